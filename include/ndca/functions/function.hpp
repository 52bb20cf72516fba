// Shared declarations for built-in capabilities. Each capability provides:
//   static std::optional<Self> try_new(UserFunction&, const Span&, ..., BuildResult&)
//   std::optional<Type> check_args(const UserFunction&, const Span&, const Args&, BuildResult&) const
//   std::optional<Value> compile(Compiler&, const UserFunction&, const Args&) const
//   std::optional<ConstValue> const_eval(const UserFunction&, const Args&) const
#pragma once
#include <optional>
#include <string>

#include "ndca/errors.hpp"
#include "ndca/types.hpp"
#include "ndca/ast/refs.hpp"
#include "ndca/ir/value.hpp"

namespace ndca {
class UserFunction;
class Compiler;
}

namespace ndca::functions {

// Arity check; reports an internal error naming the capability on mismatch.
bool expect_arg_count(const char* fn_name, const Span& span, const Args& args, size_t n, BuildResult& r);
// Type check of one argument; reports a type error spanning that argument.
bool expect_arg_type(const UserFunction& uf, ExprRef arg, const Type& expected, BuildResult& r);

// Compiles every argument left to right; empty on the first failure.
std::optional<std::vector<Value>> compile_args(Compiler& c, const UserFunction& uf, const Args& args);
// Const-evaluates one Int argument.
std::optional<int32_t> const_eval_int_arg(const UserFunction& uf, ExprRef arg);

} // namespace ndca::functions
