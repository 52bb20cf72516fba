#pragma once
#include <optional>

#include "ndca/errors.hpp"
#include "ndca/functions.hpp"
#include "ndca/ast/refs.hpp"
#include "ndca/ir/value.hpp"

namespace ndca {

class UserFunction;
class Compiler;

// Expression node: a resolved capability applied to arguments from the same
// function's arena. Immutable once constructed.
struct Expr {
    Span span;
    Function function;
    Args args;
    Type return_type;

    // Validates `args` against `function` and computes the result type.
    static std::optional<Expr> try_new(const Span& span, const UserFunction& uf, Function function, Args args, BuildResult& r);

    std::optional<Value> compile(Compiler& c, const UserFunction& uf) const;
    std::optional<ConstValue> const_eval(const UserFunction& uf) const;
};

} // namespace ndca
