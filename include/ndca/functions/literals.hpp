#pragma once
#include <cstdint>
#include "ndca/functions/function.hpp"

namespace ndca::functions {

// Integer literal.
struct IntLiteral {
    int32_t value;

    static std::optional<IntLiteral> try_new(UserFunction& uf, const Span& span, int64_t value, BuildResult& r);
    std::optional<Type> check_args(const UserFunction& uf, const Span& span, const Args& args, BuildResult& r) const;
    std::optional<Value> compile(Compiler& c, const UserFunction& uf, const Args& args) const;
    std::optional<ConstValue> const_eval(const UserFunction& uf, const Args& args) const;
};

} // namespace ndca::functions
