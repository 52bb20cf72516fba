#pragma once
#include "ndca/functions/function.hpp"

namespace ndca::functions {

// `#x`: integer to cell state, trapping unless 0 <= x < state_count.
struct IntToCellState {
    unsigned state_count;
    ErrorPointRef out_of_range_error;

    static std::optional<IntToCellState> try_new(UserFunction& uf, const Span& span, BuildResult& r);
    std::optional<Type> check_args(const UserFunction& uf, const Span& span, const Args& args, BuildResult& r) const;
    std::optional<Value> compile(Compiler& c, const UserFunction& uf, const Args& args) const;
    std::optional<ConstValue> const_eval(const UserFunction& uf, const Args& args) const;
};

} // namespace ndca::functions
