#pragma once
#include <vector>
#include "ndca/functions/function.hpp"
#include "ndca/syntax.hpp"

namespace ndca::functions {

// Chained comparison `a < b <= c`: every adjacent pair is compared and the
// results are ANDed into an Int 0 or 1.
struct Cmp {
    std::vector<syntax::ComparisonToken> cmps;
    Type operand_type;

    static std::optional<Cmp> try_new(UserFunction& uf, const Span& span, const Args& args,
                                      std::vector<syntax::ComparisonToken> cmps, BuildResult& r);
    std::optional<Type> check_args(const UserFunction& uf, const Span& span, const Args& args, BuildResult& r) const;
    std::optional<Value> compile(Compiler& c, const UserFunction& uf, const Args& args) const;
    std::optional<ConstValue> const_eval(const UserFunction& uf, const Args& args) const;
};

} // namespace ndca::functions
