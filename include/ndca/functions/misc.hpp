#pragma once
#include <string>
#include "ndca/functions/function.hpp"

namespace ndca::functions {

// Read of a variable's storage slot.
struct GetVar {
    std::string var_name;
    Type var_type;

    // Fails with UseOfUninitializedVariable if the variable is unknown.
    static std::optional<GetVar> try_new(UserFunction& uf, const Span& span, const std::string& var_name, BuildResult& r);
    std::optional<Type> check_args(const UserFunction& uf, const Span& span, const Args& args, BuildResult& r) const;
    std::optional<Value> compile(Compiler& c, const UserFunction& uf, const Args& args) const;
    std::optional<ConstValue> const_eval(const UserFunction& uf, const Args& args) const;
};

} // namespace ndca::functions
