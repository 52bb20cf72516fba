#include "ndca/functions/misc.hpp"
#include "ndca/ast/userfunc.hpp"
#include "ndca/ir/compiler.hpp"

namespace ndca::functions {

std::optional<GetVar> GetVar::try_new(UserFunction& uf, const Span& span, const std::string& var_name, BuildResult& r){
    auto ty = uf.try_get_var(span, var_name, r);
    if(!ty) return std::nullopt;
    return GetVar{var_name, *ty};
}

std::optional<Type> GetVar::check_args(const UserFunction&, const Span& span, const Args& args, BuildResult& r) const {
    if(!expect_arg_count("variable read", span, args, 0, r)) return std::nullopt;
    return var_type;
}

std::optional<Value> GetVar::compile(Compiler& c, const UserFunction&, const Args&) const {
    llvm::AllocaInst* slot = c.var_slot(var_name);
    if(!slot){ c.fail(internal_error({}, "no storage slot for variable '"+var_name+"'")); return std::nullopt; }
    return Value{var_type, c.builder().CreateLoad(c.llvm_type(var_type), slot, var_name)};
}

std::optional<ConstValue> GetVar::const_eval(const UserFunction&, const Args&) const {
    // Variables are runtime state.
    return std::nullopt;
}

} // namespace ndca::functions
