#include "ndca/ast/statements.hpp"
#include "ndca/ast/userfunc.hpp"
#include "ndca/ir/compiler.hpp"

namespace ndca::statements {

std::optional<SetVar> SetVar::try_new(const Span& span, UserFunction& uf, std::string var_name, ExprRef value_expr, BuildResult& r){
    Type got = uf[value_expr].return_type;
    Type expected = uf.get_or_create_var(var_name, got);
    // A variable keeps the type of its first assignment.
    if(expected != got){ fail(r, type_error(uf[value_expr].span, expected, got)); return std::nullopt; }
    return SetVar{span, std::move(var_name), value_expr};
}

bool SetVar::compile(Compiler& c, const UserFunction& uf) const {
    auto value = uf.compile_expr(c, value_expr);
    if(!value) return false;
    llvm::AllocaInst* slot = c.var_slot(var_name);
    if(!slot) return c.fail(internal_error(span, "no storage slot for variable '"+var_name+"'"));
    c.builder().CreateStore(value->llvm_value, slot);
    return true;
}

std::optional<If> If::try_new(const Span& span, UserFunction& uf, ExprRef cond_expr,
                              StatementBlock if_true, StatementBlock if_false, BuildResult& r){
    const Expr& cond = uf[cond_expr];
    if(!cond.return_type.is_int()){ fail(r, type_error(cond.span, Type::integer(), cond.return_type)); return std::nullopt; }
    return If{span, cond_expr, std::move(if_true), std::move(if_false)};
}

bool If::compile(Compiler& c, const UserFunction& uf) const {
    auto cond = uf.compile_expr(c, cond_expr);
    if(!cond) return false;
    return c.build_conditional(
        cond->llvm_value,
        [&](Compiler& cc){ return uf.compile_block(cc, if_true); },
        [&](Compiler& cc){ return uf.compile_block(cc, if_false); });
}

std::optional<Return> Return::try_new(const Span& span, UserFunction& uf, ExprRef ret_expr, BuildResult& r){
    const Expr& e = uf[ret_expr];
    if(e.return_type != uf.return_type()){ fail(r, type_error(e.span, uf.return_type(), e.return_type)); return std::nullopt; }
    if(e.return_type.is_vector()){ fail(r, unimplemented(span, "returning a vector")); return std::nullopt; }
    return Return{span, ret_expr};
}

bool Return::compile(Compiler& c, const UserFunction& uf) const {
    auto value = uf.compile_expr(c, ret_expr);
    if(!value) return false;
    return c.build_return_ok(*value);
}

} // namespace ndca::statements
