#include "ndca/functions/function.hpp"
#include "ndca/ast/userfunc.hpp"

namespace ndca::functions {

bool expect_arg_count(const char* fn_name, const Span& span, const Args& args, size_t n, BuildResult& r){
    if(args.size() == n) return true;
    return fail(r, internal_error(span, std::string(fn_name)+" expects "+std::to_string(n)+" argument(s); got "+std::to_string(args.size())));
}

bool expect_arg_type(const UserFunction& uf, ExprRef arg, const Type& expected, BuildResult& r){
    const Expr& e = uf[arg];
    if(e.return_type == expected) return true;
    return fail(r, type_error(e.span, expected, e.return_type));
}

std::optional<std::vector<Value>> compile_args(Compiler& c, const UserFunction& uf, const Args& args){
    std::vector<Value> out; out.reserve(args.size());
    for(ExprRef a : args){
        auto v = uf.compile_expr(c, a);
        if(!v) return std::nullopt;
        out.push_back(*v);
    }
    return out;
}

std::optional<int32_t> const_eval_int_arg(const UserFunction& uf, ExprRef arg){
    auto v = uf.const_eval_expr(arg);
    if(!v || !std::holds_alternative<int32_t>(*v)) return std::nullopt;
    return std::get<int32_t>(*v);
}

} // namespace ndca::functions
