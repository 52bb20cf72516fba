#include "ndca/ast/expr.hpp"
#include "ndca/ast/userfunc.hpp"

namespace ndca {

std::optional<Expr> Expr::try_new(const Span& span, const UserFunction& uf, Function function, Args args, BuildResult& r){
    auto ret = std::visit([&](const auto& f){ return f.check_args(uf, span, args, r); }, function);
    if(!ret) return std::nullopt;
    return Expr{span, std::move(function), std::move(args), *ret};
}

std::optional<Value> Expr::compile(Compiler& c, const UserFunction& uf) const {
    return std::visit([&](const auto& f){ return f.compile(c, uf, args); }, function);
}

std::optional<ConstValue> Expr::const_eval(const UserFunction& uf) const {
    return std::visit([&](const auto& f){ return f.const_eval(uf, args); }, function);
}

} // namespace ndca
