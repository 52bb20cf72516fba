#pragma once
#include <optional>
#include <string>
#include <variant>

#include "ndca/errors.hpp"
#include "ndca/ast/refs.hpp"

namespace ndca {
class UserFunction;
class Compiler;
}

namespace ndca::statements {

// `x = e`; compound forms are desugared before this node is built.
struct SetVar {
    Span span;
    std::string var_name;
    ExprRef value_expr;

    static std::optional<SetVar> try_new(const Span& span, UserFunction& uf, std::string var_name, ExprRef value_expr, BuildResult& r);
    bool compile(Compiler& c, const UserFunction& uf) const;
};

struct If {
    Span span;
    ExprRef cond_expr;
    StatementBlock if_true;
    StatementBlock if_false;

    static std::optional<If> try_new(const Span& span, UserFunction& uf, ExprRef cond_expr,
                                     StatementBlock if_true, StatementBlock if_false, BuildResult& r);
    bool compile(Compiler& c, const UserFunction& uf) const;
};

// `become` in a transition function, `return` in a helper function.
struct Return {
    Span span;
    ExprRef ret_expr;

    static std::optional<Return> try_new(const Span& span, UserFunction& uf, ExprRef ret_expr, BuildResult& r);
    bool compile(Compiler& c, const UserFunction& uf) const;
};

} // namespace ndca::statements

namespace ndca {

using Statement = std::variant<statements::SetVar, statements::If, statements::Return>;

} // namespace ndca
