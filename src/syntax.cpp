#include "ndca/syntax.hpp"

namespace ndca::syntax {

std::optional<OperatorToken> compound_operator(AssignOp op){
    switch(op){
        case AssignOp::Assign: return std::nullopt;
        case AssignOp::Plus: return OperatorToken::Plus;
        case AssignOp::Minus: return OperatorToken::Minus;
        case AssignOp::Asterisk: return OperatorToken::Asterisk;
        case AssignOp::Slash: return OperatorToken::Slash;
        case AssignOp::Percent: return OperatorToken::Percent;
        case AssignOp::DoubleAsterisk: return OperatorToken::DoubleAsterisk;
        case AssignOp::DoubleLessThan: return OperatorToken::DoubleLessThan;
        case AssignOp::DoubleGreaterThan: return OperatorToken::DoubleGreaterThan;
        case AssignOp::TripleGreaterThan: return OperatorToken::TripleGreaterThan;
        case AssignOp::Ampersand: return OperatorToken::Ampersand;
        case AssignOp::Pipe: return OperatorToken::Pipe;
        case AssignOp::Caret: return OperatorToken::Caret;
    }
    return std::nullopt;
}

const char* to_string(OperatorToken op){
    switch(op){
        case OperatorToken::Plus: return "+";
        case OperatorToken::Minus: return "-";
        case OperatorToken::Asterisk: return "*";
        case OperatorToken::Slash: return "/";
        case OperatorToken::Percent: return "%";
        case OperatorToken::DoubleAsterisk: return "**";
        case OperatorToken::DoubleLessThan: return "<<";
        case OperatorToken::DoubleGreaterThan: return ">>";
        case OperatorToken::TripleGreaterThan: return ">>>";
        case OperatorToken::Ampersand: return "&";
        case OperatorToken::Pipe: return "|";
        case OperatorToken::Caret: return "^";
        case OperatorToken::Tag: return "#";
        case OperatorToken::Dot: return ".";
        case OperatorToken::DotDot: return "..";
    }
    return "?";
}

const char* to_string(ComparisonToken cmp){
    switch(cmp){
        case ComparisonToken::Eql: return "==";
        case ComparisonToken::Neq: return "!=";
        case ComparisonToken::Lt: return "<";
        case ComparisonToken::Gt: return ">";
        case ComparisonToken::Lte: return "<=";
        case ComparisonToken::Gte: return ">=";
    }
    return "?";
}

ExprPtr make_expr(ExprData d, Span span){ return std::make_shared<const Expr>(Expr{span, std::move(d)}); }
ExprPtr int_lit(int64_t v, Span span){ return make_expr(IntLit{v}, span); }
ExprPtr ident(std::string name, Span span){ return make_expr(Ident{std::move(name)}, span); }
ExprPtr paren(ExprPtr inner, Span span){ return make_expr(Group{PunctuationToken::LParen, std::move(inner)}, span); }
ExprPtr bracket(ExprPtr inner, Span span){ return make_expr(Group{PunctuationToken::LBracket, std::move(inner)}, span); }
ExprPtr list(std::vector<ExprPtr> items, Span span){ return make_expr(List{std::move(items)}, span); }
ExprPtr unary(OperatorToken op, ExprPtr operand, Span span){ return make_expr(UnaryOp{op, std::move(operand)}, span); }
ExprPtr binary(ExprPtr lhs, OperatorToken op, ExprPtr rhs, Span span){ return make_expr(BinaryOp{std::move(lhs), op, std::move(rhs)}, span); }
ExprPtr cmp(std::vector<ExprPtr> exprs, std::vector<ComparisonToken> cmps, Span span){ return make_expr(Cmp{std::move(exprs), std::move(cmps)}, span); }

Statement set_var(std::string name, ExprPtr value, Span span){
    return set_var(ident(std::move(name), span), AssignOp::Assign, std::move(value), span);
}
Statement set_var(ExprPtr target, AssignOp op, ExprPtr value, Span span){
    return Statement{span, SetVar{std::move(target), op, std::move(value)}};
}
Statement if_else(ExprPtr cond, StatementBlock if_true, StatementBlock if_false, Span span){
    return Statement{span, If{std::move(cond), std::move(if_true), std::move(if_false)}};
}
Statement become(ExprPtr e, Span span){ return Statement{span, Become{std::move(e)}}; }
Statement return_(ExprPtr e, Span span){ return Statement{span, Return{std::move(e)}}; }

} // namespace ndca::syntax
