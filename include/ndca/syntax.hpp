// Parse tree produced by the external rule-language parser. Consumed read-only by the AST builder.
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "ndca/errors.hpp"

namespace ndca::syntax {

enum class OperatorToken {
    Plus, Minus, Asterisk, Slash, Percent, DoubleAsterisk,
    DoubleLessThan, DoubleGreaterThan, TripleGreaterThan,
    Ampersand, Pipe, Caret,
    Tag,    // `#`: integer -> cell state
    Dot,    // method call
    DotDot, // range
};

enum class PunctuationToken { LParen, LBracket, LBrace };

enum class ComparisonToken { Eql, Neq, Lt, Gt, Lte, Gte };

// `=` or `op=`.
enum class AssignOp {
    Assign,
    Plus, Minus, Asterisk, Slash, Percent, DoubleAsterisk,
    DoubleLessThan, DoubleGreaterThan, TripleGreaterThan,
    Ampersand, Pipe, Caret,
};

// Operator a compound assignment desugars to; nullopt for plain `=`.
std::optional<OperatorToken> compound_operator(AssignOp op);

const char* to_string(OperatorToken op);
const char* to_string(ComparisonToken cmp);

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

struct IntLit { int64_t value; };
struct Ident { std::string name; };
struct Group { PunctuationToken start_token; ExprPtr inner; };
struct List { std::vector<ExprPtr> items; };
struct UnaryOp { OperatorToken op; ExprPtr operand; };
struct BinaryOp { ExprPtr lhs; OperatorToken op; ExprPtr rhs; };
// `a < b <= c`: exprs.size() == cmps.size() + 1
struct Cmp { std::vector<ExprPtr> exprs; std::vector<ComparisonToken> cmps; };

using ExprData = std::variant<IntLit, Ident, Group, List, UnaryOp, BinaryOp, Cmp>;

struct Expr {
    Span span;
    ExprData data;
};

struct Statement;
using StatementBlock = std::vector<Statement>;

struct SetVar { ExprPtr var_expr; AssignOp assign_op; ExprPtr value_expr; };
struct If { ExprPtr cond_expr; StatementBlock if_true; StatementBlock if_false; };
struct Become { ExprPtr ret_expr; };
struct Return { ExprPtr ret_expr; };

using StatementData = std::variant<SetVar, If, Become, Return>;

struct Statement {
    Span span;
    StatementData data;
};

// Tree construction helpers for hosts and tests.
ExprPtr make_expr(ExprData d, Span span = {});
ExprPtr int_lit(int64_t v, Span span = {});
ExprPtr ident(std::string name, Span span = {});
ExprPtr paren(ExprPtr inner, Span span = {});
ExprPtr bracket(ExprPtr inner, Span span = {});
ExprPtr list(std::vector<ExprPtr> items, Span span = {});
ExprPtr unary(OperatorToken op, ExprPtr operand, Span span = {});
ExprPtr binary(ExprPtr lhs, OperatorToken op, ExprPtr rhs, Span span = {});
ExprPtr cmp(std::vector<ExprPtr> exprs, std::vector<ComparisonToken> cmps, Span span = {});

Statement set_var(std::string name, ExprPtr value, Span span = {});
Statement set_var(ExprPtr target, AssignOp op, ExprPtr value, Span span = {});
Statement if_else(ExprPtr cond, StatementBlock if_true, StatementBlock if_false = {}, Span span = {});
Statement become(ExprPtr e, Span span = {});
Statement return_(ExprPtr e, Span span = {});

} // namespace ndca::syntax
