#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <llvm/IR/Function.h>

#include "ndca/errors.hpp"
#include "ndca/syntax.hpp"
#include "ndca/types.hpp"
#include "ndca/ast/expr.hpp"
#include "ndca/ast/refs.hpp"
#include "ndca/ast/rule_meta.hpp"
#include "ndca/ast/statements.hpp"
#include "ndca/ir/value.hpp"

namespace ndca {

class Compiler;

// Unit of compilation: a transition or helper function with its statement,
// expression and error-point arenas. Populated in one pass by the build_*
// methods, then only read by the code generator.
class UserFunction {
public:
    static UserFunction new_transition_function(RuleMetaPtr rule_meta);
    static UserFunction new_helper_function(RuleMetaPtr rule_meta, Type return_type);

    const RuleMetaPtr& rule_meta() const { return rule_meta_; }
    Type return_type() const { return return_type_; }
    bool is_transition_function() const { return is_transition_function_; }

    // --- variables ----------------------------------------------------------
    // Type of an existing variable; reports UseOfUninitializedVariable if absent.
    std::optional<Type> try_get_var(const Span& span, const std::string& var_name, BuildResult& r) const;
    // First write wins: returns the known type, or registers `new_type` and returns it.
    Type get_or_create_var(const std::string& var_name, Type new_type);
    // Variable names in registration order.
    const std::vector<std::string>& var_names() const { return var_order_; }
    Type var_type(const std::string& var_name) const { return variables_.at(var_name); }

    // --- building -----------------------------------------------------------
    std::optional<StatementBlock> build_statement_block_ast(const syntax::StatementBlock& block, BuildResult& r);
    std::optional<ExprRef> build_expression_ast(const syntax::Expr& expr, BuildResult& r);
    // Builds the top-level block and records it as the function body.
    bool build_body(const syntax::StatementBlock& block, BuildResult& r);
    const StatementBlock& body() const { return body_; }

    ErrorPointRef add_error_point(LangError error);
    const std::vector<LangError>& error_points() const { return error_points_; }

    const Expr& operator[](ExprRef e) const { return expressions_[e.idx]; }
    const Statement& operator[](StatementRef s) const { return statements_[s.idx]; }
    const LangError& operator[](ErrorPointRef p) const { return error_points_[p.idx]; }
    size_t expr_count() const { return expressions_.size(); }
    size_t statement_count() const { return statements_.size(); }

    // --- code generation ----------------------------------------------------
    // Emits `i64 name()`; nullptr on failure (errors in c.result()).
    llvm::Function* compile(Compiler& c, const std::string& name) const;
    bool compile_statement(Compiler& c, StatementRef s) const;
    bool compile_block(Compiler& c, const StatementBlock& block) const;
    std::optional<Value> compile_expr(Compiler& c, ExprRef e) const;
    // Compile-time value of an expression; nullopt if it depends on runtime
    // state or would trap.
    std::optional<ConstValue> const_eval_expr(ExprRef e) const;

private:
    UserFunction(RuleMetaPtr rule_meta, Type return_type, bool is_transition_function);

    StatementRef add_statement(Statement statement);
    ExprRef add_expr(Expr expr);

    RuleMetaPtr rule_meta_;
    Type return_type_;
    bool is_transition_function_ = false;
    std::vector<Statement> statements_;
    std::vector<Expr> expressions_;
    std::vector<LangError> error_points_;
    std::unordered_map<std::string, Type> variables_;
    std::vector<std::string> var_order_;
    StatementBlock body_;
};

} // namespace ndca
