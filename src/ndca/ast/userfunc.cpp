#include "ndca/ast/userfunc.hpp"
#include "ndca/diagnostics_json.hpp"
#include "ndca/ir/compiler.hpp"

#include <cstdio>

namespace ndca {

using syntax::OperatorToken;
using syntax::PunctuationToken;

UserFunction::UserFunction(RuleMetaPtr rule_meta, Type return_type, bool is_transition_function)
    : rule_meta_(std::move(rule_meta)), return_type_(return_type), is_transition_function_(is_transition_function) {}

UserFunction UserFunction::new_transition_function(RuleMetaPtr rule_meta){
    return UserFunction(std::move(rule_meta), Type::cell_state(), /*is_transition_function*/ true);
}

UserFunction UserFunction::new_helper_function(RuleMetaPtr rule_meta, Type return_type){
    return UserFunction(std::move(rule_meta), return_type, /*is_transition_function*/ false);
}

std::optional<Type> UserFunction::try_get_var(const Span& span, const std::string& var_name, BuildResult& r) const {
    auto it = variables_.find(var_name);
    if(it == variables_.end()){ fail(r, use_of_uninitialized_variable(span, var_name)); return std::nullopt; }
    return it->second;
}

Type UserFunction::get_or_create_var(const std::string& var_name, Type new_type){
    if(auto it = variables_.find(var_name); it != variables_.end()) return it->second;
    variables_.emplace(var_name, new_type);
    var_order_.push_back(var_name);
    return new_type;
}

std::optional<StatementBlock> UserFunction::build_statement_block_ast(const syntax::StatementBlock& block, BuildResult& r){
    StatementBlock out;
    out.reserve(block.size());
    for(const syntax::Statement& st : block){
        const Span& span = st.span;
        std::optional<Statement> built;

        if(auto *sv = std::get_if<syntax::SetVar>(&st.data)){
            auto *target = std::get_if<syntax::Ident>(&sv->var_expr->data);
            if(!target){ fail(r, expected(st.span, "variable name")); return std::nullopt; }
            // `x op= e` becomes `x = x op e` before anything is type-checked.
            std::optional<ExprRef> value;
            if(auto op = syntax::compound_operator(sv->assign_op)){
                syntax::Expr desugared{span, syntax::BinaryOp{
                    syntax::ident(target->name, sv->var_expr->span), *op, sv->value_expr}};
                value = build_expression_ast(desugared, r);
            } else {
                value = build_expression_ast(*sv->value_expr, r);
            }
            if(!value) return std::nullopt;
            auto node = statements::SetVar::try_new(span, *this, target->name, *value, r);
            if(!node) return std::nullopt;
            built = std::move(*node);
        }
        else if(auto *iff = std::get_if<syntax::If>(&st.data)){
            auto cond = build_expression_ast(*iff->cond_expr, r);
            if(!cond) return std::nullopt;
            // Both arms are always built, even when empty.
            auto if_true = build_statement_block_ast(iff->if_true, r);
            if(!if_true) return std::nullopt;
            auto if_false = build_statement_block_ast(iff->if_false, r);
            if(!if_false) return std::nullopt;
            auto node = statements::If::try_new(span, *this, *cond, std::move(*if_true), std::move(*if_false), r);
            if(!node) return std::nullopt;
            built = std::move(*node);
        }
        else if(auto *bec = std::get_if<syntax::Become>(&st.data)){
            if(!is_transition_function_){
                fail(r, make_error(ErrorKind::BecomeInHelperFunction, span,
                                   "'become' is only allowed in the transition function", "use 'return' in helper functions"));
                return std::nullopt;
            }
            auto ret = build_expression_ast(*bec->ret_expr, r);
            if(!ret) return std::nullopt;
            auto node = statements::Return::try_new(span, *this, *ret, r);
            if(!node) return std::nullopt;
            built = std::move(*node);
        }
        else if(auto *ret_st = std::get_if<syntax::Return>(&st.data)){
            if(is_transition_function_){
                fail(r, make_error(ErrorKind::ReturnInTransitionFunction, span,
                                   "'return' is not allowed in the transition function", "use 'become' to set the new cell state"));
                return std::nullopt;
            }
            auto ret = build_expression_ast(*ret_st->ret_expr, r);
            if(!ret) return std::nullopt;
            auto node = statements::Return::try_new(span, *this, *ret, r);
            if(!node) return std::nullopt;
            built = std::move(*node);
        }

        if(!built){ fail(r, internal_error(span, "unhandled statement kind")); return std::nullopt; }
        out.push_back(add_statement(std::move(*built)));
    }
    return out;
}

std::optional<ExprRef> UserFunction::build_expression_ast(const syntax::Expr& expr, BuildResult& r){
    const Span& span = expr.span;
    Args args;
    std::optional<Function> function;

    // Builds the operands left to right into `args`.
    auto build_args = [&](std::initializer_list<const syntax::ExprPtr*> operands)->bool{
        for(const syntax::ExprPtr* e : operands){
            auto ref = build_expression_ast(**e, r);
            if(!ref) return false;
            args.push_back(*ref);
        }
        return true;
    };

    if(auto *lit = std::get_if<syntax::IntLit>(&expr.data)){
        auto f = functions::IntLiteral::try_new(*this, span, lit->value, r);
        if(!f) return std::nullopt;
        function = std::move(*f);
    }
    else if(auto *id = std::get_if<syntax::Ident>(&expr.data)){
        // GetVar itself reports unknown variables.
        auto f = functions::GetVar::try_new(*this, span, id->name, r);
        if(!f) return std::nullopt;
        function = std::move(*f);
    }
    else if(auto *group = std::get_if<syntax::Group>(&expr.data)){
        switch(group->start_token){
            case PunctuationToken::LParen: return build_expression_ast(*group->inner, r);
            case PunctuationToken::LBracket: fail(r, unimplemented(span, "vector construction")); return std::nullopt;
            default: fail(r, internal_error(span, "Invalid group")); return std::nullopt;
        }
    }
    else if(std::holds_alternative<syntax::List>(expr.data)){
        fail(r, expected_got(span, "expression", "comma-separated list"));
        return std::nullopt;
    }
    else if(auto *un = std::get_if<syntax::UnaryOp>(&expr.data)){
        switch(un->op){
            case OperatorToken::Minus: {
                if(!build_args({&un->operand})) return std::nullopt;
                auto f = functions::NegInt::try_new(*this, span, r);
                if(!f) return std::nullopt;
                function = std::move(*f);
                break;
            }
            case OperatorToken::Tag: {
                if(!build_args({&un->operand})) return std::nullopt;
                auto f = functions::IntToCellState::try_new(*this, span, r);
                if(!f) return std::nullopt;
                function = std::move(*f);
                break;
            }
            default:
                fail(r, internal_error(span, "Invalid unary operator"));
                return std::nullopt;
        }
    }
    else if(auto *bin = std::get_if<syntax::BinaryOp>(&expr.data)){
        switch(bin->op){
            case OperatorToken::Plus:
            case OperatorToken::Minus:
            case OperatorToken::Asterisk:
            case OperatorToken::Slash:
            case OperatorToken::Percent:
            case OperatorToken::DoubleAsterisk:
            case OperatorToken::DoubleLessThan:
            case OperatorToken::DoubleGreaterThan:
            case OperatorToken::TripleGreaterThan:
            case OperatorToken::Ampersand:
            case OperatorToken::Pipe:
            case OperatorToken::Caret: {
                if(!build_args({&bin->lhs, &bin->rhs})) return std::nullopt;
                auto f = functions::BinaryIntOp::try_new(*this, span, bin->op, r);
                if(!f) return std::nullopt;
                function = std::move(*f);
                break;
            }
            case OperatorToken::Dot:
                fail(r, unimplemented(span, "method call"));
                return std::nullopt;
            case OperatorToken::DotDot:
                fail(r, unimplemented(span, "range"));
                return std::nullopt;
            default:
                fail(r, internal_error(span, "Invalid binary operator"));
                return std::nullopt;
        }
    }
    else if(auto *cmp = std::get_if<syntax::Cmp>(&expr.data)){
        for(const syntax::ExprPtr& e : cmp->exprs){
            auto ref = build_expression_ast(*e, r);
            if(!ref) return std::nullopt;
            args.push_back(*ref);
        }
        auto f = functions::Cmp::try_new(*this, span, args, cmp->cmps, r);
        if(!f) return std::nullopt;
        function = std::move(*f);
    }

    if(!function){ fail(r, internal_error(span, "unhandled expression kind")); return std::nullopt; }
    auto node = Expr::try_new(span, *this, std::move(*function), std::move(args), r);
    if(!node) return std::nullopt;
    return add_expr(std::move(*node));
}

bool UserFunction::build_body(const syntax::StatementBlock& block, BuildResult& r){
    if(!return_type_.is_valid()){
        fail(r, internal_error({}, "invalid return type "+return_type_.to_string()));
        maybe_print_json(r);
        return false;
    }
    auto built = build_statement_block_ast(block, r);
    if(!built){ maybe_print_json(r); return false; }
    body_ = std::move(*built);
    return true;
}

StatementRef UserFunction::add_statement(Statement statement){
    statements_.push_back(std::move(statement));
    return StatementRef{statements_.size() - 1};
}

ExprRef UserFunction::add_expr(Expr expr){
    expressions_.push_back(std::move(expr));
    return ExprRef{expressions_.size() - 1};
}

ErrorPointRef UserFunction::add_error_point(LangError error){
    error_points_.push_back(std::move(error));
    return ErrorPointRef{error_points_.size() - 1};
}

llvm::Function* UserFunction::compile(Compiler& c, const std::string& name) const {
    llvm::Function* F = c.begin_function(name);
    for(const std::string& v : var_order_) c.alloc_var_slot(v, variables_.at(v));
    if(!compile_block(c, body_)) return nullptr;
    // Falling off the end yields the zero value of the return type.
    if(c.needs_terminator()){
        if(!c.build_return_ok(Value{return_type_, c.get_default_var_value(return_type_)})) return nullptr;
    }
    if(c.env().verifyIR && !c.verify_function()) return nullptr;
    return F;
}

bool UserFunction::compile_statement(Compiler& c, StatementRef s) const {
    return std::visit([&](const auto& st){ return st.compile(c, *this); }, statements_[s.idx]);
}

bool UserFunction::compile_block(Compiler& c, const StatementBlock& block) const {
    for(StatementRef s : block){
        if(!c.needs_terminator()){
            // Everything after an unconditional exit is unreachable.
            if(c.env().debugCodegen) std::fprintf(stderr, "[codegen] skipping unreachable statement #%zu\n", s.idx);
            break;
        }
        if(!compile_statement(c, s)) return false;
    }
    return true;
}

std::optional<Value> UserFunction::compile_expr(Compiler& c, ExprRef e) const {
    return expressions_[e.idx].compile(c, *this);
}

std::optional<ConstValue> UserFunction::const_eval_expr(ExprRef e) const {
    return expressions_[e.idx].const_eval(*this);
}

} // namespace ndca
