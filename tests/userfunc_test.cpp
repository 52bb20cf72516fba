// AST builder: variable registry, statement legality, desugaring and the
// expression shapes that are rejected at build time.
#include <gtest/gtest.h>

#include "ndca/ast/userfunc.hpp"
#include "ndca/syntax.hpp"

using namespace ndca;
namespace sx = ndca::syntax;
using sx::OperatorToken;
using sx::ComparisonToken;

namespace {

RuleMetaPtr life_meta(){ return make_rule_meta(2, 1, 2); }

// Builds `block` into a fresh transition function and returns the build result.
BuildResult build_transition(const sx::StatementBlock& block){
    UserFunction uf = UserFunction::new_transition_function(life_meta());
    BuildResult r;
    uf.build_body(block, r);
    return r;
}

ErrorKind first_error(const BuildResult& r){
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errors.size(), 1u);
    return r.errors.empty() ? ErrorKind::InternalError : r.errors.front().kind;
}

} // namespace

TEST(UserFunctionVars, GetOrCreateIsFirstWriteWins){
    UserFunction uf = UserFunction::new_helper_function(life_meta(), Type::integer());
    EXPECT_EQ(uf.get_or_create_var("x", Type::integer()), Type::integer());
    EXPECT_EQ(uf.get_or_create_var("x", Type::cell_state()), Type::integer());
    EXPECT_EQ(uf.get_or_create_var("s", Type::cell_state()), Type::cell_state());
    ASSERT_EQ(uf.var_names().size(), 2u);
    EXPECT_EQ(uf.var_names()[0], "x");
    EXPECT_EQ(uf.var_names()[1], "s");

    BuildResult r;
    auto t = uf.try_get_var({}, "x", r);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, Type::integer());
    EXPECT_FALSE(uf.try_get_var({}, "nope", r).has_value());
    EXPECT_EQ(first_error(r), ErrorKind::UseOfUninitializedVariable);
}

TEST(UserFunctionBuild, BecomeOnlyInTransitionFunction){
    UserFunction helper = UserFunction::new_helper_function(life_meta(), Type::cell_state());
    BuildResult r;
    EXPECT_FALSE(helper.build_body({sx::become(sx::unary(OperatorToken::Tag, sx::int_lit(1)))}, r));
    EXPECT_EQ(first_error(r), ErrorKind::BecomeInHelperFunction);

    BuildResult ok = build_transition({sx::become(sx::unary(OperatorToken::Tag, sx::int_lit(1)))});
    EXPECT_TRUE(ok.success);
}

TEST(UserFunctionBuild, ReturnOnlyInHelperFunction){
    auto r = build_transition({sx::return_(sx::int_lit(1))});
    EXPECT_EQ(first_error(r), ErrorKind::ReturnInTransitionFunction);

    UserFunction helper = UserFunction::new_helper_function(life_meta(), Type::integer());
    BuildResult ok;
    EXPECT_TRUE(helper.build_body({sx::return_(sx::int_lit(1))}, ok));
    EXPECT_TRUE(ok.success);
}

TEST(UserFunctionBuild, ReturnTypeMustMatch){
    auto r = build_transition({sx::become(sx::int_lit(1))});
    EXPECT_EQ(first_error(r), ErrorKind::TypeError);
}

TEST(UserFunctionBuild, ReadBeforeWriteIsRejected){
    auto r = build_transition({sx::set_var("y", sx::ident("x", Span{2, 5, 2, 6}))});
    ASSERT_EQ(first_error(r), ErrorKind::UseOfUninitializedVariable);
    EXPECT_EQ(r.errors[0].span.line, 2);
    EXPECT_EQ(r.errors[0].span.col, 5);
}

TEST(UserFunctionBuild, CompoundAssignDesugarsToBinaryOp){
    UserFunction uf = UserFunction::new_transition_function(life_meta());
    BuildResult r;
    ASSERT_TRUE(uf.build_body({
        sx::set_var("x", sx::int_lit(1)),
        sx::set_var(sx::ident("x"), sx::AssignOp::Plus, sx::int_lit(2)),
    }, r));
    ASSERT_EQ(uf.body().size(), 2u);

    const auto& second = std::get<statements::SetVar>(uf[uf.body()[1]]);
    EXPECT_EQ(second.var_name, "x");
    const Expr& value = uf[second.value_expr];
    const auto* op = std::get_if<functions::BinaryIntOp>(&value.function);
    ASSERT_NE(op, nullptr);
    EXPECT_EQ(op->op, OperatorToken::Plus);
    ASSERT_EQ(value.args.size(), 2u);
    const auto* lhs = std::get_if<functions::GetVar>(&uf[value.args[0]].function);
    ASSERT_NE(lhs, nullptr);
    EXPECT_EQ(lhs->var_name, "x");
    EXPECT_TRUE(std::holds_alternative<functions::IntLiteral>(uf[value.args[1]].function));
}

TEST(UserFunctionBuild, CompoundAssignOnUnknownVariable){
    auto r = build_transition({sx::set_var(sx::ident("x"), sx::AssignOp::Asterisk, sx::int_lit(2))});
    EXPECT_EQ(first_error(r), ErrorKind::UseOfUninitializedVariable);
}

TEST(UserFunctionBuild, AssignmentTargetMustBeName){
    auto r = build_transition({sx::set_var(sx::int_lit(3), sx::AssignOp::Assign, sx::int_lit(2))});
    EXPECT_EQ(first_error(r), ErrorKind::Expected);
}

TEST(UserFunctionBuild, VariableKeepsItsFirstType){
    auto r = build_transition({
        sx::set_var("x", sx::int_lit(1)),
        sx::set_var("x", sx::unary(OperatorToken::Tag, sx::int_lit(0))),
    });
    EXPECT_EQ(first_error(r), ErrorKind::TypeError);
}

TEST(UserFunctionBuild, ConditionMustBeInt){
    auto r = build_transition({sx::if_else(sx::unary(OperatorToken::Tag, sx::int_lit(0)), {})});
    EXPECT_EQ(first_error(r), ErrorKind::TypeError);
}

TEST(UserFunctionBuild, EmptyArmsAreBuilt){
    UserFunction uf = UserFunction::new_transition_function(life_meta());
    BuildResult r;
    ASSERT_TRUE(uf.build_body({sx::if_else(sx::int_lit(1), {}, {})}, r));
    const auto& iff = std::get<statements::If>(uf[uf.body()[0]]);
    EXPECT_TRUE(iff.if_true.empty());
    EXPECT_TRUE(iff.if_false.empty());
}

TEST(UserFunctionBuild, UnimplementedShapes){
    auto vec = build_transition({sx::set_var("v", sx::bracket(sx::int_lit(1)))});
    EXPECT_EQ(first_error(vec), ErrorKind::Unimplemented);

    auto method = build_transition({sx::set_var("v", sx::binary(sx::int_lit(1), OperatorToken::Dot, sx::int_lit(2)))});
    EXPECT_EQ(first_error(method), ErrorKind::Unimplemented);

    auto range = build_transition({sx::set_var("v", sx::binary(sx::int_lit(1), OperatorToken::DotDot, sx::int_lit(2)))});
    EXPECT_EQ(first_error(range), ErrorKind::Unimplemented);
}

TEST(UserFunctionBuild, ListIsNotAnExpression){
    auto r = build_transition({sx::set_var("v", sx::list({sx::int_lit(1), sx::int_lit(2)}))});
    ASSERT_EQ(first_error(r), ErrorKind::ExpectedGot);
    EXPECT_NE(r.errors[0].message.find("comma-separated list"), std::string::npos);
}

TEST(UserFunctionBuild, InvalidOperatorsAreInternalErrors){
    auto un = build_transition({sx::set_var("v", sx::unary(OperatorToken::Plus, sx::int_lit(1)))});
    EXPECT_EQ(first_error(un), ErrorKind::InternalError);

    auto bin = build_transition({sx::set_var("v", sx::binary(sx::int_lit(1), OperatorToken::Tag, sx::int_lit(2)))});
    EXPECT_EQ(first_error(bin), ErrorKind::InternalError);

    auto grp = build_transition({sx::set_var("v", sx::make_expr(sx::Group{sx::PunctuationToken::LBrace, sx::int_lit(1)}))});
    EXPECT_EQ(first_error(grp), ErrorKind::InternalError);
}

TEST(UserFunctionBuild, ParenthesesAreTransparent){
    UserFunction uf = UserFunction::new_transition_function(life_meta());
    BuildResult r;
    ASSERT_TRUE(uf.build_body({sx::set_var("v", sx::paren(sx::paren(sx::int_lit(7))))}, r));
    EXPECT_EQ(uf.expr_count(), 1u);
}

TEST(UserFunctionBuild, LiteralOutOfRange){
    auto r = build_transition({sx::set_var("v", sx::int_lit(int64_t(1) << 31))});
    EXPECT_EQ(first_error(r), ErrorKind::IntegerLiteralOutOfRange);
}

TEST(UserFunctionBuild, OperandTypesAreChecked){
    auto r = build_transition({sx::set_var("v", sx::binary(sx::unary(OperatorToken::Tag, sx::int_lit(1)), OperatorToken::Plus, sx::int_lit(2)))});
    EXPECT_EQ(first_error(r), ErrorKind::TypeError);

    auto neg = build_transition({sx::set_var("v", sx::unary(OperatorToken::Minus, sx::unary(OperatorToken::Tag, sx::int_lit(1))))});
    EXPECT_EQ(first_error(neg), ErrorKind::TypeError);
}

TEST(UserFunctionBuild, ComparisonRules){
    auto cs = [](int v){ return sx::unary(OperatorToken::Tag, sx::int_lit(v)); };

    auto ordered = build_transition({sx::set_var("v", sx::cmp({cs(0), cs(1)}, {ComparisonToken::Lt}))});
    EXPECT_EQ(first_error(ordered), ErrorKind::InvalidComparison);

    auto mixed = build_transition({sx::set_var("v", sx::cmp({sx::int_lit(0), cs(1)}, {ComparisonToken::Eql}))});
    EXPECT_EQ(first_error(mixed), ErrorKind::TypeError);

    auto eq = build_transition({sx::set_var("v", sx::cmp({cs(0), cs(1)}, {ComparisonToken::Neq}))});
    EXPECT_TRUE(eq.success);

    auto chained = build_transition({sx::set_var("v", sx::cmp({sx::int_lit(0), sx::int_lit(1), sx::int_lit(2)},
                                                                {ComparisonToken::Lt, ComparisonToken::Lte}))});
    EXPECT_TRUE(chained.success);

    auto arity = build_transition({sx::set_var("v", sx::cmp({sx::int_lit(0), sx::int_lit(1)}, {}))});
    EXPECT_EQ(first_error(arity), ErrorKind::InternalError);
}

TEST(UserFunctionBuild, ErrorPointsPerOperator){
    UserFunction uf = UserFunction::new_transition_function(life_meta());
    BuildResult r;
    ASSERT_TRUE(uf.build_body({
        sx::set_var("a", sx::binary(sx::int_lit(6), OperatorToken::Slash, sx::int_lit(3))),   // overflow + div by zero
        sx::set_var("b", sx::binary(sx::int_lit(6), OperatorToken::Ampersand, sx::int_lit(3))), // none
        sx::set_var("c", sx::binary(sx::int_lit(6), OperatorToken::DoubleLessThan, sx::int_lit(3))), // bitshift
        sx::become(sx::unary(OperatorToken::Tag, sx::int_lit(1))), // cell state range
    }, r));
    const auto& pts = uf.error_points();
    ASSERT_EQ(pts.size(), 4u);
    EXPECT_EQ(pts[0].kind, ErrorKind::IntegerOverflow);
    EXPECT_EQ(pts[1].kind, ErrorKind::DivideByZero);
    EXPECT_EQ(pts[2].kind, ErrorKind::BitshiftOutOfRange);
    EXPECT_EQ(pts[3].kind, ErrorKind::CellStateOutOfRange);
}

TEST(UserFunctionBuild, StateCountMustFitCellState){
    auto become_n = [](unsigned state_count){
        UserFunction uf = UserFunction::new_transition_function(make_rule_meta(2, 1, state_count));
        BuildResult r;
        uf.build_body({sx::set_var("n", sx::int_lit(260)), sx::become(sx::unary(OperatorToken::Tag, sx::ident("n")))}, r);
        return r;
    };
    // #260 would wrap to #4 in an 8-bit cell state.
    auto wide = become_n(300);
    ASSERT_EQ(first_error(wide), ErrorKind::InternalError);
    EXPECT_NE(wide.errors[0].message.find("300"), std::string::npos);

    EXPECT_EQ(first_error(become_n(0)), ErrorKind::InternalError);
    EXPECT_TRUE(become_n(MAX_STATE_COUNT).success);
    EXPECT_TRUE(become_n(1).success);
}

TEST(UserFunctionBuild, VectorReturnTypeLength){
    for(unsigned len : {0u, MAX_VECTOR_LEN + 1}){
        UserFunction uf = UserFunction::new_helper_function(life_meta(), Type::vector(len));
        BuildResult r;
        EXPECT_FALSE(uf.build_body({}, r));
        EXPECT_EQ(first_error(r), ErrorKind::InternalError);
    }
    UserFunction ok = UserFunction::new_helper_function(life_meta(), Type::vector(MAX_VECTOR_LEN));
    BuildResult r;
    EXPECT_TRUE(ok.build_body({}, r));
}
