#pragma once
#include "ndca/functions/function.hpp"
#include "ndca/syntax.hpp"

namespace ndca::functions {

// Checked integer negation.
struct NegInt {
    ErrorPointRef overflow_error;

    static std::optional<NegInt> try_new(UserFunction& uf, const Span& span, BuildResult& r);
    std::optional<Type> check_args(const UserFunction& uf, const Span& span, const Args& args, BuildResult& r) const;
    std::optional<Value> compile(Compiler& c, const UserFunction& uf, const Args& args) const;
    std::optional<ConstValue> const_eval(const UserFunction& uf, const Args& args) const;
};

// Binary integer arithmetic and bitwise operators, selected by token.
struct BinaryIntOp {
    syntax::OperatorToken op;
    // Only the error points the operator can raise are registered.
    std::optional<ErrorPointRef> overflow_error;
    std::optional<ErrorPointRef> div_by_zero_error;
    std::optional<ErrorPointRef> negative_exponent_error;
    std::optional<ErrorPointRef> bitshift_error;

    static std::optional<BinaryIntOp> try_new(UserFunction& uf, const Span& span, syntax::OperatorToken op, BuildResult& r);
    std::optional<Type> check_args(const UserFunction& uf, const Span& span, const Args& args, BuildResult& r) const;
    std::optional<Value> compile(Compiler& c, const UserFunction& uf, const Args& args) const;
    std::optional<ConstValue> const_eval(const UserFunction& uf, const Args& args) const;

private:
    llvm::Value* compile_pow(Compiler& c, llvm::Value* base, llvm::Value* exponent) const;
};

// Evaluates `lhs op rhs` with the same trapping rules as generated code;
// nullopt where the generated code would return an error.
std::optional<int32_t> eval_binary_int_op(syntax::OperatorToken op, int32_t lhs, int32_t rhs);

} // namespace ndca::functions
