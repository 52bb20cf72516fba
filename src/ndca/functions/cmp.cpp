#include "ndca/functions/cmp.hpp"
#include "ndca/ast/userfunc.hpp"
#include "ndca/ir/compiler.hpp"

#include <llvm/IR/Constants.h>

namespace ndca::functions {

using syntax::ComparisonToken;

static bool is_equality(ComparisonToken t){ return t==ComparisonToken::Eql || t==ComparisonToken::Neq; }

static llvm::CmpInst::Predicate predicate_for(ComparisonToken t, bool is_signed){
    switch(t){
        case ComparisonToken::Eql: return llvm::CmpInst::ICMP_EQ;
        case ComparisonToken::Neq: return llvm::CmpInst::ICMP_NE;
        case ComparisonToken::Lt:  return is_signed ? llvm::CmpInst::ICMP_SLT : llvm::CmpInst::ICMP_ULT;
        case ComparisonToken::Gt:  return is_signed ? llvm::CmpInst::ICMP_SGT : llvm::CmpInst::ICMP_UGT;
        case ComparisonToken::Lte: return is_signed ? llvm::CmpInst::ICMP_SLE : llvm::CmpInst::ICMP_ULE;
        case ComparisonToken::Gte: return is_signed ? llvm::CmpInst::ICMP_SGE : llvm::CmpInst::ICMP_UGE;
    }
    return llvm::CmpInst::ICMP_EQ;
}

template<typename T>
static bool compare(ComparisonToken t, T a, T b){
    switch(t){
        case ComparisonToken::Eql: return a == b;
        case ComparisonToken::Neq: return a != b;
        case ComparisonToken::Lt:  return a < b;
        case ComparisonToken::Gt:  return a > b;
        case ComparisonToken::Lte: return a <= b;
        case ComparisonToken::Gte: return a >= b;
    }
    return false;
}

std::optional<Cmp> Cmp::try_new(UserFunction& uf, const Span& span, const Args& args,
                                std::vector<ComparisonToken> cmps, BuildResult& r){
    if(args.empty()){ fail(r, internal_error(span, "comparison without operands")); return std::nullopt; }
    // The first operand fixes the type every other operand must have.
    return Cmp{std::move(cmps), uf[args[0]].return_type};
}

std::optional<Type> Cmp::check_args(const UserFunction& uf, const Span& span, const Args& args, BuildResult& r) const {
    if(args.size() < 2 || args.size() != cmps.size() + 1){
        fail(r, internal_error(span, "comparison expects "+std::to_string(cmps.size()+1)+" operands; got "+std::to_string(args.size())));
        return std::nullopt;
    }
    if(operand_type.is_vector()){
        fail(r, type_error(uf[args[0]].span, Type::integer(), operand_type));
        return std::nullopt;
    }
    for(size_t i=1; i<args.size(); ++i)
        if(!expect_arg_type(uf, args[i], operand_type, r)) return std::nullopt;
    if(operand_type.is_cell_state()){
        for(ComparisonToken t : cmps){
            if(is_equality(t)) continue;
            fail(r, make_error(ErrorKind::InvalidComparison, span,
                               std::string("cannot compare cell states with '")+syntax::to_string(t)+"'",
                               "cell states only support '==' and '!='"));
            return std::nullopt;
        }
    }
    return Type::integer();
}

std::optional<Value> Cmp::compile(Compiler& c, const UserFunction& uf, const Args& args) const {
    auto operands = compile_args(c, uf, args);
    if(!operands) return std::nullopt;
    auto& B = c.builder();
    const bool is_signed = operand_type.is_int();
    llvm::Value* acc = nullptr;
    for(size_t i=0; i<cmps.size(); ++i){
        auto *bit = B.CreateICmp(predicate_for(cmps[i], is_signed),
                                 (*operands)[i].llvm_value, (*operands)[i+1].llvm_value, "cmp");
        acc = acc ? B.CreateAnd(acc, bit, "cmpAnd") : bit;
    }
    return Value{Type::integer(), B.CreateZExt(acc, c.int_type(), "cmpResult")};
}

std::optional<ConstValue> Cmp::const_eval(const UserFunction& uf, const Args& args) const {
    std::vector<ConstValue> values;
    values.reserve(args.size());
    for(ExprRef a : args){
        auto v = uf.const_eval_expr(a);
        if(!v) return std::nullopt;
        values.push_back(std::move(*v));
    }
    bool all = true;
    for(size_t i=0; i<cmps.size() && all; ++i){
        if(operand_type.is_int()) all = compare(cmps[i], std::get<int32_t>(values[i]), std::get<int32_t>(values[i+1]));
        else all = compare(cmps[i], std::get<uint8_t>(values[i]), std::get<uint8_t>(values[i+1]));
    }
    return ConstValue{std::in_place_type<int32_t>, all ? 1 : 0};
}

} // namespace ndca::functions
