#include "ndca/functions/math.hpp"
#include "ndca/ast/userfunc.hpp"
#include "ndca/ir/compiler.hpp"

#include <llvm/IR/Constants.h>

namespace ndca::functions {

using syntax::OperatorToken;

static LangError overflow_error_for(const Span& span){
    return make_error(ErrorKind::IntegerOverflow, span, "integer overflow");
}

static bool is_checked_arith(OperatorToken op){
    return op==OperatorToken::Plus || op==OperatorToken::Minus || op==OperatorToken::Asterisk;
}
static bool is_division(OperatorToken op){
    return op==OperatorToken::Slash || op==OperatorToken::Percent;
}
static bool is_shift(OperatorToken op){
    return op==OperatorToken::DoubleLessThan || op==OperatorToken::DoubleGreaterThan || op==OperatorToken::TripleGreaterThan;
}

// --- NegInt ---------------------------------------------------------------

std::optional<NegInt> NegInt::try_new(UserFunction& uf, const Span& span, BuildResult&){
    return NegInt{uf.add_error_point(overflow_error_for(span))};
}

std::optional<Type> NegInt::check_args(const UserFunction& uf, const Span& span, const Args& args, BuildResult& r) const {
    if(!expect_arg_count("negation", span, args, 1, r)) return std::nullopt;
    if(!expect_arg_type(uf, args[0], Type::integer(), r)) return std::nullopt;
    return Type::integer();
}

std::optional<Value> NegInt::compile(Compiler& c, const UserFunction& uf, const Args& args) const {
    auto operand = uf.compile_expr(c, args[0]);
    if(!operand) return std::nullopt;
    auto *zero = llvm::ConstantInt::get(c.int_type(), 0);
    auto *result = c.build_checked_int_arithmetic(zero, operand->llvm_value, "ssub",
                                                  [this](Compiler& cc){ return overflow_error.compile(cc); });
    if(!result) return std::nullopt;
    return Value{Type::integer(), result};
}

std::optional<ConstValue> NegInt::const_eval(const UserFunction& uf, const Args& args) const {
    auto x = const_eval_int_arg(uf, args[0]);
    if(!x || !fits_int(-int64_t(*x))) return std::nullopt;
    return ConstValue{std::in_place_type<int32_t>, static_cast<int32_t>(-int64_t(*x))};
}

// --- BinaryIntOp ----------------------------------------------------------

std::optional<BinaryIntOp> BinaryIntOp::try_new(UserFunction& uf, const Span& span, OperatorToken op, BuildResult& r){
    BinaryIntOp out{op, std::nullopt, std::nullopt, std::nullopt, std::nullopt};
    switch(op){
        case OperatorToken::Plus:
        case OperatorToken::Minus:
        case OperatorToken::Asterisk:
            out.overflow_error = uf.add_error_point(overflow_error_for(span));
            break;
        case OperatorToken::Slash:
        case OperatorToken::Percent:
            out.overflow_error = uf.add_error_point(overflow_error_for(span));
            out.div_by_zero_error = uf.add_error_point(make_error(ErrorKind::DivideByZero, span, "division by zero"));
            break;
        case OperatorToken::DoubleAsterisk:
            out.overflow_error = uf.add_error_point(overflow_error_for(span));
            out.negative_exponent_error = uf.add_error_point(make_error(ErrorKind::NegativeExponent, span, "negative exponent"));
            break;
        case OperatorToken::DoubleLessThan:
        case OperatorToken::DoubleGreaterThan:
        case OperatorToken::TripleGreaterThan:
            out.bitshift_error = uf.add_error_point(make_error(ErrorKind::BitshiftOutOfRange, span,
                "bitshift amount out of range", "shift amounts must be between 0 and "+std::to_string(INT_BITS-1)));
            break;
        case OperatorToken::Ampersand:
        case OperatorToken::Pipe:
        case OperatorToken::Caret:
            break;
        default:
            fail(r, internal_error(span, "Invalid binary operator"));
            return std::nullopt;
    }
    return out;
}

std::optional<Type> BinaryIntOp::check_args(const UserFunction& uf, const Span& span, const Args& args, BuildResult& r) const {
    if(!expect_arg_count(syntax::to_string(op), span, args, 2, r)) return std::nullopt;
    if(!expect_arg_type(uf, args[0], Type::integer(), r)) return std::nullopt;
    if(!expect_arg_type(uf, args[1], Type::integer(), r)) return std::nullopt;
    return Type::integer();
}

std::optional<Value> BinaryIntOp::compile(Compiler& c, const UserFunction& uf, const Args& args) const {
    auto operands = compile_args(c, uf, args);
    if(!operands) return std::nullopt;
    llvm::Value* lhs = (*operands)[0].llvm_value;
    llvm::Value* rhs = (*operands)[1].llvm_value;
    auto& B = c.builder();
    auto trap = [](const std::optional<ErrorPointRef>& p){
        return [p](Compiler& cc){ return p ? p->compile(cc) : cc.fail(internal_error({}, "missing error point")); };
    };

    llvm::Value* result = nullptr;
    if(is_checked_arith(op)){
        const char* name = op==OperatorToken::Plus ? "sadd" : op==OperatorToken::Minus ? "ssub" : "smul";
        result = c.build_checked_int_arithmetic(lhs, rhs, name, trap(overflow_error));
        if(!result) return std::nullopt;
    }
    else if(is_division(op)){
        if(!c.build_div_check(lhs, rhs, trap(overflow_error), trap(div_by_zero_error))) return std::nullopt;
        result = op==OperatorToken::Slash ? B.CreateSDiv(lhs, rhs, "quot") : B.CreateSRem(lhs, rhs, "rem");
    }
    else if(op == OperatorToken::DoubleAsterisk){
        result = compile_pow(c, lhs, rhs);
        if(!result) return std::nullopt;
    }
    else if(is_shift(op)){
        // Unsigned comparison also rejects negative amounts.
        auto *limit = llvm::ConstantInt::get(c.int_type(), INT_BITS);
        auto *out_of_range = B.CreateICmpUGE(rhs, limit, "isShiftOutOfRange");
        if(!c.build_conditional(out_of_range, trap(bitshift_error), [](Compiler&){ return true; })) return std::nullopt;
        auto& B2 = c.builder();
        if(op == OperatorToken::DoubleLessThan) result = B2.CreateShl(lhs, rhs, "shl");
        else if(op == OperatorToken::DoubleGreaterThan) result = B2.CreateAShr(lhs, rhs, "ashr");
        else result = B2.CreateLShr(lhs, rhs, "lshr");
    }
    else if(op == OperatorToken::Ampersand) result = B.CreateAnd(lhs, rhs, "and");
    else if(op == OperatorToken::Pipe) result = B.CreateOr(lhs, rhs, "or");
    else if(op == OperatorToken::Caret) result = B.CreateXor(lhs, rhs, "xor");
    else { c.fail(internal_error({}, "Invalid binary operator")); return std::nullopt; }

    return Value{Type::integer(), result};
}

// Square-and-multiply. The base is only squared while exponent bits remain,
// so an overflow while squaring implies the final result overflows too.
llvm::Value* BinaryIntOp::compile_pow(Compiler& c, llvm::Value* base, llvm::Value* exponent) const {
    auto& B = c.builder();
    auto *ity = c.int_type();
    auto trap = [](const std::optional<ErrorPointRef>& p){
        return [p](Compiler& cc){ return p ? p->compile(cc) : cc.fail(internal_error({}, "missing error point")); };
    };
    auto noop = [](Compiler&){ return true; };

    auto *is_negative = B.CreateICmpSLT(exponent, llvm::ConstantInt::get(ity, 0), "isNegExponent");
    if(!c.build_conditional(is_negative, trap(negative_exponent_error), noop)) return nullptr;

    auto *result_slot = c.build_entry_alloca(ity, "pow.result");
    auto *base_slot = c.build_entry_alloca(ity, "pow.base");
    auto *exp_slot = c.build_entry_alloca(ity, "pow.exp");
    c.builder().CreateStore(llvm::ConstantInt::get(ity, 1), result_slot);
    c.builder().CreateStore(base, base_slot);
    c.builder().CreateStore(exponent, exp_slot);

    auto *cond_bb = c.append_basic_block("pow.cond");
    auto *body_bb = c.append_basic_block("pow.body");
    auto *end_bb = c.append_basic_block("pow.end");
    c.builder().CreateBr(cond_bb);

    c.builder().SetInsertPoint(cond_bb);
    auto *e = c.builder().CreateLoad(ity, exp_slot, "e");
    auto *done = c.builder().CreateICmpEQ(e, llvm::ConstantInt::get(ity, 0), "isExpZero");
    c.builder().CreateCondBr(done, end_bb, body_bb);

    c.builder().SetInsertPoint(body_bb);
    auto *e_body = c.builder().CreateLoad(ity, exp_slot, "e");
    auto *low_bit = c.builder().CreateAnd(e_body, llvm::ConstantInt::get(ity, 1), "lowBit");
    bool ok = c.build_conditional(low_bit, [&](Compiler& cc){
        auto *acc = cc.builder().CreateLoad(ity, result_slot, "acc");
        auto *b = cc.builder().CreateLoad(ity, base_slot, "b");
        auto *prod = cc.build_checked_int_arithmetic(acc, b, "smul", trap(overflow_error));
        if(!prod) return false;
        cc.builder().CreateStore(prod, result_slot);
        return true;
    }, noop);
    if(!ok) return nullptr;
    auto *e_next = c.builder().CreateLShr(e_body, llvm::ConstantInt::get(ity, 1), "eNext");
    c.builder().CreateStore(e_next, exp_slot);
    ok = c.build_conditional(e_next, [&](Compiler& cc){
        auto *b = cc.builder().CreateLoad(ity, base_slot, "b");
        auto *sq = cc.build_checked_int_arithmetic(b, b, "smul", trap(overflow_error));
        if(!sq) return false;
        cc.builder().CreateStore(sq, base_slot);
        return true;
    }, noop);
    if(!ok) return nullptr;
    c.builder().CreateBr(cond_bb);

    c.builder().SetInsertPoint(end_bb);
    return c.builder().CreateLoad(ity, result_slot, "pow");
}

std::optional<int32_t> eval_binary_int_op(OperatorToken op, int32_t lhs, int32_t rhs){
    const int64_t a = lhs, b = rhs;
    auto checked = [](int64_t v)->std::optional<int32_t>{
        if(!fits_int(v)) return std::nullopt;
        return static_cast<int32_t>(v);
    };
    switch(op){
        case OperatorToken::Plus: return checked(a + b);
        case OperatorToken::Minus: return checked(a - b);
        case OperatorToken::Asterisk: return checked(a * b);
        case OperatorToken::Slash:
            if(b == 0) return std::nullopt;
            return checked(a / b);
        case OperatorToken::Percent:
            if(b == 0 || (a == INT_MIN_VALUE && b == -1)) return std::nullopt;
            return checked(a % b);
        case OperatorToken::DoubleAsterisk: {
            if(b < 0) return std::nullopt;
            int64_t result = 1, base = a;
            for(int64_t e = b; e != 0; ){
                if(e & 1){ result *= base; if(!fits_int(result)) return std::nullopt; }
                e >>= 1;
                if(e != 0){ base *= base; if(!fits_int(base)) return std::nullopt; }
            }
            return static_cast<int32_t>(result);
        }
        case OperatorToken::DoubleLessThan:
            if(b < 0 || b >= INT_BITS) return std::nullopt;
            return static_cast<int32_t>(static_cast<uint32_t>(lhs) << b);
        case OperatorToken::DoubleGreaterThan:
            if(b < 0 || b >= INT_BITS) return std::nullopt;
            return static_cast<int32_t>(lhs >> b);
        case OperatorToken::TripleGreaterThan:
            if(b < 0 || b >= INT_BITS) return std::nullopt;
            return static_cast<int32_t>(static_cast<uint32_t>(lhs) >> b);
        case OperatorToken::Ampersand: return lhs & rhs;
        case OperatorToken::Pipe: return lhs | rhs;
        case OperatorToken::Caret: return lhs ^ rhs;
        default: return std::nullopt;
    }
}

std::optional<ConstValue> BinaryIntOp::const_eval(const UserFunction& uf, const Args& args) const {
    auto lhs = const_eval_int_arg(uf, args[0]);
    auto rhs = const_eval_int_arg(uf, args[1]);
    if(!lhs || !rhs) return std::nullopt;
    auto v = eval_binary_int_op(op, *lhs, *rhs);
    if(!v) return std::nullopt;
    return ConstValue{std::in_place_type<int32_t>, *v};
}

} // namespace ndca::functions
