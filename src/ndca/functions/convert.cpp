#include "ndca/functions/convert.hpp"
#include "ndca/ast/userfunc.hpp"
#include "ndca/ir/compiler.hpp"

#include <llvm/IR/Constants.h>

namespace ndca::functions {

std::optional<IntToCellState> IntToCellState::try_new(UserFunction& uf, const Span& span, BuildResult& r){
    const RuleMetaPtr& meta = uf.rule_meta();
    if(!meta){ fail(r, internal_error(span, "cell state conversion outside of a rule")); return std::nullopt; }
    const unsigned state_count = meta->state_count;
    if(state_count < 1 || state_count > MAX_STATE_COUNT){
        fail(r, internal_error(span, "rule has "+std::to_string(state_count)+" cell states; expected 1 through "
                                     +std::to_string(MAX_STATE_COUNT)));
        return std::nullopt;
    }
    auto err = uf.add_error_point(make_error(ErrorKind::CellStateOutOfRange, span,
        "cell state out of range", "valid cell states are #0 through #"+std::to_string(state_count-1)));
    return IntToCellState{state_count, err};
}

std::optional<Type> IntToCellState::check_args(const UserFunction& uf, const Span& span, const Args& args, BuildResult& r) const {
    if(!expect_arg_count("cell state conversion", span, args, 1, r)) return std::nullopt;
    if(!expect_arg_type(uf, args[0], Type::integer(), r)) return std::nullopt;
    return Type::cell_state();
}

std::optional<Value> IntToCellState::compile(Compiler& c, const UserFunction& uf, const Args& args) const {
    auto arg = uf.compile_expr(c, args[0]);
    if(!arg) return std::nullopt;
    llvm::Value* x = arg->llvm_value;
    // One unsigned compare covers both x < 0 and x >= state_count.
    auto *limit = llvm::ConstantInt::get(c.int_type(), state_count);
    auto *out_of_range = c.builder().CreateICmpUGE(x, limit, "isCellStateOutOfRange");
    bool ok = c.build_conditional(out_of_range,
                                  [this](Compiler& cc){ return out_of_range_error.compile(cc); },
                                  [](Compiler&){ return true; });
    if(!ok) return std::nullopt;
    return Value{Type::cell_state(), c.builder().CreateTrunc(x, c.cell_state_type(), "cellState")};
}

std::optional<ConstValue> IntToCellState::const_eval(const UserFunction& uf, const Args& args) const {
    auto x = const_eval_int_arg(uf, args[0]);
    if(!x || *x < 0 || static_cast<unsigned>(*x) >= state_count) return std::nullopt;
    return ConstValue{std::in_place_type<uint8_t>, static_cast<uint8_t>(*x)};
}

} // namespace ndca::functions
