#include "ndca/ir/compiler.hpp"
#include "ndca/ir/return_encoding.hpp"
#include "ndca/ast/refs.hpp"

#include <cstdio>
#include <iterator>

#include <llvm/ADT/APInt.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/raw_ostream.h>

namespace ndca {

Compiler::Compiler(const std::string& module_name, CompileEnv env)
    : env_(std::move(env)),
      tsctx_(thread_context()),
      llctx_(tsctx_.getContext()),
      module_(std::make_unique<llvm::Module>(module_name, *llctx_)),
      builder_(*llctx_) {
    apply_env_to_module(*module_, env_);
}

Compiler::~Compiler() = default;

llvm::IntegerType* Compiler::return_type(){ return llvm::Type::getIntNTy(*llctx_, RETURN_BITS); }
llvm::IntegerType* Compiler::int_type(){ return llvm::Type::getIntNTy(*llctx_, INT_BITS); }
llvm::IntegerType* Compiler::cell_state_type(){ return llvm::Type::getIntNTy(*llctx_, CELL_STATE_BITS); }

llvm::Type* Compiler::llvm_type(const Type& t){
    switch(t.kind){
        case Type::Kind::Int: return int_type();
        case Type::Kind::CellState: return cell_state_type();
        case Type::Kind::Vector: return llvm::FixedVectorType::get(int_type(), t.vector_len);
    }
    return int_type();
}

llvm::Function* Compiler::begin_function(const std::string& name){
    auto *fty = llvm::FunctionType::get(return_type(), {}, /*isVarArg*/ false);
    fn_ = llvm::Function::Create(fty, llvm::Function::ExternalLinkage, name, module_.get());
    auto *entry = llvm::BasicBlock::Create(*llctx_, "entry", fn_);
    builder_.SetInsertPoint(entry);
    var_slots_.clear();
    if(env_.debugCodegen) std::fprintf(stderr, "[codegen] begin function %s\n", name.c_str());
    return fn_;
}

llvm::AllocaInst* Compiler::alloc_var_slot(const std::string& name, const Type& t){
    auto *slot = build_entry_alloca(llvm_type(t), name);
    // Default store goes right after the alloca so it runs before any use.
    llvm::IRBuilder<> eb(slot->getParent(), std::next(slot->getIterator()));
    eb.CreateStore(get_default_var_value(t), slot);
    var_slots_[name] = slot;
    if(env_.debugCodegen) std::fprintf(stderr, "[codegen] slot %s : %s\n", name.c_str(), t.to_string().c_str());
    return slot;
}

llvm::AllocaInst* Compiler::var_slot(const std::string& name) const {
    auto it = var_slots_.find(name);
    return it == var_slots_.end() ? nullptr : it->second;
}

llvm::AllocaInst* Compiler::build_entry_alloca(llvm::Type* ty, const std::string& name){
    llvm::BasicBlock& entryBB = fn_->getEntryBlock();
    llvm::IRBuilder<> eb(&entryBB, entryBB.begin());
    // Keep allocas grouped at the top of the entry block, in creation order.
    while(eb.GetInsertPoint() != entryBB.end() && llvm::isa<llvm::AllocaInst>(*eb.GetInsertPoint()))
        eb.SetInsertPoint(&entryBB, std::next(eb.GetInsertPoint()));
    return eb.CreateAlloca(ty, nullptr, name);
}

llvm::BasicBlock* Compiler::append_basic_block(const std::string& label){
    return llvm::BasicBlock::Create(*llctx_, label, fn_);
}

bool Compiler::needs_terminator() const {
    llvm::BasicBlock* bb = builder_.GetInsertBlock();
    return bb && !bb->getTerminator();
}

bool Compiler::build_conditional(llvm::Value* condition, const BuildFn& build_if_true, const BuildFn& build_if_false){
    auto *condTy = condition ? llvm::dyn_cast<llvm::IntegerType>(condition->getType()) : nullptr;
    if(!condTy) return fail(internal_error({}, "conditional on a non-integer value"));

    auto *if_true_bb = append_basic_block("ifTrue");
    auto *if_false_bb = append_basic_block("ifFalse");
    auto *merge_bb = append_basic_block("endIf");

    // A switch rather than a conditional branch, because the condition might not be 1-bit.
    auto *sw = builder_.CreateSwitch(condition, if_true_bb, 1);
    sw->addCase(llvm::ConstantInt::get(condTy, 0), if_false_bb);

    builder_.SetInsertPoint(if_true_bb);
    if(!build_if_true(*this)) return false;
    if(needs_terminator()) builder_.CreateBr(merge_bb);

    builder_.SetInsertPoint(if_false_bb);
    if(!build_if_false(*this)) return false;
    if(needs_terminator()) builder_.CreateBr(merge_bb);

    builder_.SetInsertPoint(merge_bb);
    return true;
}

bool Compiler::build_return_ok(const Value& v){
    if(!v.llvm_value) return fail(internal_error({}, "return of a missing value"));
    if(v.type.is_vector()) return fail(internal_error({}, "vector values cannot be returned"));
    auto *wide = builder_.CreateZExt(v.llvm_value, return_type(), "retval");
    builder_.CreateRet(wide);
    return true;
}

void Compiler::build_return_error(size_t error_index){
    if(env_.debugCodegen) std::fprintf(stderr, "[codegen] trap -> error point %zu\n", error_index);
    builder_.CreateRet(llvm::ConstantInt::get(return_type(), encode_error_index(error_index)));
}

bool ErrorPointRef::compile(Compiler& c) const {
    c.build_return_error(idx);
    return true;
}

llvm::Value* Compiler::build_checked_int_arithmetic(llvm::Value* lhs, llvm::Value* rhs, const std::string& name,
                                                    const BuildFn& on_overflow){
    llvm::Intrinsic::ID id;
    if(name=="sadd") id = llvm::Intrinsic::sadd_with_overflow;
    else if(name=="ssub") id = llvm::Intrinsic::ssub_with_overflow;
    else if(name=="smul") id = llvm::Intrinsic::smul_with_overflow;
    else { fail(internal_error({}, "unknown checked arithmetic operation '"+name+"'")); return nullptr; }

    llvm::Function* intrinsic = get_llvm_intrinsic(id, lhs->getType());
    // The intrinsic returns {result, overflow flag}.
    auto *call = builder_.CreateCall(intrinsic, {lhs, rhs}, "tmp_" + name);
    auto *result = builder_.CreateExtractValue(call, 0, "tmp_" + name + "Result");
    auto *is_overflow = builder_.CreateExtractValue(call, 1, "tmp_" + name + "Overflow");

    if(!build_conditional(is_overflow, on_overflow, [](Compiler&){ return true; })) return nullptr;
    return result;
}

bool Compiler::build_div_check(llvm::Value* lhs, llvm::Value* rhs, const BuildFn& on_overflow, const BuildFn& on_div_by_zero){
    auto *zero = llvm::ConstantInt::get(int_type(), 0);
    auto *is_div_by_zero = builder_.CreateICmpEQ(rhs, zero, "isDivByZero");
    return build_conditional(
        is_div_by_zero,
        on_div_by_zero,
        [&](Compiler& c){
            // MIN / -1 is the one signed division that overflows.
            auto *num_is_min_value = c.builder().CreateICmpEQ(lhs, c.get_min_int_value(), "isMinValue");
            auto *negative_one = llvm::ConstantInt::get(c.int_type(), -1, /*isSigned*/ true);
            auto *denom_is_neg_one = c.builder().CreateICmpEQ(rhs, negative_one, "isNegOne");
            auto *is_overflow = c.builder().CreateAnd(num_is_min_value, denom_is_neg_one, "isOverflow");
            return c.build_conditional(is_overflow, on_overflow, [](Compiler&){ return true; });
        });
}

llvm::Constant* Compiler::get_default_var_value(const Type& t){
    return llvm::Constant::getNullValue(llvm_type(t));
}

llvm::ConstantInt* Compiler::get_min_int_value(){
    return llvm::ConstantInt::get(*llctx_, llvm::APInt::getSignedMinValue(INT_BITS));
}

llvm::Function* Compiler::get_llvm_intrinsic(llvm::Intrinsic::ID id, llvm::Type* overload){
    return llvm::Intrinsic::getDeclaration(module_.get(), id, {overload});
}

bool Compiler::verify_function(){
    if(!fn_) return true;
    std::string msg; llvm::raw_string_ostream os(msg);
    if(llvm::verifyFunction(*fn_, &os)){
        os.flush();
        if(env_.debugCodegen) llvm::errs() << "[ndca] IR verify failed for " << fn_->getName() << "\n" << msg;
        return fail(internal_error({}, "generated IR failed verification: " + msg));
    }
    return true;
}

bool Compiler::verify_module(){
    std::string msg; llvm::raw_string_ostream os(msg);
    if(llvm::verifyModule(*module_, &os)){
        os.flush();
        return fail(internal_error({}, "generated module failed verification: " + msg));
    }
    return true;
}

std::string Compiler::print_ir() const {
    std::string out; llvm::raw_string_ostream os(out);
    if(module_) module_->print(os, nullptr);
    os.flush();
    return out;
}

llvm::orc::ThreadSafeModule Compiler::take_module(){
    fn_ = nullptr;
    var_slots_.clear();
    builder_.ClearInsertionPoint();
    return llvm::orc::ThreadSafeModule(std::move(module_), tsctx_);
}

} // namespace ndca
