#pragma once
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Intrinsics.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include "ndca/errors.hpp"
#include "ndca/types.hpp"
#include "ndca/ir/context.hpp"
#include "ndca/ir/value.hpp"

namespace ndca {

// Native code generator for one module. Holds the instruction cursor and the
// function currently being built; not synchronized, so concurrent generation
// needs one Compiler per thread.
class Compiler {
public:
    // Callback that emits the body of a branch. Returns false on failure, after
    // reporting into result().
    using BuildFn = std::function<bool(Compiler&)>;

    explicit Compiler(const std::string& module_name = "ndca", CompileEnv env = detect_env());
    ~Compiler();
    Compiler(const Compiler&) = delete;
    Compiler& operator=(const Compiler&) = delete;

    llvm::LLVMContext& llctx() { return *llctx_; }
    llvm::Module& module() { return *module_; }
    const llvm::Module& module() const { return *module_; }
    llvm::IRBuilder<>& builder() { return builder_; }
    const CompileEnv& env() const { return env_; }
    BuildResult& result() { return result_; }
    bool fail(LangError e) { return ErrorReporter{&result_}.fail(std::move(e)); }

    llvm::IntegerType* return_type();
    llvm::IntegerType* int_type();
    llvm::IntegerType* cell_state_type();
    llvm::Type* llvm_type(const Type& t);

    // Opens `i64 name()` with an empty entry block and clears variable slots.
    llvm::Function* begin_function(const std::string& name);
    // Function currently being built; nullptr before begin_function().
    llvm::Function* fn_value() const { return fn_; }

    // Allocates a variable's slot in the entry block and stores its default value.
    llvm::AllocaInst* alloc_var_slot(const std::string& name, const Type& t);
    llvm::AllocaInst* var_slot(const std::string& name) const;
    // Scratch slot in the entry block, independent of the cursor position.
    llvm::AllocaInst* build_entry_alloca(llvm::Type* ty, const std::string& name);

    llvm::BasicBlock* append_basic_block(const std::string& label);
    // True iff the block under the cursor has no terminator yet.
    bool needs_terminator() const;

    // Branches on `condition != 0` and leaves the cursor at the merge block.
    // Arms that did not terminate fall through to the merge block.
    bool build_conditional(llvm::Value* condition, const BuildFn& build_if_true, const BuildFn& build_if_false);

    // Zero-extends a result into the return integer and returns it.
    bool build_return_ok(const Value& v);
    // Returns `error_index | 1 << 63`.
    void build_return_error(size_t error_index);

    // `name` is one of sadd, ssub, smul. Returns the
    // arithmetic result, valid only on the non-overflow path; nullptr on failure.
    llvm::Value* build_checked_int_arithmetic(llvm::Value* lhs, llvm::Value* rhs, const std::string& name,
                                              const BuildFn& on_overflow);
    // Guards a signed division: rhs == 0 runs on_div_by_zero, MIN / -1 runs
    // on_overflow. Both callbacks are expected to terminate their path.
    bool build_div_check(llvm::Value* lhs, llvm::Value* rhs, const BuildFn& on_overflow, const BuildFn& on_div_by_zero);

    llvm::Constant* get_default_var_value(const Type& t);
    llvm::ConstantInt* get_min_int_value();
    llvm::Function* get_llvm_intrinsic(llvm::Intrinsic::ID id, llvm::Type* overload);

    // Runs the LLVM verifier on the current function; failures are reported as internal errors.
    bool verify_function();
    bool verify_module();
    std::string print_ir() const;

    // Hands the module (and a reference to this thread's context) to a JIT.
    llvm::orc::ThreadSafeModule take_module();

private:
    CompileEnv env_;
    llvm::orc::ThreadSafeContext tsctx_;
    llvm::LLVMContext* llctx_ = nullptr;
    std::unique_ptr<llvm::Module> module_;
    llvm::IRBuilder<> builder_;
    llvm::Function* fn_ = nullptr;
    std::unordered_map<std::string, llvm::AllocaInst*> var_slots_;
    BuildResult result_;
};

} // namespace ndca
