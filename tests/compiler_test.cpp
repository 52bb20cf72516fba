// Code generator primitives, checked at the IR level.
#include <gtest/gtest.h>
#include <string>

#include <llvm/IR/Constants.h>
#include <llvm/IR/Instructions.h>

#include "ndca/ir/compiler.hpp"
#include "ndca/ir/return_encoding.hpp"

using namespace ndca;

namespace {
bool noop(Compiler&){ return true; }
}

TEST(Compiler, NeedsTerminatorTracksCursorBlock){
    Compiler c("t", CompileEnv{});
    c.begin_function("f");
    EXPECT_TRUE(c.needs_terminator());
    auto *three = llvm::ConstantInt::get(c.int_type(), 3);
    ASSERT_TRUE(c.build_return_ok(Value{Type::integer(), three}));
    EXPECT_FALSE(c.needs_terminator());
    EXPECT_TRUE(c.verify_function());
}

TEST(Compiler, ConditionalSkipsBranchAfterTerminatedArm){
    Compiler c("t", CompileEnv{});
    llvm::Function* F = c.begin_function("f");
    auto *cond = llvm::ConstantInt::get(c.int_type(), 7); // not 1-bit
    ASSERT_TRUE(c.build_conditional(cond, [](Compiler& cc){ cc.build_return_error(2); return true; }, noop));
    EXPECT_TRUE(c.needs_terminator());
    EXPECT_EQ(c.builder().GetInsertBlock()->getName(), "endIf");

    llvm::BasicBlock* if_true = nullptr; llvm::BasicBlock* if_false = nullptr;
    for(llvm::BasicBlock& bb : *F){
        if(bb.getName().str().rfind("ifTrue", 0) == 0) if_true = &bb;
        if(bb.getName().str().rfind("ifFalse", 0) == 0) if_false = &bb;
    }
    ASSERT_NE(if_true, nullptr);
    ASSERT_NE(if_false, nullptr);
    // The trapping arm ends in its own return and has no extra branch.
    ASSERT_EQ(if_true->size(), 1u);
    auto *ret = llvm::dyn_cast<llvm::ReturnInst>(if_true->getTerminator());
    ASSERT_NE(ret, nullptr);
    auto *code = llvm::dyn_cast<llvm::ConstantInt>(ret->getReturnValue());
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(code->getZExtValue(), encode_error_index(2));
    // The empty arm falls through to the merge block.
    auto *br = llvm::dyn_cast<llvm::BranchInst>(if_false->getTerminator());
    ASSERT_NE(br, nullptr);
    EXPECT_EQ(br->getSuccessor(0), c.builder().GetInsertBlock());

    ASSERT_TRUE(c.build_return_ok(Value{Type::integer(), llvm::ConstantInt::get(c.int_type(), 0)}));
    EXPECT_TRUE(c.verify_function());
}

TEST(Compiler, ConditionalDispatchesWithSwitch){
    Compiler c("t", CompileEnv{});
    c.begin_function("f");
    llvm::BasicBlock* entry = c.builder().GetInsertBlock();
    ASSERT_TRUE(c.build_conditional(llvm::ConstantInt::get(c.int_type(), 1), noop, noop));
    auto *sw = llvm::dyn_cast<llvm::SwitchInst>(entry->getTerminator());
    ASSERT_NE(sw, nullptr);
    EXPECT_EQ(sw->getNumCases(), 1u);
    EXPECT_EQ(sw->getDefaultDest()->getName(), "ifTrue");
}

TEST(Compiler, VarSlotsLiveInEntryBlock){
    Compiler c("t", CompileEnv{});
    llvm::Function* F = c.begin_function("f");
    ASSERT_TRUE(c.build_conditional(llvm::ConstantInt::get(c.int_type(), 1), noop, noop));
    // Allocated after the cursor has left the entry block.
    llvm::AllocaInst* slot = c.alloc_var_slot("x", Type::cell_state());
    ASSERT_NE(slot, nullptr);
    EXPECT_EQ(slot->getParent(), &F->getEntryBlock());
    EXPECT_EQ(c.var_slot("x"), slot);
    EXPECT_EQ(c.var_slot("y"), nullptr);
    EXPECT_TRUE(slot->getAllocatedType()->isIntegerTy(CELL_STATE_BITS));
    auto *init = llvm::dyn_cast<llvm::StoreInst>(slot->getNextNode());
    ASSERT_NE(init, nullptr);
    EXPECT_TRUE(llvm::isa<llvm::ConstantInt>(init->getValueOperand()));

    ASSERT_TRUE(c.build_return_ok(Value{Type::integer(), llvm::ConstantInt::get(c.int_type(), 0)}));
    EXPECT_TRUE(c.verify_function());
}

TEST(Compiler, CheckedArithmeticUsesOverflowIntrinsic){
    Compiler c("t", CompileEnv{});
    c.begin_function("f");
    auto *a = llvm::ConstantInt::get(c.int_type(), 1);
    auto *b = llvm::ConstantInt::get(c.int_type(), 2);
    llvm::Value* sum = c.build_checked_int_arithmetic(a, b, "sadd", [](Compiler& cc){ cc.build_return_error(0); return true; });
    ASSERT_NE(sum, nullptr);
    ASSERT_TRUE(c.build_return_ok(Value{Type::integer(), sum}));
    EXPECT_TRUE(c.verify_function());
    std::string ir = c.print_ir();
    EXPECT_NE(ir.find("llvm.sadd.with.overflow.i32"), std::string::npos) << ir;

    EXPECT_EQ(c.build_checked_int_arithmetic(a, b, "sdiv", noop), nullptr);
    ASSERT_FALSE(c.result().success);
    EXPECT_EQ(c.result().errors.back().kind, ErrorKind::InternalError);
    // Only the signed operations are lowered.
    EXPECT_EQ(c.build_checked_int_arithmetic(a, b, "uadd", noop), nullptr);
    EXPECT_EQ(c.result().errors.size(), 2u);
}

TEST(Compiler, VectorReturnIsRejected){
    Compiler c("t", CompileEnv{});
    c.begin_function("f");
    auto *zero = c.get_default_var_value(Type::vector(4));
    EXPECT_FALSE(c.build_return_ok(Value{Type::vector(4), zero}));
    EXPECT_FALSE(c.result().success);
}

TEST(Compiler, TakeModuleHandsOverFunction){
    Compiler c("t", CompileEnv{});
    c.begin_function("f");
    ASSERT_TRUE(c.build_return_ok(Value{Type::integer(), llvm::ConstantInt::get(c.int_type(), 0)}));
    auto tsm = c.take_module();
    bool found = false;
    tsm.withModuleDo([&](llvm::Module& m){ found = m.getFunction("f") != nullptr; });
    EXPECT_TRUE(found);
}
