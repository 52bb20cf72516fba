#pragma once
#include <string>

#include <llvm/ExecutionEngine/Orc/ThreadSafeModule.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

namespace ndca {

struct CompileEnv {
    bool debugCodegen = false;
    bool verifyIR = false;
    bool dumpIR = false;
    bool enablePasses = false;
    int optLevel = 1;          // 0..3, used when enablePasses and no custom pipeline
    std::string passPipeline;  // textual new-PM pipeline; overrides optLevel
    std::string targetTriple;  // empty = default
};

// Detect compile environment from process env vars:
//   NDCA_DEBUG_CODEGEN=1, NDCA_VERIFY_IR=1, NDCA_DUMP_IR=1,
//   NDCA_ENABLE_PASSES=1, NDCA_OPT_LEVEL=0..3, NDCA_PASS_PIPELINE, NDCA_TARGET_TRIPLE
CompileEnv detect_env();

// Apply environment configuration to a module (e.g., target triple). Safe to call with defaults.
void apply_env_to_module(llvm::Module& M, const CompileEnv& env);

// LLVM context of the calling thread. Created on first use and never handed to
// another thread; modules built in it carry a copy of the handle so the context
// outlives them.
llvm::orc::ThreadSafeContext thread_context();

} // namespace ndca
