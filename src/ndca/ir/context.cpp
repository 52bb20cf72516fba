#include "ndca/ir/context.hpp"
#include <cstdio>
#include <cstdlib>
#include <memory>

namespace ndca {

llvm::orc::ThreadSafeContext thread_context(){
    thread_local llvm::orc::ThreadSafeContext ctx;
    if(!ctx.getContext()){
        ctx = llvm::orc::ThreadSafeContext(std::make_unique<llvm::LLVMContext>());
        if(const char* dbg = std::getenv("NDCA_DEBUG_CODEGEN"); dbg && dbg[0]=='1')
            std::fprintf(stderr, "[codegen] created thread-local LLVM context %p\n", (void*)ctx.getContext());
    }
    return ctx;
}

void apply_env_to_module(llvm::Module& M, const CompileEnv& env){
    if(!env.targetTriple.empty()){
        M.setTargetTriple(env.targetTriple);
    }
}

} // namespace ndca
