#pragma once

#include <llvm/IR/Module.h>

#include "ndca/ir/context.hpp"

namespace ndca::ir {

// Runs the optional optimization pipeline configured by `env`:
//   enablePasses gates everything
//   passPipeline (textual) overrides the preset if it parses
//   optLevel selects the preset otherwise; 0 leaves the module untouched
//   verifyIR adds verification before and after
// Returns false if verification failed after the pipeline ran.
bool run_pass_pipeline(llvm::Module& M, const CompileEnv& env);

} // namespace ndca::ir
