#pragma once
#include "ndca/types.hpp"

namespace llvm { class Value; }

namespace ndca {

// Result of compiling an expression: an LLVM SSA value tagged with its language type.
struct Value {
    Type type;
    llvm::Value* llvm_value = nullptr;
};

} // namespace ndca
