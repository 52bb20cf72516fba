// Index handles into the arenas of one UserFunction. Never exchanged across functions.
#pragma once
#include <cstddef>
#include <vector>

namespace ndca {

class Compiler;

struct ExprRef {
    size_t idx = 0;
    bool operator==(const ExprRef& o) const { return idx == o.idx; }
    bool operator!=(const ExprRef& o) const { return idx != o.idx; }
};

struct StatementRef {
    size_t idx = 0;
    bool operator==(const StatementRef& o) const { return idx == o.idx; }
    bool operator!=(const StatementRef& o) const { return idx != o.idx; }
};

// A possible runtime error registered at build time.
struct ErrorPointRef {
    size_t idx = 0;
    bool operator==(const ErrorPointRef& o) const { return idx == o.idx; }
    bool operator!=(const ErrorPointRef& o) const { return idx != o.idx; }
    // Emits a return of this error; always terminates the current block.
    bool compile(Compiler& c) const;
};

using Args = std::vector<ExprRef>;
using StatementBlock = std::vector<StatementRef>;

} // namespace ndca
