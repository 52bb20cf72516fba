// Build-time and run-time diagnostics shared by the AST builder and code generator.
#pragma once
#include "ndca/types.hpp"
#include <string>
#include <vector>

namespace ndca {

// Source range; -1 marks an unknown position.
struct Span { int line=-1; int col=-1; int end_line=-1; int end_col=-1; };

enum class ErrorKind {
    // build time
    UseOfUninitializedVariable,
    BecomeInHelperFunction,
    ReturnInTransitionFunction,
    Expected,
    ExpectedGot,
    TypeError,
    InvalidComparison,
    Unimplemented,
    IntegerLiteralOutOfRange,
    InternalError,
    // run time (registered as error points)
    IntegerOverflow,
    DivideByZero,
    CellStateOutOfRange,
    NegativeExponent,
    BitshiftOutOfRange,
};

struct LangError { ErrorKind kind; std::string code; std::string message; std::string hint; Span span; };

struct BuildResult { bool success=true; std::vector<LangError> errors; };

// Stable diagnostic code for a kind (E2xxx build time, E3xxx run time).
const char* error_code(ErrorKind kind);
bool is_runtime_error(ErrorKind kind);

LangError make_error(ErrorKind kind, const Span& span, std::string message, std::string hint="");

// Message builders for the kinds that carry structured data.
LangError use_of_uninitialized_variable(const Span& span, const std::string& name);
LangError expected(const Span& span, const std::string& what);
LangError expected_got(const Span& span, const std::string& expected, const std::string& got);
LangError type_error(const Span& span, const Type& expected, const Type& got);
LangError unimplemented(const Span& span, const std::string& what);
LangError internal_error(const Span& span, const std::string& what);

// Thin wrapper so every component reports failures the same way.
struct ErrorReporter {
    BuildResult* result=nullptr;
    // Always returns false so callers can `return rep.fail(...)`.
    bool fail(LangError e){ if(result){ result->success=false; result->errors.push_back(std::move(e)); } return false; }
};

inline bool fail(BuildResult& r, LangError e){ return ErrorReporter{&r}.fail(std::move(e)); }

} // namespace ndca
