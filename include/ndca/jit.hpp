// In-process execution host for compiled rule functions.
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <llvm/ExecutionEngine/Orc/LLJIT.h>

#include "ndca/errors.hpp"
#include "ndca/types.hpp"

namespace ndca {

class Compiler;
class UserFunction;

// Outcome of one call. On success `value` holds the decoded result; on a
// runtime trap `error_index` names the error point and `error` is its entry.
struct CallResult {
    bool ok = false;
    std::optional<ConstValue> value;
    size_t error_index = 0;
    std::optional<LangError> error;
};

class JitFunction {
public:
    using RawFn = uint64_t (*)();

    // Compiles `uf` into the compiler's module as `name`, links it with ORC
    // and resolves the entry point. nullptr on failure, with errors in `r`.
    static std::unique_ptr<JitFunction> create(Compiler&& c, const UserFunction& uf, const std::string& name, BuildResult& r);

    CallResult call() const;
    // Undecoded 64-bit return value.
    uint64_t call_raw() const { return fn_(); }

    const std::string& name() const { return name_; }
    const Type& return_type() const { return return_type_; }
    const std::vector<LangError>& error_points() const { return error_points_; }

private:
    JitFunction() = default;

    std::unique_ptr<llvm::orc::LLJIT> jit_;
    RawFn fn_ = nullptr;
    std::string name_;
    Type return_type_;
    // Copied so the host keeps working after the UserFunction is gone.
    std::vector<LangError> error_points_;
};

} // namespace ndca
