#pragma once
#include <optional>
#include <string>

// Test-only environment helpers. NDCA_* configuration is read from the process
// environment, so tests flip variables around a block and restore them after.

namespace ndca::test {

// Sets NAME to VALUE; an empty value unsets it.
int set_env(const char* name, const char* value);

// Restores the previous value (or absence) of a variable on scope exit.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value);
    ~ScopedEnv();
    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;
private:
    std::string name_;
    std::optional<std::string> previous_;
};

} // namespace ndca::test
