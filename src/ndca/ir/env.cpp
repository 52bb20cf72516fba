#include "ndca/ir/context.hpp"
#include <cstdlib>
#include <string>
#include <algorithm>
#include <cctype>

namespace ndca {

// Reads process env vars and constructs a CompileEnv.
CompileEnv detect_env(){
    CompileEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("NDCA_DEBUG_CODEGEN")) e.debugCodegen = (std::string(v) == "1");
    if (const char* v = get("NDCA_VERIFY_IR")) e.verifyIR = (std::string(v) == "1");
    if (const char* v = get("NDCA_DUMP_IR")) e.dumpIR = (std::string(v) == "1");

    // Optimization: presets unless a textual pipeline is given
    if (const char* v = get("NDCA_ENABLE_PASSES")) e.enablePasses = (std::string(v) == "1");
    if (const char* v = get("NDCA_OPT_LEVEL")) {
        std::string s = v; std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
        if (s=="0"||s=="o0") e.optLevel = 0;
        else if (s=="2"||s=="o2") e.optLevel = 2;
        else if (s=="3"||s=="o3") e.optLevel = 3;
        else e.optLevel = 1;
    }
    if (const char* v = get("NDCA_PASS_PIPELINE")) e.passPipeline = v;

    // Target triple (optional)
    if (const char* v = get("NDCA_TARGET_TRIPLE")) e.targetTriple = v;

    return e;
}

} // namespace ndca
