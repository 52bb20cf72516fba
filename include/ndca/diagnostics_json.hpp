// diagnostics_json.hpp - JSON serialization for build failures and error points
#pragma once
#include "ndca/errors.hpp"
#include <cstddef>
#include <string>

namespace ndca {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize one diagnostic to a compact JSON object.
std::string error_to_json(const LangError& e);

// Serialize build diagnostics to a compact JSON string.
std::string build_result_to_json(const BuildResult& r);

// Serialize a resolved runtime error point; `index` is the decoded error index.
std::string error_point_to_json(size_t index, const LangError& e);

// If NDCA_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const BuildResult& r);

} // namespace ndca
