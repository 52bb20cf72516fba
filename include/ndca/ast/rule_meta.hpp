#pragma once
#include <memory>

namespace ndca {

// A cell state is one byte wide.
constexpr unsigned MAX_STATE_COUNT = 256;

// Metadata of the automaton rule a function belongs to. Written once when the
// rule is defined, then shared read-only by every function of that rule.
struct RuleMeta {
    unsigned ndim = 2;        // dimensionality of the grid
    unsigned radius = 1;      // neighborhood radius
    unsigned state_count = 2; // number of cell states (1..=256)
};

using RuleMetaPtr = std::shared_ptr<const RuleMeta>;

inline RuleMetaPtr make_rule_meta(unsigned ndim, unsigned radius, unsigned state_count){
    return std::make_shared<const RuleMeta>(RuleMeta{ndim, radius, state_count});
}

} // namespace ndca
