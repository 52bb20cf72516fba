// Closed set of built-in capabilities an expression node can resolve to.
#pragma once
#include <variant>

#include "ndca/functions/literals.hpp"
#include "ndca/functions/misc.hpp"
#include "ndca/functions/math.hpp"
#include "ndca/functions/convert.hpp"
#include "ndca/functions/cmp.hpp"

namespace ndca {

using Function = std::variant<
    functions::IntLiteral,
    functions::GetVar,
    functions::NegInt,
    functions::BinaryIntOp,
    functions::IntToCellState,
    functions::Cmp>;

} // namespace ndca
