#pragma once

#include "types.hpp"
#include <string>

namespace specread {

/**
 * @brief Resolve the display unit for a header mode code.
 *
 * Known codes: "INTENSITY", "A"/"E" (extinction) and "%T"
 * (transmission). Matching is exact and case-sensitive. Any other code is
 * passed through as the unit symbol with empty quantity and separator, so
 * resolution never fails.
 *
 * @param mode_code Raw mode code from the file header
 * @return Unit label triple
 */
UnitLabel resolveUnit(const std::string& mode_code);

} // namespace specread
