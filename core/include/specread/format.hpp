#pragma once

#include <string>

namespace specread {

/**
 * @brief Shortest round-trip text of a number, always with a decimal part.
 *
 * 500 -> "500.0", 0.12 -> "0.12", 1e+16 -> "1e+16", NaN -> "nan".
 */
std::string formatNumber(double value);

} // namespace specread
