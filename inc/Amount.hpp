#pragma once

#include <optional>

#include "Error.hpp"
#include "utils.hpp"

namespace quasar {

/** Amounts travel as i64 stroops, a unit of any asset is 10^7 stroops */
constexpr i64 sStroopsPerUnit = 10000000;
constexpr int sAmountDecimals = 7;

/** Decimal string such as "12.3456789" to stroops, without going through floating point
 * @throw quasar_error eInvalidAmount, eAmountNegative or eAmountOverflow */
i64 parseAmount(std::string_view pText);
std::optional<i64> parseAmount(std::string_view pText, ErrorCode &pError);

/** Stroops to a decimal string with all 7 decimals, "1.5000000" for 15000000 */
std::string formatAmount(i64 pStroops);

} // namespace quasar
