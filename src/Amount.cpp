#include <limits>

#include "Amount.hpp"
#include "Types.hpp"

using namespace quasar;

static bool allDigits(std::string_view pText) {
  for (char lChar : pText) {
    if (lChar < '0' || lChar > '9')
      return false;
  }
  return true;
}

// pValue * 10 + pDigit, false when the result leaves [0, pMax]
static bool pushDigit(u64 &pValue, u64 pDigit, u64 pMax) {
  if (pValue > (pMax - pDigit) / 10)
    return false;
  pValue = pValue * 10 + pDigit;
  return true;
}

i64 quasar::parseAmount(std::string_view pText) {
  ErrorCode lError;
  auto lResult = parseAmount(pText, lError);
  if (!lResult)
    throw quasar_error(lError, "cannot parse amount '" + std::string(pText) + "'");
  return *lResult;
}

std::optional<i64> quasar::parseAmount(std::string_view pText, ErrorCode &pError) {
  if (!pText.empty() && pText[0] == '-') {
    pError = QuasarErrorCode::eAmountNegative;
    return std::nullopt;
  }

  const auto lDot = pText.find('.');
  const auto lWhole = pText.substr(0, lDot);
  const auto lFraction = lDot == std::string_view::npos ? std::string_view() : pText.substr(lDot + 1);
  if ((lWhole.empty() && lFraction.empty()) || lFraction.size() > sAmountDecimals || !allDigits(lWhole) ||
      !allDigits(lFraction)) {
    pError = QuasarErrorCode::eInvalidAmount;
    return std::nullopt;
  }

  const u64 lMax = (u64)std::numeric_limits<i64>::max();
  u64 lStroops = 0;
  bool lFits = true;
  for (char lChar : lWhole)
    lFits = lFits && pushDigit(lStroops, (u64)(lChar - '0'), lMax);
  for (size_t i = 0; i < sAmountDecimals; i++)
    lFits = lFits && pushDigit(lStroops, i < lFraction.size() ? (u64)(lFraction[i] - '0') : 0, lMax);
  if (!lFits) {
    pError = QuasarErrorCode::eAmountOverflow;
    return std::nullopt;
  }

  pError.clear();
  return (i64)lStroops;
}

std::string quasar::formatAmount(i64 pStroops) {
  u64 lMagnitude = pStroops < 0 ? (u64)0 - (u64)pStroops : (u64)pStroops;
  std::string lFraction = std::to_string(lMagnitude % (u64)sStroopsPerUnit);
  lFraction.insert(0, sAmountDecimals - lFraction.size(), '0');
  return (pStroops < 0 ? "-" : "") + std::to_string(lMagnitude / (u64)sStroopsPerUnit) + "." + lFraction;
}

// Prices are given with at most this many decimals, so that value * 10^decimals fits 64 bits
static constexpr size_t sPriceDecimals = 9;

Price Price::fromString(std::string_view pText) {
  const auto lDot = pText.find('.');
  const auto lWhole = pText.substr(0, lDot);
  const auto lFraction = lDot == std::string_view::npos ? std::string_view() : pText.substr(lDot + 1);
  if (lWhole.empty() || lFraction.size() > sPriceDecimals || !allDigits(lWhole) || !allDigits(lFraction) ||
      (lDot != std::string_view::npos && lFraction.empty()))
    throw quasar_error(QuasarErrorCode::eInvalidPrice, "'" + std::string(pText) + "'");

  const u64 lLimit = (u64)std::numeric_limits<i32>::max();
  u64 lNumerator = 0;
  u64 lDenominator = 1;
  for (char lChar : lWhole) {
    if (!pushDigit(lNumerator, (u64)(lChar - '0'), lLimit))
      throw quasar_error(QuasarErrorCode::eNotApproximableAsFraction, "'" + std::string(pText) + "'");
  }
  for (char lChar : lFraction) {
    lNumerator = lNumerator * 10 + (u64)(lChar - '0');
    lDenominator *= 10;
  }
  if (lNumerator == 0)
    throw quasar_error(QuasarErrorCode::eInvalidPrice, "'" + std::string(pText) + "' is not a positive price");

  // convergents of the continued fraction of lNumerator / lDenominator, the last one within bounds wins
  u64 lH1 = 1, lH2 = 0, lK1 = 0, lK2 = 1;
  std::optional<Price> lBest;
  while (true) {
    u64 lA = lNumerator / lDenominator;
    u64 lH = lA * lH1 + lH2;
    u64 lK = lA * lK1 + lK2;
    if (lH > lLimit || lK > lLimit)
      break;
    lBest = Price{(i32)lH, (i32)lK};
    u64 lRest = lNumerator % lDenominator;
    if (lRest == 0)
      break;
    lNumerator = lDenominator;
    lDenominator = lRest;
    lH2 = lH1;
    lH1 = lH;
    lK2 = lK1;
    lK1 = lK;
  }

  if (!lBest)
    throw quasar_error(QuasarErrorCode::eNotApproximableAsFraction, "'" + std::string(pText) + "'");
  return *lBest;
}
