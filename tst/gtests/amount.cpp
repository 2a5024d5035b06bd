#include <limits>

#include <gtest/gtest.h>

#include "Fixtures.hpp"

#include "Amount.hpp"

using namespace quasar;

TEST(Amount, Parse) {
  EXPECT_EQ(123456789, parseAmount("12.3456789"));
  EXPECT_EQ(10000000, parseAmount("1"));
  EXPECT_EQ(5000000, parseAmount(".5"));
  EXPECT_EQ(1, parseAmount("0.0000001"));
  EXPECT_EQ(0, parseAmount("0"));
  EXPECT_EQ(std::numeric_limits<i64>::max(), parseAmount("922337203685.4775807"));
}

TEST(Amount, Rejections) {
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eAmountOverflow), thrownCode([] { parseAmount("922337203685.4775808"); }));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eAmountOverflow), thrownCode([] { parseAmount("99999999999999999999"); }));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eAmountNegative), thrownCode([] { parseAmount("-1"); }));

  for (auto lText : {"1.23456789", "", ".", "abc", "1.2.3", "1e5", " 1"}) {
    ErrorCode lError;
    EXPECT_FALSE(parseAmount(lText, lError)) << lText;
    EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidAmount), lError) << lText;
  }
}

TEST(Amount, Format) {
  EXPECT_EQ("12.3456789", formatAmount(123456789));
  EXPECT_EQ("0.0000000", formatAmount(0));
  EXPECT_EQ("0.0000001", formatAmount(1));
  EXPECT_EQ("-1.5000000", formatAmount(-15000000));
  EXPECT_EQ("922337203685.4775807", formatAmount(std::numeric_limits<i64>::max()));
  EXPECT_EQ("-922337203685.4775808", formatAmount(std::numeric_limits<i64>::min()));

  for (i64 lStroops : {(i64)1, (i64)10000000, (i64)123456789, std::numeric_limits<i64>::max()})
    EXPECT_EQ(lStroops, parseAmount(formatAmount(lStroops)));
}

TEST(Amount, Price) {
  EXPECT_EQ((Price{5, 4}), Price::fromString("1.25"));
  EXPECT_EQ((Price{1, 10}), Price::fromString("0.1"));
  EXPECT_EQ((Price{1, 2}), Price::fromString("0.5"));
  EXPECT_EQ((Price{2, 1}), Price::fromString("2"));
  EXPECT_EQ((Price{314159, 100000}), Price::fromString("3.14159"));
  // the exact fraction doesn't fit, the closest convergent that does is kept
  EXPECT_EQ((Price{2000000000, 1}), Price::fromString("2000000000.5"));

  EXPECT_EQ(ErrorCode(QuasarErrorCode::eNotApproximableAsFraction),
            thrownCode([] { Price::fromString("2147483648"); }));
  for (auto lText : {"-1", "1.", "abc", "", "0.1234567891", "0", "0.000"})
    EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidPrice), thrownCode([lText] { Price::fromString(lText); })) << lText;

  EXPECT_EQ(fromHex("00000005"
                    "00000004"),
            encodeXdr(Price::fromString("1.25")));
}
