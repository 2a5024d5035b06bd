#pragma once

#include "gtest/gtest.h"

#include "Signing.hpp"

// RFC 8032 section 7.1, test 1
constexpr const char *sRfcSeedHex = "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60";
constexpr const char *sRfcPublicHex = "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a";

std::vector<quasar::u8> fromHex(std::string_view pHex);
quasar::u256 u256FromHex(std::string_view pHex);

/** Code carried by the quasar_error pFunction throws, empty if it doesn't throw */
template <typename TFunction> quasar::ErrorCode thrownCode(TFunction &&pFunction) {
  try {
    pFunction();
  } catch (const quasar::quasar_error &pError) {
    return pError.code();
  }
  return {};
}

/** Payment of 1 XLM to the all-zero account, its encoding is pinned in sGoldenPaymentHex */
quasar::Transaction goldenPayment();
extern const char *const sGoldenPaymentHex;

class QuasarSigningTest : public ::testing::Test {
protected:
  quasar::SecretKey rfcKey;
  std::vector<quasar::SecretKey> signers;
  quasar::Transaction payment;

  void SetUp() override;

  quasar::TransactionEnvelope unsignedEnvelope() const { return quasar::TransactionEnvelope(payment); }

public:
  QuasarSigningTest();
  ~QuasarSigningTest() override = default;
};
