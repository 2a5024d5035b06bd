#include "Fixtures.hpp"

const char *const sGoldenPaymentHex =
    "00000000d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a000000640000011f71fb04cb0000000100000000"
    "00000000000000006553f100000000010000000568656c6c6f000000000000010000000000000001000000000000000000000000000000"
    "00000000000000000000000000000000000000000000000000000000000098968000000000";

std::vector<quasar::u8> fromHex(std::string_view pHex) {
  std::vector<quasar::u8> lResult(pHex.size() / 2);
  if (!quasar::parseHex({lResult.data(), lResult.size()}, pHex))
    throw std::invalid_argument("bad hex in test vector");
  return lResult;
}

quasar::u256 u256FromHex(std::string_view pHex) {
  quasar::u256 lResult;
  if (!quasar::parseHex(lResult.view(), pHex))
    throw std::invalid_argument("bad hex in test vector");
  return lResult;
}

quasar::Transaction goldenPayment() {
  using namespace quasar;
  return TransactionBuilder(MuxedAccount(PublicKey(u256FromHex(sRfcPublicHex))), 1234567890123)
      .setTimeBounds(0, 1700000000)
      .setMemo(Memo::text("hello"))
      .addOperation(Operation::payment(MuxedAccount(PublicKey()), Asset::native(), 10000000))
      .build();
}

QuasarSigningTest::QuasarSigningTest() : rfcKey(quasar::SecretKey::fromSeed(u256FromHex(sRfcSeedHex).view())) {}

void QuasarSigningTest::SetUp() {
  constexpr size_t lSignersCount = 3;
  for (size_t i = 0; i < lSignersCount; i++)
    signers.emplace_back(quasar::SecretKey::generate());
  payment = goldenPayment();
}
