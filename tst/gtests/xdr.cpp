#include <gtest/gtest.h>

#include "Fixtures.hpp"

using namespace quasar;

static ClaimPredicate nested(size_t pDepth) {
  auto lResult = ClaimPredicate::unconditional();
  for (size_t i = 1; i < pDepth; i++)
    lResult = ClaimPredicate::negate(std::move(lResult));
  return lResult;
}

TEST(Xdr, Primitives) {
  std::vector<u8> lOut;
  XdrWriter lWriter(lOut);
  lWriter.put((u32)0x01020304, (i32)-2, (u64)0x0102030405060708, (i64)-1, true);
  EXPECT_EQ(fromHex("01020304"
                    "fffffffe"
                    "0102030405060708"
                    "ffffffffffffffff"
                    "00000001"),
            lOut);

  XdrReader lReader(view(lOut));
  u32 lU32 = 0;
  i32 lI32 = 0;
  u64 lU64 = 0;
  i64 lI64 = 0;
  bool lBool = false;
  ASSERT_FALSE(lReader.get(lU32, lI32, lU64, lI64, lBool));
  EXPECT_EQ(0x01020304u, lU32);
  EXPECT_EQ(-2, lI32);
  EXPECT_EQ(0x0102030405060708u, lU64);
  EXPECT_EQ(-1, lI64);
  EXPECT_TRUE(lBool);
  EXPECT_EQ(0u, lReader.remaining());
}

TEST(Xdr, VariableOpaquePadding) {
  XdrBytes<8> lValue(std::vector<u8>{1, 2, 3});
  auto lEncoded = encodeXdr(lValue);
  EXPECT_EQ(fromHex("00000003"
                    "01020300"),
            lEncoded);

  XdrBytes<8> lDecoded;
  ASSERT_FALSE(decodeXdr(view(lEncoded), lDecoded));
  EXPECT_EQ(lValue, lDecoded);

  lEncoded.back() = 1;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidPadding), decodeXdr(view(lEncoded), lDecoded));
}

TEST(Xdr, EmptyOpaque) {
  XdrBytes<64> lEmpty;
  auto lEncoded = encodeXdr(lEmpty);
  EXPECT_EQ(fromHex("00000000"), lEncoded);

  XdrBytes<64> lDecoded(std::vector<u8>{1, 2, 3});
  ASSERT_FALSE(decodeXdr(view(lEncoded), lDecoded));
  EXPECT_EQ(0u, lDecoded.size());

  // an empty value inside a full envelope, as set by a manage data operation
  TransactionEnvelope lEnvelope(Transaction(MuxedAccount(PublicKey()), 100, 1,
                                            {Operation::manageData("empty", std::vector<u8>())}));
  TransactionEnvelope lRestored;
  ASSERT_FALSE(fromBase64Xdr(lEnvelope.toBase64(), lRestored));
  EXPECT_EQ(lEnvelope, lRestored);
  const auto &lOp = lRestored.as<EnvelopeV1>().value.tx.operations()[0].body.as<ManageData>().value;
  ASSERT_TRUE(lOp.dataValue);
  EXPECT_EQ(0u, lOp.dataValue->size());
}

TEST(Xdr, StringPadding) {
  auto lEncoded = encodeXdr(Memo::text("hello"));
  EXPECT_EQ(fromHex("00000001"
                    "00000005"
                    "68656c6c6f000000"),
            lEncoded);

  for (size_t i = lEncoded.size() - 3; i < lEncoded.size(); i++) {
    auto lTampered = lEncoded;
    lTampered[i] = 0x20;
    Memo lMemo;
    EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidPadding), decodeXdr(view(lTampered), lMemo));
  }
}

TEST(Xdr, LengthPrefixTampering) {
  auto lEncoded = encodeXdr(XdrBytes<64>(std::vector<u8>(10, 0xAB)));
  XdrBytes<64> lBounded;

  // 16 announced, 12 left
  lEncoded[3] = 16;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eLengthExceedsInput), decodeXdr(view(lEncoded), lBounded));

  lEncoded[3] = 65;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eLengthExceedsMax), decodeXdr(view(lEncoded), lBounded));

  lEncoded[0] = 0xFF;
  XdrBytes<> lUnbounded;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eLengthExceedsInput), decodeXdr(view(lEncoded), lUnbounded));

  XdrArray<u32> lArray;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eLengthExceedsInput), decodeXdr(view(fromHex("7fffffff00000001")), lArray));
  XdrArray<u32, 2> lSmallArray;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eLengthExceedsMax),
            decodeXdr(view(fromHex("00000003000000010000000200000003")), lSmallArray));
}

TEST(Xdr, Truncation) {
  const auto lEncoded = fromHex(sGoldenPaymentHex);
  Transaction lTx;
  ASSERT_FALSE(decodeXdr(view(lEncoded), lTx));
  for (size_t i = 0; i < lEncoded.size(); i++) {
    auto lError = decodeXdr({lEncoded.data(), i}, lTx);
    EXPECT_TRUE(lError) << "prefix of " << i << " bytes";
    EXPECT_EQ(&QuasarErrorCategory::instance(), &lError.category());
  }
}

TEST(Xdr, InvalidDiscriminant) {
  Memo lMemo;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidDiscriminant), decodeXdr(view(fromHex("00000007")), lMemo));
  Asset lAsset;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidDiscriminant), decodeXdr(view(fromHex("ffffffff")), lAsset));
  OperationBody lBody;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidDiscriminant), decodeXdr(view(fromHex("00000016")), lBody));
}

TEST(Xdr, OptionalFlag) {
  std::optional<u32> lValue;
  ASSERT_FALSE(decodeXdr(view(fromHex("000000010000002a")), lValue));
  ASSERT_TRUE(lValue.has_value());
  EXPECT_EQ(42u, *lValue);

  ASSERT_FALSE(decodeXdr(view(fromHex("00000000")), lValue));
  EXPECT_FALSE(lValue.has_value());

  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidFlag), decodeXdr(view(fromHex("000000020000002a")), lValue));
  bool lBool = false;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidFlag), decodeXdr(view(fromHex("00000002")), lBool));
}

TEST(Xdr, TrailingBytes) {
  const auto lBytes = fromHex("0000000100000002");
  u32 lValue = 0;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eTrailingBytes), decodeXdr(view(lBytes), lValue));

  size_t lConsumed = 0;
  ASSERT_FALSE(decodeXdrPrefix(view(lBytes), lValue, lConsumed));
  EXPECT_EQ(1u, lValue);
  EXPECT_EQ(4u, lConsumed);
}

TEST(Xdr, ConstructionBounds) {
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eExceedsMaximumLength), thrownCode([] { XdrArray<u32, 2>({1, 2, 3}); }));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eExceedsMaximumLength),
            thrownCode([] { XdrBytes<4>(std::vector<u8>(5, 0)); }));

  XdrArray<u32, 2> lArray;
  lArray.push_back(1);
  lArray.push_back(2);
  EXPECT_TRUE(lArray.full());
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eExceedsMaximumLength), thrownCode([&lArray] { lArray.push_back(3); }));
  EXPECT_EQ(2u, lArray.size());

  EXPECT_NO_THROW(Memo::text(std::string(28, 'a')));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eExceedsMaximumLength),
            thrownCode([] { Memo::text(std::string(29, 'a')); }));
}

TEST(Xdr, RecursionDepth) {
  const auto lDeepest = nested(QUASAR_XDR_MAX_DEPTH);
  ClaimPredicate lDecoded;
  ASSERT_FALSE(decodeXdr(view(encodeXdr(lDeepest)), lDecoded));
  EXPECT_EQ(lDeepest, lDecoded);

  const auto lBalanced = ClaimPredicate::both(nested(QUASAR_XDR_MAX_DEPTH - 1), nested(QUASAR_XDR_MAX_DEPTH - 1));
  ASSERT_FALSE(decodeXdr(view(encodeXdr(lBalanced)), lDecoded));
  EXPECT_EQ(lBalanced, lDecoded);

  // encoding has no limit, only the decoder refuses
  const auto lTooDeep = nested(QUASAR_XDR_MAX_DEPTH + 1);
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eDepthExceeded), decodeXdr(view(encodeXdr(lTooDeep)), lDecoded));

  // the reader is still usable for siblings after a failed subtree
  const auto lSiblings = ClaimPredicate::either(nested(3), ClaimPredicate::beforeRelativeTime(3600));
  ASSERT_FALSE(decodeXdr(view(encodeXdr(lSiblings)), lDecoded));
  EXPECT_EQ(lSiblings, lDecoded);
}

TEST(Xdr, GoldenTransaction) {
  const auto lEncoded = fromHex(sGoldenPaymentHex);
  Transaction lTx;
  ASSERT_FALSE(decodeXdr(view(lEncoded), lTx));

  EXPECT_EQ(u256FromHex(sRfcPublicHex), lTx.sourceAccount.accountId().bytes());
  EXPECT_EQ(100u, lTx.fee);
  EXPECT_EQ(1234567890123, lTx.seqNum);
  ASSERT_TRUE(lTx.timeBounds.has_value());
  EXPECT_EQ(1700000000u, lTx.timeBounds->maxTime);
  ASSERT_TRUE(lTx.memo.is<MemoText>());
  EXPECT_EQ("hello", lTx.memo.as<MemoText>().value.value());
  ASSERT_EQ(1u, lTx.operations().size());
  EXPECT_EQ(OperationType::ePayment, lTx.operations()[0].type());
  EXPECT_EQ(10000000, lTx.operations()[0].body.as<Payment>().value.amount);

  EXPECT_EQ(lEncoded, encodeXdr(lTx));
  EXPECT_EQ(lEncoded, encodeXdr(goldenPayment()));
  EXPECT_EQ(goldenPayment(), lTx);
}

TEST(Xdr, Base64) {
  const auto lTx = goldenPayment();
  Transaction lDecoded;
  ASSERT_FALSE(fromBase64Xdr(toBase64Xdr(lTx), lDecoded));
  EXPECT_EQ(lTx, lDecoded);

  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidBase64), fromBase64Xdr("not base64!", lDecoded));
}
