#include <gtest/gtest.h>

#include "Fixtures.hpp"

using namespace quasar;

TEST(Types, MuxedAccount) {
  // SEP-23 vectors
  const std::string lAccount = "GA7QYNF7SOWQ3GLR2BGMZEHXAVIRZA4KVWLTJJFC7MGXUA74P7UJVSGZ";
  const std::string lMuxedZero = "MA7QYNF7SOWQ3GLR2BGMZEHXAVIRZA4KVWLTJJFC7MGXUA74P7UJUAAAAAAAAAAAACJUQ";
  const std::string lMuxedHigh = "MA7QYNF7SOWQ3GLR2BGMZEHXAVIRZA4KVWLTJJFC7MGXUA74P7UJVAAAAAAAAAAAAAJLK";

  auto lZero = MuxedAccount::fromStrKey(lMuxedZero);
  EXPECT_EQ(PublicKey::fromStrKey(lAccount), lZero.accountId());
  ASSERT_TRUE(lZero.muxedId().has_value());
  EXPECT_EQ(0u, *lZero.muxedId());
  EXPECT_EQ(lMuxedZero, lZero.toStrKey());

  auto lHigh = MuxedAccount::fromStrKey(lMuxedHigh);
  EXPECT_EQ(9223372036854775808u, *lHigh.muxedId());
  EXPECT_EQ(lMuxedHigh, lHigh.toStrKey());

  // on the wire the id comes before the key
  EXPECT_EQ(fromHex("00000100"
                    "8000000000000000"
                    "3f0c34bf93ad0d9971d04ccc90f705511c838aad9734a4a2fb0d7a03fc7fe89a"),
            encodeXdr(lHigh));

  auto lPlain = MuxedAccount::fromStrKey(lAccount);
  EXPECT_FALSE(lPlain.muxedId().has_value());
  EXPECT_EQ(lAccount, lPlain.toStrKey());
  EXPECT_EQ(fromHex("00000000"
                    "3f0c34bf93ad0d9971d04ccc90f705511c838aad9734a4a2fb0d7a03fc7fe89a"),
            encodeXdr(lPlain));

  ErrorCode lError;
  EXPECT_FALSE(MuxedAccount::fromStrKey("SCOWDMM5576VUYF2QRFPJEXMFTCEISOFNF5TE2IZOA52YAY4VZ7WBQNO", lError));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyVersion), lError);
}

TEST(Types, SignerKeys) {
  const auto lHash = sha256(view(std::string_view("quasar")));
  const std::string lTexts[] = {
      "GDLVVGABQKYQVN6VJP7NHSLEA45A5YLS6PNKMIZFV4BBU2HXA5IRVHUR",
      "TASKQ2QYJ3G5PZT73MOT2XTWETXGJIZGJ4IQUCZTHEBZWZGD6P4GNWU7",
      "XASKQ2QYJ3G5PZT73MOT2XTWETXGJIZGJ4IQUCZTHEBZWZGD6P4GMSRG",
      "PDLVVGABQKYQVN6VJP7NHSLEA45A5YLS6PNKMIZFV4BBU2HXA5IRUAAAAAKACAQDAQCQMBYIBEFAWDANBYHRAEISCMKIDMI",
  };
  const SignerKeyType lTypes[] = {SignerKeyType::eEd25519, SignerKeyType::ePreAuthTx, SignerKeyType::eHashX,
                                  SignerKeyType::eEd25519SignedPayload};

  for (size_t i = 0; i < 4; i++) {
    auto lKey = SignerKey::fromStrKey(lTexts[i]);
    EXPECT_EQ((i32)lTypes[i], lKey.discriminant());
    EXPECT_EQ(lTexts[i], lKey.toStrKey());

    SignerKey lDecoded;
    ASSERT_FALSE(decodeXdr(view(encodeXdr(lKey)), lDecoded));
    EXPECT_EQ(lKey, lDecoded);
  }

  EXPECT_EQ(SignerKey::preAuthTx(lHash), SignerKey::fromStrKey(lTexts[1]));
  EXPECT_EQ(SignerKey::hashX(lHash), SignerKey::fromStrKey(lTexts[2]));
  EXPECT_EQ(SignerKey(PublicKey(u256FromHex(sRfcPublicHex))), SignerKey::fromStrKey(lTexts[0]));

  const auto lSignedKey = SignerKey::fromStrKey(lTexts[3]);
  const auto &lSigned = lSignedKey.as<SignerKeySignedPayload>().value;
  EXPECT_EQ(u256FromHex(sRfcPublicHex), lSigned.ed25519);
  EXPECT_EQ(20u, lSigned.payload.size());
  EXPECT_EQ(20, lSigned.payload.value().back());

  ErrorCode lError;
  EXPECT_FALSE(SignerKey::fromStrKey("MA7QYNF7SOWQ3GLR2BGMZEHXAVIRZA4KVWLTJJFC7MGXUA74P7UJUAAAAAAAAAAAACJUQ", lError));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyVersion), lError);
}

TEST(Types, Assets) {
  const PublicKey lIssuer(u256FromHex(sRfcPublicHex));

  auto lNative = Asset::native();
  EXPECT_TRUE(lNative.isNative());
  EXPECT_EQ("", lNative.code());
  EXPECT_FALSE(lNative.issuer().has_value());
  EXPECT_EQ(fromHex("00000000"), encodeXdr(lNative));

  auto lUsd = Asset::credit("USD", lIssuer);
  EXPECT_TRUE(lUsd.is<AssetAlphaNum4>());
  EXPECT_EQ("USD", lUsd.code());
  EXPECT_EQ(lIssuer, *lUsd.issuer());
  EXPECT_EQ(fromHex(std::string("00000001"
                                "55534400"
                                "00000000") +
                    sRfcPublicHex),
            encodeXdr(lUsd));

  auto lLong = Asset::credit("ABCDE", lIssuer);
  EXPECT_TRUE(lLong.is<AssetAlphaNum12>());
  EXPECT_EQ("ABCDE", lLong.code());
  EXPECT_EQ("ABCDEFGHIJKL", Asset::credit("ABCDEFGHIJKL", lIssuer).code());

  const char *lInvalid[] = {"", "ABCDEFGHIJKLM", "US-D", "US D", "\xC3\xA9"};
  for (auto lCode : lInvalid)
    EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidAssetCode), thrownCode([&] { Asset::credit(lCode, lIssuer); }))
        << lCode;

  EXPECT_TRUE(AssetCode::fromString("EUR").is<AssetCodeAlphaNum4>());
  EXPECT_TRUE(AssetCode::fromString("EURO2").is<AssetCodeAlphaNum12>());
  EXPECT_EQ(AssetType::eCreditAlphanum4, assetTypeForCode("ABCD"));
}

TEST(Types, Memos) {
  EXPECT_EQ(fromHex("00000000"), encodeXdr(Memo::none()));
  EXPECT_EQ(fromHex("00000002"
                    "000000000000002a"),
            encodeXdr(Memo::id(42)));

  const auto lHash = sha256(view(std::string_view("quasar")));
  auto lEncoded = encodeXdr(Memo::returnHash(lHash));
  EXPECT_EQ(4u + 32, lEncoded.size());
  Memo lDecoded;
  ASSERT_FALSE(decodeXdr(view(lEncoded), lDecoded));
  ASSERT_TRUE(lDecoded.is<MemoReturn>());
  EXPECT_EQ(lHash, lDecoded.as<MemoReturn>().value);
  EXPECT_NE(Memo::hash(lHash), lDecoded);
}

TEST(Types, ClaimableBalanceId) {
  const std::string lHex = "0000000024a86a184ecdd7e67fdb1d3d5e7624ee64a3264f110a0b3339039b64c3f3f866";
  auto lId = ClaimableBalanceId::fromHex(lHex);
  EXPECT_EQ(sha256(view(std::string_view("quasar"))), lId.as<ClaimableBalanceIdV0>().value);
  EXPECT_EQ(lHex, lId.toHex());
  EXPECT_EQ(lId, ClaimableBalanceId::fromBinary(view(fromHex(lHex))));
  EXPECT_EQ(lId, ClaimableBalanceId(sha256(view(std::string_view("quasar")))));

  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidBalanceId),
            thrownCode([&] { ClaimableBalanceId::fromHex("00000001" + lHex.substr(8)); }));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidBalanceId),
            thrownCode([&] { ClaimableBalanceId::fromHex(lHex.substr(2)); }));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidBalanceId),
            thrownCode([&] { ClaimableBalanceId::fromBinary(view(fromHex(lHex.substr(0, 70)))); }));
}

TEST(Types, SetOptionsWeights) {
  SetOptionsOp lOptions;
  lOptions.masterWeight = 255;
  lOptions.lowThreshold = 0;
  lOptions.highThreshold = 255;
  lOptions.signer = Signer{SignerKey::hashX(u256()), 255};
  EXPECT_FALSE(thrownCode([&] { Operation::setOptions(lOptions); }));

  const ErrorCode lInvalid(QuasarErrorCode::eInvalidSignerWeight);
  auto lMaster = lOptions;
  lMaster.masterWeight = 1000;
  EXPECT_EQ(lInvalid, thrownCode([&] { Operation::setOptions(lMaster); }));
  auto lLow = lOptions;
  lLow.lowThreshold = 256;
  EXPECT_EQ(lInvalid, thrownCode([&] { Operation::setOptions(lLow); }));
  auto lMedium = lOptions;
  lMedium.medThreshold = 300;
  EXPECT_EQ(lInvalid, thrownCode([&] { Operation::setOptions(lMedium); }));
  auto lHigh = lOptions;
  lHigh.highThreshold = 0x10000;
  EXPECT_EQ(lInvalid, thrownCode([&] { Operation::setOptions(lHigh); }));
  auto lSigner = lOptions;
  lSigner.signer->weight = 256;
  EXPECT_EQ(lInvalid, thrownCode([&] { Operation::setOptions(lSigner); }));
}

TEST(Types, Operations) {
  const PublicKey lAccount(u256FromHex(sRfcPublicHex));
  const auto lAsset = Asset::credit("USD", lAccount);

  SetOptionsOp lOptions;
  lOptions.homeDomain = String32(std::string("example.com"));
  lOptions.signer = Signer{SignerKey::hashX(sha256(view(std::string_view("quasar")))), 1};
  lOptions.masterWeight = 2;

  ClaimantV0 lClaimant{lAccount, ClaimPredicate::either(ClaimPredicate::beforeAbsoluteTime(1700000000),
                                                        ClaimPredicate::negate(ClaimPredicate::unconditional()))};
  CreateClaimableBalanceOp lCreateBalance{lAsset, 5, {Claimant(XdrArm<ClaimantType::eV0, ClaimantV0>(lClaimant))}};

  RevokeSponsorshipOp lRevoke(
      XdrArm<RevokeSponsorshipType::eSigner, RevokeSponsorshipSigner>(RevokeSponsorshipSigner{lAccount, lAccount}));

  std::vector<Operation> lOperations = {
      Operation::createAccount(lAccount, 100000000),
      Operation::payment(MuxedAccount(lAccount, 7), lAsset, 1),
      Operation::changeTrust(lAsset, 0),
      Operation::accountMerge(lAccount),
      Operation::manageData("config", std::vector<u8>{1, 2, 3}),
      Operation::manageData("config", std::nullopt),
      Operation::bumpSequence(1234567890123),
      Operation::setOptions(lOptions),
      Operation::beginSponsoringFutureReserves(lAccount),
      Operation::endSponsoringFutureReserves(),
      Operation::claimClaimableBalance(ClaimableBalanceId(sha256(view(std::string_view("quasar"))))),
  };
  lOperations.push_back(Operation{std::nullopt, CreateClaimableBalance(lCreateBalance)});
  lOperations.push_back(Operation{std::nullopt, RevokeSponsorship(lRevoke)});
  lOperations.push_back(Operation{std::nullopt, Inflation()});
  lOperations.push_back(
      Operation{std::nullopt, ManageSellOffer(ManageSellOfferOp{Asset::native(), lAsset, 10, Price{5, 4}, 0})});
  lOperations.push_back(Operation{
      std::nullopt,
      PathPaymentStrictSend(PathPaymentStrictSendOp{lAsset, 10, lAccount, Asset::native(), 9, {lAsset, lAsset}})});
  lOperations.push_back(Operation{std::nullopt, AllowTrust(AllowTrustOp{lAccount, AssetCode::fromString("USD"), 1})});
  lOperations.push_back(Operation{std::nullopt, Clawback(ClawbackOp{lAsset, lAccount, 3})});
  lOperations.push_back(Operation{std::nullopt, SetTrustLineFlags(SetTrustLineFlagsOp{lAccount, lAsset, 1, 2})});
  lOperations.back().withSource(MuxedAccount(lAccount, 1));

  Transaction lTx(lAccount, 100 * (u32)lOperations.size(), 1, lOperations, Memo::id(3), TimeBounds{0, 0});
  Transaction lDecoded;
  ASSERT_FALSE(decodeXdr(view(encodeXdr(lTx)), lDecoded));
  EXPECT_EQ(lTx, lDecoded);
  ASSERT_EQ(lOperations.size(), lDecoded.operations().size());
  for (size_t i = 0; i < lOperations.size(); i++)
    EXPECT_EQ(lOperations[i].type(), lDecoded.operations()[i].type()) << operationName(lOperations[i].type());

  EXPECT_EQ(OperationType::eSetTrustLineFlags, lDecoded.operations().back().type());
  EXPECT_EQ(1u, *lDecoded.operations().back().sourceAccount->muxedId());
  EXPECT_STREQ("set_trust_line_flags", operationName(OperationType::eSetTrustLineFlags));

  EXPECT_EQ(ErrorCode(QuasarErrorCode::eExceedsMaximumLength),
            thrownCode([] { Operation::manageData(std::string(65, 'k'), std::nullopt); }));
}
