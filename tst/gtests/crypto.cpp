#include <gtest/gtest.h>

#include "Fixtures.hpp"

using namespace quasar;

static const char *sEmptySignatureHex =
    "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e065224901555fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe2465"
    "5141438e7a100b";
static const char *sTestPayloadSignatureHex =
    "ce38351f951de5046922d52a9e09e59cffcf8f9beb0441d0edc78d4c21e708e455e91a693b8f953dac30a088b1e7e6973bdab8d4c087d826"
    "451fa79d66f04f08";

TEST(Crypto, Rfc8032) {
  auto lKey = SecretKey::fromSeed(u256FromHex(sRfcSeedHex).view());
  EXPECT_EQ(u256FromHex(sRfcPublicHex), lKey.publicKey().bytes());
  EXPECT_EQ(u256FromHex(sRfcSeedHex), lKey.seed());

  auto lSignature = lKey.sign({nullptr, 0});
  EXPECT_EQ(fromHex(sEmptySignatureHex), std::vector<u8>(lSignature.begin(), lSignature.end()));
  EXPECT_TRUE(lKey.publicKey().verify({nullptr, 0}, lSignature));
}

TEST(Crypto, StrKeys) {
  auto lKey = SecretKey::fromSeed(u256FromHex(sRfcSeedHex).view());
  EXPECT_EQ("SCOWDMM5576VUYF2QRFPJEXMFTCEISOFNF5TE2IZOA52YAY4VZ7WBQNO", lKey.toStrKey());
  EXPECT_EQ("GDLVVGABQKYQVN6VJP7NHSLEA45A5YLS6PNKMIZFV4BBU2HXA5IRVHUR", lKey.publicKey().toStrKey());

  auto lParsed = SecretKey::fromStrKey("SCOWDMM5576VUYF2QRFPJEXMFTCEISOFNF5TE2IZOA52YAY4VZ7WBQNO");
  EXPECT_EQ(lKey.publicKey(), lParsed.publicKey());
  EXPECT_EQ(lKey.publicKey(), PublicKey::fromStrKey("GDLVVGABQKYQVN6VJP7NHSLEA45A5YLS6PNKMIZFV4BBU2HXA5IRVHUR"));

  ErrorCode lError;
  EXPECT_FALSE(PublicKey::fromStrKey("SCOWDMM5576VUYF2QRFPJEXMFTCEISOFNF5TE2IZOA52YAY4VZ7WBQNO", lError));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyVersion), lError);
  EXPECT_FALSE(SecretKey::fromStrKey("GDLVVGABQKYQVN6VJP7NHSLEA45A5YLS6PNKMIZFV4BBU2HXA5IRVHUR", lError));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyVersion), lError);
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyVersion),
            thrownCode([] { SecretKey::fromStrKey("GDLVVGABQKYQVN6VJP7NHSLEA45A5YLS6PNKMIZFV4BBU2HXA5IRVHUR"); }));
}

TEST(Crypto, SignatureDeterminism) {
  auto lKey = SecretKey::fromSeed(u256FromHex(sRfcSeedHex).view());
  std::string lMessage = "test-payload";

  auto lFirst = lKey.sign(view(lMessage));
  auto lSecond = lKey.sign(view(lMessage));
  EXPECT_EQ(lFirst, lSecond);
  EXPECT_EQ(fromHex(sTestPayloadSignatureHex), std::vector<u8>(lFirst.begin(), lFirst.end()));
  EXPECT_TRUE(lKey.publicKey().verify(view(lMessage), lFirst));

  for (size_t i = 0; i < lMessage.size(); i++) {
    auto lTampered = lMessage;
    lTampered[i] ^= 0x01;
    EXPECT_FALSE(lKey.publicKey().verify(view(lTampered), lFirst)) << "message byte " << i;
  }
  for (size_t i = 0; i < lFirst.size(); i++) {
    auto lTampered = lFirst;
    lTampered[i] ^= 0x01;
    EXPECT_FALSE(lKey.publicKey().verify(view(lMessage), lTampered)) << "signature byte " << i;
  }
}

TEST(Crypto, GeneratedKeys) {
  auto lFirst = SecretKey::generate();
  auto lSecond = SecretKey::generate();
  EXPECT_NE(lFirst.publicKey(), lSecond.publicKey());

  auto lMessage = quasar::rand<u256>();
  auto lSignature = lFirst.sign(lMessage.view());
  EXPECT_TRUE(lFirst.publicKey().verify(lMessage.view(), lSignature));
  EXPECT_FALSE(lSecond.publicKey().verify(lMessage.view(), lSignature));

  auto lRestored = SecretKey::fromStrKey(lFirst.toStrKey());
  EXPECT_EQ(lFirst.publicKey(), lRestored.publicKey());
  EXPECT_EQ(lSignature, lRestored.sign(lMessage.view()));
}

TEST(Crypto, SeededKeys) {
  for (int i = 0; i < 16; i++) {
    auto lSeed = quasar::rand<u256>();
    auto lKey = SecretKey::fromSeed(lSeed.view());
    auto lAgain = SecretKey::fromSeed(lSeed.view());
    EXPECT_EQ(lKey.publicKey(), lAgain.publicKey());
    auto lSignature = lKey.sign(lSeed.view());
    EXPECT_TRUE(lAgain.publicKey().verify(lSeed.view(), lSignature));
  }
}

TEST(Crypto, Capabilities) {
  Keypair lVerifyOnly(PublicKey(u256FromHex(sRfcPublicHex)));
  Keypair lSigning(SecretKey::fromSeed(u256FromHex(sRfcSeedHex).view()));

  EXPECT_FALSE(canSign(lVerifyOnly));
  EXPECT_TRUE(canSign(lSigning));
  EXPECT_EQ(publicKeyOf(lVerifyOnly), publicKeyOf(lSigning));

  std::string lMessage = "test-payload";
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eCannotSign), thrownCode([&] { sign(lVerifyOnly, view(lMessage)); }));
  auto lSignature = sign(lSigning, view(lMessage));
  EXPECT_TRUE(publicKeyOf(lVerifyOnly).verify(view(lMessage), lSignature));
}

TEST(Crypto, MalformedSizes) {
  const auto lPublic = u256FromHex(sRfcPublicHex);
  const auto lSignature = fromHex(sEmptySignatureHex);

  EXPECT_TRUE(verifySignature(lPublic.view(), {nullptr, 0}, view(lSignature)));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidPublicKeyLength),
            thrownCode([&] { verifySignature({lPublic.data(), 31}, {nullptr, 0}, view(lSignature)); }));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidSignatureLength),
            thrownCode([&] { verifySignature(lPublic.view(), {nullptr, 0}, {lSignature.data(), 63}); }));

  ErrorCode lError;
  EXPECT_FALSE(verifySignature(lPublic.view(), {nullptr, 0}, {lSignature.data(), 63}, lError));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidSignatureLength), lError);

  // a wrong signature is an outcome, not an error
  auto lWrong = lSignature;
  lWrong[0] ^= 0xFF;
  EXPECT_FALSE(verifySignature(lPublic.view(), {nullptr, 0}, view(lWrong), lError));
  EXPECT_FALSE(lError);

  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidPublicKeyLength),
            thrownCode([&] { PublicKey::fromBytes({lPublic.data(), 33}); }));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidSeedLength),
            thrownCode([&] { SecretKey::fromSeed({lPublic.data(), 16}); }));
}

TEST(Crypto, HintAndXdr) {
  PublicKey lKey(u256FromHex(sRfcPublicHex));
  const auto lHint = lKey.hint();
  EXPECT_EQ(fromHex("f707511a"), std::vector<u8>(lHint.begin(), lHint.end()));

  auto lEncoded = encodeXdr(lKey);
  EXPECT_EQ(fromHex(std::string("00000000") + sRfcPublicHex), lEncoded);

  PublicKey lDecoded;
  ASSERT_FALSE(decodeXdr(view(lEncoded), lDecoded));
  EXPECT_EQ(lKey, lDecoded);

  lEncoded[3] = 1;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidDiscriminant), decodeXdr(view(lEncoded), lDecoded));
}
