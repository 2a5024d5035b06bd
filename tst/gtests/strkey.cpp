#include <gtest/gtest.h>

#include "Fixtures.hpp"

using namespace quasar;

static ErrorCode decodeError(std::string_view pText) {
  VersionByte lVersion;
  std::vector<u8> lRaw;
  return decodeStrKey(pText, lVersion, lRaw);
}

TEST(StrKey, Crc16CheckValue) {
  EXPECT_EQ(0x31C3, crc16Xmodem(view(std::string_view("123456789"))));
  EXPECT_EQ(0, crc16Xmodem(view(std::string_view(""))));
}

TEST(StrKey, Base32) {
  EXPECT_EQ("MZXW6YTBOI", base32Encode(view(std::string_view("foobar"))));
  EXPECT_EQ("MY", base32Encode(view(std::string_view("f"))));

  std::vector<u8> lDecoded;
  ASSERT_FALSE(base32Decode("MZXW6YTBOI", lDecoded));
  EXPECT_EQ("foobar", std::string(lDecoded.begin(), lDecoded.end()));

  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidBase32Character), base32Decode("MZXW6YTBoI", lDecoded));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidBase32Character), base32Decode("MZXW6YTBOI======", lDecoded));
  // same bytes, but the unused low bit of the last character is set
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyEncoding), base32Decode("MZXW6YTBOJ", lDecoded));
}

TEST(StrKey, KnownKeys) {
  const auto lPublic = u256FromHex(sRfcPublicHex);
  EXPECT_EQ("GAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAWHF",
            encodeStrKey(VersionByte::eAccountId, u256().view()));
  EXPECT_EQ("GDLVVGABQKYQVN6VJP7NHSLEA45A5YLS6PNKMIZFV4BBU2HXA5IRVHUR",
            encodeStrKey(VersionByte::eAccountId, lPublic.view()));
  EXPECT_EQ("SCOWDMM5576VUYF2QRFPJEXMFTCEISOFNF5TE2IZOA52YAY4VZ7WBQNO",
            encodeStrKey(VersionByte::eSeed, u256FromHex(sRfcSeedHex).view()));

  const auto lHash = sha256(view(std::string_view("quasar")));
  EXPECT_EQ("TASKQ2QYJ3G5PZT73MOT2XTWETXGJIZGJ4IQUCZTHEBZWZGD6P4GNWU7",
            encodeStrKey(VersionByte::ePreAuthTx, lHash.view()));
  EXPECT_EQ("XASKQ2QYJ3G5PZT73MOT2XTWETXGJIZGJ4IQUCZTHEBZWZGD6P4GMSRG",
            encodeStrKey(VersionByte::eSha256Hash, lHash.view()));

  VersionByte lVersion;
  std::vector<u8> lRaw;
  ASSERT_FALSE(decodeStrKey("GDLVVGABQKYQVN6VJP7NHSLEA45A5YLS6PNKMIZFV4BBU2HXA5IRVHUR", lVersion, lRaw));
  EXPECT_EQ(VersionByte::eAccountId, lVersion);
  EXPECT_EQ(std::vector<u8>(lPublic.begin(), lPublic.end()), lRaw);
}

TEST(StrKey, RoundTrip) {
  const VersionByte lVersions[] = {VersionByte::eAccountId, VersionByte::eSeed, VersionByte::ePreAuthTx,
                                   VersionByte::eSha256Hash};
  for (size_t i = 0; i < 200; i++) {
    auto lVersion = lVersions[randombytes_uniform(4)];
    auto lKey = quasar::rand<u256>();
    auto lText = encodeStrKey(lVersion, lKey.view());
    EXPECT_EQ(56u, lText.size());

    VersionByte lDecodedVersion;
    std::vector<u8> lRaw;
    ASSERT_FALSE(decodeStrKey(lText, lDecodedVersion, lRaw));
    EXPECT_EQ(lVersion, lDecodedVersion);
    EXPECT_EQ(std::vector<u8>(lKey.begin(), lKey.end()), lRaw);
  }
}

TEST(StrKey, SingleCharacterFlips) {
  const std::string lAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
  for (size_t lRound = 0; lRound < 10; lRound++) {
    const auto lText = encodeStrKey(VersionByte::eAccountId, quasar::rand<u256>().view());
    for (size_t i = 0; i < lText.size(); i++) {
      auto lTampered = lText;
      // any other alphabet character
      lTampered[i] = lAlphabet[(lAlphabet.find(lText[i]) + 1 + randombytes_uniform(31)) % 32];
      EXPECT_TRUE(decodeError(lTampered)) << lTampered;
    }
  }

  buff_t<40> lMuxed = quasar::rand<buff_t<40>>();
  const auto lText = encodeStrKey(VersionByte::eMuxedAccount, lMuxed.view());
  for (size_t i = 0; i < lText.size(); i++) {
    auto lTampered = lText;
    lTampered[i] = lText[i] == 'A' ? 'B' : 'A';
    EXPECT_TRUE(decodeError(lTampered)) << lTampered;
  }
}

TEST(StrKey, Rejections) {
  const auto lKey = quasar::rand<u256>();

  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyLength),
            decodeError(encodeStrKey(VersionByte::eAccountId, {lKey.data(), 31})));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyLength),
            decodeError(encodeStrKey(VersionByte::eMuxedAccount, lKey.view())));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyVersion),
            decodeError(encodeStrKey((VersionByte)(1 << 3), lKey.view())));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyLength), decodeError(""));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyLength), decodeError(std::string(200, 'A')));

  auto lValid = encodeStrKey(VersionByte::eAccountId, lKey.view());
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidBase32Character), decodeError(lValid.substr(0, 55) + "1"));

  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyVersion),
            thrownCode([&lValid] { decodeStrKey(lValid, VersionByte::eSeed); }));
  // swapping two distinct characters keeps the alphabet but breaks the checksum
  std::string lSwapped = "GDLVVGABQKYQVN6VJP7NHSLEA45A5YLS6PNKMIZFV4BBU2HXA5IRVHUR";
  std::swap(lSwapped[13], lSwapped[14]);
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eKeyChecksumMismatch),
            thrownCode([&lSwapped] { decodeStrKey(lSwapped, VersionByte::eAccountId); }));
}

TEST(StrKey, SignedPayload) {
  const auto lPublic = u256FromHex(sRfcPublicHex);
  std::vector<u8> lRaw(lPublic.begin(), lPublic.end());
  const u8 lPayload20[] = {0, 0, 0, 20, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17, 18, 19, 20};
  lRaw.insert(lRaw.end(), lPayload20, lPayload20 + sizeof(lPayload20));
  EXPECT_EQ("PDLVVGABQKYQVN6VJP7NHSLEA45A5YLS6PNKMIZFV4BBU2HXA5IRUAAAAAKACAQDAQCQMBYIBEFAWDANBYHRAEISCMKIDMI",
            encodeStrKey(VersionByte::eSignedPayload, view(lRaw)));

  VersionByte lVersion;
  std::vector<u8> lDecoded;
  const std::string lText29 =
      "PDLVVGABQKYQVN6VJP7NHSLEA45A5YLS6PNKMIZFV4BBU2HXA5IRUAAAAAOQCAQDAQCQMBYIBEFAWDANBYHRAEISCMKB"
      "KFQXDAMRUGY4DUAAAAGUXE";
  ASSERT_FALSE(decodeStrKey(lText29, lVersion, lDecoded));
  EXPECT_EQ(VersionByte::eSignedPayload, lVersion);
  EXPECT_EQ(32u + 4 + 32, lDecoded.size());

  // payload length not matching the padded size
  auto lBad = lRaw;
  lBad[35] = 24;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyLength),
            decodeError(encodeStrKey(VersionByte::eSignedPayload, view(lBad))));
  // non-zero padding after a 19 byte payload
  lBad = lRaw;
  lBad[35] = 19;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyLength),
            decodeError(encodeStrKey(VersionByte::eSignedPayload, view(lBad))));
  // empty payload
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidKeyLength),
            decodeError(encodeStrKey(VersionByte::eSignedPayload, {lRaw.data(), 36})));
}
