#include "StrKey.hpp"

#include <boost/endian/conversion.hpp>

using namespace quasar;

static constexpr char sBase32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
static constexpr size_t sSignedPayloadMax = 64;

static const std::array<u16, 256> &crc16Table() {
  static const std::array<u16, 256> sTable = [] {
    std::array<u16, 256> lTable{};
    for (u32 i = 0; i < 256; i++) {
      u16 lCrc = (u16)(i << 8);
      for (int j = 0; j < 8; j++)
        lCrc = (lCrc & 0x8000u) ? (u16)((lCrc << 1) ^ 0x1021u) : (u16)(lCrc << 1);
      lTable[i] = lCrc;
    }
    return lTable;
  }();
  return sTable;
}

static int base32Value(char pChar) {
  if (pChar >= 'A' && pChar <= 'Z')
    return pChar - 'A';
  if (pChar >= '2' && pChar <= '7')
    return pChar - '2' + 26;
  return -1;
}

static bool knownVersion(u8 pVersion) {
  switch ((VersionByte)pVersion) {
  case VersionByte::eAccountId:
  case VersionByte::eSignedPayload:
  case VersionByte::eMuxedAccount:
  case VersionByte::eSeed:
  case VersionByte::ePreAuthTx:
  case VersionByte::eSha256Hash:
    return true;
  }
  return false;
}

// signed payload: ed25519 key, u32 payload length, payload padded to 4 bytes
static bool validSignedPayload(const cbuff_view_t &pRaw) {
  if (pRaw.size < 32 + 4 + 4 || pRaw.size > 32 + 4 + sSignedPayloadMax)
    return false;
  u32 lLength = boost::endian::load_big_u32(pRaw.data + 32);
  if (lLength == 0 || lLength > sSignedPayloadMax)
    return false;
  size_t lPadded = lLength + ((4 - (lLength & 3u)) & 3u);
  if (pRaw.size != 32 + 4 + lPadded)
    return false;
  for (size_t i = 32 + 4 + lLength; i < pRaw.size; i++) {
    if (pRaw.data[i] != 0)
      return false;
  }
  return true;
}

static bool validLength(VersionByte pVersion, const cbuff_view_t &pRaw) {
  switch (pVersion) {
  case VersionByte::eMuxedAccount:
    return pRaw.size == 32 + 8;
  case VersionByte::eSignedPayload:
    return validSignedPayload(pRaw);
  default:
    return pRaw.size == 32;
  }
}

u16 quasar::crc16Xmodem(const cbuff_view_t &pData) {
  const auto &lTable = crc16Table();
  u16 lCrc = 0;
  for (size_t i = 0; i < pData.size; i++)
    lCrc = (u16)((lCrc << 8) ^ lTable[((lCrc >> 8) ^ pData.data[i]) & 0xFFu]);
  return lCrc;
}

std::string quasar::base32Encode(const cbuff_view_t &pData) {
  std::string lResult;
  lResult.reserve((pData.size * 8 + 4) / 5);
  u32 lBuffer = 0;
  int lBits = 0;
  for (size_t i = 0; i < pData.size; i++) {
    lBuffer = (lBuffer << 8) | pData.data[i];
    lBits += 8;
    while (lBits >= 5) {
      lResult.push_back(sBase32Alphabet[(lBuffer >> (lBits - 5)) & 0x1Fu]);
      lBits -= 5;
    }
  }
  if (lBits > 0)
    lResult.push_back(sBase32Alphabet[(lBuffer << (5 - lBits)) & 0x1Fu]);
  return lResult;
}

ErrorCode quasar::base32Decode(std::string_view pText, std::vector<u8> &pOut) {
  pOut.clear();
  pOut.reserve(pText.size() * 5 / 8);
  u32 lBuffer = 0;
  int lBits = 0;
  for (char lChar : pText) {
    int lValue = base32Value(lChar);
    if (lValue < 0)
      return QuasarErrorCode::eInvalidBase32Character;
    lBuffer = (lBuffer << 5) | (u32)lValue;
    lBits += 5;
    if (lBits >= 8) {
      pOut.push_back((u8)(lBuffer >> (lBits - 8)));
      lBits -= 8;
    }
  }
  // a whole unused character, or unused bits that aren't zero, can't come from the encoder
  if (lBits >= 5 || (lBuffer & ((1u << lBits) - 1u)) != 0)
    return QuasarErrorCode::eInvalidKeyEncoding;
  return {};
}

std::string quasar::encodeStrKey(VersionByte pVersion, const cbuff_view_t &pRaw) {
  std::vector<u8> lPayload;
  lPayload.reserve(pRaw.size + 3);
  lPayload.push_back((u8)pVersion);
  lPayload.insert(lPayload.end(), pRaw.data, pRaw.data + pRaw.size);
  u16 lChecksum = crc16Xmodem(view(lPayload));
  lPayload.push_back((u8)(lChecksum & 0xFFu));
  lPayload.push_back((u8)(lChecksum >> 8));
  return base32Encode(view(lPayload));
}

ErrorCode quasar::decodeStrKey(std::string_view pText, VersionByte &pVersion, std::vector<u8> &pRaw) {
  // longest payload is a signed payload: version, 100 raw bytes, checksum
  if (pText.size() > ((1 + 32 + 4 + sSignedPayloadMax + 2) * 8 + 4) / 5)
    return QuasarErrorCode::eInvalidKeyLength;

  std::vector<u8> lPayload;
  QUASAR_TRY(base32Decode(pText, lPayload));
  if (lPayload.size() < 3)
    return QuasarErrorCode::eInvalidKeyLength;

  const size_t lDataSize = lPayload.size() - 2;
  u16 lExpected = crc16Xmodem({lPayload.data(), lDataSize});
  u16 lFound = (u16)(lPayload[lDataSize] | (lPayload[lDataSize + 1] << 8));
  if (lExpected != lFound)
    return QuasarErrorCode::eKeyChecksumMismatch;

  if (!knownVersion(lPayload[0]))
    return QuasarErrorCode::eInvalidKeyVersion;
  auto lVersion = (VersionByte)lPayload[0];

  cbuff_view_t lRaw{lPayload.data() + 1, lDataSize - 1};
  if (!validLength(lVersion, lRaw))
    return QuasarErrorCode::eInvalidKeyLength;

  pVersion = lVersion;
  pRaw.assign(lRaw.data, lRaw.data + lRaw.size);
  return {};
}

std::vector<u8> quasar::decodeStrKey(std::string_view pText, VersionByte pExpected) {
  VersionByte lVersion;
  std::vector<u8> lRaw;
  if (auto lError = decodeStrKey(pText, lVersion, lRaw))
    throw quasar_error(lError, "cannot decode strkey");
  if (lVersion != pExpected)
    throw quasar_error(QuasarErrorCode::eInvalidKeyVersion,
                       std::string("expected '") + base32Encode({(const u8 *)&pExpected, 1})[0] + "' strkey");
  return lRaw;
}
