#pragma once

#include "Error.hpp"
#include "utils.hpp"

namespace quasar {

/** Leading byte of a strkey payload, the protocol fixes these so the first base32 character reads as the role */
enum class VersionByte : u8 {
  eAccountId = 6 << 3,     // G
  eSignedPayload = 15 << 3, // P
  eMuxedAccount = 12 << 3, // M
  eSeed = 18 << 3,         // S
  ePreAuthTx = 19 << 3,    // T
  eSha256Hash = 23 << 3,   // X
};

u16 crc16Xmodem(const cbuff_view_t &pData);

std::string base32Encode(const cbuff_view_t &pData);
ErrorCode base32Decode(std::string_view pText, std::vector<u8> &pOut);

std::string encodeStrKey(VersionByte pVersion, const cbuff_view_t &pRaw);

/** Splits a strkey into its version and raw key bytes after checking alphabet, length and checksum */
ErrorCode decodeStrKey(std::string_view pText, VersionByte &pVersion, std::vector<u8> &pRaw);

/** Throwing form that also insists on pExpected as version */
std::vector<u8> decodeStrKey(std::string_view pText, VersionByte pExpected);

} // namespace quasar
