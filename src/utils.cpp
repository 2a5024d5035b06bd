#include "utils.hpp"

#include <stdexcept>

using namespace quasar;

void buff_view_t::seek(size_t pBytes) {
  data += pBytes;
  size -= pBytes;
}

void cbuff_view_t::seek(size_t pBytes) {
  data += pBytes;
  size -= pBytes;
}

std::ostream &quasar::operator<<(std::ostream &pOS, const buff_view_t &pBuff) {
  return pOS << cbuff_view_t{pBuff.data, pBuff.size};
}

std::ostream &quasar::operator<<(std::ostream &pOS, const cbuff_view_t &pBuff) { return pOS << toHex(pBuff); }

std::string quasar::toHex(const cbuff_view_t &pSource) {
  std::string lHex(pSource.size * 2 + 1, '\0');
  sodium_bin2hex(lHex.data(), lHex.size(), pSource.data, pSource.size);
  lHex.pop_back();
  return lHex;
}

bool quasar::parseHex(const buff_view_t &pDest, std::string_view pSource) {
  if (pSource.size() != pDest.size * 2)
    return false;
  size_t lWritten = 0;
  const char *lEnd = nullptr;
  if (sodium_hex2bin(pDest.data, pDest.size, pSource.data(), pSource.size(), nullptr, &lWritten, &lEnd) != 0)
    return false;
  return lWritten == pDest.size && lEnd == pSource.data() + pSource.size();
}

void quasar::ensureSodium() {
  static const bool sReady = [] {
    if (sodium_init() < 0)
      throw std::runtime_error("sodium_init failed, no secure random source");
    return true;
  }();
  (void)sReady;
}

u256 quasar::sha256(const cbuff_view_t &pData) {
  u256 lResult;
  QUASAR_CCALL(crypto_hash_sha256(lResult.data(), pData.data, pData.size));
  return lResult;
}

std::string quasar::toBase64(const cbuff_view_t &pData) {
  constexpr int lVariant = sodium_base64_VARIANT_ORIGINAL;
  std::string lResult(sodium_base64_ENCODED_LEN(pData.size, lVariant), '\0');
  sodium_bin2base64(lResult.data(), lResult.size(), pData.data, pData.size, lVariant);
  lResult.pop_back();
  return lResult;
}

bool quasar::fromBase64(std::string_view pText, std::vector<u8> &pOut) {
  pOut.resize(pText.size() / 4 * 3 + 3);
  size_t lWritten = 0;
  const char *lEnd = nullptr;
  if (sodium_base642bin(pOut.data(), pOut.size(), pText.data(), pText.size(), nullptr, &lWritten, &lEnd,
                        sodium_base64_VARIANT_ORIGINAL) != 0)
    return false;
  if (lEnd != pText.data() + pText.size())
    return false;
  pOut.resize(lWritten);
  return true;
}
