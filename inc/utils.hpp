#pragma once

#include <cstdint>
#include <cstring>

#include <array>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sodium.h>

#define QUASAR_MAX_OPERATIONS 100
#define QUASAR_MAX_SIGNATURES 20
#define QUASAR_XDR_MAX_DEPTH 8
#define QUASAR_BASE_FEE 100

#define QUASAR_CCALL(expr)                                                                                             \
  if (expr)                                                                                                            \
    throw std::runtime_error(std::string(#expr) + " failed at " __FILE__ ":" + std::to_string(__LINE__));

namespace quasar {

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i32 = int32_t;
using i64 = int64_t;

struct buff_view_t {
  u8 *data;
  size_t size;

  void seek(size_t pBytes);
};

struct cbuff_view_t {
  const u8 *data;
  size_t size;

  void seek(size_t pBytes);
};
std::ostream &operator<<(std::ostream &pOS, const buff_view_t &pBuff);
std::ostream &operator<<(std::ostream &pOS, const cbuff_view_t &pBuff);

inline cbuff_view_t view(const std::vector<u8> &pBytes) { return cbuff_view_t{pBytes.data(), pBytes.size()}; }
inline cbuff_view_t view(std::string_view pText) { return cbuff_view_t{(const u8 *)pText.data(), pText.size()}; }

std::string toHex(const cbuff_view_t &pSource);
/** @return false if pSource is not exactly 2 * pDest.size hex digits */
bool parseHex(const buff_view_t &pDest, std::string_view pSource);

template <const size_t TSize> struct buff_t : public std::array<u8, TSize> {
  static constexpr size_t sSize = TSize;

  buff_t() : std::array<u8, TSize>{} {}

  bool operator==(const buff_t<TSize> &pOther) const {
    return memcmp(std::array<u8, TSize>::data(), pOther.data(), TSize) == 0;
  }
  bool operator!=(const buff_t<TSize> &pOther) const { return !(*this == pOther); }
  bool operator<(const buff_t<TSize> &pOther) const {
    return memcmp(std::array<u8, TSize>::data(), pOther.data(), TSize) < 0;
  }

  buff_view_t view() { return buff_view_t{std::array<u8, TSize>::data(), std::array<u8, TSize>::size()}; }

  cbuff_view_t view() const { return cbuff_view_t{std::array<u8, TSize>::data(), std::array<u8, TSize>::size()}; }
};

template <const size_t TSize> std::ostream &operator<<(std::ostream &pOS, const buff_t<TSize> &pBuff) {
  return pOS << pBuff.view();
}

using u32b = buff_t<4>;
using u256 = buff_t<32>;
using u512 = buff_t<64>;

/** Keeps secret material out of swap and wipes it on destruction. */
template <typename T> struct sensitive_t {
  T contained;

  sensitive_t() { sodium_mlock(contained.data(), contained.size()); }
  explicit sensitive_t(T pInit) : contained(std::move(pInit)) { sodium_mlock(contained.data(), contained.size()); }
  sensitive_t(const sensitive_t &) = delete;
  sensitive_t &operator=(const sensitive_t &) = delete;

  sensitive_t(sensitive_t &&pOther) noexcept : contained(pOther.contained) {
    sodium_mlock(contained.data(), contained.size());
    sodium_memzero(pOther.contained.data(), pOther.contained.size());
  }

  ~sensitive_t() {
    sodium_memzero(contained.data(), contained.size());
    sodium_munlock(contained.data(), contained.size());
  }

  T *operator->() { return &contained; }

  const T *operator->() const { return &contained; }
};

/** Initializes libsodium once; throws if no secure random source is available. */
void ensureSodium();

template <typename T> T rand() {
  ensureSodium();
  T lResult;
  randombytes_buf(lResult.data(), lResult.size());
  return lResult;
}

u256 sha256(const cbuff_view_t &pData);

std::string toBase64(const cbuff_view_t &pData);
/** @return false if pText isn't canonical base64 */
bool fromBase64(std::string_view pText, std::vector<u8> &pOut);

} // namespace quasar
