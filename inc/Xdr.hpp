#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <variant>

#include "Error.hpp"
#include "utils.hpp"

namespace quasar {

constexpr u32 sXdrUnbounded = 0xFFFFFFFFu;

inline size_t xdrPadding(size_t pSize) { return (4 - (pSize & 3u)) & 3u; }

template <typename T, typename = void> struct XdrTraits;

class XdrWriter {
  std::vector<u8> &out;

public:
  explicit XdrWriter(std::vector<u8> &pOut) : out(pOut) {}

  void putU32(u32 pValue);
  void putI32(i32 pValue);
  void putU64(u64 pValue);
  void putI64(i64 pValue);
  void putBool(bool pValue);
  /** Raw bytes, caller keeps the stream aligned */
  void putBytes(const cbuff_view_t &pBytes);
  /** Bytes followed by zero padding up to the next multiple of 4 */
  void putOpaque(const cbuff_view_t &pBytes);

  template <typename... T> void put(const T &...pValues) { (XdrTraits<T>::write(*this, pValues), ...); }
};

class XdrReader {
  cbuff_view_t source;
  size_t depth = 0;

public:
  explicit XdrReader(const cbuff_view_t &pSource) : source(pSource) {}

  size_t remaining() const { return source.size; }

  ErrorCode getU32(u32 &pValue);
  ErrorCode getI32(i32 &pValue);
  ErrorCode getU64(u64 &pValue);
  ErrorCode getI64(i64 &pValue);
  ErrorCode getBool(bool &pValue);
  /** Reads a presence flag, anything but 0 or 1 is rejected */
  ErrorCode getFlag(bool &pPresent);
  ErrorCode getBytes(const buff_view_t &pDest);
  ErrorCode getOpaque(const buff_view_t &pDest);

  /** Guards recursive types against unbounded nesting */
  ErrorCode enter();
  void leave();

  template <typename... T> ErrorCode get(T &...pValues) {
    ErrorCode lError;
    (void)((lError = XdrTraits<T>::read(*this, pValues)) || ...);
    return lError;
  }
};

template <typename T, typename> struct XdrTraits {
  static void write(XdrWriter &pOut, const T &pValue) { pValue.write(pOut); }
  static ErrorCode read(XdrReader &pIn, T &pValue) { return pValue.read(pIn); }
};

template <> struct XdrTraits<u32> {
  static void write(XdrWriter &pOut, u32 pValue) { pOut.putU32(pValue); }
  static ErrorCode read(XdrReader &pIn, u32 &pValue) { return pIn.getU32(pValue); }
};

template <> struct XdrTraits<i32> {
  static void write(XdrWriter &pOut, i32 pValue) { pOut.putI32(pValue); }
  static ErrorCode read(XdrReader &pIn, i32 &pValue) { return pIn.getI32(pValue); }
};

template <> struct XdrTraits<u64> {
  static void write(XdrWriter &pOut, u64 pValue) { pOut.putU64(pValue); }
  static ErrorCode read(XdrReader &pIn, u64 &pValue) { return pIn.getU64(pValue); }
};

template <> struct XdrTraits<i64> {
  static void write(XdrWriter &pOut, i64 pValue) { pOut.putI64(pValue); }
  static ErrorCode read(XdrReader &pIn, i64 &pValue) { return pIn.getI64(pValue); }
};

template <> struct XdrTraits<bool> {
  static void write(XdrWriter &pOut, bool pValue) { pOut.putBool(pValue); }
  static ErrorCode read(XdrReader &pIn, bool &pValue) { return pIn.getBool(pValue); }
};

// opaque name[N]
template <size_t TSize> struct XdrTraits<buff_t<TSize>> {
  static void write(XdrWriter &pOut, const buff_t<TSize> &pValue) { pOut.putOpaque(pValue.view()); }
  static ErrorCode read(XdrReader &pIn, buff_t<TSize> &pValue) { return pIn.getOpaque(pValue.view()); }
};

// T name[N]
template <typename T, size_t TSize> struct XdrTraits<std::array<T, TSize>> {
  static void write(XdrWriter &pOut, const std::array<T, TSize> &pValue) {
    for (const auto &lItem : pValue)
      XdrTraits<T>::write(pOut, lItem);
  }
  static ErrorCode read(XdrReader &pIn, std::array<T, TSize> &pValue) {
    for (auto &lItem : pValue)
      QUASAR_TRY(XdrTraits<T>::read(pIn, lItem));
    return {};
  }
};

// T *name
template <typename T> struct XdrTraits<std::optional<T>> {
  static void write(XdrWriter &pOut, const std::optional<T> &pValue) {
    pOut.putU32(pValue ? 1 : 0);
    if (pValue)
      XdrTraits<T>::write(pOut, *pValue);
  }
  static ErrorCode read(XdrReader &pIn, std::optional<T> &pValue) {
    bool lPresent = false;
    QUASAR_TRY(pIn.getFlag(lPresent));
    if (!lPresent) {
      pValue.reset();
      return {};
    }
    pValue.emplace();
    return XdrTraits<T>::read(pIn, *pValue);
  }
};

/** opaque name<TMax> or string name<TMax>, depending on TContainer */
template <typename TContainer, u32 TMax> class XdrVarOpaque {
  TContainer bytes;

public:
  static constexpr u32 sMax = TMax;

  XdrVarOpaque() = default;
  XdrVarOpaque(TContainer pBytes) : bytes(std::move(pBytes)) {
    if (bytes.size() > TMax)
      throw quasar_error(QuasarErrorCode::eExceedsMaximumLength,
                         std::to_string(bytes.size()) + " bytes, allowed " + std::to_string(TMax));
  }
  XdrVarOpaque(const cbuff_view_t &pBytes) : XdrVarOpaque(TContainer(pBytes.data, pBytes.data + pBytes.size)) {}

  size_t size() const { return bytes.size(); }
  bool empty() const { return bytes.empty(); }
  const TContainer &value() const { return bytes; }
  cbuff_view_t view() const { return cbuff_view_t{(const u8 *)bytes.data(), bytes.size()}; }

  void write(XdrWriter &pOut) const {
    pOut.putU32((u32)bytes.size());
    pOut.putOpaque(view());
  }

  ErrorCode read(XdrReader &pIn) {
    u32 lSize = 0;
    QUASAR_TRY(pIn.getU32(lSize));
    if (lSize > TMax)
      return QuasarErrorCode::eLengthExceedsMax;
    if (lSize > pIn.remaining())
      return QuasarErrorCode::eLengthExceedsInput;
    bytes.resize(lSize);
    return pIn.getOpaque(buff_view_t{(u8 *)bytes.data(), bytes.size()});
  }

  bool operator==(const XdrVarOpaque &pOther) const { return bytes == pOther.bytes; }
  bool operator!=(const XdrVarOpaque &pOther) const { return bytes != pOther.bytes; }
};

template <u32 TMax = sXdrUnbounded> using XdrBytes = XdrVarOpaque<std::vector<u8>, TMax>;
template <u32 TMax = sXdrUnbounded> using XdrString = XdrVarOpaque<std::string, TMax>;

/** T name<TMax> */
template <typename T, u32 TMax = sXdrUnbounded> class XdrArray {
  std::vector<T> items;

  void check() const {
    if (items.size() > TMax)
      throw quasar_error(QuasarErrorCode::eExceedsMaximumLength,
                         std::to_string(items.size()) + " elements, allowed " + std::to_string(TMax));
  }

public:
  static constexpr u32 sMax = TMax;

  XdrArray() = default;
  XdrArray(std::vector<T> pItems) : items(std::move(pItems)) { check(); }
  XdrArray(std::initializer_list<T> pItems) : items(pItems) { check(); }

  size_t size() const { return items.size(); }
  bool empty() const { return items.empty(); }
  bool full() const { return items.size() >= TMax; }

  void push_back(T pItem) {
    if (full())
      throw quasar_error(QuasarErrorCode::eExceedsMaximumLength, "already " + std::to_string(TMax) + " elements");
    items.push_back(std::move(pItem));
  }

  auto begin() { return items.begin(); }
  auto end() { return items.end(); }
  auto begin() const { return items.cbegin(); }
  auto end() const { return items.cend(); }
  T &operator[](size_t pIndex) { return items[pIndex]; }
  const T &operator[](size_t pIndex) const { return items[pIndex]; }
  const T &back() const { return items.back(); }
  const std::vector<T> &value() const { return items; }

  void write(XdrWriter &pOut) const {
    pOut.putU32((u32)items.size());
    for (const auto &lItem : items)
      XdrTraits<T>::write(pOut, lItem);
  }

  ErrorCode read(XdrReader &pIn) {
    u32 lCount = 0;
    QUASAR_TRY(pIn.getU32(lCount));
    if (lCount > TMax)
      return QuasarErrorCode::eLengthExceedsMax;
    // every element of the schema encodes to 4 bytes at least
    if (lCount > pIn.remaining() / 4)
      return QuasarErrorCode::eLengthExceedsInput;
    items.clear();
    items.resize(lCount);
    for (auto &lItem : items)
      QUASAR_TRY(XdrTraits<T>::read(pIn, lItem));
    return {};
  }

  bool operator==(const XdrArray &pOther) const { return items == pOther.items; }
  bool operator!=(const XdrArray &pOther) const { return items != pOther.items; }
};

/** Optional value behind a pointer, for recursive types */
template <typename T> class XdrBox {
  std::unique_ptr<T> ptr;

public:
  XdrBox() = default;
  XdrBox(T pValue) : ptr(std::make_unique<T>(std::move(pValue))) {}
  XdrBox(const XdrBox &pOther) : ptr(pOther.ptr ? std::make_unique<T>(*pOther.ptr) : nullptr) {}
  XdrBox(XdrBox &&pOther) noexcept = default;
  XdrBox &operator=(XdrBox pOther) noexcept {
    ptr.swap(pOther.ptr);
    return *this;
  }

  bool has_value() const { return ptr != nullptr; }
  explicit operator bool() const { return has_value(); }
  const T &operator*() const { return *ptr; }
  const T *operator->() const { return ptr.get(); }

  void write(XdrWriter &pOut) const {
    pOut.putU32(ptr ? 1 : 0);
    if (ptr)
      XdrTraits<T>::write(pOut, *ptr);
  }

  ErrorCode read(XdrReader &pIn) {
    bool lPresent = false;
    QUASAR_TRY(pIn.getFlag(lPresent));
    if (!lPresent) {
      ptr.reset();
      return {};
    }
    ptr = std::make_unique<T>();
    return XdrTraits<T>::read(pIn, *ptr);
  }

  bool operator==(const XdrBox &pOther) const {
    if (!ptr || !pOther.ptr)
      return !ptr && !pOther.ptr;
    return *ptr == *pOther.ptr;
  }
  bool operator!=(const XdrBox &pOther) const { return !(*this == pOther); }
};

/** case TDiscriminant: T value; */
template <auto TDiscriminant, typename T> struct XdrArm {
  static constexpr auto sDiscriminant = TDiscriminant;
  T value;

  XdrArm() = default;
  explicit XdrArm(T pValue) : value(std::move(pValue)) {}

  void write(XdrWriter &pOut) const { XdrTraits<T>::write(pOut, value); }
  ErrorCode read(XdrReader &pIn) { return XdrTraits<T>::read(pIn, value); }

  bool operator==(const XdrArm &pOther) const { return value == pOther.value; }
};

/** case TDiscriminant: void; */
template <auto TDiscriminant> struct XdrVoidArm {
  static constexpr auto sDiscriminant = TDiscriminant;

  void write(XdrWriter &) const {}
  ErrorCode read(XdrReader &) { return {}; }

  bool operator==(const XdrVoidArm &) const { return true; }
};

/** union switch (discriminant) over a closed set of arms */
template <typename... TArms> class XdrUnion {
  std::variant<TArms...> arms;

  template <typename TArm> ErrorCode readArm(XdrReader &pIn) {
    TArm lArm;
    QUASAR_TRY(lArm.read(pIn));
    arms = std::move(lArm);
    return {};
  }

public:
  XdrUnion() = default;
  template <typename TArm, typename = std::enable_if_t<(std::is_same_v<std::decay_t<TArm>, TArms> || ...)>>
  XdrUnion(TArm &&pArm) : arms(std::forward<TArm>(pArm)) {}

  i32 discriminant() const {
    return std::visit([](const auto &pArm) { return static_cast<i32>(std::decay_t<decltype(pArm)>::sDiscriminant); },
                      arms);
  }

  template <typename TArm> bool is() const { return std::holds_alternative<TArm>(arms); }
  template <typename TArm> const TArm &as() const { return std::get<TArm>(arms); }
  template <typename TArm> TArm &as() { return std::get<TArm>(arms); }
  template <typename TArm> const TArm *getIf() const { return std::get_if<TArm>(&arms); }
  template <typename TArm> TArm *getIf() { return std::get_if<TArm>(&arms); }
  template <typename TVisitor> decltype(auto) visit(TVisitor &&pVisitor) const {
    return std::visit(std::forward<TVisitor>(pVisitor), arms);
  }

  void write(XdrWriter &pOut) const {
    pOut.putI32(discriminant());
    std::visit([&pOut](const auto &pArm) { pArm.write(pOut); }, arms);
  }

  ErrorCode read(XdrReader &pIn) {
    i32 lDiscriminant = 0;
    QUASAR_TRY(pIn.getI32(lDiscriminant));
    ErrorCode lError = QuasarErrorCode::eInvalidDiscriminant;
    (void)((lDiscriminant == static_cast<i32>(TArms::sDiscriminant) ? (lError = readArm<TArms>(pIn), true) : false) ||
           ...);
    return lError;
  }

  bool operator==(const XdrUnion &pOther) const { return arms == pOther.arms; }
  bool operator!=(const XdrUnion &pOther) const { return !(arms == pOther.arms); }
};

/** Structures list their fields once, in wire order */
#define QUASAR_XDR_FIELDS(...)                                                                                         \
  void write(::quasar::XdrWriter &pOut) const { pOut.put(__VA_ARGS__); }                                              \
  ::quasar::ErrorCode read(::quasar::XdrReader &pIn) { return pIn.get(__VA_ARGS__); }                                 \
  auto tie() const { return std::tie(__VA_ARGS__); }

template <typename T> auto operator==(const T &pLeft, const T &pRight) -> decltype(pLeft.tie() == pRight.tie()) {
  return pLeft.tie() == pRight.tie();
}

template <typename T> auto operator!=(const T &pLeft, const T &pRight) -> decltype(pLeft.tie() == pRight.tie()) {
  return !(pLeft.tie() == pRight.tie());
}

template <typename T> std::vector<u8> encodeXdr(const T &pValue) {
  std::vector<u8> lResult;
  XdrWriter lWriter(lResult);
  XdrTraits<T>::write(lWriter, pValue);
  return lResult;
}

/** Decodes a value from the front of pSource, pConsumed receives its encoded size */
template <typename T> ErrorCode decodeXdrPrefix(const cbuff_view_t &pSource, T &pValue, size_t &pConsumed) {
  XdrReader lReader(pSource);
  T lValue;
  QUASAR_TRY(XdrTraits<T>::read(lReader, lValue));
  pConsumed = pSource.size - lReader.remaining();
  pValue = std::move(lValue);
  return {};
}

/** Decodes a value that must span all of pSource */
template <typename T> ErrorCode decodeXdr(const cbuff_view_t &pSource, T &pValue) {
  XdrReader lReader(pSource);
  T lValue;
  QUASAR_TRY(XdrTraits<T>::read(lReader, lValue));
  if (lReader.remaining() != 0)
    return QuasarErrorCode::eTrailingBytes;
  pValue = std::move(lValue);
  return {};
}

template <typename T> std::string toBase64Xdr(const T &pValue) { return toBase64(view(encodeXdr(pValue))); }

template <typename T> ErrorCode fromBase64Xdr(std::string_view pText, T &pValue) {
  std::vector<u8> lBytes;
  if (!fromBase64(pText, lBytes))
    return QuasarErrorCode::eInvalidBase64;
  return decodeXdr(view(lBytes), pValue);
}

} // namespace quasar
