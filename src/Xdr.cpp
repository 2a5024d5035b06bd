#include <boost/endian/buffers.hpp>

#include "Xdr.hpp"

using namespace quasar;
namespace endian = boost::endian;

static const u8 sZeroPadding[4] = {0, 0, 0, 0};

void XdrWriter::putU32(u32 pValue) {
  endian::big_uint32_buf_t lBuff(pValue);
  putBytes({lBuff.data(), sizeof(lBuff)});
}

void XdrWriter::putI32(i32 pValue) {
  endian::big_int32_buf_t lBuff(pValue);
  putBytes({lBuff.data(), sizeof(lBuff)});
}

void XdrWriter::putU64(u64 pValue) {
  endian::big_uint64_buf_t lBuff(pValue);
  putBytes({lBuff.data(), sizeof(lBuff)});
}

void XdrWriter::putI64(i64 pValue) {
  endian::big_int64_buf_t lBuff(pValue);
  putBytes({lBuff.data(), sizeof(lBuff)});
}

void XdrWriter::putBool(bool pValue) { putU32(pValue ? 1 : 0); }

void XdrWriter::putBytes(const cbuff_view_t &pBytes) { out.insert(out.end(), pBytes.data, pBytes.data + pBytes.size); }

void XdrWriter::putOpaque(const cbuff_view_t &pBytes) {
  putBytes(pBytes);
  putBytes({sZeroPadding, xdrPadding(pBytes.size)});
}

ErrorCode XdrReader::getBytes(const buff_view_t &pDest) {
  if (source.size < pDest.size)
    return QuasarErrorCode::eTruncated;
  if (pDest.size == 0)
    return {};
  memcpy(pDest.data, source.data, pDest.size);
  source.seek(pDest.size);
  return {};
}

ErrorCode XdrReader::getOpaque(const buff_view_t &pDest) {
  const size_t lPadding = xdrPadding(pDest.size);
  if (source.size < pDest.size + lPadding)
    return QuasarErrorCode::eTruncated;
  QUASAR_TRY(getBytes(pDest));
  for (size_t i = 0; i < lPadding; i++) {
    if (source.data[i] != 0)
      return QuasarErrorCode::eInvalidPadding;
  }
  source.seek(lPadding);
  return {};
}

ErrorCode XdrReader::getU32(u32 &pValue) {
  endian::big_uint32_buf_t lBuff;
  QUASAR_TRY(getBytes({lBuff.data(), sizeof(lBuff)}));
  pValue = lBuff.value();
  return {};
}

ErrorCode XdrReader::getI32(i32 &pValue) {
  endian::big_int32_buf_t lBuff;
  QUASAR_TRY(getBytes({lBuff.data(), sizeof(lBuff)}));
  pValue = lBuff.value();
  return {};
}

ErrorCode XdrReader::getU64(u64 &pValue) {
  endian::big_uint64_buf_t lBuff;
  QUASAR_TRY(getBytes({lBuff.data(), sizeof(lBuff)}));
  pValue = lBuff.value();
  return {};
}

ErrorCode XdrReader::getI64(i64 &pValue) {
  endian::big_int64_buf_t lBuff;
  QUASAR_TRY(getBytes({lBuff.data(), sizeof(lBuff)}));
  pValue = lBuff.value();
  return {};
}

ErrorCode XdrReader::getBool(bool &pValue) { return getFlag(pValue); }

ErrorCode XdrReader::getFlag(bool &pPresent) {
  u32 lFlag = 0;
  QUASAR_TRY(getU32(lFlag));
  if (lFlag > 1)
    return QuasarErrorCode::eInvalidFlag;
  pPresent = lFlag == 1;
  return {};
}

ErrorCode XdrReader::enter() {
  if (depth >= QUASAR_XDR_MAX_DEPTH)
    return QuasarErrorCode::eDepthExceeded;
  depth++;
  return {};
}

void XdrReader::leave() { depth--; }
