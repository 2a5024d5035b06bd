#include "Error.hpp"

using namespace quasar;

const char *QuasarErrorCategory::name() const noexcept { return "quasar"; }

std::string QuasarErrorCategory::message(int ev) const {
  switch ((QuasarErrorCode)ev) {
  case QuasarErrorCode::eNoError:
    return "0x0000: eNoError";
  case QuasarErrorCode::eTruncated:
    return "0x1000: eTruncated";
  case QuasarErrorCode::eLengthExceedsMax:
    return "0x1001: eLengthExceedsMax";
  case QuasarErrorCode::eLengthExceedsInput:
    return "0x1002: eLengthExceedsInput";
  case QuasarErrorCode::eInvalidDiscriminant:
    return "0x1003: eInvalidDiscriminant";
  case QuasarErrorCode::eInvalidPadding:
    return "0x1004: eInvalidPadding";
  case QuasarErrorCode::eInvalidFlag:
    return "0x1005: eInvalidFlag";
  case QuasarErrorCode::eTrailingBytes:
    return "0x1006: eTrailingBytes";
  case QuasarErrorCode::eDepthExceeded:
    return "0x1007: eDepthExceeded";
  case QuasarErrorCode::eInvalidBase64:
    return "0x1008: eInvalidBase64";
  case QuasarErrorCode::eExceedsMaximumLength:
    return "0x2000: eExceedsMaximumLength";
  case QuasarErrorCode::eEmptyOperations:
    return "0x2001: eEmptyOperations";
  case QuasarErrorCode::eTooManyOperations:
    return "0x2002: eTooManyOperations";
  case QuasarErrorCode::eTooManySignatures:
    return "0x2003: eTooManySignatures";
  case QuasarErrorCode::eInvalidAssetCode:
    return "0x2004: eInvalidAssetCode";
  case QuasarErrorCode::eInvalidAmount:
    return "0x2005: eInvalidAmount";
  case QuasarErrorCode::eAmountOverflow:
    return "0x2006: eAmountOverflow";
  case QuasarErrorCode::eAmountNegative:
    return "0x2007: eAmountNegative";
  case QuasarErrorCode::eInvalidPrice:
    return "0x2008: eInvalidPrice";
  case QuasarErrorCode::eNotApproximableAsFraction:
    return "0x2009: eNotApproximableAsFraction";
  case QuasarErrorCode::eInvalidBalanceId:
    return "0x200A: eInvalidBalanceId";
  case QuasarErrorCode::eCannotWrapFeeBump:
    return "0x200B: eCannotWrapFeeBump";
  case QuasarErrorCode::eInvalidSignerWeight:
    return "0x200C: eInvalidSignerWeight";
  case QuasarErrorCode::eInvalidBase32Character:
    return "0x3000: eInvalidBase32Character";
  case QuasarErrorCode::eInvalidKeyEncoding:
    return "0x3001: eInvalidKeyEncoding";
  case QuasarErrorCode::eInvalidKeyVersion:
    return "0x3002: eInvalidKeyVersion";
  case QuasarErrorCode::eInvalidKeyLength:
    return "0x3003: eInvalidKeyLength";
  case QuasarErrorCode::eKeyChecksumMismatch:
    return "0x3004: eKeyChecksumMismatch";
  case QuasarErrorCode::eInvalidPublicKeyLength:
    return "0x4000: eInvalidPublicKeyLength";
  case QuasarErrorCode::eInvalidSignatureLength:
    return "0x4001: eInvalidSignatureLength";
  case QuasarErrorCode::eInvalidSeedLength:
    return "0x4002: eInvalidSeedLength";
  case QuasarErrorCode::eCannotSign:
    return "0x4003: eCannotSign";
  }
  return std::string();
}

const QuasarErrorCategory &QuasarErrorCategory::instance() {
  static QuasarErrorCategory sCategory;
  return sCategory;
}

ErrorCode QuasarErrorCategory::wrap(QuasarErrorCode pCode) { return ErrorCode((int)pCode, instance()); }

quasar_error::quasar_error(ErrorCode pError) : std::runtime_error(pError.message()), code_(pError) {}

quasar_error::quasar_error(ErrorCode pError, const std::string &pDesc)
    : std::runtime_error(pDesc + " (" + pError.message() + ")"), code_(pError) {}
