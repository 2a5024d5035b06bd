#pragma once

#include <stdexcept>
#include <string>

#include <boost/system/error_code.hpp>

namespace quasar {

using ErrorCode = boost::system::error_code;

enum class QuasarErrorCode {
  eNoError = 0x0,

  // Decoding, recoverable by rejecting the input
  eTruncated = 0x1000,
  eLengthExceedsMax = 0x1001,
  eLengthExceedsInput = 0x1002,
  eInvalidDiscriminant = 0x1003,
  eInvalidPadding = 0x1004,
  eInvalidFlag = 0x1005,
  eTrailingBytes = 0x1006,
  eDepthExceeded = 0x1007,
  eInvalidBase64 = 0x1008,

  // Construction, caller built a value violating a static bound
  eExceedsMaximumLength = 0x2000,
  eEmptyOperations = 0x2001,
  eTooManyOperations = 0x2002,
  eTooManySignatures = 0x2003,
  eInvalidAssetCode = 0x2004,
  eInvalidAmount = 0x2005,
  eAmountOverflow = 0x2006,
  eAmountNegative = 0x2007,
  eInvalidPrice = 0x2008,
  eNotApproximableAsFraction = 0x2009,
  eInvalidBalanceId = 0x200A,
  eCannotWrapFeeBump = 0x200B,
  eInvalidSignerWeight = 0x200C,

  // Textual key encoding
  eInvalidBase32Character = 0x3000,
  eInvalidKeyEncoding = 0x3001,
  eInvalidKeyVersion = 0x3002,
  eInvalidKeyLength = 0x3003,
  eKeyChecksumMismatch = 0x3004,

  // Cryptographic
  eInvalidPublicKeyLength = 0x4000,
  eInvalidSignatureLength = 0x4001,
  eInvalidSeedLength = 0x4002,
  eCannotSign = 0x4003,
};

struct QuasarErrorCategory : boost::system::error_category {
  const char *name() const noexcept override;
  std::string message(int ev) const override;
  static const QuasarErrorCategory &instance();
  static ErrorCode wrap(QuasarErrorCode pCode);
};

inline ErrorCode make_error_code(QuasarErrorCode pCode) { return QuasarErrorCategory::wrap(pCode); }

class quasar_error : public std::runtime_error {
  ErrorCode code_;

public:
  explicit quasar_error(ErrorCode pError);
  quasar_error(ErrorCode pError, const std::string &pDesc);
  explicit quasar_error(QuasarErrorCode pCode) : quasar_error(make_error_code(pCode)) {}
  quasar_error(QuasarErrorCode pCode, const std::string &pDesc) : quasar_error(make_error_code(pCode), pDesc) {}

  const ErrorCode &code() const noexcept { return code_; }
};

} // namespace quasar

namespace boost {
namespace system {
template <> struct is_error_code_enum<quasar::QuasarErrorCode> : std::true_type {};
} // namespace system
} // namespace boost

#define QUASAR_TRY(expr)                                                                                               \
  if (::quasar::ErrorCode lTryError = (expr))                                                                          \
    return lTryError;
