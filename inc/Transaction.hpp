#pragma once

#include "Operations.hpp"

namespace quasar {

enum class EnvelopeType : i32 {
  eTxV0 = 0,
  eTx = 2,
  eTxFeeBump = 5,
};

using Operations = XdrArray<Operation, QUASAR_MAX_OPERATIONS>;
using DecoratedSignatures = XdrArray<DecoratedSignature, QUASAR_MAX_SIGNATURES>;
using TransactionExt = XdrUnion<XdrVoidArm<0>>;

/** Ledger transaction. Built values always carry 1 to 100 operations. */
class Transaction {
  Operations operations_;

  friend struct TransactionV0;

public:
  MuxedAccount sourceAccount;
  u32 fee = 0;
  SequenceNumber seqNum = 0;
  std::optional<TimeBounds> timeBounds;
  Memo memo;
  TransactionExt ext;

  /** Empty value, only meant as a decode target */
  Transaction() = default;
  /** @throw quasar_error eEmptyOperations or eTooManyOperations */
  Transaction(MuxedAccount pSource, u32 pFee, SequenceNumber pSeqNum, std::vector<Operation> pOperations,
              Memo pMemo = Memo::none(), std::optional<TimeBounds> pTimeBounds = std::nullopt);

  const Operations &operations() const { return operations_; }
  /** @throw quasar_error eTooManyOperations */
  void appendOperation(Operation pOperation);

  QUASAR_XDR_FIELDS(sourceAccount, fee, seqNum, timeBounds, memo, operations_, ext)
};

/** Pre-muxed-account transaction layout, source is a bare ed25519 key */
struct TransactionV0 {
  u256 sourceAccountEd25519;
  u32 fee = 0;
  SequenceNumber seqNum = 0;
  std::optional<TimeBounds> timeBounds;
  Memo memo;
  Operations operations;
  TransactionExt ext;
  QUASAR_XDR_FIELDS(sourceAccountEd25519, fee, seqNum, timeBounds, memo, operations, ext)

  /** Same transaction in the v1 layout, which is what signatures are computed over */
  Transaction toV1() const;
};

struct TransactionV0Envelope {
  TransactionV0 tx;
  DecoratedSignatures signatures;
  QUASAR_XDR_FIELDS(tx, signatures)
};

struct TransactionV1Envelope {
  Transaction tx;
  DecoratedSignatures signatures;
  QUASAR_XDR_FIELDS(tx, signatures)
};

using FeeBumpInnerV1 = XdrArm<EnvelopeType::eTx, TransactionV1Envelope>;
using FeeBumpInnerTx = XdrUnion<FeeBumpInnerV1>;

/** Outer transaction paying the fee of an already signed inner one */
struct FeeBumpTransaction {
  MuxedAccount feeSource;
  i64 fee = 0;
  FeeBumpInnerTx innerTx;
  TransactionExt ext;
  QUASAR_XDR_FIELDS(feeSource, fee, innerTx, ext)

  const TransactionV1Envelope &inner() const { return innerTx.as<FeeBumpInnerV1>().value; }
};

struct FeeBumpTransactionEnvelope {
  FeeBumpTransaction tx;
  DecoratedSignatures signatures;
  QUASAR_XDR_FIELDS(tx, signatures)
};

using EnvelopeV0 = XdrArm<EnvelopeType::eTxV0, TransactionV0Envelope>;
using EnvelopeV1 = XdrArm<EnvelopeType::eTx, TransactionV1Envelope>;
using EnvelopeFeeBump = XdrArm<EnvelopeType::eTxFeeBump, FeeBumpTransactionEnvelope>;

/** What gets submitted to the network: a transaction and its signatures.
 * Signatures are appended by a single writer at a time, nothing here is locked. */
struct TransactionEnvelope : XdrUnion<EnvelopeV0, EnvelopeV1, EnvelopeFeeBump> {
  using XdrUnion::XdrUnion;

  TransactionEnvelope() = default;
  /** Unsigned v1 envelope */
  explicit TransactionEnvelope(Transaction pTx) : XdrUnion(EnvelopeV1(TransactionV1Envelope{std::move(pTx), {}})) {}

  EnvelopeType type() const { return (EnvelopeType)discriminant(); }

  const DecoratedSignatures &signatures() const;
  DecoratedSignatures &signatures();

  std::string toBase64() const { return toBase64Xdr(*this); }
  /** @throw quasar_error with the decode error */
  static TransactionEnvelope fromBase64(std::string_view pText);
  static std::optional<TransactionEnvelope> fromBase64(std::string_view pText, ErrorCode &pError);
};

/** Accumulates operations then produces a transaction charging pBaseFee per operation */
class TransactionBuilder {
  MuxedAccount source;
  SequenceNumber seqNum;
  u32 baseFee = QUASAR_BASE_FEE;
  std::optional<TimeBounds> timeBounds;
  Memo memo;
  std::vector<Operation> operations;

public:
  TransactionBuilder(MuxedAccount pSource, SequenceNumber pSeqNum) : source(std::move(pSource)), seqNum(pSeqNum) {}

  TransactionBuilder &setBaseFee(u32 pBaseFee);
  TransactionBuilder &setTimeBounds(TimePoint pMinTime, TimePoint pMaxTime);
  TransactionBuilder &setMemo(Memo pMemo);
  /** @throw quasar_error eTooManyOperations past 100 */
  TransactionBuilder &addOperation(Operation pOperation);

  /** @throw quasar_error eEmptyOperations, or eAmountOverflow if the total fee doesn't fit 32 bits */
  Transaction build() const;
};

} // namespace quasar
