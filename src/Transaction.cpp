#include "Transaction.hpp"

using namespace quasar;

Transaction::Transaction(MuxedAccount pSource, u32 pFee, SequenceNumber pSeqNum, std::vector<Operation> pOperations,
                         Memo pMemo, std::optional<TimeBounds> pTimeBounds)
    : sourceAccount(std::move(pSource)), fee(pFee), seqNum(pSeqNum), timeBounds(std::move(pTimeBounds)),
      memo(std::move(pMemo)) {
  if (pOperations.empty())
    throw quasar_error(QuasarErrorCode::eEmptyOperations);
  if (pOperations.size() > Operations::sMax)
    throw quasar_error(QuasarErrorCode::eTooManyOperations, std::to_string(pOperations.size()) + " operations");
  operations_ = Operations(std::move(pOperations));
}

void Transaction::appendOperation(Operation pOperation) {
  if (operations_.full())
    throw quasar_error(QuasarErrorCode::eTooManyOperations);
  operations_.push_back(std::move(pOperation));
}

Transaction TransactionV0::toV1() const {
  Transaction lResult;
  lResult.sourceAccount = MuxedAccount(PublicKey(sourceAccountEd25519));
  lResult.fee = fee;
  lResult.seqNum = seqNum;
  lResult.timeBounds = timeBounds;
  lResult.memo = memo;
  lResult.operations_ = operations;
  lResult.ext = ext;
  return lResult;
}

const DecoratedSignatures &TransactionEnvelope::signatures() const {
  return visit([](const auto &pArm) -> const DecoratedSignatures & { return pArm.value.signatures; });
}

DecoratedSignatures &TransactionEnvelope::signatures() {
  if (auto *lV0 = getIf<EnvelopeV0>())
    return lV0->value.signatures;
  if (auto *lV1 = getIf<EnvelopeV1>())
    return lV1->value.signatures;
  return as<EnvelopeFeeBump>().value.signatures;
}

TransactionEnvelope TransactionEnvelope::fromBase64(std::string_view pText) {
  ErrorCode lError;
  auto lResult = fromBase64(pText, lError);
  if (!lResult)
    throw quasar_error(lError, "cannot decode transaction envelope");
  return std::move(*lResult);
}

std::optional<TransactionEnvelope> TransactionEnvelope::fromBase64(std::string_view pText, ErrorCode &pError) {
  TransactionEnvelope lResult;
  if ((pError = fromBase64Xdr(pText, lResult)))
    return std::nullopt;
  return lResult;
}

TransactionBuilder &TransactionBuilder::setBaseFee(u32 pBaseFee) {
  baseFee = pBaseFee;
  return *this;
}

TransactionBuilder &TransactionBuilder::setTimeBounds(TimePoint pMinTime, TimePoint pMaxTime) {
  timeBounds = TimeBounds{pMinTime, pMaxTime};
  return *this;
}

TransactionBuilder &TransactionBuilder::setMemo(Memo pMemo) {
  memo = std::move(pMemo);
  return *this;
}

TransactionBuilder &TransactionBuilder::addOperation(Operation pOperation) {
  if (operations.size() >= Operations::sMax)
    throw quasar_error(QuasarErrorCode::eTooManyOperations);
  operations.push_back(std::move(pOperation));
  return *this;
}

Transaction TransactionBuilder::build() const {
  u64 lFee = (u64)baseFee * operations.size();
  if (lFee > 0xFFFFFFFFu)
    throw quasar_error(QuasarErrorCode::eAmountOverflow, "fee of " + std::to_string(lFee) + " stroops");
  return Transaction(source, (u32)lFee, seqNum, operations, memo, timeBounds);
}
