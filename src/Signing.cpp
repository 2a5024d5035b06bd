#include <algorithm>

#include "Signing.hpp"

namespace quasar {

struct DecoratedSignatureFactory {
  static DecoratedSignature make(const SignatureHint &pHint, const cbuff_view_t &pSignature) {
    return DecoratedSignature(pHint, XdrBytes<64>(pSignature));
  }
};

} // namespace quasar

using namespace quasar;

constexpr bool sDebugSignatures = false;

template <typename T> static Hash payloadOf(const Network &pNetwork, EnvelopeType pType, const T &pTx) {
  std::vector<u8> lPayload;
  XdrWriter lOut(lPayload);
  lOut.put(pNetwork.id());
  lOut.putI32((i32)pType);
  lOut.put(pTx);
  return sha256(view(lPayload));
}

Hash quasar::signaturePayload(const Network &pNetwork, const Transaction &pTx) {
  return payloadOf(pNetwork, EnvelopeType::eTx, pTx);
}

Hash quasar::signaturePayload(const Network &pNetwork, const FeeBumpTransaction &pTx) {
  return payloadOf(pNetwork, EnvelopeType::eTxFeeBump, pTx);
}

Hash quasar::transactionHash(const Network &pNetwork, const TransactionEnvelope &pEnvelope) {
  if (const auto *lV0 = pEnvelope.getIf<EnvelopeV0>())
    return signaturePayload(pNetwork, lV0->value.tx.toV1());
  if (const auto *lV1 = pEnvelope.getIf<EnvelopeV1>())
    return signaturePayload(pNetwork, lV1->value.tx);
  return signaturePayload(pNetwork, pEnvelope.as<EnvelopeFeeBump>().value.tx);
}

static DecoratedSignature signPayload(const Hash &pPayload, const SecretKey &pKey) {
  auto lSignature = pKey.sign(pPayload.view());
  if constexpr (sDebugSignatures)
    std::cout << "[SIG] " << pKey.publicKey() << " signed " << pPayload << std::endl;
  return DecoratedSignatureFactory::make(pKey.publicKey().hint(), lSignature.view());
}

static const SecretKey &signingKeyOf(const Keypair &pKeypair) {
  const auto *lSecret = std::get_if<SecretKey>(&pKeypair);
  if (lSecret == nullptr)
    throw quasar_error(QuasarErrorCode::eCannotSign, std::get<PublicKey>(pKeypair).toStrKey() + " is verify-only");
  return *lSecret;
}

// A default constructed transaction decodes fine but the network would never accept it
static void requireOperations(size_t pCount) {
  if (pCount == 0)
    throw quasar_error(QuasarErrorCode::eEmptyOperations, "refusing to sign a transaction without operations");
}

static size_t operationCount(const TransactionEnvelope &pEnvelope) {
  if (const auto *lV0 = pEnvelope.getIf<EnvelopeV0>())
    return lV0->value.tx.operations.size();
  if (const auto *lV1 = pEnvelope.getIf<EnvelopeV1>())
    return lV1->value.tx.operations().size();
  return pEnvelope.as<EnvelopeFeeBump>().value.tx.inner().tx.operations().size();
}

DecoratedSignature quasar::signTransaction(const Transaction &pTx, const Network &pNetwork, const SecretKey &pKey) {
  requireOperations(pTx.operations().size());
  return signPayload(signaturePayload(pNetwork, pTx), pKey);
}

DecoratedSignature quasar::signTransaction(const Transaction &pTx, const Network &pNetwork, const Keypair &pKeypair) {
  return signTransaction(pTx, pNetwork, signingKeyOf(pKeypair));
}

DecoratedSignature quasar::signHashX(const cbuff_view_t &pPreimage) {
  auto lHash = sha256(pPreimage);
  SignatureHint lHint;
  memcpy(lHint.data(), lHash.data() + lHash.size() - lHint.size(), lHint.size());
  return DecoratedSignatureFactory::make(lHint, pPreimage);
}

void quasar::addSignature(TransactionEnvelope &pEnvelope, DecoratedSignature pSignature) {
  auto &lSignatures = pEnvelope.signatures();
  if (lSignatures.full())
    throw quasar_error(QuasarErrorCode::eTooManySignatures,
                       "envelope already holds " + std::to_string(lSignatures.size()) + " signatures");
  lSignatures.push_back(std::move(pSignature));
}

void quasar::sign(TransactionEnvelope &pEnvelope, const Network &pNetwork, const SecretKey &pKey) {
  requireOperations(operationCount(pEnvelope));
  addSignature(pEnvelope, signPayload(transactionHash(pNetwork, pEnvelope), pKey));
}

void quasar::sign(TransactionEnvelope &pEnvelope, const Network &pNetwork, const Keypair &pKeypair) {
  sign(pEnvelope, pNetwork, signingKeyOf(pKeypair));
}

std::vector<PublicKey> quasar::verifySigners(const TransactionEnvelope &pEnvelope, const Network &pNetwork,
                                             const std::vector<PublicKey> &pCandidates) {
  const auto lPayload = transactionHash(pNetwork, pEnvelope);
  std::vector<PublicKey> lVerified;

  for (const auto &lSignature : pEnvelope.signatures()) {
    // hash-x preimages share the list, they are never ed25519 signatures of the right size
    if (lSignature.signature().size() != Signature::sSize)
      continue;

    for (const auto &lCandidate : pCandidates) {
      if (lCandidate.hint() != lSignature.hint())
        continue;
      bool lValid = lCandidate.verify(lPayload.view(), lSignature.signature().view());
      if constexpr (sDebugSignatures)
        std::cout << "[SIG] hint " << lSignature.hint() << " candidate " << lCandidate << (lValid ? " ok" : " no")
                  << std::endl;
      if (lValid && std::find(lVerified.begin(), lVerified.end(), lCandidate) == lVerified.end())
        lVerified.push_back(lCandidate);
    }
  }
  return lVerified;
}

u64 AccountThresholds::weightOf(const std::vector<PublicKey> &pVerified) const {
  u64 lWeight = 0;
  for (const auto &lSigner : signers) {
    if (std::find(pVerified.begin(), pVerified.end(), lSigner.key) != pVerified.end())
      lWeight += lSigner.weight;
  }
  return lWeight;
}

bool AccountThresholds::isSatisfiedBy(const TransactionEnvelope &pEnvelope, const Network &pNetwork) const {
  std::vector<PublicKey> lCandidates;
  lCandidates.reserve(signers.size());
  for (const auto &lSigner : signers)
    lCandidates.push_back(lSigner.key);
  return isSatisfiedBy(verifySigners(pEnvelope, pNetwork, lCandidates));
}

TransactionEnvelope quasar::wrapFeeBump(const TransactionEnvelope &pInner, const MuxedAccount &pFeeSource, i64 pFee) {
  TransactionV1Envelope lInner;
  if (const auto *lV0 = pInner.getIf<EnvelopeV0>())
    lInner = TransactionV1Envelope{lV0->value.tx.toV1(), lV0->value.signatures};
  else if (const auto *lV1 = pInner.getIf<EnvelopeV1>())
    lInner = lV1->value;
  else
    throw quasar_error(QuasarErrorCode::eCannotWrapFeeBump);

  FeeBumpTransaction lTx;
  lTx.feeSource = pFeeSource;
  lTx.fee = pFee;
  lTx.innerTx = FeeBumpInnerV1(std::move(lInner));
  return TransactionEnvelope(EnvelopeFeeBump(FeeBumpTransactionEnvelope{std::move(lTx), {}}));
}
