#pragma once

#include "Network.hpp"
#include "Transaction.hpp"

namespace quasar {

/** What the signers of a transaction sign:
 * SHA-256(network id || envelope type || XDR(transaction)) */
Hash signaturePayload(const Network &pNetwork, const Transaction &pTx);
Hash signaturePayload(const Network &pNetwork, const FeeBumpTransaction &pTx);

/** Payload of whatever transaction the envelope carries, v0 ones are hashed in their v1 layout */
Hash transactionHash(const Network &pNetwork, const TransactionEnvelope &pEnvelope);

/** @throw quasar_error eEmptyOperations for a transaction without operations */
DecoratedSignature signTransaction(const Transaction &pTx, const Network &pNetwork, const SecretKey &pKey);
/** @throw quasar_error eCannotSign for a verify-only keypair */
DecoratedSignature signTransaction(const Transaction &pTx, const Network &pNetwork, const Keypair &pKeypair);

/** Signature for a hash-x signer: the preimage itself, hinted by its hash
 * @throw quasar_error eExceedsMaximumLength above 64 bytes */
DecoratedSignature signHashX(const cbuff_view_t &pPreimage);

/** Appends without looking for duplicates. Callers serialize access to an envelope.
 * @throw quasar_error eTooManySignatures once 20 signatures are attached */
void addSignature(TransactionEnvelope &pEnvelope, DecoratedSignature pSignature);

/** @throw quasar_error eEmptyOperations or eTooManySignatures */
void sign(TransactionEnvelope &pEnvelope, const Network &pNetwork, const SecretKey &pKey);
void sign(TransactionEnvelope &pEnvelope, const Network &pNetwork, const Keypair &pKeypair);

/** Keys among pCandidates with at least one valid signature on the envelope.
 * Hints only narrow the candidates: every candidate whose hint matches is verified. */
std::vector<PublicKey> verifySigners(const TransactionEnvelope &pEnvelope, const Network &pNetwork,
                                     const std::vector<PublicKey> &pCandidates);

/** Signer weights of an account as the ledger knows them, fetched by the caller */
struct AccountThresholds {
  struct Weighted {
    PublicKey key;
    u32 weight = 0;
  };

  std::vector<Weighted> signers;
  u32 threshold = 0;

  /** Sum of the weights of signers found in pVerified, each counted once */
  u64 weightOf(const std::vector<PublicKey> &pVerified) const;
  bool isSatisfiedBy(const std::vector<PublicKey> &pVerified) const { return weightOf(pVerified) >= threshold; }
  bool isSatisfiedBy(const TransactionEnvelope &pEnvelope, const Network &pNetwork) const;
};

/** Fee bump around a v0 or v1 envelope, whose signatures stay valid
 * @throw quasar_error eCannotWrapFeeBump if pInner already is a fee bump */
TransactionEnvelope wrapFeeBump(const TransactionEnvelope &pInner, const MuxedAccount &pFeeSource, i64 pFee);

} // namespace quasar
