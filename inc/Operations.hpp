#pragma once

#include "Types.hpp"

namespace quasar {

enum class OperationType : i32 {
  eCreateAccount = 0,
  ePayment = 1,
  ePathPaymentStrictReceive = 2,
  eManageSellOffer = 3,
  eCreatePassiveSellOffer = 4,
  eSetOptions = 5,
  eChangeTrust = 6,
  eAllowTrust = 7,
  eAccountMerge = 8,
  eInflation = 9,
  eManageData = 10,
  eBumpSequence = 11,
  eManageBuyOffer = 12,
  ePathPaymentStrictSend = 13,
  eCreateClaimableBalance = 14,
  eClaimClaimableBalance = 15,
  eBeginSponsoringFutureReserves = 16,
  eEndSponsoringFutureReserves = 17,
  eRevokeSponsorship = 18,
  eClawback = 19,
  eClawbackClaimableBalance = 20,
  eSetTrustLineFlags = 21,
};

struct CreateAccountOp {
  AccountId destination;
  i64 startingBalance = 0;
  QUASAR_XDR_FIELDS(destination, startingBalance)
};

struct PaymentOp {
  MuxedAccount destination;
  Asset asset;
  i64 amount = 0;
  QUASAR_XDR_FIELDS(destination, asset, amount)
};

struct PathPaymentStrictReceiveOp {
  Asset sendAsset;
  i64 sendMax = 0;
  MuxedAccount destination;
  Asset destAsset;
  i64 destAmount = 0;
  XdrArray<Asset, 5> path;
  QUASAR_XDR_FIELDS(sendAsset, sendMax, destination, destAsset, destAmount, path)
};

struct PathPaymentStrictSendOp {
  Asset sendAsset;
  i64 sendAmount = 0;
  MuxedAccount destination;
  Asset destAsset;
  i64 destMin = 0;
  XdrArray<Asset, 5> path;
  QUASAR_XDR_FIELDS(sendAsset, sendAmount, destination, destAsset, destMin, path)
};

/** offerId 0 creates a new offer, amount 0 deletes offerId */
struct ManageSellOfferOp {
  Asset selling;
  Asset buying;
  i64 amount = 0;
  Price price;
  i64 offerId = 0;
  QUASAR_XDR_FIELDS(selling, buying, amount, price, offerId)
};

struct ManageBuyOfferOp {
  Asset selling;
  Asset buying;
  i64 buyAmount = 0;
  Price price;
  i64 offerId = 0;
  QUASAR_XDR_FIELDS(selling, buying, buyAmount, price, offerId)
};

struct CreatePassiveSellOfferOp {
  Asset selling;
  Asset buying;
  i64 amount = 0;
  Price price;
  QUASAR_XDR_FIELDS(selling, buying, amount, price)
};

/** Every field is optional, absent ones leave the account untouched */
struct SetOptionsOp {
  std::optional<AccountId> inflationDest;
  std::optional<u32> clearFlags;
  std::optional<u32> setFlags;
  std::optional<u32> masterWeight;
  std::optional<u32> lowThreshold;
  std::optional<u32> medThreshold;
  std::optional<u32> highThreshold;
  std::optional<String32> homeDomain;
  std::optional<Signer> signer; // weight 0 removes the signer
  QUASAR_XDR_FIELDS(inflationDest, clearFlags, setFlags, masterWeight, lowThreshold, medThreshold, highThreshold,
                    homeDomain, signer)
};

struct ChangeTrustOp {
  Asset line;
  i64 limit = 0; // 0 removes the trust line
  QUASAR_XDR_FIELDS(line, limit)
};

struct AllowTrustOp {
  AccountId trustor;
  AssetCode asset;
  u32 authorize = 0;
  QUASAR_XDR_FIELDS(trustor, asset, authorize)
};

struct ManageDataOp {
  String64 dataName;
  std::optional<DataValue> dataValue; // absent deletes the entry
  QUASAR_XDR_FIELDS(dataName, dataValue)
};

struct BumpSequenceOp {
  SequenceNumber bumpTo = 0;
  QUASAR_XDR_FIELDS(bumpTo)
};

struct CreateClaimableBalanceOp {
  Asset asset;
  i64 amount = 0;
  XdrArray<Claimant, 10> claimants;
  QUASAR_XDR_FIELDS(asset, amount, claimants)
};

struct ClaimClaimableBalanceOp {
  ClaimableBalanceId balanceId;
  QUASAR_XDR_FIELDS(balanceId)
};

struct BeginSponsoringFutureReservesOp {
  AccountId sponsoredId;
  QUASAR_XDR_FIELDS(sponsoredId)
};

enum class RevokeSponsorshipType : i32 {
  eLedgerEntry = 0,
  eSigner = 1,
};

struct RevokeSponsorshipSigner {
  AccountId accountId;
  SignerKey signerKey;
  QUASAR_XDR_FIELDS(accountId, signerKey)
};

using RevokeSponsorshipOp = XdrUnion<XdrArm<RevokeSponsorshipType::eLedgerEntry, LedgerKey>,
                                     XdrArm<RevokeSponsorshipType::eSigner, RevokeSponsorshipSigner>>;

struct ClawbackOp {
  Asset asset;
  MuxedAccount from;
  i64 amount = 0;
  QUASAR_XDR_FIELDS(asset, from, amount)
};

struct ClawbackClaimableBalanceOp {
  ClaimableBalanceId balanceId;
  QUASAR_XDR_FIELDS(balanceId)
};

struct SetTrustLineFlagsOp {
  AccountId trustor;
  Asset asset;
  u32 clearFlags = 0;
  u32 setFlags = 0;
  QUASAR_XDR_FIELDS(trustor, asset, clearFlags, setFlags)
};

using CreateAccount = XdrArm<OperationType::eCreateAccount, CreateAccountOp>;
using Payment = XdrArm<OperationType::ePayment, PaymentOp>;
using PathPaymentStrictReceive = XdrArm<OperationType::ePathPaymentStrictReceive, PathPaymentStrictReceiveOp>;
using ManageSellOffer = XdrArm<OperationType::eManageSellOffer, ManageSellOfferOp>;
using CreatePassiveSellOffer = XdrArm<OperationType::eCreatePassiveSellOffer, CreatePassiveSellOfferOp>;
using SetOptions = XdrArm<OperationType::eSetOptions, SetOptionsOp>;
using ChangeTrust = XdrArm<OperationType::eChangeTrust, ChangeTrustOp>;
using AllowTrust = XdrArm<OperationType::eAllowTrust, AllowTrustOp>;
using AccountMerge = XdrArm<OperationType::eAccountMerge, MuxedAccount>;
using Inflation = XdrVoidArm<OperationType::eInflation>;
using ManageData = XdrArm<OperationType::eManageData, ManageDataOp>;
using BumpSequence = XdrArm<OperationType::eBumpSequence, BumpSequenceOp>;
using ManageBuyOffer = XdrArm<OperationType::eManageBuyOffer, ManageBuyOfferOp>;
using PathPaymentStrictSend = XdrArm<OperationType::ePathPaymentStrictSend, PathPaymentStrictSendOp>;
using CreateClaimableBalance = XdrArm<OperationType::eCreateClaimableBalance, CreateClaimableBalanceOp>;
using ClaimClaimableBalance = XdrArm<OperationType::eClaimClaimableBalance, ClaimClaimableBalanceOp>;
using BeginSponsoringFutureReserves =
    XdrArm<OperationType::eBeginSponsoringFutureReserves, BeginSponsoringFutureReservesOp>;
using EndSponsoringFutureReserves = XdrVoidArm<OperationType::eEndSponsoringFutureReserves>;
using RevokeSponsorship = XdrArm<OperationType::eRevokeSponsorship, RevokeSponsorshipOp>;
using Clawback = XdrArm<OperationType::eClawback, ClawbackOp>;
using ClawbackClaimableBalance = XdrArm<OperationType::eClawbackClaimableBalance, ClawbackClaimableBalanceOp>;
using SetTrustLineFlags = XdrArm<OperationType::eSetTrustLineFlags, SetTrustLineFlagsOp>;

using OperationBody =
    XdrUnion<CreateAccount, Payment, PathPaymentStrictReceive, ManageSellOffer, CreatePassiveSellOffer, SetOptions,
             ChangeTrust, AllowTrust, AccountMerge, Inflation, ManageData, BumpSequence, ManageBuyOffer,
             PathPaymentStrictSend, CreateClaimableBalance, ClaimClaimableBalance, BeginSponsoringFutureReserves,
             EndSponsoringFutureReserves, RevokeSponsorship, Clawback, ClawbackClaimableBalance, SetTrustLineFlags>;

const char *operationName(OperationType pType);

struct Operation {
  std::optional<MuxedAccount> sourceAccount; // defaults to the transaction source
  OperationBody body;
  QUASAR_XDR_FIELDS(sourceAccount, body)

  OperationType type() const { return (OperationType)body.discriminant(); }

  static Operation createAccount(const AccountId &pDestination, i64 pStartingBalance);
  static Operation payment(const MuxedAccount &pDestination, const Asset &pAsset, i64 pAmount);
  static Operation changeTrust(const Asset &pLine, i64 pLimit);
  static Operation accountMerge(const MuxedAccount &pDestination);
  /** Absent value deletes the entry
   * @throw quasar_error eExceedsMaximumLength for a name above 64 or a value above 64 bytes */
  static Operation manageData(std::string_view pName, const std::optional<std::vector<u8>> &pValue);
  static Operation bumpSequence(SequenceNumber pBumpTo);
  /** @throw quasar_error eInvalidSignerWeight when a weight or threshold exceeds 255 */
  static Operation setOptions(SetOptionsOp pOptions);
  static Operation beginSponsoringFutureReserves(const AccountId &pSponsored);
  static Operation endSponsoringFutureReserves();
  static Operation claimClaimableBalance(const ClaimableBalanceId &pBalanceId);

  /** Runs on behalf of another account than the transaction source */
  Operation &withSource(const MuxedAccount &pSource) {
    sourceAccount = pSource;
    return *this;
  }
};

} // namespace quasar
