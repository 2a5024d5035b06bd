#include "Operations.hpp"

#include <limits>

using namespace quasar;

const char *quasar::operationName(OperationType pType) {
  switch (pType) {
  case OperationType::eCreateAccount:
    return "create_account";
  case OperationType::ePayment:
    return "payment";
  case OperationType::ePathPaymentStrictReceive:
    return "path_payment_strict_receive";
  case OperationType::eManageSellOffer:
    return "manage_sell_offer";
  case OperationType::eCreatePassiveSellOffer:
    return "create_passive_sell_offer";
  case OperationType::eSetOptions:
    return "set_options";
  case OperationType::eChangeTrust:
    return "change_trust";
  case OperationType::eAllowTrust:
    return "allow_trust";
  case OperationType::eAccountMerge:
    return "account_merge";
  case OperationType::eInflation:
    return "inflation";
  case OperationType::eManageData:
    return "manage_data";
  case OperationType::eBumpSequence:
    return "bump_sequence";
  case OperationType::eManageBuyOffer:
    return "manage_buy_offer";
  case OperationType::ePathPaymentStrictSend:
    return "path_payment_strict_send";
  case OperationType::eCreateClaimableBalance:
    return "create_claimable_balance";
  case OperationType::eClaimClaimableBalance:
    return "claim_claimable_balance";
  case OperationType::eBeginSponsoringFutureReserves:
    return "begin_sponsoring_future_reserves";
  case OperationType::eEndSponsoringFutureReserves:
    return "end_sponsoring_future_reserves";
  case OperationType::eRevokeSponsorship:
    return "revoke_sponsorship";
  case OperationType::eClawback:
    return "clawback";
  case OperationType::eClawbackClaimableBalance:
    return "clawback_claimable_balance";
  case OperationType::eSetTrustLineFlags:
    return "set_trust_line_flags";
  }
  return "unknown";
}

static Operation makeOperation(OperationBody pBody) {
  Operation lResult;
  lResult.body = std::move(pBody);
  return lResult;
}

Operation Operation::createAccount(const AccountId &pDestination, i64 pStartingBalance) {
  return makeOperation(CreateAccount(CreateAccountOp{pDestination, pStartingBalance}));
}

Operation Operation::payment(const MuxedAccount &pDestination, const Asset &pAsset, i64 pAmount) {
  return makeOperation(Payment(PaymentOp{pDestination, pAsset, pAmount}));
}

Operation Operation::changeTrust(const Asset &pLine, i64 pLimit) {
  return makeOperation(ChangeTrust(ChangeTrustOp{pLine, pLimit}));
}

Operation Operation::accountMerge(const MuxedAccount &pDestination) {
  return makeOperation(AccountMerge(pDestination));
}

Operation Operation::manageData(std::string_view pName, const std::optional<std::vector<u8>> &pValue) {
  ManageDataOp lOp;
  lOp.dataName = String64(std::string(pName));
  if (pValue)
    lOp.dataValue = DataValue(*pValue);
  return makeOperation(ManageData(std::move(lOp)));
}

Operation Operation::bumpSequence(SequenceNumber pBumpTo) {
  return makeOperation(BumpSequence(BumpSequenceOp{pBumpTo}));
}

// Weights and thresholds are single bytes on the ledger
static void checkWeight(const char *pName, const std::optional<u32> &pWeight) {
  if (pWeight && *pWeight > std::numeric_limits<u8>::max())
    throw quasar_error(QuasarErrorCode::eInvalidSignerWeight,
                       std::string(pName) + " is " + std::to_string(*pWeight) + ", allowed 255");
}

Operation Operation::setOptions(SetOptionsOp pOptions) {
  checkWeight("masterWeight", pOptions.masterWeight);
  checkWeight("lowThreshold", pOptions.lowThreshold);
  checkWeight("medThreshold", pOptions.medThreshold);
  checkWeight("highThreshold", pOptions.highThreshold);
  if (pOptions.signer)
    checkWeight("signer weight", pOptions.signer->weight);
  return makeOperation(SetOptions(std::move(pOptions)));
}

Operation Operation::beginSponsoringFutureReserves(const AccountId &pSponsored) {
  return makeOperation(BeginSponsoringFutureReserves(BeginSponsoringFutureReservesOp{pSponsored}));
}

Operation Operation::endSponsoringFutureReserves() { return makeOperation(EndSponsoringFutureReserves()); }

Operation Operation::claimClaimableBalance(const ClaimableBalanceId &pBalanceId) {
  return makeOperation(ClaimClaimableBalance(ClaimClaimableBalanceOp{pBalanceId}));
}
