#include "Types.hpp"

#include <boost/endian/conversion.hpp>

using namespace quasar;

MuxedAccount::MuxedAccount(const PublicKey &pAccount) : XdrUnion(MuxedAccountEd25519Arm(pAccount.bytes())) {}

MuxedAccount::MuxedAccount(const PublicKey &pAccount, u64 pId)
    : XdrUnion(MuxedAccountMed25519Arm(MuxedAccountMed25519{pId, pAccount.bytes()})) {}

PublicKey MuxedAccount::accountId() const {
  if (const auto *lMuxed = getIf<MuxedAccountMed25519Arm>())
    return PublicKey(lMuxed->value.ed25519);
  return PublicKey(as<MuxedAccountEd25519Arm>().value);
}

std::optional<u64> MuxedAccount::muxedId() const {
  if (const auto *lMuxed = getIf<MuxedAccountMed25519Arm>())
    return lMuxed->value.id;
  return std::nullopt;
}

// strkey puts the key first and the id last, unlike the wire layout
std::string MuxedAccount::toStrKey() const {
  const auto *lMuxed = getIf<MuxedAccountMed25519Arm>();
  if (lMuxed == nullptr)
    return accountId().toStrKey();
  buff_t<40> lRaw;
  memcpy(lRaw.data(), lMuxed->value.ed25519.data(), 32);
  boost::endian::store_big_u64(lRaw.data() + 32, lMuxed->value.id);
  return encodeStrKey(VersionByte::eMuxedAccount, lRaw.view());
}

MuxedAccount MuxedAccount::fromStrKey(std::string_view pText) {
  ErrorCode lError;
  auto lResult = fromStrKey(pText, lError);
  if (!lResult)
    throw quasar_error(lError, "cannot decode muxed account");
  return *lResult;
}

std::optional<MuxedAccount> MuxedAccount::fromStrKey(std::string_view pText, ErrorCode &pError) {
  VersionByte lVersion;
  std::vector<u8> lRaw;
  if ((pError = decodeStrKey(pText, lVersion, lRaw)))
    return std::nullopt;

  u256 lKey;
  memcpy(lKey.data(), lRaw.data(), lKey.size());
  switch (lVersion) {
  case VersionByte::eAccountId:
    return MuxedAccount(PublicKey(lKey));
  case VersionByte::eMuxedAccount:
    return MuxedAccount(PublicKey(lKey), boost::endian::load_big_u64(lRaw.data() + 32));
  default:
    pError = QuasarErrorCode::eInvalidKeyVersion;
    return std::nullopt;
  }
}

SignerKey::SignerKey(const PublicKey &pKey) : XdrUnion(SignerKeyEd25519(pKey.bytes())) {}

SignerKey SignerKey::preAuthTx(const Hash &pTransactionHash) { return SignerKey(SignerKeyPreAuthTx(pTransactionHash)); }

SignerKey SignerKey::hashX(const Hash &pPreimageHash) { return SignerKey(SignerKeyHashX(pPreimageHash)); }

std::string SignerKey::toStrKey() const {
  return visit([](const auto &pArm) -> std::string {
    using Arm = std::decay_t<decltype(pArm)>;
    if constexpr (std::is_same_v<Arm, SignerKeyEd25519>)
      return encodeStrKey(VersionByte::eAccountId, pArm.value.view());
    else if constexpr (std::is_same_v<Arm, SignerKeyPreAuthTx>)
      return encodeStrKey(VersionByte::ePreAuthTx, pArm.value.view());
    else if constexpr (std::is_same_v<Arm, SignerKeyHashX>)
      return encodeStrKey(VersionByte::eSha256Hash, pArm.value.view());
    else
      return encodeStrKey(VersionByte::eSignedPayload, view(encodeXdr(pArm.value)));
  });
}

SignerKey SignerKey::fromStrKey(std::string_view pText) {
  ErrorCode lError;
  auto lResult = fromStrKey(pText, lError);
  if (!lResult)
    throw quasar_error(lError, "cannot decode signer key");
  return *lResult;
}

std::optional<SignerKey> SignerKey::fromStrKey(std::string_view pText, ErrorCode &pError) {
  VersionByte lVersion;
  std::vector<u8> lRaw;
  if ((pError = decodeStrKey(pText, lVersion, lRaw)))
    return std::nullopt;

  if (lVersion == VersionByte::eSignedPayload) {
    SignedPayloadSigner lSigner;
    if ((pError = decodeXdr(view(lRaw), lSigner)))
      return std::nullopt;
    return SignerKey(SignerKeySignedPayload(std::move(lSigner)));
  }

  u256 lKey;
  if (lRaw.size() != lKey.size()) {
    pError = QuasarErrorCode::eInvalidKeyVersion;
    return std::nullopt;
  }
  memcpy(lKey.data(), lRaw.data(), lKey.size());
  switch (lVersion) {
  case VersionByte::eAccountId:
    return SignerKey(SignerKeyEd25519(lKey));
  case VersionByte::ePreAuthTx:
    return SignerKey(SignerKeyPreAuthTx(lKey));
  case VersionByte::eSha256Hash:
    return SignerKey(SignerKeyHashX(lKey));
  default:
    pError = QuasarErrorCode::eInvalidKeyVersion;
    return std::nullopt;
  }
}

AssetType quasar::assetTypeForCode(std::string_view pCode) {
  if (pCode.empty() || pCode.size() > AssetCode12::sSize)
    throw quasar_error(QuasarErrorCode::eInvalidAssetCode, "asset code must be 1 to 12 characters");
  for (char lChar : pCode) {
    bool lAlphaNum = (lChar >= 'A' && lChar <= 'Z') || (lChar >= 'a' && lChar <= 'z') || (lChar >= '0' && lChar <= '9');
    if (!lAlphaNum)
      throw quasar_error(QuasarErrorCode::eInvalidAssetCode, "invalid asset code character");
  }
  return pCode.size() <= AssetCode4::sSize ? AssetType::eCreditAlphanum4 : AssetType::eCreditAlphanum12;
}

template <size_t TSize> static buff_t<TSize> padCode(std::string_view pCode) {
  buff_t<TSize> lResult;
  memcpy(lResult.data(), pCode.data(), pCode.size());
  return lResult;
}

template <size_t TSize> static std::string unpadCode(const buff_t<TSize> &pCode) {
  size_t lSize = 0;
  while (lSize < TSize && pCode[lSize] != 0)
    lSize++;
  return std::string((const char *)pCode.data(), lSize);
}

Asset Asset::native() { return Asset(AssetNative()); }

Asset Asset::credit(std::string_view pCode, const AccountId &pIssuer) {
  if (assetTypeForCode(pCode) == AssetType::eCreditAlphanum4)
    return Asset(AssetAlphaNum4(AlphaNum4{padCode<4>(pCode), pIssuer}));
  return Asset(AssetAlphaNum12(AlphaNum12{padCode<12>(pCode), pIssuer}));
}

std::string Asset::code() const {
  if (const auto *lAlphaNum4 = getIf<AssetAlphaNum4>())
    return unpadCode(lAlphaNum4->value.assetCode);
  if (const auto *lAlphaNum12 = getIf<AssetAlphaNum12>())
    return unpadCode(lAlphaNum12->value.assetCode);
  return std::string();
}

std::optional<AccountId> Asset::issuer() const {
  if (const auto *lAlphaNum4 = getIf<AssetAlphaNum4>())
    return lAlphaNum4->value.issuer;
  if (const auto *lAlphaNum12 = getIf<AssetAlphaNum12>())
    return lAlphaNum12->value.issuer;
  return std::nullopt;
}

AssetCode AssetCode::fromString(std::string_view pCode) {
  if (assetTypeForCode(pCode) == AssetType::eCreditAlphanum4)
    return AssetCode(AssetCodeAlphaNum4(padCode<4>(pCode)));
  return AssetCode(AssetCodeAlphaNum12(padCode<12>(pCode)));
}

Memo Memo::none() { return Memo(MemoNone()); }

Memo Memo::text(std::string_view pText) { return Memo(MemoText(XdrString<28>(std::string(pText)))); }

Memo Memo::id(u64 pId) { return Memo(MemoId(pId)); }

Memo Memo::hash(const Hash &pHash) { return Memo(MemoHash(pHash)); }

Memo Memo::returnHash(const Hash &pHash) { return Memo(MemoReturn(pHash)); }

ClaimPredicate ClaimPredicate::unconditional() { return ClaimPredicate(ClaimPredicateUnconditional()); }

ClaimPredicate ClaimPredicate::both(ClaimPredicate pLeft, ClaimPredicate pRight) {
  return ClaimPredicate(ClaimPredicateAnd(std::vector<ClaimPredicate>{std::move(pLeft), std::move(pRight)}));
}

ClaimPredicate ClaimPredicate::either(ClaimPredicate pLeft, ClaimPredicate pRight) {
  return ClaimPredicate(ClaimPredicateOr(std::vector<ClaimPredicate>{std::move(pLeft), std::move(pRight)}));
}

ClaimPredicate ClaimPredicate::negate(ClaimPredicate pPredicate) {
  return ClaimPredicate(ClaimPredicateNot(XdrBox<ClaimPredicate>(std::move(pPredicate))));
}

ClaimPredicate ClaimPredicate::beforeAbsoluteTime(i64 pUnixTime) {
  return ClaimPredicate(ClaimPredicateBeforeAbsoluteTime(pUnixTime));
}

ClaimPredicate ClaimPredicate::beforeRelativeTime(i64 pSeconds) {
  return ClaimPredicate(ClaimPredicateBeforeRelativeTime(pSeconds));
}

ErrorCode ClaimPredicate::read(XdrReader &pIn) {
  QUASAR_TRY(pIn.enter());
  auto lError = XdrUnion::read(pIn);
  pIn.leave();
  return lError;
}

ClaimableBalanceId ClaimableBalanceId::fromBinary(const cbuff_view_t &pBytes) {
  ClaimableBalanceId lResult;
  if (auto lError = decodeXdr(pBytes, lResult))
    throw quasar_error(QuasarErrorCode::eInvalidBalanceId, lError.message());
  return lResult;
}

ClaimableBalanceId ClaimableBalanceId::fromHex(std::string_view pHex) {
  buff_t<4 + 32> lBinary;
  if (!parseHex(lBinary.view(), pHex))
    throw quasar_error(QuasarErrorCode::eInvalidBalanceId, "expected 72 hex digits");
  return fromBinary(lBinary.view());
}

std::string ClaimableBalanceId::toHex() const { return quasar::toHex(view(encodeXdr(*this))); }
