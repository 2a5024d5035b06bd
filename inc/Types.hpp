#pragma once

#include "Keys.hpp"
#include "Xdr.hpp"

namespace quasar {

using Hash = u256;
using SequenceNumber = i64;
using TimePoint = u64;
using String32 = XdrString<32>;
using String64 = XdrString<64>;
using DataValue = XdrBytes<64>;

enum class CryptoKeyType : i32 {
  eEd25519 = 0,
  ePreAuthTx = 1,
  eHashX = 2,
  eEd25519SignedPayload = 3,
  eMuxedEd25519 = 0x100,
};

enum class SignerKeyType : i32 {
  eEd25519 = 0,
  ePreAuthTx = 1,
  eHashX = 2,
  eEd25519SignedPayload = 3,
};

enum class AssetType : i32 {
  eNative = 0,
  eCreditAlphanum4 = 1,
  eCreditAlphanum12 = 2,
};

enum class MemoType : i32 {
  eNone = 0,
  eText = 1,
  eId = 2,
  eHash = 3,
  eReturn = 4,
};

enum class ClaimPredicateType : i32 {
  eUnconditional = 0,
  eAnd = 1,
  eOr = 2,
  eNot = 3,
  eBeforeAbsoluteTime = 4,
  eBeforeRelativeTime = 5,
};

enum class ClaimantType : i32 { eV0 = 0 };
enum class ClaimableBalanceIdType : i32 { eV0 = 0 };

enum class LedgerEntryType : i32 {
  eAccount = 0,
  eTrustline = 1,
  eOffer = 2,
  eData = 3,
  eClaimableBalance = 4,
};

struct MuxedAccountMed25519 {
  u64 id = 0;
  u256 ed25519;
  QUASAR_XDR_FIELDS(id, ed25519)
};

using MuxedAccountEd25519Arm = XdrArm<CryptoKeyType::eEd25519, u256>;
using MuxedAccountMed25519Arm = XdrArm<CryptoKeyType::eMuxedEd25519, MuxedAccountMed25519>;

/** Account reference that may carry a 64-bit sub-account id, textual forms "G..." and "M..." */
struct MuxedAccount : XdrUnion<MuxedAccountEd25519Arm, MuxedAccountMed25519Arm> {
  using XdrUnion::XdrUnion;

  MuxedAccount() = default;
  MuxedAccount(const PublicKey &pAccount);
  MuxedAccount(const PublicKey &pAccount, u64 pId);

  PublicKey accountId() const;
  std::optional<u64> muxedId() const;

  std::string toStrKey() const;
  /** Accepts both "G..." and "M..." */
  static MuxedAccount fromStrKey(std::string_view pText);
  static std::optional<MuxedAccount> fromStrKey(std::string_view pText, ErrorCode &pError);
};

struct SignedPayloadSigner {
  u256 ed25519;
  XdrBytes<64> payload;
  QUASAR_XDR_FIELDS(ed25519, payload)
};

using SignerKeyEd25519 = XdrArm<SignerKeyType::eEd25519, u256>;
using SignerKeyPreAuthTx = XdrArm<SignerKeyType::ePreAuthTx, u256>;
using SignerKeyHashX = XdrArm<SignerKeyType::eHashX, u256>;
using SignerKeySignedPayload = XdrArm<SignerKeyType::eEd25519SignedPayload, SignedPayloadSigner>;

/** Key authorized to sign for an account, textual forms "G...", "T...", "X..." and "P..." */
struct SignerKey : XdrUnion<SignerKeyEd25519, SignerKeyPreAuthTx, SignerKeyHashX, SignerKeySignedPayload> {
  using XdrUnion::XdrUnion;

  SignerKey() = default;
  SignerKey(const PublicKey &pKey);

  static SignerKey preAuthTx(const Hash &pTransactionHash);
  static SignerKey hashX(const Hash &pPreimageHash);

  std::string toStrKey() const;
  static SignerKey fromStrKey(std::string_view pText);
  static std::optional<SignerKey> fromStrKey(std::string_view pText, ErrorCode &pError);
};

struct Signer {
  SignerKey key;
  u32 weight = 0;
  QUASAR_XDR_FIELDS(key, weight)
};

using AssetCode4 = buff_t<4>;
using AssetCode12 = buff_t<12>;

struct AlphaNum4 {
  AssetCode4 assetCode;
  AccountId issuer;
  QUASAR_XDR_FIELDS(assetCode, issuer)
};

struct AlphaNum12 {
  AssetCode12 assetCode;
  AccountId issuer;
  QUASAR_XDR_FIELDS(assetCode, issuer)
};

using AssetNative = XdrVoidArm<AssetType::eNative>;
using AssetAlphaNum4 = XdrArm<AssetType::eCreditAlphanum4, AlphaNum4>;
using AssetAlphaNum12 = XdrArm<AssetType::eCreditAlphanum12, AlphaNum12>;

struct Asset : XdrUnion<AssetNative, AssetAlphaNum4, AssetAlphaNum12> {
  using XdrUnion::XdrUnion;

  Asset() = default;

  static Asset native();
  /** Picks alphanum4 or alphanum12 from the code length
   * @throw quasar_error eInvalidAssetCode unless the code is 1 to 12 characters of [A-Za-z0-9] */
  static Asset credit(std::string_view pCode, const AccountId &pIssuer);

  bool isNative() const { return is<AssetNative>(); }
  /** Code without its zero padding, empty for the native asset */
  std::string code() const;
  std::optional<AccountId> issuer() const;
};

using AssetCodeAlphaNum4 = XdrArm<AssetType::eCreditAlphanum4, AssetCode4>;
using AssetCodeAlphaNum12 = XdrArm<AssetType::eCreditAlphanum12, AssetCode12>;

/** Issuer-less asset code, as used by allow trust */
struct AssetCode : XdrUnion<AssetCodeAlphaNum4, AssetCodeAlphaNum12> {
  using XdrUnion::XdrUnion;

  AssetCode() = default;
  static AssetCode fromString(std::string_view pCode);
};

/** @throw quasar_error eInvalidAssetCode, otherwise the alphanum variant the code fits in */
AssetType assetTypeForCode(std::string_view pCode);

struct Price {
  i32 n = 0;
  i32 d = 1;
  QUASAR_XDR_FIELDS(n, d)

  /** Closest fraction to a decimal string such as "1.25", without floating point
   * @throw quasar_error eInvalidPrice or eNotApproximableAsFraction */
  static Price fromString(std::string_view pText);
};

using MemoNone = XdrVoidArm<MemoType::eNone>;
using MemoText = XdrArm<MemoType::eText, XdrString<28>>;
using MemoId = XdrArm<MemoType::eId, u64>;
using MemoHash = XdrArm<MemoType::eHash, Hash>;
using MemoReturn = XdrArm<MemoType::eReturn, Hash>;

struct Memo : XdrUnion<MemoNone, MemoText, MemoId, MemoHash, MemoReturn> {
  using XdrUnion::XdrUnion;

  Memo() = default;

  static Memo none();
  /** @throw quasar_error eExceedsMaximumLength above 28 bytes */
  static Memo text(std::string_view pText);
  static Memo id(u64 pId);
  static Memo hash(const Hash &pHash);
  static Memo returnHash(const Hash &pHash);
};

/** Validity window, 0 leaves a side unbounded */
struct TimeBounds {
  TimePoint minTime = 0;
  TimePoint maxTime = 0;
  QUASAR_XDR_FIELDS(minTime, maxTime)
};

struct ClaimPredicate;

using ClaimPredicateUnconditional = XdrVoidArm<ClaimPredicateType::eUnconditional>;
using ClaimPredicateAnd = XdrArm<ClaimPredicateType::eAnd, XdrArray<ClaimPredicate, 2>>;
using ClaimPredicateOr = XdrArm<ClaimPredicateType::eOr, XdrArray<ClaimPredicate, 2>>;
using ClaimPredicateNot = XdrArm<ClaimPredicateType::eNot, XdrBox<ClaimPredicate>>;
using ClaimPredicateBeforeAbsoluteTime = XdrArm<ClaimPredicateType::eBeforeAbsoluteTime, i64>;
using ClaimPredicateBeforeRelativeTime = XdrArm<ClaimPredicateType::eBeforeRelativeTime, i64>;

struct ClaimPredicate
    : XdrUnion<ClaimPredicateUnconditional, ClaimPredicateAnd, ClaimPredicateOr, ClaimPredicateNot,
               ClaimPredicateBeforeAbsoluteTime, ClaimPredicateBeforeRelativeTime> {
  using XdrUnion::XdrUnion;

  ClaimPredicate() = default;

  static ClaimPredicate unconditional();
  static ClaimPredicate both(ClaimPredicate pLeft, ClaimPredicate pRight);
  static ClaimPredicate either(ClaimPredicate pLeft, ClaimPredicate pRight);
  static ClaimPredicate negate(ClaimPredicate pPredicate);
  static ClaimPredicate beforeAbsoluteTime(i64 pUnixTime);
  static ClaimPredicate beforeRelativeTime(i64 pSeconds);

  ErrorCode read(XdrReader &pIn);
};

struct ClaimantV0 {
  AccountId destination;
  ClaimPredicate predicate;
  QUASAR_XDR_FIELDS(destination, predicate)
};

using Claimant = XdrUnion<XdrArm<ClaimantType::eV0, ClaimantV0>>;

using ClaimableBalanceIdV0 = XdrArm<ClaimableBalanceIdType::eV0, Hash>;

struct ClaimableBalanceId : XdrUnion<ClaimableBalanceIdV0> {
  using XdrUnion::XdrUnion;

  ClaimableBalanceId() = default;
  explicit ClaimableBalanceId(const Hash &pHash) : XdrUnion(ClaimableBalanceIdV0(pHash)) {}

  /** 36 bytes: type discriminant then hash
   * @throw quasar_error eInvalidBalanceId */
  static ClaimableBalanceId fromBinary(const cbuff_view_t &pBytes);
  /** Hex of the 36 byte form, as the observation service prints balance ids */
  static ClaimableBalanceId fromHex(std::string_view pHex);
  std::string toHex() const;
};

struct LedgerKeyAccount {
  AccountId accountId;
  QUASAR_XDR_FIELDS(accountId)
};

struct LedgerKeyTrustLine {
  AccountId accountId;
  Asset asset;
  QUASAR_XDR_FIELDS(accountId, asset)
};

struct LedgerKeyOffer {
  AccountId sellerId;
  i64 offerId = 0;
  QUASAR_XDR_FIELDS(sellerId, offerId)
};

struct LedgerKeyData {
  AccountId accountId;
  String64 dataName;
  QUASAR_XDR_FIELDS(accountId, dataName)
};

struct LedgerKeyClaimableBalance {
  ClaimableBalanceId balanceId;
  QUASAR_XDR_FIELDS(balanceId)
};

using LedgerKey = XdrUnion<XdrArm<LedgerEntryType::eAccount, LedgerKeyAccount>,
                           XdrArm<LedgerEntryType::eTrustline, LedgerKeyTrustLine>,
                           XdrArm<LedgerEntryType::eOffer, LedgerKeyOffer>,
                           XdrArm<LedgerEntryType::eData, LedgerKeyData>,
                           XdrArm<LedgerEntryType::eClaimableBalance, LedgerKeyClaimableBalance>>;

/** (hint, signature) attached to an envelope. Only the signing engine creates populated values. */
class DecoratedSignature {
  SignatureHint hint_;
  XdrBytes<64> signature_;

  DecoratedSignature(const SignatureHint &pHint, XdrBytes<64> pSignature)
      : hint_(pHint), signature_(std::move(pSignature)) {}

  friend struct DecoratedSignatureFactory;

public:
  DecoratedSignature() = default;

  const SignatureHint &hint() const { return hint_; }
  const XdrBytes<64> &signature() const { return signature_; }

  QUASAR_XDR_FIELDS(hint_, signature_)
};

} // namespace quasar
