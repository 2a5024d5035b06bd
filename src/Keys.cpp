#include "Keys.hpp"

using namespace quasar;

static_assert(crypto_sign_PUBLICKEYBYTES == 32, "ed25519 public key size");
static_assert(crypto_sign_SECRETKEYBYTES == 64, "ed25519 secret key size");
static_assert(crypto_sign_SEEDBYTES == 32, "ed25519 seed size");
static_assert(crypto_sign_BYTES == 64, "ed25519 signature size");

PublicKey PublicKey::fromBytes(const cbuff_view_t &pBytes) {
  ErrorCode lError;
  auto lResult = fromBytes(pBytes, lError);
  if (!lResult)
    throw quasar_error(lError);
  return *lResult;
}

std::optional<PublicKey> PublicKey::fromBytes(const cbuff_view_t &pBytes, ErrorCode &pError) {
  if (pBytes.size != u256::sSize) {
    pError = QuasarErrorCode::eInvalidPublicKeyLength;
    return std::nullopt;
  }
  u256 lKey;
  memcpy(lKey.data(), pBytes.data, lKey.size());
  pError.clear();
  return PublicKey(lKey);
}

PublicKey PublicKey::fromStrKey(std::string_view pText) {
  auto lRaw = decodeStrKey(pText, VersionByte::eAccountId);
  return fromBytes(view(lRaw));
}

std::optional<PublicKey> PublicKey::fromStrKey(std::string_view pText, ErrorCode &pError) {
  VersionByte lVersion;
  std::vector<u8> lRaw;
  if ((pError = decodeStrKey(pText, lVersion, lRaw)))
    return std::nullopt;
  if (lVersion != VersionByte::eAccountId) {
    pError = QuasarErrorCode::eInvalidKeyVersion;
    return std::nullopt;
  }
  return fromBytes(view(lRaw), pError);
}

std::string PublicKey::toStrKey() const { return encodeStrKey(VersionByte::eAccountId, key.view()); }

SignatureHint PublicKey::hint() const {
  SignatureHint lHint;
  memcpy(lHint.data(), key.data() + key.size() - lHint.size(), lHint.size());
  return lHint;
}

bool PublicKey::verify(const cbuff_view_t &pMessage, const Signature &pSignature) const {
  return crypto_sign_verify_detached(pSignature.data(), pMessage.data, pMessage.size, key.data()) == 0;
}

bool PublicKey::verify(const cbuff_view_t &pMessage, const cbuff_view_t &pSignature) const {
  return verifySignature(key.view(), pMessage, pSignature);
}

void PublicKey::write(XdrWriter &pOut) const {
  pOut.putI32(sTypeEd25519);
  pOut.put(key);
}

ErrorCode PublicKey::read(XdrReader &pIn) {
  i32 lType = 0;
  QUASAR_TRY(pIn.getI32(lType));
  if (lType != sTypeEd25519)
    return QuasarErrorCode::eInvalidDiscriminant;
  return pIn.get(key);
}

std::ostream &quasar::operator<<(std::ostream &pOS, const PublicKey &pKey) { return pOS << pKey.toStrKey(); }

SecretKey SecretKey::generate() {
  ensureSodium();
  SecretKey lResult;
  u256 lPublic;
  QUASAR_CCALL(crypto_sign_keypair(lPublic.data(), lResult.secret->data()));
  lResult.publicKey_ = PublicKey(lPublic);
  return lResult;
}

SecretKey SecretKey::fromSeed(const cbuff_view_t &pSeed) {
  ensureSodium();
  if (pSeed.size != crypto_sign_SEEDBYTES)
    throw quasar_error(QuasarErrorCode::eInvalidSeedLength);
  SecretKey lResult;
  u256 lPublic;
  QUASAR_CCALL(crypto_sign_seed_keypair(lPublic.data(), lResult.secret->data(), pSeed.data));
  lResult.publicKey_ = PublicKey(lPublic);
  return lResult;
}

SecretKey SecretKey::fromStrKey(std::string_view pText) {
  auto lRaw = decodeStrKey(pText, VersionByte::eSeed);
  auto lResult = fromSeed(view(lRaw));
  sodium_memzero(lRaw.data(), lRaw.size());
  return lResult;
}

std::optional<SecretKey> SecretKey::fromStrKey(std::string_view pText, ErrorCode &pError) {
  VersionByte lVersion;
  std::vector<u8> lRaw;
  if ((pError = decodeStrKey(pText, lVersion, lRaw)))
    return std::nullopt;
  std::optional<SecretKey> lResult;
  if (lVersion != VersionByte::eSeed)
    pError = QuasarErrorCode::eInvalidKeyVersion;
  else
    lResult.emplace(fromSeed(view(lRaw)));
  sodium_memzero(lRaw.data(), lRaw.size());
  return lResult;
}

std::string SecretKey::toStrKey() const {
  sensitive_t<u256> lSeed(seed());
  return encodeStrKey(VersionByte::eSeed, lSeed->view());
}

u256 SecretKey::seed() const {
  u256 lSeed;
  QUASAR_CCALL(crypto_sign_ed25519_sk_to_seed(lSeed.data(), secret->data()));
  return lSeed;
}

Signature SecretKey::sign(const cbuff_view_t &pMessage) const {
  Signature lResult;
  QUASAR_CCALL(crypto_sign_detached(lResult.data(), nullptr, pMessage.data, pMessage.size, secret->data()));
  return lResult;
}

bool quasar::canSign(const Keypair &pKeypair) { return std::holds_alternative<SecretKey>(pKeypair); }

const PublicKey &quasar::publicKeyOf(const Keypair &pKeypair) {
  if (const auto *lSecret = std::get_if<SecretKey>(&pKeypair))
    return lSecret->publicKey();
  return std::get<PublicKey>(pKeypair);
}

Signature quasar::sign(const Keypair &pKeypair, const cbuff_view_t &pMessage) {
  const auto *lSecret = std::get_if<SecretKey>(&pKeypair);
  if (lSecret == nullptr)
    throw quasar_error(QuasarErrorCode::eCannotSign, std::get<PublicKey>(pKeypair).toStrKey() + " is verify-only");
  return lSecret->sign(pMessage);
}

bool quasar::verifySignature(const cbuff_view_t &pPublicKey, const cbuff_view_t &pMessage,
                             const cbuff_view_t &pSignature) {
  ErrorCode lError;
  bool lValid = verifySignature(pPublicKey, pMessage, pSignature, lError);
  if (lError)
    throw quasar_error(lError);
  return lValid;
}

bool quasar::verifySignature(const cbuff_view_t &pPublicKey, const cbuff_view_t &pMessage,
                             const cbuff_view_t &pSignature, ErrorCode &pError) {
  if (pPublicKey.size != crypto_sign_PUBLICKEYBYTES) {
    pError = QuasarErrorCode::eInvalidPublicKeyLength;
    return false;
  }
  if (pSignature.size != crypto_sign_BYTES) {
    pError = QuasarErrorCode::eInvalidSignatureLength;
    return false;
  }
  pError.clear();
  return crypto_sign_verify_detached(pSignature.data, pMessage.data, pMessage.size, pPublicKey.data) == 0;
}
