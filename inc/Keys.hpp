#pragma once

#include <optional>
#include <variant>

#include "StrKey.hpp"
#include "Xdr.hpp"

namespace quasar {

using Signature = u512;
using SignatureHint = u32b;

/** Ed25519 public key, the verifying half of an identity.
 * On the wire it is the PublicKey union with its single PUBLIC_KEY_TYPE_ED25519 arm. */
class PublicKey {
  u256 key;

public:
  static constexpr i32 sTypeEd25519 = 0;

  PublicKey() = default;
  explicit PublicKey(const u256 &pKey) : key(pKey) {}

  /** @throw quasar_error eInvalidPublicKeyLength */
  static PublicKey fromBytes(const cbuff_view_t &pBytes);
  static std::optional<PublicKey> fromBytes(const cbuff_view_t &pBytes, ErrorCode &pError);

  /** Parses a "G..." strkey */
  static PublicKey fromStrKey(std::string_view pText);
  static std::optional<PublicKey> fromStrKey(std::string_view pText, ErrorCode &pError);

  std::string toStrKey() const;

  const u256 &bytes() const { return key; }
  SignatureHint hint() const;

  bool verify(const cbuff_view_t &pMessage, const Signature &pSignature) const;
  /** @throw quasar_error eInvalidSignatureLength */
  bool verify(const cbuff_view_t &pMessage, const cbuff_view_t &pSignature) const;

  void write(XdrWriter &pOut) const;
  ErrorCode read(XdrReader &pIn);

  bool operator==(const PublicKey &pOther) const { return key == pOther.key; }
  bool operator!=(const PublicKey &pOther) const { return key != pOther.key; }
  bool operator<(const PublicKey &pOther) const { return key < pOther.key; }
};

std::ostream &operator<<(std::ostream &pOS, const PublicKey &pKey);

using AccountId = PublicKey;

/** Ed25519 signing identity. Move-only, the secret stays in locked memory owned by a single holder. */
class SecretKey {
  PublicKey publicKey_;
  sensitive_t<u512> secret; // libsodium layout: seed || public key

  SecretKey() = default;

public:
  SecretKey(SecretKey &&pOther) noexcept = default;
  SecretKey(const SecretKey &) = delete;
  SecretKey &operator=(const SecretKey &) = delete;

  /** Fresh identity from libsodium's CSPRNG */
  static SecretKey generate();
  /** @throw quasar_error eInvalidSeedLength */
  static SecretKey fromSeed(const cbuff_view_t &pSeed);
  /** Parses an "S..." strkey */
  static SecretKey fromStrKey(std::string_view pText);
  static std::optional<SecretKey> fromStrKey(std::string_view pText, ErrorCode &pError);

  std::string toStrKey() const;
  u256 seed() const;

  const PublicKey &publicKey() const { return publicKey_; }

  /** Deterministic: the same key and message always give the same signature */
  Signature sign(const cbuff_view_t &pMessage) const;
};

/** Either capability: verify-only or signing */
using Keypair = std::variant<PublicKey, SecretKey>;

bool canSign(const Keypair &pKeypair);
const PublicKey &publicKeyOf(const Keypair &pKeypair);
/** @throw quasar_error eCannotSign for a verify-only keypair */
Signature sign(const Keypair &pKeypair, const cbuff_view_t &pMessage);

/** @return false for a well-formed but wrong signature
 * @throw quasar_error eInvalidPublicKeyLength or eInvalidSignatureLength for malformed sizes */
bool verifySignature(const cbuff_view_t &pPublicKey, const cbuff_view_t &pMessage, const cbuff_view_t &pSignature);
bool verifySignature(const cbuff_view_t &pPublicKey, const cbuff_view_t &pMessage, const cbuff_view_t &pSignature,
                     ErrorCode &pError);

} // namespace quasar
