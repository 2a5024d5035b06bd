#pragma once

#include "utils.hpp"

namespace quasar {

/** Ledger network a transaction is meant for. Signatures made for one network never verify on another. */
class Network {
  std::string passphrase_;
  u256 id_;

public:
  static constexpr const char *sPublicPassphrase = "Public Global Stellar Network ; September 2015";
  static constexpr const char *sTestPassphrase = "Test SDF Network ; September 2015";

  explicit Network(std::string pPassphrase);

  static const Network &publicNetwork();
  static const Network &testNetwork();

  const std::string &passphrase() const { return passphrase_; }
  /** SHA-256 of the passphrase */
  const u256 &id() const { return id_; }
};

} // namespace quasar
