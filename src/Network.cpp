#include "Network.hpp"

using namespace quasar;

Network::Network(std::string pPassphrase) : passphrase_(std::move(pPassphrase)), id_(sha256(view(passphrase_))) {}

const Network &Network::publicNetwork() {
  static const Network sNetwork(sPublicPassphrase);
  return sNetwork;
}

const Network &Network::testNetwork() {
  static const Network sNetwork(sTestPassphrase);
  return sNetwork;
}
