#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include <termios.h>

#include <boost/version.hpp>

#include "Amount.hpp"
#include "Signing.hpp"

using namespace quasar;

sensitive_t<std::array<char, 64>> getSecret() {
  // https://www.gnu.org/savannah-checkouts/gnu/libc/manual/html_node/getpass.html
  sensitive_t<std::array<char, 64>> lResult;

  /* disabling echo */
  termios lOld, lNoEcho;
  tcgetattr(fileno(stdin), &lOld);
  lNoEcho = lOld;
  lNoEcho.c_lflag &= ~ECHO;
  lNoEcho.c_lflag |= ECHONL;

  QUASAR_CCALL(tcsetattr(fileno(stdin), TCSANOW, &lNoEcho));

  std::cout << "Secret seed: ";
  std::cin.getline(lResult->data(), lResult->size());

  /* restore terminal */
  QUASAR_CCALL(tcsetattr(fileno(stdin), TCSANOW, &lOld));

  return lResult;
}

SecretKey loadSecret(const std::string &pArgument) {
  if (!pArgument.empty())
    return SecretKey::fromStrKey(pArgument);
  auto lSecret = getSecret();
  return SecretKey::fromStrKey(std::string_view(lSecret->data()));
}

Network selectNetwork(const std::string &pName) {
  if (pName.empty() || pName == "public")
    return Network::publicNetwork();
  if (pName == "testnet")
    return Network::testNetwork();
  return Network(pName);
}

void printEnvelope(const TransactionEnvelope &pEnvelope, const Network &pNetwork) {
  Transaction lTx;
  if (const auto *lV0 = pEnvelope.getIf<EnvelopeV0>()) {
    lTx = lV0->value.tx.toV1();
    std::cout << "[TX] Envelope: v0" << std::endl;
  } else if (const auto *lV1 = pEnvelope.getIf<EnvelopeV1>()) {
    lTx = lV1->value.tx;
    std::cout << "[TX] Envelope: v1" << std::endl;
  } else {
    const auto &lFeeBump = pEnvelope.as<EnvelopeFeeBump>().value.tx;
    lTx = lFeeBump.inner().tx;
    std::cout << "[TX] Envelope: fee bump by " << lFeeBump.feeSource.toStrKey() << ", fee "
              << formatAmount(lFeeBump.fee) << std::endl;
  }

  std::cout << "[TX] Source: " << lTx.sourceAccount.toStrKey() << "\n[TX] Fee: " << lTx.fee
            << " stroops\n[TX] Sequence: " << lTx.seqNum << std::endl;
  if (lTx.timeBounds)
    std::cout << "[TX] Valid: " << lTx.timeBounds->minTime << " to " << lTx.timeBounds->maxTime << std::endl;
  for (const auto &lOperation : lTx.operations()) {
    std::cout << "[TX] Operation: " << operationName(lOperation.type());
    if (lOperation.sourceAccount)
      std::cout << " from " << lOperation.sourceAccount->toStrKey();
    std::cout << std::endl;
  }
  std::cout << "[TX] Hash: " << transactionHash(pNetwork, pEnvelope) << "\n[TX] Signatures: "
            << pEnvelope.signatures().size() << std::endl;
}

void helpMsg() {
  std::cout << "usage: quasar-cli [--network public|testnet|<passphrase>] <command>\n"
               "  keygen\n"
               "  pubkey [--secret S...]\n"
               "  decode <envelope base64>\n"
               "  sign [--secret S...] <envelope base64>\n"
               "  verify --signer G... [--signer G...] <envelope base64>"
            << std::endl;
}

int main(int argc, char **argv) {
  std::string lCommand;
  std::string lNetworkName;
  std::string lSecret;
  std::string lEnvelope;
  std::vector<PublicKey> lSigners;

  try {
    for (int i = 1; i < argc; i++) {
      if (strcmp("--help", argv[i]) == 0) {
        helpMsg();
        return EXIT_SUCCESS;
      }
      if (strcmp("--version", argv[i]) == 0) {
        std::cout << "Boost: " << BOOST_VERSION / 100000 << "." // maj. version
                  << BOOST_VERSION / 100 % 1000 << "."          // min. version
                  << BOOST_VERSION % 100                        // patch version
                  << "\nsodium: " << sodium_version_string() << std::endl;
        return EXIT_SUCCESS;
      }
      if (strcmp("--network", argv[i]) == 0 && argc > (i + 1)) {
        lNetworkName = argv[++i];
      } else if (strcmp("--secret", argv[i]) == 0 && argc > (i + 1)) {
        lSecret = argv[++i];
      } else if (strcmp("--signer", argv[i]) == 0 && argc > (i + 1)) {
        lSigners.push_back(PublicKey::fromStrKey(argv[++i]));
      } else if (lCommand.empty()) {
        lCommand = argv[i];
      } else if (lEnvelope.empty()) {
        lEnvelope = argv[i];
      } else {
        std::cout << "unknown argument: " << argv[i] << std::endl;
      }
    }

    if (lCommand.empty()) {
      helpMsg();
      return EXIT_FAILURE;
    }

    ensureSodium();
    const auto lNetwork = selectNetwork(lNetworkName);

    if (lCommand == "keygen") {
      auto lKey = SecretKey::generate();
      std::cout << "[KEY] Public: " << lKey.publicKey() << "\n[KEY] Secret: " << lKey.toStrKey() << std::endl;
    } else if (lCommand == "pubkey") {
      auto lKey = loadSecret(lSecret);
      std::cout << "[KEY] Public: " << lKey.publicKey() << std::endl;
    } else if (lCommand == "decode" && !lEnvelope.empty()) {
      printEnvelope(TransactionEnvelope::fromBase64(lEnvelope), lNetwork);
    } else if (lCommand == "sign" && !lEnvelope.empty()) {
      auto lDecoded = TransactionEnvelope::fromBase64(lEnvelope);
      auto lKey = loadSecret(lSecret);
      sign(lDecoded, lNetwork, lKey);
      std::cout << "[SIG] Signed by " << lKey.publicKey() << "\n" << lDecoded.toBase64() << std::endl;
    } else if (lCommand == "verify" && !lEnvelope.empty()) {
      auto lVerified = verifySigners(TransactionEnvelope::fromBase64(lEnvelope), lNetwork, lSigners);
      for (const auto &lKey : lVerified)
        std::cout << "[SIG] Verified: " << lKey << std::endl;
      if (lVerified.empty()) {
        std::cout << "[SIG] No candidate signature verified" << std::endl;
        return EXIT_FAILURE;
      }
    } else {
      helpMsg();
      return EXIT_FAILURE;
    }
  } catch (quasar_error &pException) {
    std::cout << "Error " << pException.what() << std::endl;
    return EXIT_FAILURE;
  } catch (std::exception &pException) {
    std::cout << "Caught exception: " << pException.what() << std::endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
