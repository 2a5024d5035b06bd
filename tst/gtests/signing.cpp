#include "Fixtures.hpp"

using namespace quasar;

static const char *sTestnetPayloadHex = "edb7d6fbec48c82abc271876df0d5bd65c9bab495b7741119fcb723d2e949678";
static const char *sPublicPayloadHex = "f766cd1394dfe92b88475a3af6d1206ac82417f069ff5a84c55b804c02c12b46";
static const char *sFeeBumpPayloadHex = "b49635283a7560ec86637a5a80afc5d3583654d3e3627bb56f8e686e9ef14211";
static const char *sTestnetSignatureHex =
    "86949741037fd219501a21bb43ffbdfc13ad59322b9aa6ab500a339bb6a9181a899da486cd06c8518511db8c34609b5566b6b455405a7553"
    "95682175f9e3de0e";

static const char *sUnsignedBase64 =
    "AAAAAgAAAADXWpgBgrEKt9VL/tPJZAc6DuFy89qmIyWvAhpo9wdRGgAAAGQAAAEfcfsEywAAAAEAAAAAAAAAAAAAAABlU/EAAAAAAQAAAAVoZW"
    "xsbwAAAAAAAAEAAAAAAAAAAQAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAJiWgAAAAAAAAAAA";
static const char *sSignedBase64 =
    "AAAAAgAAAADXWpgBgrEKt9VL/tPJZAc6DuFy89qmIyWvAhpo9wdRGgAAAGQAAAEfcfsEywAAAAEAAAAAAAAAAAAAAABlU/EAAAAAAQAAAAVoZW"
    "xsbwAAAAAAAAEAAAAAAAAAAQAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAJiWgAAAAAAAAAAB9wdRGgAAAECG"
    "lJdBA3/SGVAaIbtD/738E61ZMiuapqtQCjObtqkYGomdpIbNBshRhRHbjDRgm1VmtrRVQFp1U5VoIXX5494O";

// verify-only key sharing the hint of pKey, nothing else
static PublicKey hintTwin(const PublicKey &pKey) {
  auto lBytes = quasar::rand<u256>();
  const auto lHint = pKey.hint();
  memcpy(lBytes.data() + lBytes.size() - lHint.size(), lHint.data(), lHint.size());
  return PublicKey(lBytes);
}

static Operation bump(SequenceNumber pTo) { return Operation::bumpSequence(pTo); }

TEST(Networks, Identifiers) {
  EXPECT_EQ(u256FromHex("7ac33997544e3175d266bd022439b22cdb16508c01163f26e5cb2a3e1045a979"),
            Network::publicNetwork().id());
  EXPECT_EQ(u256FromHex("cee0302d59844d32bdca915c8203dd44b33fbb7edc19051ea37abedf28ecd472"),
            Network::testNetwork().id());
  EXPECT_EQ(Network::sTestPassphrase, Network::testNetwork().passphrase());
  EXPECT_EQ(Network::testNetwork().id(), Network(Network::sTestPassphrase).id());
  EXPECT_NE(Network::publicNetwork().id(), Network("Standalone Network ; February 2017").id());
}

TEST_F(QuasarSigningTest, PayloadIsBoundToTheNetwork) {
  EXPECT_EQ(u256FromHex(sTestnetPayloadHex), signaturePayload(Network::testNetwork(), payment));
  EXPECT_EQ(u256FromHex(sPublicPayloadHex), signaturePayload(Network::publicNetwork(), payment));
  EXPECT_EQ(u256FromHex(sTestnetPayloadHex), transactionHash(Network::testNetwork(), unsignedEnvelope()));

  // any field change moves the payload
  auto lOther = payment;
  lOther.seqNum++;
  EXPECT_NE(signaturePayload(Network::testNetwork(), payment), signaturePayload(Network::testNetwork(), lOther));
}

TEST_F(QuasarSigningTest, GoldenEnvelope) {
  auto lEnvelope = unsignedEnvelope();
  EXPECT_EQ(sUnsignedBase64, lEnvelope.toBase64());
  EXPECT_EQ(lEnvelope, TransactionEnvelope::fromBase64(sUnsignedBase64));

  sign(lEnvelope, Network::testNetwork(), rfcKey);
  ASSERT_EQ(1u, lEnvelope.signatures().size());
  const auto &lSignature = lEnvelope.signatures()[0];
  EXPECT_EQ(rfcKey.publicKey().hint(), lSignature.hint());
  EXPECT_EQ(fromHex(sTestnetSignatureHex), lSignature.signature().value());
  EXPECT_EQ(sSignedBase64, lEnvelope.toBase64());

  auto lDecoded = TransactionEnvelope::fromBase64(sSignedBase64);
  EXPECT_EQ(EnvelopeType::eTx, lDecoded.type());
  EXPECT_EQ(lEnvelope, lDecoded);

  ErrorCode lError;
  EXPECT_FALSE(TransactionEnvelope::fromBase64(std::string(sSignedBase64) + "AAAA", lError));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eTrailingBytes), lError);
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eInvalidBase64), thrownCode([] { TransactionEnvelope::fromBase64("$$$$"); }));
}

TEST_F(QuasarSigningTest, SignatureDoesNotCrossNetworks) {
  auto lEnvelope = TransactionEnvelope::fromBase64(sSignedBase64);
  const std::vector<PublicKey> lCandidates = {rfcKey.publicKey()};

  EXPECT_EQ(lCandidates, verifySigners(lEnvelope, Network::testNetwork(), lCandidates));
  EXPECT_TRUE(verifySigners(lEnvelope, Network::publicNetwork(), lCandidates).empty());

  std::vector<PublicKey> lOthers;
  for (const auto &lKey : signers)
    lOthers.push_back(lKey.publicKey());
  EXPECT_TRUE(verifySigners(lEnvelope, Network::testNetwork(), lOthers).empty());
}

TEST_F(QuasarSigningTest, HintCollisions) {
  auto lEnvelope = unsignedEnvelope();
  sign(lEnvelope, Network::testNetwork(), rfcKey);

  const auto lFirstTwin = hintTwin(rfcKey.publicKey());
  const auto lSecondTwin = hintTwin(rfcKey.publicKey());
  ASSERT_EQ(rfcKey.publicKey().hint(), lFirstTwin.hint());

  // every candidate matching the hint is tried, not only the first one
  auto lVerified = verifySigners(lEnvelope, Network::testNetwork(), {lFirstTwin, lSecondTwin, rfcKey.publicKey()});
  ASSERT_EQ(1u, lVerified.size());
  EXPECT_EQ(rfcKey.publicKey(), lVerified[0]);

  EXPECT_TRUE(verifySigners(lEnvelope, Network::testNetwork(), {lFirstTwin, lSecondTwin}).empty());
}

TEST_F(QuasarSigningTest, Thresholds) {
  AccountThresholds lAccount;
  for (const auto &lKey : signers)
    lAccount.signers.push_back({lKey.publicKey(), 1});
  lAccount.threshold = 2;

  auto lEnvelope = unsignedEnvelope();
  EXPECT_FALSE(lAccount.isSatisfiedBy(lEnvelope, Network::testNetwork()));

  sign(lEnvelope, Network::testNetwork(), signers[0]);
  EXPECT_FALSE(lAccount.isSatisfiedBy(lEnvelope, Network::testNetwork()));

  // the same signer twice still weighs 1
  sign(lEnvelope, Network::testNetwork(), signers[0]);
  EXPECT_EQ(2u, lEnvelope.signatures().size());
  EXPECT_FALSE(lAccount.isSatisfiedBy(lEnvelope, Network::testNetwork()));

  // a signer the account doesn't know adds nothing
  sign(lEnvelope, Network::testNetwork(), rfcKey);
  EXPECT_FALSE(lAccount.isSatisfiedBy(lEnvelope, Network::testNetwork()));

  sign(lEnvelope, Network::testNetwork(), signers[2]);
  EXPECT_TRUE(lAccount.isSatisfiedBy(lEnvelope, Network::testNetwork()));
  EXPECT_FALSE(lAccount.isSatisfiedBy(lEnvelope, Network::publicNetwork()));

  auto lVerified = verifySigners(lEnvelope, Network::testNetwork(),
                                 {signers[0].publicKey(), signers[1].publicKey(), signers[2].publicKey()});
  EXPECT_EQ(2u, lVerified.size());
  EXPECT_EQ(2u, lAccount.weightOf(lVerified));
  EXPECT_EQ(2u, lAccount.weightOf({signers[0].publicKey(), signers[0].publicKey(), signers[2].publicKey()}));

  AccountThresholds lWeighted{{{signers[0].publicKey(), 5}, {signers[1].publicKey(), 1}}, 5};
  EXPECT_TRUE(lWeighted.isSatisfiedBy(lEnvelope, Network::testNetwork()));
  lWeighted.threshold = 6;
  EXPECT_FALSE(lWeighted.isSatisfiedBy(lEnvelope, Network::testNetwork()));
}

TEST_F(QuasarSigningTest, SignatureLimit) {
  auto lEnvelope = unsignedEnvelope();
  for (size_t i = 0; i < QUASAR_MAX_SIGNATURES; i++)
    sign(lEnvelope, Network::testNetwork(), rfcKey);
  EXPECT_EQ((size_t)QUASAR_MAX_SIGNATURES, lEnvelope.signatures().size());
  // identical signatures are kept as they are
  EXPECT_EQ(lEnvelope.signatures()[0], lEnvelope.signatures()[QUASAR_MAX_SIGNATURES - 1]);

  EXPECT_EQ(ErrorCode(QuasarErrorCode::eTooManySignatures),
            thrownCode([&] { sign(lEnvelope, Network::testNetwork(), signers[0]); }));
  EXPECT_EQ((size_t)QUASAR_MAX_SIGNATURES, lEnvelope.signatures().size());

  EXPECT_EQ(std::vector<PublicKey>{rfcKey.publicKey()},
            verifySigners(lEnvelope, Network::testNetwork(), {rfcKey.publicKey()}));

  TransactionEnvelope lDecoded;
  ASSERT_FALSE(decodeXdr(view(encodeXdr(lEnvelope)), lDecoded));
  EXPECT_EQ(lEnvelope, lDecoded);
}

TEST_F(QuasarSigningTest, Keypairs) {
  const Keypair lVerifyOnly(rfcKey.publicKey());
  auto lEnvelope = unsignedEnvelope();
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eCannotSign),
            thrownCode([&] { sign(lEnvelope, Network::testNetwork(), lVerifyOnly); }));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eCannotSign),
            thrownCode([&] { signTransaction(payment, Network::testNetwork(), lVerifyOnly); }));
  EXPECT_TRUE(lEnvelope.signatures().empty());

  const Keypair lSigning(SecretKey::fromSeed(u256FromHex(sRfcSeedHex).view()));
  sign(lEnvelope, Network::testNetwork(), lSigning);
  EXPECT_EQ(sSignedBase64, lEnvelope.toBase64());
  EXPECT_EQ(lEnvelope.signatures()[0], signTransaction(payment, Network::testNetwork(), lSigning));
}

TEST_F(QuasarSigningTest, HashX) {
  const std::string lPreimage = "open sesame";
  auto lSignature = signHashX(view(lPreimage));
  EXPECT_EQ(fromHex("a93ed4eb"), std::vector<u8>(lSignature.hint().begin(), lSignature.hint().end()));
  EXPECT_EQ(std::vector<u8>(lPreimage.begin(), lPreimage.end()), lSignature.signature().value());

  auto lEnvelope = unsignedEnvelope();
  addSignature(lEnvelope, lSignature);
  sign(lEnvelope, Network::testNetwork(), rfcKey);
  EXPECT_EQ(2u, lEnvelope.signatures().size());
  // preimages are skipped, ed25519 signatures after them still count
  EXPECT_EQ(std::vector<PublicKey>{rfcKey.publicKey()},
            verifySigners(lEnvelope, Network::testNetwork(), {rfcKey.publicKey()}));

  EXPECT_EQ(ErrorCode(QuasarErrorCode::eExceedsMaximumLength),
            thrownCode([] { signHashX(view(std::string(65, 'x'))); }));
}

TEST_F(QuasarSigningTest, FeeBump) {
  auto lInner = TransactionEnvelope::fromBase64(sSignedBase64);
  auto lBumped = wrapFeeBump(lInner, MuxedAccount(PublicKey()), 400);
  ASSERT_EQ(EnvelopeType::eTxFeeBump, lBumped.type());
  EXPECT_TRUE(lBumped.signatures().empty());
  EXPECT_EQ(u256FromHex(sFeeBumpPayloadHex), transactionHash(Network::testNetwork(), lBumped));

  const auto &lTx = lBumped.as<EnvelopeFeeBump>().value.tx;
  EXPECT_EQ(400, lTx.fee);
  EXPECT_EQ(payment, lTx.inner().tx);
  ASSERT_EQ(1u, lTx.inner().signatures.size());

  // the inner signature still holds on its own payload
  EXPECT_TRUE(rfcKey.publicKey().verify(signaturePayload(Network::testNetwork(), lTx.inner().tx).view(),
                                        lTx.inner().signatures[0].signature().view()));

  // the outer signature is over the fee bump payload, not the inner one
  sign(lBumped, Network::testNetwork(), signers[0]);
  EXPECT_EQ(std::vector<PublicKey>{signers[0].publicKey()},
            verifySigners(lBumped, Network::testNetwork(), {signers[0].publicKey(), rfcKey.publicKey()}));

  auto lDecoded = TransactionEnvelope::fromBase64(lBumped.toBase64());
  EXPECT_EQ(lBumped, lDecoded);

  EXPECT_EQ(ErrorCode(QuasarErrorCode::eCannotWrapFeeBump),
            thrownCode([&] { wrapFeeBump(lBumped, MuxedAccount(PublicKey()), 800); }));
}

TEST_F(QuasarSigningTest, LegacyEnvelope) {
  TransactionV0 lV0;
  lV0.sourceAccountEd25519 = rfcKey.publicKey().bytes();
  lV0.fee = payment.fee;
  lV0.seqNum = payment.seqNum;
  lV0.timeBounds = payment.timeBounds;
  lV0.memo = payment.memo;
  lV0.operations = payment.operations();
  EXPECT_EQ(payment, lV0.toV1());

  TransactionEnvelope lEnvelope(EnvelopeV0(TransactionV0Envelope{lV0, {}}));
  EXPECT_EQ(EnvelopeType::eTxV0, lEnvelope.type());
  EXPECT_EQ(u256FromHex(sTestnetPayloadHex), transactionHash(Network::testNetwork(), lEnvelope));

  // a v0 signature is the one of its v1 form
  sign(lEnvelope, Network::testNetwork(), rfcKey);
  EXPECT_EQ(fromHex(sTestnetSignatureHex), lEnvelope.signatures()[0].signature().value());
  EXPECT_EQ(std::vector<PublicKey>{rfcKey.publicKey()},
            verifySigners(lEnvelope, Network::testNetwork(), {rfcKey.publicKey()}));

  TransactionEnvelope lDecoded;
  ASSERT_FALSE(fromBase64Xdr(lEnvelope.toBase64(), lDecoded));
  EXPECT_EQ(lEnvelope, lDecoded);

  auto lBumped = wrapFeeBump(lEnvelope, MuxedAccount(PublicKey()), 400);
  EXPECT_EQ(u256FromHex(sFeeBumpPayloadHex), transactionHash(Network::testNetwork(), lBumped));
  EXPECT_EQ(lEnvelope.signatures(), lBumped.as<EnvelopeFeeBump>().value.tx.inner().signatures);
}

TEST_F(QuasarSigningTest, OperationCounts) {
  const MuxedAccount lSource(rfcKey.publicKey());

  EXPECT_EQ(ErrorCode(QuasarErrorCode::eEmptyOperations), thrownCode([&] { Transaction(lSource, 100, 1, {}); }));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eTooManyOperations), thrownCode([&] {
              Transaction(lSource, 100, 1, std::vector<Operation>(QUASAR_MAX_OPERATIONS + 1, bump(2)));
            }));

  Transaction lFull(lSource, 100, 1, std::vector<Operation>(QUASAR_MAX_OPERATIONS - 1, bump(2)));
  lFull.appendOperation(bump(3));
  EXPECT_EQ((size_t)QUASAR_MAX_OPERATIONS, lFull.operations().size());
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eTooManyOperations), thrownCode([&] { lFull.appendOperation(bump(4)); }));
  EXPECT_EQ((size_t)QUASAR_MAX_OPERATIONS, lFull.operations().size());

  TransactionBuilder lBuilder(lSource, 1);
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eEmptyOperations), thrownCode([&] { lBuilder.build(); }));
  for (size_t i = 0; i < QUASAR_MAX_OPERATIONS; i++)
    lBuilder.addOperation(bump((SequenceNumber)i));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eTooManyOperations), thrownCode([&] { lBuilder.addOperation(bump(0)); }));
  EXPECT_EQ((u32)QUASAR_BASE_FEE * QUASAR_MAX_OPERATIONS, lBuilder.build().fee);

  // decode targets start empty and are never signed as is
  Transaction lBlank;
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eEmptyOperations),
            thrownCode([&] { signTransaction(lBlank, Network::testNetwork(), rfcKey); }));
  TransactionEnvelope lBlankEnvelope(lBlank);
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eEmptyOperations),
            thrownCode([&] { sign(lBlankEnvelope, Network::testNetwork(), rfcKey); }));
  EXPECT_TRUE(lBlankEnvelope.signatures().empty());
}

TEST_F(QuasarSigningTest, BuilderFees) {
  auto lTx = TransactionBuilder(rfcKey.publicKey(), 7)
                 .setBaseFee(250)
                 .addOperation(bump(8))
                 .addOperation(Operation::payment(signers[0].publicKey(), Asset::native(), 1))
                 .addOperation(Operation::endSponsoringFutureReserves())
                 .build();
  EXPECT_EQ(750u, lTx.fee);
  EXPECT_EQ(7, lTx.seqNum);
  EXPECT_FALSE(lTx.timeBounds.has_value());
  EXPECT_TRUE(lTx.memo.is<MemoNone>());

  TransactionBuilder lExpensive(rfcKey.publicKey(), 7);
  lExpensive.setBaseFee(0xFFFFFFFFu).addOperation(bump(8)).addOperation(bump(9));
  EXPECT_EQ(ErrorCode(QuasarErrorCode::eAmountOverflow), thrownCode([&] { lExpensive.build(); }));
}
