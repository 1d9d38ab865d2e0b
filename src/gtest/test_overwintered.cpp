#include <gtest/gtest.h>

#include "consensus/upgrades.h"
#include "gtest/utils.h"
#include "signing/coininfo.h"
#include "signing/overwintered.h"
#include "streams.h"
#include "utilstrencodings.h"

#include <stdexcept>

TEST(OverwinteredSigner, SelectsStrategyByVersion) {
    auto coin = CoinByName("Zcash");

    auto v3 = CreateSigHasher(TestTxHeader(OVERWINTER_TX_VERSION), coin);
    EXPECT_TRUE(std::holds_alternative<CZip143SigHasher>(v3));

    auto v4 = CreateSigHasher(TestTxHeader(SAPLING_TX_VERSION), coin);
    EXPECT_TRUE(std::holds_alternative<CZip243SigHasher>(v4));
}

TEST(OverwinteredSigner, DefaultBranchIds) {
    auto coin = CoinByName("Zcash");

    COverwinteredSigner v3(coin, TestTxHeader(OVERWINTER_TX_VERSION));
    EXPECT_EQ(v3.GetBranchId(), 0x5ba81b19u);
    EXPECT_EQ(v3.GetBranchId(), NetworkUpgradeInfo[Consensus::UPGRADE_OVERWINTER].nBranchId);

    COverwinteredSigner v4(coin, TestTxHeader(SAPLING_TX_VERSION));
    EXPECT_EQ(v4.GetBranchId(), 0x76b809bbu);
    EXPECT_EQ(v4.GetBranchId(), NetworkUpgradeInfo[Consensus::UPGRADE_SAPLING].nBranchId);
}

TEST(OverwinteredSigner, ExplicitBranchIdIsKept) {
    auto coin = CoinByName("Komodo");

    COverwinteredSigner v3(coin, TestTxHeader(OVERWINTER_TX_VERSION, 0x12345678));
    EXPECT_EQ(v3.GetBranchId(), 0x12345678u);

    COverwinteredSigner v4(coin, TestTxHeader(SAPLING_TX_VERSION, 0x12345678));
    EXPECT_EQ(v4.GetBranchId(), 0x12345678u);
}

TEST(OverwinteredSigner, UnsupportedVersion) {
    auto coin = CoinByName("Zcash");

    for (uint32_t nVersion : {1u, 2u, 5u}) {
        try {
            COverwinteredSigner signer(coin, TestTxHeader(nVersion));
            FAIL() << "Expected SigningError for version " << nVersion;
        } catch (const SigningError& e) {
            EXPECT_EQ(e.GetType(), FailureType::DataError);
            EXPECT_EQ(FailureTypeToString(e.GetType()), "DataError");
            EXPECT_EQ(std::string(e.what()), "Unsupported version for overwintered transaction");
        }
    }
}

TEST(OverwinteredSigner, NonOverwinteredCoinIsFatal) {
    auto coin = CoinByName("Bitcoin");
    EXPECT_THROW(CreateSigHasher(TestTxHeader(SAPLING_TX_VERSION), coin), std::logic_error);
}

TEST(OverwinteredSigner, SerializeHeader) {
    auto coin = CoinByName("Zcash");

    COverwinteredSigner v3(coin, TestTxHeader(OVERWINTER_TX_VERSION));
    EXPECT_EQ(HexStr(v3.SerializeHeader()), "030000807082c403");

    COverwinteredSigner v4(coin, TestTxHeader(SAPLING_TX_VERSION));
    EXPECT_EQ(HexStr(v4.SerializeHeader()), "0400008085202f89");
}

TEST(OverwinteredSigner, SerializeFooter) {
    auto coin = CoinByName("Zcash");

    // nLockTime, nExpiryHeight, nJoinSplit
    COverwinteredSigner v3(coin, TestTxHeader(OVERWINTER_TX_VERSION));
    EXPECT_EQ(HexStr(v3.SerializeFooter()), "20a1070084a1070000");

    // nLockTime, nExpiryHeight, valueBalance, nShieldedSpend, nShieldedOutput, nJoinSplit
    COverwinteredSigner v4(coin, TestTxHeader(SAPLING_TX_VERSION));
    EXPECT_EQ(HexStr(v4.SerializeFooter()), "20a1070084a107000000000000000000000000");
}

TEST(OverwinteredSigner, FooterRejectsUnsupportedVersion) {
    CTxHeader tx = TestTxHeader(SAPLING_TX_VERSION);
    tx.nVersion = 5;

    std::vector<unsigned char> vch;
    CVectorWriter writer(vch);
    EXPECT_THROW(WriteOverwinteredTxFooter(writer, tx), SigningError);
}

TEST(OverwinteredSigner, SignatureHashMatchesStrategy) {
    auto coin = CoinByName("Zcash");
    auto vin = TestInputs();
    auto vout = TestOutputs();

    COverwinteredSigner signer(coin, TestTxHeader(SAPLING_TX_VERSION));
    for (const auto& txin : vin) {
        signer.ProcessInput(txin);
    }
    for (const auto& txout : vout) {
        signer.ProcessOutput(txout);
    }

    EXPECT_EQ(DigestHex(signer.SignatureHash(vin[0], SIGHASH_ALL)),
              "ec70e894ba7775ed00a89b0234075e4dec643f737ba466127564f72965236926");
    EXPECT_EQ(DigestHex(signer.SignatureHash(vin[1], SIGHASH_ALL)),
              "3e3dd4fcef436bb53ccb85c83bb3269f9c46caa97cf4a6f59844af3c207d4aee");
}

TEST(OverwinteredSigner, SerializedOutputsMatchTxOut) {
    auto coin = CoinByName("Zcash Testnet");
    auto vin = TestInputs();

    COverwinteredSigner fromTxOut(coin, TestTxHeader(OVERWINTER_TX_VERSION));
    COverwinteredSigner fromBytes(coin, TestTxHeader(OVERWINTER_TX_VERSION));
    for (const auto& txin : vin) {
        fromTxOut.ProcessInput(txin);
        fromBytes.ProcessInput(txin);
    }
    for (const auto& txout : TestOutputs()) {
        fromTxOut.ProcessOutput(txout);

        std::vector<unsigned char> vch;
        CVectorWriter writer(vch);
        writer << txout;
        fromBytes.ProcessOutput(vch);
    }

    EXPECT_EQ(DigestHex(fromTxOut.SignatureHash(vin[1], SIGHASH_ALL)),
              "23bd0eb00cd6a11722070b5cdcaa149471c3375a55cb45023f38ceee93d0542d");
    EXPECT_EQ(fromTxOut.SignatureHash(vin[0], SIGHASH_ALL),
              fromBytes.SignatureHash(vin[0], SIGHASH_ALL));
}

TEST(OverwinteredSigner, NoInputsAfterFirstSignature) {
    auto coin = CoinByName("Zcash");
    auto vin = TestInputs();

    COverwinteredSigner signer(coin, TestTxHeader(SAPLING_TX_VERSION));
    signer.ProcessInput(vin[0]);
    signer.SignatureHash(vin[0], SIGHASH_ALL);

    EXPECT_THROW(signer.ProcessInput(vin[1]), std::logic_error);
    EXPECT_THROW(signer.ProcessOutput(TestOutputs()[0]), std::logic_error);
}

TEST(OverwinteredSigner, SignatureHashRejectsNonAllHashTypes) {
    auto coin = CoinByName("Zcash");
    auto vin = TestInputs();

    for (uint32_t nVersion : {OVERWINTER_TX_VERSION, SAPLING_TX_VERSION}) {
        COverwinteredSigner signer(coin, TestTxHeader(nVersion));
        for (const auto& txin : vin) {
            signer.ProcessInput(txin);
        }
        for (const auto& txout : TestOutputs()) {
            signer.ProcessOutput(txout);
        }

        EXPECT_THROW(signer.SignatureHash(vin[0], SIGHASH_ALL | SIGHASH_ANYONECANPAY), SigningError);
        EXPECT_THROW(signer.SignatureHash(vin[0], SIGHASH_SINGLE), SigningError);
        // A rejected type leaves the signer usable.
        EXPECT_NO_THROW(signer.SignatureHash(vin[0], SIGHASH_ALL));
    }
}
