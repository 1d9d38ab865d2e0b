// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "signing/overwintered.h"

#include "consensus/upgrades.h"
#include "logging.h"
#include "streams.h"

SigHasher CreateSigHasher(const CTxHeader& tx, const CoinInfo& coin)
{
    ensure(coin.fOverwintered, "Overwintered sighash requires an overwintered coin");

    uint32_t nBranchId = tx.nBranchId;
    if (nBranchId == 0) {
        nBranchId = DefaultBranchIdForTxVersion(tx.nVersion);
    }

    switch (tx.nVersion) {
    case OVERWINTER_TX_VERSION:
        LogPrint("signtx", "%s: ZIP 143 sighash, branch id %08x\n", coin.strCoinName, nBranchId);
        return SigHasher(std::in_place_type<CZip143SigHasher>, nBranchId);
    case SAPLING_TX_VERSION:
        LogPrint("signtx", "%s: ZIP 243 sighash, branch id %08x\n", coin.strCoinName, nBranchId);
        return SigHasher(std::in_place_type<CZip243SigHasher>, nBranchId);
    default:
        LogPrint("signtx", "%s: rejecting transaction version %u\n", coin.strCoinName, tx.nVersion);
        throw SigningError(FailureType::DataError, "Unsupported version for overwintered transaction");
    }
}

COverwinteredSigner::COverwinteredSigner(const CoinInfo& coinIn, const CTxHeader& txIn) :
    coin(coinIn), tx(txIn), hasher(CreateSigHasher(txIn, coinIn)) {}

void COverwinteredSigner::ProcessInput(const CTxSigningInput& txin)
{
    std::visit([&](auto& h) {
        h.AddPrevout(txin.prevHash, txin.nPrevIndex);
        h.AddSequence(txin.nSequence);
    }, hasher);
}

void COverwinteredSigner::ProcessOutput(const CTxOut& txout)
{
    std::vector<unsigned char> vchTxOut;
    CVectorWriter writer(vchTxOut);
    writer << txout;
    ProcessOutput(vchTxOut);
}

void COverwinteredSigner::ProcessOutput(const std::vector<unsigned char>& vchTxOut)
{
    std::visit([&](auto& h) { h.AddOutput(vchTxOut); }, hasher);
}

uint256 COverwinteredSigner::SignatureHash(const CTxSigningInput& txin, uint32_t nHashType)
{
    return std::visit([&](auto& h) { return h.PreimageHash(coin, tx, txin, nHashType); }, hasher);
}

std::vector<unsigned char> COverwinteredSigner::SerializeHeader() const
{
    std::vector<unsigned char> vch;
    CVectorWriter writer(vch);
    WriteOverwinteredTxHeader(writer, tx);
    return vch;
}

std::vector<unsigned char> COverwinteredSigner::SerializeFooter() const
{
    std::vector<unsigned char> vch;
    CVectorWriter writer(vch);
    WriteOverwinteredTxFooter(writer, tx);
    return vch;
}

uint32_t COverwinteredSigner::GetBranchId() const
{
    return std::visit([](const auto& h) { return h.GetBranchId(); }, hasher);
}
