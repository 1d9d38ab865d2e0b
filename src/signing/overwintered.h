// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZSIGHASH_SIGNING_OVERWINTERED_H
#define ZSIGHASH_SIGNING_OVERWINTERED_H

#include "primitives/transaction.h"
#include "serialize.h"
#include "signing/coininfo.h"
#include "signing/signing_error.h"
#include "signing/txinput.h"
#include "signing/zip143.h"
#include "uint256.h"

#include <variant>
#include <vector>

/** The sighash strategy for one transaction, fixed when the version is known. */
typedef std::variant<CZip143SigHasher, CZip243SigHasher> SigHasher;

/**
 * Select the sighash strategy for tx: ZIP 143 for v3 and ZIP 243 for v4. A
 * zero tx.nBranchId is replaced by the default branch for the version.
 *
 * @throws std::logic_error if coin is not overwintered.
 * @throws SigningError(DataError) for any other transaction version.
 */
SigHasher CreateSigHasher(const CTxHeader& tx, const CoinInfo& coin);

/** Write nVersion | fOverwintered, then nVersionGroupId. */
template<typename Stream>
void WriteOverwinteredTxHeader(Stream& s, const CTxHeader& tx)
{
    ser_writedata32(s, tx.GetHeader());
    ser_writedata32(s, tx.nVersionGroupId);
}

/**
 * Write the fields following the transparent outputs. The shielded
 * components are always empty.
 */
template<typename Stream>
void WriteOverwinteredTxFooter(Stream& s, const CTxHeader& tx)
{
    ser_writedata32(s, tx.nLockTime);
    if (tx.nVersion == OVERWINTER_TX_VERSION) {
        ser_writedata32(s, tx.nExpiryHeight);
        WriteCompactSize(s, 0); // nJoinSplit
    } else if (tx.nVersion == SAPLING_TX_VERSION) {
        ser_writedata32(s, tx.nExpiryHeight);
        ser_writedata64(s, 0);  // valueBalance
        WriteCompactSize(s, 0); // nShieldedSpend
        WriteCompactSize(s, 0); // nShieldedOutput
        WriteCompactSize(s, 0); // nJoinSplit
    } else {
        throw SigningError(FailureType::DataError, "Unsupported version for overwintered transaction");
    }
}

/**
 * Bridges the sighash strategies into a two-pass signing flow.
 *
 * The first pass feeds every input with ProcessInput() and every output with
 * ProcessOutput(). The second pass asks SignatureHash() for each input being
 * signed. Inputs and outputs cannot be added once the first signature hash
 * has been computed.
 */
class COverwinteredSigner
{
public:
    COverwinteredSigner(const CoinInfo& coinIn, const CTxHeader& txIn);

    /** Commit txin's outpoint and sequence number. */
    void ProcessInput(const CTxSigningInput& txin);
    void ProcessOutput(const CTxOut& txout);
    /** Commit an output that is already serialized. */
    void ProcessOutput(const std::vector<unsigned char>& vchTxOut);

    uint256 SignatureHash(const CTxSigningInput& txin, uint32_t nHashType);

    std::vector<unsigned char> SerializeHeader() const;
    std::vector<unsigned char> SerializeFooter() const;

    uint32_t GetBranchId() const;
    const CTxHeader& GetTxHeader() const { return tx; }
    const SigHasher& GetSigHasher() const { return hasher; }

private:
    const CoinInfo coin;
    const CTxHeader tx;
    SigHasher hasher;
};

#endif // ZSIGHASH_SIGNING_OVERWINTERED_H
