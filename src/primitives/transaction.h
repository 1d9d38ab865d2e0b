// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2016-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZSIGHASH_PRIMITIVES_TRANSACTION_H
#define ZSIGHASH_PRIMITIVES_TRANSACTION_H

#include "script/script.h"
#include "serialize.h"

#include <stdint.h>
#include <string>

// Overwinter transaction version group id
static constexpr uint32_t OVERWINTER_VERSION_GROUP_ID = 0x03C48270;
static_assert(OVERWINTER_VERSION_GROUP_ID != 0, "version group id must be non-zero as specified in ZIP 202");

// Overwinter transaction version
static const uint32_t OVERWINTER_TX_VERSION = 3;

// Sapling transaction version group id
static constexpr uint32_t SAPLING_VERSION_GROUP_ID = 0x892F2085;
static_assert(SAPLING_VERSION_GROUP_ID != 0, "version group id must be non-zero as specified in ZIP 202");

// Sapling transaction version
static const uint32_t SAPLING_TX_VERSION = 4;

// The fOverwintered bit of the transaction header.
static constexpr uint32_t OVERWINTERED_FLAG = 0x80000000;

/**
 * The transaction-wide fields a signer is given once per transaction.
 * nBranchId == 0 means "use the default for nVersion".
 */
struct CTxHeader
{
    uint32_t nVersion;
    uint32_t nVersionGroupId;
    uint32_t nBranchId;
    uint32_t nLockTime;
    uint32_t nExpiryHeight;

    CTxHeader() : nVersion(0), nVersionGroupId(0), nBranchId(0), nLockTime(0), nExpiryHeight(0) {}

    /** The serialized header word: nVersion with the fOverwintered bit set. */
    uint32_t GetHeader() const { return nVersion | OVERWINTERED_FLAG; }

    std::string ToString() const;
};

/** Returns the version group id that pairs with a transparent tx version, or 0. */
uint32_t DefaultVersionGroupId(uint32_t nVersion);

/** An output of a transaction.  It contains the public key that the next input
 * must be able to sign with to claim it.
 */
class CTxOut
{
public:
    uint64_t nValue;
    CScript scriptPubKey;

    CTxOut()
    {
        SetNull();
    }

    CTxOut(uint64_t nValueIn, CScript scriptPubKeyIn) : nValue(nValueIn), scriptPubKey(scriptPubKeyIn) {}

    template<typename Stream>
    void Serialize(Stream& s) const
    {
        ::Serialize(s, nValue);
        ::Serialize(s, scriptPubKey);
    }

    void SetNull()
    {
        nValue = 0;
        scriptPubKey.clear();
    }

    friend bool operator==(const CTxOut& a, const CTxOut& b)
    {
        return (a.nValue       == b.nValue &&
                a.scriptPubKey == b.scriptPubKey);
    }

    friend bool operator!=(const CTxOut& a, const CTxOut& b)
    {
        return !(a == b);
    }

    std::string ToString() const;
};

#endif // ZSIGHASH_PRIMITIVES_TRANSACTION_H
