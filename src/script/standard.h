// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZSIGHASH_SCRIPT_STANDARD_H
#define ZSIGHASH_SCRIPT_STANDARD_H

#include "script/script.h"
#include "uint256.h"

#include <boost/variant.hpp>

#include <stdint.h>
#include <vector>

/** Size of a compressed secp256k1 public key. */
static const unsigned int COMPRESSED_PUBLIC_KEY_SIZE = 33;

/** Maximum number of keys in a bare multisig redeem script. */
static const unsigned int MAX_MULTISIG_PUBKEYS = 15;

/** A reference to a public key: the 160-bit hash of its serialization. */
class CKeyID : public uint160
{
public:
    CKeyID() : uint160() {}
    CKeyID(const uint160& in) : uint160(in) {}
};

class CNoDestination {
public:
    friend bool operator==(const CNoDestination &a, const CNoDestination &b) { return true; }
    friend bool operator<(const CNoDestination &a, const CNoDestination &b) { return true; }
};

/**
 * A txout script template with a specific destination. It is either:
 *  * CNoDestination: no destination set
 *  * CKeyID: TX_PUBKEYHASH destination
 */
typedef boost::variant<CNoDestination, CKeyID> CTxDestination;

bool IsValidDestination(const CTxDestination& dest);

CScript GetScriptForDestination(const CTxDestination& dest);

/**
 * Build the bare m-of-n redeem script for the given keys, in the order
 * given. The caller is responsible for validating nRequired and the keys.
 */
CScript GetScriptForMultisig(int nRequired, const std::vector<valtype>& keys);

#endif // ZSIGHASH_SCRIPT_STANDARD_H
