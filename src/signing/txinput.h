// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZSIGHASH_SIGNING_TXINPUT_H
#define ZSIGHASH_SIGNING_TXINPUT_H

#include "script/script.h"
#include "script/standard.h"

#include <optional>
#include <stdint.h>
#include <vector>

/** Size in bytes of a transaction hash. */
static const unsigned int TX_HASH_SIZE = 32;

/** How the requester declares an input is to be spent. */
enum class InputScriptType {
    SPENDADDRESS = 0,
    SPENDMULTISIG = 1,
    EXTERNAL = 2,
    SPENDWITNESS = 3,
    SPENDP2SHWITNESS = 4,
};

/** An ordered m-of-n multisig descriptor. The key order is significant. */
struct CMultisigRedeemScriptType
{
    std::vector<valtype> vPubKeys;
    uint32_t m;

    CMultisigRedeemScriptType() : m(0) {}
    CMultisigRedeemScriptType(std::vector<valtype> vPubKeysIn, uint32_t mIn) :
        vPubKeys(vPubKeysIn), m(mIn) {}
};

/**
 * One transparent input as seen by the signer. prevHash is in the byte order
 * it was received in (display order); it is reversed when serialized.
 */
struct CTxSigningInput
{
    std::vector<unsigned char> prevHash;
    uint32_t nPrevIndex;
    uint32_t nSequence;
    uint64_t nAmount;
    InputScriptType scriptType;
    std::optional<CMultisigRedeemScriptType> multisig;
    /** Hash160 of the signing key; used for the single-signature script code. */
    CKeyID pubKeyHash;

    CTxSigningInput() :
        nPrevIndex(0), nSequence(0xffffffff), nAmount(0),
        scriptType(InputScriptType::SPENDADDRESS) {}
};

#endif // ZSIGHASH_SIGNING_TXINPUT_H
