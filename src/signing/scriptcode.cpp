// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "signing/scriptcode.h"

#include "logging.h"
#include "script/standard.h"
#include "signing/signing_error.h"

CScript MultisigScriptCode(const CMultisigRedeemScriptType& multisig)
{
    size_t n = multisig.vPubKeys.size();
    if (n < 1 || n > MAX_MULTISIG_PUBKEYS || multisig.m < 1 || multisig.m > n) {
        throw SigningError(FailureType::DataError, "Invalid multisig parameters");
    }
    for (const valtype& pubkey : multisig.vPubKeys) {
        if (pubkey.size() != COMPRESSED_PUBLIC_KEY_SIZE) {
            throw SigningError(FailureType::DataError, "Invalid multisig parameters");
        }
    }
    return GetScriptForMultisig(multisig.m, multisig.vPubKeys);
}

CScript DeriveScriptCode(const CTxSigningInput& txin)
{
    if (txin.multisig) {
        return MultisigScriptCode(*txin.multisig);
    }

    if (txin.scriptType == InputScriptType::SPENDADDRESS) {
        return GetScriptForDestination(txin.pubKeyHash);
    }

    LogPrint("signtx", "%s: no script code for input script type %d\n",
        __func__, static_cast<int>(txin.scriptType));
    throw SigningError(FailureType::DataError, "Unknown input script type for zip143 script code");
}
