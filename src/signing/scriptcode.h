// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZSIGHASH_SIGNING_SCRIPTCODE_H
#define ZSIGHASH_SIGNING_SCRIPTCODE_H

#include "script/script.h"
#include "signing/txinput.h"

/**
 * Derive the scriptCode that stands in for the spent output's script in a
 * ZIP 143 / ZIP 243 preimage.
 *
 * Multisig inputs yield the bare m-of-n redeem script in descriptor order;
 * SPENDADDRESS inputs yield the P2PKH script for txin.pubKeyHash.
 *
 * @throws SigningError(DataError) for any other input shape, or for a
 *         malformed multisig descriptor.
 */
CScript DeriveScriptCode(const CTxSigningInput& txin);

/** Validate and build the redeem script for a multisig descriptor. */
CScript MultisigScriptCode(const CMultisigRedeemScriptType& multisig);

#endif // ZSIGHASH_SIGNING_SCRIPTCODE_H
