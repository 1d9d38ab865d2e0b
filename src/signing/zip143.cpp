// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "signing/zip143.h"

#include "crypto/common.h"
#include "logging.h"

#include <algorithm>
#include <stdexcept>

const Blake2bPersonalization ZCASH_PREVOUTS_HASH_PERSONALIZATION =
    {'Z','c','a','s','h','P','r','e','v','o','u','t','H','a','s','h'};
const Blake2bPersonalization ZCASH_SEQUENCE_HASH_PERSONALIZATION =
    {'Z','c','a','s','h','S','e','q','u','e','n','c','H','a','s','h'};
const Blake2bPersonalization ZCASH_OUTPUTS_HASH_PERSONALIZATION =
    {'Z','c','a','s','h','O','u','t','p','u','t','s','H','a','s','h'};

static const unsigned char ZCASH_SIGHASH_PERSONALIZATION_PREFIX[] =
    {'Z','c','a','s','h','S','i','g','H','a','s','h'};

Blake2bPersonalization SigHashPersonalization(uint32_t nBranchId)
{
    Blake2bPersonalization personalization;
    std::copy(std::begin(ZCASH_SIGHASH_PERSONALIZATION_PREFIX),
              std::end(ZCASH_SIGHASH_PERSONALIZATION_PREFIX),
              personalization.begin());
    WriteLE32(personalization.data() + 12, nBranchId);
    return personalization;
}

void CTransparentSigHasher::CheckHashType(uint32_t nHashType)
{
    if (nHashType != SIGHASH_ALL) {
        LogPrint("signtx", "%s: rejecting sighash type %08x\n", __func__, nHashType);
        throw SigningError(FailureType::DataError, "Unsupported sighash type");
    }
}

CTransparentDigests::CTransparentDigests() :
    prevouts(ZCASH_PREVOUTS_HASH_PERSONALIZATION),
    sequence(ZCASH_SEQUENCE_HASH_PERSONALIZATION),
    outputs(ZCASH_OUTPUTS_HASH_PERSONALIZATION),
    fFinalized(false) {}

void CTransparentDigests::AddPrevout(const std::vector<unsigned char>& prevHash, uint32_t n)
{
    if (fFinalized) {
        throw std::logic_error("AddPrevout called after the sighash commitments were finalized");
    }
    SerializePrevout(prevouts, prevHash, n);
}

void CTransparentDigests::AddSequence(uint32_t nSequence)
{
    if (fFinalized) {
        throw std::logic_error("AddSequence called after the sighash commitments were finalized");
    }
    ser_writedata32(sequence, nSequence);
}

void CTransparentDigests::AddOutput(const std::vector<unsigned char>& vchTxOut)
{
    if (fFinalized) {
        throw std::logic_error("AddOutput called after the sighash commitments were finalized");
    }
    if (!vchTxOut.empty()) {
        outputs.write((const char*)vchTxOut.data(), vchTxOut.size());
    }
}

void CTransparentDigests::Finalize()
{
    if (fFinalized) {
        return;
    }
    hashPrevouts = prevouts.GetHash();
    hashSequence = sequence.GetHash();
    hashOutputs = outputs.GetHash();
    fFinalized = true;

    LogPrint("sighash", "commitments: prevouts=%s sequence=%s outputs=%s\n",
        hashPrevouts.GetHex(), hashSequence.GetHex(), hashOutputs.GetHex());
}

const uint256& CTransparentDigests::GetPrevoutsHash()
{
    Finalize();
    return hashPrevouts;
}

const uint256& CTransparentDigests::GetSequenceHash()
{
    Finalize();
    return hashSequence;
}

const uint256& CTransparentDigests::GetOutputsHash()
{
    Finalize();
    return hashOutputs;
}

uint256 CZip143SigHasher::PreimageHash(const CoinInfo& coin, const CTxHeader& tx,
                                       const CTxSigningInput& txin, uint32_t nHashType)
{
    CBLAKE2bWriter ss(GetPersonalization());
    SerializePreimage(ss, coin, tx, txin, nHashType);
    return ss.GetHash();
}

uint256 CZip243SigHasher::PreimageHash(const CoinInfo& coin, const CTxHeader& tx,
                                       const CTxSigningInput& txin, uint32_t nHashType)
{
    CBLAKE2bWriter ss(GetPersonalization());
    SerializePreimage(ss, coin, tx, txin, nHashType);
    return ss.GetHash();
}
