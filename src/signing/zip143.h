// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZSIGHASH_SIGNING_ZIP143_H
#define ZSIGHASH_SIGNING_ZIP143_H

#include "hash.h"
#include "primitives/transaction.h"
#include "serialize.h"
#include "signing/coininfo.h"
#include "signing/scriptcode.h"
#include "signing/signing_error.h"
#include "signing/txinput.h"
#include "uint256.h"

#include <stdint.h>
#include <vector>

/** Signature hash types/flags */
enum
{
    SIGHASH_ALL = 1,
    SIGHASH_NONE = 2,
    SIGHASH_SINGLE = 3,
    SIGHASH_ANYONECANPAY = 0x80,
};

extern const Blake2bPersonalization ZCASH_PREVOUTS_HASH_PERSONALIZATION;
extern const Blake2bPersonalization ZCASH_SEQUENCE_HASH_PERSONALIZATION;
extern const Blake2bPersonalization ZCASH_OUTPUTS_HASH_PERSONALIZATION;

/** "ZcashSigHash" || LE32(nBranchId) */
Blake2bPersonalization SigHashPersonalization(uint32_t nBranchId);

/** Digest of the shielded components this signer never produces. */
static const uint256 ZERO_HASH;

/** Serialize an outpoint: the received transaction hash reversed, then LE32 n. */
template<typename Stream>
void SerializePrevout(Stream& s, const std::vector<unsigned char>& prevHash, uint32_t n)
{
    if (prevHash.size() != TX_HASH_SIZE) {
        throw SigningError(FailureType::DataError, "Invalid previous transaction hash");
    }
    ser_writereversed(s, prevHash);
    ser_writedata32(s, n);
}

/**
 * The three commitment digests shared by every input's preimage:
 * hashPrevouts, hashSequence and hashOutputs.
 *
 * Everything must be added before the first Get*Hash() call, which
 * finalizes all three writers. Adding afterwards throws std::logic_error.
 */
class CTransparentDigests
{
private:
    CBLAKE2bWriter prevouts;
    CBLAKE2bWriter sequence;
    CBLAKE2bWriter outputs;

    bool fFinalized;
    uint256 hashPrevouts;
    uint256 hashSequence;
    uint256 hashOutputs;

    void Finalize();

public:
    CTransparentDigests();

    void AddPrevout(const std::vector<unsigned char>& prevHash, uint32_t n);
    void AddSequence(uint32_t nSequence);
    /** Add one serialized transaction output. */
    void AddOutput(const std::vector<unsigned char>& vchTxOut);

    bool IsFinalized() const { return fFinalized; }

    const uint256& GetPrevoutsHash();
    const uint256& GetSequenceHash();
    const uint256& GetOutputsHash();
};

/**
 * State common to the ZIP 143 and ZIP 243 sighash strategies: the consensus
 * branch id and the commitment digests.
 */
class CTransparentSigHasher
{
protected:
    uint32_t nBranchId;
    CTransparentDigests digests;

    explicit CTransparentSigHasher(uint32_t nBranchIdIn) : nBranchId(nBranchIdIn) {}

    /**
     * Only SIGHASH_ALL is signed. NONE, SINGLE and ANYONECANPAY would narrow
     * or zero the commitments, which this signer never does, so they are
     * rejected with a DataError.
     */
    static void CheckHashType(uint32_t nHashType);

    // The signed input: outpoint, scriptCode, value, nSequence.
    template<typename Stream>
    void SerializeInput(Stream& s, const CTxSigningInput& txin, const CScript& scriptCode) const
    {
        SerializePrevout(s, txin.prevHash, txin.nPrevIndex);
        ::Serialize(s, scriptCode);
        ser_writedata64(s, txin.nAmount);
        ser_writedata32(s, txin.nSequence);
    }

public:
    CTransparentSigHasher(const CTransparentSigHasher&) = delete;
    CTransparentSigHasher& operator=(const CTransparentSigHasher&) = delete;
    CTransparentSigHasher(CTransparentSigHasher&&) = default;
    CTransparentSigHasher& operator=(CTransparentSigHasher&&) = default;

    uint32_t GetBranchId() const { return nBranchId; }
    Blake2bPersonalization GetPersonalization() const { return SigHashPersonalization(nBranchId); }

    void AddPrevout(const std::vector<unsigned char>& prevHash, uint32_t n) { digests.AddPrevout(prevHash, n); }
    void AddSequence(uint32_t nSequence) { digests.AddSequence(nSequence); }
    void AddOutput(const std::vector<unsigned char>& vchTxOut) { digests.AddOutput(vchTxOut); }

    const uint256& GetPrevoutsHash() { return digests.GetPrevoutsHash(); }
    const uint256& GetSequenceHash() { return digests.GetSequenceHash(); }
    const uint256& GetOutputsHash() { return digests.GetOutputsHash(); }
};

/** ZIP 143 (Overwinter, v3) transparent signature hash. */
class CZip143SigHasher : public CTransparentSigHasher
{
public:
    static const uint32_t TX_VERSION = OVERWINTER_TX_VERSION;

    explicit CZip143SigHasher(uint32_t nBranchIdIn) : CTransparentSigHasher(nBranchIdIn) {}

    /** Write the full preimage for txin to s. */
    template<typename Stream>
    void SerializePreimage(Stream& s, const CoinInfo& coin, const CTxHeader& tx,
                           const CTxSigningInput& txin, uint32_t nHashType)
    {
        ensure(coin.fOverwintered, "ZIP 143 sighash requires an overwintered coin");
        ensure(tx.nVersion == TX_VERSION, "ZIP 143 sighash requires a version 3 transaction");
        CheckHashType(nHashType);

        CScript scriptCode = DeriveScriptCode(txin);

        // 1. nVersion | fOverwintered
        ser_writedata32(s, tx.GetHeader());
        // 2. nVersionGroupId
        ser_writedata32(s, tx.nVersionGroupId);
        // 3. hashPrevouts
        ::Serialize(s, GetPrevoutsHash());
        // 4. hashSequence
        ::Serialize(s, GetSequenceHash());
        // 5. hashOutputs
        ::Serialize(s, GetOutputsHash());
        // 6. hashJoinSplits
        ::Serialize(s, ZERO_HASH);
        // 7. nLockTime
        ser_writedata32(s, tx.nLockTime);
        // 8. expiryHeight
        ser_writedata32(s, tx.nExpiryHeight);
        // 9. nHashType
        ser_writedata32(s, nHashType);
        // 10. outpoint, scriptCode, value, nSequence
        SerializeInput(s, txin, scriptCode);
    }

    uint256 PreimageHash(const CoinInfo& coin, const CTxHeader& tx,
                         const CTxSigningInput& txin, uint32_t nHashType);
};

/**
 * ZIP 243 (Sapling, v4) transparent signature hash. The shielded digests
 * and valueBalance are always zero since no shielded components are signed.
 */
class CZip243SigHasher : public CTransparentSigHasher
{
public:
    static const uint32_t TX_VERSION = SAPLING_TX_VERSION;

    explicit CZip243SigHasher(uint32_t nBranchIdIn) : CTransparentSigHasher(nBranchIdIn) {}

    template<typename Stream>
    void SerializePreimage(Stream& s, const CoinInfo& coin, const CTxHeader& tx,
                           const CTxSigningInput& txin, uint32_t nHashType)
    {
        ensure(coin.fOverwintered, "ZIP 243 sighash requires an overwintered coin");
        ensure(tx.nVersion == TX_VERSION, "ZIP 243 sighash requires a version 4 transaction");
        CheckHashType(nHashType);

        CScript scriptCode = DeriveScriptCode(txin);

        // 1. nVersion | fOverwintered
        ser_writedata32(s, tx.GetHeader());
        // 2. nVersionGroupId
        ser_writedata32(s, tx.nVersionGroupId);
        // 3. hashPrevouts
        ::Serialize(s, GetPrevoutsHash());
        // 4. hashSequence
        ::Serialize(s, GetSequenceHash());
        // 5. hashOutputs
        ::Serialize(s, GetOutputsHash());
        // 6. hashJoinSplits
        ::Serialize(s, ZERO_HASH);
        // 7. hashShieldedSpends
        ::Serialize(s, ZERO_HASH);
        // 8. hashShieldedOutputs
        ::Serialize(s, ZERO_HASH);
        // 9. nLockTime
        ser_writedata32(s, tx.nLockTime);
        // 10. expiryHeight
        ser_writedata32(s, tx.nExpiryHeight);
        // 11. valueBalance
        ser_writedata64(s, 0);
        // 12. nHashType
        ser_writedata32(s, nHashType);
        // 13. outpoint, scriptCode, value, nSequence
        SerializeInput(s, txin, scriptCode);
    }

    uint256 PreimageHash(const CoinInfo& coin, const CTxHeader& tx,
                         const CTxSigningInput& txin, uint32_t nHashType);
};

#endif // ZSIGHASH_SIGNING_ZIP143_H
