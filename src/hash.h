// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2013 The Bitcoin Core developers
// Copyright (c) 2016-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZSIGHASH_HASH_H
#define ZSIGHASH_HASH_H

#include "serialize.h"
#include "uint256.h"

#include <sodium.h>

#include <array>

typedef std::array<unsigned char, crypto_generichash_blake2b_PERSONALBYTES> Blake2bPersonalization;

/** A writer stream (for serialization) that computes a 256-bit BLAKE2b hash.
 *
 * The personalization is fixed when the writer is constructed. GetHash()
 * finalizes the writer; any later write or GetHash() call throws
 * std::logic_error.
 */
class CBLAKE2bWriter
{
private:
    crypto_generichash_blake2b_state state;
    Blake2bPersonalization personalization;
    bool fFinalized;

public:
    explicit CBLAKE2bWriter(const Blake2bPersonalization& personal);

    CBLAKE2bWriter(const CBLAKE2bWriter&) = delete;
    CBLAKE2bWriter& operator=(const CBLAKE2bWriter&) = delete;
    CBLAKE2bWriter(CBLAKE2bWriter&&) = default;
    CBLAKE2bWriter& operator=(CBLAKE2bWriter&&) = default;

    CBLAKE2bWriter& write(const char *pch, size_t size);

    // invalidates the object
    uint256 GetHash();

    bool IsFinalized() const { return fFinalized; }
    const Blake2bPersonalization& GetPersonalization() const { return personalization; }

    template<typename T>
    CBLAKE2bWriter& operator<<(const T& obj) {
        // Serialize to this stream
        ::Serialize(*this, obj);
        return (*this);
    }
};

#endif // ZSIGHASH_HASH_H
