// Copyright (c) 2013-2014 The Bitcoin Core developers
// Copyright (c) 2016-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "hash.h"

#include <stdexcept>

CBLAKE2bWriter::CBLAKE2bWriter(const Blake2bPersonalization& personal) :
    personalization(personal), fFinalized(false)
{
    if (crypto_generichash_blake2b_init_salt_personal(
            &state,
            NULL, 0, // No key.
            32,
            NULL,    // No salt.
            personalization.data()) != 0) {
        throw std::runtime_error("CBLAKE2bWriter: BLAKE2b initialization failed");
    }
}

CBLAKE2bWriter& CBLAKE2bWriter::write(const char *pch, size_t size)
{
    if (fFinalized) {
        throw std::logic_error("CBLAKE2bWriter: write after GetHash()");
    }
    crypto_generichash_blake2b_update(&state, (const unsigned char*)pch, size);
    return (*this);
}

uint256 CBLAKE2bWriter::GetHash()
{
    if (fFinalized) {
        throw std::logic_error("CBLAKE2bWriter: GetHash() called twice");
    }
    fFinalized = true;

    uint256 result;
    if (crypto_generichash_blake2b_final(&state, result.begin(), 32) != 0) {
        throw std::runtime_error("CBLAKE2bWriter: BLAKE2b finalization failed");
    }
    return result;
}
