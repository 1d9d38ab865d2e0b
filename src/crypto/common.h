// Copyright (c) 2014 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZSIGHASH_CRYPTO_COMMON_H
#define ZSIGHASH_CRYPTO_COMMON_H

#include <endian.h>
#include <stdint.h>
#include <string.h>

#include <sodium.h>

void static inline WriteLE32(unsigned char* ptr, uint32_t x)
{
    uint32_t v = htole32(x);
    memcpy(ptr, (char*)&v, 4);
}

/**
 * Initializes libsodium and checks that the BLAKE2b personalization we rely
 * on behaves as expected. Returns -1 on failure.
 */
int inline init_and_check_sodium()
{
    if (sodium_init() == -1) {
        return -1;
    }

    // BLAKE2b-256 of the empty string under the ZIP 143 prevouts
    // personalization. This is the hashPrevouts of any transaction without
    // transparent inputs.
    static const unsigned char personal[crypto_generichash_blake2b_PERSONALBYTES] =
        {'Z','c','a','s','h','P','r','e','v','o','u','t','H','a','s','h'};
    static const unsigned char expected[32] =
      { 0xd5, 0x3a, 0x63, 0x3b, 0xbe, 0xcf, 0x82, 0xfe,
        0x9e, 0x94, 0x84, 0xd8, 0xa0, 0xe7, 0x27, 0xc7,
        0x3b, 0xb9, 0xe6, 0x8c, 0x96, 0xe7, 0x2d, 0xec,
        0x30, 0x14, 0x4f, 0x6a, 0x84, 0xaf, 0xa1, 0x36 };

    crypto_generichash_blake2b_state state;
    unsigned char digest[32];
    if (crypto_generichash_blake2b_init_salt_personal(&state, NULL, 0, 32, NULL, personal) != 0 ||
        crypto_generichash_blake2b_final(&state, digest, 32) != 0) {
        return -1;
    }
    if (sodium_memcmp(digest, expected, 32) != 0) {
        return -1;
    }

    return 0;
}

#endif // ZSIGHASH_CRYPTO_COMMON_H
