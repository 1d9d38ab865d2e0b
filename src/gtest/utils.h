#ifndef ZSIGHASH_GTEST_UTILS_H
#define ZSIGHASH_GTEST_UTILS_H

#include "primitives/transaction.h"
#include "script/standard.h"
#include "signing/txinput.h"
#include "uint256.h"

#include <string>
#include <vector>

// A fixed 2-in 2-out transparent transaction. Input 0 is P2PKH, input 1 is
// a 2-of-3 multisig.
std::vector<CTxSigningInput> TestInputs();
std::vector<CTxOut> TestOutputs();
CTxHeader TestTxHeader(uint32_t nVersion, uint32_t nBranchId = 0);

CKeyID TestKeyID(unsigned char fill);
std::vector<valtype> TestMultisigKeys();

/** Digest bytes in the order they were produced. */
std::string DigestHex(const uint256& hash);

#endif // ZSIGHASH_GTEST_UTILS_H
