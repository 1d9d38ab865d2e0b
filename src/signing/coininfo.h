// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZSIGHASH_SIGNING_COININFO_H
#define ZSIGHASH_SIGNING_COININFO_H

#include <stdint.h>
#include <string>
#include <vector>

/**
 * Static per-network facts a signer needs. fOverwintered gates the
 * Overwinter/Sapling sighash strategies.
 */
struct CoinInfo
{
    std::string strCoinName;
    std::string strCoinShortcut;
    unsigned int nDecimals;
    uint32_t nAddressType;
    uint32_t nAddressTypeP2SH;
    bool fOverwintered;
};

/** All coins known to this build, in a fixed order. */
const std::vector<CoinInfo>& KnownCoins();

/**
 * Return the coin with the given name (e.g. "Zcash").
 * @throws std::runtime_error if the coin is unknown.
 */
const CoinInfo& CoinByName(const std::string& strName);

#endif // ZSIGHASH_SIGNING_COININFO_H
