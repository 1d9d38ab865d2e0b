// Copyright (c) 2018-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "signing/coininfo.h"

#include "logging.h"

#include <stdexcept>

const std::vector<CoinInfo>& KnownCoins()
{
    static const std::vector<CoinInfo> vCoins = {
        {
            /*.strCoinName =*/ "Bitcoin",
            /*.strCoinShortcut =*/ "BTC",
            /*.nDecimals =*/ 8,
            /*.nAddressType =*/ 0,
            /*.nAddressTypeP2SH =*/ 5,
            /*.fOverwintered =*/ false,
        },
        {
            /*.strCoinName =*/ "Komodo",
            /*.strCoinShortcut =*/ "KMD",
            /*.nDecimals =*/ 8,
            /*.nAddressType =*/ 60,
            /*.nAddressTypeP2SH =*/ 85,
            /*.fOverwintered =*/ true,
        },
        {
            /*.strCoinName =*/ "Zcash",
            /*.strCoinShortcut =*/ "ZEC",
            /*.nDecimals =*/ 8,
            /*.nAddressType =*/ 7352,
            /*.nAddressTypeP2SH =*/ 7357,
            /*.fOverwintered =*/ true,
        },
        {
            /*.strCoinName =*/ "Zcash Testnet",
            /*.strCoinShortcut =*/ "TAZ",
            /*.nDecimals =*/ 8,
            /*.nAddressType =*/ 7461,
            /*.nAddressTypeP2SH =*/ 7354,
            /*.fOverwintered =*/ true,
        },
    };
    return vCoins;
}

const CoinInfo& CoinByName(const std::string& strName)
{
    for (const CoinInfo& coin : KnownCoins()) {
        if (coin.strCoinName == strName) {
            return coin;
        }
    }
    throw std::runtime_error(strprintf("%s: Unknown coin %s.", __func__, strName));
}
