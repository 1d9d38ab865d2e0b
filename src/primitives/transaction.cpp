// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin Core developers
// Copyright (c) 2016-2023 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "primitives/transaction.h"

#include "logging.h"
#include "utilstrencodings.h"

std::string CTxHeader::ToString() const
{
    return strprintf("CTxHeader(ver=%u, versiongroupid=%08x, branchid=%08x, locktime=%u, expiry=%u)",
        nVersion,
        nVersionGroupId,
        nBranchId,
        nLockTime,
        nExpiryHeight);
}

uint32_t DefaultVersionGroupId(uint32_t nVersion)
{
    switch (nVersion) {
    case OVERWINTER_TX_VERSION:
        return OVERWINTER_VERSION_GROUP_ID;
    case SAPLING_TX_VERSION:
        return SAPLING_VERSION_GROUP_ID;
    default:
        return 0;
    }
}

std::string CTxOut::ToString() const
{
    return strprintf("CTxOut(nValue=%d.%08d, scriptPubKey=%s)",
        nValue / 100000000, nValue % 100000000, HexStr(scriptPubKey).substr(0, 30));
}
