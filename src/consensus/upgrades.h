// Copyright (c) 2018 The Zcash developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZSIGHASH_CONSENSUS_UPGRADES_H
#define ZSIGHASH_CONSENSUS_UPGRADES_H

#include <stdint.h>
#include <string>

namespace Consensus {

/**
 * Index into NetworkUpgradeInfo
 *
 * Being array indices, these MUST be numbered consecutively.
 *
 * The order of these indices MUST match the order of the upgrades on-chain.
 */
enum UpgradeIndex : uint32_t {
    // Sprout must be first
    BASE_SPROUT,
    UPGRADE_OVERWINTER,
    UPGRADE_SAPLING,
    // NOTE: Also add new upgrades to NetworkUpgradeInfo in upgrades.cpp
    MAX_NETWORK_UPGRADES
};

} // namespace Consensus

struct NUInfo {
    /** Branch ID (a random non-zero 32-bit value) */
    uint32_t nBranchId;
    /** User-facing name for the upgrade */
    std::string strName;
    /** User-facing information string about the upgrade */
    std::string strInfo;
};

extern const struct NUInfo NetworkUpgradeInfo[];

// Consensus branch id to identify pre-overwinter (Sprout) consensus rules.
extern const uint32_t SPROUT_BRANCH_ID;

/**
 * Returns true if a given branch id is a valid nBranchId for one of the network
 * upgrades contained in NetworkUpgradeInfo.
 */
bool IsConsensusBranchId(int branchId);

/**
 * Returns the upgrade that introduced the given transparent transaction
 * version: UPGRADE_OVERWINTER for v3, UPGRADE_SAPLING for v4, and
 * BASE_SPROUT for anything else.
 */
Consensus::UpgradeIndex UpgradeForTxVersion(uint32_t nVersion);

/**
 * Returns the branch ID a signer assumes when the request leaves it unset,
 * or 0 if the transaction version has no overwintered default.
 */
uint32_t DefaultBranchIdForTxVersion(uint32_t nVersion);

#endif // ZSIGHASH_CONSENSUS_UPGRADES_H
