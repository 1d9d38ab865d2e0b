#include <gtest/gtest.h>

#include "consensus/upgrades.h"
#include "primitives/transaction.h"

TEST(UpgradesTest, BranchIds) {
    EXPECT_EQ(SPROUT_BRANCH_ID, 0u);
    EXPECT_EQ(NetworkUpgradeInfo[Consensus::UPGRADE_OVERWINTER].nBranchId, 0x5ba81b19u);
    EXPECT_EQ(NetworkUpgradeInfo[Consensus::UPGRADE_SAPLING].nBranchId, 0x76b809bbu);
    EXPECT_EQ(NetworkUpgradeInfo[Consensus::UPGRADE_SAPLING].strName, "Sapling");
}

TEST(UpgradesTest, IsConsensusBranchId) {
    EXPECT_TRUE(IsConsensusBranchId(0));
    EXPECT_TRUE(IsConsensusBranchId(0x5ba81b19));
    EXPECT_TRUE(IsConsensusBranchId(0x76b809bb));
    EXPECT_FALSE(IsConsensusBranchId(0x2bb40e60));
    EXPECT_FALSE(IsConsensusBranchId(1));
}

TEST(UpgradesTest, UpgradeForTxVersion) {
    EXPECT_EQ(UpgradeForTxVersion(1), Consensus::BASE_SPROUT);
    EXPECT_EQ(UpgradeForTxVersion(2), Consensus::BASE_SPROUT);
    EXPECT_EQ(UpgradeForTxVersion(OVERWINTER_TX_VERSION), Consensus::UPGRADE_OVERWINTER);
    EXPECT_EQ(UpgradeForTxVersion(SAPLING_TX_VERSION), Consensus::UPGRADE_SAPLING);
    EXPECT_EQ(UpgradeForTxVersion(5), Consensus::BASE_SPROUT);
}

TEST(UpgradesTest, DefaultBranchIdForTxVersion) {
    EXPECT_EQ(DefaultBranchIdForTxVersion(OVERWINTER_TX_VERSION), 0x5ba81b19u);
    EXPECT_EQ(DefaultBranchIdForTxVersion(SAPLING_TX_VERSION), 0x76b809bbu);
    EXPECT_EQ(DefaultBranchIdForTxVersion(2), 0u);
}

TEST(UpgradesTest, DefaultVersionGroupId) {
    EXPECT_EQ(DefaultVersionGroupId(OVERWINTER_TX_VERSION), OVERWINTER_VERSION_GROUP_ID);
    EXPECT_EQ(DefaultVersionGroupId(SAPLING_TX_VERSION), SAPLING_VERSION_GROUP_ID);
    EXPECT_EQ(DefaultVersionGroupId(1), 0u);
}
