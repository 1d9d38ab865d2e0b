#include <gtest/gtest.h>

#include "signing/coininfo.h"

#include <stdexcept>

TEST(CoinInfoTest, KnownCoins) {
    const auto& coins = KnownCoins();
    ASSERT_EQ(coins.size(), 4u);

    for (const auto& coin : coins) {
        EXPECT_EQ(&CoinByName(coin.strCoinName), &coin);
        EXPECT_EQ(coin.nDecimals, 8u);
    }
}

TEST(CoinInfoTest, OverwinteredFlag) {
    EXPECT_TRUE(CoinByName("Zcash").fOverwintered);
    EXPECT_TRUE(CoinByName("Zcash Testnet").fOverwintered);
    EXPECT_TRUE(CoinByName("Komodo").fOverwintered);
    EXPECT_FALSE(CoinByName("Bitcoin").fOverwintered);
}

TEST(CoinInfoTest, AddressTypes) {
    const auto& zec = CoinByName("Zcash");
    EXPECT_EQ(zec.strCoinShortcut, "ZEC");
    EXPECT_EQ(zec.nAddressType, 7352u);
    EXPECT_EQ(zec.nAddressTypeP2SH, 7357u);

    const auto& taz = CoinByName("Zcash Testnet");
    EXPECT_EQ(taz.strCoinShortcut, "TAZ");
    EXPECT_EQ(taz.nAddressType, 7461u);
    EXPECT_EQ(taz.nAddressTypeP2SH, 7354u);
}

TEST(CoinInfoTest, UnknownCoin) {
    EXPECT_THROW(CoinByName("Zclassic"), std::runtime_error);
    EXPECT_THROW(CoinByName("zcash"), std::runtime_error);
}
