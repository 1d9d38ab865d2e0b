#include "gtest/utils.h"

#include "utilstrencodings.h"

CKeyID TestKeyID(unsigned char fill)
{
    return CKeyID(uint160(std::vector<unsigned char>(20, fill)));
}

std::vector<valtype> TestMultisigKeys()
{
    std::vector<valtype> keys;
    for (unsigned char i = 0; i < 3; i++) {
        valtype key(33, 0x21 + i);
        key[0] = (i == 1) ? 0x03 : 0x02;
        keys.push_back(key);
    }
    return keys;
}

std::vector<CTxSigningInput> TestInputs()
{
    std::vector<CTxSigningInput> vin(2);

    // Hashes are given in display order: 0x01..0x20 and 0x20..0x01.
    for (unsigned char i = 0; i < 32; i++) {
        vin[0].prevHash.push_back(i + 1);
        vin[1].prevHash.push_back(32 - i);
    }

    vin[0].nPrevIndex = 0;
    vin[0].nSequence = 0xfffffffe;
    vin[0].nAmount = 100000000;
    vin[0].scriptType = InputScriptType::SPENDADDRESS;
    vin[0].pubKeyHash = TestKeyID(0x11);

    vin[1].nPrevIndex = 1;
    vin[1].nSequence = 0xffffffff;
    vin[1].nAmount = 50000000;
    vin[1].scriptType = InputScriptType::SPENDMULTISIG;
    vin[1].multisig = CMultisigRedeemScriptType(TestMultisigKeys(), 2);

    return vin;
}

std::vector<CTxOut> TestOutputs()
{
    std::vector<CTxOut> vout;
    vout.push_back(CTxOut(149990000, GetScriptForDestination(TestKeyID(0x22))));
    vout.push_back(CTxOut(0, CScript() << OP_RETURN << ParseHex("7a736967")));
    return vout;
}

CTxHeader TestTxHeader(uint32_t nVersion, uint32_t nBranchId)
{
    CTxHeader tx;
    tx.nVersion = nVersion;
    tx.nVersionGroupId = DefaultVersionGroupId(nVersion);
    tx.nBranchId = nBranchId;
    tx.nLockTime = 500000;
    tx.nExpiryHeight = 500100;
    return tx;
}

std::string DigestHex(const uint256& hash)
{
    return HexStr(hash.begin(), hash.end());
}
