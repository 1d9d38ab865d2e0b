#include <gtest/gtest.h>

#include "gtest/utils.h"
#include "signing/scriptcode.h"
#include "signing/signing_error.h"
#include "utilstrencodings.h"

TEST(ScriptCodeTest, PayToAddress) {
    CTxSigningInput txin;
    txin.scriptType = InputScriptType::SPENDADDRESS;
    txin.pubKeyHash = TestKeyID(0x11);

    CScript scriptCode = DeriveScriptCode(txin);
    EXPECT_EQ(HexStr(scriptCode), "76a914111111111111111111111111111111111111111188ac");
    EXPECT_EQ(scriptCode, GetScriptForDestination(txin.pubKeyHash));
    EXPECT_EQ(scriptCode.ToString(),
              "OP_DUP OP_HASH160 1111111111111111111111111111111111111111 OP_EQUALVERIFY OP_CHECKSIG");
}

TEST(ScriptCodeTest, MultisigUsesDescriptorOrder) {
    auto keys = TestMultisigKeys();

    CTxSigningInput txin;
    txin.scriptType = InputScriptType::SPENDMULTISIG;
    txin.multisig = CMultisigRedeemScriptType(keys, 2);

    CScript expected = CScript() << OP_2 << keys[0] << keys[1] << keys[2] << OP_3 << OP_CHECKMULTISIG;
    EXPECT_EQ(DeriveScriptCode(txin), expected);

    // Reordering the descriptor reorders the script; nothing is sorted.
    std::vector<valtype> reversed(keys.rbegin(), keys.rend());
    txin.multisig = CMultisigRedeemScriptType(reversed, 2);
    CScript reorderedCode = DeriveScriptCode(txin);
    EXPECT_NE(reorderedCode, expected);
    EXPECT_EQ(reorderedCode, CScript() << OP_2 << keys[2] << keys[1] << keys[0] << OP_3 << OP_CHECKMULTISIG);
}

TEST(ScriptCodeTest, MultisigTakesPrecedenceOverScriptType) {
    CTxSigningInput txin;
    txin.scriptType = InputScriptType::SPENDADDRESS;
    txin.pubKeyHash = TestKeyID(0x11);
    txin.multisig = CMultisigRedeemScriptType(TestMultisigKeys(), 1);

    EXPECT_EQ(DeriveScriptCode(txin), MultisigScriptCode(*txin.multisig));
    EXPECT_EQ(DeriveScriptCode(txin)[0], OP_1);
}

TEST(ScriptCodeTest, RejectsOtherScriptTypes) {
    for (auto scriptType : {InputScriptType::EXTERNAL,
                            InputScriptType::SPENDWITNESS,
                            InputScriptType::SPENDP2SHWITNESS,
                            InputScriptType::SPENDMULTISIG}) {
        CTxSigningInput txin;
        txin.scriptType = scriptType;
        try {
            DeriveScriptCode(txin);
            FAIL() << "Expected SigningError for script type " << static_cast<int>(scriptType);
        } catch (const SigningError& e) {
            EXPECT_EQ(e.GetType(), FailureType::DataError);
            EXPECT_EQ(std::string(e.what()), "Unknown input script type for zip143 script code");
        }
    }
}

TEST(ScriptCodeTest, RejectsInvalidMultisig) {
    auto keys = TestMultisigKeys();

    // m out of range
    EXPECT_THROW(MultisigScriptCode(CMultisigRedeemScriptType(keys, 0)), SigningError);
    EXPECT_THROW(MultisigScriptCode(CMultisigRedeemScriptType(keys, 4)), SigningError);

    // no keys
    EXPECT_THROW(MultisigScriptCode(CMultisigRedeemScriptType(std::vector<valtype>(), 1)), SigningError);

    // too many keys
    std::vector<valtype> many(16, keys[0]);
    EXPECT_THROW(MultisigScriptCode(CMultisigRedeemScriptType(many, 2)), SigningError);

    // uncompressed key
    auto bad = keys;
    bad[1] = valtype(65, 0x04);
    EXPECT_THROW(MultisigScriptCode(CMultisigRedeemScriptType(bad, 2)), SigningError);

    // fifteen keys is the limit
    std::vector<valtype> fifteen(15, keys[0]);
    EXPECT_NO_THROW(MultisigScriptCode(CMultisigRedeemScriptType(fifteen, 15)));
}

TEST(ScriptCodeTest, Destinations) {
    EXPECT_FALSE(IsValidDestination(CNoDestination()));
    EXPECT_TRUE(GetScriptForDestination(CNoDestination()).empty());

    CTxDestination dest = TestKeyID(0x33);
    EXPECT_TRUE(IsValidDestination(dest));
    EXPECT_EQ(GetScriptForDestination(dest).size(), 25u);
}
