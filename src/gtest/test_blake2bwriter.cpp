#include <gtest/gtest.h>

#include "gtest/utils.h"
#include "hash.h"
#include "signing/zip143.h"

#include <stdexcept>
#include <string>

TEST(BLAKE2bWriter, Personalized) {
    CBLAKE2bWriter ss(ZCASH_OUTPUTS_HASH_PERSONALIZATION);
    ss.write("abc", 3);
    EXPECT_EQ(DigestHex(ss.GetHash()),
              "507c0c547b18c3ffbb6ac8b47f47fd8c3933c8d396605e5e4b7c8b9a701a768c");
}

TEST(BLAKE2bWriter, WritesAreConcatenated) {
    CBLAKE2bWriter ss(ZCASH_OUTPUTS_HASH_PERSONALIZATION);
    ss.write("abc", 3);
    ss.write("", 0);
    ss.write("def", 3);
    EXPECT_EQ(DigestHex(ss.GetHash()),
              "36ada6ea0cb24284bb48f60c6ae4d6ab1a8b5d208303abf64e7f4a3d3124b5c4");
}

TEST(BLAKE2bWriter, PersonalizationSeparatesDomains) {
    CBLAKE2bWriter outputs(ZCASH_OUTPUTS_HASH_PERSONALIZATION);
    CBLAKE2bWriter sequence(ZCASH_SEQUENCE_HASH_PERSONALIZATION);
    outputs.write("abc", 3);
    sequence.write("abc", 3);
    uint256 hashOutputs = outputs.GetHash();
    uint256 hashSequence = sequence.GetHash();
    EXPECT_NE(hashOutputs, hashSequence);
    EXPECT_EQ(DigestHex(hashSequence),
              "3d93013a79099c93f2856a9662a98b4d05cb6239a59656dd8cd4d4654b44e15e");
    EXPECT_EQ(sequence.GetPersonalization(), ZCASH_SEQUENCE_HASH_PERSONALIZATION);
}

TEST(BLAKE2bWriter, SerializesLittleEndian) {
    CBLAKE2bWriter ss(ZCASH_SEQUENCE_HASH_PERSONALIZATION);
    ss << (uint32_t)1;
    EXPECT_EQ(DigestHex(ss.GetHash()),
              "025f002d150a1c000893447042fe642b38e880890fcdd13907fa5e1325f7ffbb");
}

TEST(BLAKE2bWriter, FinalizesOnce) {
    CBLAKE2bWriter ss(ZCASH_PREVOUTS_HASH_PERSONALIZATION);
    EXPECT_FALSE(ss.IsFinalized());
    EXPECT_EQ(DigestHex(ss.GetHash()),
              "d53a633bbecf82fe9e9484d8a0e727c73bb9e68c96e72dec30144f6a84afa136");
    EXPECT_TRUE(ss.IsFinalized());

    EXPECT_THROW(ss.write("a", 1), std::logic_error);
    EXPECT_THROW(ss.GetHash(), std::logic_error);
}
