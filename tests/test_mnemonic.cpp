#include <gtest/gtest.h>
#include <algorithm>
#include "error.hpp"
#include "hex_utils.hpp"
#include "mnemonic.hpp"

namespace cosmkit {
namespace {

struct Bip39Vector {
    const char* entropy;
    const char* phrase;
    const char* seed;
};

// Reference vectors, passphrase "TREZOR"
const Bip39Vector kVectors[] = {
    {"00000000000000000000000000000000",
     "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about",
     "c55257c360c07c72029aebc1b53c05ed0362ada38ead3e3e9efa3708e53495531f09a6987599d18264c1e1c92f2cf141630c7a3c4ab7c81b2f001698e7463b04"},
    {"7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f",
     "legal winner thank year wave sausage worth useful legal winner thank yellow",
     "2e8905819b8723fe2c1d161860e5ee1830318dbf49a83bd451cfb8440c28bd6fa457fe1296106559a3c80937a1c1069be3a3a5bd381ee6260e8d9739fce1f607"},
    {"80808080808080808080808080808080",
     "letter advice cage absurd amount doctor acoustic avoid letter advice cage above",
     "d71de856f81a8acc65e6fc851a38d4d7ec216fd0796d0a6827a3ad6ed5511a30fa280f12eb2e47ed2ac03b5c462a0358d18d69fe4f985ec81778c1b370b652a8"},
    {"ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff",
     "zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo vote",
     "dd48c104698c30cfe2b6142103248622fb7bb0ff692eebb00089b32d22484e1613912f0a5b694407be899ffd31ed3992c456cdf60f5d4564b8ba3f05a69890ad"},
    {"9e885d952ad362caeb4efe34a8e91bd2",
     "ozone drill grab fiber curtain grace pudding thank cruise elder eight picnic",
     "274ddc525802f7c828d8ef7ddbcdc5304e87ac3535913611fbbfa986d0c9e5476c91689f9c8a54fd55bd38606aa6a8595ad213d4c9c9f9aca3fb217069a41028"},
};

class MnemonicVectorTest : public ::testing::TestWithParam<Bip39Vector> {};

TEST_P(MnemonicVectorTest, EntropyToPhrase) {
    const auto& v = GetParam();
    auto mnemonic = Mnemonic::from_entropy(HexUtils::decode(v.entropy));
    EXPECT_EQ(mnemonic.phrase(), v.phrase);
}

TEST_P(MnemonicVectorTest, PhraseToEntropy) {
    const auto& v = GetParam();
    EXPECT_EQ(HexUtils::encode(Mnemonic::parse(v.phrase).to_entropy()), v.entropy);
}

TEST_P(MnemonicVectorTest, PhraseToSeed) {
    const auto& v = GetParam();
    auto seed = Mnemonic::parse(v.phrase).to_seed("TREZOR");
    EXPECT_EQ(HexUtils::encode(seed.span()), v.seed);
}

INSTANTIATE_TEST_SUITE_P(Bip39, MnemonicVectorTest, ::testing::ValuesIn(kVectors));

// ============================================================================
// Parsing
// ============================================================================

TEST(MnemonicTest, NormalizesCaseAndWhitespace) {
    auto mnemonic = Mnemonic::parse(
        "  Legal WINNER thank year\twave sausage worth useful legal  winner thank yellow\n");
    EXPECT_EQ(mnemonic.phrase(), "legal winner thank year wave sausage worth useful legal winner thank yellow");
    EXPECT_EQ(mnemonic.word_count(), 12u);
    EXPECT_EQ(mnemonic.words().front(), "legal");
}

TEST(MnemonicTest, RejectsBadChecksum) {
    try {
        Mnemonic::parse("abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon");
        FAIL() << "Expected PhraseError";
    } catch (const PhraseError& e) {
        EXPECT_EQ(e.type(), PhraseError::ErrorType::InvalidChecksum);
    }
}

TEST(MnemonicTest, RejectsUnknownWord) {
    try {
        Mnemonic::parse("abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon bitcoinz");
        FAIL() << "Expected PhraseError";
    } catch (const PhraseError& e) {
        EXPECT_EQ(e.type(), PhraseError::ErrorType::UnknownWord);
    }
}

TEST(MnemonicTest, RejectsWrongWordCount) {
    try {
        Mnemonic::validate("abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about");
        FAIL() << "Expected PhraseError";
    } catch (const PhraseError& e) {
        EXPECT_EQ(e.type(), PhraseError::ErrorType::InvalidLength);
    }
    EXPECT_THROW(Mnemonic::validate(""), PhraseError);
}

TEST(MnemonicTest, RejectsBadEntropySize) {
    std::vector<uint8_t> entropy(15, 0);
    EXPECT_THROW(Mnemonic::from_entropy(entropy), PhraseError);
    EXPECT_THROW(Mnemonic::generate(100), PhraseError);
}

TEST(MnemonicTest, GeneratedPhrasesValidate) {
    for (size_t bits : {128u, 160u, 192u, 224u, 256u}) {
        auto mnemonic = Mnemonic::generate(bits);
        EXPECT_EQ(mnemonic.word_count(), (bits + bits / 32) / 11);
        EXPECT_NO_THROW(Mnemonic::validate(mnemonic.phrase()));
        EXPECT_EQ(mnemonic.to_entropy().size(), bits / 8);
    }
}

TEST(MnemonicTest, PassphraseChangesSeed) {
    const char* phrase = "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about";
    auto plain = seed_from_phrase(phrase);
    auto salted = seed_from_phrase(phrase, "TREZOR");
    EXPECT_EQ(plain.size(), SEED_SIZE);
    EXPECT_NE(HexUtils::encode(plain.span()), HexUtils::encode(salted.span()));
}

TEST(MnemonicTest, WordlistIsSorted) {
    const auto& list = english_wordlist();
    EXPECT_EQ(list.front(), "abandon");
    EXPECT_EQ(list.back(), "zoo");
    EXPECT_TRUE(std::is_sorted(list.begin(), list.end()));
}

} // namespace
} // namespace cosmkit
