#include "codec/EncryptionMaterial.hpp"

#include <gtest/gtest.h>

using namespace aax::codec;

namespace {
constexpr auto KEY = "00112233445566778899aabbccddeeff";
constexpr auto IV = "0f0e0d0c0b0a09080706050403020100";
}

TEST(EncryptionMaterialTest, ParsesPlainHex) {
    const auto m = EncryptionMaterial::parse(KEY, IV);
    EXPECT_EQ(m.key().size(), 16u);
    EXPECT_EQ(m.iv().size(), 16u);
    EXPECT_EQ(m.key().front(), 0x00);
    EXPECT_EQ(m.key().back(), 0xff);
    EXPECT_EQ(m.keyHex(), KEY);
    EXPECT_EQ(m.ivHex(), IV);
}

TEST(EncryptionMaterialTest, NormalizesCaseAndSeparators) {
    const auto m = EncryptionMaterial::parse("00:11:22:33:44:55:66:77:88:99:AA:BB:CC:DD:EE:FF",
                                             "0F-0E-0D-0C 0B-0A-09-08 07-06-05-04 03-02-01-00");
    EXPECT_EQ(m, EncryptionMaterial::parse(KEY, IV));
    EXPECT_EQ(m.keyHex(), KEY);
}

TEST(EncryptionMaterialTest, AcceptsHexPrefix) {
    const auto m = EncryptionMaterial::parse(std::string("0x") + KEY, std::string("0X") + IV);
    EXPECT_EQ(m.keyHex(), KEY);
    EXPECT_EQ(m.ivHex(), IV);
}

TEST(EncryptionMaterialTest, RejectsOddLength) {
    EXPECT_THROW(EncryptionMaterial::parse("abc", IV), ParseError);
}

TEST(EncryptionMaterialTest, RejectsNonHex) {
    EXPECT_THROW(EncryptionMaterial::parse("zz112233", IV), ParseError);
    EXPECT_THROW(EncryptionMaterial::parse(KEY, "0011gg"), ParseError);
}

TEST(EncryptionMaterialTest, RejectsEmptyHalves) {
    EXPECT_THROW(EncryptionMaterial::parse("", IV), ParseError);
    EXPECT_THROW(EncryptionMaterial::parse(KEY, ""), ParseError);
    EXPECT_THROW(EncryptionMaterial::parse("0x", IV), ParseError);
}
