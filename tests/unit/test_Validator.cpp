#include "pipeline/Validator.hpp"
#include "error/Error.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace aax;
using namespace aax::pipeline;
using namespace aax::test;

class ValidatorTest : public ::testing::Test {
protected:
    TempDir tmp;
    Validator validator;

    fs::path original() const { return tmp.path() / "B00ITEM.aax"; }
    fs::path converted() const { return tmp.path() / "B00ITEM.m4a"; }
};

TEST_F(ValidatorTest, AcceptsOutputWithinTolerance) {
    makeFile(original(), 200 * MB);
    makeFile(converted(), 196 * MB);

    EXPECT_TRUE(validator.validateConvertedArtifact(original(), converted()));
    EXPECT_TRUE(fs::exists(converted()));
}

TEST_F(ValidatorTest, AcceptsBoundaryValues) {
    makeFile(original(), 1000);
    makeFile(converted(), 950);
    EXPECT_TRUE(validator.validateConvertedArtifact(original(), converted()));

    makeFile(converted(), 1050);
    EXPECT_TRUE(validator.validateConvertedArtifact(original(), converted()));
}

TEST_F(ValidatorTest, RejectsAndDeletesTruncatedOutput) {
    makeFile(original(), 200 * MB);
    makeFile(converted(), 100 * MB);

    EXPECT_FALSE(validator.validateConvertedArtifact(original(), converted()));
    EXPECT_FALSE(fs::exists(converted()));
}

TEST_F(ValidatorTest, RejectsOversizedOutput) {
    makeFile(original(), 1000);
    makeFile(converted(), 1100);

    EXPECT_FALSE(validator.validateConvertedArtifact(original(), converted()));
    EXPECT_FALSE(fs::exists(converted()));
}

TEST_F(ValidatorTest, MissingFilesAreUploadFailures) {
    makeFile(original(), 1000);

    try {
        (void)validator.validateConvertedArtifact(original(), converted());
        FAIL() << "expected an error for the missing converted file";
    } catch (const error::Error& e) {
        EXPECT_EQ(e.code(), error::Code::UploadFailed);
    }

    fs::remove(original());
    makeFile(converted(), 1000);
    EXPECT_THROW((void)validator.validateConvertedArtifact(original(), converted()), error::Error);
}

TEST_F(ValidatorTest, ToleranceIsConfigurable) {
    Validator strict(config::ValidationConfig{0.01});
    makeFile(original(), 1000);
    makeFile(converted(), 970);

    EXPECT_FALSE(strict.validateConvertedArtifact(original(), converted()));
}
