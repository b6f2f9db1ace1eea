#include "pipeline/ManifestSource.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace aax::pipeline;
using namespace aax::test;

class ManifestSourceTest : public ::testing::Test {
protected:
    TempDir tmp;

    fs::path write(const std::string& json) const {
        const auto path = tmp.path() / "manifest.json";
        std::ofstream(path) << json;
        return path;
    }
};

TEST_F(ManifestSourceTest, LoadsItemsAndLicenses) {
    const auto src = ManifestSource::load(write(R"({"items": [
        {"id": "B00A", "title": "First", "url": "https://cdn.example/a", "key": "0011", "iv": "2233"},
        {"id": "B00B", "protected": false, "remote_progress": 0.5}
    ]})"));

    ASSERT_EQ(src->items().size(), 2u);
    EXPECT_EQ(src->items()[0].title, "First");
    EXPECT_TRUE(src->items()[0].isProtected);
    EXPECT_FALSE(src->items()[0].hasRemoteProgress());

    EXPECT_EQ(src->items()[1].title, "B00B");
    EXPECT_FALSE(src->items()[1].isProtected);
    EXPECT_TRUE(src->items()[1].hasRemoteProgress());

    const auto license = src->fetchLicense(src->items()[0]);
    EXPECT_EQ(license.url, "https://cdn.example/a");
    EXPECT_EQ(license.keyHex, "0011");
    EXPECT_EQ(license.ivHex, "2233");
}

TEST_F(ManifestSourceTest, ResolvesById) {
    const auto src = ManifestSource::load(write(R"({"items": [{"id": "B00A", "url": "u"}]})"));
    EXPECT_TRUE(src->resolve("B00A").has_value());
    EXPECT_FALSE(src->resolve("B00Z").has_value());
}

TEST_F(ManifestSourceTest, LicenseWithoutUrlThrows) {
    const auto src = ManifestSource::load(write(R"({"items": [{"id": "B00A"}]})"));
    EXPECT_THROW(src->fetchLicense(src->items()[0]), std::runtime_error);
}

TEST_F(ManifestSourceTest, MissingFileThrows) {
    EXPECT_THROW(ManifestSource::load(tmp.path() / "absent.json"), std::runtime_error);
}
