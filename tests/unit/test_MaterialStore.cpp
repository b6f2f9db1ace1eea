#include "codec/MaterialStore.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

using namespace aax::codec;
using namespace aax::test;

class MaterialStoreTest : public ::testing::Test {
protected:
    TempDir tmp;
    fs::path file() const { return tmp.path() / "state" / "materials.json"; }

    static EncryptionMaterial material() {
        return EncryptionMaterial::parse(FakeCatalog::KEY, FakeCatalog::IV);
    }
};

TEST_F(MaterialStoreTest, SurvivesReload) {
    {
        MaterialStore store(file());
        store.put("B00A", material());
    }

    MaterialStore reloaded(file());
    ASSERT_TRUE(reloaded.contains("B00A"));
    EXPECT_EQ(*reloaded.get("B00A"), material());
    EXPECT_FALSE(reloaded.get("B00B").has_value());
}

TEST_F(MaterialStoreTest, RemoveAndClearPersist) {
    {
        MaterialStore store(file());
        store.put("B00A", material());
        store.put("B00B", material());
        store.remove("B00A");
    }
    {
        MaterialStore store(file());
        EXPECT_FALSE(store.contains("B00A"));
        EXPECT_TRUE(store.contains("B00B"));
        store.clear();
    }

    MaterialStore store(file());
    EXPECT_FALSE(store.contains("B00B"));
}

TEST_F(MaterialStoreTest, UnreadableEntriesAreDropped) {
    fs::create_directories(file().parent_path());
    std::ofstream(file()) << R"({"B00A": {"key": "zz", "iv": "00"}, "B00B": {"key": "0011", "iv": "2233"}})";

    MaterialStore store(file());
    EXPECT_FALSE(store.contains("B00A"));
    EXPECT_TRUE(store.contains("B00B"));
}
