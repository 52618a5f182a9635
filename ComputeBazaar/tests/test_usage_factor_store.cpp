#include <gtest/gtest.h>
#include "database/usage_factor_store.h"
#include "market/usage_ledger.h"
#include <filesystem>
#include <limits>
#include <string>

using namespace bazaar;
using namespace bazaar::database;

class UsageFactorStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        // One directory per test so discovered tests may run in parallel.
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        testDir = std::filesystem::temp_directory_path() /
                  (std::string("computebazaar_test_store_") + info->name());
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
        dbPath = (testDir / "market.db").string();
        ASSERT_TRUE(store.open(dbPath).ok());
    }

    void TearDown() override {
        store.close();
        if (std::filesystem::exists(testDir)) {
            std::filesystem::remove_all(testDir);
        }
    }

    std::filesystem::path testDir;
    std::string dbPath;
    UsageFactorStore store;
};

TEST_F(UsageFactorStoreTest, OpenState) {
    EXPECT_TRUE(store.isOpen());
    EXPECT_EQ(store.getPath(), dbPath);
    EXPECT_EQ(store.count(), 0u);

    auto twice = store.open(dbPath);
    ASSERT_TRUE(twice.failed());
    EXPECT_EQ(twice.error().code, ErrorCode::INVALID_STATE);
}

TEST_F(UsageFactorStoreTest, SaveAndLoad) {
    ASSERT_TRUE(store.save("alice", 5.0).ok());
    ASSERT_TRUE(store.save("alice", 2.5).ok());

    auto loaded = store.load("alice");
    ASSERT_TRUE(loaded.ok());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_DOUBLE_EQ(*loaded.value(), 2.5);
    EXPECT_EQ(store.count(), 1u);

    auto missing = store.load("nobody");
    ASSERT_TRUE(missing.ok());
    EXPECT_FALSE(missing.value().has_value());
}

TEST_F(UsageFactorStoreTest, RejectsInvalidFactors) {
    EXPECT_EQ(store.save("alice", 0.0).error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_TRUE(store.save("alice", -2.0).failed());
    EXPECT_TRUE(store.save("alice", std::numeric_limits<double>::infinity()).failed());
    EXPECT_TRUE(store.save("", 1.0).failed());
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(UsageFactorStoreTest, SaveAllIsAtomic) {
    auto saved = store.saveAll({{"a", 1.5}, {"b", 3.0}});
    ASSERT_TRUE(saved.ok());
    EXPECT_EQ(store.count(), 2u);

    auto bad = store.saveAll({{"c", 2.0}, {"d", -1.0}});
    ASSERT_TRUE(bad.failed());
    EXPECT_EQ(store.count(), 2u);
    EXPECT_FALSE(store.load("c").value().has_value());

    auto all = store.loadAll();
    ASSERT_TRUE(all.ok());
    EXPECT_DOUBLE_EQ(all.value().at("a"), 1.5);
    EXPECT_DOUBLE_EQ(all.value().at("b"), 3.0);
}

TEST_F(UsageFactorStoreTest, NodesAndRemoval) {
    ASSERT_TRUE(store.upsertNode("alice", "Alice's GPU box").ok());
    ASSERT_TRUE(store.upsertNode("alice", "renamed").ok());
    EXPECT_TRUE(store.upsertNode("", "x").failed());
    ASSERT_TRUE(store.save("alice", 4.0).ok());

    ASSERT_TRUE(store.remove("alice").ok());
    EXPECT_EQ(store.count(), 0u);
    EXPECT_TRUE(store.remove("alice").ok());

    ASSERT_TRUE(store.save("bob", 1.0).ok());
    ASSERT_TRUE(store.clear().ok());
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(UsageFactorStoreTest, SurvivesReopenAndSeedsLedger) {
    market::UsageLedger ledger;
    ASSERT_TRUE(ledger.recordUsage("A", 5.0, 1.0).ok());
    ASSERT_TRUE(ledger.recordUsage("B", 8.0, 1.0).ok());
    ASSERT_TRUE(store.saveAll(ledger.takeDirty()).ok());
    store.close();
    EXPECT_FALSE(store.isOpen());
    EXPECT_EQ(store.loadAll().error().code, ErrorCode::NOT_OPEN);

    UsageFactorStore reopened;
    ASSERT_TRUE(reopened.open(dbPath).ok());
    auto all = reopened.loadAll();
    ASSERT_TRUE(all.ok());

    market::UsageLedger fresh;
    EXPECT_EQ(fresh.load(all.value()), 2u);
    EXPECT_DOUBLE_EQ(fresh.getFactor("A"), 5.0);
    EXPECT_DOUBLE_EQ(fresh.getFactor("B"), 8.0);
    EXPECT_DOUBLE_EQ(fresh.getFactor("C"), 1.0);
}
