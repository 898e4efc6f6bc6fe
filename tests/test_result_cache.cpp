#include <gtest/gtest.h>

#include <memory>

#include "kernel/services/result_cache_service.hpp"
#include "kernel/store/memory_result_store.hpp"
#include "kernel/store/sqlite_result_store.hpp"
#include "test_support.hpp"

using namespace nw;
using nw::fixtures::FakeClock;

namespace {

NodeResult text_result(const std::string& text) {
    return make_single_item_result(ItemType::Text, YAML::Node(text), "out");
}

std::unique_ptr<ResultStore> make_store(const std::string& backend) {
    if (backend == "sqlite") {
        return std::make_unique<SqliteResultStore>(":memory:");
    }
    return std::make_unique<MemoryResultStore>();
}

class ResultCacheTest : public ::testing::TestWithParam<std::string> {
protected:
    ResultCacheTest()
        : store_(make_store(GetParam())), hashes_(hasher_), cache_(*store_, hashes_, clock_.fn()) {}

    FakeClock clock_;
    Sha256Hasher hasher_;
    std::unique_ptr<ResultStore> store_;
    HashService hashes_;
    ResultCacheService cache_;
};

} // namespace

TEST_P(ResultCacheTest, PutThenExactGet) {
    NodeId id = cache_.put("n1", "Node 1", text_result("a"), "H1");
    EXPECT_EQ(id, "n1");

    auto hit = cache_.get("n1", "H1");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->name, "Node 1");
    EXPECT_EQ(hit->input_hash, "H1");
    EXPECT_EQ(hit->age, 1000);
    EXPECT_EQ(hit->hash, hashes_.hash_result(text_result("a")));
    EXPECT_EQ(hit->result.find_item("out")->data.as<std::string>(), "a");

    EXPECT_FALSE(cache_.get("n1", "H2").has_value());
    EXPECT_FALSE(cache_.get("n2", "H1").has_value());
}

TEST_P(ResultCacheTest, WriteReplacesPreviousEntry) {
    cache_.put("n1", "n1", text_result("a"), "H1");
    cache_.put("n1", "n1", text_result("b"), "H2");
    EXPECT_EQ(cache_.size(), 1u);
    EXPECT_FALSE(cache_.get("n1", "H1").has_value());
    auto latest = cache_.latest("n1");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->input_hash, "H2");
    EXPECT_EQ(latest->result.find_item("out")->data.as<std::string>(), "b");
}

TEST_P(ResultCacheTest, TouchUpdatesAgeOnly) {
    cache_.put("n1", "n1", text_result("a"), "H1");
    const std::string hash = cache_.latest("n1")->hash;
    clock_.now = 5000;
    EXPECT_TRUE(cache_.touch("n1"));
    auto e = cache_.latest("n1");
    EXPECT_EQ(e->age, 5000);
    EXPECT_EQ(e->hash, hash);
    EXPECT_EQ(e->input_hash, "H1");
    EXPECT_FALSE(cache_.touch("missing"));
}

TEST_P(ResultCacheTest, CleanupZeroRemovesEverything) {
    cache_.put("a", "a", text_result("1"), "H");
    cache_.put("b", "b", text_result("2"), "H");
    cache_.put("c", "c", text_result("3"), "H");
    EXPECT_EQ(cache_.cleanup(0), 3);
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_P(ResultCacheTest, CleanupKeepsFreshEntries) {
    cache_.put("old", "old", text_result("1"), "H");
    clock_.now = 5000;
    cache_.put("new", "new", text_result("2"), "H");
    clock_.now = 6000;
    EXPECT_EQ(cache_.cleanup(2000), 1);
    EXPECT_FALSE(cache_.latest("old").has_value());
    EXPECT_TRUE(cache_.latest("new").has_value());
}

TEST_P(ResultCacheTest, DeleteForNodes) {
    cache_.put("a", "a", text_result("1"), "H");
    cache_.put("b", "b", text_result("2"), "H");
    cache_.put("c", "c", text_result("3"), "H");
    EXPECT_EQ(cache_.delete_for_node("a"), 1);
    EXPECT_EQ(cache_.delete_for_node("a"), 0);
    EXPECT_EQ(cache_.delete_for_nodes({"b", "c", "zzz"}), 2);
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_P(ResultCacheTest, GetOrCreateDeduplicatesByContent) {
    Node a = fixtures::make_node("a", "text");
    Node b = fixtures::make_node("b", "text");

    CacheEntry first = cache_.get_or_create(a, text_result("same"), "Ha");
    EXPECT_EQ(first.id, "a");

    clock_.now = 3000;
    CacheEntry second = cache_.get_or_create(b, text_result("same"), "Hb");
    EXPECT_EQ(second.id, "a");
    EXPECT_EQ(second.age, 3000);
    EXPECT_EQ(cache_.size(), 1u);

    CacheEntry third = cache_.get_or_create(b, text_result("different"), "Hb");
    EXPECT_EQ(third.id, "b");
    EXPECT_EQ(cache_.size(), 2u);
    ASSERT_TRUE(cache_.find_by_hash(third.hash).has_value());
}

TEST_P(ResultCacheTest, EntriesAreSortedById) {
    cache_.put("c", "c", text_result("3"), "H");
    cache_.put("a", "a", text_result("1"), "H");
    cache_.put("b", "b", text_result("2"), "H");
    auto all = cache_.entries();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "a");
    EXPECT_EQ(all[1].id, "b");
    EXPECT_EQ(all[2].id, "c");
}

INSTANTIATE_TEST_SUITE_P(Backends, ResultCacheTest, ::testing::Values("memory", "sqlite"));

TEST(SqliteResultStoreTest, SurvivesReopen) {
    auto path = fixtures::temp_path("reopen_test.db");
    Sha256Hasher hasher;
    HashService hashes(hasher);
    FakeClock clock;
    {
        SqliteResultStore store(path);
        ResultCacheService cache(store, hashes, clock.fn());
        FileData file;
        file.entity_id = "ent-1";
        file.signed_url = "https://cdn.example/ent-1";
        cache.put("img", "Image", make_single_item_result(ItemType::Image, file.to_yaml(), "img-out"), "H1");
        CacheEntry with_blob = *store.get("img");
        with_blob.blob_id = "blob-7";
        store.put(with_blob);
    }
    {
        SqliteResultStore store(path);
        ResultCacheService cache(store, hashes, clock.fn());
        auto e = cache.get("img", "H1");
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->name, "Image");
        ASSERT_TRUE(e->blob_id.has_value());
        EXPECT_EQ(*e->blob_id, "blob-7");
        const OutputItem* item = e->result.find_item("img-out");
        ASSERT_NE(item, nullptr);
        EXPECT_EQ(item->type, ItemType::Image);
        EXPECT_EQ(FileData::from_yaml(item->data).entity_id, "ent-1");
        EXPECT_EQ(e->hash, cache.latest("img")->hash);
    }
    std::filesystem::remove(path);
}

TEST(SqliteResultStoreTest, UnopenablePathThrowsStorageError) {
    auto dir = fixtures::temp_path("not_a_db_dir");
    std::filesystem::create_directories(dir);
    try {
        SqliteResultStore store(dir);
        FAIL() << "expected GraphError";
    } catch (const GraphError& e) {
        EXPECT_EQ(e.code(), GraphErrc::Storage);
    }
    std::filesystem::remove_all(dir);
}
