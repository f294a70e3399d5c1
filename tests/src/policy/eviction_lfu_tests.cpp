#include <gtest/gtest.h>

#include <map>
#include <string>
#include <tuple>
#include <vector>

#include <absl/hash/hash.h>

#include "tiercache/item.h"
#include "tiercache/policy/eviction_lfu.h"

using namespace tiercache;

using TestLFU  = policy::EvictionLFU<std::string, absl::Hash<std::string>, int32_t>;
using TestItem = Item<int32_t>;
using ItemMap  = std::map<std::string, TestItem>;

namespace {

void insert_item(const std::string& key, int32_t value, TestLFU& policy, ItemMap& item_map)
{
    const auto key_and_item = item_map.emplace(std::piecewise_construct, std::forward_as_tuple(key), std::forward_as_tuple(value)).first;

    policy.on_insert(key_and_item->first, key_and_item->second);
}

void hit_item(const std::string& key, TestLFU& policy, ItemMap& item_map)
{
    auto key_and_item = item_map.find(key);
    ASSERT_NE(key_and_item, item_map.end());
    policy.on_cache_hit(key_and_item->first, key_and_item->second);
}

void evict_item(const std::string& key, TestLFU& policy, ItemMap& item_map)
{
    auto key_and_item = item_map.find(key);
    ASSERT_NE(key_and_item, item_map.end());
    policy.on_evict(key_and_item->first, key_and_item->second);
    item_map.erase(key_and_item);
}

void expect_victims(const TestLFU& policy, const std::vector<std::string>& expected_victims)
{
    std::vector<std::string> victims;
    for (auto it = policy.victim_begin(); it != policy.victim_end(); ++it) {
        victims.push_back(*it);
    }
    EXPECT_EQ(victims, expected_victims);
}

}  // namespace

TEST(EvictionLFU, EmptyPolicy)
{
    TestLFU policy;

    EXPECT_EQ(policy.victim_begin(), policy.victim_end());
    EXPECT_EQ(policy.min_frequency(), 0);
    EXPECT_EQ(policy.number_of_buckets(), 0);
    EXPECT_EQ(policy.frequency("a"), 0);
}

TEST(EvictionLFU, TiesAreBrokenOldestFirst)
{
    TestLFU policy;

    // Policies store references - we need to keep the values alive ourselves.
    ItemMap item_store;

    insert_item("a", 1, policy, item_store);
    insert_item("b", 2, policy, item_store);
    insert_item("c", 3, policy, item_store);

    EXPECT_EQ("a", *policy.victim_begin());
    expect_victims(policy, {"a", "b", "c"});
    EXPECT_EQ(policy.min_frequency(), 1);
    EXPECT_EQ(policy.number_of_buckets(), 1);
}

TEST(EvictionLFU, HitMovesKeyToNextFrequency)
{
    TestLFU policy;

    ItemMap item_store;

    insert_item("a", 1, policy, item_store);
    insert_item("b", 2, policy, item_store);

    hit_item("a", policy, item_store);

    EXPECT_EQ(policy.frequency("a"), 2);
    EXPECT_EQ(policy.frequency("b"), 1);
    EXPECT_EQ(policy.min_frequency(), 1);
    expect_victims(policy, {"b", "a"});
}

TEST(EvictionLFU, MinFrequencyFollowsEmptiedBucket)
{
    TestLFU policy;

    ItemMap item_store;

    insert_item("a", 1, policy, item_store);
    hit_item("a", policy, item_store);

    // The frequency-1 bucket was the minimum and is now empty: the minimum moves up by exactly one.
    EXPECT_EQ(policy.min_frequency(), 2);
    EXPECT_EQ(policy.number_of_buckets(), 1);

    // A fresh insert is always tied for least-frequently-used.
    insert_item("b", 2, policy, item_store);
    EXPECT_EQ(policy.min_frequency(), 1);
    expect_victims(policy, {"b", "a"});
}

TEST(EvictionLFU, HitAppendsAtTailOfDestinationBucket)
{
    TestLFU policy;

    ItemMap item_store;

    insert_item("a", 1, policy, item_store);
    insert_item("b", 2, policy, item_store);
    insert_item("c", 3, policy, item_store);

    // b reaches frequency 2 first, then a: within the frequency-2 bucket, b is older than a.
    hit_item("b", policy, item_store);
    hit_item("a", policy, item_store);

    expect_victims(policy, {"c", "b", "a"});
}

TEST(EvictionLFU, VictimOrderSpansBuckets)
{
    TestLFU policy;

    ItemMap item_store;

    insert_item("a", 1, policy, item_store);
    insert_item("b", 2, policy, item_store);
    insert_item("c", 3, policy, item_store);
    insert_item("d", 4, policy, item_store);

    for (int i = 0; i < 3; ++i) {
        hit_item("a", policy, item_store);
    }
    hit_item("c", policy, item_store);

    // Frequencies: a=4, b=1, c=2, d=1.
    EXPECT_EQ(policy.number_of_buckets(), 3);
    expect_victims(policy, {"b", "d", "c", "a"});
}

TEST(EvictionLFU, EvictRecomputesMinFrequency)
{
    TestLFU policy;

    ItemMap item_store;

    insert_item("a", 1, policy, item_store);
    insert_item("b", 2, policy, item_store);
    for (int i = 0; i < 4; ++i) {
        hit_item("b", policy, item_store);
    }

    // Removing the only key at the minimum frequency leaves a gap: the new minimum is 5, not 2.
    evict_item("a", policy, item_store);
    EXPECT_EQ(policy.min_frequency(), 5);
    expect_victims(policy, {"b"});

    evict_item("b", policy, item_store);
    EXPECT_EQ(policy.min_frequency(), 0);
    EXPECT_EQ(policy.victim_begin(), policy.victim_end());
}

TEST(EvictionLFU, EvictFromMiddleOfBucket)
{
    TestLFU policy;

    ItemMap item_store;

    insert_item("a", 1, policy, item_store);
    insert_item("b", 2, policy, item_store);
    insert_item("c", 3, policy, item_store);

    evict_item("b", policy, item_store);

    expect_victims(policy, {"a", "c"});
    EXPECT_EQ(policy.frequency("b"), 0);
}

TEST(EvictionLFU, ReinsertStartsAtFrequencyOne)
{
    TestLFU policy;

    ItemMap item_store;

    insert_item("a", 1, policy, item_store);
    hit_item("a", policy, item_store);
    hit_item("a", policy, item_store);
    EXPECT_EQ(policy.frequency("a"), 3);

    evict_item("a", policy, item_store);
    insert_item("a", 1, policy, item_store);

    EXPECT_EQ(policy.frequency("a"), 1);
    EXPECT_EQ(policy.min_frequency(), 1);
}

TEST(EvictionLFU, UpdateCountsAsAccess)
{
    TestLFU policy;

    ItemMap item_store;

    insert_item("a", 1, policy, item_store);
    insert_item("b", 2, policy, item_store);

    TestItem new_item{42};
    auto     key_and_item = item_store.find("a");
    policy.on_update(key_and_item->first, key_and_item->second, new_item);

    EXPECT_EQ(policy.frequency("a"), 2);
    expect_victims(policy, {"b", "a"});
}

TEST(EvictionLFU, Clear)
{
    TestLFU policy;

    ItemMap item_store;

    insert_item("a", 1, policy, item_store);
    insert_item("b", 2, policy, item_store);
    hit_item("a", policy, item_store);

    policy.clear();

    EXPECT_EQ(policy.victim_begin(), policy.victim_end());
    EXPECT_EQ(policy.min_frequency(), 0);
    EXPECT_EQ(policy.frequency("a"), 0);
}
