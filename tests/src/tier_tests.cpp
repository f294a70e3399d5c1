#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tiercache/policy/eviction_fifo.h"
#include "tiercache/policy/eviction_lfu.h"
#include "tiercache/policy/eviction_lru.h"
#include "tiercache/tier.h"

using namespace tiercache;

using LFUTier  = Tier<std::string, int32_t, policy::EvictionLFU>;
using LRUTier  = Tier<std::string, int32_t, policy::EvictionLRU>;
using FIFOTier = Tier<std::string, int32_t, policy::EvictionFIFO>;

template<typename TierT> class TierTest : public testing::Test
{
public:
    std::unique_ptr<TierT> new_tier(size_t capacity)
    {
        return std::make_unique<TierT>(capacity);
    }
};

using TestTypes = testing::Types<LFUTier, LRUTier, FIFOTier>;

TYPED_TEST_SUITE(TierTest, TestTypes);

TYPED_TEST(TierTest, GetWhenKeyAbsent)
{
    auto tier = TestFixture::new_tier(2);
    EXPECT_FALSE(tier->get("a").has_value());
}

TYPED_TEST(TierTest, PutBelowCapacityNeverEvicts)
{
    auto tier = TestFixture::new_tier(3);

    EXPECT_FALSE(tier->put("a", 1).has_value());
    EXPECT_FALSE(tier->put("b", 2).has_value());
    EXPECT_FALSE(tier->put("c", 3).has_value());

    EXPECT_EQ(tier->number_of_items(), 3);
    EXPECT_TRUE(tier->is_full());
    EXPECT_EQ(tier->get("b"), 2);
}

TYPED_TEST(TierTest, PutOnFullTierEvictsOldestUntouched)
{
    auto tier = TestFixture::new_tier(2);

    tier->put("a", 1);
    tier->put("b", 2);
    const auto evicted = tier->put("c", 3);

    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(evicted->first, "a");
    EXPECT_EQ(evicted->second, 1);

    EXPECT_FALSE(tier->contains("a"));
    EXPECT_TRUE(tier->contains("b"));
    EXPECT_TRUE(tier->contains("c"));
    EXPECT_EQ(tier->number_of_items(), 2);
}

TYPED_TEST(TierTest, OverwriteNeverEvicts)
{
    auto tier = TestFixture::new_tier(2);

    tier->put("a", 1);
    tier->put("b", 2);

    EXPECT_FALSE(tier->put("a", 10).has_value());
    EXPECT_EQ(tier->get("a"), 10);
    EXPECT_EQ(tier->number_of_items(), 2);
}

TYPED_TEST(TierTest, ZeroCapacityBouncesEverything)
{
    auto tier = TestFixture::new_tier(0);

    const auto evicted = tier->put("a", 1);

    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(evicted->first, "a");
    EXPECT_EQ(evicted->second, 1);
    EXPECT_EQ(tier->number_of_items(), 0);
    EXPECT_TRUE(tier->is_full());
}

TYPED_TEST(TierTest, RemoveWhenKeyPresent)
{
    auto tier = TestFixture::new_tier(2);

    tier->put("a", 1);

    EXPECT_TRUE(tier->contains("a"));
    EXPECT_TRUE(tier->remove("a"));
    EXPECT_FALSE(tier->contains("a"));
    EXPECT_EQ(tier->eviction_policy().victim_begin(), tier->eviction_policy().victim_end());
}

TYPED_TEST(TierTest, RemoveWhenKeyAbsent)
{
    auto tier = TestFixture::new_tier(2);
    EXPECT_FALSE(tier->remove("a"));
}

TYPED_TEST(TierTest, NextVictim)
{
    auto tier = TestFixture::new_tier(2);

    const std::string candidate = "c";

    tier->put("a", 1);
    EXPECT_EQ(tier->next_victim(candidate), nullptr);

    tier->put("b", 2);
    const std::string* victim = tier->next_victim(candidate);
    ASSERT_NE(victim, nullptr);
    EXPECT_EQ(*victim, "a");

    // Overwriting an existing key never evicts.
    EXPECT_EQ(tier->next_victim("a"), nullptr);

    // Asking doesn't change anything.
    EXPECT_EQ(tier->number_of_items(), 2);
    EXPECT_EQ(*tier->next_victim(candidate), "a");
}

TYPED_TEST(TierTest, NextVictimOnZeroCapacity)
{
    auto tier = TestFixture::new_tier(0);

    const std::string candidate = "a";
    EXPECT_EQ(tier->next_victim(candidate), &candidate);
}

TYPED_TEST(TierTest, Collect)
{
    auto tier = TestFixture::new_tier(3);

    tier->put("a", 1);
    tier->put("b", 2);
    tier->put("c", 3);

    // Sequence container.
    std::vector<std::pair<std::string, int32_t>> collected_vec;
    tier->collect_into(collected_vec);
    EXPECT_EQ(collected_vec.size(), 3);

    // Associative container.
    std::unordered_map<std::string, int32_t> collected_map;
    tier->collect_into(collected_map);

    const std::unordered_map<std::string, int32_t> expected{{"a", 1}, {"b", 2}, {"c", 3}};
    EXPECT_EQ(collected_map, expected);

    EXPECT_EQ(tier->snapshot(), (std::map<std::string, int32_t>{{"a", 1}, {"b", 2}, {"c", 3}}));
}

TYPED_TEST(TierTest, Clear)
{
    auto tier = TestFixture::new_tier(2);

    tier->put("a", 1);
    tier->put("b", 2);
    tier->clear();

    EXPECT_EQ(tier->number_of_items(), 0);
    EXPECT_FALSE(tier->contains("a"));
    EXPECT_EQ(tier->eviction_policy().victim_begin(), tier->eviction_policy().victim_end());

    // Still usable after a clear.
    tier->put("c", 3);
    EXPECT_EQ(tier->get("c"), 3);
}

TEST(LFUTier, HitProtectsFromEviction)
{
    LFUTier tier{2};

    tier.put("a", 1);
    tier.put("b", 2);
    EXPECT_EQ(tier.get("a"), 1);

    const auto evicted = tier.put("c", 3);

    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(evicted->first, "b");
    EXPECT_EQ(tier.snapshot(), (std::map<std::string, int32_t>{{"a", 1}, {"c", 3}}));
}

TEST(LFUTier, MinFrequencyAfterHit)
{
    LFUTier tier{2};

    tier.put("a", 1);
    tier.get("a");

    EXPECT_EQ(tier.eviction_policy().min_frequency(), 2);
    EXPECT_EQ(tier.eviction_policy().frequency("a"), 2);
}

TEST(LFUTier, OverwriteCountsAsAccess)
{
    LFUTier tier{2};

    tier.put("a", 1);
    tier.put("b", 2);
    tier.put("a", 10);

    EXPECT_EQ(tier.eviction_policy().frequency("a"), 2);

    const auto evicted = tier.put("c", 3);
    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(evicted->first, "b");
}

TEST(LFUTier, RemoveThenReinsertStartsFresh)
{
    LFUTier tier{2};

    tier.put("a", 1);
    tier.get("a");
    tier.get("a");
    tier.put("b", 2);

    EXPECT_TRUE(tier.remove("a"));
    EXPECT_EQ(tier.eviction_policy().min_frequency(), 1);

    tier.put("a", 5);
    EXPECT_EQ(tier.eviction_policy().frequency("a"), 1);

    // a and b now tie at frequency 1, and b is the older of the two.
    const auto evicted = tier.put("c", 3);
    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(evicted->first, "b");
}

TEST(LFUTier, RemoveLastKeyAtMinFrequency)
{
    LFUTier tier{3};

    tier.put("a", 1);
    tier.put("b", 2);
    tier.get("b");
    tier.get("b");

    tier.remove("a");
    EXPECT_EQ(tier.eviction_policy().min_frequency(), 3);
}

TEST(LRUTier, HitProtectsFromEviction)
{
    LRUTier tier{2};

    tier.put("a", 1);
    tier.put("b", 2);
    tier.get("a");

    const auto evicted = tier.put("c", 3);

    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(evicted->first, "b");
}

TEST(FIFOTier, HitDoesNotProtectFromEviction)
{
    FIFOTier tier{2};

    tier.put("a", 1);
    tier.put("b", 2);
    tier.get("a");

    const auto evicted = tier.put("c", 3);

    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(evicted->first, "a");
}
