#ifndef TIERCACHE_EVICTION_LFU_H
#define TIERCACHE_EVICTION_LFU_H

#include <cassert>
#include <cstdint>
#include <functional>
#include <iterator>
#include <list>

#include <absl/container/flat_hash_map.h>

#include "tiercache/item.h"

namespace tiercache::policy {

/// @brief Least Frequently Used (LFU) eviction policy.
/// @details Keys are grouped in frequency buckets. Within a bucket, keys are ordered from the
///          least-recently touched to the most-recently touched, which gives a FIFO tie-break between
///          keys sharing the same frequency.
///
///          The buckets themselves are kept in a list sorted by ascending frequency, so the minimum
///          frequency bucket is always at the front of the list. Since a hit only ever moves a key one
///          frequency up, the destination bucket is always either the next bucket in the list or a new
///          bucket inserted right after the current one. Every operation is therefore O(1).
///
///          Only stores references to keys kept alive by the tier.
/// @tparam Key The type of the keys used to identify items in the tier.
/// @tparam KeyHash The hash functor used for key lookups.
/// @tparam Value The type of the values stored in the tier.
template<typename Key, typename KeyHash, typename Value> class EvictionLFU
{
private:
    using KeyRef     = std::reference_wrapper<const Key>;
    using KeyRefList = std::list<KeyRef>;
    using KeyRefIt   = typename KeyRefList::iterator;

    struct Bucket {
        explicit Bucket(uint64_t frequency);

        uint64_t   m_frequency;
        KeyRefList m_keys;  // Least-recently touched first.
    };

    using BucketList = std::list<Bucket>;
    using BucketIt   = typename BucketList::iterator;

    struct Node {
        BucketIt m_bucket;
        KeyRefIt m_key;
    };

    using NodeMap = absl::flat_hash_map<KeyRef, Node, KeyHash, std::equal_to<Key>>;

public:
    using CacheItem = tiercache::Item<Value>;

    /// @brief Iterator for iterating over tier items in the order they should be
    ///        evicted.
    /// @details Walks the minimum frequency bucket from oldest to newest, then moves on to
    ///          the next frequency bucket.
    class VictimIterator
    {
    public:
        using BucketConstIt = typename BucketList::const_iterator;
        using KeyConstIt    = typename KeyRefList::const_iterator;

        VictimIterator(BucketConstIt bucket, BucketConstIt bucket_end);

        const Key&      operator*() const;
        VictimIterator& operator++();
        VictimIterator  operator++(int);
        bool            operator==(const VictimIterator& other) const;
        bool            operator!=(const VictimIterator& other) const;

    private:
        BucketConstIt m_bucket;
        BucketConstIt m_bucket_end;
        KeyConstIt    m_key;
    };

    /// @brief Clears the policy.
    void clear();

    /// @brief Insertion event handler.
    /// @details Appends the key to the frequency-1 bucket, creating the bucket if needed.
    ///          After an insertion the minimum frequency is always 1.
    /// @param key The key of the inserted item.
    /// @param item The item that has been inserted in the tier.
    void on_insert(const Key& key, const CacheItem& item);

    /// @brief Update event handler.
    /// @details Overwriting a value counts as an access: same as a cache hit.
    /// @param key The key that has been updated in the tier.
    /// @param old_item The old value for this key.
    /// @param new_item The new value for this key.
    void on_update(const Key& key, const CacheItem& old_item, const CacheItem& new_item);

    /// @brief Cache hit event handler.
    /// @details Increments the frequency of the key and moves it to the tail of the next frequency bucket.
    /// @param key The key that has been hit.
    /// @param item The item that has been hit.
    void on_cache_hit(const Key& key, const CacheItem& item);

    /// @brief Eviction event handler.
    /// @details Removes the key from its frequency bucket, dropping the bucket if it becomes empty.
    ///          Called both for capacity evictions and for explicit removals.
    /// @param key The key that was evicted.
    /// @param item The item that was evicted.
    void on_evict(const Key& key, const CacheItem& item);

    /// @brief Get the access frequency of a key.
    /// @return The frequency of the key, or 0 if the policy does not track it.
    [[nodiscard]] uint64_t frequency(const Key& key) const;

    /// @brief Get the smallest frequency currently tracked.
    /// @return The minimum frequency, or 0 if the policy is empty.
    [[nodiscard]] uint64_t min_frequency() const;

    /// @brief Get the number of non-empty frequency buckets.
    [[nodiscard]] size_t number_of_buckets() const;

    /// @brief Get an iterator to the first item that should be evicted.
    /// @return An item iterator.
    [[nodiscard]] VictimIterator victim_begin() const;

    /// @brief Get an end iterator.
    /// @return The end iterator.
    [[nodiscard]] VictimIterator victim_end() const;

private:
    BucketList m_buckets;  // Sorted by ascending frequency, never contains an empty bucket.
    NodeMap    m_nodes;

    void touch(Node& node);
};

}  // namespace tiercache::policy

#include "eviction_lfu.hpp"

#endif
