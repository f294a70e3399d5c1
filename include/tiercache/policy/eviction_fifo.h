#ifndef TIERCACHE_EVICTION_FIFO_H
#define TIERCACHE_EVICTION_FIFO_H

#include <cassert>
#include <functional>
#include <iterator>
#include <list>

#include <absl/container/flat_hash_map.h>

#include "tiercache/item.h"

namespace tiercache::policy {

/// @brief First-In First-Out (FIFO) eviction policy.
/// @details Evicts keys in the order they entered the tier. Hits and value updates do not
///          change that order, so this policy doesn't define the hit and update handlers at all.
/// @tparam Key The type of the keys used to identify items in the tier.
/// @tparam KeyHash The hash functor used for key lookups.
/// @tparam Value The type of the values stored in the tier.
template<typename Key, typename KeyHash, typename Value> class EvictionFIFO
{
private:
    using KeyRef    = std::reference_wrapper<const Key>;
    using KeyRefIt  = typename std::list<KeyRef>::iterator;
    using KeyRefMap = absl::flat_hash_map<KeyRef, KeyRefIt, KeyHash, std::equal_to<Key>>;

public:
    using CacheItem      = tiercache::Item<Value>;
    using VictimIterator = typename std::list<KeyRef>::const_iterator;

    /// @brief Clears the policy.
    void clear();

    /// @brief Insertion event handler.
    /// @details Appends the key to the back of the queue.
    /// @param key The key of the inserted item.
    /// @param item The item that has been inserted in the tier.
    void on_insert(const Key& key, const CacheItem& item);

    /// @brief Eviction event handler.
    /// @param key The key that was evicted.
    /// @param item The item that was evicted.
    void on_evict(const Key& key, const CacheItem& item);

    /// @brief Get an iterator to the first item that should be evicted.
    [[nodiscard]] VictimIterator victim_begin() const;

    /// @brief Get an end iterator.
    [[nodiscard]] VictimIterator victim_end() const;

private:
    std::list<KeyRef> m_queue;  // Oldest first.
    KeyRefMap         m_nodes;
};

}  // namespace tiercache::policy

#include "eviction_fifo.hpp"

#endif
