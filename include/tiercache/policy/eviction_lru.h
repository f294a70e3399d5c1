#ifndef TIERCACHE_EVICTION_LRU_H
#define TIERCACHE_EVICTION_LRU_H

#include <cassert>
#include <functional>
#include <list>

#include <absl/container/flat_hash_map.h>

#include "tiercache/item.h"

namespace tiercache::policy {

/// @brief Least Recently Used (LRU) eviction policy.
/// @details Implemented internally using a linked list.
///          The keys are ordered from most-recently used to least-recently used.
///          Only stores references to keys kept alive by the tier.
/// @tparam Key The type of the keys used to identify items in the tier.
/// @tparam KeyHash The hash functor used for key lookups.
/// @tparam Value The type of the values stored in the tier.
template<typename Key, typename KeyHash, typename Value> class EvictionLRU
{
private:
    using KeyRef    = std::reference_wrapper<const Key>;
    using KeyRefIt  = typename std::list<KeyRef>::iterator;
    using KeyRefMap = absl::flat_hash_map<KeyRef, KeyRefIt, KeyHash, std::equal_to<Key>>;

public:
    using CacheItem = tiercache::Item<Value>;

    /// @brief Iterator for iterating over tier items in the order they should be
    ///        evicted.
    class VictimIterator
    {
    public:
        using KeyRefReverseIt = typename std::list<KeyRef>::const_reverse_iterator;

        VictimIterator(const KeyRefReverseIt& iterator);

        const Key&      operator*() const;
        VictimIterator& operator++();
        VictimIterator  operator++(int);
        bool            operator==(const VictimIterator& other) const;
        bool            operator!=(const VictimIterator& other) const;

    private:
        KeyRefReverseIt m_iterator;
    };

    /// @brief Clears the policy.
    void clear();

    /// @brief Insertion event handler.
    /// @details Inserts the provided item at the front of the list.
    /// @param key The key of the inserted item.
    /// @param item The item that has been inserted in the tier.
    void on_insert(const Key& key, const CacheItem& item);

    /// @brief Update event handler.
    /// @details Moves the provided item to the front of the list.
    /// @param key The key that has been updated in the tier.
    /// @param old_item The old value for this key.
    /// @param new_item The new value for this key
    void on_update(const Key& key, const CacheItem& old_item, const CacheItem& new_item);

    /// @brief Cache hit event handler.
    /// @details Moves the provided item at the front of the list.
    /// @param key The key that has been hit.
    /// @param item The item that has been hit.
    void on_cache_hit(const Key& key, const CacheItem& item);

    /// @brief Eviction event handler.
    /// @details Unlinks the key from the list, wherever it sits.
    /// @param key The key that was evicted.
    /// @param item The item that was evicted.
    void on_evict(const Key& key, const CacheItem& item);

    /// @brief Get an iterator to the first item that should be evicted.
    /// @details Considering that the keys are ordered internally from most-recently used
    ///          to least-recently used, this iterator will effectively walk the internal
    ///          structure backwards.
    /// @return An item iterator.
    [[nodiscard]] VictimIterator victim_begin() const;

    /// @brief Get an end iterator.
    /// @return The end iterator.
    [[nodiscard]] VictimIterator victim_end() const;

private:
    std::list<KeyRef> m_keys;
    KeyRefMap         m_nodes;
};

}  // namespace tiercache::policy

#include "eviction_lru.hpp"

#endif
