#ifndef TIERCACHE_TIER_H
#define TIERCACHE_TIER_H

#include <cassert>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <utility>

#include <absl/container/node_hash_map.h>
#include <absl/hash/hash.h>

#include <boost/hana.hpp>

#include "item.h"
#include "detail/traits.h"

namespace tiercache {

/// @brief A single capacity-bounded cache level.
/// @details The tier keeps the inserted items alive and handles the insert/evict bookkeeping, while the
///          decision of *which* item to evict is delegated to the eviction policy.
///
///          The policy is an event handler: the tier notifies it of insertions, updates, hits and evictions,
///          and asks it for the next victim when it runs out of room. Handlers the policy doesn't define are
///          simply not called.
///
///          A tier is not synchronized. It is meant to be owned and guarded by a `TieredCache`.
/// @tparam Key The type of the key used for retrieving items.
/// @tparam Value The type of the items stored in the tier.
/// @tparam EvictionPolicy A template parameterized by `Key`, `KeyHash`, and `Value` implementing the eviction policy interface.
/// @tparam KeyHash A default-constructible callable type returning a hash of a key. Defaults to `absl::Hash<Key>`.
template<typename Key, typename Value, template<class, class, class> class EvictionPolicy, typename KeyHash = absl::Hash<Key>> class Tier
{
public:
    using MyEvictionPolicy = EvictionPolicy<Key, KeyHash, Value>;
    using Entry            = std::pair<Key, Value>;

    /// @brief Constructor.
    /// @param capacity The maximum number of items this tier holds. A capacity of zero is allowed: such
    ///                 a tier never keeps anything and bounces every new item straight back as evicted.
    explicit Tier(size_t capacity);

    Tier(const Tier&) = delete;
    Tier& operator=(const Tier&) = delete;

    /// @brief Check whether a given key is stored in the tier.
    /// @details Does not count as an access.
    /// @param key The key whose presence to test.
    /// @return Whether the key is in the tier.
    [[nodiscard]] bool contains(const Key& key) const;

    /// @brief Find a given key, registering a hit with the eviction policy.
    /// @param key The key to lookup.
    /// @return The value if `key` is in the tier, `std::nullopt` otherwise.
    std::optional<Value> get(const Key& key);

    /// @brief Insert or overwrite a key/value pair.
    /// @details If the key already exists its value is overwritten, which counts as an access and never evicts.
    ///          If the key is new and the tier is full, the first victim of the eviction policy is removed to make room.
    /// @param key The key to associate with the value.
    /// @param value The value to store.
    /// @return The entry that was pushed out of the tier, if any.
    std::optional<Entry> put(Key key, Value value);

    /// @brief Remove a key and its value from the tier.
    /// @details If the key is not present, no operation is taken.
    /// @param key The key to remove.
    /// @return Whether the key was present.
    bool remove(const Key& key);

    /// @brief Get the key a `put` of `candidate` would push out, without modifying anything.
    /// @param candidate The key that would be put.
    /// @return A pointer to the key that would be evicted, or `nullptr` if the put would not evict.
    ///         For a zero-capacity tier, this is `&candidate` itself.
    [[nodiscard]] const Key* next_victim(const Key& candidate) const;

    /// @brief Clears the tier contents.
    void clear();

    /// @brief Copy the tier contents into an ordered map.
    [[nodiscard]] std::map<Key, Value> snapshot() const;

    /// @brief Copy the tier contents in the provided container.
    /// @details Uses `emplace_back` for sequence containers, and `emplace` for associative containers.
    ///          If the provided container has `size()` and `reserve()` methods, `collect_into` will reserve
    ///          the appropriate amount of space in the container before inserting.
    /// @param container The container in which to insert the items.
    template<typename C> void collect_into(C& container) const;

    /// @brief Get the number of items currently stored in the tier.
    [[nodiscard]] size_t number_of_items() const;

    /// @brief Get the maximum number of items this tier can hold.
    [[nodiscard]] size_t capacity() const;

    /// @brief Whether inserting a new key would require an eviction.
    [[nodiscard]] bool is_full() const;

    /// @brief Get a const reference to the eviction policy used by the tier.
    [[nodiscard]] const MyEvictionPolicy& eviction_policy() const;

private:
    using CacheItem = Item<Value>;
    using DataMap   = absl::node_hash_map<Key, CacheItem, KeyHash>;
    using DataMapIt = typename DataMap::iterator;

    const size_t                      m_capacity;
    std::unique_ptr<MyEvictionPolicy> m_eviction_policy;
    DataMap                           m_data;

    Entry evict_one();
    Entry remove(DataMapIt it);

    void on_insert(const Key& key, const CacheItem& item);
    void on_update(const Key& key, const CacheItem& old_item, const CacheItem& new_item);
    void on_cache_hit(const Key& key, const CacheItem& item);
    void on_evict(const Key& key, const CacheItem& item);
};

}  // namespace tiercache

#include "tier.hpp"

#endif
