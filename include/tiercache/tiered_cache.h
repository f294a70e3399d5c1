#ifndef TIERCACHE_TIERED_CACHE_H
#define TIERCACHE_TIERED_CACHE_H

#include <cassert>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <absl/hash/hash.h>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/rolling_mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>

#include <glog/logging.h>

#include "errors.h"
#include "tier.h"

/// @brief Root namespace
namespace tiercache {

/// @brief Thread-safe multi-level cache.
/// @details Keeps an ordered sequence of tiers, from the fastest and smallest (index 0) to the slowest and largest.
///
///          - Writes always land in tier 0. Whatever a tier evicts to make room cascades into the next tier.
///            When the cascade runs past the last tier a new tier is created, up to `max_levels`. Past that,
///            the entry is dropped from the cache and reported to the drop listener.
///          - Reads scan the tiers in order. A hit below tier 0 is promoted by writing the entry back through
///            tier 0. The lower copy is left where it is until that tier evicts it or it is removed.
///          - Removals are applied to every tier.
///
///          Tiers are only ever appended, and their capacities are fixed at construction.
/// @tparam Key The type of the key used for retrieving items.
/// @tparam Value The type of the items stored in the cache.
/// @tparam EvictionPolicy A template parameterized by `Key`, `KeyHash`, and `Value` implementing the eviction policy interface.
///                        Every tier gets its own instance.
/// @tparam KeyHash A default-constructible callable type returning a hash of a key. Defaults to `absl::Hash<Key>`.
/// @tparam ThreadSafe Whether to enable locking. When true, all cache operations will be protected by a lock. `true` by default.
template<typename Key,
         typename Value,
         template<class, class, class>
         class EvictionPolicy,
         typename KeyHash = absl::Hash<Key>,
         bool ThreadSafe  = true>
class TieredCache
{
public:
    using TierType     = Tier<Key, Value, EvictionPolicy, KeyHash>;
    using DropListener = std::function<void(const Key&, const Value&)>;
    using Snapshot     = std::vector<std::map<Key, Value>>;
    using LockGuard    = std::unique_lock<std::recursive_mutex>;

    /// @brief Constructor.
    /// @details Creates the first tier right away. Further tiers are created on demand.
    /// @param max_levels The maximum number of tiers. Must be at least 1.
    /// @param capacities The capacity of each tier, by index. Must not be empty. `capacities[i]` is only
    ///                   read when tier `i` is created.
    /// @throws InvalidConfiguration If `max_levels` is zero or `capacities` is empty.
    TieredCache(size_t max_levels, std::vector<size_t> capacities);

    TieredCache(const TieredCache&) = delete;
    TieredCache& operator=(const TieredCache&) = delete;

    /// @brief Look a key up in every tier, from fastest to slowest.
    /// @details A hit in a tier other than the first promotes the entry through `write`.
    /// @param key The key to lookup.
    /// @return The value if `key` is in cache, `std::nullopt` otherwise.
    /// @throws InvalidConfiguration If the promotion needs a tier that has no configured capacity.
    std::optional<Value> read(const Key& key);

    /// @brief Insert a key/value pair in the first tier, cascading evictions down the tiers.
    /// @details If the key already exists in the first tier, the provided value overwrites the previous one.
    ///          An entry pushed out of the last tier once `max_levels` is reached is dropped: the drop listener
    ///          is notified, but the write itself succeeds.
    /// @param key The key to associate with the value.
    /// @param value The value to store.
    /// @throws InvalidConfiguration If the cascade needs a tier that has no configured capacity. The cache is
    ///                              left untouched in that case.
    void write(Key key, Value value);

    /// @brief Remove a key from every tier.
    /// @param key The key to remove from the cache.
    /// @return Whether the key was present in at least one tier.
    bool remove(const Key& key);

    /// @brief Check whether a given key is stored in any tier.
    /// @details Does not count as an access.
    [[nodiscard]] bool contains(const Key& key) const;

    /// @brief Clears the contents of every tier. Tiers that were created are kept.
    void clear();

    /// @brief Get a copy of the contents of every tier, ordered by tier index.
    [[nodiscard]] Snapshot snapshot() const;

    /// @brief Get the number of entries stored across all tiers.
    /// @details Stale copies left in a lower tier by a promotion are counted.
    [[nodiscard]] size_t number_of_items() const;

    /// @brief Get the number of tiers created so far.
    [[nodiscard]] size_t number_of_tiers() const;

    /// @brief Get the maximum number of tiers.
    [[nodiscard]] size_t max_levels() const;

    /// @brief Get the configured tier capacities.
    [[nodiscard]] const std::vector<size_t>& capacities() const;

    /// @brief Get a tier by index.
    /// @warning The reference is not protected by the cache lock.
    /// @throws std::out_of_range If no tier exists at `index`.
    [[nodiscard]] const TierType& tier(size_t index) const;

    /// @brief Set the function called whenever an entry is pushed out of the cache for good.
    /// @details The listener is invoked while the cache lock is held.
    void set_drop_listener(DropListener listener);

    /// @brief Get the number of entries pushed out of the cache for good.
    [[nodiscard]] uint64_t dropped_count() const;

    /// @brief Compute and return the running hit rate of the cache.
    /// @details The hit rate is computed over the last `statistics_window_size()` reads.
    /// @return The hit rate, as a fraction.
    [[nodiscard]] double hit_rate() const;

    /// @brief Get the size of the sliding window used for computing statistics.
    [[nodiscard]] uint32_t statistics_window_size() const;

    /// @brief Set the size of the sliding window used for computing statistics.
    /// @warning This will reset the access log, so reads made prior to calling this will not be
    ///          counted in the statistics.
    void statistics_window_size(uint32_t window_size);

protected:
    LockGuard lock() const;

private:
    using TierSP = std::unique_ptr<TierType>;
    using Entry  = typename TierType::Entry;

    using RollingMeanTag        = boost::accumulators::tag::rolling_mean;
    using RollingMeanStatistics = boost::accumulators::stats<RollingMeanTag>;
    using MeanAccumulator       = boost::accumulators::accumulator_set<uint32_t, RollingMeanStatistics>;

    const size_t              m_max_levels;
    const std::vector<size_t> m_capacities;

    mutable std::recursive_mutex m_mutex;
    std::vector<TierSP>          m_tiers;

    DropListener m_drop_listener;
    uint64_t     m_dropped_count = 0;

    uint32_t                m_statistics_window_size = 1000;
    mutable MeanAccumulator m_hit_rate_acc;

    void      check_capacities(const Key& key) const;
    void      cascade(Key&& key, Value&& value);
    TierType& add_tier();
    void      drop(Entry&& entry);
};

/// @brief Print every tier on its own line, as `L1: {key: value, ...}`.
template<class K, class V, template<class, class, class> class E, class KH, bool TS>
std::ostream& operator<<(std::ostream& out, const TieredCache<K, V, E, KH, TS>& cache);

}  // namespace tiercache

#include "tiered_cache.hpp"

#endif
