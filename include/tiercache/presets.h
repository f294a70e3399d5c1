#ifndef TIERCACHE_PRESETS_H
#define TIERCACHE_PRESETS_H

#include <string>

#include <absl/hash/hash.h>

#include "tiered_cache.h"

#include "policy/eviction_fifo.h"
#include "policy/eviction_lfu.h"
#include "policy/eviction_lru.h"

/// @brief Frequently-used cache presets.
namespace tiercache::presets {

/// @brief Least-Frequently-Used tiered cache.
/// @details Every tier evicts the key with the fewest accesses, oldest first among ties.
/// @tparam Key The type of the key used for retrieving items.
/// @tparam Value The type of the items stored in the cache.
/// @tparam KeyHash A default-constructible callable type returning a hash of a key. Defaults to `absl::Hash<Key>`.
/// @tparam ThreadSafe Whether to protect this cache for concurrent access. (true by default)
template<typename Key, typename Value, typename KeyHash = absl::Hash<Key>, bool ThreadSafe = true>
using LFUTieredCache = TieredCache<Key, Value, policy::EvictionLFU, KeyHash, ThreadSafe>;

/// @brief Least-Recently-Used tiered cache.
/// @details Uses a linked list per tier to order items from hottest (most recently accessed) to coldest (least recently accessed).
/// @tparam Key The type of the key used for retrieving items.
/// @tparam Value The type of the items stored in the cache.
/// @tparam KeyHash A default-constructible callable type returning a hash of a key. Defaults to `absl::Hash<Key>`.
/// @tparam ThreadSafe Whether to protect this cache for concurrent access. (true by default)
template<typename Key, typename Value, typename KeyHash = absl::Hash<Key>, bool ThreadSafe = true>
using LRUTieredCache = TieredCache<Key, Value, policy::EvictionLRU, KeyHash, ThreadSafe>;

/// @brief First-In-First-Out tiered cache.
template<typename Key, typename Value, typename KeyHash = absl::Hash<Key>, bool ThreadSafe = true>
using FIFOTieredCache = TieredCache<Key, Value, policy::EvictionFIFO, KeyHash, ThreadSafe>;

/// @brief The string to string LFU cache most callers want.
using StringCache = LFUTieredCache<std::string, std::string>;

}  // namespace tiercache::presets

#endif
