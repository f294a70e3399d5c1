#ifndef TIERCACHE_KEY_LOCK_REGISTRY_H
#define TIERCACHE_KEY_LOCK_REGISTRY_H

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <absl/container/node_hash_map.h>
#include <absl/hash/hash.h>

#include <glog/logging.h>

#include "errors.h"

namespace tiercache {

/// @brief A table of mutual exclusion locks, one per key.
/// @details Serializes compound operations (check availability, decrement, record) against a single key,
///          while operations on different keys never wait on each other.
///
///          Locks are created the first time a key is seen and are kept for the lifetime of the registry.
///          The table itself is guarded by its own mutex, which is only held while looking up or inserting
///          a lock, never while a key lock is being waited on or held.
/// @tparam Key The type of the keys identifying the protected resources.
/// @tparam KeyHash A default-constructible callable type returning a hash of a key. Defaults to `absl::Hash<Key>`.
template<typename Key, typename KeyHash = absl::Hash<Key>> class KeyLockRegistry
{
public:
    using Mutex = std::timed_mutex;

    /// @brief Scoped ownership of a key lock. Releases the lock when it goes out of scope.
    using Guard = std::unique_lock<Mutex>;

    KeyLockRegistry() = default;

    KeyLockRegistry(const KeyLockRegistry&) = delete;
    KeyLockRegistry& operator=(const KeyLockRegistry&) = delete;

    /// @brief Try to lock a key, waiting at most `timeout`.
    /// @param key The key to lock.
    /// @param timeout How long to wait for the lock.
    /// @return An owning guard, or `std::nullopt` if the lock could not be taken in time.
    template<typename Rep, typename Period>
    [[nodiscard]] std::optional<Guard> try_acquire(const Key& key, const std::chrono::duration<Rep, Period>& timeout);

    /// @brief Lock a key, waiting at most `timeout`.
    /// @param key The key to lock.
    /// @param timeout How long to wait for the lock.
    /// @return An owning guard.
    /// @throws LockTimeout If the lock could not be taken in time.
    template<typename Rep, typename Period> [[nodiscard]] Guard acquire(const Key& key, const std::chrono::duration<Rep, Period>& timeout);

    /// @brief Release a key lock before its guard goes out of scope.
    /// @details Releasing a guard that doesn't own its lock is a no-op.
    void release(Guard& guard);

    /// @brief Whether a lock was ever created for this key.
    [[nodiscard]] bool contains(const Key& key) const;

    /// @brief Get the number of key locks created so far.
    [[nodiscard]] size_t number_of_locks() const;

private:
    using MutexSP  = std::unique_ptr<Mutex>;
    using MutexMap = absl::node_hash_map<Key, MutexSP, KeyHash>;

    mutable std::mutex m_table_mutex;
    MutexMap           m_locks;

    Mutex& lock_for(const Key& key);
};

}  // namespace tiercache

#include "key_lock_registry.hpp"

#endif
