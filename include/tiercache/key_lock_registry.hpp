namespace tiercache {

template<class K, class KH>
template<class Rep, class Period>
auto KeyLockRegistry<K, KH>::try_acquire(const K& key, const std::chrono::duration<Rep, Period>& timeout) -> std::optional<Guard>
{
    Guard guard{lock_for(key), std::defer_lock};
    if (!guard.try_lock_for(timeout)) {
        return std::nullopt;
    }
    return guard;
}

template<class K, class KH>
template<class Rep, class Period>
auto KeyLockRegistry<K, KH>::acquire(const K& key, const std::chrono::duration<Rep, Period>& timeout) -> Guard
{
    std::optional<Guard> guard = try_acquire(key, timeout);
    if (!guard) {
        const auto waited_ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
        LOG(WARNING) << "Timed out after " << waited_ms << "ms waiting for a key lock";
        throw LockTimeout("could not acquire key lock within " + std::to_string(waited_ms) + "ms");
    }
    return std::move(*guard);
}

template<class K, class KH> void KeyLockRegistry<K, KH>::release(Guard& guard)
{
    if (guard.owns_lock()) {
        guard.unlock();
    }
}

template<class K, class KH> bool KeyLockRegistry<K, KH>::contains(const K& key) const
{
    std::lock_guard<std::mutex> table_guard{m_table_mutex};
    return m_locks.find(key) != m_locks.end();
}

template<class K, class KH> size_t KeyLockRegistry<K, KH>::number_of_locks() const
{
    std::lock_guard<std::mutex> table_guard{m_table_mutex};
    return m_locks.size();
}

template<class K, class KH> auto KeyLockRegistry<K, KH>::lock_for(const K& key) -> Mutex&
{
    std::lock_guard<std::mutex> table_guard{m_table_mutex};

    auto key_and_lock = m_locks.find(key);
    if (key_and_lock == m_locks.end()) {
        key_and_lock = m_locks.emplace(key, std::make_unique<Mutex>()).first;
    }

    // Key locks are never erased, so handing out a reference that outlives the table lock is safe.
    return *key_and_lock->second;
}

}  // namespace tiercache
