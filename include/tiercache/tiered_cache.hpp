namespace tiercache {

template<class K, class V, template<class, class, class> class E, class KH, bool TS>
TieredCache<K, V, E, KH, TS>::TieredCache(size_t max_levels, std::vector<size_t> capacities)
 : m_max_levels{max_levels},
   m_capacities{std::move(capacities)},
   m_mutex{},
   m_tiers{},
   m_hit_rate_acc(boost::accumulators::tag::rolling_window::window_size = m_statistics_window_size)
{
    if (m_max_levels == 0) {
        LOG(ERROR) << "Refusing to build a cache without any tier";
        throw InvalidConfiguration("max_levels must be at least 1");
    }
    if (m_capacities.empty()) {
        LOG(ERROR) << "Refusing to build a cache without tier capacities";
        throw InvalidConfiguration("capacities must contain at least one entry");
    }
    if (m_capacities.size() < m_max_levels) {
        LOG(WARNING) << "Only " << m_capacities.size() << " tier capacities configured for up to " << m_max_levels << " tiers";
    }

    add_tier();

    VLOG(1) << "TieredCache(max_levels=" << m_max_levels << ", first_capacity=" << m_capacities.front() << ")";
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> std::optional<V> TieredCache<K, V, E, KH, TS>::read(const K& key)
{
    LockGuard guard(lock());

    for (size_t level = 0; level < m_tiers.size(); ++level) {
        std::optional<V> value = m_tiers[level]->get(key);
        if (!value) {
            continue;
        }

        m_hit_rate_acc(1);

        if (level != 0) {
            VLOG(2) << "Promoting key found in L" << level + 1;
            write(key, *value);
        }
        return value;
    }

    m_hit_rate_acc(0);
    return std::nullopt;
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> void TieredCache<K, V, E, KH, TS>::write(K key, V value)
{
    LockGuard guard(lock());

    check_capacities(key);
    cascade(std::move(key), std::move(value));
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> bool TieredCache<K, V, E, KH, TS>::remove(const K& key)
{
    LockGuard guard(lock());

    // Every tier is visited: a promotion may have left a stale copy behind in a lower tier.
    bool found = false;
    for (auto& tier : m_tiers) {
        found |= tier->remove(key);
    }
    return found;
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> bool TieredCache<K, V, E, KH, TS>::contains(const K& key) const
{
    LockGuard guard(lock());

    for (const auto& tier : m_tiers) {
        if (tier->contains(key)) {
            return true;
        }
    }
    return false;
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> void TieredCache<K, V, E, KH, TS>::clear()
{
    LockGuard guard(lock());

    for (auto& tier : m_tiers) {
        tier->clear();
    }

    m_dropped_count = 0;
    m_hit_rate_acc  = MeanAccumulator(boost::accumulators::tag::rolling_window::window_size = m_statistics_window_size);
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> auto TieredCache<K, V, E, KH, TS>::snapshot() const -> Snapshot
{
    LockGuard guard(lock());

    Snapshot contents;
    contents.reserve(m_tiers.size());
    for (const auto& tier : m_tiers) {
        contents.push_back(tier->snapshot());
    }
    return contents;
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> size_t TieredCache<K, V, E, KH, TS>::number_of_items() const
{
    LockGuard guard(lock());

    size_t count = 0;
    for (const auto& tier : m_tiers) {
        count += tier->number_of_items();
    }
    return count;
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> inline size_t TieredCache<K, V, E, KH, TS>::number_of_tiers() const
{
    LockGuard guard(lock());
    return m_tiers.size();
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> inline size_t TieredCache<K, V, E, KH, TS>::max_levels() const
{
    return m_max_levels;
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS>
inline const std::vector<size_t>& TieredCache<K, V, E, KH, TS>::capacities() const
{
    return m_capacities;
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS>
auto TieredCache<K, V, E, KH, TS>::tier(size_t index) const -> const TierType&
{
    LockGuard guard(lock());
    return *m_tiers.at(index);
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS>
void TieredCache<K, V, E, KH, TS>::set_drop_listener(DropListener listener)
{
    LockGuard guard(lock());
    m_drop_listener = std::move(listener);
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> inline uint64_t TieredCache<K, V, E, KH, TS>::dropped_count() const
{
    LockGuard guard(lock());
    return m_dropped_count;
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> inline double TieredCache<K, V, E, KH, TS>::hit_rate() const
{
    LockGuard guard(lock());
    return boost::accumulators::rolling_mean(m_hit_rate_acc);
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS>
inline uint32_t TieredCache<K, V, E, KH, TS>::statistics_window_size() const
{
    return m_statistics_window_size;
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS>
inline void TieredCache<K, V, E, KH, TS>::statistics_window_size(uint32_t window_size)
{
    LockGuard guard(lock());

    m_statistics_window_size = window_size;
    m_hit_rate_acc           = MeanAccumulator(boost::accumulators::tag::rolling_window::window_size = m_statistics_window_size);
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> auto TieredCache<K, V, E, KH, TS>::lock() const -> LockGuard
{
    if constexpr (TS) {
        LockGuard guard{m_mutex};
        return guard;
    } else {
        LockGuard guard;
        return guard;
    }
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS>
void TieredCache<K, V, E, KH, TS>::check_capacities(const K& key) const
{
    if (m_capacities.size() >= m_max_levels) {
        // Every tier we could ever create has a capacity.
        return;
    }

    // Walk the cascade without touching anything, to find out whether this write would need a tier we can't size.
    // Tiers are independent, so asking each one in turn what it would evict gives the exact chain of victims.
    const K* in_flight = &key;
    for (const auto& tier : m_tiers) {
        in_flight = tier->next_victim(*in_flight);
        if (in_flight == nullptr) {
            return;
        }
    }

    for (size_t level = m_tiers.size(); level < m_max_levels; ++level) {
        if (level >= m_capacities.size()) {
            LOG(ERROR) << "Cascade needs tier L" << level + 1 << " but only " << m_capacities.size() << " capacities are configured";
            throw InvalidConfiguration("no capacity configured for tier " + std::to_string(level));
        }
        if (m_capacities[level] > 0) {
            return;
        }
    }
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS>
void TieredCache<K, V, E, KH, TS>::cascade(K&& key, V&& value)
{
    std::optional<Entry> in_flight{std::in_place, std::move(key), std::move(value)};

    for (size_t level = 0; in_flight; ++level) {
        if (level == m_tiers.size()) {
            if (m_tiers.size() >= m_max_levels) {
                drop(std::move(*in_flight));
                return;
            }
            add_tier();
        }

        in_flight = m_tiers[level]->put(std::move(in_flight->first), std::move(in_flight->second));
    }
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> auto TieredCache<K, V, E, KH, TS>::add_tier() -> TierType&
{
    const size_t level = m_tiers.size();
    assert(level < m_max_levels);
    assert(level < m_capacities.size());

    m_tiers.push_back(std::make_unique<TierType>(m_capacities[level]));

    VLOG(1) << "Created tier L" << level + 1 << " with capacity " << m_capacities[level];
    return *m_tiers.back();
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS> void TieredCache<K, V, E, KH, TS>::drop(Entry&& entry)
{
    ++m_dropped_count;
    VLOG(1) << "All " << m_tiers.size() << " tiers are full, dropping an entry (" << m_dropped_count << " dropped so far)";

    if (m_drop_listener) {
        m_drop_listener(entry.first, entry.second);
    }
}

template<class K, class V, template<class, class, class> class E, class KH, bool TS>
std::ostream& operator<<(std::ostream& out, const TieredCache<K, V, E, KH, TS>& cache)
{
    const auto contents = cache.snapshot();

    for (size_t level = 0; level < contents.size(); ++level) {
        if (level != 0) {
            out << '\n';
        }

        out << 'L' << level + 1 << ": {";
        bool first = true;
        for (const auto& [key, value] : contents[level]) {
            if (!first) {
                out << ", ";
            }
            out << key << ": " << value;
            first = false;
        }
        out << '}';
    }
    return out;
}

}  // namespace tiercache
