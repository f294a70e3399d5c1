namespace tiercache {

template<class K, class V, template<class, class, class> class E, class KH>
Tier<K, V, E, KH>::Tier(size_t capacity)
 : m_capacity{capacity},
   m_eviction_policy(std::make_unique<MyEvictionPolicy>()),
   m_data{}
{
}

template<class K, class V, template<class, class, class> class E, class KH> inline bool Tier<K, V, E, KH>::contains(const K& key) const
{
    return m_data.find(key) != m_data.end();
}

template<class K, class V, template<class, class, class> class E, class KH> std::optional<V> Tier<K, V, E, KH>::get(const K& key)
{
    auto key_and_item = m_data.find(key);
    if (key_and_item != m_data.end()) {
        on_cache_hit(key_and_item->first, key_and_item->second);
        return key_and_item->second.m_value;
    }

    return std::nullopt;
}

template<class K, class V, template<class, class, class> class E, class KH> auto Tier<K, V, E, KH>::put(K key, V value) -> std::optional<Entry>
{
    CacheItem new_item{std::move(value)};

    auto it = m_data.find(key);
    if (it != m_data.end()) {
        using std::swap;
        swap(it->second, new_item);
        on_update(it->first, new_item, it->second);
        return std::nullopt;
    }

    if (m_capacity == 0) {
        // Nothing can ever live here: the candidate is its own victim.
        return Entry{std::move(key), std::move(new_item.m_value)};
    }

    std::optional<Entry> evicted;
    if (m_data.size() >= m_capacity) {
        evicted = evict_one();
    }

    const auto it_and_ok = m_data.insert_or_assign(std::move(key), std::move(new_item));
    assert(it_and_ok.second);
    on_insert(it_and_ok.first->first, it_and_ok.first->second);

    return evicted;
}

template<class K, class V, template<class, class, class> class E, class KH> bool Tier<K, V, E, KH>::remove(const K& key)
{
    auto key_and_item = m_data.find(key);
    if (key_and_item != m_data.end()) {
        remove(key_and_item);
        return true;
    }
    return false;
}

template<class K, class V, template<class, class, class> class E, class KH> const K* Tier<K, V, E, KH>::next_victim(const K& candidate) const
{
    if (contains(candidate)) {
        return nullptr;
    }

    if (m_capacity == 0) {
        return &candidate;
    }

    if (m_data.size() < m_capacity) {
        return nullptr;
    }

    auto victim_it = m_eviction_policy->victim_begin();
    assert(victim_it != m_eviction_policy->victim_end());

    const K& victim = *victim_it;
    return &victim;
}

template<class K, class V, template<class, class, class> class E, class KH> void Tier<K, V, E, KH>::clear()
{
    m_eviction_policy->clear();
    m_data.clear();
}

template<class K, class V, template<class, class, class> class E, class KH> std::map<K, V> Tier<K, V, E, KH>::snapshot() const
{
    std::map<K, V> contents;
    collect_into(contents);
    return contents;
}

template<class K, class V, template<class, class, class> class E, class KH>
template<class Container>
void Tier<K, V, E, KH>::collect_into(Container& container) const
{
    using namespace detail;

    // Use emplace_back if container is a sequence container, or emplace if container is an associative container.
    constexpr auto emplace_fn = boost::hana::if_(
        traits::stl::has_emplace_back<Container, K, V>,
        [](auto& seq_container, const auto& key, const auto& item) { seq_container.emplace_back(key, item.m_value); },
        [](auto& assoc_container, const auto& key, const auto& item) { assoc_container.emplace(key, item.m_value); });

    // Reserve space if the container has a reserve() method and a size method().
    boost::hana::if_(
        boost::hana::and_(traits::stl::has_reserve<Container>, traits::stl::has_size<Container>),
        [&](auto& c) { c.reserve(c.size() + m_data.size()); },
        [](auto&) {})(container);

    for (const auto& [key, cached_item] : m_data) {
        emplace_fn(container, key, cached_item);
    }
}

template<class K, class V, template<class, class, class> class E, class KH> inline size_t Tier<K, V, E, KH>::number_of_items() const
{
    return m_data.size();
}

template<class K, class V, template<class, class, class> class E, class KH> inline size_t Tier<K, V, E, KH>::capacity() const
{
    return m_capacity;
}

template<class K, class V, template<class, class, class> class E, class KH> inline bool Tier<K, V, E, KH>::is_full() const
{
    return m_data.size() >= m_capacity;
}

template<class K, class V, template<class, class, class> class E, class KH>
inline auto Tier<K, V, E, KH>::eviction_policy() const -> const MyEvictionPolicy&
{
    return *m_eviction_policy;
}

template<class K, class V, template<class, class, class> class E, class KH> auto Tier<K, V, E, KH>::evict_one() -> Entry
{
    auto victim_it = m_eviction_policy->victim_begin();
    assert(victim_it != m_eviction_policy->victim_end());

    const K& key_to_evict = *victim_it;
    auto     key_and_item = m_data.find(key_to_evict);

    // If this trips, the eviction policy tried to evict an item not in the tier: the eviction policy and the tier are out of sync.
    assert(key_and_item != m_data.end());

    return remove(key_and_item);
}

template<class K, class V, template<class, class, class> class E, class KH> auto Tier<K, V, E, KH>::remove(DataMapIt it) -> Entry
{
    // The policy holds a reference to the key stored in the map, so it has to let go before the node is extracted.
    on_evict(it->first, it->second);

    auto node = m_data.extract(it);
    return Entry{std::move(node.key()), std::move(node.mapped().m_value)};
}

template<class K, class V, template<class, class, class> class E, class KH> void Tier<K, V, E, KH>::on_insert(const K& key, const CacheItem& item)
{
    // Call event handler iif the method is defined in the policy.
    boost::hana::if_(
        detail::traits::event::has_on_insert<K, KH, V, E>,
        [&](auto& x) { return x.on_insert(key, item); },
        [](auto&) {})(*m_eviction_policy);
}

template<class K, class V, template<class, class, class> class E, class KH>
void Tier<K, V, E, KH>::on_update(const K& key, const CacheItem& old_item, const CacheItem& new_item)
{
    boost::hana::if_(
        detail::traits::event::has_on_update<K, KH, V, E>,
        [&](auto& x) { return x.on_update(key, old_item, new_item); },
        [](auto&) {})(*m_eviction_policy);
}

template<class K, class V, template<class, class, class> class E, class KH> void Tier<K, V, E, KH>::on_cache_hit(const K& key, const CacheItem& item)
{
    boost::hana::if_(
        detail::traits::event::has_on_cachehit<K, KH, V, E>,
        [&](auto& x) { return x.on_cache_hit(key, item); },
        [](auto&) {})(*m_eviction_policy);
}

template<class K, class V, template<class, class, class> class E, class KH> void Tier<K, V, E, KH>::on_evict(const K& key, const CacheItem& item)
{
    boost::hana::if_(
        detail::traits::event::has_on_evict<K, KH, V, E>,
        [&](auto& x) { return x.on_evict(key, item); },
        [](auto&) {})(*m_eviction_policy);
}

}  // namespace tiercache
