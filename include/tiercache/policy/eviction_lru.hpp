namespace tiercache::policy {

template<class Key, class KeyHash, class Value>
EvictionLRU<Key, KeyHash, Value>::VictimIterator::VictimIterator(const KeyRefReverseIt& iterator) : m_iterator(iterator)
{
}

template<class Key, class KeyHash, class Value> const Key& EvictionLRU<Key, KeyHash, Value>::VictimIterator::operator*() const
{
    return *m_iterator;
}

template<class Key, class KeyHash, class Value> auto EvictionLRU<Key, KeyHash, Value>::VictimIterator::operator++() -> VictimIterator&
{
    ++m_iterator;
    return *this;
}

template<class Key, class KeyHash, class Value> auto EvictionLRU<Key, KeyHash, Value>::VictimIterator::operator++(int) -> VictimIterator
{
    auto tmp = *this;
    ++*this;
    return tmp;
}

template<class Key, class KeyHash, class Value> bool EvictionLRU<Key, KeyHash, Value>::VictimIterator::operator==(const VictimIterator& other) const
{
    return m_iterator == other.m_iterator;
}

template<class Key, class KeyHash, class Value> bool EvictionLRU<Key, KeyHash, Value>::VictimIterator::operator!=(const VictimIterator& other) const
{
    return m_iterator != other.m_iterator;
}

template<class Key, class KeyHash, class Value> void EvictionLRU<Key, KeyHash, Value>::clear()
{
    m_keys.clear();
    m_nodes.clear();
}

template<class Key, class KeyHash, class Value> void EvictionLRU<Key, KeyHash, Value>::on_insert(const Key& key, const CacheItem& /* item */)
{
    assert(m_nodes.find(key) == m_nodes.end());  // Validate the item is not already in policy.

    m_keys.emplace_front(std::ref(key));
    m_nodes.emplace(std::ref(key), m_keys.begin());
}

template<class Key, class KeyHash, class Value>
void EvictionLRU<Key, KeyHash, Value>::on_update(const Key& key, const CacheItem& /* old_item */, const CacheItem& new_item)
{
    on_cache_hit(key, new_item);
}

template<class Key, class KeyHash, class Value> void EvictionLRU<Key, KeyHash, Value>::on_cache_hit(const Key& key, const CacheItem& /* item */)
{
    auto node_it = m_nodes.find(key);
    if (node_it != m_nodes.end()) {
        // No need to shuffle stuff around if item is already the hottest item in the tier.
        if (node_it->second != m_keys.begin()) {
            m_keys.splice(m_keys.begin(), m_keys, node_it->second);
        }
    } else {
        // If this is tripped, there is a disconnect between the contents of the policy and the contents of the tier.
        assert(false);
    }
}

template<class Key, class KeyHash, class Value> void EvictionLRU<Key, KeyHash, Value>::on_evict(const Key& key, const CacheItem& /* item */)
{
    auto node_it = m_nodes.find(key);
    assert(node_it != m_nodes.end());
    if (node_it == m_nodes.end()) {
        return;
    }

    m_keys.erase(node_it->second);
    m_nodes.erase(node_it);
}

template<class Key, class KeyHash, class Value> auto EvictionLRU<Key, KeyHash, Value>::victim_begin() const -> VictimIterator
{
    return VictimIterator{m_keys.crbegin()};
}

template<class Key, class KeyHash, class Value> auto EvictionLRU<Key, KeyHash, Value>::victim_end() const -> VictimIterator
{
    return VictimIterator{m_keys.crend()};
}

}  // namespace tiercache::policy
