namespace tiercache::policy {

template<class Key, class KeyHash, class Value> void EvictionFIFO<Key, KeyHash, Value>::clear()
{
    m_queue.clear();
    m_nodes.clear();
}

template<class Key, class KeyHash, class Value> void EvictionFIFO<Key, KeyHash, Value>::on_insert(const Key& key, const CacheItem& /* item */)
{
    assert(m_nodes.find(key) == m_nodes.end());

    m_queue.emplace_back(std::ref(key));
    m_nodes.emplace(std::ref(key), std::prev(m_queue.end()));
}

template<class Key, class KeyHash, class Value> void EvictionFIFO<Key, KeyHash, Value>::on_evict(const Key& key, const CacheItem& /* item */)
{
    auto node_it = m_nodes.find(key);
    assert(node_it != m_nodes.end());
    if (node_it == m_nodes.end()) {
        return;
    }

    m_queue.erase(node_it->second);
    m_nodes.erase(node_it);
}

template<class Key, class KeyHash, class Value> auto EvictionFIFO<Key, KeyHash, Value>::victim_begin() const -> VictimIterator
{
    return m_queue.cbegin();
}

template<class Key, class KeyHash, class Value> auto EvictionFIFO<Key, KeyHash, Value>::victim_end() const -> VictimIterator
{
    return m_queue.cend();
}

}  // namespace tiercache::policy
