namespace tiercache::policy {

template<class Key, class KeyHash, class Value> EvictionLFU<Key, KeyHash, Value>::Bucket::Bucket(uint64_t frequency) : m_frequency{frequency}
{
}

template<class Key, class KeyHash, class Value>
EvictionLFU<Key, KeyHash, Value>::VictimIterator::VictimIterator(BucketConstIt bucket, BucketConstIt bucket_end)
 : m_bucket{bucket},
   m_bucket_end{bucket_end},
   m_key{}
{
    if (m_bucket != m_bucket_end) {
        m_key = m_bucket->m_keys.begin();
    }
}

template<class Key, class KeyHash, class Value> const Key& EvictionLFU<Key, KeyHash, Value>::VictimIterator::operator*() const
{
    assert(m_bucket != m_bucket_end);
    return *m_key;
}

template<class Key, class KeyHash, class Value> auto EvictionLFU<Key, KeyHash, Value>::VictimIterator::operator++() -> VictimIterator&
{
    assert(m_bucket != m_bucket_end);

    ++m_key;
    if (m_key == m_bucket->m_keys.end()) {
        ++m_bucket;
        if (m_bucket != m_bucket_end) {
            m_key = m_bucket->m_keys.begin();
        }
    }
    return *this;
}

template<class Key, class KeyHash, class Value> auto EvictionLFU<Key, KeyHash, Value>::VictimIterator::operator++(int) -> VictimIterator
{
    auto tmp = *this;
    ++*this;
    return tmp;
}

template<class Key, class KeyHash, class Value> bool EvictionLFU<Key, KeyHash, Value>::VictimIterator::operator==(const VictimIterator& other) const
{
    // Key iterators are only meaningful while we still point to a bucket.
    return m_bucket == other.m_bucket && (m_bucket == m_bucket_end || m_key == other.m_key);
}

template<class Key, class KeyHash, class Value> bool EvictionLFU<Key, KeyHash, Value>::VictimIterator::operator!=(const VictimIterator& other) const
{
    return !(*this == other);
}

template<class Key, class KeyHash, class Value> void EvictionLFU<Key, KeyHash, Value>::clear()
{
    m_nodes.clear();
    m_buckets.clear();
}

template<class Key, class KeyHash, class Value> void EvictionLFU<Key, KeyHash, Value>::on_insert(const Key& key, const CacheItem& /* item */)
{
    assert(m_nodes.find(key) == m_nodes.end());  // Validate the item is not already in policy.

    BucketIt bucket = m_buckets.begin();
    if (bucket == m_buckets.end() || bucket->m_frequency != 1) {
        bucket = m_buckets.emplace(m_buckets.begin(), 1);
    }

    bucket->m_keys.emplace_back(std::ref(key));
    m_nodes.emplace(std::ref(key), Node{bucket, std::prev(bucket->m_keys.end())});
}

template<class Key, class KeyHash, class Value>
void EvictionLFU<Key, KeyHash, Value>::on_update(const Key& key, const CacheItem& /* old_item */, const CacheItem& new_item)
{
    on_cache_hit(key, new_item);
}

template<class Key, class KeyHash, class Value> void EvictionLFU<Key, KeyHash, Value>::on_cache_hit(const Key& key, const CacheItem& /* item */)
{
    auto node_it = m_nodes.find(key);
    if (node_it != m_nodes.end()) {
        touch(node_it->second);
    } else {
        // If this is tripped, there is a disconnect between the contents of the policy and the contents of the tier.
        assert(false);
    }
}

template<class Key, class KeyHash, class Value> void EvictionLFU<Key, KeyHash, Value>::on_evict(const Key& key, const CacheItem& /* item */)
{
    auto node_it = m_nodes.find(key);
    assert(node_it != m_nodes.end());
    if (node_it == m_nodes.end()) {
        return;
    }

    const BucketIt bucket = node_it->second.m_bucket;
    bucket->m_keys.erase(node_it->second.m_key);
    m_nodes.erase(node_it);

    // The minimum frequency is whatever bucket ends up at the front, so dropping an empty
    // bucket is all that is needed to recompute it.
    if (bucket->m_keys.empty()) {
        m_buckets.erase(bucket);
    }
}

template<class Key, class KeyHash, class Value> uint64_t EvictionLFU<Key, KeyHash, Value>::frequency(const Key& key) const
{
    auto node_it = m_nodes.find(key);
    if (node_it == m_nodes.end()) {
        return 0;
    }
    return node_it->second.m_bucket->m_frequency;
}

template<class Key, class KeyHash, class Value> uint64_t EvictionLFU<Key, KeyHash, Value>::min_frequency() const
{
    return m_buckets.empty() ? 0 : m_buckets.front().m_frequency;
}

template<class Key, class KeyHash, class Value> size_t EvictionLFU<Key, KeyHash, Value>::number_of_buckets() const
{
    return m_buckets.size();
}

template<class Key, class KeyHash, class Value> auto EvictionLFU<Key, KeyHash, Value>::victim_begin() const -> VictimIterator
{
    return VictimIterator{m_buckets.cbegin(), m_buckets.cend()};
}

template<class Key, class KeyHash, class Value> auto EvictionLFU<Key, KeyHash, Value>::victim_end() const -> VictimIterator
{
    return VictimIterator{m_buckets.cend(), m_buckets.cend()};
}

template<class Key, class KeyHash, class Value> void EvictionLFU<Key, KeyHash, Value>::touch(Node& node)
{
    const BucketIt current        = node.m_bucket;
    const uint64_t next_frequency = current->m_frequency + 1;

    BucketIt next = std::next(current);
    if (next == m_buckets.end() || next->m_frequency != next_frequency) {
        next = m_buckets.emplace(next, next_frequency);
    }

    // Splicing keeps the list node (and the key reference it holds) alive, only relinking it at the tail of the next bucket.
    next->m_keys.splice(next->m_keys.end(), current->m_keys, node.m_key);
    node.m_bucket = next;

    if (current->m_keys.empty()) {
        m_buckets.erase(current);
    }
}

}  // namespace tiercache::policy
