#ifndef TIERCACHE_ITEM_H
#define TIERCACHE_ITEM_H

#include <utility>

namespace tiercache {

/// @brief A wrapper for items stored in a cache tier.
template<typename Value> struct Item {
    explicit Item(Value value) : m_value{std::move(value)}
    {
    }
    Item(Item&& other) noexcept = default;
    Item(const Item& other)     = delete;
    Item& operator=(const Item&) = delete;
    Item& operator=(Item&&) noexcept = default;

    Value m_value;  //!< The value stored in the tier.
};

template<typename Value> void swap(Item<Value>& a, Item<Value>& b)
{
    using std::swap;

    swap(a.m_value, b.m_value);
}

}  // namespace tiercache

#endif
