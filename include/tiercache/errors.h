#ifndef TIERCACHE_ERRORS_H
#define TIERCACHE_ERRORS_H

#include <stdexcept>
#include <string>

namespace tiercache {

/// @brief Thrown when a cache is constructed, or asked to grow, with parameters it cannot honor.
/// @details Raised by the `TieredCache` constructor for an empty capacity list or a zero level count,
///          and by `TieredCache::write` when a cascade needs a tier whose capacity was never provided.
class InvalidConfiguration : public std::invalid_argument
{
public:
    explicit InvalidConfiguration(const std::string& what) : std::invalid_argument(what)
    {
    }
};

/// @brief Thrown by `KeyLockRegistry::acquire` when a key lock could not be taken before the deadline.
/// @details Recoverable: the caller should treat the resource as contended and retry or give up.
class LockTimeout : public std::runtime_error
{
public:
    explicit LockTimeout(const std::string& what) : std::runtime_error(what)
    {
    }
};

}  // namespace tiercache

#endif
