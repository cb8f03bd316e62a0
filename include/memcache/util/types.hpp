#ifndef MEMCACHE_UTIL_TYPES_HPP
#define MEMCACHE_UTIL_TYPES_HPP

#include <chrono>
#include <cstdint>

namespace memcache::util {

// socket timeouts. zero means block forever
using Duration = std::chrono::milliseconds;

// memcached expiry and flush delay are whole seconds on the wire
using Seconds = std::chrono::seconds;

inline int64_t to_wire_seconds(Seconds s) {
    return static_cast<int64_t>(s.count());
}

}  // namespace memcache::util

#endif
