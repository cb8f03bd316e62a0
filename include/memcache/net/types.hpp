#ifndef MEMCACHE_NET_TYPES_HPP
#define MEMCACHE_NET_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "memcache/util/types.hpp"

namespace memcache::net {

// memcached text protocol commands
enum class Command : uint8_t {
    Unknown = 0,
    // store family
    Set = 1,
    Add = 2,
    Replace = 3,
    Append = 4,
    Prepend = 5,
    Cas = 6,
    // fetch family
    Get = 7,
    Gets = 8,
    // misc
    Delete = 9,
    Incr = 10,
    Decr = 11,
    Touch = 12,
    FlushAll = 13,
    Stats = 14,
    Quit = 15,
};

// every non-numeric, non-error reply the server can give to a keyed command
enum class Outcome : uint8_t {
    Stored = 0,
    NotStored = 1,
    Exists = 2,
    NotFound = 3,
    Deleted = 4,
    Touched = 5,
    Ok = 6,
};

// one command on the wire. fields a command doesn't use are ignored by the encoder
struct Request {
    Command command = Command::Unknown;
    std::string key;
    std::vector<std::string> keys;  // get/gets keys, stats arguments
    uint16_t flags = 0;
    util::Seconds expire{0};  // expiry for store/touch, delay for flush_all
    std::string data;
    std::optional<uint64_t> cas;
    uint64_t delta = 0;
    bool noreply = false;
};

// parsed "VALUE <key> <flags> <bytes> [<cas>]"
struct ValueHeader {
    std::string key;
    uint16_t flags = 0;
    std::size_t size = 0;
    std::optional<uint64_t> cas;
};

struct CasValue {
    std::string value;
    uint64_t cas = 0;

    bool operator==(const CasValue& other) const {
        return value == other.value && cas == other.cas;
    }
};

// incr/decr reply: the new counter value, or Outcome::NotFound
using CounterValue = std::variant<uint64_t, Outcome>;

using FetchResult = std::unordered_map<std::string, std::string>;
using CasFetchResult = std::unordered_map<std::string, CasValue>;

// serialization hooks. both are opaque to the protocol: the client only moves bytes and flags
struct SerializedValue {
    std::string data;
    uint16_t flags = 0;
};

using Serializer = std::function<SerializedValue(std::string_view key, std::string_view value)>;
using Deserializer =
    std::function<std::string(std::string_view key, std::string_view data, uint16_t flags)>;

}  // namespace memcache::net

#endif
