#ifndef MEMCACHE_UTIL_CONFIG_HPP
#define MEMCACHE_UTIL_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "memcache/util/logger.hpp"

namespace memcache::util {

struct Config {
    // target
    std::string host = "127.0.0.1";
    uint16_t port = 11211;

    // socket. 0 = no timeout
    int64_t connect_timeout_ms = 0;
    int64_t timeout_ms = 0;
    bool no_delay = false;

    // treat get/gets failures as cache misses
    bool ignore_exc = false;

    // logging
    LogLevel log_level = LogLevel::Info;

    // Load from file (key = value, '#' comments). nullopt if the file can't be opened,
    // std::invalid_argument on a malformed number
    static std::optional<Config> load_file(const std::filesystem::path& path);

    void apply_logging() const;
};

}  // namespace memcache::util

#endif
