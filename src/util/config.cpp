#include "memcache/util/config.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

namespace memcache::util {

namespace {
std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

int64_t parse_int(const std::string& key, const std::string& value, int64_t min, int64_t max) {
    size_t used = 0;
    int64_t parsed = 0;
    try {
        parsed = std::stoll(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("config: " + key + " is not a number: " + value);
    }
    if (used != value.size() || parsed < min || parsed > max) {
        throw std::invalid_argument("config: " + key + " out of range: " + value);
    }
    return parsed;
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

}  // namespace

std::optional<Config> Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // remove quotes if present
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (key == "host") {
            config.host = value;
        } else if (key == "port") {
            config.port = static_cast<uint16_t>(
                parse_int(key, value, 1, std::numeric_limits<uint16_t>::max()));
        } else if (key == "connect_timeout_ms") {
            config.connect_timeout_ms =
                parse_int(key, value, 0, std::numeric_limits<int64_t>::max());
        } else if (key == "timeout_ms") {
            config.timeout_ms = parse_int(key, value, 0, std::numeric_limits<int64_t>::max());
        } else if (key == "no_delay") {
            config.no_delay = parse_bool(value);
        } else if (key == "ignore_exc") {
            config.ignore_exc = parse_bool(value);
        } else if (key == "log_level") {
            config.log_level = parse_log_level(value);
        }
    }

    return config;
}

void Config::apply_logging() const {
    Logger::instance().set_level(log_level);
}

}  // namespace memcache::util
