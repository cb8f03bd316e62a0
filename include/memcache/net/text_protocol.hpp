#ifndef MEMCACHE_NET_TEXT_PROTOCOL_HPP
#define MEMCACHE_NET_TEXT_PROTOCOL_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "memcache/net/types.hpp"

namespace memcache::net {

/*
    memcached ASCII protocol: request encoding and reply classification.

    Every decode_* call first checks for the three error replies (ERROR, CLIENT_ERROR,
    SERVER_ERROR) and throws MemcacheError with the matching kind. Anything outside the grammar
    of the command that was sent throws UnknownResponse with at most kMaxExcerpt bytes of the
    offending line.
*/
class TextProtocol {
public:
    static constexpr std::size_t kMaxExcerpt = 32;

    // Encode. throws ClientError for a key that isn't 7-bit ASCII
    static std::string encode_request(const Request& req);

    // Decode
    static void check_error(std::string_view line, Command cmd);
    static Outcome decode_outcome(std::string_view line, Command cmd);
    static CounterValue decode_counter(std::string_view line, Command cmd);
    // nullopt on END
    static std::optional<ValueHeader> decode_value_header(std::string_view line, Command cmd);
    static std::optional<std::pair<std::string, std::string>> decode_stat(std::string_view line);

    // replies a command may legitimately produce (empty for fetch/stats/quit)
    static const std::vector<Outcome>& valid_outcomes(Command cmd);

    // Conversions
    static std::string_view command_to_string(Command cmd);
    static Command parse_command(std::string_view str);
    static std::string_view outcome_to_string(Outcome outcome);
    static std::optional<Outcome> parse_outcome(std::string_view str);

    static bool is_store(Command cmd);
    static bool is_fetch(Command cmd);
    static std::string excerpt(std::string_view line);
};

}  // namespace memcache::net

#endif
