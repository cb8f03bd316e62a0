#ifndef MEMCACHE_NET_CLIENT_CLIENT_HPP
#define MEMCACHE_NET_CLIENT_CLIENT_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "memcache/net/stream.hpp"
#include "memcache/net/types.hpp"
#include "memcache/util/config.hpp"
#include "memcache/util/types.hpp"

namespace memcache::net::client {

struct ClientOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 11211;  // memcached's default port
    util::Duration connect_timeout{0};  // 0: wait as long as the OS does
    util::Duration timeout{0};          // per send/recv, 0: no timeout
    bool no_delay = false;
    // get/get_many/gets/gets_many report any failure as a miss instead of throwing
    bool ignore_exc = false;

    Serializer serializer;      // empty: values go out as-is with flags 0
    Deserializer deserializer;  // empty: values come back as-is

    [[nodiscard]] SocketOptions socket_options() const;
    static ClientOptions from_config(const util::Config& config);
};

// opens the byte stream for a (re)connect. the default dials TCP with connect_tcp()
using StreamFactory = std::function<std::unique_ptr<IStream>(const ClientOptions&)>;

/*
    Client for one memcached server over one connection.

    The connection is opened lazily by the first call that needs it. Any error while a command is
    in flight closes it (and drops whatever was buffered) before the error reaches the caller;
    the next call reconnects. Not thread safe: one request is on the wire at a time.
    A moved-from Client may only be destroyed or assigned to.

    noreply defaults follow memcached client convention: on for set/add/replace/append/prepend/
    remove/touch/flush_all, off for cas/incr/decr. Calls made with noreply return nullopt.
*/
class Client {
public:
    explicit Client(const ClientOptions& options = {});
    Client(const ClientOptions& options, StreamFactory factory);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    void connect();
    void close();
    [[nodiscard]] bool connected() const noexcept;

    std::optional<Outcome> set(std::string_view key, std::string_view value,
                               util::Seconds expire = util::Seconds(0), bool noreply = true);
    std::optional<Outcome> add(std::string_view key, std::string_view value,
                               util::Seconds expire = util::Seconds(0), bool noreply = true);
    std::optional<Outcome> replace(std::string_view key, std::string_view value,
                                   util::Seconds expire = util::Seconds(0), bool noreply = true);
    std::optional<Outcome> append(std::string_view key, std::string_view value,
                                  util::Seconds expire = util::Seconds(0), bool noreply = true);
    std::optional<Outcome> prepend(std::string_view key, std::string_view value,
                                   util::Seconds expire = util::Seconds(0), bool noreply = true);
    std::optional<Outcome> cas(std::string_view key, std::string_view value, uint64_t cas,
                               util::Seconds expire = util::Seconds(0), bool noreply = false);

    // one set per entry, in order. the first failure is thrown and the rest are not sent
    void set_many(const std::vector<std::pair<std::string, std::string>>& values,
                  util::Seconds expire = util::Seconds(0), bool noreply = true);

    [[nodiscard]] std::optional<std::string> get(std::string_view key);
    [[nodiscard]] FetchResult get_many(const std::vector<std::string>& keys);
    [[nodiscard]] std::optional<CasValue> gets(std::string_view key);
    [[nodiscard]] CasFetchResult gets_many(const std::vector<std::string>& keys);

    std::optional<Outcome> remove(std::string_view key, bool noreply = true);
    // one delete per key, in order, each waiting for its reply unless noreply
    void remove_many(const std::vector<std::string>& keys, bool noreply = true);

    std::optional<CounterValue> incr(std::string_view key, uint64_t delta, bool noreply = false);
    std::optional<CounterValue> decr(std::string_view key, uint64_t delta, bool noreply = false);

    std::optional<Outcome> touch(std::string_view key, util::Seconds expire = util::Seconds(0),
                                 bool noreply = true);
    std::optional<Outcome> flush_all(util::Seconds delay = util::Seconds(0), bool noreply = true);

    [[nodiscard]] std::map<std::string, std::string> stats(
        const std::vector<std::string>& args = {});

    // sends quit and closes without waiting. the client stays usable and reconnects on demand
    void quit();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace memcache::net::client

#endif
