#include "memcache/net/client/client.hpp"

#include <exception>
#include <utility>

#include "memcache/net/errors.hpp"
#include "memcache/net/frame_reader.hpp"
#include "memcache/net/text_protocol.hpp"
#include "memcache/util/logger.hpp"

namespace memcache::net::client {

namespace util = memcache::util;

SocketOptions ClientOptions::socket_options() const {
    SocketOptions socket;
    socket.host = host;
    socket.port = port;
    socket.connect_timeout = connect_timeout;
    socket.timeout = timeout;
    socket.no_delay = no_delay;
    return socket;
}

ClientOptions ClientOptions::from_config(const util::Config& config) {
    ClientOptions options;
    options.host = config.host;
    options.port = config.port;
    options.connect_timeout = util::Duration(config.connect_timeout_ms);
    options.timeout = util::Duration(config.timeout_ms);
    options.no_delay = config.no_delay;
    options.ignore_exc = config.ignore_exc;
    return options;
}

namespace {

std::unique_ptr<IStream> dial_tcp(const ClientOptions& options) {
    return connect_tcp(options.socket_options());
}

}  // namespace

class Client::Impl {
   public:
    Impl(const ClientOptions& options, StreamFactory factory)
        : options_(options), factory_(factory ? std::move(factory) : StreamFactory(dial_tcp)) {}

    // no logging here: building the message may throw
    ~Impl() {
        if (conn_) {
            conn_->stream->close();
        }
    }

    void connect() {
        ensure_connected();
    }

    void close() {
        if (!conn_) {
            return;
        }
        conn_->stream->close();
        conn_.reset();
        LOG_DEBUG("closed connection to " + target());
    }

    [[nodiscard]] bool connected() const noexcept {
        return conn_.has_value();
    }

    std::optional<Outcome> store(Command cmd, std::string_view key, std::string_view value,
                                 util::Seconds expire, bool noreply,
                                 std::optional<uint64_t> cas = std::nullopt) {
        return guarded(cmd, [&]() -> std::optional<Outcome> {
            Request req;
            req.command = cmd;
            req.key = std::string(key);
            req.expire = expire;
            req.cas = cas;
            req.noreply = noreply;
            if (options_.serializer) {
                SerializedValue serialized = options_.serializer(key, value);
                req.data = std::move(serialized.data);
                req.flags = serialized.flags;
            } else {
                req.data = std::string(value);
            }

            Connection& conn = send(req);
            if (noreply) {
                return std::nullopt;
            }
            return TextProtocol::decode_outcome(read_line(conn), cmd);
        });
    }

    FetchResult get_many(const std::vector<std::string>& keys) {
        return fetch<FetchResult>(Command::Get, keys,
                                  [](FetchResult& result, ValueHeader& header, std::string value) {
                                      result.insert_or_assign(std::move(header.key),
                                                              std::move(value));
                                  });
    }

    CasFetchResult gets_many(const std::vector<std::string>& keys) {
        return fetch<CasFetchResult>(
            Command::Gets, keys, [](CasFetchResult& result, ValueHeader& header, std::string value) {
                result.insert_or_assign(std::move(header.key),
                                        CasValue{std::move(value), header.cas.value_or(0)});
            });
    }

    std::optional<CounterValue> counter(Command cmd, std::string_view key, uint64_t delta,
                                        bool noreply) {
        return guarded(cmd, [&]() -> std::optional<CounterValue> {
            Request req;
            req.command = cmd;
            req.key = std::string(key);
            req.delta = delta;
            req.noreply = noreply;

            Connection& conn = send(req);
            if (noreply) {
                return std::nullopt;
            }
            return TextProtocol::decode_counter(read_line(conn), cmd);
        });
    }

    // delete, touch, flush_all
    std::optional<Outcome> misc(const Request& req) {
        return guarded(req.command, [&]() -> std::optional<Outcome> {
            Connection& conn = send(req);
            if (req.noreply) {
                return std::nullopt;
            }
            return TextProtocol::decode_outcome(read_line(conn), req.command);
        });
    }

    std::map<std::string, std::string> stats(const std::vector<std::string>& args) {
        return guarded(Command::Stats, [&]() {
            Request req;
            req.command = Command::Stats;
            req.keys = args;

            Connection& conn = send(req);
            std::map<std::string, std::string> result;
            while (auto stat = TextProtocol::decode_stat(read_line(conn))) {
                result.insert_or_assign(std::move(stat->first), std::move(stat->second));
            }
            return result;
        });
    }

    void quit() {
        // nothing to say goodbye to
        if (!conn_) {
            return;
        }
        Request req;
        req.command = Command::Quit;
        guarded(Command::Quit, [&]() { send(req); });
        close();
    }

   private:
    // one connection and the bytes read from it but not yet consumed. they live and die together
    struct Connection {
        std::unique_ptr<IStream> stream;
        FrameReader reader;
    };

    Connection& ensure_connected() {
        if (!conn_) {
            auto stream = factory_(options_);
            if (!stream) {
                throw MemcacheError(ErrorKind::Transport, "no stream to " + target());
            }
            conn_ = Connection{std::move(stream), FrameReader{}};
            LOG_DEBUG("connected to " + target());
        }
        return *conn_;
    }

    // encoding happens before connecting so a request we refuse never opens a socket
    Connection& send(const Request& req) {
        std::string wire = TextProtocol::encode_request(req);
        Connection& conn = ensure_connected();
        conn.stream->send_all(wire);
        return conn;
    }

    std::string read_line(Connection& conn) {
        return conn.reader.read_line(*conn.stream);
    }

    /*
        runs one command. whatever escapes (protocol error, EOF, timeout, a throwing serializer)
        leaves the connection closed: a half-read reply would desync every later command
    */
    template <typename Fn>
    auto guarded(Command cmd, Fn&& fn) -> decltype(fn()) {
        try {
            return fn();
        } catch (const std::exception& e) {
            teardown(cmd, e.what());
            throw;
        } catch (...) {
            teardown(cmd, "unknown exception");
            throw;
        }
    }

    void teardown(Command cmd, std::string_view reason) {
        if (!conn_) {
            return;
        }
        LOG_WARN(std::string(TextProtocol::command_to_string(cmd)) + " on " + target() +
                 " failed, closing connection: " + std::string(reason));
        close();
    }

    template <typename Result, typename Insert>
    Result fetch(Command cmd, const std::vector<std::string>& keys, Insert insert) {
        if (keys.empty()) {
            return {};
        }

        try {
            return guarded(cmd, [&]() {
                Request req;
                req.command = cmd;
                req.keys = keys;

                Connection& conn = send(req);
                Result result;
                while (auto header = TextProtocol::decode_value_header(read_line(conn), cmd)) {
                    std::string value = conn.reader.read_value(*conn.stream, header->size);
                    if (options_.deserializer) {
                        value = options_.deserializer(header->key, value, header->flags);
                    }
                    insert(result, *header, std::move(value));
                }
                return result;
            });
        } catch (const std::exception& e) {
            if (!options_.ignore_exc) {
                throw;
            }
            report_miss(cmd, e.what());
            return {};
        } catch (...) {
            if (!options_.ignore_exc) {
                throw;
            }
            report_miss(cmd, "unknown exception");
            return {};
        }
    }

    void report_miss(Command cmd, std::string_view reason) {
        LOG_WARN(std::string(TextProtocol::command_to_string(cmd)) + " on " + target() +
                 " failed, reporting a miss: " + std::string(reason));
    }

    std::string target() const {
        return options_.host + ":" + std::to_string(options_.port);
    }

    ClientOptions options_;
    StreamFactory factory_;
    std::optional<Connection> conn_;  // empty while disconnected
};

// PIMPL INTERFACE ------------------------------------------------------------------------
Client::Client(const ClientOptions& options) : impl_(std::make_unique<Impl>(options, nullptr)) {}
Client::Client(const ClientOptions& options, StreamFactory factory)
    : impl_(std::make_unique<Impl>(options, std::move(factory))) {}
Client::~Client() = default;
Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;

void Client::connect() {
    impl_->connect();
}
void Client::close() {
    impl_->close();
}
bool Client::connected() const noexcept {
    return impl_->connected();
}

std::optional<Outcome> Client::set(std::string_view key, std::string_view value,
                                   util::Seconds expire, bool noreply) {
    return impl_->store(Command::Set, key, value, expire, noreply);
}
std::optional<Outcome> Client::add(std::string_view key, std::string_view value,
                                   util::Seconds expire, bool noreply) {
    return impl_->store(Command::Add, key, value, expire, noreply);
}
std::optional<Outcome> Client::replace(std::string_view key, std::string_view value,
                                       util::Seconds expire, bool noreply) {
    return impl_->store(Command::Replace, key, value, expire, noreply);
}
std::optional<Outcome> Client::append(std::string_view key, std::string_view value,
                                      util::Seconds expire, bool noreply) {
    return impl_->store(Command::Append, key, value, expire, noreply);
}
std::optional<Outcome> Client::prepend(std::string_view key, std::string_view value,
                                       util::Seconds expire, bool noreply) {
    return impl_->store(Command::Prepend, key, value, expire, noreply);
}
std::optional<Outcome> Client::cas(std::string_view key, std::string_view value, uint64_t cas,
                                   util::Seconds expire, bool noreply) {
    return impl_->store(Command::Cas, key, value, expire, noreply, cas);
}

void Client::set_many(const std::vector<std::pair<std::string, std::string>>& values,
                      util::Seconds expire, bool noreply) {
    for (const auto& [key, value] : values) {
        impl_->store(Command::Set, key, value, expire, noreply);
    }
}

std::optional<std::string> Client::get(std::string_view key) {
    std::string k(key);
    auto result = impl_->get_many({k});
    auto it = result.find(k);
    if (it == result.end()) {
        return std::nullopt;
    }
    return std::move(it->second);
}
FetchResult Client::get_many(const std::vector<std::string>& keys) {
    return impl_->get_many(keys);
}
std::optional<CasValue> Client::gets(std::string_view key) {
    std::string k(key);
    auto result = impl_->gets_many({k});
    auto it = result.find(k);
    if (it == result.end()) {
        return std::nullopt;
    }
    return std::move(it->second);
}
CasFetchResult Client::gets_many(const std::vector<std::string>& keys) {
    return impl_->gets_many(keys);
}

std::optional<Outcome> Client::remove(std::string_view key, bool noreply) {
    Request req;
    req.command = Command::Delete;
    req.key = std::string(key);
    req.noreply = noreply;
    return impl_->misc(req);
}
void Client::remove_many(const std::vector<std::string>& keys, bool noreply) {
    for (const auto& key : keys) {
        remove(key, noreply);
    }
}

std::optional<CounterValue> Client::incr(std::string_view key, uint64_t delta, bool noreply) {
    return impl_->counter(Command::Incr, key, delta, noreply);
}
std::optional<CounterValue> Client::decr(std::string_view key, uint64_t delta, bool noreply) {
    return impl_->counter(Command::Decr, key, delta, noreply);
}

std::optional<Outcome> Client::touch(std::string_view key, util::Seconds expire, bool noreply) {
    Request req;
    req.command = Command::Touch;
    req.key = std::string(key);
    req.expire = expire;
    req.noreply = noreply;
    return impl_->misc(req);
}
std::optional<Outcome> Client::flush_all(util::Seconds delay, bool noreply) {
    Request req;
    req.command = Command::FlushAll;
    req.expire = delay;
    req.noreply = noreply;
    return impl_->misc(req);
}

std::map<std::string, std::string> Client::stats(const std::vector<std::string>& args) {
    return impl_->stats(args);
}

void Client::quit() {
    impl_->quit();
}

}  // namespace memcache::net::client
