#ifndef MEMCACHE_NET_STREAM_HPP
#define MEMCACHE_NET_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "memcache/util/types.hpp"

namespace memcache::net {

// blocking byte stream the protocol runs over. errors are thrown as MemcacheError(Transport)
class IStream {
public:
    virtual ~IStream() = default;

    // read at most `length` bytes. returns 0 once the peer has closed
    [[nodiscard]] virtual std::size_t recv(char* buffer, std::size_t length) = 0;
    virtual void send_all(std::string_view data) = 0;
    virtual void close() noexcept = 0;
};

struct SocketOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 11211;
    util::Duration connect_timeout{0};  // 0: block until the OS gives up
    util::Duration timeout{0};          // per send/recv, 0: no timeout
    bool no_delay = false;
};

class SocketStream : public IStream {
public:
    // takes ownership of a connected socket
    explicit SocketStream(int fd) noexcept;
    ~SocketStream() override;

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    [[nodiscard]] std::size_t recv(char* buffer, std::size_t length) override;
    void send_all(std::string_view data) override;
    void close() noexcept override;

    [[nodiscard]] int fd() const noexcept {
        return fd_;
    }

private:
    int fd_ = -1;
};

// resolve, connect (bounded by connect_timeout), then apply timeout and TCP_NODELAY
std::unique_ptr<SocketStream> connect_tcp(const SocketOptions& options);

}  // namespace memcache::net

#endif
