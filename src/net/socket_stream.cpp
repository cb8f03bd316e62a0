#include "memcache/net/stream.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <memory>
#include <string>

#include "memcache/net/errors.hpp"

namespace memcache::net {

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* ai) const noexcept {
        freeaddrinfo(ai);
    }
};

int poll_timeout_ms(util::Duration timeout) {
    return timeout.count() > INT_MAX ? INT_MAX : static_cast<int>(timeout.count());
}

// returns 0 once connected, otherwise the errno describing the failure
int connect_with_timeout(int fd, const sockaddr* addr, socklen_t len, util::Duration timeout) {
    if (timeout.count() <= 0) {
        return ::connect(fd, addr, len) < 0 ? errno : 0;
    }

    // non-blocking connect + poll bounds the handshake, then the socket goes back to blocking
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return errno;
    }

    if (::connect(fd, addr, len) < 0) {
        if (errno != EINPROGRESS) {
            return errno;
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int ready;
        do {
            ready = poll(&pfd, 1, poll_timeout_ms(timeout));
        } while (ready < 0 && errno == EINTR);

        if (ready < 0) {
            return errno;
        }
        if (ready == 0) {
            return ETIMEDOUT;
        }

        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) {
            return errno;
        }
        if (so_error != 0) {
            return so_error;
        }
    }

    if (fcntl(fd, F_SETFL, flags) < 0) {
        return errno;
    }
    return 0;
}

void apply_io_options(int fd, const SocketOptions& options) {
    if (options.timeout.count() > 0) {
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(options.timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((options.timeout.count() % 1000) * 1000);
        if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
            setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
            throw MemcacheError::transport("failed to set socket timeout", errno);
        }
    }

    if (options.no_delay) {
        int flag = 1;
        if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) < 0) {
            throw MemcacheError::transport("failed to set TCP_NODELAY", errno);
        }
    }
}

}  // namespace

SocketStream::SocketStream(int fd) noexcept : fd_(fd) {}

SocketStream::~SocketStream() {
    close();
}

std::size_t SocketStream::recv(char* buffer, std::size_t length) {
    if (fd_ < 0) {
        throw MemcacheError(ErrorKind::Transport, "recv on a closed socket", EBADF);
    }
    while (true) {
        ssize_t n = ::recv(fd_, buffer, length, 0);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno != EINTR) {
            throw MemcacheError::transport("recv failed", errno);
        }
    }
}

void SocketStream::send_all(std::string_view data) {
    if (fd_ < 0) {
        throw MemcacheError(ErrorKind::Transport, "send on a closed socket", EBADF);
    }
    size_t total_sent = 0;
    while (total_sent < data.size()) {
        // MSG_NOSIGNAL: a peer that already closed gives EPIPE instead of killing us with SIGPIPE
        ssize_t sent =
            ::send(fd_, data.data() + total_sent, data.size() - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw MemcacheError::transport("send failed", errno);
        }
        total_sent += static_cast<size_t>(sent);
    }
}

void SocketStream::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::unique_ptr<SocketStream> connect_tcp(const SocketOptions& options) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    std::string target = options.host + ":" + std::to_string(options.port);

    addrinfo* raw = nullptr;
    int rc = getaddrinfo(options.host.c_str(), std::to_string(options.port).c_str(), &hints, &raw);
    if (rc != 0) {
        int err = rc == EAI_SYSTEM ? errno : 0;
        throw MemcacheError(ErrorKind::Transport,
                            "failed to resolve " + target + ": " + gai_strerror(rc), err);
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> addresses(raw);

    // localhost may resolve to both ::1 and 127.0.0.1; the first address that accepts wins
    int last_error = ECONNREFUSED;
    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno;
            continue;
        }

        int err = connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, options.connect_timeout);
        if (err != 0) {
            ::close(fd);
            last_error = err;
            continue;
        }

        auto stream = std::make_unique<SocketStream>(fd);
        apply_io_options(stream->fd(), options);
        return stream;
    }

    throw MemcacheError::transport("failed to connect to " + target, last_error);
}

}  // namespace memcache::net
