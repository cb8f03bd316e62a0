#include "memcache/net/errors.hpp"

#include <cerrno>
#include <cstring>

namespace memcache::net {

MemcacheError::MemcacheError(ErrorKind kind, const std::string& message, int sys_errno)
    : std::runtime_error(message), kind_(kind), sys_errno_(sys_errno) {}

bool MemcacheError::timed_out() const noexcept {
    return kind_ == ErrorKind::Transport &&
           (sys_errno_ == EAGAIN || sys_errno_ == EWOULDBLOCK || sys_errno_ == ETIMEDOUT);
}

MemcacheError MemcacheError::transport(const std::string& what, int err) {
    if (err == EAGAIN || err == EWOULDBLOCK) {
        // SO_RCVTIMEO/SO_SNDTIMEO expiry shows up as EAGAIN
        return MemcacheError(ErrorKind::Transport, what + ": timed out", err);
    }
    return MemcacheError(ErrorKind::Transport, what + ": " + std::strerror(err), err);
}

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownCommand:
            return "unknown command";
        case ErrorKind::ClientError:
            return "client error";
        case ErrorKind::ServerError:
            return "server error";
        case ErrorKind::UnknownResponse:
            return "unknown response";
        case ErrorKind::UnexpectedClose:
            return "unexpected close";
        case ErrorKind::Transport:
            return "transport error";
    }
    return "unknown";
}

}  // namespace memcache::net
