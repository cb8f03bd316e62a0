#ifndef MEMCACHE_NET_ERRORS_HPP
#define MEMCACHE_NET_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace memcache::net {

enum class ErrorKind : uint8_t {
    UnknownCommand = 0,   // server answered ERROR
    ClientError = 1,      // CLIENT_ERROR, or a request we refused to encode
    ServerError = 2,      // SERVER_ERROR
    UnknownResponse = 3,  // reply matches no grammar for the command sent
    UnexpectedClose = 4,  // EOF before a full line or value
    Transport = 5,        // resolve/connect/send/recv failures, timeouts included
};

class MemcacheError : public std::runtime_error {
public:
    MemcacheError(ErrorKind kind, const std::string& message, int sys_errno = 0);

    [[nodiscard]] ErrorKind kind() const noexcept {
        return kind_;
    }

    // errno captured for Transport errors, 0 otherwise
    [[nodiscard]] int sys_errno() const noexcept {
        return sys_errno_;
    }

    [[nodiscard]] bool timed_out() const noexcept;

    // Transport error for a failed syscall: "<what>: <strerror(err)>"
    static MemcacheError transport(const std::string& what, int err);

private:
    ErrorKind kind_;
    int sys_errno_;
};

std::string_view to_string(ErrorKind kind);

}  // namespace memcache::net

#endif
