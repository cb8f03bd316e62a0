#ifndef MEMCACHE_NET_FRAME_READER_HPP
#define MEMCACHE_NET_FRAME_READER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "memcache/net/stream.hpp"

namespace memcache::net {

/*
    Incremental reader for CRLF-framed lines and length-prefixed values.

    Bytes arrive in arbitrary chunks (feed, or recv inside read_line/read_value). The reader keeps
    whatever follows the last line/value it handed out and starts the next read from there, so a
    "\r\n" split across two chunks, or a value whose terminator arrives separately, frames the
    same as if everything had arrived at once.

    The pending buffer belongs to exactly one connection: clear it (or drop the reader) whenever
    that connection goes away.
*/
class FrameReader {
public:
    static constexpr std::size_t kRecvSize = 4096;

    void feed(std::string_view chunk);

    // next complete line without its "\r\n", or nullopt if none is buffered yet
    [[nodiscard]] std::optional<std::string> consume_line();

    // `size` payload bytes once size + 2 are buffered. throws UnknownResponse when the two
    // bytes after the payload are not "\r\n"
    [[nodiscard]] std::optional<std::string> consume_value(std::size_t size);

    // blocking forms: recv from `stream` until the frame is complete. EOF throws UnexpectedClose
    [[nodiscard]] std::string read_line(IStream& stream);
    [[nodiscard]] std::string read_value(IStream& stream, std::size_t size);

    [[nodiscard]] std::size_t pending() const noexcept {
        return buffer_.size();
    }

    void clear() noexcept;

private:
    void fill(IStream& stream);

    std::string buffer_;
    // bytes of buffer_ already searched for "\r\n" without a match
    std::size_t scanned_ = 0;
};

}  // namespace memcache::net

#endif
