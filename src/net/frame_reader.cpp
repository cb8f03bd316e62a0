#include "memcache/net/frame_reader.hpp"

#include "memcache/net/errors.hpp"

namespace memcache::net {

namespace {
constexpr std::string_view kTerminator = "\r\n";
}  // namespace

void FrameReader::feed(std::string_view chunk) {
    buffer_.append(chunk.data(), chunk.size());
}

std::optional<std::string> FrameReader::consume_line() {
    // step back one byte: the '\r' may have been the last byte of the previous chunk
    std::size_t from = scanned_ > 0 ? scanned_ - 1 : 0;
    std::size_t pos = buffer_.find(kTerminator, from);
    if (pos == std::string::npos) {
        scanned_ = buffer_.size();
        return std::nullopt;
    }

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + kTerminator.size());
    scanned_ = 0;
    return line;
}

std::optional<std::string> FrameReader::consume_value(std::size_t size) {
    if (buffer_.size() < size + kTerminator.size()) {
        return std::nullopt;
    }

    if (buffer_.compare(size, kTerminator.size(), kTerminator) != 0) {
        throw MemcacheError(ErrorKind::UnknownResponse,
                            "value of " + std::to_string(size) + " bytes not followed by CRLF");
    }

    std::string value = buffer_.substr(0, size);
    buffer_.erase(0, size + kTerminator.size());
    scanned_ = 0;
    return value;
}

std::string FrameReader::read_line(IStream& stream) {
    while (true) {
        if (auto line = consume_line()) {
            return std::move(*line);
        }
        fill(stream);
    }
}

std::string FrameReader::read_value(IStream& stream, std::size_t size) {
    while (true) {
        if (auto value = consume_value(size)) {
            return std::move(*value);
        }
        fill(stream);
    }
}

void FrameReader::clear() noexcept {
    buffer_.clear();
    scanned_ = 0;
}

void FrameReader::fill(IStream& stream) {
    char chunk[kRecvSize];
    std::size_t n = stream.recv(chunk, sizeof(chunk));
    if (n == 0) {
        throw MemcacheError(ErrorKind::UnexpectedClose, "connection closed by server");
    }
    buffer_.append(chunk, n);
}

}  // namespace memcache::net
