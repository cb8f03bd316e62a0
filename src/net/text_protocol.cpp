#include "memcache/net/text_protocol.hpp"

#include <algorithm>
#include <charconv>
#include <limits>

#include "memcache/net/errors.hpp"

namespace memcache::net {

namespace {

bool starts_with(std::string_view line, std::string_view prefix) {
    return line.substr(0, prefix.size()) == prefix;
}

// text after the first space, or the whole line when there is none
std::string error_detail(std::string_view line) {
    size_t space = line.find(' ');
    if (space == std::string_view::npos) {
        return std::string(line);
    }
    return std::string(line.substr(space + 1));
}

std::vector<std::string_view> split(std::string_view line) {
    std::vector<std::string_view> tokens;
    size_t pos = 0;
    while (pos < line.size()) {
        size_t space = line.find(' ', pos);
        if (space == std::string_view::npos) {
            space = line.size();
        }
        if (space > pos) {
            tokens.push_back(line.substr(pos, space - pos));
        }
        pos = space + 1;
    }
    return tokens;
}

std::optional<uint64_t> parse_u64(std::string_view s) {
    if (s.empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || end != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

[[noreturn]] void unknown_response(std::string_view line) {
    throw MemcacheError(ErrorKind::UnknownResponse, TextProtocol::excerpt(line));
}

void check_key(const std::string& key) {
    for (size_t i = 0; i < key.size(); ++i) {
        if (static_cast<unsigned char>(key[i]) > 0x7F) {
            throw MemcacheError(ErrorKind::ClientError,
                                "key contains a non-ASCII byte at offset " + std::to_string(i));
        }
    }
}

void append_noreply(std::string& line, bool noreply) {
    if (noreply) {
        line += " noreply";
    }
}

}  // namespace

std::string TextProtocol::encode_request(const Request& req) {
    std::string line(command_to_string(req.command));

    switch (req.command) {
        case Command::Set:
        case Command::Add:
        case Command::Replace:
        case Command::Append:
        case Command::Prepend:
        case Command::Cas:
            check_key(req.key);
            // <bytes> is the payload's byte count; the payload itself is never inspected
            line += " " + req.key + " " + std::to_string(req.flags) + " " +
                    std::to_string(util::to_wire_seconds(req.expire)) + " " +
                    std::to_string(req.data.size());
            if (req.command == Command::Cas) {
                if (!req.cas) {
                    throw MemcacheError(ErrorKind::ClientError, "cas requires a cas token");
                }
                line += " " + std::to_string(*req.cas);
            }
            append_noreply(line, req.noreply);
            line += "\r\n";
            line += req.data;
            break;

        case Command::Get:
        case Command::Gets:
            if (req.keys.empty()) {
                throw MemcacheError(ErrorKind::ClientError,
                                    std::string(command_to_string(req.command)) +
                                        " requires at least one key");
            }
            for (const auto& key : req.keys) {
                check_key(key);
                line += " " + key;
            }
            break;

        case Command::Delete:
            check_key(req.key);
            line += " " + req.key;
            append_noreply(line, req.noreply);
            break;

        case Command::Incr:
        case Command::Decr:
            check_key(req.key);
            line += " " + req.key + " " + std::to_string(req.delta);
            append_noreply(line, req.noreply);
            break;

        case Command::Touch:
            check_key(req.key);
            line += " " + req.key + " " + std::to_string(util::to_wire_seconds(req.expire));
            append_noreply(line, req.noreply);
            break;

        case Command::FlushAll:
            line += " " + std::to_string(util::to_wire_seconds(req.expire));
            append_noreply(line, req.noreply);
            break;

        case Command::Stats:
            for (const auto& arg : req.keys) {
                line += " " + arg;
            }
            break;

        case Command::Quit:
            break;

        case Command::Unknown:
            throw MemcacheError(ErrorKind::ClientError, "cannot encode an unknown command");
    }

    line += "\r\n";
    return line;
}

void TextProtocol::check_error(std::string_view line, Command cmd) {
    if (starts_with(line, "ERROR")) {
        throw MemcacheError(ErrorKind::UnknownCommand,
                            "server did not recognize " + std::string(command_to_string(cmd)));
    }
    if (starts_with(line, "CLIENT_ERROR")) {
        throw MemcacheError(ErrorKind::ClientError, error_detail(line));
    }
    if (starts_with(line, "SERVER_ERROR")) {
        throw MemcacheError(ErrorKind::ServerError, error_detail(line));
    }
}

Outcome TextProtocol::decode_outcome(std::string_view line, Command cmd) {
    check_error(line, cmd);

    auto outcome = parse_outcome(line);
    const auto& valid = valid_outcomes(cmd);
    if (!outcome || std::find(valid.begin(), valid.end(), *outcome) == valid.end()) {
        unknown_response(line);
    }
    return *outcome;
}

CounterValue TextProtocol::decode_counter(std::string_view line, Command cmd) {
    check_error(line, cmd);

    if (line == "NOT_FOUND") {
        return Outcome::NotFound;
    }

    // older servers pad decremented values with trailing spaces
    std::string_view digits = line;
    while (!digits.empty() && digits.back() == ' ') {
        digits.remove_suffix(1);
    }

    auto value = parse_u64(digits);
    if (!value) {
        unknown_response(line);
    }
    return *value;
}

std::optional<ValueHeader> TextProtocol::decode_value_header(std::string_view line, Command cmd) {
    check_error(line, cmd);

    if (line == "END") {
        return std::nullopt;
    }

    auto tokens = split(line);
    size_t expected = cmd == Command::Gets ? 5 : 4;
    if (tokens.size() != expected || tokens[0] != "VALUE") {
        unknown_response(line);
    }

    auto flags = parse_u64(tokens[2]);
    auto size = parse_u64(tokens[3]);
    if (!flags || *flags > std::numeric_limits<uint16_t>::max() || !size ||
        *size > std::numeric_limits<std::size_t>::max() - 2) {
        unknown_response(line);
    }

    ValueHeader header;
    header.key = std::string(tokens[1]);
    header.flags = static_cast<uint16_t>(*flags);
    header.size = static_cast<std::size_t>(*size);

    if (cmd == Command::Gets) {
        auto cas = parse_u64(tokens[4]);
        if (!cas) {
            unknown_response(line);
        }
        header.cas = *cas;
    }
    return header;
}

std::optional<std::pair<std::string, std::string>> TextProtocol::decode_stat(
    std::string_view line) {
    check_error(line, Command::Stats);

    if (line == "END") {
        return std::nullopt;
    }
    if (!starts_with(line, "STAT ")) {
        unknown_response(line);
    }

    // values may contain spaces ("STAT version 1.6.21 (Ubuntu)")
    std::string_view rest = line.substr(5);
    size_t space = rest.find(' ');
    if (space == 0 || rest.empty()) {
        unknown_response(line);
    }
    if (space == std::string_view::npos) {
        return std::make_pair(std::string(rest), std::string());
    }
    return std::make_pair(std::string(rest.substr(0, space)), std::string(rest.substr(space + 1)));
}

const std::vector<Outcome>& TextProtocol::valid_outcomes(Command cmd) {
    static const std::vector<Outcome> kStoredOnly{Outcome::Stored};
    static const std::vector<Outcome> kConditionalStore{Outcome::Stored, Outcome::NotStored};
    static const std::vector<Outcome> kCas{Outcome::Stored, Outcome::Exists, Outcome::NotFound};
    static const std::vector<Outcome> kDelete{Outcome::Deleted, Outcome::NotFound};
    // TOUCHED from memcached >= 1.4.8, OK from servers that predate it
    static const std::vector<Outcome> kTouch{Outcome::Touched, Outcome::Ok, Outcome::NotFound};
    static const std::vector<Outcome> kOk{Outcome::Ok};
    static const std::vector<Outcome> kCounter{Outcome::NotFound};
    static const std::vector<Outcome> kNone{};

    switch (cmd) {
        case Command::Set:
            return kStoredOnly;
        case Command::Add:
        case Command::Replace:
        case Command::Append:
        case Command::Prepend:
            return kConditionalStore;
        case Command::Cas:
            return kCas;
        case Command::Delete:
            return kDelete;
        case Command::Touch:
            return kTouch;
        case Command::FlushAll:
            return kOk;
        case Command::Incr:
        case Command::Decr:
            return kCounter;
        default:
            return kNone;
    }
}

std::string_view TextProtocol::command_to_string(Command cmd) {
    switch (cmd) {
        case Command::Set:
            return "set";
        case Command::Add:
            return "add";
        case Command::Replace:
            return "replace";
        case Command::Append:
            return "append";
        case Command::Prepend:
            return "prepend";
        case Command::Cas:
            return "cas";
        case Command::Get:
            return "get";
        case Command::Gets:
            return "gets";
        case Command::Delete:
            return "delete";
        case Command::Incr:
            return "incr";
        case Command::Decr:
            return "decr";
        case Command::Touch:
            return "touch";
        case Command::FlushAll:
            return "flush_all";
        case Command::Stats:
            return "stats";
        case Command::Quit:
            return "quit";
        case Command::Unknown:
            return "unknown";
    }
    return "unknown";
}

Command TextProtocol::parse_command(std::string_view str) {
    if (str == "set") return Command::Set;
    if (str == "add") return Command::Add;
    if (str == "replace") return Command::Replace;
    if (str == "append") return Command::Append;
    if (str == "prepend") return Command::Prepend;
    if (str == "cas") return Command::Cas;
    if (str == "get") return Command::Get;
    if (str == "gets") return Command::Gets;
    if (str == "delete") return Command::Delete;
    if (str == "incr") return Command::Incr;
    if (str == "decr") return Command::Decr;
    if (str == "touch") return Command::Touch;
    if (str == "flush_all") return Command::FlushAll;
    if (str == "stats") return Command::Stats;
    if (str == "quit") return Command::Quit;
    return Command::Unknown;
}

std::string_view TextProtocol::outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::Stored:
            return "STORED";
        case Outcome::NotStored:
            return "NOT_STORED";
        case Outcome::Exists:
            return "EXISTS";
        case Outcome::NotFound:
            return "NOT_FOUND";
        case Outcome::Deleted:
            return "DELETED";
        case Outcome::Touched:
            return "TOUCHED";
        case Outcome::Ok:
            return "OK";
    }
    return "UNKNOWN";
}

std::optional<Outcome> TextProtocol::parse_outcome(std::string_view str) {
    if (str == "STORED") return Outcome::Stored;
    if (str == "NOT_STORED") return Outcome::NotStored;
    if (str == "EXISTS") return Outcome::Exists;
    if (str == "NOT_FOUND") return Outcome::NotFound;
    if (str == "DELETED") return Outcome::Deleted;
    if (str == "TOUCHED") return Outcome::Touched;
    if (str == "OK") return Outcome::Ok;
    return std::nullopt;
}

bool TextProtocol::is_store(Command cmd) {
    switch (cmd) {
        case Command::Set:
        case Command::Add:
        case Command::Replace:
        case Command::Append:
        case Command::Prepend:
        case Command::Cas:
            return true;
        default:
            return false;
    }
}

bool TextProtocol::is_fetch(Command cmd) {
    return cmd == Command::Get || cmd == Command::Gets;
}

std::string TextProtocol::excerpt(std::string_view line) {
    return std::string(line.substr(0, kMaxExcerpt));
}

}  // namespace memcache::net
