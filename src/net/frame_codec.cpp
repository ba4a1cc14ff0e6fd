#include "walrus/net/frame_codec.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

#include "walrus/error.hpp"

namespace walrus::net {

namespace {

constexpr std::string_view kCrlf = "\r\n";

/*
    forward-only read position over the byte window.
    every getter returns false when the window ends too early ("incomplete") and leaves the
    caller to bail out; malformed input is thrown as ProtocolError by the helpers below.
*/
class Cursor {
   public:
    explicit Cursor(std::string_view buf) : buf_(buf) {}

    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    [[nodiscard]] std::size_t remaining() const noexcept {
        return buf_.size() - pos_;
    }

    bool get_u8(char& out) {
        if (remaining() < 1) {
            return false;
        }
        out = buf_[pos_++];
        return true;
    }

    bool peek_u8(char& out) const {
        if (remaining() < 1) {
            return false;
        }
        out = buf_[pos_];
        return true;
    }

    // bytes up to the next CRLF; the cursor moves past the CRLF
    bool get_line(std::string_view& out) {
        std::size_t end = buf_.find(kCrlf, pos_);
        if (end == std::string_view::npos) {
            return false;
        }
        out = buf_.substr(pos_, end - pos_);
        pos_ = end + kCrlf.size();
        return true;
    }

    bool take(std::size_t n, std::string_view& out) {
        if (remaining() < n) {
            return false;
        }
        out = buf_.substr(pos_, n);
        pos_ += n;
        return true;
    }

   private:
    std::string_view buf_;
    std::size_t pos_ = 0;
};

[[noreturn]] void invalid_format() {
    throw ProtocolError("protocol error; invalid frame format");
}

uint64_t parse_decimal(std::string_view line) {
    if (line.empty()) {
        invalid_format();
    }
    uint64_t value = 0;
    const char* first = line.data();
    const char* last = line.data() + line.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    // rejects signs, trailing garbage and values that overflow u64
    if (ec != std::errc() || ptr != last) {
        invalid_format();
    }
    return value;
}

bool get_decimal(Cursor& cur, uint64_t& out) {
    std::string_view line;
    if (!cur.get_line(line)) {
        return false;
    }
    out = parse_decimal(line);
    return true;
}

/*
    length field of a bulk string or array.
    `len` is left empty for the "-1" null marker; any other negative-looking length is an error.
*/
bool get_length(Cursor& cur, std::optional<std::size_t>& len) {
    char next = 0;
    if (!cur.peek_u8(next)) {
        return false;
    }
    std::string_view line;
    if (!cur.get_line(line)) {
        return false;
    }
    if (next == '-') {
        if (line != "-1") {
            invalid_format();
        }
        len.reset();
        return true;
    }
    uint64_t value = parse_decimal(line);
    // payload length plus its CRLF must still be addressable
    if (value > static_cast<uint64_t>(std::numeric_limits<std::size_t>::max() - kCrlf.size())) {
        invalid_format();
    }
    len = static_cast<std::size_t>(value);
    return true;
}

bool get_bulk_payload(Cursor& cur, std::size_t len, std::string_view& payload) {
    std::string_view data;
    if (!cur.take(len + kCrlf.size(), data)) {
        return false;
    }
    if (data.substr(len) != kCrlf) {
        invalid_format();
    }
    payload = data.substr(0, len);
    return true;
}

[[noreturn]] void invalid_type_byte(char type) {
    throw ProtocolError("protocol error; invalid frame type byte `" +
                        std::to_string(static_cast<unsigned char>(type)) + "`");
}

void check_depth(std::size_t depth) {
    if (depth > FrameCodec::kMaxDepth) {
        throw ProtocolError("protocol error; arrays nested too deeply");
    }
}

bool check_frame(Cursor& cur, std::size_t depth) {
    char type = 0;
    if (!cur.get_u8(type)) {
        return false;
    }

    switch (type) {
        case '+':
        case '-': {
            std::string_view line;
            return cur.get_line(line);
        }
        case ':': {
            uint64_t ignored = 0;
            return get_decimal(cur, ignored);
        }
        case '$': {
            std::optional<std::size_t> len;
            if (!get_length(cur, len)) {
                return false;
            }
            if (!len) {
                return true;
            }
            std::string_view payload;
            return get_bulk_payload(cur, *len, payload);
        }
        case '*': {
            std::optional<std::size_t> len;
            if (!get_length(cur, len)) {
                return false;
            }
            if (!len) {
                return true;
            }
            check_depth(depth + 1);
            // every element takes at least 3 bytes, so a huge count runs out of window quickly
            for (std::size_t i = 0; i < *len; ++i) {
                if (!check_frame(cur, depth + 1)) {
                    return false;
                }
            }
            return true;
        }
        default:
            invalid_type_byte(type);
    }
}

std::optional<Frame> parse_frame(Cursor& cur, std::size_t depth) {
    char type = 0;
    if (!cur.get_u8(type)) {
        return std::nullopt;
    }

    switch (type) {
        case '+':
        case '-': {
            std::string_view line;
            if (!cur.get_line(line)) {
                return std::nullopt;
            }
            return type == '+' ? Frame::simple(std::string(line)) : Frame::error(std::string(line));
        }
        case ':': {
            uint64_t value = 0;
            if (!get_decimal(cur, value)) {
                return std::nullopt;
            }
            return Frame::integer(value);
        }
        case '$': {
            std::optional<std::size_t> len;
            if (!get_length(cur, len)) {
                return std::nullopt;
            }
            if (!len) {
                return Frame::null();
            }
            std::string_view payload;
            if (!get_bulk_payload(cur, *len, payload)) {
                return std::nullopt;
            }
            return Frame::bulk(std::string(payload));
        }
        case '*': {
            std::optional<std::size_t> len;
            if (!get_length(cur, len)) {
                return std::nullopt;
            }
            if (!len) {
                return Frame::null();
            }
            check_depth(depth + 1);
            std::vector<Frame> items;
            // don't trust the declared count for the reservation; a short window can still lie
            items.reserve(std::min(*len, cur.remaining() / 3));
            for (std::size_t i = 0; i < *len; ++i) {
                auto item = parse_frame(cur, depth + 1);
                if (!item) {
                    return std::nullopt;
                }
                items.push_back(std::move(*item));
            }
            return Frame::array(std::move(items));
        }
        default:
            invalid_type_byte(type);
    }
}

void append_decimal(uint64_t value, std::string& out) {
    char buf[24];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    (void)ec;  // 24 bytes always fit a u64
    out.append(buf, static_cast<std::size_t>(end - buf));
    out.append(kCrlf);
}

}  // namespace

std::optional<std::size_t> FrameCodec::check(std::string_view window) {
    Cursor cur(window);
    if (!check_frame(cur, 0)) {
        return std::nullopt;
    }
    return cur.position();
}

std::optional<Frame> FrameCodec::parse(std::string_view window, std::size_t& consumed) {
    Cursor cur(window);
    auto frame = parse_frame(cur, 0);
    if (frame) {
        consumed = cur.position();
    }
    return frame;
}

void FrameCodec::encode_value(const Frame& frame, std::string& out) {
    switch (frame.type()) {
        case FrameType::Simple:
            out += '+';
            out += frame.text();
            out.append(kCrlf);
            break;
        case FrameType::Error:
            out += '-';
            out += frame.text();
            out.append(kCrlf);
            break;
        case FrameType::Integer:
            out += ':';
            append_decimal(frame.integer_value(), out);
            break;
        case FrameType::Null:
            out.append("$-1\r\n");
            break;
        case FrameType::Bulk:
            out += '$';
            append_decimal(frame.text().size(), out);
            out += frame.text();
            out.append(kCrlf);
            break;
        case FrameType::Array:
            throw std::logic_error("nested array frames cannot be encoded");
    }
}

void FrameCodec::encode_array_header(std::size_t count, std::string& out) {
    out += '*';
    append_decimal(count, out);
}

void FrameCodec::encode(const Frame& frame, std::string& out) {
    if (frame.is(FrameType::Array)) {
        encode_array_header(frame.items().size(), out);
        for (const auto& item : frame.items()) {
            encode_value(item, out);
        }
        return;
    }
    encode_value(frame, out);
}

std::string FrameCodec::encode(const Frame& frame) {
    std::string out;
    encode(frame, out);
    return out;
}

}  // namespace walrus::net
