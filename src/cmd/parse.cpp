#include "walrus/cmd/parse.hpp"

#include <charconv>
#include <utility>

#include "walrus/error.hpp"

namespace walrus::cmd {

namespace {

// strict UTF-8: no overlongs, no surrogates, nothing above U+10FFFF
bool is_valid_utf8(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        std::size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= s.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000) || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

uint64_t parse_number(const std::string& text) {
    uint64_t value = 0;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        throw ParseError("protocol error; invalid number");
    }
    return value;
}

[[noreturn]] void unexpected(std::string_view expected, const net::Frame& frame) {
    throw ParseError("protocol error; expected " + std::string(expected) + " frame, got " +
                     std::string(net::frame_type_name(frame.type())) + " " + frame.to_string());
}

}  // namespace

Parse::Parse(net::Frame frame) {
    if (!frame.is(net::FrameType::Array)) {
        throw ParseError("protocol error; expected array, got " +
                         std::string(net::frame_type_name(frame.type())) + " " +
                         frame.to_string());
    }
    items_ = std::move(frame.take_items());
}

net::Frame Parse::next() {
    if (pos_ >= items_.size()) {
        throw EndOfStream();
    }
    return std::move(items_[pos_++]);
}

std::string Parse::next_bytes() {
    auto frame = next();
    // errors are strings on the wire too, but they are never valid arguments
    if (frame.is(net::FrameType::Simple) || frame.is(net::FrameType::Bulk)) {
        return frame.text();
    }
    unexpected("simple or bulk string", frame);
}

std::string Parse::next_string() {
    auto frame = next();
    if (frame.is(net::FrameType::Simple)) {
        return frame.text();
    }
    if (frame.is(net::FrameType::Bulk)) {
        if (!is_valid_utf8(frame.text())) {
            throw ParseError("protocol error; invalid string");
        }
        return frame.text();
    }
    unexpected("simple or bulk string", frame);
}

uint64_t Parse::next_int() {
    auto frame = next();
    if (frame.is(net::FrameType::Integer)) {
        return frame.integer_value();
    }
    if (frame.is(net::FrameType::Simple) || frame.is(net::FrameType::Bulk)) {
        return parse_number(frame.text());
    }
    unexpected("integer", frame);
}

std::vector<core::Data> Parse::next_array() {
    std::vector<core::Data> values;
    values.reserve(remaining());
    while (pos_ < items_.size()) {
        auto frame = next();
        switch (frame.type()) {
            case net::FrameType::Bulk:
                values.push_back(core::Data::bytes(frame.text()));
                break;
            case net::FrameType::Simple:
                values.push_back(core::Data::string(frame.text()));
                break;
            case net::FrameType::Integer:
                values.push_back(core::Data::integer(frame.integer_value()));
                break;
            default:
                unexpected("simple, bulk or integer", frame);
        }
    }
    return values;
}

void Parse::finish() {
    if (pos_ < items_.size()) {
        throw ParseError("protocol error; expected end of frame, but there was more");
    }
}

}  // namespace walrus::cmd
