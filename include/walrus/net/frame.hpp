#ifndef WALRUS_NET_FRAME_HPP
#define WALRUS_NET_FRAME_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "walrus/core/data.hpp"

namespace walrus::net {

enum class FrameType : uint8_t {
    Simple,
    Error,
    Integer,
    Bulk,
    Null,
    Array,
};

/*
    one value of the wire protocol.

    note: a tagged struct rather than std::variant - Simple, Error and Bulk all carry a
    std::string, so a variant would need three wrapper types just to tell them apart.
    accessors for the wrong type throw std::logic_error (misuse is a programming error).
*/
class Frame {
   public:
    Frame() = default;  // Null

    // simple and error text is a single line: text containing CRLF throws std::logic_error
    static Frame simple(std::string text);
    static Frame error(std::string text);
    static Frame integer(uint64_t value);
    static Frame bulk(std::string bytes);
    static Frame null();
    static Frame array(std::vector<Frame> items);

    [[nodiscard]] FrameType type() const noexcept {
        return type_;
    }
    [[nodiscard]] bool is(FrameType type) const noexcept {
        return type_ == type;
    }

    // Simple, Error and Bulk payload
    [[nodiscard]] const std::string& text() const;
    [[nodiscard]] uint64_t integer_value() const;
    [[nodiscard]] const std::vector<Frame>& items() const;
    [[nodiscard]] std::vector<Frame>&& take_items();

    // human readable rendering, used by the CLI and in error messages
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Frame& other) const;
    bool operator!=(const Frame& other) const {
        return !(*this == other);
    }

   private:
    FrameType type_ = FrameType::Null;
    std::string text_;
    uint64_t integer_ = 0;
    std::vector<Frame> items_;
};

[[nodiscard]] std::string_view frame_type_name(FrameType type) noexcept;

/*
    builds an Array frame one element at a time. only arrays can be pushed into, so the
    "push into a non-array frame" mistake cannot be written.
*/
class FrameArrayBuilder {
   public:
    FrameArrayBuilder& push_string(std::string text);
    FrameArrayBuilder& push_bulk(std::string bytes);
    FrameArrayBuilder& push_int(uint64_t value);
    // stored values as frame elements; nested lists are rejected with std::logic_error
    FrameArrayBuilder& push_data(const std::vector<core::Data>& values);

    [[nodiscard]] std::size_t size() const noexcept {
        return items_.size();
    }

    [[nodiscard]] Frame build() &&;

   private:
    std::vector<Frame> items_;
};

}  // namespace walrus::net

#endif
