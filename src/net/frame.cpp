#include "walrus/net/frame.hpp"

#include <stdexcept>
#include <utility>

namespace walrus::net {

namespace {

// a line frame ends at the first CRLF, so text containing one could never be read back whole
void check_line(const std::string& text) {
    if (text.find("\r\n") != std::string::npos) {
        throw std::logic_error("simple and error frames cannot contain CRLF");
    }
}

}  // namespace

Frame Frame::simple(std::string text) {
    check_line(text);
    Frame frame;
    frame.type_ = FrameType::Simple;
    frame.text_ = std::move(text);
    return frame;
}

Frame Frame::error(std::string text) {
    check_line(text);
    Frame frame;
    frame.type_ = FrameType::Error;
    frame.text_ = std::move(text);
    return frame;
}

Frame Frame::integer(uint64_t value) {
    Frame frame;
    frame.type_ = FrameType::Integer;
    frame.integer_ = value;
    return frame;
}

Frame Frame::bulk(std::string bytes) {
    Frame frame;
    frame.type_ = FrameType::Bulk;
    frame.text_ = std::move(bytes);
    return frame;
}

Frame Frame::null() {
    return Frame();
}

Frame Frame::array(std::vector<Frame> items) {
    Frame frame;
    frame.type_ = FrameType::Array;
    frame.items_ = std::move(items);
    return frame;
}

const std::string& Frame::text() const {
    if (type_ != FrameType::Simple && type_ != FrameType::Error && type_ != FrameType::Bulk) {
        throw std::logic_error("frame has no text payload: " +
                               std::string(frame_type_name(type_)));
    }
    return text_;
}

uint64_t Frame::integer_value() const {
    if (type_ != FrameType::Integer) {
        throw std::logic_error("not an integer frame: " + std::string(frame_type_name(type_)));
    }
    return integer_;
}

const std::vector<Frame>& Frame::items() const {
    if (type_ != FrameType::Array) {
        throw std::logic_error("not an array frame: " + std::string(frame_type_name(type_)));
    }
    return items_;
}

std::vector<Frame>&& Frame::take_items() {
    if (type_ != FrameType::Array) {
        throw std::logic_error("not an array frame: " + std::string(frame_type_name(type_)));
    }
    return std::move(items_);
}

std::string Frame::to_string() const {
    switch (type_) {
        case FrameType::Simple:
        case FrameType::Bulk:
            return text_;
        case FrameType::Error:
            return "error: " + text_;
        case FrameType::Integer:
            return std::to_string(integer_);
        case FrameType::Null:
            return "(nil)";
        case FrameType::Array: {
            std::string out = "[";
            for (std::size_t i = 0; i < items_.size(); ++i) {
                if (i > 0) {
                    out += ' ';
                }
                out += items_[i].to_string();
            }
            out += ']';
            return out;
        }
    }
    return {};
}

bool Frame::operator==(const Frame& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case FrameType::Simple:
        case FrameType::Error:
        case FrameType::Bulk:
            return text_ == other.text_;
        case FrameType::Integer:
            return integer_ == other.integer_;
        case FrameType::Null:
            return true;
        case FrameType::Array:
            return items_ == other.items_;
    }
    return false;
}

std::string_view frame_type_name(FrameType type) noexcept {
    switch (type) {
        case FrameType::Simple:
            return "simple";
        case FrameType::Error:
            return "error";
        case FrameType::Integer:
            return "integer";
        case FrameType::Bulk:
            return "bulk";
        case FrameType::Null:
            return "null";
        case FrameType::Array:
            return "array";
    }
    return "unknown";
}

FrameArrayBuilder& FrameArrayBuilder::push_string(std::string text) {
    items_.push_back(Frame::simple(std::move(text)));
    return *this;
}

FrameArrayBuilder& FrameArrayBuilder::push_bulk(std::string bytes) {
    items_.push_back(Frame::bulk(std::move(bytes)));
    return *this;
}

FrameArrayBuilder& FrameArrayBuilder::push_int(uint64_t value) {
    items_.push_back(Frame::integer(value));
    return *this;
}

FrameArrayBuilder& FrameArrayBuilder::push_data(const std::vector<core::Data>& values) {
    for (const auto& value : values) {
        switch (value.kind()) {
            case core::DataKind::Bytes:
                push_bulk(value.as_bytes().str());
                break;
            case core::DataKind::String:
                push_string(value.as_string());
                break;
            case core::DataKind::Integer:
                push_int(value.as_integer());
                break;
            case core::DataKind::List:
                throw std::logic_error("nested lists cannot be encoded as frame elements");
        }
    }
    return *this;
}

Frame FrameArrayBuilder::build() && {
    return Frame::array(std::move(items_));
}

}  // namespace walrus::net
