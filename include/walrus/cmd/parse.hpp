#ifndef WALRUS_CMD_PARSE_HPP
#define WALRUS_CMD_PARSE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "walrus/core/data.hpp"
#include "walrus/net/frame.hpp"

namespace walrus::cmd {

/*
    forward-only cursor over the elements of a command frame.

    every next_* consumes one element (next_array consumes the rest). running past the last
    element throws EndOfStream, which commands catch to treat a trailing argument as absent.
    an element of the wrong type throws a plain ParseError.
*/
class Parse {
   public:
    // throws ParseError if `frame` is not an array
    explicit Parse(net::Frame frame);

    [[nodiscard]] std::string next_bytes();
    [[nodiscard]] std::string next_string();
    [[nodiscard]] uint64_t next_int();
    [[nodiscard]] std::vector<core::Data> next_array();

    // throws ParseError if elements remain
    void finish();

    [[nodiscard]] std::size_t remaining() const noexcept {
        return items_.size() - pos_;
    }

   private:
    net::Frame next();

    std::vector<net::Frame> items_;
    std::size_t pos_ = 0;
};

}  // namespace walrus::cmd

#endif
