#ifndef WALRUS_NET_FRAME_CODEC_HPP
#define WALRUS_NET_FRAME_CODEC_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "walrus/net/frame.hpp"

/*
    wire format (RESP2 subset), every line terminated by CRLF:
        +<text>             Simple
        -<text>             Error
        :<u64>              Integer
        $<len> <bytes>      Bulk ($-1 is Null)
        *<count> <items>    Array (*-1 is Null)
*/

namespace walrus::net {

class FrameCodec {
   public:
    // nesting limit for decoded arrays, guards the recursive decoder's stack
    static constexpr std::size_t kMaxDepth = 32;

    /*
        check whether a complete frame starts at the front of `window` without building it.
        returns the number of bytes the frame occupies, or nullopt if more bytes are needed
        (the caller reads more and retries from the start of the window).
        throws ProtocolError if the bytes can never become a valid frame.
    */
    [[nodiscard]] static std::optional<std::size_t> check(std::string_view window);

    /*
        decode the frame at the front of `window`. sets `consumed` to exactly the byte count
        check() reports. returns nullopt if the window is incomplete, throws ProtocolError on
        malformed input.
    */
    [[nodiscard]] static std::optional<Frame> parse(std::string_view window, std::size_t& consumed);

    /*
        append the wire form of `frame` to `out`. an array nested inside an array is a
        programming error and throws std::logic_error.
    */
    static void encode(const Frame& frame, std::string& out);
    [[nodiscard]] static std::string encode(const Frame& frame);

    // single element (no arrays). used by Connection to stream array elements
    static void encode_value(const Frame& frame, std::string& out);
    static void encode_array_header(std::size_t count, std::string& out);
};

}  // namespace walrus::net

#endif
