#ifndef WALRUS_NET_CONNECTION_HPP
#define WALRUS_NET_CONNECTION_HPP

#include <cstddef>
#include <optional>
#include <string>

#include "walrus/net/frame.hpp"

namespace walrus::net {

/*
    sends and receives Frames over a connected socket.

    reads go through a growable buffer: bytes are pulled from the socket in batches until the
    buffer holds a complete frame, the frame is decoded and exactly its bytes are dropped from the
    front. anything left over belongs to the next frame.

    writes are encoded into a separate buffer and flushed once per write_frame(), so a reply
    never leaves the process half-written.

    the connection owns the fd and closes it on destruction. move-only.
*/
class Connection {
   public:
    static constexpr std::size_t kDefaultReadBufferCapacity = 16 * 1024;

    explicit Connection(int fd, std::size_t read_buffer_capacity = kDefaultReadBufferCapacity);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&& other) noexcept;
    Connection& operator=(Connection&& other) noexcept;

    /*
        returns the next frame, or nullopt when the peer closed cleanly between frames.
        throws:
            ConnectionReset    peer closed with part of a frame buffered
            ProtocolError      malformed bytes
            std::system_error  socket failure
    */
    [[nodiscard]] std::optional<Frame> read_frame();

    // throws std::system_error on socket failure, std::logic_error on nested arrays
    void write_frame(const Frame& frame);

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept {
        return fd_ >= 0;
    }
    [[nodiscard]] int fd() const noexcept {
        return fd_;
    }
    // bytes received but not yet returned as a frame
    [[nodiscard]] std::size_t buffered() const noexcept {
        return read_buffer_.size();
    }

   private:
    [[nodiscard]] std::optional<Frame> parse_frame();
    [[nodiscard]] std::size_t fill_buffer();
    void flush();

    int fd_ = -1;
    std::size_t read_capacity_;
    std::string read_buffer_;
    std::string write_buffer_;
};

}  // namespace walrus::net

#endif
