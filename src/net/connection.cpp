#include "walrus/net/connection.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

#include "walrus/error.hpp"
#include "walrus/net/frame_codec.hpp"

namespace walrus::net {

Connection::Connection(int fd, std::size_t read_buffer_capacity)
    : fd_(fd), read_capacity_(read_buffer_capacity > 0 ? read_buffer_capacity : 1) {
    read_buffer_.reserve(read_capacity_);
}

Connection::~Connection() {
    close();
}

Connection::Connection(Connection&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      read_capacity_(other.read_capacity_),
      read_buffer_(std::move(other.read_buffer_)),
      write_buffer_(std::move(other.write_buffer_)) {}

Connection& Connection::operator=(Connection&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        read_capacity_ = other.read_capacity_;
        read_buffer_ = std::move(other.read_buffer_);
        write_buffer_ = std::move(other.write_buffer_);
    }
    return *this;
}

std::optional<Frame> Connection::read_frame() {
    while (true) {
        // enough buffered data for a whole frame -> done
        if (auto frame = parse_frame()) {
            return frame;
        }

        // not enough, pull more from the socket. zero bytes means the peer closed its side
        if (fill_buffer() == 0) {
            if (read_buffer_.empty()) {
                return std::nullopt;
            }
            throw ConnectionReset();
        }
    }
}

std::optional<Frame> Connection::parse_frame() {
    // check first: it only walks the bytes, so a partial frame costs no allocations
    if (!FrameCodec::check(read_buffer_)) {
        return std::nullopt;
    }

    // parse consumes exactly the bytes check() walked over
    std::size_t consumed = 0;
    auto frame = FrameCodec::parse(read_buffer_, consumed);
    read_buffer_.erase(0, consumed);
    return frame;
}

std::size_t Connection::fill_buffer() {
    if (fd_ < 0) {
        throw std::system_error(EBADF, std::generic_category(), "recv on closed connection");
    }

    /*
        note: we recv straight into the tail of the buffer. resize() makes the bytes addressable,
        then we shrink back to what actually arrived. when the buffer is full the next read grows
        it by another read_capacity_ bytes.
    */
    std::size_t old_size = read_buffer_.size();
    std::size_t spare = read_buffer_.capacity() - old_size;
    if (spare == 0) {
        spare = read_capacity_;
    }
    read_buffer_.resize(old_size + spare);

    ssize_t n = 0;
    do {
        n = recv(fd_, read_buffer_.data() + old_size, spare, 0);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        int err = errno;
        read_buffer_.resize(old_size);
        throw std::system_error(err, std::generic_category(), "recv");
    }

    read_buffer_.resize(old_size + static_cast<std::size_t>(n));
    return static_cast<std::size_t>(n);
}

void Connection::write_frame(const Frame& frame) {
    write_buffer_.clear();
    // top level arrays are written as header + literal elements; encode() rejects deeper nesting
    FrameCodec::encode(frame, write_buffer_);
    flush();
}

void Connection::flush() {
    if (fd_ < 0) {
        throw std::system_error(EBADF, std::generic_category(), "send on closed connection");
    }

    std::size_t total_sent = 0;
    while (total_sent < write_buffer_.size()) {
        // MSG_NOSIGNAL: a closed peer gives EPIPE instead of killing the process with SIGPIPE
        ssize_t sent = send(fd_, write_buffer_.data() + total_sent,
                            write_buffer_.size() - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "send");
        }
        total_sent += static_cast<std::size_t>(sent);
    }
    write_buffer_.clear();
}

void Connection::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace walrus::net
