#ifndef WALRUS_NET_SERVER_HPP
#define WALRUS_NET_SERVER_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "walrus/core/db.hpp"
#include "walrus/net/connection.hpp"

namespace walrus::net {

struct ServerOptions {
    std::string host = "127.0.0.1";  // local host
    uint16_t port = 6379;            // redis' default port. 0 picks a free one
    std::size_t max_connections = 1000;
    int client_timeout_seconds = 0;  // 0 = no socket timeout
    std::size_t read_buffer_capacity = 32 * 1024;

    // accept() failures back off 1s, 2s, 4s ... and give up past the max, closing the listener
    std::chrono::milliseconds accept_backoff_initial = std::chrono::seconds(1);
    std::chrono::milliseconds accept_backoff_max = std::chrono::seconds(64);
};

class Server {
   public:
    Server(core::Db db, const ServerOptions& options = {});
    ~Server();
    /*
        note on copy&moves:
        - server owns Impl which has threads & mutex and socket fds under the hood
        - copying is not safe
        - move would normally not be safe either but since we did PIMPL, move is trivial and allowed
    */
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    void start();
    void stop();

    // false once stopped, or once the acceptor gave up after repeated accept() failures
    [[nodiscard]] bool running() const noexcept;
    // the acceptor gave up; the owner should stop() the server
    [[nodiscard]] bool failed() const noexcept;
    [[nodiscard]] uint16_t port() const noexcept;
    [[nodiscard]] std::size_t active_connections() const;

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace walrus::net

#endif
