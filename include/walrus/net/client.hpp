#ifndef WALRUS_NET_CLIENT_HPP
#define WALRUS_NET_CLIENT_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "walrus/net/connection.hpp"
#include "walrus/net/frame.hpp"
#include "walrus/util/types.hpp"

namespace walrus::net {

struct ClientOptions {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;
    int timeout_seconds = 30;
    std::size_t read_buffer_capacity = Connection::kDefaultReadBufferCapacity;
};

/*
    blocking client: one request in flight at a time, each call sends a command frame and waits
    for its reply.

    an Error reply from the server is thrown as std::runtime_error carrying the server's text.
    a dropped connection throws too and leaves the client disconnected.
*/
class Client {
   public:
    explicit Client(const ClientOptions& options = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;

    void connect();
    void disconnect();
    [[nodiscard]] bool connected() const noexcept;

    // "PONG", or `msg` echoed back
    [[nodiscard]] std::string ping(std::optional<std::string> msg = std::nullopt);
    [[nodiscard]] std::optional<std::string> get(std::string_view key);
    void set(std::string_view key, std::string_view value);
    void set(std::string_view key, std::string_view value, util::Duration ttl);
    // returns the list length after the push, 0 if the key holds something other than a list
    [[nodiscard]] uint64_t rpush(std::string_view key, const std::vector<std::string>& items);

    // send an arbitrary request frame and return the raw reply. used by the CLI
    [[nodiscard]] Frame request(const Frame& frame);

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace walrus::net

#endif
