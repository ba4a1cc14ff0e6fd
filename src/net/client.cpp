#include "walrus/net/client.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

#include "walrus/cmd/command.hpp"
#include "walrus/core/data.hpp"
#include "walrus/util/logger.hpp"

namespace walrus::net {

class Client::Impl {
   public:
    explicit Impl(const ClientOptions& options) : options_(options) {}

    ~Impl() {
        disconnect();
    }

    void connect() {
        if (connection_) {
            return;
        }

        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            throw std::runtime_error("failed to create socket: " + std::string(strerror(errno)));
        }

        if (options_.timeout_seconds > 0) {
            timeval tv{};
            tv.tv_sec = options_.timeout_seconds;
            tv.tv_usec = 0;
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
            setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(options_.port);

        if (inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) <= 0) {
            close(fd);
            throw std::runtime_error("Invalid address: " + options_.host);
        }

        if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(fd);
            throw std::runtime_error("failed to connect to " + options_.host + ":" +
                                     std::to_string(options_.port));
        }

        connection_.emplace(fd, options_.read_buffer_capacity);
    }

    void disconnect() {
        connection_.reset();
    }

    [[nodiscard]] bool connected() const noexcept {
        return connection_.has_value();
    }

    /*
        note: we throw in user operations because errors are rare and unrecoverable (network down =
        cant continue anyway)
    */
    [[nodiscard]] std::string ping(std::optional<std::string> msg) {
        auto reply = expect_ok(request(cmd::Ping{std::move(msg)}.into_frame()));
        if (reply.is(FrameType::Simple) || reply.is(FrameType::Bulk)) {
            return reply.text();
        }
        throw unexpected(reply);
    }

    [[nodiscard]] std::optional<std::string> get(std::string_view key) {
        auto reply = expect_ok(request(cmd::Get{std::string(key)}.into_frame()));
        switch (reply.type()) {
            case FrameType::Null:
                return std::nullopt;
            case FrameType::Simple:
            case FrameType::Bulk:
                return reply.text();
            case FrameType::Integer:
                return std::to_string(reply.integer_value());
            default:
                break;
        }
        throw unexpected(reply);
    }

    void set(std::string_view key, std::string_view value, std::optional<util::Duration> ttl) {
        cmd::Set command{std::string(key), std::string(value), ttl};
        auto reply = expect_ok(request(command.into_frame()));
        if (!reply.is(FrameType::Simple) || reply.text() != "OK") {
            throw unexpected(reply);
        }
    }

    [[nodiscard]] uint64_t rpush(std::string_view key, const std::vector<std::string>& items) {
        cmd::RPush command;
        command.key = std::string(key);
        command.items.reserve(items.size());
        for (const auto& item : items) {
            command.items.push_back(core::Data::bytes(item));
        }
        auto reply = expect_ok(request(command.into_frame()));
        if (!reply.is(FrameType::Integer)) {
            throw unexpected(reply);
        }
        return reply.integer_value();
    }

    [[nodiscard]] Frame request(const Frame& frame) {
        if (!connection_) {
            throw std::runtime_error("Not connected");
        }

        std::optional<Frame> reply;
        try {
            connection_->write_frame(frame);
            reply = connection_->read_frame();
        } catch (const std::exception&) {
            disconnect();
            throw;
        }

        if (!reply) {
            disconnect();
            throw std::runtime_error("connection closed by server");
        }
        return std::move(*reply);
    }

   private:
    static Frame expect_ok(Frame reply) {
        if (reply.is(FrameType::Error)) {
            throw std::runtime_error(reply.text());
        }
        return reply;
    }

    static std::runtime_error unexpected(const Frame& reply) {
        WALRUS_LOG_DEBUG("unexpected reply: " + reply.to_string());
        return std::runtime_error("unexpected response from server");
    }

    ClientOptions options_;
    std::optional<Connection> connection_;
};

// PIMPL INTERFACE ------------------------------------------------------------------------
Client::Client(const ClientOptions& options) : impl_(std::make_unique<Impl>(options)) {}
Client::~Client() = default;
Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;
void Client::connect() {
    impl_->connect();
}
void Client::disconnect() {
    impl_->disconnect();
}
bool Client::connected() const noexcept {
    return impl_->connected();
}
std::string Client::ping(std::optional<std::string> msg) {
    return impl_->ping(std::move(msg));
}
std::optional<std::string> Client::get(std::string_view key) {
    return impl_->get(key);
}
void Client::set(std::string_view key, std::string_view value) {
    impl_->set(key, value, std::nullopt);
}
void Client::set(std::string_view key, std::string_view value, util::Duration ttl) {
    impl_->set(key, value, ttl);
}
uint64_t Client::rpush(std::string_view key, const std::vector<std::string>& items) {
    return impl_->rpush(key, items);
}
Frame Client::request(const Frame& frame) {
    return impl_->request(frame);
}

}  // namespace walrus::net
