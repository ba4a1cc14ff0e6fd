#include "walrus/net/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "walrus/cmd/command.hpp"
#include "walrus/error.hpp"
#include "walrus/util/logger.hpp"
#include "walrus/util/semaphore.hpp"

namespace walrus::net {

namespace {

/*
    when you write to a socket whose other end has closed, the OS sends the process SIGPIPE and
    the default action terminates it. Connection already sends with MSG_NOSIGNAL; ignoring the
    signal globally as well covers any other write path.
*/
struct SigpipeIgnorer {
    SigpipeIgnorer() {
        signal(SIGPIPE, SIG_IGN);
    }
};

static SigpipeIgnorer sigpipe_ignorer;

// how long the acceptor waits for a free permit before re-checking running_
constexpr std::chrono::milliseconds kPermitPollInterval(100);

}  // namespace

class Server::Impl {
   public:
    Impl(core::Db db, const ServerOptions& options)
        : db_(std::move(db)),
          options_(options),
          limit_connections_(std::max<std::size_t>(options.max_connections, 1)) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }
        // AF_INET = IPv4, SOCK_STREAM = TCP
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            throw std::runtime_error("failed to create socket: " + std::string(strerror(errno)));
        }

        // SO_REUSEADDR lets us rebind to the port right after a restart instead of waiting out
        // TIME_WAIT
        int opt = 1;
        if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            close(fd);
            throw std::runtime_error("failed to set SO_REUSEADDR: " + std::string(strerror(errno)));
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(options_.port);

        if (inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) <= 0) {
            close(fd);
            throw std::runtime_error("Invalid address: " + options_.host);
        }

        if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            close(fd);
            throw std::runtime_error("failed to bind to port " + std::to_string(options_.port) +
                                     ": " + std::string(strerror(errno)));
        }

        // query actual bound port (for options_.port == 0)
        sockaddr_in bound_addr{};
        socklen_t bound_len = sizeof(bound_addr);
        if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound_addr), &bound_len) == 0) {
            actual_port_ = ntohs(bound_addr.sin_port);
        } else {
            actual_port_ = options_.port;
        }

        if (listen(fd, SOMAXCONN) < 0) {
            close(fd);
            throw std::runtime_error("failed to listen: " + std::string(strerror(errno)));
        }

        server_fd_.store(fd);
        running_ = true;
        accept_thread_ = std::thread(&Impl::accept_loop, this);

        WALRUS_LOG_INFO("Server started on " + options_.host + ":" + std::to_string(actual_port_));
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }

        WALRUS_LOG_INFO("Server stopping...");

        // cut a backoff sleep short
        {
            std::lock_guard lock(stop_mutex_);
        }
        stop_cv_.notify_all();

        // shutdown unblocks a thread stuck in accept(), close releases the fd
        int fd = server_fd_.exchange(-1);
        if (fd >= 0) {
            shutdown(fd, SHUT_RDWR);
            close(fd);
        }

        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }

        // handlers blocked in recv() see EOF once their socket is shut down
        std::lock_guard lock(clients_mutex_);
        for (auto& info : clients_) {
            std::lock_guard fd_lock(info->mutex);
            if (info->fd >= 0) {
                shutdown(info->fd, SHUT_RDWR);
            }
        }
        for (auto& info : clients_) {
            if (info->thread.joinable()) {
                info->thread.join();
            }
        }
        clients_.clear();

        WALRUS_LOG_INFO("Server stopped");
    }

    [[nodiscard]] bool running() const noexcept {
        return running_ && !failed_;
    }

    [[nodiscard]] bool failed() const noexcept {
        return failed_;
    }

    [[nodiscard]] uint16_t port() const noexcept {
        return actual_port_;
    }

    [[nodiscard]] std::size_t active_connections() const {
        return std::max<std::size_t>(options_.max_connections, 1) - limit_connections_.available();
    }

   private:
    struct ClientInfo {
        std::thread thread;
        std::atomic<bool> finished{false};
        // guards fd between the handler closing it and stop() shutting it down
        std::mutex mutex;
        int fd = -1;
    };

    void accept_loop() {
        while (running_) {
            cleanup_finished_clients();

            // a permit is taken before accept() so at most max_connections handlers ever exist.
            // it travels with the handler thread and is returned when that thread finishes
            auto permit = limit_connections_.try_acquire_for(kPermitPollInterval);
            if (!permit) {
                continue;
            }

            auto client_fd = accept_with_backoff();
            if (!client_fd) {
                if (running_) {
                    give_up();
                }
                break;
            }

            if (options_.client_timeout_seconds > 0) {
                timeval tv{};
                tv.tv_sec = options_.client_timeout_seconds;
                tv.tv_usec = 0;
                setsockopt(*client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
                setsockopt(*client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
            }

            WALRUS_LOG_DEBUG("Client connected, fd=" + std::to_string(*client_fd));

            std::lock_guard lock(clients_mutex_);
            auto info = std::make_unique<ClientInfo>();
            auto* info_ptr = info.get();
            info->fd = *client_fd;
            // the info is passed by pointer: unique_ptr keeps its address stable while the
            // vector reallocates
            info->thread = std::thread(&Impl::handle_client, this, *client_fd, info_ptr,
                                       std::move(*permit));
            clients_.push_back(std::move(info));
        }
    }

    /*
        accept with exponential backoff: 1s, 2s, 4s ... once the next delay would exceed
        accept_backoff_max we give up and the acceptor exits.
        returns nullopt when stopping or giving up.
    */
    std::optional<int> accept_with_backoff() {
        auto backoff = options_.accept_backoff_initial;

        while (running_) {
            int fd = server_fd_.load();
            if (fd < 0) {
                return std::nullopt;
            }

            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);
            int client_fd = accept(fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
            if (client_fd >= 0) {
                return client_fd;
            }

            int err = errno;
            if (!running_) {
                return std::nullopt;
            }
            if (err == EINTR) {
                continue;
            }

            if (backoff > options_.accept_backoff_max) {
                WALRUS_LOG_ERROR("Accept failed too many times, giving up: " +
                                 std::string(strerror(err)));
                return std::nullopt;
            }

            WALRUS_LOG_ERROR("Accept failed: " + std::string(strerror(err)) + ", retrying in " +
                             std::to_string(backoff.count()) + "ms");
            {
                std::unique_lock lock(stop_mutex_);
                stop_cv_.wait_for(lock, backoff, [this] { return !running_; });
            }
            backoff *= 2;
        }
        return std::nullopt;
    }

    /*
        the acceptor can't recover: stop listening so new clients are refused instead of sitting
        in the backlog, and flag the failure for whoever owns the server. connected clients keep
        being served until stop().
    */
    void give_up() {
        failed_ = true;
        int fd = server_fd_.exchange(-1);
        if (fd >= 0) {
            shutdown(fd, SHUT_RDWR);
            close(fd);
        }
    }

    void cleanup_finished_clients() {
        std::lock_guard lock(clients_mutex_);
        auto it = clients_.begin();
        while (it != clients_.end()) {
            if ((*it)->finished.load()) {
                if ((*it)->thread.joinable()) {
                    (*it)->thread.join();
                }
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }

    /*
        per connection loop: read a frame, decode it, run it, write the reply, repeat.
        replies go out in request order before the next frame is read.

        a CommandError (e.g. an unsupported SET option) is answered and the loop goes on - the
        frame was fully consumed so the stream is still in sync. every other error ends the
        connection: after a bad frame we can't know where the next one starts.
    */
    void handle_client(int client_fd, ClientInfo* info, util::Semaphore::Permit permit) {
        Connection connection(client_fd, options_.read_buffer_capacity);
        core::Db db = db_;

        try {
            while (running_) {
                auto frame = connection.read_frame();
                if (!frame) {
                    break;  // peer closed cleanly
                }

                std::optional<cmd::Command> command;
                try {
                    command = cmd::Command::from_frame(std::move(*frame));
                } catch (const CommandError& e) {
                    connection.write_frame(Frame::error(e.what()));
                    continue;
                }

                command->execute(db, connection);
            }
        } catch (const std::exception& e) {
            WALRUS_LOG_WARN("connection error: " + std::string(e.what()));
        }

        {
            std::lock_guard lock(info->mutex);
            info->fd = -1;
            connection.close();
        }

        WALRUS_LOG_DEBUG("Client disconnected, fd=" + std::to_string(client_fd));
        permit.release();
        info->finished.store(true);
    }

    core::Db db_;
    ServerOptions options_;

    uint16_t actual_port_{0};

    // written by stop() on the caller's thread while accept_loop() reads it
    std::atomic<int> server_fd_{-1};
    std::atomic<bool> running_{false};
    // set by the acceptor when it gives up; running_ stays set so stop() still joins everything
    std::atomic<bool> failed_{false};

    std::thread accept_thread_;
    util::Semaphore limit_connections_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;

    std::vector<std::unique_ptr<ClientInfo>> clients_;
    std::mutex clients_mutex_;
};

// PIMPL INTERFACE -------------------------------------------------------------------------------
Server::Server(core::Db db, const ServerOptions& options)
    : impl_(std::make_unique<Impl>(std::move(db), options)) {}
Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;
void Server::start() {
    impl_->start();
}
void Server::stop() {
    impl_->stop();
}
bool Server::running() const noexcept {
    return impl_->running();
}
bool Server::failed() const noexcept {
    return impl_->failed();
}
uint16_t Server::port() const noexcept {
    return impl_->port();
}
std::size_t Server::active_connections() const {
    return impl_->active_connections();
}

}  // namespace walrus::net
