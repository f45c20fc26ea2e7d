#include "respkv/net/server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "respkv/core/dispatcher.hpp"
#include "respkv/net/io.hpp"
#include "respkv/util/logger.hpp"

namespace respkv::net {

namespace util = respkv::util;

class Server::Impl {
   public:
    Impl(core::Store& store, const ServerOptions& options) : store_(store), options_(options) {}

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

        // SO_REUSEADDR lets us rebind right after a restart instead of waiting out TIME_WAIT
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
            throw std::runtime_error("invalid address: " + options_.host);
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

        LOG_INFO("Listening on " + options_.host + ":" + std::to_string(actual_port_));
    }

    void stop() {
        // exchange returns the old value: already stopped means nothing to do
        if (!running_.exchange(false)) {
            return;
        }

        LOG_INFO("Server stopping...");

        // shutdown unblocks accept(), close releases the descriptor
        int fd = server_fd_.exchange(-1);
        if (fd >= 0) {
            shutdown(fd, SHUT_RDWR);
            close(fd);
        }

        // unblock the connection being served. its owner closes it
        {
            std::lock_guard lock(client_mutex_);
            if (client_fd_ >= 0) {
                shutdown(client_fd_, SHUT_RDWR);
            }
        }

        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }

        LOG_INFO("Server stopped");
    }

    [[nodiscard]] bool running() const noexcept {
        return running_;
    }

    [[nodiscard]] uint16_t port() const noexcept {
        return actual_port_;
    }

   private:
    void accept_loop() {
        while (running_) {
            int fd = server_fd_.load();
            if (fd < 0) {
                break;
            }

            sockaddr_in client_addr{};
            socklen_t client_len = sizeof(client_addr);
            int client_fd = accept(fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
            if (client_fd < 0) {
                if (running_ && errno != EINTR) {
                    LOG_ERROR("Accept failed: " + std::string(strerror(errno)));
                }
                continue;
            }

            if (options_.client_timeout_seconds > 0) {
                timeval tv{};
                tv.tv_sec = options_.client_timeout_seconds;
                setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
                setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
            }

            {
                std::lock_guard lock(client_mutex_);
                // stop() ran between accept() and here
                if (!running_) {
                    close(client_fd);
                    break;
                }
                client_fd_ = client_fd;
            }

            LOG_DEBUG("Client connected, fd=" + std::to_string(client_fd));
            serve_connection(client_fd);

            {
                std::lock_guard lock(client_mutex_);
                client_fd_ = -1;
                close(client_fd);
            }
            LOG_DEBUG("Client disconnected, fd=" + std::to_string(client_fd));
        }
    }

    // request/response loop for one client, until it hangs up or the stream breaks
    void serve_connection(int client_fd) {
        SocketReader input(client_fd);
        SocketWriter output(client_fd);
        RespReader reader(input, options_.limits);

        try {
            while (running_) {
                auto request = reader.read();
                if (!request) {
                    break;
                }

                if (util::Logger::instance().enabled(util::LogLevel::Debug)) {
                    LOG_DEBUG("Raw data: " + quote(reader.raw_data()));
                    LOG_DEBUG("Parsed data: " + request->describe());
                }

                Value response = core::Dispatcher::handle(*request, store_);
                LOG_DEBUG("Response: " + response.describe());

                RespEncoder::write(response, output);
            }
        } catch (const IoError& e) {
            // a broken stream only costs this connection
            LOG_WARN("Dropping client fd=" + std::to_string(client_fd) + ": " + e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("Client handler error: " + std::string(e.what()));
        }
    }

    core::Store& store_;
    ServerOptions options_;

    uint16_t actual_port_{0};

    // written by stop() on the caller's thread while accept_loop() reads it
    std::atomic<int> server_fd_{-1};
    std::atomic<bool> running_{false};

    std::thread accept_thread_;

    int client_fd_{-1};
    std::mutex client_mutex_;
};

// PIMPL INTERFACE -------------------------------------------------------------------------------
Server::Server(core::Store& store, const ServerOptions& options)
    : impl_(std::make_unique<Impl>(store, options)) {}
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
uint16_t Server::port() const noexcept {
    return impl_->port();
}

}  // namespace respkv::net
