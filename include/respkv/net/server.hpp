#ifndef RESPKV_NET_SERVER_HPP
#define RESPKV_NET_SERVER_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "respkv/core/store.hpp"
#include "respkv/net/resp.hpp"

namespace respkv::net {

struct ServerOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 6379;              // 0 picks an ephemeral port, see port()
    int client_timeout_seconds = 300;  // 0 disables the per-connection socket timeout
    DecodeLimits limits;
};

/*
    TCP front end. One background thread accepts connections and serves each one to completion
    (read request, dispatch, write response, repeat) before accepting the next, so the store is
    only ever touched from that thread.
*/
class Server {
   public:
    Server(core::Store& store, const ServerOptions& options = {});
    ~Server();

    // owns a thread and sockets through the pimpl: no copies, moves only move the pointer
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    // throws std::runtime_error when the socket cannot be set up
    void start();
    void stop();

    [[nodiscard]] bool running() const noexcept;
    // the bound port, valid after start()
    [[nodiscard]] uint16_t port() const noexcept;

   private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace respkv::net

#endif
