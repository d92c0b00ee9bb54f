#pragma once

/**
 * ZK Insurance Verifier Server
 *
 * TCP listener that gives every accepted connection its own session thread,
 * so a slow proof never holds up the accept loop or other clients.
 * Connections beyond the session cap get a busy message and are closed.
 *
 * Usage:
 *   ./zk_insurance_server --port 8080
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "service_context.hpp"

namespace zk_insurance {
namespace verifier_server {

class Server {
public:
    explicit Server(std::shared_ptr<ServiceContext> context);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Start listening on TCP
    bool listen_tcp(const std::string& host, uint16_t port);

    // Run the accept loop (blocks until stop() is called)
    void run();

    // Stop accepting; live sessions are left to the caller to drain
    void stop();

    // Check if server is running
    bool is_running() const { return running_.load(); }

    // Port actually bound, useful after listening on port 0
    uint16_t bound_port() const { return bound_port_; }

private:
    void handle_client(int client_fd, const std::string& peer);

    std::shared_ptr<ServiceContext> context_;
    std::atomic<int> server_fd_{-1};
    std::atomic<bool> running_{false};
    uint16_t bound_port_ = 0;
};

} // namespace verifier_server
} // namespace zk_insurance
