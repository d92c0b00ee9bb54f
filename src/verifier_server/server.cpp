#include "server.hpp"
#include "session.hpp"

#include <chrono>
#include <cstring>
#include <iostream>
#include <system_error>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

namespace zk_insurance {
namespace verifier_server {

Server::Server(std::shared_ptr<ServiceContext> context)
    : context_(std::move(context)) {}

Server::~Server() {
    stop();
}

bool Server::listen_tcp(const std::string& host, uint16_t port) {
    // Create socket
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        std::cerr << "[server] Failed to create socket: " << strerror(errno) << std::endl;
        return false;
    }

    // Set SO_REUSEADDR
    int opt = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "[server] Failed to set SO_REUSEADDR: " << strerror(errno) << std::endl;
        ::close(fd);
        return false;
    }

    // Bind
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "[server] Invalid address: " << host << std::endl;
        ::close(fd);
        return false;
    }

    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::cerr << "[server] Failed to bind " << host << ":" << port << ": "
                  << strerror(errno) << std::endl;
        ::close(fd);
        return false;
    }

    // Listen
    if (::listen(fd, 64) < 0) {
        std::cerr << "[server] Failed to listen: " << strerror(errno) << std::endl;
        ::close(fd);
        return false;
    }

    struct sockaddr_in bound;
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    server_fd_.store(fd);
    std::cout << "[server] Listening on " << host << ":" << bound_port_ << std::endl;
    return true;
}

void Server::run() {
    int listen_fd = server_fd_.load();
    if (listen_fd < 0) {
        std::cerr << "[server] Not listening" << std::endl;
        return;
    }

    running_.store(true);

    // Ignore SIGPIPE (we handle write errors explicitly)
    signal(SIGPIPE, SIG_IGN);

    std::cout << "[server] Ready to accept connections (max_sessions="
              << context_->config().max_sessions << ")" << std::endl;

    while (running_.load()) {
        struct sockaddr_storage client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = ::accept4(listen_fd, reinterpret_cast<struct sockaddr*>(&client_addr),
                                  &client_len, SOCK_CLOEXEC);

        if (client_fd < 0) {
            if (errno == EINTR) {
                continue;  // Interrupted, check running_ flag
            }
            if (!running_.load()) {
                break;  // Server stopped
            }
            std::cerr << "[server] Accept failed: " << strerror(errno) << std::endl;
            if (errno == EMFILE || errno == ENFILE || errno == ENOBUFS || errno == ENOMEM) {
                // Out of descriptors or memory; back off instead of spinning
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            continue;
        }

        std::string peer = "unknown";
        if (client_addr.ss_family == AF_INET) {
            auto* addr = reinterpret_cast<struct sockaddr_in*>(&client_addr);
            char ip[INET_ADDRSTRLEN];
            inet_ntop(AF_INET, &addr->sin_addr, ip, sizeof(ip));
            peer = std::string(ip) + ":" + std::to_string(ntohs(addr->sin_port));
        }

        handle_client(client_fd, peer);
    }

    running_.store(false);
    std::cout << "[server] Accept loop stopped" << std::endl;
}

void Server::stop() {
    running_.store(false);
    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
}

void Server::handle_client(int client_fd, const std::string& peer) {
    SessionSlot slot = context_->try_acquire_slot();
    if (!slot) {
        std::cerr << "[server] Rejecting " << peer << ": " << context_->config().max_sessions
                  << " sessions already active" << std::endl;
        SocketWriter writer(client_fd);
        if (!writer.write_text(wire::BUSY)) {
            std::cerr << "[server] Failed to send busy message to " << peer << std::endl;
        }
        ::close(client_fd);
        return;
    }

    std::string id = context_->next_session_id();
    std::cout << "[server] Accepted connection from " << peer << " as session " << id << std::endl;

    auto context = context_;
    try {
        std::thread worker([client_fd, id, context, slot = std::move(slot)]() mutable {
            {
                Session session(client_fd, id, context);
                session.run();
            }
            // Release while `context` is still held by this closure
            slot = SessionSlot();
        });
        worker.detach();
    } catch (const std::system_error& e) {
        // The lambda never ran, so the fd is still ours; the slot was
        // released along with the destroyed lambda
        std::cerr << "[server] Failed to start session thread: " << e.what() << std::endl;
        ::close(client_fd);
    }
}

} // namespace verifier_server
} // namespace zk_insurance
