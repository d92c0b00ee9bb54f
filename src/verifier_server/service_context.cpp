#include "service_context.hpp"
#include "verifier/result_parser.hpp"

#include <iostream>

#include <sys/socket.h>

namespace zk_insurance {
namespace verifier_server {

SessionSlot::~SessionSlot() {
    if (context_) {
        context_->release_slot();
    }
}

SessionSlot& SessionSlot::operator=(SessionSlot&& other) noexcept {
    if (this != &other) {
        if (context_) {
            context_->release_slot();
        }
        context_ = other.context_;
        other.context_ = nullptr;
    }
    return *this;
}

ServiceContext::ServiceContext(ServerConfig config, ProveHandler handler)
    : config_(std::move(config)), prove_handler_(std::move(handler)) {}

ProofResult ServiceContext::prove(const ProofRequest& request, const CancelCheck& cancelled) const {
    if (!prove_handler_) {
        std::cerr << "[server] No prove handler set!" << std::endl;
        return ProofResult::failed(FailureKind::Internal, messages::INTERNAL_ERROR,
                                   std::string("No prove handler configured"));
    }
    return prove_handler_(request, cancelled);
}

SessionSlot ServiceContext::try_acquire_slot() {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    if (active_ >= config_.max_sessions) {
        return SessionSlot();
    }
    ++active_;
    return SessionSlot(this);
}

void ServiceContext::release_slot() {
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        if (active_ > 0) {
            --active_;
        }
    }
    idle_cv_.notify_all();
}

size_t ServiceContext::active_sessions() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return active_;
}

bool ServiceContext::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(slots_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return active_ == 0; });
}

std::string ServiceContext::next_session_id() {
    return std::to_string(next_id_.fetch_add(1));
}

void ServiceContext::register_connection(int fd) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.insert(fd);
}

void ServiceContext::unregister_connection(int fd) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(fd);
}

void ServiceContext::shutdown_connections() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (int fd : connections_) {
        // Wakes the session's blocking read; the session closes the fd itself
        ::shutdown(fd, SHUT_RDWR);
    }
    if (!connections_.empty()) {
        std::cout << "[server] Shut down " << connections_.size() << " live connection(s)" << std::endl;
    }
}

} // namespace verifier_server
} // namespace zk_insurance
