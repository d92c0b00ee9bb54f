#pragma once

/**
 * Process-wide state shared by the listener and every session: the
 * configuration, the prove handler, the concurrent-session cap, the
 * session identifier counter and the set of live client sockets.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>

#include "config.hpp"
#include "verifier/proof_types.hpp"

namespace zk_insurance {
namespace verifier_server {

// Callback type for handling proving requests
using ProveHandler = std::function<ProofResult(const ProofRequest&, const CancelCheck&)>;

class ServiceContext;

// Holds one unit of the session cap; returns it on destruction
class SessionSlot {
public:
    SessionSlot() = default;
    explicit SessionSlot(ServiceContext* context) : context_(context) {}
    ~SessionSlot();

    SessionSlot(const SessionSlot&) = delete;
    SessionSlot& operator=(const SessionSlot&) = delete;
    SessionSlot(SessionSlot&& other) noexcept : context_(other.context_) { other.context_ = nullptr; }
    SessionSlot& operator=(SessionSlot&& other) noexcept;

    explicit operator bool() const { return context_ != nullptr; }

private:
    ServiceContext* context_ = nullptr;
};

class ServiceContext {
public:
    ServiceContext(ServerConfig config, ProveHandler handler);

    const ServerConfig& config() const { return config_; }

    // Run the prove handler; a missing handler yields an Internal failure
    ProofResult prove(const ProofRequest& request, const CancelCheck& cancelled) const;

    // Empty slot when max_sessions sessions are already active
    SessionSlot try_acquire_slot();

    size_t active_sessions() const;

    // Block until no session holds a slot or the timeout passes
    bool wait_until_idle(std::chrono::milliseconds timeout);

    std::string next_session_id();

    // Live client sockets, so shutdown can unblock their sessions
    void register_connection(int fd);
    void unregister_connection(int fd);
    void shutdown_connections();

private:
    friend class SessionSlot;
    void release_slot();

    ServerConfig config_;
    ProveHandler prove_handler_;

    mutable std::mutex slots_mutex_;
    std::condition_variable idle_cv_;
    size_t active_ = 0;

    std::mutex connections_mutex_;
    std::set<int> connections_;

    std::atomic<uint64_t> next_id_{1};
};

} // namespace verifier_server
} // namespace zk_insurance
