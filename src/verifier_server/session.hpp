#pragma once

/**
 * Session Handler
 *
 * Owns one client connection for its whole life:
 *
 *   Greeting -> AwaitingAge -> AwaitingBmi -> Proving -> Responding -> Closed
 *
 * Invalid numbers re-prompt in place. EOF, a blank line or any socket error
 * goes straight to Closed. One verification per connection.
 */

#include <memory>
#include <optional>
#include <string>

#include "protocol.hpp"
#include "service_context.hpp"
#include "verifier/input_validator.hpp"

namespace zk_insurance {
namespace verifier_server {

enum class SessionState {
    Greeting,
    AwaitingAge,
    AwaitingBmi,
    Proving,
    Responding,
    Closed,
};

const char* session_state_name(SessionState state);

class Session {
public:
    // Takes ownership of client_fd
    Session(int client_fd, std::string id, std::shared_ptr<ServiceContext> context);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Run the state machine to Closed
    void run();

    SessionState state() const { return state_; }
    const std::string& id() const { return id_; }

private:
    bool send(const std::string& text);
    std::optional<int> read_field(FieldKind kind, const char* prompt);
    bool peer_hung_up() const;
    std::optional<std::string> save_proof(const ProofResult& result) const;
    void transition(SessionState next);
    void close();

    int fd_;
    std::string id_;
    std::shared_ptr<ServiceContext> context_;
    LineReader reader_;
    SocketWriter writer_;
    SessionState state_ = SessionState::Greeting;
};

} // namespace verifier_server
} // namespace zk_insurance
