#include "session.hpp"
#include "common/debug_control.hpp"
#include "verifier/result_parser.hpp"

#include <chrono>
#include <fstream>
#include <iostream>

#include <poll.h>
#include <unistd.h>

namespace zk_insurance {
namespace verifier_server {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

} // namespace

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Greeting: return "Greeting";
        case SessionState::AwaitingAge: return "AwaitingAge";
        case SessionState::AwaitingBmi: return "AwaitingBmi";
        case SessionState::Proving: return "Proving";
        case SessionState::Responding: return "Responding";
        case SessionState::Closed: return "Closed";
    }
    return "Unknown";
}

Session::Session(int client_fd, std::string id, std::shared_ptr<ServiceContext> context)
    : fd_(client_fd),
      id_(std::move(id)),
      context_(std::move(context)),
      reader_(client_fd),
      writer_(client_fd) {
    context_->register_connection(fd_);
}

Session::~Session() {
    close();
}

void Session::close() {
    if (fd_ < 0) {
        return;
    }
    // Unregister first so a concurrent shutdown never targets a reused fd
    context_->unregister_connection(fd_);
    ::close(fd_);
    fd_ = -1;
    state_ = SessionState::Closed;
}

void Session::transition(SessionState next) {
    ZKI_DEBUG_COUT("[session " << id_ << "] " << session_state_name(state_)
                   << " -> " << session_state_name(next) << std::endl);
    state_ = next;
}

bool Session::send(const std::string& text) {
    if (!writer_.write_text(text)) {
        std::cerr << "[session " << id_ << "] Write failed in state "
                  << session_state_name(state_) << ", closing" << std::endl;
        transition(SessionState::Closed);
        return false;
    }
    return true;
}

std::optional<int> Session::read_field(FieldKind kind, const char* prompt) {
    while (true) {
        auto line = reader_.read_line();
        if (!line) {
            if (reader_.overflowed()) {
                std::cerr << "[session " << id_ << "] Line too long, closing" << std::endl;
            } else {
                std::cout << "[session " << id_ << "] Client disconnected in state "
                          << session_state_name(state_) << std::endl;
            }
            transition(SessionState::Closed);
            return std::nullopt;
        }

        ZKI_DEBUG_COUT("[session " << id_ << "] Read: \"" << *line << "\"" << std::endl);

        if (is_blank(*line)) {
            std::cout << "[session " << id_ << "] Blank input, closing" << std::endl;
            transition(SessionState::Closed);
            return std::nullopt;
        }

        ValidationResult result = validate(*line, kind);
        if (result.ok()) {
            return result.value();
        }

        if (!send(result.error().message() + "\n" + prompt)) {
            return std::nullopt;
        }
    }
}

bool Session::peer_hung_up() const {
    if (fd_ < 0) {
        return true;
    }
    // No events requested: unread bytes and a half-close (client done
    // writing, still reading) do not count. A closed peer answers the
    // "Generating proof" line with a reset, which shows up as POLLHUP/POLLERR.
    struct pollfd p;
    p.fd = fd_;
    p.events = 0;
    p.revents = 0;
    if (::poll(&p, 1, 0) <= 0) {
        return false;
    }
    return (p.revents & (POLLHUP | POLLERR | POLLNVAL)) != 0;
}

std::optional<std::string> Session::save_proof(const ProofResult& result) const {
    const auto& dir = context_->config().proof_output_dir;
    if (dir.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "[session " << id_ << "] Cannot create proof output dir " << dir
                  << ": " << ec.message() << std::endl;
        return std::nullopt;
    }

    std::string filename = "proof_" + id_ + "_" +
        std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count()) + ".json";
    std::ofstream out(dir / filename);
    if (!out.is_open()) {
        std::cerr << "[session " << id_ << "] Failed to write " << (dir / filename) << std::endl;
        return std::nullopt;
    }
    out << proof_response_json(result, id_).dump(2) << "\n";
    if (!out) {
        std::cerr << "[session " << id_ << "] Failed to write " << (dir / filename) << std::endl;
        return std::nullopt;
    }
    return filename;
}

void Session::run() {
    std::cout << "[session " << id_ << "] Started" << std::endl;

    // Greeting
    if (!send(std::string(wire::BANNER) + wire::AGE_PROMPT)) {
        close();
        return;
    }
    transition(SessionState::AwaitingAge);

    auto age = read_field(FieldKind::Age, wire::AGE_PROMPT);
    if (!age) {
        close();
        return;
    }
    if (!send(wire::BMI_PROMPT)) {
        close();
        return;
    }
    transition(SessionState::AwaitingBmi);

    auto bmi = read_field(FieldKind::BmiTimesTen, wire::BMI_PROMPT);
    if (!bmi) {
        close();
        return;
    }

    auto input = VerificationInput::create(*age, *bmi);
    if (!input) {
        // validate() already enforced both ranges
        std::cerr << "[session " << id_ << "] Validated input rejected, closing" << std::endl;
        close();
        return;
    }

    transition(SessionState::Proving);
    if (!send(wire::GENERATING)) {
        close();
        return;
    }

    ProofResult result;
    try {
        result = context_->prove(ProofRequest{*input, id_}, [this] { return peer_hung_up(); });
    } catch (const std::exception& e) {
        std::cerr << "[session " << id_ << "] Prove handler threw: " << e.what() << std::endl;
        result = ProofResult::failed(FailureKind::Internal, messages::INTERNAL_ERROR,
                                     std::string(e.what()));
    }

    if (result.failure == FailureKind::Cancelled || peer_hung_up()) {
        std::cout << "[session " << id_ << "] Client gone during proving, no response sent"
                  << std::endl;
        close();
        return;
    }

    transition(SessionState::Responding);
    std::string response = format_response_header(result);
    if (result.success) {
        response += format_success_details(result, id_);
        if (auto saved = save_proof(result)) {
            response += "Proof saved to: " + *saved + "\n";
        }
    }
    response += wire::FAREWELL;

    if (send(response)) {
        std::cout << "[session " << id_ << "] Response sent: success="
                  << (result.success ? "true" : "false") << std::endl;
    }
    close();
}

} // namespace verifier_server
} // namespace zk_insurance
