#include "protocol.hpp"

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <sys/socket.h>
#include <unistd.h>

namespace zk_insurance {
namespace verifier_server {

// LineReader implementation

std::optional<std::string> LineReader::read_line() {
    while (true) {
        size_t newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.size() > wire::MAX_LINE_LENGTH) {
                overflowed_ = true;
                return std::nullopt;
            }
            return line;
        }

        if (buffer_.size() > wire::MAX_LINE_LENGTH + 1) {
            std::cerr << "[protocol] Line too long (" << buffer_.size() << "+ bytes)" << std::endl;
            overflowed_ = true;
            return std::nullopt;
        }

        if (eof_) {
            if (buffer_.empty()) {
                return std::nullopt;
            }
            std::string line;
            line.swap(buffer_);
            return line;
        }

        char chunk[512];
        ssize_t bytes_read = ::read(fd_, chunk, sizeof(chunk));
        if (bytes_read < 0) {
            if (errno == EINTR) {
                continue;  // Interrupted, retry
            }
            return std::nullopt;  // Error
        }
        if (bytes_read == 0) {
            // Connection closed
            eof_ = true;
            continue;
        }
        buffer_.append(chunk, static_cast<size_t>(bytes_read));
    }
}

// SocketWriter implementation

bool SocketWriter::write_all(const void* buf, size_t n) {
    const char* ptr = static_cast<const char*>(buf);
    size_t remaining = n;

    while (remaining > 0) {
        // MSG_NOSIGNAL: a vanished peer is an error return, not SIGPIPE
        ssize_t written = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
        if (written <= 0) {
            if (written < 0 && errno == EINTR) {
                continue;
            }
            return false;
        }
        ptr += written;
        remaining -= static_cast<size_t>(written);
    }
    return true;
}

// Response formatting

std::string format_response_header(const ProofResult& result) {
    std::ostringstream out;
    out << "\n=== PROOF RESPONSE ===\n"
        << "Success: " << (result.success ? "true" : "false") << "\n"
        << "Message: " << result.message << "\n";
    return out.str();
}

nlohmann::json proof_response_json(const ProofResult& result, const std::string& session_id) {
    nlohmann::json json;
    json["success"] = result.success;
    json["message"] = result.message;
    json["session_id"] = session_id;
    if (result.artifact) {
        json["proof"] = result.artifact->proof_base64;
        json["proof_size"] = result.artifact->size_bytes;
        json["verification_key"] = result.artifact->verification_key_base64;
    } else {
        json["proof"] = "";
        json["proof_size"] = 0;
        json["verification_key"] = "";
    }
    json["public_inputs"] = {
        {"min_age", result.public_inputs.min_age},
        {"max_age", result.public_inputs.max_age},
        {"min_bmi", result.public_inputs.min_bmi},
        {"max_bmi", result.public_inputs.max_bmi},
    };
    return json;
}

std::string format_success_details(const ProofResult& result, const std::string& session_id) {
    std::ostringstream out;

    if (result.artifact && !result.artifact->proof_base64.empty()) {
        out << "\nProof (Base64): "
            << result.artifact->proof_base64.substr(0, wire::PROOF_PREVIEW_CHARS) << "...\n";
    }

    const PublicInputs& p = result.public_inputs;
    out << "\nAge Range: " << p.min_age << " - " << p.max_age << "\n"
        << std::fixed << std::setprecision(1)
        << "BMI Range: " << p.min_bmi / 10.0 << " - " << p.max_bmi / 10.0 << "\n";

    out << "\nFull JSON Response:\n" << proof_response_json(result, session_id).dump(2) << "\n";
    return out.str();
}

} // namespace verifier_server
} // namespace zk_insurance
