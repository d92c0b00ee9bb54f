#pragma once

/**
 * Line protocol for the insurance verifier server
 *
 * Plain text over TCP, newline-terminated:
 *
 *   S: "ZK Insurance Verifier Server\n============================\nEnter age (10-25): "
 *   C: "<integer>\n"
 *   S: (invalid) "<error message>\nEnter age (10-25): "          repeated until valid
 *   S: (valid)   "Enter BMI multiplied by 10 (185-249): "
 *   C: "<integer>\n"
 *   S: (invalid) "<error message>\nEnter BMI multiplied by 10 (185-249): "
 *   S: (valid)   "Generating proof...\n"
 *   S: "\n=== PROOF RESPONSE ===\nSuccess: <true|false>\nMessage: <text>\n"
 *   S: (success) proof preview, public ranges, full JSON response
 *   S: "\nConnection will close. Thanks for using ZK Insurance Verifier!\n"
 *
 * The server closes the connection after one response.
 */

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "verifier/proof_types.hpp"

namespace zk_insurance {
namespace verifier_server {

namespace wire {

constexpr const char* BANNER = "ZK Insurance Verifier Server\n============================\n";
constexpr const char* AGE_PROMPT = "Enter age (10-25): ";
constexpr const char* BMI_PROMPT = "Enter BMI multiplied by 10 (185-249): ";
constexpr const char* GENERATING = "Generating proof...\n";
constexpr const char* FAREWELL = "\nConnection will close. Thanks for using ZK Insurance Verifier!\n";
constexpr const char* BUSY = "Server busy: too many concurrent sessions. Please try again later.\n";

// Longest accepted client line, newline excluded
constexpr size_t MAX_LINE_LENGTH = 1024;

// Characters of the base64 proof shown in the preview line
constexpr size_t PROOF_PREVIEW_CHARS = 50;

} // namespace wire

// Buffered newline-delimited reader over a socket
class LineReader {
public:
    explicit LineReader(int fd) : fd_(fd) {}

    /**
     * Read one line without its terminator ("\n" or "\r\n").
     *
     * Returns nullopt on EOF, on a read error, or when the line exceeds
     * MAX_LINE_LENGTH. A final unterminated line before EOF is returned.
     */
    std::optional<std::string> read_line();

    bool overflowed() const { return overflowed_; }

private:
    int fd_;
    std::string buffer_;
    bool eof_ = false;
    bool overflowed_ = false;
};

class SocketWriter {
public:
    explicit SocketWriter(int fd) : fd_(fd) {}

    // Write exactly n bytes
    bool write_all(const void* buf, size_t n);

    bool write_text(const std::string& text) { return write_all(text.data(), text.size()); }

private:
    int fd_;
};

// "\n=== PROOF RESPONSE ===\nSuccess: ...\nMessage: ...\n"
std::string format_response_header(const ProofResult& result);

// JSON document describing a successful proof
nlohmann::json proof_response_json(const ProofResult& result, const std::string& session_id);

// Everything after the header for a successful proof, up to the optional
// "Proof saved to" line
std::string format_success_details(const ProofResult& result, const std::string& session_id);

} // namespace verifier_server
} // namespace zk_insurance
