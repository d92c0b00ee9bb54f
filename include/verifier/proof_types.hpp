#pragma once

/**
 * Values passed between the session, the proof pipeline and the result
 * parser. Each is created and consumed inside one session.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "verifier/input_validator.hpp"

namespace zk_insurance {

// Returns true once the owner of a running proof no longer wants the result
using CancelCheck = std::function<bool()>;

// Range constants published alongside every proof
struct PublicInputs {
    uint32_t min_age = static_cast<uint32_t>(MIN_AGE);
    uint32_t max_age = static_cast<uint32_t>(MAX_AGE);
    uint32_t min_bmi = static_cast<uint32_t>(MIN_BMI_TIMES_TEN);
    uint32_t max_bmi = static_cast<uint32_t>(MAX_BMI_TIMES_TEN);
};

struct ProofRequest {
    VerificationInput input;
    std::string session_id;
};

// Captured result of one external-process invocation
struct StageOutcome {
    std::string stage;
    bool launched = false;       // false when pipes/fork failed before exec
    int exit_status = -1;        // -1 unless the process exited normally
    int term_signal = 0;         // non-zero when killed by a signal
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;

    bool succeeded() const {
        return launched && !timed_out && !cancelled && exit_status == 0;
    }
};

enum class FailureKind {
    None,
    Environment,         // toolchain or circuit missing
    ConstraintFailure,   // witness stage rejected the inputs
    ProofFailure,        // proof synthesis failed
    Timeout,
    Cancelled,
    Internal,            // local I/O while preparing the working area
};

const char* failure_kind_name(FailureKind kind);

struct ProofArtifact {
    std::string proof_base64;
    size_t size_bytes = 0;
    std::string verification_key_base64;  // empty when no vk was found
};

struct ProofResult {
    bool success = false;
    std::string message;
    std::optional<std::string> raw_detail;
    FailureKind failure = FailureKind::None;
    std::optional<ProofArtifact> artifact;
    PublicInputs public_inputs;

    static ProofResult succeeded(std::string message) {
        ProofResult r;
        r.success = true;
        r.message = std::move(message);
        return r;
    }

    static ProofResult failed(FailureKind kind, std::string message,
                              std::optional<std::string> detail = std::nullopt) {
        ProofResult r;
        r.success = false;
        r.failure = kind;
        r.message = std::move(message);
        r.raw_detail = std::move(detail);
        return r;
    }
};

} // namespace zk_insurance
