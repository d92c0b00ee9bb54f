#include "verifier/result_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace zk_insurance {

namespace {

// Shell conventions: 126 = found but not executable, 127 = not found.
// SubprocessStageRunner uses 127 for any exec failure as well.
constexpr int EXIT_NOT_EXECUTABLE = 126;
constexpr int EXIT_NOT_FOUND = 127;

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string combined_detail(const StageOutcome& outcome) {
    std::string detail = outcome.stderr_text;
    if (detail.empty()) {
        detail = outcome.stdout_text;
    }
    if (outcome.term_signal != 0) {
        if (!detail.empty() && detail.back() != '\n') detail += '\n';
        detail += outcome.stage + " terminated by signal " + std::to_string(outcome.term_signal);
    }
    return detail;
}

// Failures that are not about the stage's own verdict
std::optional<ProofResult> classify_abnormal(const StageOutcome& outcome) {
    if (is_environment_failure(outcome)) {
        return ProofResult::failed(FailureKind::Environment, messages::TOOLCHAIN_UNAVAILABLE,
                                   combined_detail(outcome));
    }
    if (outcome.cancelled) {
        return ProofResult::failed(FailureKind::Cancelled, messages::CANCELLED,
                                   combined_detail(outcome));
    }
    if (outcome.timed_out) {
        return ProofResult::failed(FailureKind::Timeout, messages::TIMED_OUT,
                                   combined_detail(outcome));
    }
    return std::nullopt;
}

} // namespace

const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::Environment: return "environment";
        case FailureKind::ConstraintFailure: return "constraint_failure";
        case FailureKind::ProofFailure: return "proof_failure";
        case FailureKind::Timeout: return "timeout";
        case FailureKind::Cancelled: return "cancelled";
        case FailureKind::Internal: return "internal";
    }
    return "unknown";
}

bool is_environment_failure(const StageOutcome& outcome) {
    if (!outcome.launched) {
        return true;
    }
    if (outcome.timed_out || outcome.cancelled) {
        return false;
    }
    return outcome.exit_status == EXIT_NOT_FOUND || outcome.exit_status == EXIT_NOT_EXECUTABLE;
}

ProofResult interpret(const StageOutcome& witness, const std::optional<StageOutcome>& proof) {
    if (!witness.succeeded()) {
        if (auto abnormal = classify_abnormal(witness)) {
            return *abnormal;
        }
        return ProofResult::failed(FailureKind::ConstraintFailure,
                                   messages::CIRCUIT_EXECUTION_FAILED,
                                   combined_detail(witness));
    }

    if (!proof) {
        // Witness succeeded but the proof stage never ran
        return ProofResult::failed(FailureKind::Internal, messages::INTERNAL_ERROR,
                                   std::string("proof stage was not run"));
    }

    if (!proof->succeeded()) {
        if (auto abnormal = classify_abnormal(*proof)) {
            return *abnormal;
        }
        return ProofResult::failed(FailureKind::ProofFailure, messages::PROOF_SYNTHESIS_FAILED,
                                   combined_detail(*proof));
    }

    return ProofResult::succeeded(messages::SUCCESS);
}

std::string summarize_diagnostics(const std::string& output) {
    std::istringstream in(output);
    std::string line;
    std::string last_non_empty;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        if (lowercase(line).find("error") != std::string::npos) {
            return line;
        }
        last_non_empty = line;
    }
    return last_non_empty;
}

} // namespace zk_insurance
