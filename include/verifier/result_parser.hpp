#pragma once

/**
 * Result Parser
 *
 * Turns captured stage outcomes into the ProofResult sent to the client.
 * Three situations are kept apart:
 *   - the toolchain could not run at all (deployment problem),
 *   - the toolchain ran and rejected the inputs or failed to prove,
 *   - both stages succeeded.
 * Client messages come from a fixed set; raw tool output only goes into
 * raw_detail for the logs.
 */

#include <optional>
#include <string>

#include "verifier/proof_types.hpp"

namespace zk_insurance {

namespace messages {

constexpr const char* SUCCESS =
    "Proof generated successfully! The user is eligible for insurance discount.";
constexpr const char* CIRCUIT_EXECUTION_FAILED =
    "Circuit execution failed. Likely the inputs don't satisfy the constraints.";
constexpr const char* PROOF_SYNTHESIS_FAILED = "Proof synthesis failed.";
constexpr const char* TOOLCHAIN_UNAVAILABLE =
    "Proof service unavailable: the proving toolchain is not installed correctly.";
constexpr const char* TIMED_OUT = "Proof generation timed out.";
constexpr const char* CANCELLED = "Proof generation cancelled.";
constexpr const char* INTERNAL_ERROR = "Internal error while preparing the proof.";

} // namespace messages

// True when the outcome means the stage binary never ran (missing or not
// executable), as opposed to running and failing.
bool is_environment_failure(const StageOutcome& outcome);

/**
 * Interpret the witness stage outcome and, when it ran, the proof stage
 * outcome. `proof` must be empty if the witness stage failed.
 */
ProofResult interpret(const StageOutcome& witness, const std::optional<StageOutcome>& proof);

/**
 * Pick the most useful line out of tool output for a log summary: the first
 * line mentioning "error" (any case), else the last non-empty line.
 */
std::string summarize_diagnostics(const std::string& output);

} // namespace zk_insurance
