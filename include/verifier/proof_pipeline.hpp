#pragma once

/**
 * Proof Pipeline
 *
 * Drives the external Noir toolchain for one request:
 *   1. copy the circuit project into a per-session work area
 *   2. write Prover.toml with the private inputs and public range bounds
 *   3. witness stage:  nargo execute
 *   4. proof stage:    bb prove -b target/<pkg>.json -w target/<pkg>.gz -o target/proof
 * and hands the captured outcomes to the result parser. The work area is
 * removed on every exit path.
 */

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "verifier/proof_types.hpp"
#include "verifier/stage_runner.hpp"
#include "verifier/work_area.hpp"

namespace zk_insurance {

struct PipelineConfig {
    std::filesystem::path circuit_path;
    std::string package_name = "insurance_verifier";
    std::string nargo_path = "nargo";
    std::string bb_path = "bb";
    std::filesystem::path work_root;
    bool preserve_work_dirs = false;
};

class ProofPipeline {
public:
    ProofPipeline(PipelineConfig config, std::shared_ptr<StageRunner> runner);

    ProofResult prove(const ProofRequest& request, const CancelCheck& cancelled);

    /**
     * Check that the circuit project is where the config says.
     * Returns a description of the first problem found, or nullopt.
     */
    std::optional<std::string> check_environment() const;

    std::vector<std::string> witness_command() const;
    std::vector<std::string> proof_command() const;

    const PipelineConfig& config() const { return config_; }
    const WorkAreaAllocator& allocator() const { return allocator_; }

private:
    bool copy_circuit(const std::filesystem::path& dest, std::string& error) const;
    std::optional<ProofArtifact> read_proof_artifact(const std::filesystem::path& work_dir) const;

    PipelineConfig config_;
    std::shared_ptr<StageRunner> runner_;
    WorkAreaAllocator allocator_;
};

// Prover.toml contents for the insurance circuit
std::string render_prover_toml(const VerificationInput& input, const PublicInputs& bounds);

std::string encode_base64(const std::vector<uint8_t>& data);

} // namespace zk_insurance
