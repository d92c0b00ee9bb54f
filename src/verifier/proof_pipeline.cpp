#include "verifier/proof_pipeline.hpp"
#include "verifier/result_parser.hpp"
#include "common/debug_control.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>

namespace zk_insurance {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    auto end = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

std::vector<uint8_t> read_binary_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return {};
    }

    std::streamsize size = file.tellg();
    if (size <= 0) {
        return {};
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return {};
    }

    return buffer;
}

void log_failure(const std::string& session_id, const ProofResult& result) {
    // Deployment problems are for operators, not an ordinary "not eligible"
    const bool elevated = result.failure == FailureKind::Environment ||
                          result.failure == FailureKind::Internal;
    std::ostream& out = elevated ? std::cerr : std::cout;
    out << "[pipeline] " << (elevated ? "ERROR " : "") << "session=" << session_id
        << " failure=" << failure_kind_name(result.failure);
    if (result.raw_detail && !result.raw_detail->empty()) {
        out << " detail=\"" << summarize_diagnostics(*result.raw_detail) << "\"";
    }
    out << std::endl;
    if (result.raw_detail) {
        ZKI_DEBUG_COUT("[pipeline] Full diagnostics:\n" << *result.raw_detail << std::endl);
    }
}

} // namespace

std::string render_prover_toml(const VerificationInput& input, const PublicInputs& bounds) {
    std::ostringstream out;
    out << "age = \"" << input.age() << "\"\n"
        << "bmi = \"" << input.bmi_times_ten() << "\"\n"
        << "min_age = \"" << bounds.min_age << "\"\n"
        << "max_age = \"" << bounds.max_age << "\"\n"
        << "min_bmi = \"" << bounds.min_bmi << "\"\n"
        << "max_bmi = \"" << bounds.max_bmi << "\"\n";
    return out.str();
}

std::string encode_base64(const std::vector<uint8_t>& data) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += alphabet[n & 0x3F];
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

ProofPipeline::ProofPipeline(PipelineConfig config, std::shared_ptr<StageRunner> runner)
    : config_(std::move(config)),
      runner_(std::move(runner)),
      allocator_(config_.work_root.empty() ? std::filesystem::temp_directory_path()
                                           : config_.work_root,
                 config_.preserve_work_dirs) {}

std::optional<std::string> ProofPipeline::check_environment() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(config_.circuit_path, ec)) {
        return "circuit directory not found: " + config_.circuit_path.string();
    }
    if (!std::filesystem::is_regular_file(config_.circuit_path / "Nargo.toml", ec)) {
        return "Nargo.toml missing in " + config_.circuit_path.string();
    }
    if (!std::filesystem::is_regular_file(config_.circuit_path / "src" / "main.nr", ec)) {
        return "src/main.nr missing in " + config_.circuit_path.string();
    }
    return std::nullopt;
}

std::vector<std::string> ProofPipeline::witness_command() const {
    return {config_.nargo_path, "execute"};
}

std::vector<std::string> ProofPipeline::proof_command() const {
    const std::string target = "target/" + config_.package_name;
    return {config_.bb_path, "prove",
            "-b", target + ".json",
            "-w", target + ".gz",
            "-o", "target/proof"};
}

bool ProofPipeline::copy_circuit(const std::filesystem::path& dest, std::string& error) const {
    namespace fs = std::filesystem;
    std::error_code ec;

    fs::copy_file(config_.circuit_path / "Nargo.toml", dest / "Nargo.toml", ec);
    if (ec) {
        error = "copy Nargo.toml: " + ec.message();
        return false;
    }

    fs::copy(config_.circuit_path / "src", dest / "src", fs::copy_options::recursive, ec);
    if (ec) {
        error = "copy src/: " + ec.message();
        return false;
    }

    // A precompiled artifact saves nargo a compile per request
    if (fs::is_directory(config_.circuit_path / "target", ec)) {
        fs::copy(config_.circuit_path / "target", dest / "target", fs::copy_options::recursive, ec);
        if (ec) {
            error = "copy target/: " + ec.message();
            return false;
        }
    }
    return true;
}

std::optional<ProofArtifact> ProofPipeline::read_proof_artifact(
    const std::filesystem::path& work_dir) const {
    // bb writes either a file or a directory holding "proof" (and "vk" when
    // asked to), depending on version
    const std::filesystem::path target = work_dir / "target";
    std::filesystem::path proof_path = target / "proof";
    std::filesystem::path vk_path = target / "vk";
    std::error_code ec;
    if (std::filesystem::is_directory(proof_path, ec)) {
        if (std::filesystem::is_regular_file(proof_path / "vk", ec)) {
            vk_path = proof_path / "vk";
        }
        proof_path /= "proof";
    }

    std::vector<uint8_t> bytes = read_binary_file(proof_path);
    if (bytes.empty()) {
        return std::nullopt;
    }

    ProofArtifact artifact;
    artifact.size_bytes = bytes.size();
    artifact.proof_base64 = encode_base64(bytes);

    // Optional: a vk shipped in the precompiled target/ or written by bb
    std::vector<uint8_t> vk = read_binary_file(vk_path);
    if (!vk.empty()) {
        artifact.verification_key_base64 = encode_base64(vk);
    }
    return artifact;
}

ProofResult ProofPipeline::prove(const ProofRequest& request, const CancelCheck& cancelled) {
    auto total_start = std::chrono::steady_clock::now();
    const std::string& session_id = request.session_id;

    std::cout << "[pipeline] =========================================" << std::endl;
    std::cout << "[pipeline] Starting proof session=" << session_id << std::endl;

    if (auto problem = check_environment()) {
        std::cerr << "[pipeline] ERROR toolchain environment: " << *problem << std::endl;
        std::cerr << "[pipeline] Set ZKI_CIRCUIT_PATH to the Noir circuit project" << std::endl;
        return ProofResult::failed(FailureKind::Environment, messages::TOOLCHAIN_UNAVAILABLE,
                                   *problem);
    }

    std::error_code ec;
    std::optional<WorkArea> area = allocator_.acquire(session_id, ec);
    if (!area) {
        ProofResult result = ProofResult::failed(
            FailureKind::Internal, messages::INTERNAL_ERROR,
            "work area " + allocator_.path_for(session_id).string() + ": " + ec.message());
        log_failure(session_id, result);
        return result;
    }
    ZKI_DEBUG_COUT("[pipeline] Work area: " << area->path() << std::endl);

    std::string copy_error;
    if (!copy_circuit(area->path(), copy_error)) {
        ProofResult result = ProofResult::failed(FailureKind::Internal, messages::INTERNAL_ERROR,
                                                 copy_error);
        log_failure(session_id, result);
        return result;
    }

    PublicInputs bounds;
    {
        std::ofstream prover_file(area->path() / "Prover.toml");
        if (!prover_file.is_open()) {
            ProofResult result = ProofResult::failed(FailureKind::Internal,
                                                     messages::INTERNAL_ERROR,
                                                     std::string("failed to write Prover.toml"));
            log_failure(session_id, result);
            return result;
        }
        prover_file << render_prover_toml(request.input, bounds);
    }

    auto witness_start = std::chrono::steady_clock::now();
    StageOutcome witness = runner_->run_stage("witness", witness_command(), area->path(), cancelled);
    double witness_ms = elapsed_ms(witness_start);

    std::optional<StageOutcome> proof;
    double proof_ms = 0.0;
    if (witness.succeeded()) {
        auto proof_start = std::chrono::steady_clock::now();
        proof = runner_->run_stage("proof", proof_command(), area->path(), cancelled);
        proof_ms = elapsed_ms(proof_start);
    }

    ProofResult result = interpret(witness, proof);
    result.public_inputs = bounds;

    if (result.success) {
        result.artifact = read_proof_artifact(area->path());
        if (!result.artifact) {
            std::cerr << "[pipeline] Warning: proof stage succeeded but no proof file was found"
                      << std::endl;
        }
    } else {
        log_failure(session_id, result);
    }

    area->release();

    std::cout << "[pipeline] Finished session=" << session_id
              << " success=" << (result.success ? "true" : "false")
              << " witness_ms=" << witness_ms
              << " proof_ms=" << proof_ms
              << " total_ms=" << elapsed_ms(total_start);
    if (result.artifact) {
        std::cout << " proof_size=" << result.artifact->size_bytes;
    }
    std::cout << std::endl;
    std::cout << "[pipeline] =========================================" << std::endl;

    return result;
}

} // namespace zk_insurance
