#pragma once

/**
 * Server configuration
 *
 * Precedence, lowest first: built-in defaults, JSON config file
 * (--config), environment variables, command-line flags.
 *
 * Environment Variables:
 *   ZKI_HOST                 Listen address (default 0.0.0.0)
 *   ZKI_PORT                 Listen port (default 8080)
 *   ZKI_MAX_SESSIONS         Concurrent session cap (default 8)
 *   ZKI_CIRCUIT_PATH         Noir circuit project directory
 *   ZKI_PACKAGE_NAME         Circuit package name (default insurance_verifier)
 *   ZKI_NARGO_PATH           nargo binary (default: nargo on PATH)
 *   ZKI_BB_PATH              bb binary (default: bb on PATH)
 *   ZKI_WORK_ROOT            Parent of per-session work areas (default: system temp)
 *   ZKI_PROVE_TIMEOUT_SECS   Per-stage timeout (default 300)
 *   ZKI_PROOF_OUTPUT_DIR     Save successful proof JSON here (default: disabled)
 *   ZKI_PRESERVE_TMP         Keep work areas for debugging
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "verifier/proof_pipeline.hpp"

namespace zk_insurance {
namespace verifier_server {

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t max_sessions = 8;
    unsigned prove_timeout_seconds = 300;
    std::filesystem::path proof_output_dir;
    PipelineConfig pipeline;
};

// Looks up one environment variable; std::getenv in production
using EnvLookup = std::function<const char*(const char*)>;

// Default circuit location: /app/noir-circuit in the container image,
// ../noir-circuit when run from a source checkout
std::filesystem::path default_circuit_path();

ServerConfig default_config();

// Throws std::runtime_error on an unreadable file, bad JSON or a
// wrongly-typed value. Unknown keys are ignored.
void apply_config_file(ServerConfig& config, const std::filesystem::path& path);
void apply_config_json(ServerConfig& config, const nlohmann::json& json);

// Throws std::runtime_error on a non-numeric or out-of-range number
void apply_environment(ServerConfig& config, const EnvLookup& lookup);

// Throws std::runtime_error when a setting is unusable
void validate_config(const ServerConfig& config);

// Numeric parsing shared with the command line
uint16_t parse_port(const std::string& text);
size_t parse_count(const std::string& text, const char* what);

} // namespace verifier_server
} // namespace zk_insurance
