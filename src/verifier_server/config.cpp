#include "config.hpp"

#include <fstream>
#include <stdexcept>

namespace zk_insurance {
namespace verifier_server {

namespace {

bool is_truthy(const char* value) {
    std::string v = value;
    return v == "1" || v == "true" || v == "yes";
}

template <typename T>
T json_get(const nlohmann::json& json, const char* key) {
    try {
        return json.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("config key '") + key + "': " + e.what());
    }
}

} // namespace

uint16_t parse_port(const std::string& text) {
    size_t value = parse_count(text, "port");
    if (value > 65535) {
        throw std::runtime_error("port out of range: " + text);
    }
    return static_cast<uint16_t>(value);
}

size_t parse_count(const std::string& text, const char* what) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error(std::string("invalid ") + what + ": '" + text + "'");
    }
    try {
        return static_cast<size_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        throw std::runtime_error(std::string(what) + " out of range: " + text);
    }
}

std::filesystem::path default_circuit_path() {
    std::error_code ec;
    if (std::filesystem::exists("/app/noir-circuit", ec)) {
        return "/app/noir-circuit";
    }
    return "../noir-circuit";
}

ServerConfig default_config() {
    ServerConfig config;
    config.pipeline.circuit_path = default_circuit_path();
    return config;
}

void apply_config_file(ServerConfig& config, const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }
    apply_config_json(config, json);
}

void apply_config_json(ServerConfig& config, const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::runtime_error("config must be a JSON object");
    }

    if (json.contains("host")) config.host = json_get<std::string>(json, "host");
    if (json.contains("port")) {
        auto port = json_get<int64_t>(json, "port");
        if (port < 0 || port > 65535) {
            throw std::runtime_error("config key 'port' out of range");
        }
        config.port = static_cast<uint16_t>(port);
    }
    if (json.contains("max_sessions")) {
        auto n = json_get<int64_t>(json, "max_sessions");
        if (n < 0) {
            throw std::runtime_error("config key 'max_sessions' must not be negative");
        }
        config.max_sessions = static_cast<size_t>(n);
    }
    if (json.contains("prove_timeout_seconds")) {
        auto n = json_get<int64_t>(json, "prove_timeout_seconds");
        if (n < 0) {
            throw std::runtime_error("config key 'prove_timeout_seconds' must not be negative");
        }
        config.prove_timeout_seconds = static_cast<unsigned>(n);
    }
    if (json.contains("proof_output_dir")) {
        config.proof_output_dir = json_get<std::string>(json, "proof_output_dir");
    }
    if (json.contains("circuit_path")) {
        config.pipeline.circuit_path = json_get<std::string>(json, "circuit_path");
    }
    if (json.contains("package_name")) {
        config.pipeline.package_name = json_get<std::string>(json, "package_name");
    }
    if (json.contains("nargo_path")) config.pipeline.nargo_path = json_get<std::string>(json, "nargo_path");
    if (json.contains("bb_path")) config.pipeline.bb_path = json_get<std::string>(json, "bb_path");
    if (json.contains("work_root")) {
        config.pipeline.work_root = json_get<std::string>(json, "work_root");
    }
    if (json.contains("preserve_work_dirs")) {
        config.pipeline.preserve_work_dirs = json_get<bool>(json, "preserve_work_dirs");
    }
}

void apply_environment(ServerConfig& config, const EnvLookup& lookup) {
    if (const char* v = lookup("ZKI_HOST")) config.host = v;
    if (const char* v = lookup("ZKI_PORT")) config.port = parse_port(v);
    if (const char* v = lookup("ZKI_MAX_SESSIONS")) {
        config.max_sessions = parse_count(v, "ZKI_MAX_SESSIONS");
    }
    if (const char* v = lookup("ZKI_PROVE_TIMEOUT_SECS")) {
        config.prove_timeout_seconds =
            static_cast<unsigned>(parse_count(v, "ZKI_PROVE_TIMEOUT_SECS"));
    }
    if (const char* v = lookup("ZKI_PROOF_OUTPUT_DIR")) config.proof_output_dir = v;
    if (const char* v = lookup("ZKI_CIRCUIT_PATH")) config.pipeline.circuit_path = v;
    if (const char* v = lookup("ZKI_PACKAGE_NAME")) config.pipeline.package_name = v;
    if (const char* v = lookup("ZKI_NARGO_PATH")) config.pipeline.nargo_path = v;
    if (const char* v = lookup("ZKI_BB_PATH")) config.pipeline.bb_path = v;
    if (const char* v = lookup("ZKI_WORK_ROOT")) config.pipeline.work_root = v;
    if (const char* v = lookup("ZKI_PRESERVE_TMP")) {
        config.pipeline.preserve_work_dirs = is_truthy(v);
    }
}

void validate_config(const ServerConfig& config) {
    if (config.max_sessions < 1) {
        throw std::runtime_error("max_sessions must be at least 1");
    }
    if (config.prove_timeout_seconds < 1) {
        throw std::runtime_error("prove_timeout_seconds must be at least 1");
    }
    if (config.pipeline.package_name.empty()) {
        throw std::runtime_error("package_name must not be empty");
    }
    if (config.pipeline.nargo_path.empty() || config.pipeline.bb_path.empty()) {
        throw std::runtime_error("toolchain binary paths must not be empty");
    }
}

} // namespace verifier_server
} // namespace zk_insurance
