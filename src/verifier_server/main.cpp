/**
 * ZK Insurance Verifier Server - Main Entry Point
 *
 * Line-oriented TCP server: clients enter an age and BMI * 10, the server
 * runs the Noir witness stage and the Barretenberg proof stage, and replies
 * whether a proof of eligibility could be generated.
 *
 * Usage:
 *   ./zk_insurance_server
 *   ./zk_insurance_server --port 9000 --max-sessions 4 --circuit /app/noir-circuit
 *   ./zk_insurance_server --config server.json
 *
 * Environment Variables: see config.hpp. ZKI_DEBUG enables debug output.
 */

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "common/debug_control.hpp"
#include "config.hpp"
#include "server.hpp"
#include "verifier/proof_pipeline.hpp"
#include "verifier/stage_runner.hpp"

using namespace zk_insurance;
using namespace zk_insurance::verifier_server;

// Global server pointer for signal handling
static Server* g_server = nullptr;

void signal_handler(int sig) {
    std::cout << "\n[main] Received signal " << sig << ", stopping server..." << std::endl;
    if (g_server) {
        g_server->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [OPTIONS]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --port N           Listen port (default 8080)" << std::endl;
    std::cerr << "  --host ADDR        Listen address (default 0.0.0.0)" << std::endl;
    std::cerr << "  --max-sessions N   Concurrent session cap (default 8)" << std::endl;
    std::cerr << "  --circuit DIR      Noir circuit project directory" << std::endl;
    std::cerr << "  --config FILE      JSON config file" << std::endl;
    std::cerr << "  --help             Show this help message" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Environment Variables:" << std::endl;
    std::cerr << "  ZKI_PORT, ZKI_HOST, ZKI_MAX_SESSIONS, ZKI_CIRCUIT_PATH, ZKI_PACKAGE_NAME," << std::endl;
    std::cerr << "  ZKI_NARGO_PATH, ZKI_BB_PATH, ZKI_WORK_ROOT, ZKI_PROVE_TIMEOUT_SECS," << std::endl;
    std::cerr << "  ZKI_PROOF_OUTPUT_DIR, ZKI_PRESERVE_TMP, ZKI_DEBUG" << std::endl;
}

int main(int argc, char* argv[]) {
    std::cout << "ZK Insurance Verifier TCP Server" << std::endl;
    std::cout << "================================" << std::endl;

    // Command line is collected first but applied last so it wins over
    // the config file and environment
    std::string config_file;
    std::string port_arg, host_arg, max_sessions_arg, circuit_arg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto take_value = [&](std::string& out) -> bool {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--port" || arg == "-p") {
            if (!take_value(port_arg)) return 1;
        } else if (arg == "--host") {
            if (!take_value(host_arg)) return 1;
        } else if (arg == "--max-sessions") {
            if (!take_value(max_sessions_arg)) return 1;
        } else if (arg == "--circuit") {
            if (!take_value(circuit_arg)) return 1;
        } else if (arg == "--config") {
            if (!take_value(config_file)) return 1;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    ServerConfig config = default_config();
    try {
        if (!config_file.empty()) {
            apply_config_file(config, config_file);
        }
        apply_environment(config, [](const char* name) { return std::getenv(name); });
        if (!port_arg.empty()) config.port = parse_port(port_arg);
        if (!host_arg.empty()) config.host = host_arg;
        if (!max_sessions_arg.empty()) {
            config.max_sessions = parse_count(max_sessions_arg, "--max-sessions");
        }
        if (!circuit_arg.empty()) config.pipeline.circuit_path = circuit_arg;
        validate_config(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto runner = std::make_shared<SubprocessStageRunner>(
        std::chrono::seconds(config.prove_timeout_seconds));
    auto pipeline = std::make_shared<ProofPipeline>(config.pipeline, runner);

    std::cout << "Circuit: " << config.pipeline.circuit_path << std::endl;
    std::cout << "Toolchain: " << config.pipeline.nargo_path << ", " << config.pipeline.bb_path << std::endl;
    std::cout << "Work root: " << pipeline->allocator().root() << std::endl;
    std::cout << "Max sessions: " << config.max_sessions
              << ", stage timeout: " << config.prove_timeout_seconds << "s" << std::endl;
    if (ZKI_DEBUG_ENABLED()) {
        std::cout << "Debug output: enabled (ZKI_DEBUG)" << std::endl;
    }
    if (auto problem = pipeline->check_environment()) {
        // Not fatal: each request reports the problem until it is fixed
        std::cerr << "[main] WARNING: " << *problem << std::endl;
    }
    std::cout << std::endl;

    auto context = std::make_shared<ServiceContext>(
        config,
        [pipeline](const ProofRequest& request, const CancelCheck& cancelled) {
            return pipeline->prove(request, cancelled);
        });

    // Create server
    Server server(context);
    g_server = &server;

    // Set up signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!server.listen_tcp(config.host, config.port)) {
        std::cerr << "Failed to start server" << std::endl;
        return 1;
    }

    std::cout << "Connect using: nc 127.0.0.1 " << server.bound_port() << std::endl;
    std::cout << "Or: telnet 127.0.0.1 " << server.bound_port() << std::endl;
    std::cout << std::endl;

    // Run server (blocks until stopped)
    server.run();
    g_server = nullptr;

    // Unblock live sessions; in-flight proofs see the hang-up and are killed
    context->shutdown_connections();
    if (!context->wait_until_idle(std::chrono::seconds(10))) {
        std::cerr << "[main] " << context->active_sessions()
                  << " session(s) still active after 10s, exiting anyway" << std::endl;
    }

    std::cout << "Server stopped." << std::endl;
    return 0;
}
