#pragma once

/**
 * Stage Runner
 *
 * Runs one external toolchain stage (witness computation or proof synthesis)
 * and captures its exit status and output. The pipeline only talks to the
 * abstract interface so tests can substitute scripted outcomes.
 */

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "verifier/proof_types.hpp"

namespace zk_insurance {

class StageRunner {
public:
    virtual ~StageRunner() = default;

    /**
     * Run args[0] with args[1..] inside work_dir.
     *
     * `cancelled` is polled while the stage runs; once it returns true the
     * stage is killed and the outcome is marked cancelled.
     */
    virtual StageOutcome run_stage(const std::string& name,
                                   const std::vector<std::string>& args,
                                   const std::filesystem::path& work_dir,
                                   const CancelCheck& cancelled) = 0;
};

/**
 * fork/exec implementation.
 *
 * The child runs in its own process group so that timeouts and
 * cancellation kill anything the tool itself spawned. An exec failure
 * exits the child with status 127, the shell's "command not found" code.
 */
class SubprocessStageRunner : public StageRunner {
public:
    explicit SubprocessStageRunner(std::chrono::milliseconds timeout);

    StageOutcome run_stage(const std::string& name,
                           const std::vector<std::string>& args,
                           const std::filesystem::path& work_dir,
                           const CancelCheck& cancelled) override;

private:
    std::chrono::milliseconds timeout_;
};

} // namespace zk_insurance
