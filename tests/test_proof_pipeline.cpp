#include <gtest/gtest.h>
#include "verifier/proof_pipeline.hpp"
#include "verifier/result_parser.hpp"

#include <deque>
#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>

#include <unistd.h>

using namespace zk_insurance;
namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Returns queued outcomes in order and records what each stage saw
class ScriptedStageRunner : public StageRunner {
public:
    struct Call {
        std::string name;
        std::vector<std::string> args;
        fs::path work_dir;
        std::string prover_toml;
        bool circuit_copied;
    };

    void push(StageOutcome outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        outcomes_.push_back(std::move(outcome));
    }

    // Used when the queue is empty
    void set_default(StageOutcome outcome) { default_ = std::move(outcome); }

    StageOutcome run_stage(const std::string& name,
                           const std::vector<std::string>& args,
                           const fs::path& work_dir,
                           const CancelCheck&) override {
        Call call{name, args, work_dir, read_file(work_dir / "Prover.toml"),
                  fs::exists(work_dir / "Nargo.toml") && fs::exists(work_dir / "src" / "main.nr")};

        std::lock_guard<std::mutex> lock(mutex_);
        calls.push_back(call);
        StageOutcome outcome = default_;
        if (!outcomes_.empty()) {
            outcome = outcomes_.front();
            outcomes_.pop_front();
        }
        outcome.stage = name;
        return outcome;
    }

    std::vector<Call> calls;

private:
    std::mutex mutex_;
    std::deque<StageOutcome> outcomes_;
    StageOutcome default_ = ok();

public:
    static StageOutcome ok() {
        StageOutcome o;
        o.launched = true;
        o.exit_status = 0;
        return o;
    }

    static StageOutcome fail(int status, const std::string& err) {
        StageOutcome o;
        o.launched = true;
        o.exit_status = status;
        o.stderr_text = err;
        return o;
    }
};

} // namespace

class ProofPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = fs::temp_directory_path() /
                ("zki_pipeline_test_" + std::to_string(::getpid()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(base_);

        circuit_ = base_ / "noir-circuit";
        fs::create_directories(circuit_ / "src");
        std::ofstream(circuit_ / "Nargo.toml")
            << "[package]\nname = \"insurance_verifier\"\ntype = \"bin\"\n";
        std::ofstream(circuit_ / "src" / "main.nr") << "fn main() {}\n";

        work_root_ = base_ / "work";
        runner_ = std::make_shared<ScriptedStageRunner>();
    }

    void TearDown() override {
        fs::remove_all(base_);
    }

    PipelineConfig make_config() const {
        PipelineConfig config;
        config.circuit_path = circuit_;
        config.work_root = work_root_;
        return config;
    }

    static ProofRequest request(int age, int bmi, const std::string& session_id) {
        return ProofRequest{*VerificationInput::create(age, bmi), session_id};
    }

    fs::path base_;
    fs::path circuit_;
    fs::path work_root_;
    std::shared_ptr<ScriptedStageRunner> runner_;
};

TEST_F(ProofPipelineTest, BothStagesSucceed) {
    ProofPipeline pipeline(make_config(), runner_);
    auto result = pipeline.prove(request(20, 220, "1"), nullptr);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, messages::SUCCESS);
    ASSERT_EQ(runner_->calls.size(), 2u);
    EXPECT_EQ(runner_->calls[0].name, "witness");
    EXPECT_EQ(runner_->calls[0].args, pipeline.witness_command());
    EXPECT_EQ(runner_->calls[1].name, "proof");
    EXPECT_EQ(runner_->calls[1].args, pipeline.proof_command());
    EXPECT_TRUE(runner_->calls[0].circuit_copied);
}

TEST_F(ProofPipelineTest, WritesProverToml) {
    ProofPipeline pipeline(make_config(), runner_);
    pipeline.prove(request(18, 201, "2"), nullptr);

    ASSERT_FALSE(runner_->calls.empty());
    const std::string& toml = runner_->calls[0].prover_toml;
    EXPECT_NE(toml.find("age = \"18\""), std::string::npos);
    EXPECT_NE(toml.find("bmi = \"201\""), std::string::npos);
    EXPECT_NE(toml.find("min_age = \"10\""), std::string::npos);
    EXPECT_NE(toml.find("max_bmi = \"249\""), std::string::npos);
}

TEST_F(ProofPipelineTest, WitnessFailureSkipsProofStage) {
    runner_->push(ScriptedStageRunner::fail(1, "error: Failed constraint"));
    ProofPipeline pipeline(make_config(), runner_);
    auto result = pipeline.prove(request(20, 220, "3"), nullptr);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, FailureKind::ConstraintFailure);
    EXPECT_EQ(runner_->calls.size(), 1u);
    ASSERT_TRUE(result.raw_detail.has_value());
    EXPECT_NE(result.raw_detail->find("Failed constraint"), std::string::npos);
}

TEST_F(ProofPipelineTest, ProofFailure) {
    runner_->push(ScriptedStageRunner::ok());
    runner_->push(ScriptedStageRunner::fail(1, "bb failed"));
    ProofPipeline pipeline(make_config(), runner_);
    auto result = pipeline.prove(request(20, 220, "4"), nullptr);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, FailureKind::ProofFailure);
}

TEST_F(ProofPipelineTest, MissingCircuitIsEnvironmentFailure) {
    fs::remove_all(circuit_);
    ProofPipeline pipeline(make_config(), runner_);
    auto result = pipeline.prove(request(20, 220, "5"), nullptr);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, FailureKind::Environment);
    EXPECT_EQ(result.message, messages::TOOLCHAIN_UNAVAILABLE);
    EXPECT_TRUE(runner_->calls.empty());
}

TEST_F(ProofPipelineTest, WorkAreaRemovedOnEveryOutcome) {
    ProofPipeline pipeline(make_config(), runner_);

    pipeline.prove(request(20, 220, "ok"), nullptr);
    EXPECT_FALSE(fs::exists(pipeline.allocator().path_for("ok")));

    runner_->push(ScriptedStageRunner::fail(1, "constraint"));
    pipeline.prove(request(20, 220, "bad"), nullptr);
    EXPECT_FALSE(fs::exists(pipeline.allocator().path_for("bad")));

    StageOutcome cancelled = ScriptedStageRunner::ok();
    cancelled.cancelled = true;
    runner_->push(cancelled);
    pipeline.prove(request(20, 220, "gone"), nullptr);
    EXPECT_FALSE(fs::exists(pipeline.allocator().path_for("gone")));
}

TEST_F(ProofPipelineTest, PrecompiledTargetIsCopied) {
    fs::create_directories(circuit_ / "target");
    std::ofstream(circuit_ / "target" / "insurance_verifier.json") << "{}";

    struct CheckingRunner : public StageRunner {
        bool saw_artifact = false;
        StageOutcome run_stage(const std::string& name, const std::vector<std::string>&,
                               const fs::path& work_dir, const CancelCheck&) override {
            if (name == "witness") {
                saw_artifact = fs::exists(work_dir / "target" / "insurance_verifier.json");
            }
            return ScriptedStageRunner::ok();
        }
    };
    auto runner = std::make_shared<CheckingRunner>();
    ProofPipeline pipeline(make_config(), runner);
    pipeline.prove(request(20, 220, "6"), nullptr);
    EXPECT_TRUE(runner->saw_artifact);
}

// Two sessions proving at once each see only their own inputs
TEST_F(ProofPipelineTest, ConcurrentSessionsUseSeparateWorkAreas) {
    ProofPipeline pipeline(make_config(), runner_);

    std::thread a([&] { pipeline.prove(request(11, 190, "A"), nullptr); });
    std::thread b([&] { pipeline.prove(request(24, 240, "B"), nullptr); });
    a.join();
    b.join();

    ASSERT_EQ(runner_->calls.size(), 4u);
    for (const auto& call : runner_->calls) {
        if (call.work_dir == pipeline.allocator().path_for("A")) {
            EXPECT_NE(call.prover_toml.find("age = \"11\""), std::string::npos);
            EXPECT_NE(call.prover_toml.find("bmi = \"190\""), std::string::npos);
        } else {
            EXPECT_EQ(call.work_dir, pipeline.allocator().path_for("B"));
            EXPECT_NE(call.prover_toml.find("age = \"24\""), std::string::npos);
            EXPECT_NE(call.prover_toml.find("bmi = \"240\""), std::string::npos);
        }
    }
}

TEST_F(ProofPipelineTest, ProofCommandUsesPackageName) {
    PipelineConfig config = make_config();
    config.package_name = "my_circuit";
    config.bb_path = "/opt/bb";
    ProofPipeline pipeline(config, runner_);

    std::vector<std::string> expected = {"/opt/bb", "prove", "-b", "target/my_circuit.json",
                                         "-w", "target/my_circuit.gz", "-o", "target/proof"};
    EXPECT_EQ(pipeline.proof_command(), expected);
}

TEST(Base64Test, KnownVectors) {
    auto enc = [](const std::string& s) {
        return encode_base64(std::vector<uint8_t>(s.begin(), s.end()));
    };
    EXPECT_EQ(enc(""), "");
    EXPECT_EQ(enc("f"), "Zg==");
    EXPECT_EQ(enc("fo"), "Zm8=");
    EXPECT_EQ(enc("foo"), "Zm9v");
    EXPECT_EQ(enc("foobar"), "Zm9vYmFy");
}

// End to end through real subprocesses, with shell scripts playing nargo and bb
class ProofPipelineScriptTest : public ProofPipelineTest {
protected:
    void SetUp() override {
        ProofPipelineTest::SetUp();
        bin_ = base_ / "bin";
        fs::create_directories(bin_);

        write_script("nargo",
            "#!/bin/sh\n"
            "[ \"$1\" = execute ] || exit 2\n"
            "[ -f Prover.toml ] || { echo 'error: Prover.toml missing' 1>&2; exit 1; }\n"
            "mkdir -p target\n"
            "printf 'witness' > target/insurance_verifier.gz\n");

        write_script("bb",
            "#!/bin/sh\n"
            "out=''; wit=''\n"
            "while [ $# -gt 0 ]; do\n"
            "  case \"$1\" in\n"
            "    -o) out=\"$2\"; shift ;;\n"
            "    -w) wit=\"$2\"; shift ;;\n"
            "  esac\n"
            "  shift\n"
            "done\n"
            "[ -f \"$wit\" ] || { echo 'error: witness not found' 1>&2; exit 1; }\n"
            "printf 'proof-bytes' > \"$out\"\n");

        write_script("nargo_reject",
            "#!/bin/sh\n"
            "echo 'error: Failed constraint' 1>&2\n"
            "exit 1\n");
    }

    void write_script(const std::string& name, const std::string& body) {
        fs::path path = bin_ / name;
        std::ofstream(path) << body;
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
    }

    PipelineConfig script_config(const std::string& nargo) const {
        PipelineConfig config = make_config();
        config.nargo_path = (bin_ / nargo).string();
        config.bb_path = (bin_ / "bb").string();
        return config;
    }

    fs::path bin_;
};

TEST_F(ProofPipelineScriptTest, ProducesProofArtifact) {
    auto runner = std::make_shared<SubprocessStageRunner>(std::chrono::seconds(30));
    ProofPipeline pipeline(script_config("nargo"), runner);
    auto result = pipeline.prove(request(20, 220, "e2e"), nullptr);

    ASSERT_TRUE(result.success) << result.raw_detail.value_or("");
    ASSERT_TRUE(result.artifact.has_value());
    EXPECT_EQ(result.artifact->size_bytes, 11u);
    EXPECT_TRUE(result.artifact->verification_key_base64.empty());
    EXPECT_EQ(result.artifact->proof_base64,
              encode_base64(std::vector<uint8_t>{'p', 'r', 'o', 'o', 'f', '-', 'b', 'y', 't', 'e', 's'}));
    EXPECT_FALSE(fs::exists(pipeline.allocator().path_for("e2e")));
}

TEST_F(ProofPipelineScriptTest, ShippedVerificationKeyIsReturned) {
    fs::create_directories(circuit_ / "target");
    std::ofstream(circuit_ / "target" / "vk", std::ios::binary) << "vk-bytes";

    auto runner = std::make_shared<SubprocessStageRunner>(std::chrono::seconds(30));
    ProofPipeline pipeline(script_config("nargo"), runner);
    auto result = pipeline.prove(request(20, 220, "vk"), nullptr);

    ASSERT_TRUE(result.success) << result.raw_detail.value_or("");
    ASSERT_TRUE(result.artifact.has_value());
    EXPECT_EQ(result.artifact->verification_key_base64,
              encode_base64(std::vector<uint8_t>{'v', 'k', '-', 'b', 'y', 't', 'e', 's'}));
}

TEST_F(ProofPipelineScriptTest, WitnessRejection) {
    auto runner = std::make_shared<SubprocessStageRunner>(std::chrono::seconds(30));
    ProofPipeline pipeline(script_config("nargo_reject"), runner);
    auto result = pipeline.prove(request(20, 220, "reject"), nullptr);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, FailureKind::ConstraintFailure);
    EXPECT_FALSE(result.artifact.has_value());
}

TEST_F(ProofPipelineScriptTest, MissingToolchainBinary) {
    auto runner = std::make_shared<SubprocessStageRunner>(std::chrono::seconds(30));
    ProofPipeline pipeline(script_config("no-such-nargo"), runner);
    auto result = pipeline.prove(request(20, 220, "missing"), nullptr);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.failure, FailureKind::Environment);
    EXPECT_EQ(result.message, messages::TOOLCHAIN_UNAVAILABLE);
}
