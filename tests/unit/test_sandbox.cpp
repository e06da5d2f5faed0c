#include <gtest/gtest.h>
#include "sandbox.h"
#include "constants.h"
#include "file_utils.h"
#include "fake_runtime.h"

#include <filesystem>
#include <fstream>

namespace gradebox {
namespace {

using testing_support::FakeRuntime;
using testing_support::FakeScript;

class SandboxExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = std::filesystem::temp_directory_path() / ("gradebox_sandbox_" + FileUtils::random_hex(4));
        workspaces = std::make_unique<WorkspaceManager>(root.string());
        workspace = workspaces->stage("exec_1", {{"solution.py", "def add(a, b): return a + b\n"}});

        language = BuiltInLanguages::python();
        limits.timeout = std::chrono::milliseconds(200);
    }

    void TearDown() override {
        std::filesystem::remove_all(root);
    }

    ExecutionResult run(const FakeScript& script) {
        runtime.set_script(script);
        SandboxExecutor executor(runtime, images);
        return executor.execute("exec_1", language, workspace, language.command, limits);
    }

    // Each created container must have been removed exactly once
    void expect_single_removal() {
        auto ids = runtime.created_ids();
        ASSERT_EQ(ids.size(), 1u);
        EXPECT_EQ(runtime.removal_count(ids[0]), 1) << "Container " << ids[0] << " must be removed once";
    }

    std::filesystem::path root;
    std::unique_ptr<WorkspaceManager> workspaces;
    WorkspaceHandle workspace;
    LanguageProfile language;
    ExecutionLimits limits;
    FakeRuntime runtime;
    ImageRegistry images{runtime};
};

// ============================================================================
// Exit Status
// ============================================================================

TEST_F(SandboxExecutorTest, ZeroExitIsSuccess) {
    FakeScript script;
    script.stdout_data = "5 passed\n";
    script.write_files = {{".gradebox/report.xml", "<testsuite tests=\"5\"/>"}};

    ExecutionResult result = run(script);

    EXPECT_EQ(result.status, ExecutionStatus::SUCCESS);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.execution_id, "exec_1");
    EXPECT_EQ(result.stdout_output, "5 passed\n");
    EXPECT_EQ(result.memory_bytes, 42u * 1024 * 1024);
    ASSERT_EQ(result.report_files.count(".gradebox/report.xml"), 1u) << "Report written by the run is collected";
    EXPECT_EQ(result.report_files[".gradebox/report.xml"], "<testsuite tests=\"5\"/>");
    expect_single_removal();
}

TEST_F(SandboxExecutorTest, NonZeroExitIsFailed) {
    FakeScript script;
    script.exit_code = 1;
    script.stderr_data = "AssertionError\n";

    ExecutionResult result = run(script);

    EXPECT_EQ(result.status, ExecutionStatus::FAILED);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_EQ(result.stderr_output, "AssertionError\n");
    EXPECT_TRUE(result.stdout_output.empty()) << "Streams are never merged";
    expect_single_removal();
}

TEST_F(SandboxExecutorTest, HangIsKilledAtTimeout) {
    // Given: a container that never exits on its own
    FakeScript script;
    script.hang = true;
    script.stdout_data = "collecting...\n";

    // When: it runs past the limit
    ExecutionResult result = run(script);

    // Then: it is killed, reported as timed out, and still removed
    EXPECT_EQ(result.status, ExecutionStatus::TIMED_OUT);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_EQ(runtime.kill_count(), 1u);
    EXPECT_GE(result.duration, std::chrono::milliseconds(200));
    EXPECT_EQ(result.stdout_output, "collecting...\n") << "Partial output is kept";
    EXPECT_TRUE(result.report_files.empty());
    expect_single_removal();
}

// ============================================================================
// Infrastructure Failures
// ============================================================================

TEST_F(SandboxExecutorTest, CreateFailureIsError) {
    FakeScript script;
    script.fail_create = true;

    ExecutionResult result = run(script);

    EXPECT_EQ(result.status, ExecutionStatus::ERROR);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_NE(result.error.find("create refused"), std::string::npos) << result.error;
    EXPECT_EQ(runtime.created_count(), 0u);
}

TEST_F(SandboxExecutorTest, StartFailureIsErrorAndRemoves) {
    FakeScript script;
    script.fail_start = true;

    ExecutionResult result = run(script);

    EXPECT_EQ(result.status, ExecutionStatus::ERROR);
    expect_single_removal();
}

TEST_F(SandboxExecutorTest, RemovalFailureDowngradesToError) {
    FakeScript script;
    script.fail_remove = true;

    ExecutionResult result = run(script);

    EXPECT_EQ(result.status, ExecutionStatus::ERROR);
    EXPECT_NE(result.error.find("container removal failed"), std::string::npos) << result.error;
    expect_single_removal();
}

TEST_F(SandboxExecutorTest, LogStreamFailureIsError) {
    FakeScript script;
    script.fail_logs = true;

    ExecutionResult result = run(script);

    EXPECT_EQ(result.status, ExecutionStatus::ERROR);
    EXPECT_NE(result.error.find("log stream failed"), std::string::npos) << result.error;
    expect_single_removal();
}

TEST_F(SandboxExecutorTest, MissingImageWithoutDockerfileIsError) {
    runtime.set_image_present(false);
    language.dockerfile.clear();

    ExecutionResult result = run(FakeScript());

    EXPECT_EQ(result.status, ExecutionStatus::ERROR);
    EXPECT_EQ(runtime.created_count(), 0u) << "No container without an image";
}

// ============================================================================
// Output Capture
// ============================================================================

TEST_F(SandboxExecutorTest, OutputIsCappedPerStream) {
    limits.max_stream_bytes = 16;
    FakeScript script;
    script.stdout_data = std::string(100, 'o');
    script.stderr_data = "short";

    ExecutionResult result = run(script);

    EXPECT_EQ(result.stdout_output.substr(0, 16), std::string(16, 'o'));
    EXPECT_NE(result.stdout_output.find("[truncated 84 bytes]"), std::string::npos) << result.stdout_output;
    EXPECT_EQ(result.stderr_output, "short");
}

TEST(CaptureSinkTest, KeepsStreamsSeparate) {
    CaptureSink sink(1024);
    sink.on_stdout("a", 1);
    sink.on_stderr("b", 1);
    sink.on_stdout("c", 1);

    EXPECT_EQ(sink.stdout_text(), "ac");
    EXPECT_EQ(sink.stderr_text(), "b");
    EXPECT_EQ(sink.stdout_dropped(), 0u);
}

// ============================================================================
// Container Settings
// ============================================================================

TEST_F(SandboxExecutorTest, SpecIsHardened) {
    limits.memory_bytes = 128 * 1024 * 1024;
    limits.memory_swap_bytes = limits.memory_bytes;
    limits.timeout = std::chrono::seconds(10);

    ContainerSpec spec = SandboxExecutor::build_spec("exec_1", "img:1", workspace, "pytest", limits);

    EXPECT_EQ(spec.name, "exec_1");
    EXPECT_EQ(spec.image, "img:1");
    ASSERT_EQ(spec.command.size(), 3u);
    EXPECT_EQ(spec.command[2], "pytest");
    EXPECT_EQ(spec.mount_point, SANDBOX_MOUNT_POINT);
    EXPECT_TRUE(std::filesystem::path(spec.workspace_host_path).is_absolute());
    EXPECT_EQ(spec.memory_bytes, spec.memory_swap_bytes) << "No swap beyond the memory limit";
    EXPECT_EQ(spec.cpu_time_seconds, 11);
    EXPECT_TRUE(spec.network_disabled);
    EXPECT_TRUE(spec.drop_all_capabilities);
    EXPECT_TRUE(spec.no_new_privileges);
    EXPECT_TRUE(spec.read_only_rootfs);
    EXPECT_EQ(spec.user, "65534:65534");
}

TEST_F(SandboxExecutorTest, ReportsBehindSymlinksAreIgnored) {
    std::filesystem::path outside = root / "outside";
    std::filesystem::create_directories(outside);
    std::ofstream(outside / "report.xml") << "<testsuite tests=\"100\"/>";
    std::filesystem::remove(workspace.path() / ".gradebox");
    std::filesystem::create_directory_symlink(outside, workspace.path() / ".gradebox");

    auto reports = SandboxExecutor::collect_reports(workspace, ".gradebox/report.xml");
    EXPECT_TRUE(reports.empty());
}

TEST_F(SandboxExecutorTest, ReportGlobCollectsEveryMatch) {
    std::filesystem::create_directories(workspace.path() / ".gradebox/reports");
    std::ofstream(workspace.path() / ".gradebox/reports/A.xml") << "a";
    std::ofstream(workspace.path() / ".gradebox/reports/B.xml") << "b";
    std::ofstream(workspace.path() / ".gradebox/reports/notes.txt") << "n";

    auto reports = SandboxExecutor::collect_reports(workspace, ".gradebox/reports/*.xml");
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[".gradebox/reports/A.xml"], "a");
    EXPECT_EQ(reports[".gradebox/reports/B.xml"], "b");
}

} // namespace
} // namespace gradebox
