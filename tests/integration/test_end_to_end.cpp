#include <gtest/gtest.h>
#include "pipeline.h"
#include "native_runtime.h"
#include "image_registry.h"
#include "problem_catalog.h"
#include "memory_store.h"
#include "file_utils.h"

#include <filesystem>
#include <fstream>
#include <condition_variable>
#include <mutex>
#include <set>

namespace fs = std::filesystem;

namespace gradebox {
namespace {

// Hidden test for an `add` shell function, reporting PASS/FAIL markers
const char* CHECK_SCRIPT =
    "failures=0\n"
    ". ./solution.sh\n"
    "check() {\n"
    "  if [ \"$(add $1 $2)\" = \"$3\" ]; then echo \"PASS: add $1 $2\";\n"
    "  else echo \"FAIL: add $1 $2: expected $3\"; failures=$((failures + 1)); fi\n"
    "}\n"
    "check 2 3 5\n"
    "check 10 -4 6\n"
    "check 0 0 0\n"
    "check 7 8 15\n"
    "[ $failures -eq 0 ]\n";

LanguageProfile shell_language() {
    LanguageProfile profile;
    profile.name = "shell";
    profile.image = "host";
    profile.command = "/bin/sh tests/check.sh";
    profile.report_format = ReportFormat::STDOUT;
    profile.extensions = {".sh"};
    return profile;
}

// Full pipeline on the host runtime with problems read from disk
class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        base = fs::temp_directory_path() / ("gradebox_e2e_" + FileUtils::random_hex(4));
        write("problems/add/problem.json", R"({"language": "shell", "timeout_seconds": 2})");
        write("problems/add/tests/check.sh", CHECK_SCRIPT);

        languages.register_language(shell_language());
        notifier.subscribe([this](const EvaluationCompleted& e) { record(e); });

        NativeRuntimeOptions native;
        native.require_namespaces = false;
        native.drop_privileges = false;
        runtime = std::make_unique<NativeRuntime>(native);
        images = std::make_unique<ImageRegistry>(*runtime);
        executor = std::make_unique<SandboxExecutor>(*runtime, *images);
        workspaces = std::make_unique<WorkspaceManager>((base / "jobs").string());
        catalog = std::make_unique<DirectoryProblemCatalog>((base / "problems").string());

        PipelineOptions options;
        options.worker_count = 2;
        pipeline = std::make_unique<SubmissionPipeline>(*catalog, store, languages, validator,
                                                        *workspaces, *executor, notifier, options);
        pipeline->start();
    }

    void TearDown() override {
        pipeline.reset();
        fs::remove_all(base);
    }

    void write(const std::string& relative, const std::string& content) {
        fs::path path = base / relative;
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    // Submit and block until the evaluation completes
    Submission evaluate(const std::string& solution) {
        std::string id = pipeline->create_submission("student", "add", {{"solution.sh", solution}});
        std::unique_lock<std::mutex> lock(completed_mutex);
        bool done = completed_cv.wait_for(lock, std::chrono::seconds(30),
                                          [&] { return completed.count(id) > 0; });
        EXPECT_TRUE(done) << id << " did not complete";
        return pipeline->get_submission(id);
    }

    void record(const EvaluationCompleted& event) {
        std::lock_guard<std::mutex> lock(completed_mutex);
        completed.insert(event.submission_id);
        completed_cv.notify_all();
    }

    fs::path base;
    LanguageRegistry languages;
    SecurityValidator validator;
    InMemorySubmissionStore store;
    CompletionNotifier notifier;
    std::mutex completed_mutex;
    std::condition_variable completed_cv;
    std::set<std::string> completed;
    std::unique_ptr<NativeRuntime> runtime;
    std::unique_ptr<ImageRegistry> images;
    std::unique_ptr<SandboxExecutor> executor;
    std::unique_ptr<WorkspaceManager> workspaces;
    std::unique_ptr<DirectoryProblemCatalog> catalog;
    std::unique_ptr<SubmissionPipeline> pipeline;
};

TEST_F(EndToEndTest, CorrectSolutionScoresFull) {
    Submission s = evaluate("add() { echo $(($1 + $2)); }\n");

    EXPECT_EQ(s.status, SubmissionStatus::SUCCESS) << s.feedback->output_excerpt;
    EXPECT_EQ(s.score, 100);
    EXPECT_EQ(s.feedback->outcome.total, 4);
    EXPECT_EQ(s.feedback->message, "All tests passed");
}

TEST_F(EndToEndTest, PartialSolutionFailsWithPartialScore) {
    // Wrong whenever the second operand is negative
    Submission s = evaluate("add() { if [ $2 -lt 0 ]; then echo 0; else echo $(($1 + $2)); fi; }\n");

    EXPECT_EQ(s.status, SubmissionStatus::FAILED);
    EXPECT_EQ(s.score, 75);
    ASSERT_EQ(s.feedback->outcome.cases.size(), 4u);
    EXPECT_FALSE(s.feedback->outcome.cases[1].passed);
    EXPECT_EQ(s.feedback->outcome.cases[1].message, "expected 6");
}

TEST_F(EndToEndTest, InfiniteLoopTimesOut) {
    Submission s = evaluate("while true; do :; done\n");

    EXPECT_EQ(s.status, SubmissionStatus::TIMED_OUT);
    EXPECT_EQ(s.score, 0);
    EXPECT_EQ(s.feedback->exit_code, -1);
}

TEST_F(EndToEndTest, WorkspacesAreRemovedAfterEvaluation) {
    evaluate("add() { echo $(($1 + $2)); }\n");
    evaluate("exit 1\n");

    size_t remaining = 0;
    for (const auto& entry : fs::directory_iterator(base / "jobs")) {
        (void)entry;
        remaining++;
    }
    EXPECT_EQ(remaining, 0u);
}

} // namespace
} // namespace gradebox
