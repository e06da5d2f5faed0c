/*
 * Gradebox - Sandboxed evaluation of submitted code
 * Submits files for one problem and prints the graded feedback
 */

#include "config.h"
#include "pipeline.h"
#include "problem_catalog.h"
#include "memory_store.h"
#include "docker_client.h"
#include "native_runtime.h"
#include "image_registry.h"
#include "file_utils.h"
#include "errors.h"

#include <json/json.h>

#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <filesystem>
#include <cstdlib>

using namespace gradebox;
namespace fs = std::filesystem;

namespace {

constexpr int EXIT_USAGE = 2;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " --problems DIR --problem ID --file PATH[=NAME]... [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE        JSON engine configuration\n"
              << "  --problems DIR       Problem catalog directory\n"
              << "  --problem ID         Problem to submit against\n"
              << "  --file PATH[=NAME]   Solution file, stored as NAME (default: file name)\n"
              << "  --user ID            Submitting user (default: local)\n"
              << "  --runtime NAME       docker or native\n"
              << "  --workers N          Concurrent evaluations\n"
              << "  --timeout SECONDS    Wall-clock limit per execution\n"
              << "\n"
              << "Exit status: 0 when every stage succeeds, 1 for any other result,\n"
              << "2 on usage or configuration errors." << std::endl;
}

// Positive integer option value, or -1
long parse_positive(const std::string& value) {
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || parsed <= 0) {
        return -1;
    }
    return parsed;
}

Json::Value feedback_to_json(const Submission& submission) {
    Json::Value root;
    root["submission_id"] = submission.id;
    root["problem_id"] = submission.problem_id;
    root["language"] = submission.language;
    root["status"] = status_to_string(submission.status);
    if (submission.score) {
        root["score"] = *submission.score;
    }

    if (submission.feedback) {
        const SubmissionFeedback& feedback = *submission.feedback;
        root["message"] = feedback.message;
        root["pass_rate"] = feedback.pass_rate;
        root["total"] = feedback.outcome.total;
        root["passed"] = feedback.outcome.passed;
        root["failed"] = feedback.outcome.failed;
        root["exit_code"] = feedback.exit_code;
        root["duration_ms"] = static_cast<Json::Int64>(feedback.duration_ms);
        root["memory_bytes"] = static_cast<Json::UInt64>(feedback.memory_bytes);
        root["fingerprint"] = feedback.fingerprint;

        Json::Value tests(Json::arrayValue);
        for (const auto& test_case : feedback.outcome.cases) {
            Json::Value item;
            item["name"] = test_case.name;
            item["passed"] = test_case.passed;
            if (!test_case.message.empty()) {
                item["message"] = test_case.message;
            }
            tests.append(item);
        }
        root["tests"] = tests;
        root["output"] = feedback.output_excerpt;
    }
    return root;
}

// Waits for the completion event of one submission
class CompletionWaiter {
public:
    void on_completed(const EvaluationCompleted& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        completed_[event.submission_id] = event.status;
        done_.notify_all();
    }

    SubmissionStatus wait_for(const std::string& submission_id) {
        std::unique_lock<std::mutex> lock(mutex_);
        done_.wait(lock, [&] { return completed_.count(submission_id) > 0; });
        return completed_[submission_id];
    }

private:
    std::mutex mutex_;
    std::condition_variable done_;
    std::map<std::string, SubmissionStatus> completed_;
};

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    std::string problems_dir;
    std::string problem_id;
    std::string user_id = "local";
    std::string runtime_override;
    long workers_override = -1;
    long timeout_override = -1;
    std::vector<std::string> file_args;

    // Parse command line
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && has_value) {
            config_file = argv[++i];
        } else if (arg == "--problems" && has_value) {
            problems_dir = argv[++i];
        } else if (arg == "--problem" && has_value) {
            problem_id = argv[++i];
        } else if (arg == "--file" && has_value) {
            file_args.push_back(argv[++i]);
        } else if (arg == "--user" && has_value) {
            user_id = argv[++i];
        } else if (arg == "--runtime" && has_value) {
            runtime_override = argv[++i];
        } else if (arg == "--workers" && has_value) {
            workers_override = parse_positive(argv[++i]);
            if (workers_override < 0) {
                std::cerr << "--workers needs a positive integer" << std::endl;
                return EXIT_USAGE;
            }
        } else if (arg == "--timeout" && has_value) {
            timeout_override = parse_positive(argv[++i]);
            if (timeout_override < 0) {
                std::cerr << "--timeout needs a positive number of seconds" << std::endl;
                return EXIT_USAGE;
            }
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_USAGE;
        }
    }

    if (problems_dir.empty() || problem_id.empty() || file_args.empty()) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    EngineConfig config;
    FileMap files;
    try {
        if (!config_file.empty()) {
            config = load_config(config_file);
        }
        if (!runtime_override.empty()) config.runtime = runtime_override;
        if (workers_override > 0) config.worker_count = static_cast<size_t>(workers_override);
        if (timeout_override > 0) config.limits.timeout = std::chrono::seconds(timeout_override);
        validate_config(config);

        for (const auto& arg : file_args) {
            auto eq = arg.find('=');
            std::string path = arg.substr(0, eq);
            std::string name = eq == std::string::npos ? fs::path(path).filename().string()
                                                       : arg.substr(eq + 1);
            files[name] = FileUtils::read_file(path, config.validator.max_payload_bytes);
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_USAGE;
    }

    std::unique_ptr<ContainerRuntime> runtime;
    if (config.runtime == "native") {
        runtime = std::make_unique<NativeRuntime>(config.native);
    } else {
        auto docker = std::make_unique<DockerClient>(config.docker_socket);
        if (!docker->ping()) {
            std::cerr << "[Docker] Daemon not reachable at " << config.docker_socket << std::endl;
            return 1;
        }
        runtime = std::move(docker);
    }

    LanguageRegistry languages;
    for (const auto& profile : config.languages) {
        languages.register_language(profile);
    }

    DirectoryProblemCatalog problems(problems_dir);
    InMemorySubmissionStore store;
    SecurityValidator validator(config.validator);
    WorkspaceManager workspaces(config.workspace_root);
    ImageRegistry images(*runtime);
    SandboxExecutor executor(*runtime, images);
    CompletionNotifier notifier;

    CompletionWaiter waiter;
    notifier.subscribe([&waiter](const EvaluationCompleted& event) { waiter.on_completed(event); });

    PipelineOptions options;
    options.limits = config.limits;
    options.worker_count = config.worker_count;
    options.queue_capacity = config.queue_capacity;
    options.persist_attempts = config.persist_attempts;
    options.output_excerpt_bytes = config.output_excerpt_bytes;

    SubmissionPipeline pipeline(problems, store, languages, validator, workspaces,
                                executor, notifier, options);

    std::string submission_id;
    try {
        pipeline.start();
        submission_id = pipeline.create_submission(user_id, problem_id, files);
    } catch (const NotFoundError& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    SubmissionStatus status = waiter.wait_for(submission_id);
    pipeline.shutdown();

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    std::cout << Json::writeString(writer, feedback_to_json(pipeline.get_submission(submission_id)))
              << std::endl;

    return status == SubmissionStatus::SUCCESS ? 0 : 1;
}
