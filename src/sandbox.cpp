#include "sandbox.h"
#include "file_utils.h"
#include "errors.h"

#include <thread>
#include <algorithm>
#include <iostream>
#include <filesystem>

namespace fs = std::filesystem;

namespace gradebox {

namespace {

// Removes the container exactly once, from whichever exit path gets there first
class ContainerGuard {
public:
    ContainerGuard(ContainerRuntime& runtime, const std::string& execution_id)
        : runtime_(runtime), execution_id_(execution_id) {}

    ~ContainerGuard() {
        try {
            remove();
        } catch (const std::exception& e) {
            std::cerr << "[Sandbox] " << execution_id_ << ": container removal failed: "
                      << e.what() << std::endl;
        }
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

    void adopt(const std::string& container_id) { container_id_ = container_id; }
    const std::string& id() const { return container_id_; }

    // Throws SandboxError from the runtime; never retries
    void remove() {
        if (container_id_.empty() || removed_) {
            return;
        }
        removed_ = true;
        runtime_.remove(container_id_);
        std::cout << "[Sandbox] " << execution_id_ << ": removed container" << std::endl;
    }

private:
    ContainerRuntime& runtime_;
    std::string execution_id_;
    std::string container_id_;
    bool removed_ = false;
};

} // namespace

std::string execution_status_to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::SUCCESS: return "success";
        case ExecutionStatus::FAILED: return "failed";
        case ExecutionStatus::TIMED_OUT: return "timed_out";
        case ExecutionStatus::ERROR: return "error";
    }
    return "error";
}

// CaptureSink

CaptureSink::CaptureSink(size_t max_bytes_per_stream) : max_bytes_(max_bytes_per_stream) {}

void CaptureSink::on_stdout(const char* data, size_t len) {
    append(stdout_, stdout_dropped_, data, len);
}

void CaptureSink::on_stderr(const char* data, size_t len) {
    append(stderr_, stderr_dropped_, data, len);
}

void CaptureSink::append(std::string& buffer, size_t& dropped, const char* data, size_t len) {
    size_t room = buffer.size() < max_bytes_ ? max_bytes_ - buffer.size() : 0;
    size_t take = std::min(room, len);
    buffer.append(data, take);
    dropped += len - take;
}

std::string CaptureSink::finish(const std::string& buffer, size_t dropped) const {
    if (dropped == 0) {
        return buffer;
    }
    return buffer + "\n... [truncated " + std::to_string(dropped) + " bytes]";
}

std::string CaptureSink::stdout_text() const {
    return finish(stdout_, stdout_dropped_);
}

std::string CaptureSink::stderr_text() const {
    return finish(stderr_, stderr_dropped_);
}

// SandboxExecutor

SandboxExecutor::SandboxExecutor(ContainerRuntime& runtime, ImageRegistry& images)
    : runtime_(runtime), images_(images) {}

ContainerSpec SandboxExecutor::build_spec(const std::string& execution_id,
                                          const std::string& image,
                                          const WorkspaceHandle& workspace,
                                          const std::string& command,
                                          const ExecutionLimits& limits) {
    ContainerSpec spec;
    spec.name = execution_id;
    spec.image = image;
    spec.command = {"/bin/sh", "-c", command};
    spec.workspace_host_path = fs::absolute(workspace.path()).string();
    spec.mount_point = SANDBOX_MOUNT_POINT;
    spec.env = {
        {"HOME", "/tmp"},
        {"GRADEBOX_EXECUTION_ID", execution_id},
        {"PYTHONDONTWRITEBYTECODE", "1"}
    };

    spec.memory_bytes = limits.memory_bytes;
    spec.memory_swap_bytes = limits.memory_swap_bytes;
    spec.cpus = limits.cpus;
    spec.cpu_time_seconds = static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(limits.timeout).count()) + 1;
    spec.pids_limit = limits.pids_limit;
    spec.tmpfs_bytes = limits.tmpfs_bytes;
    spec.user = limits.user;

    spec.network_disabled = true;
    spec.drop_all_capabilities = true;
    spec.no_new_privileges = true;
    spec.read_only_rootfs = true;
    return spec;
}

std::map<std::string, std::string> SandboxExecutor::collect_reports(const WorkspaceHandle& workspace,
                                                                    const std::string& pattern) {
    std::map<std::string, std::string> reports;
    if (pattern.empty() || !workspace.active()) {
        return reports;
    }

    // Fixed directory part of the pattern, e.g. ".gradebox/reports"
    size_t star = pattern.find('*');
    std::string fixed = pattern.substr(0, star == std::string::npos ? pattern.size() : star);
    size_t slash = fixed.rfind('/');
    std::string dir_prefix = slash == std::string::npos ? "" : fixed.substr(0, slash);
    std::string rel_pattern = dir_prefix.empty() ? pattern : pattern.substr(dir_prefix.size() + 1);

    // The sandboxed process controls the workspace: refuse to walk through symlinks
    fs::path base = workspace.path();
    for (const auto& part : fs::path(dir_prefix)) {
        base /= part;
        if (fs::is_symlink(base)) {
            std::cerr << "[Sandbox] Ignoring symlinked report directory: " << base << std::endl;
            return reports;
        }
    }

    for (auto& [path, content] : FileUtils::collect_files(base.string(), rel_pattern, MAX_REPORT_SIZE)) {
        reports[dir_prefix.empty() ? path : dir_prefix + "/" + path] = std::move(content);
    }
    return reports;
}

ExecutionResult SandboxExecutor::execute(const std::string& execution_id,
                                         const LanguageProfile& language,
                                         const WorkspaceHandle& workspace,
                                         const std::string& command,
                                         const ExecutionLimits& limits) {
    ExecutionResult result;
    result.execution_id = execution_id;

    CaptureSink sink(limits.max_stream_bytes);
    std::string log_error;
    std::thread log_thread;
    bool exited = false;

    // Declared after log_thread so it is destroyed first: removing the
    // container ends the log stream the thread is blocked on.
    ContainerGuard container(runtime_, execution_id);

    auto remove_container = [&]() {
        try {
            container.remove();
        } catch (const std::exception& e) {
            std::cerr << "[Sandbox] " << execution_id << ": container removal failed: "
                      << e.what() << std::endl;
            if (result.status == ExecutionStatus::SUCCESS || result.status == ExecutionStatus::FAILED) {
                result.status = ExecutionStatus::ERROR;
                result.exit_code = -1;
                result.error = std::string("container removal failed: ") + e.what();
            }
        }
    };

    try {
        std::string image = images_.resolve(language);

        container.adopt(runtime_.create(build_spec(execution_id, image, workspace, command, limits)));
        std::cout << "[Sandbox] " << execution_id << ": created container " << container.id()
                  << " from " << image << std::endl;

        auto started_at = std::chrono::steady_clock::now();
        runtime_.start(container.id());

        std::string container_id = container.id();
        log_thread = std::thread([this, container_id, &sink, &log_error]() {
            try {
                runtime_.stream_logs(container_id, sink);
            } catch (const std::exception& e) {
                log_error = e.what();
            }
        });

        WaitResult wait = runtime_.wait(container.id(), limits.timeout);
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at);

        if (wait.exited) {
            exited = true;
            result.exit_code = wait.exit_code;
            result.status = wait.exit_code == 0 ? ExecutionStatus::SUCCESS : ExecutionStatus::FAILED;
        } else {
            std::cout << "[Sandbox] " << execution_id << ": timed out after "
                      << limits.timeout.count() << " ms, killing" << std::endl;
            result.status = ExecutionStatus::TIMED_OUT;
            result.exit_code = -1;
            runtime_.kill(container.id());
            exited = runtime_.wait(container.id(),
                                   std::chrono::milliseconds(KILL_GRACE_MILLISECONDS)).exited;
        }

        result.memory_bytes = runtime_.peak_memory(container.id());
    } catch (const std::exception& e) {
        std::cerr << "[Sandbox] " << execution_id << ": " << e.what() << std::endl;
        result.status = ExecutionStatus::ERROR;
        result.exit_code = -1;
        result.error = e.what();
    }

    // Teardown
    if (log_thread.joinable()) {
        if (!exited) {
            remove_container();
        }
        log_thread.join();
    }
    remove_container();

    result.stdout_output = sink.stdout_text();
    result.stderr_output = sink.stderr_text();

    if (!log_error.empty() && result.status != ExecutionStatus::TIMED_OUT &&
        result.status != ExecutionStatus::ERROR) {
        result.status = ExecutionStatus::ERROR;
        result.error = "log stream failed: " + log_error;
    }

    if (result.status == ExecutionStatus::SUCCESS || result.status == ExecutionStatus::FAILED) {
        try {
            result.report_files = collect_reports(workspace, language.report_pattern);
        } catch (const std::exception& e) {
            std::cerr << "[Sandbox] " << execution_id << ": cannot read reports: " << e.what() << std::endl;
            result.status = ExecutionStatus::ERROR;
            result.error = std::string("cannot read test reports: ") + e.what();
        }
    }

    std::cout << "[Sandbox] " << execution_id << ": " << execution_status_to_string(result.status)
              << " (exit " << result.exit_code << ", " << result.duration.count() << " ms)" << std::endl;
    return result;
}

} // namespace gradebox
