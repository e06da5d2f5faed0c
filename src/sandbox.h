#pragma once

#include "container_runtime.h"
#include "image_registry.h"
#include "language_registry.h"
#include "workspace.h"
#include "constants.h"

#include <string>
#include <map>
#include <chrono>

namespace gradebox {

// Per-execution resource ceilings. Network isolation, dropping every
// capability and disabling privilege escalation are not configurable.
struct ExecutionLimits {
    size_t memory_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    size_t memory_swap_bytes = DEFAULT_MEMORY_LIMIT_BYTES;  // Equal to memory: no swap
    double cpus = DEFAULT_CPU_SHARE;
    std::chrono::milliseconds timeout = std::chrono::seconds(DEFAULT_TIMEOUT_SECONDS);
    int pids_limit = MAX_PROCESSES_PER_JOB;
    size_t tmpfs_bytes = DEFAULT_TMPFS_BYTES;
    std::string user = std::to_string(SANDBOX_UID) + ":" + std::to_string(SANDBOX_GID);
    size_t max_stream_bytes = MAX_STREAM_CAPTURE;           // Per stdout/stderr
};

enum class ExecutionStatus {
    SUCCESS,        // Exit code 0
    FAILED,         // Any other exit code
    TIMED_OUT,      // Killed at the wall-clock limit
    ERROR           // Infrastructure failure, see ExecutionResult::error
};

std::string execution_status_to_string(ExecutionStatus status);

struct ExecutionResult {
    std::string execution_id;
    std::string stdout_output;
    std::string stderr_output;
    int exit_code = -1;                                     // -1 on timeout or error
    ExecutionStatus status = ExecutionStatus::ERROR;
    std::chrono::milliseconds duration{0};
    size_t memory_bytes = 0;                                // Best effort, 0 if unknown
    std::string error;
    std::map<std::string, std::string> report_files;       // Relative path -> content
};

// Accumulates one container's output with a byte cap per stream
class CaptureSink : public LogSink {
public:
    explicit CaptureSink(size_t max_bytes_per_stream);

    void on_stdout(const char* data, size_t len) override;
    void on_stderr(const char* data, size_t len) override;

    // Captured text with a truncation marker when bytes were dropped
    std::string stdout_text() const;
    std::string stderr_text() const;

    size_t stdout_dropped() const { return stdout_dropped_; }
    size_t stderr_dropped() const { return stderr_dropped_; }

private:
    void append(std::string& buffer, size_t& dropped, const char* data, size_t len);
    std::string finish(const std::string& buffer, size_t dropped) const;

    size_t max_bytes_;
    std::string stdout_;
    std::string stderr_;
    size_t stdout_dropped_ = 0;
    size_t stderr_dropped_ = 0;
};

// Runs one staged workspace in a fresh hardened container and always
// removes the container afterwards. Never throws: every failure becomes
// an ERROR result.
class SandboxExecutor {
public:
    SandboxExecutor(ContainerRuntime& runtime, ImageRegistry& images);

    ExecutionResult execute(const std::string& execution_id,
                            const LanguageProfile& language,
                            const WorkspaceHandle& workspace,
                            const std::string& command,
                            const ExecutionLimits& limits);

    // Container settings for one execution
    static ContainerSpec build_spec(const std::string& execution_id,
                                    const std::string& image,
                                    const WorkspaceHandle& workspace,
                                    const std::string& command,
                                    const ExecutionLimits& limits);

    // Report files the run left in the workspace. Symlinks are never followed.
    static std::map<std::string, std::string> collect_reports(const WorkspaceHandle& workspace,
                                                              const std::string& pattern);

private:
    ContainerRuntime& runtime_;
    ImageRegistry& images_;
};

} // namespace gradebox
