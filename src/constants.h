#pragma once

#include <cstddef>  // for size_t

namespace gradebox {

// Memory limits
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 512 * 1024 * 1024;  // 512MB, swap ceiling is the same
constexpr size_t DEFAULT_TMPFS_BYTES = 64 * 1024 * 1024;           // 64MB /tmp inside the sandbox
constexpr size_t MAX_STREAM_CAPTURE = 1024 * 1024;                  // 1MB per stdout/stderr
constexpr size_t MAX_OUTPUT_EXCERPT = 4096;                        // Feedback excerpt
constexpr size_t MAX_REPORT_SIZE = 8 * 1024 * 1024;                // Structured report file

// Submission payload limits
constexpr size_t MAX_PAYLOAD_BYTES = 2 * 1024 * 1024;              // 2MB of source in total
constexpr size_t MAX_FILES_PER_SUBMISSION = 64;
constexpr size_t MAX_PATH_LENGTH = 255;

// Result limits
constexpr int MAX_REPORTED_TESTS = 1000000;                        // Per count in a report
constexpr size_t MAX_SCANNED_LINE = 4096;                          // Denylist line length

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 30;
constexpr int IMAGE_BUILD_TIMEOUT_SECONDS = 900;                   // 15 minutes
constexpr int DOCKER_REQUEST_TIMEOUT_SECONDS = 30;
constexpr int KILL_GRACE_MILLISECONDS = 5000;                      // Wait after SIGKILL

// Process limits
constexpr double DEFAULT_CPU_SHARE = 1.0;                          // Cores
constexpr int MAX_PROCESSES_PER_JOB = 64;
constexpr int MAX_OPEN_FILES = 256;
constexpr size_t MAX_FILE_SIZE_BYTES = 64 * 1024 * 1024;

// Non-root execution user (nobody:nogroup)
constexpr unsigned SANDBOX_UID = 65534;
constexpr unsigned SANDBOX_GID = 65534;

// Scheduling
constexpr int DEFAULT_WORKER_COUNT = 4;
constexpr size_t DEFAULT_QUEUE_CAPACITY = 256;
constexpr int DEFAULT_PERSIST_ATTEMPTS = 2;                        // First try + one retry
constexpr int PERSIST_RETRY_DELAY_MILLISECONDS = 200;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;
constexpr size_t INITIAL_HTTP_BUFFER = 8192;
constexpr size_t DOCKER_FRAME_HEADER_SIZE = 8;

// Paths
constexpr const char* DEFAULT_WORKSPACE_ROOT = "/tmp/gradebox_jobs";
constexpr const char* DEFAULT_DOCKER_SOCKET = "/var/run/docker.sock";
constexpr const char* SANDBOX_MOUNT_POINT = "/workspace";

} // namespace gradebox
