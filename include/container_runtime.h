#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <cstddef>

namespace gradebox {

// Everything a runtime needs to create one hardened container
struct ContainerSpec {
    std::string name;                      // Execution id, used for labels and logs
    std::string image;
    std::vector<std::string> command;      // argv, usually {"/bin/sh", "-c", "..."}
    std::string workspace_host_path;       // Bound read-write at mount_point
    std::string mount_point = "/workspace";
    std::map<std::string, std::string> env;

    size_t memory_bytes = 0;
    size_t memory_swap_bytes = 0;          // Equal to memory_bytes: no swap
    double cpus = 1.0;
    int cpu_time_seconds = 0;              // CPU-time ceiling where supported, 0 for none
    int pids_limit = 64;
    size_t tmpfs_bytes = 0;
    bool network_disabled = true;
    bool drop_all_capabilities = true;
    bool no_new_privileges = true;
    bool read_only_rootfs = true;
    std::string user;                      // "uid:gid", never root
};

struct WaitResult {
    bool exited = false;                   // false: timeout elapsed first
    int exit_code = -1;
};

// Receives demultiplexed output. Calls for one container come from a single
// thread; stdout and stderr are never merged.
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void on_stdout(const char* data, size_t len) = 0;
    virtual void on_stderr(const char* data, size_t len) = 0;
};

// Container runtime client. One instance is shared by every worker, so
// implementations must be safe to call concurrently for different ids.
// Failures are reported as SandboxError.
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    virtual bool has_image(const std::string& tag) = 0;
    virtual void build_image(const std::string& tag, const std::string& dockerfile) = 0;

    // Returns the runtime's container id
    virtual std::string create(const ContainerSpec& spec) = 0;
    virtual void start(const std::string& container_id) = 0;

    // Blocks until both streams are closed
    virtual void stream_logs(const std::string& container_id, LogSink& sink) = 0;

    virtual WaitResult wait(const std::string& container_id,
                            std::chrono::milliseconds timeout) = 0;
    virtual void kill(const std::string& container_id) = 0;

    // Force removal. Removing an unknown or already removed id is not an error.
    virtual void remove(const std::string& container_id) = 0;

    // Best effort, 0 when the runtime cannot tell
    virtual size_t peak_memory(const std::string& container_id) = 0;
};

} // namespace gradebox
