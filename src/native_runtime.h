#pragma once

#include "container_runtime.h"

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <sys/types.h>

namespace gradebox {

struct NativeRuntimeOptions {
    bool require_namespaces = true;   // Refuse to run when user/net namespaces are unavailable
    bool drop_privileges = true;      // Switch to SANDBOX_UID/GID when started as root
    bool enable_seccomp = true;
};

// Runs the container command as a local process group instead of a Docker
// container: fork, new user and network namespaces, rlimits, a seccomp
// denylist and no-new-privs. Images are ignored; the host toolchain is used.
// Weaker than the Docker runtime; meant for development hosts and tests.
class NativeRuntime : public ContainerRuntime {
public:
    explicit NativeRuntime(const NativeRuntimeOptions& options = NativeRuntimeOptions());
    ~NativeRuntime() override;

    bool has_image(const std::string& tag) override;
    void build_image(const std::string& tag, const std::string& dockerfile) override;

    std::string create(const ContainerSpec& spec) override;
    void start(const std::string& container_id) override;
    void stream_logs(const std::string& container_id, LogSink& sink) override;
    WaitResult wait(const std::string& container_id,
                    std::chrono::milliseconds timeout) override;
    void kill(const std::string& container_id) override;
    void remove(const std::string& container_id) override;
    size_t peak_memory(const std::string& container_id) override;

private:
    struct Process {
        ContainerSpec spec;
        pid_t pid = -1;
        int stdout_fd = -1;
        int stderr_fd = -1;
        bool reaped = false;
        int exit_code = -1;
        size_t peak_memory_bytes = 0;
    };

    std::shared_ptr<Process> lookup(const std::string& container_id);

    // Non-blocking unless block is set. Caller holds mutex_.
    bool reap(Process& process, bool block);

    // Runs in the forked child, never returns
    [[noreturn]] void exec_child(const Process& process, int stdout_write, int stderr_write,
                                 char* const* argv, char* const* envp);

    NativeRuntimeOptions options_;
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Process>> processes_;
    std::atomic<unsigned long> next_id_{1};
};

} // namespace gradebox
