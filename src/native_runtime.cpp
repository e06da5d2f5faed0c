#include "native_runtime.h"
#include "constants.h"
#include "errors.h"

#include <seccomp.h>

#include <sys/wait.h>
#include <sys/resource.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <linux/capability.h>
#include <grp.h>
#include <poll.h>
#include <fcntl.h>
#include <sched.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>
#include <iostream>

namespace gradebox {

namespace {

constexpr const char* DEFAULT_PATH = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
constexpr auto WAIT_POLL_INTERVAL = std::chrono::milliseconds(10);

// Child-side failure: report on the captured stderr and exit 126
[[noreturn]] void child_fail(const char* what) {
    const char* reason = strerror(errno);
    (void)!write(STDERR_FILENO, "gradebox sandbox: ", 18);
    (void)!write(STDERR_FILENO, what, strlen(what));
    (void)!write(STDERR_FILENO, ": ", 2);
    (void)!write(STDERR_FILENO, reason, strlen(reason));
    (void)!write(STDERR_FILENO, "\n", 1);
    _exit(126);
}

bool write_proc_file(const char* path, const std::string& content) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    bool ok = write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size());
    close(fd);
    return ok;
}

void set_limit(int resource, rlim_t value, const char* name) {
    struct rlimit limit;
    limit.rlim_cur = limit.rlim_max = value;
    if (setrlimit(resource, &limit) != 0) {
        child_fail(name);
    }
}

// Denylist: everything is allowed except syscalls that escape or
// reconfigure the sandbox, and IP sockets when the network is off.
// setsid/setpgid would let a process leave the group that kill() targets.
void install_seccomp(bool deny_network) {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) {
        child_fail("seccomp_init");
    }

    const int denied[] = {
        SCMP_SYS(ptrace), SCMP_SYS(process_vm_readv), SCMP_SYS(process_vm_writev),
        SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root), SCMP_SYS(chroot),
        SCMP_SYS(setns), SCMP_SYS(unshare), SCMP_SYS(setsid), SCMP_SYS(setpgid),
        SCMP_SYS(init_module), SCMP_SYS(finit_module), SCMP_SYS(delete_module),
        SCMP_SYS(reboot), SCMP_SYS(kexec_load), SCMP_SYS(swapon), SCMP_SYS(swapoff),
        SCMP_SYS(bpf), SCMP_SYS(perf_event_open), SCMP_SYS(keyctl), SCMP_SYS(add_key),
        SCMP_SYS(request_key)
    };
    for (int syscall : denied) {
        if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), syscall, 0) < 0) {
            seccomp_release(ctx);
            child_fail("seccomp_rule_add");
        }
    }

    if (deny_network) {
        const int families[] = {AF_INET, AF_INET6, AF_PACKET};
        for (int family : families) {
            if (seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EACCES), SCMP_SYS(socket), 1,
                                 SCMP_A0(SCMP_CMP_EQ, static_cast<scmp_datum_t>(family))) < 0) {
                seccomp_release(ctx);
                child_fail("seccomp_rule_add(socket)");
            }
        }
    }

    if (seccomp_load(ctx) < 0) {
        seccomp_release(ctx);
        child_fail("seccomp_load");
    }
    seccomp_release(ctx);
}

} // namespace

NativeRuntime::NativeRuntime(const NativeRuntimeOptions& options) : options_(options) {}

NativeRuntime::~NativeRuntime() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, _] : processes_) {
            ids.push_back(id);
        }
    }
    for (const auto& id : ids) {
        try {
            remove(id);
        } catch (const std::exception& e) {
            std::cerr << "[Native] Failed to remove " << id << ": " << e.what() << std::endl;
        }
    }
}

bool NativeRuntime::has_image(const std::string&) {
    return true;
}

void NativeRuntime::build_image(const std::string& tag, const std::string&) {
    std::cout << "[Native] Image " << tag << " ignored, using host toolchain" << std::endl;
}

std::string NativeRuntime::create(const ContainerSpec& spec) {
    if (spec.command.empty()) {
        throw SandboxError("empty command for " + spec.name);
    }
    if (access(spec.workspace_host_path.c_str(), F_OK) != 0) {
        throw SandboxError("workspace does not exist: " + spec.workspace_host_path);
    }

    auto process = std::make_shared<Process>();
    process->spec = spec;
    std::string id = "native_" + std::to_string(next_id_++);

    std::lock_guard<std::mutex> lock(mutex_);
    processes_[id] = process;
    return id;
}

std::shared_ptr<NativeRuntime::Process> NativeRuntime::lookup(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(container_id);
    if (it == processes_.end()) {
        throw SandboxError("no such container: " + container_id);
    }
    return it->second;
}

void NativeRuntime::start(const std::string& container_id) {
    auto process = lookup(container_id);
    const ContainerSpec& spec = process->spec;

    // Everything the child needs is built before fork
    std::vector<std::string> args = spec.command;
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::map<std::string, std::string> env_map = {
        {"PATH", DEFAULT_PATH},
        {"HOME", "/tmp"},
        {"LANG", "C.UTF-8"},
        {"GRADEBOX_WORKSPACE", spec.workspace_host_path}
    };
    for (const auto& [key, value] : spec.env) {
        env_map[key] = value;
    }
    std::vector<std::string> env_strings;
    for (const auto& [key, value] : env_map) {
        env_strings.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : env_strings) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
        throw SandboxError(std::string("pipe failed: ") + strerror(errno));
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        int saved = errno;
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        throw SandboxError(std::string("pipe failed: ") + strerror(saved));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (process->pid > 0) {
        for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1]}) close(fd);
        throw SandboxError("container already started: " + container_id);
    }

    pid_t pid = fork();
    if (pid == -1) {
        int saved = errno;
        for (int fd : {stdout_pipe[0], stdout_pipe[1], stderr_pipe[0], stderr_pipe[1]}) close(fd);
        throw SandboxError(std::string("fork failed: ") + strerror(saved));
    }

    if (pid == 0) {
        exec_child(*process, stdout_pipe[1], stderr_pipe[1], argv.data(), envp.data());
    }

    // Parent process
    setpgid(pid, pid);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    process->pid = pid;
    process->stdout_fd = stdout_pipe[0];
    process->stderr_fd = stderr_pipe[0];
    std::cout << "[Native] Started " << spec.name << " as pid " << pid << std::endl;
}

void NativeRuntime::exec_child(const Process& process, int stdout_write, int stderr_write,
                               char* const* argv, char* const* envp) {
    const ContainerSpec& spec = process.spec;

    // Own process group so kill() reaches every descendant
    setpgid(0, 0);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull < 0 || dup2(devnull, STDIN_FILENO) < 0 ||
        dup2(stdout_write, STDOUT_FILENO) < 0 || dup2(stderr_write, STDERR_FILENO) < 0) {
        _exit(126);
    }

    uid_t uid = getuid();
    gid_t gid = getgid();
    bool is_root = geteuid() == 0;

    // Network namespace; unprivileged callers need a user namespace first
    int ns_flags = 0;
    if (spec.network_disabled) ns_flags |= CLONE_NEWNET;
    if (!is_root) ns_flags |= CLONE_NEWUSER;
    if (ns_flags != 0) {
        if (unshare(ns_flags) == 0) {
            if (ns_flags & CLONE_NEWUSER) {
                std::string uid_map = std::to_string(uid) + " " + std::to_string(uid) + " 1\n";
                std::string gid_map = std::to_string(gid) + " " + std::to_string(gid) + " 1\n";
                if (!write_proc_file("/proc/self/setgroups", "deny") ||
                    !write_proc_file("/proc/self/uid_map", uid_map) ||
                    !write_proc_file("/proc/self/gid_map", gid_map)) {
                    child_fail("user namespace id mapping");
                }
            }
        } else if (options_.require_namespaces) {
            child_fail("unshare");
        }
    }

    if (spec.memory_bytes > 0) {
        set_limit(RLIMIT_AS, spec.memory_bytes, "RLIMIT_AS");
    }
    if (spec.cpu_time_seconds > 0) {
        set_limit(RLIMIT_CPU, static_cast<rlim_t>(spec.cpu_time_seconds), "RLIMIT_CPU");
    }
    set_limit(RLIMIT_FSIZE, MAX_FILE_SIZE_BYTES, "RLIMIT_FSIZE");
    set_limit(RLIMIT_NOFILE, MAX_OPEN_FILES, "RLIMIT_NOFILE");
    set_limit(RLIMIT_CORE, 0, "RLIMIT_CORE");

    if (is_root && options_.drop_privileges) {
        // RLIMIT_NPROC counts per real uid, so it only bounds the sandbox user
        set_limit(RLIMIT_NPROC, static_cast<rlim_t>(spec.pids_limit), "RLIMIT_NPROC");

        if (spec.drop_all_capabilities) {
            for (int cap = 0; cap <= CAP_LAST_CAP; ++cap) {
                // EINVAL past the kernel's last cap; EPERM without CAP_SETPCAP
                if (prctl(PR_CAPBSET_DROP, cap, 0, 0, 0) != 0 && errno != EINVAL && errno != EPERM) {
                    child_fail("PR_CAPBSET_DROP");
                }
            }
        }
        if (setgroups(0, nullptr) != 0) child_fail("setgroups");
        if (setgid(SANDBOX_GID) != 0) child_fail("setgid");
        if (setuid(SANDBOX_UID) != 0) child_fail("setuid");
    }

    if (chdir(spec.workspace_host_path.c_str()) != 0) {
        child_fail("chdir");
    }

    if ((spec.no_new_privileges || options_.enable_seccomp) &&
        prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        child_fail("PR_SET_NO_NEW_PRIVS");
    }

    if (options_.enable_seccomp) {
        install_seccomp(spec.network_disabled);
    }

    execvpe(argv[0], argv, envp);
    child_fail("execvpe");
}

void NativeRuntime::stream_logs(const std::string& container_id, LogSink& sink) {
    auto process = lookup(container_id);

    struct pollfd fds[2];
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (process->pid <= 0) {
            throw SandboxError("container not started: " + container_id);
        }
        // Streaming owns the read ends from here on
        fds[0].fd = process->stdout_fd;
        fds[1].fd = process->stderr_fd;
        process->stdout_fd = -1;
        process->stderr_fd = -1;
    }
    fds[0].events = fds[1].events = POLLIN;

    char buffer[PIPE_BUFFER_SIZE];
    std::string failure;
    while (failure.empty() && (fds[0].fd >= 0 || fds[1].fd >= 0)) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            failure = std::string("poll failed: ") + strerror(errno);
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                if (i == 0) {
                    sink.on_stdout(buffer, static_cast<size_t>(n));
                } else {
                    sink.on_stderr(buffer, static_cast<size_t>(n));
                }
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;   // poll ignores negative fds
            }
        }
    }

    for (auto& pfd : fds) {
        if (pfd.fd >= 0) close(pfd.fd);
    }
    if (!failure.empty()) {
        throw SandboxError(failure);
    }
}

bool NativeRuntime::reap(Process& process, bool block) {
    if (process.reaped) {
        return true;
    }
    if (process.pid <= 0) {
        return false;
    }

    // Peek first: while the leader is an unreaped zombie its pid cannot be
    // reused, so the group kill below only reaches leftover descendants.
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    int peek;
    do {
        peek = waitid(P_PID, static_cast<id_t>(process.pid), &info,
                      WEXITED | WNOWAIT | (block ? 0 : WNOHANG));
    } while (peek < 0 && errno == EINTR);
    if (peek == 0 && info.si_pid == 0) {
        return false;
    }
    if (peek == 0) {
        killpg(process.pid, SIGKILL);
    }

    int status = 0;
    struct rusage usage;
    std::memset(&usage, 0, sizeof(usage));
    pid_t result;
    do {
        result = wait4(process.pid, &status, block ? 0 : WNOHANG, &usage);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return false;
    }

    process.reaped = true;
    if (result < 0) {
        // Already collected elsewhere
        process.exit_code = -1;
        return true;
    }
    if (WIFEXITED(status)) {
        process.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        process.exit_code = 128 + WTERMSIG(status);
    }
    process.peak_memory_bytes = static_cast<size_t>(usage.ru_maxrss) * 1024;  // ru_maxrss is KB
    return true;
}

WaitResult NativeRuntime::wait(const std::string& container_id, std::chrono::milliseconds timeout) {
    auto process = lookup(container_id);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    WaitResult result;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (process->pid <= 0) {
                throw SandboxError("container not started: " + container_id);
            }
            if (reap(*process, false)) {
                result.exited = true;
                result.exit_code = process->exit_code;
                return result;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return result;
        }
        std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
    }
}

void NativeRuntime::kill(const std::string& container_id) {
    auto process = lookup(container_id);
    std::lock_guard<std::mutex> lock(mutex_);
    if (process->pid > 0 && !process->reaped) {
        if (killpg(process->pid, SIGKILL) != 0 && errno != ESRCH) {
            throw SandboxError("kill failed for " + container_id + ": " + strerror(errno));
        }
    }
}

void NativeRuntime::remove(const std::string& container_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(container_id);
    if (it == processes_.end()) {
        return;
    }
    std::shared_ptr<Process> process = it->second;
    processes_.erase(it);

    if (process->pid > 0 && !process->reaped) {
        killpg(process->pid, SIGKILL);
        reap(*process, true);
    }
    if (process->stdout_fd >= 0) close(process->stdout_fd);
    if (process->stderr_fd >= 0) close(process->stderr_fd);
    process->stdout_fd = process->stderr_fd = -1;
}

size_t NativeRuntime::peak_memory(const std::string& container_id) {
    auto process = lookup(container_id);
    std::lock_guard<std::mutex> lock(mutex_);
    return process->peak_memory_bytes;
}

} // namespace gradebox
