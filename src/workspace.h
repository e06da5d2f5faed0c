#pragma once

#include "submission.h"

#include <string>
#include <filesystem>

namespace gradebox {

// Directory inside every workspace where runners write their reports
constexpr const char* REPORT_DIR = ".gradebox";

// Owns one staged workspace directory. Move-only; the directory is removed
// by dispose() or, failing that, by the destructor.
class WorkspaceHandle {
public:
    WorkspaceHandle() = default;
    WorkspaceHandle(std::string execution_id, std::filesystem::path path);
    ~WorkspaceHandle();

    WorkspaceHandle(WorkspaceHandle&& other) noexcept;
    WorkspaceHandle& operator=(WorkspaceHandle&& other) noexcept;
    WorkspaceHandle(const WorkspaceHandle&) = delete;
    WorkspaceHandle& operator=(const WorkspaceHandle&) = delete;

    const std::string& execution_id() const { return execution_id_; }
    const std::filesystem::path& path() const { return path_; }
    bool active() const { return !path_.empty(); }

    // Remove the directory. Idempotent; throws WorkspaceError if removal fails.
    void dispose();

private:
    std::string execution_id_;
    std::filesystem::path path_;
};

// Materializes submission files into disposable per-execution directories
class WorkspaceManager {
public:
    explicit WorkspaceManager(const std::string& root_dir);

    // Create <root>/<execution_id> and write files into it.
    // Throws WorkspaceError on I/O failure, unsafe paths or an id collision;
    // nothing is left on disk in that case.
    WorkspaceHandle stage(const std::string& execution_id, const FileMap& files);

    void dispose(WorkspaceHandle& handle);

    // Remove workspaces left behind by a previous process. Returns the count.
    size_t cleanup_stale();

    const std::filesystem::path& root() const { return root_; }

private:
    void write_file(const std::filesystem::path& workspace,
                    const std::string& relative_path,
                    const std::string& content);

    std::filesystem::path root_;
};

} // namespace gradebox
