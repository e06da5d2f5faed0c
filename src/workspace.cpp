#include "workspace.h"
#include "errors.h"
#include "constants.h"
#include "security_validator.h"
#include <fstream>
#include <iostream>
#include <cctype>

namespace fs = std::filesystem;

namespace gradebox {

namespace {

// Directories are world-writable so the unprivileged sandbox user can write
// reports; files are world-readable.
constexpr fs::perms DIR_PERMS = fs::perms::all;
constexpr fs::perms FILE_PERMS = fs::perms::owner_read | fs::perms::owner_write |
                                 fs::perms::group_read | fs::perms::others_read;

bool is_valid_execution_id(const std::string& id) {
    if (id.empty() || id.size() > 128) {
        return false;
    }
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

} // namespace

// WorkspaceHandle

WorkspaceHandle::WorkspaceHandle(std::string execution_id, fs::path path)
    : execution_id_(std::move(execution_id)), path_(std::move(path)) {}

WorkspaceHandle::~WorkspaceHandle() {
    try {
        dispose();
    } catch (const std::exception& e) {
        std::cerr << "[Workspace] Failed to remove " << path_ << ": " << e.what() << std::endl;
    }
}

WorkspaceHandle::WorkspaceHandle(WorkspaceHandle&& other) noexcept
    : execution_id_(std::move(other.execution_id_)), path_(std::move(other.path_)) {
    other.path_.clear();
}

WorkspaceHandle& WorkspaceHandle::operator=(WorkspaceHandle&& other) noexcept {
    if (this != &other) {
        try {
            dispose();
        } catch (const std::exception& e) {
            std::cerr << "[Workspace] Failed to remove " << path_ << ": " << e.what() << std::endl;
        }
        execution_id_ = std::move(other.execution_id_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void WorkspaceHandle::dispose() {
    if (path_.empty()) {
        return;
    }

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        throw WorkspaceError("cannot remove " + path_.string() + ": " + ec.message());
    }
    path_.clear();
}

// WorkspaceManager

WorkspaceManager::WorkspaceManager(const std::string& root_dir) : root_(root_dir) {}

WorkspaceHandle WorkspaceManager::stage(const std::string& execution_id, const FileMap& files) {
    if (!is_valid_execution_id(execution_id)) {
        throw WorkspaceError("invalid execution id: " + execution_id);
    }

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw WorkspaceError("cannot create workspace root " + root_.string() + ": " + ec.message());
    }

    fs::path dir = root_ / execution_id;
    if (!fs::create_directory(dir, ec)) {
        throw WorkspaceError(ec ? "cannot create " + dir.string() + ": " + ec.message()
                                : "workspace already exists: " + dir.string());
    }

    // From here on the handle owns the directory, so any throw cleans up
    WorkspaceHandle handle(execution_id, dir);

    fs::permissions(dir, DIR_PERMS, ec);
    if (ec) {
        throw WorkspaceError("cannot set permissions on " + dir.string() + ": " + ec.message());
    }

    fs::create_directory(dir / REPORT_DIR, ec);
    if (!ec) fs::permissions(dir / REPORT_DIR, DIR_PERMS, ec);
    if (ec) {
        throw WorkspaceError("cannot create report directory: " + ec.message());
    }

    for (const auto& [relative_path, content] : files) {
        write_file(dir, relative_path, content);
    }

    std::cout << "[Workspace] Staged " << files.size() << " files for " << execution_id << std::endl;
    return handle;
}

void WorkspaceManager::dispose(WorkspaceHandle& handle) {
    handle.dispose();
}

void WorkspaceManager::write_file(const fs::path& workspace,
                                  const std::string& relative_path,
                                  const std::string& content) {
    std::string reason;
    if (!SecurityValidator::is_safe_relative_path(relative_path, MAX_PATH_LENGTH, &reason)) {
        throw WorkspaceError("refusing to stage " + relative_path + ": " + reason);
    }

    fs::path target = workspace / relative_path;
    std::error_code ec;

    fs::path parent = target.parent_path();
    if (parent != workspace) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw WorkspaceError("cannot create " + parent.string() + ": " + ec.message());
        }
        // Intermediate directories must be reachable by the sandbox user
        for (fs::path p = parent; p != workspace && !p.empty(); p = p.parent_path()) {
            fs::permissions(p, DIR_PERMS, ec);
        }
    }

    // Ensure path doesn't escape the workspace
    fs::path canonical_workspace = fs::canonical(workspace, ec);
    fs::path canonical_target = fs::weakly_canonical(target, ec);
    std::string prefix = canonical_workspace.string() + "/";
    if (ec || canonical_target.string().compare(0, prefix.size(), prefix) != 0) {
        throw WorkspaceError("path escapes workspace: " + relative_path);
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw WorkspaceError("cannot open " + target.string() + " for writing");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw WorkspaceError("failed writing " + target.string());
    }

    fs::permissions(target, FILE_PERMS, ec);
    if (ec) {
        throw WorkspaceError("cannot set permissions on " + target.string() + ": " + ec.message());
    }
}

size_t WorkspaceManager::cleanup_stale() {
    size_t removed = 0;
    std::error_code ec;
    if (!fs::exists(root_, ec)) {
        return removed;
    }

    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        if (!entry.is_directory() || !is_valid_execution_id(entry.path().filename().string())) {
            continue;
        }
        std::error_code remove_ec;
        fs::remove_all(entry.path(), remove_ec);
        if (remove_ec) {
            std::cerr << "[Workspace] Could not remove stale " << entry.path()
                      << ": " << remove_ec.message() << std::endl;
            continue;
        }
        std::cout << "[Workspace] Removed stale workspace: " << entry.path().filename() << std::endl;
        ++removed;
    }
    if (ec) {
        std::cerr << "[Workspace] Could not scan " << root_ << ": " << ec.message() << std::endl;
    }
    return removed;
}

} // namespace gradebox
