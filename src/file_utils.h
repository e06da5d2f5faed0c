#pragma once

#include "submission.h"

#include <string>
#include <filesystem>
#include <map>
#include <vector>

namespace gradebox {

class FileUtils {
public:
    // Check if path matches glob pattern (e.g., "*.xml", "reports/*.xml")
    static bool matches_pattern(const std::string& path, const std::string& pattern);

    // Format file size as human-readable string
    static std::string format_file_size(size_t bytes);

    // Hash utilities
    static std::string sha256_string(const std::string& data);
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // SHA-256 over language and files in path order. Stable for equal inputs.
    static std::string fingerprint(const std::string& language, const FileMap& files);

    // Cryptographically random hex string of 2 * bytes characters
    static std::string random_hex(size_t bytes);

    // Whole-file read. Throws std::runtime_error when the file cannot be read
    // or is larger than max_bytes.
    static std::string read_file(const std::filesystem::path& path, size_t max_bytes);

    // Files under dirpath whose relative path matches pattern, sorted by path.
    // Relative path -> content. Files larger than max_bytes are skipped.
    static std::map<std::string, std::string> collect_files(
        const std::string& dirpath,
        const std::string& pattern,
        size_t max_bytes
    );

    // Keep at most max_bytes, marking the cut
    static std::string truncate(const std::string& text, size_t max_bytes);
};

} // namespace gradebox
