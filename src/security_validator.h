#pragma once

#include "submission.h"
#include "language_registry.h"
#include "constants.h"

#include <string>
#include <map>
#include <set>
#include <vector>
#include <regex>
#include <mutex>
#include <memory>

namespace gradebox {

struct ValidatorLimits {
    size_t max_payload_bytes = MAX_PAYLOAD_BYTES;
    size_t max_files = MAX_FILES_PER_SUBMISSION;
    size_t max_path_length = MAX_PATH_LENGTH;
    size_t max_line_length = MAX_SCANNED_LINE;  // Per line of a screened source file
};

struct ValidationResult {
    bool ok = false;
    std::string reason;          // Set when ok is false, safe to show the submitter
};

// Cheap pre-filter for submitted files. The sandbox is the real boundary;
// this only fails fast on malformed or obviously hostile input.
class SecurityValidator {
public:
    explicit SecurityValidator(const ValidatorLimits& limits = ValidatorLimits());

    // Checks, in order: path safety, aggregate size, source denylist.
    // The denylist runs per line; a screened file with a line over
    // max_line_length is rejected outright.
    // reserved_paths are workspace paths the submission may not write
    // (hidden tests, build scaffold); entries ending in '/' reserve a directory.
    ValidationResult validate(const FileMap& files,
                              const LanguageProfile& language,
                              const std::set<std::string>& reserved_paths = {}) const;

    // Single path check, exposed for the workspace manager
    static bool is_safe_relative_path(const std::string& path, size_t max_length,
                                      std::string* reason = nullptr);

private:
    using PatternList = std::shared_ptr<const std::vector<std::regex>>;

    PatternList compiled_patterns(const LanguageProfile& language) const;
    static bool is_reserved(const std::string& path, const std::set<std::string>& reserved_paths);
    static bool has_extension(const std::string& path, const std::vector<std::string>& extensions);

    ValidatorLimits limits_;

    mutable std::mutex mutex_;
    mutable std::map<std::string, PatternList> pattern_cache_;
    mutable std::map<std::string, std::vector<std::string>> pattern_sources_;
};

} // namespace gradebox
