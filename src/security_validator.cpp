#include "security_validator.h"
#include "errors.h"
#include "file_utils.h"
#include <algorithm>
#include <cctype>

namespace gradebox {

SecurityValidator::SecurityValidator(const ValidatorLimits& limits) : limits_(limits) {}

bool SecurityValidator::is_safe_relative_path(const std::string& path, size_t max_length,
                                              std::string* reason) {
    auto reject = [reason](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };

    if (path.empty()) {
        return reject("empty file name");
    }
    if (path.size() > max_length) {
        return reject("file name longer than " + std::to_string(max_length) + " characters");
    }
    if (path.front() == '/' || path.front() == '~') {
        return reject("absolute path not allowed: " + path);
    }
    for (char c : path) {
        if (c == '\\') {
            return reject("backslash in path: " + path);
        }
        if (std::iscntrl(static_cast<unsigned char>(c))) {
            return reject("control character in path");
        }
    }

    // Every component must be a plain name
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        std::string component = path.substr(start, slash - start);

        if (component.empty()) {
            return reject("empty path component in: " + path);
        }
        if (component == "." || component == "..") {
            return reject("path traversal not allowed: " + path);
        }
        start = slash + 1;
    }

    return true;
}

ValidationResult SecurityValidator::validate(const FileMap& files,
                                             const LanguageProfile& language,
                                             const std::set<std::string>& reserved_paths) const {
    ValidationResult result;

    if (files.empty()) {
        result.reason = "No files submitted";
        return result;
    }
    if (files.size() > limits_.max_files) {
        result.reason = "Too many files (" + std::to_string(files.size()) +
                        ", limit " + std::to_string(limits_.max_files) + ")";
        return result;
    }

    // (a) Paths
    for (const auto& [path, _] : files) {
        std::string why;
        if (!is_safe_relative_path(path, limits_.max_path_length, &why)) {
            result.reason = "Invalid file path: " + why;
            return result;
        }
        if (path.rfind(".gradebox", 0) == 0) {
            result.reason = "Reserved path: " + path;
            return result;
        }
        if (is_reserved(path, reserved_paths)) {
            result.reason = "File would overwrite a problem file: " + path;
            return result;
        }
        if (std::find(language.reserved_files.begin(), language.reserved_files.end(), path) !=
            language.reserved_files.end()) {
            result.reason = "Test runner configuration cannot be submitted: " + path;
            return result;
        }
    }

    // (b) Aggregate size
    size_t total = 0;
    for (const auto& [_, content] : files) {
        total += content.size();
    }
    if (total > limits_.max_payload_bytes) {
        result.reason = "Submission too large (" + FileUtils::format_file_size(total) +
                        ", limit " + FileUtils::format_file_size(limits_.max_payload_bytes) + ")";
        return result;
    }

    // (c) Source denylist, matched one bounded line at a time
    auto patterns = compiled_patterns(language);
    for (const auto& [path, content] : files) {
        if (!has_extension(path, language.extensions)) {
            continue;
        }
        size_t start = 0;
        size_t line_number = 1;
        while (start < content.size()) {
            size_t end = content.find('\n', start);
            if (end == std::string::npos) end = content.size();
            if (end - start > limits_.max_line_length) {
                result.reason = "Line " + std::to_string(line_number) + " of " + path +
                                " is longer than " + std::to_string(limits_.max_line_length) +
                                " characters";
                return result;
            }
            std::string line = content.substr(start, end - start);
            for (const auto& pattern : *patterns) {
                if (std::regex_search(line, pattern)) {
                    result.reason = "Disallowed construct in " + path;
                    return result;
                }
            }
            start = end + 1;
            line_number++;
        }
    }

    result.ok = true;
    return result;
}

SecurityValidator::PatternList SecurityValidator::compiled_patterns(
    const LanguageProfile& language) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto cached = pattern_cache_.find(language.name);
    if (cached != pattern_cache_.end() &&
        pattern_sources_[language.name] == language.denied_patterns) {
        return cached->second;
    }

    auto compiled = std::make_shared<std::vector<std::regex>>();
    for (const auto& source : language.denied_patterns) {
        try {
            compiled->emplace_back(source, std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::regex_error& e) {
            throw ConfigError("invalid denylist pattern for " + language.name +
                              ": " + source + " (" + e.what() + ")");
        }
    }

    pattern_cache_[language.name] = compiled;
    pattern_sources_[language.name] = language.denied_patterns;
    return compiled;
}

bool SecurityValidator::is_reserved(const std::string& path,
                                    const std::set<std::string>& reserved_paths) {
    for (const auto& reserved : reserved_paths) {
        // Entries ending in '/' reserve a whole directory
        if (!reserved.empty() && reserved.back() == '/') {
            if (path.compare(0, reserved.size(), reserved) == 0) {
                return true;
            }
        } else if (path == reserved) {
            return true;
        }
    }
    return false;
}

bool SecurityValidator::has_extension(const std::string& path,
                                      const std::vector<std::string>& extensions) {
    size_t dot_pos = path.rfind('.');
    if (dot_pos == std::string::npos) {
        return false;
    }
    std::string ext = path.substr(dot_pos);
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

} // namespace gradebox
