#include "config.h"
#include "errors.h"

#include <json/json.h>

#include <fstream>
#include <sstream>
#include <iostream>

namespace gradebox {

namespace {

constexpr size_t MB = 1024 * 1024;

size_t get_size(const Json::Value& obj, const char* key, size_t fallback) {
    if (!obj.isMember(key)) return fallback;
    const Json::Value& v = obj[key];
    if (!v.isIntegral() || v.asInt64() < 0) {
        throw ConfigError(std::string("\"") + key + "\" must be a non-negative integer");
    }
    return static_cast<size_t>(v.asUInt64());
}

bool get_bool(const Json::Value& obj, const char* key, bool fallback) {
    if (!obj.isMember(key)) return fallback;
    if (!obj[key].isBool()) {
        throw ConfigError(std::string("\"") + key + "\" must be true or false");
    }
    return obj[key].asBool();
}

std::string get_string(const Json::Value& obj, const char* key, const std::string& fallback) {
    if (!obj.isMember(key)) return fallback;
    if (!obj[key].isString()) {
        throw ConfigError(std::string("\"") + key + "\" must be a string");
    }
    return obj[key].asString();
}

std::vector<std::string> get_strings(const Json::Value& obj, const char* key,
                                     const std::vector<std::string>& fallback) {
    if (!obj.isMember(key)) return fallback;
    const Json::Value& v = obj[key];
    if (!v.isArray()) {
        throw ConfigError(std::string("\"") + key + "\" must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : v) {
        if (!item.isString()) {
            throw ConfigError(std::string("\"") + key + "\" must be an array of strings");
        }
        out.push_back(item.asString());
    }
    return out;
}

const Json::Value& get_object(const Json::Value& obj, const char* key) {
    static const Json::Value empty(Json::objectValue);
    if (!obj.isMember(key)) return empty;
    if (!obj[key].isObject()) {
        throw ConfigError(std::string("\"") + key + "\" must be an object");
    }
    return obj[key];
}

LanguageProfile parse_language(const std::string& name, const Json::Value& obj,
                               const LanguageRegistry& builtins) {
    if (!obj.isObject()) {
        throw ConfigError("language \"" + name + "\" must be an object");
    }

    // Start from the built-in profile when overriding one
    LanguageProfile profile = builtins.find(name).value_or(LanguageProfile());
    profile.name = name;
    profile.image = get_string(obj, "image", profile.image);
    profile.dockerfile = get_string(obj, "dockerfile", profile.dockerfile);
    profile.command = get_string(obj, "command", profile.command);
    profile.report_pattern = get_string(obj, "report_pattern", profile.report_pattern);
    profile.extensions = get_strings(obj, "extensions", profile.extensions);
    profile.denied_patterns = get_strings(obj, "denied_patterns", profile.denied_patterns);
    profile.reserved_files = get_strings(obj, "reserved_files", profile.reserved_files);

    if (obj.isMember("report_format")) {
        auto format = report_format_from_string(get_string(obj, "report_format", ""));
        if (!format) {
            throw ConfigError("language \"" + name + "\": report_format must be junit, json or stdout");
        }
        profile.report_format = *format;
    }

    if (profile.image.empty() || profile.command.empty()) {
        throw ConfigError("language \"" + name + "\" needs an image and a command");
    }
    return profile;
}

} // namespace

EngineConfig parse_config(const std::string& json_text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(json_text);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw ConfigError("invalid JSON: " + errors);
    }
    if (!root.isObject()) {
        throw ConfigError("top level must be an object");
    }

    EngineConfig config;
    config.runtime = get_string(root, "runtime", config.runtime);
    config.docker_socket = get_string(root, "docker_socket", config.docker_socket);
    config.workspace_root = get_string(root, "workspace_root", config.workspace_root);
    config.worker_count = get_size(root, "workers", config.worker_count);
    config.queue_capacity = get_size(root, "queue_capacity", config.queue_capacity);
    config.persist_attempts = static_cast<int>(get_size(root, "persist_attempts",
                                                        static_cast<size_t>(config.persist_attempts)));
    config.output_excerpt_bytes = get_size(root, "output_excerpt_bytes", config.output_excerpt_bytes);

    const Json::Value& native = get_object(root, "native");
    config.native.require_namespaces = get_bool(native, "require_namespaces", config.native.require_namespaces);
    config.native.drop_privileges = get_bool(native, "drop_privileges", config.native.drop_privileges);
    config.native.enable_seccomp = get_bool(native, "seccomp", config.native.enable_seccomp);

    const Json::Value& limits = get_object(root, "limits");
    ExecutionLimits& l = config.limits;
    l.memory_bytes = get_size(limits, "memory_mb", l.memory_bytes / MB) * MB;
    l.memory_swap_bytes = l.memory_bytes;
    l.timeout = std::chrono::seconds(get_size(limits, "timeout_seconds",
        static_cast<size_t>(std::chrono::duration_cast<std::chrono::seconds>(l.timeout).count())));
    l.pids_limit = static_cast<int>(get_size(limits, "pids", static_cast<size_t>(l.pids_limit)));
    l.tmpfs_bytes = get_size(limits, "tmpfs_mb", l.tmpfs_bytes / MB) * MB;
    l.user = get_string(limits, "user", l.user);
    l.max_stream_bytes = get_size(limits, "max_output_bytes", l.max_stream_bytes);
    if (limits.isMember("cpus")) {
        if (!limits["cpus"].isNumeric()) {
            throw ConfigError("\"cpus\" must be a number");
        }
        l.cpus = limits["cpus"].asDouble();
    }

    const Json::Value& validator = get_object(root, "validator");
    config.validator.max_payload_bytes = get_size(validator, "max_payload_bytes",
                                                  config.validator.max_payload_bytes);
    config.validator.max_files = get_size(validator, "max_files", config.validator.max_files);
    config.validator.max_path_length = get_size(validator, "max_path_length",
                                                config.validator.max_path_length);

    const Json::Value& languages = get_object(root, "languages");
    LanguageRegistry builtins;
    for (const auto& name : languages.getMemberNames()) {
        config.languages.push_back(parse_language(name, languages[name], builtins));
    }

    validate_config(config);
    return config;
}

EngineConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    EngineConfig config;
    try {
        config = parse_config(buffer.str());
    } catch (const ConfigError&) {
        std::cerr << "[Config] Rejected " << path << std::endl;
        throw;
    }
    std::cout << "[Config] Loaded " << path << " (runtime " << config.runtime
              << ", " << config.worker_count << " workers)" << std::endl;
    return config;
}

void validate_config(const EngineConfig& config) {
    if (config.runtime != "docker" && config.runtime != "native") {
        throw ConfigError("runtime must be \"docker\" or \"native\", got \"" + config.runtime + "\"");
    }
    if (config.worker_count == 0) {
        throw ConfigError("workers must be at least 1");
    }
    if (config.queue_capacity == 0) {
        throw ConfigError("queue_capacity must be at least 1");
    }
    if (config.persist_attempts < 1) {
        throw ConfigError("persist_attempts must be at least 1");
    }
    if (config.workspace_root.empty()) {
        throw ConfigError("workspace_root must not be empty");
    }
    if (config.limits.memory_bytes == 0) {
        throw ConfigError("memory limit must be positive");
    }
    if (config.limits.memory_swap_bytes != config.limits.memory_bytes) {
        throw ConfigError("memory+swap ceiling must equal the memory limit");
    }
    if (config.limits.timeout.count() <= 0) {
        throw ConfigError("timeout must be positive");
    }
    if (config.limits.cpus <= 0.0) {
        throw ConfigError("cpus must be positive");
    }
    if (config.limits.pids_limit <= 0) {
        throw ConfigError("pids must be positive");
    }
    if (config.limits.user.empty() || config.limits.user == "0" ||
        config.limits.user.rfind("0:", 0) == 0 || config.limits.user.rfind("root", 0) == 0) {
        throw ConfigError("sandbox user must not be root");
    }
}

} // namespace gradebox
