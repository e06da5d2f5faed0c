#pragma once

#include "sandbox.h"
#include "security_validator.h"
#include "native_runtime.h"
#include "language_registry.h"
#include "constants.h"

#include <string>
#include <vector>

namespace gradebox {

// Everything tunable about one engine instance
struct EngineConfig {
    std::string runtime = "docker";                       // "docker" or "native"
    std::string docker_socket = DEFAULT_DOCKER_SOCKET;
    NativeRuntimeOptions native;

    std::string workspace_root = DEFAULT_WORKSPACE_ROOT;
    size_t worker_count = DEFAULT_WORKER_COUNT;
    size_t queue_capacity = DEFAULT_QUEUE_CAPACITY;
    int persist_attempts = DEFAULT_PERSIST_ATTEMPTS;

    ExecutionLimits limits;
    ValidatorLimits validator;
    size_t output_excerpt_bytes = MAX_OUTPUT_EXCERPT;

    // Added or overridden languages, fully resolved against the built-ins
    std::vector<LanguageProfile> languages;
};

// Reads a JSON config file. Absent keys keep their defaults.
// Throws ConfigError on unreadable files, bad JSON or invalid values.
EngineConfig load_config(const std::string& path);

// Same, from JSON text
EngineConfig parse_config(const std::string& json_text);

// Throws ConfigError when a value is out of range
void validate_config(const EngineConfig& config);

} // namespace gradebox
