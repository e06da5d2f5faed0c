#pragma once

#include <stdexcept>
#include <string>

namespace gradebox {

// Submitted files rejected before execution
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error("Validation failed: " + message) {}
};

// Staging or cleanup I/O failure
class WorkspaceError : public std::runtime_error {
public:
    explicit WorkspaceError(const std::string& message)
        : std::runtime_error("Workspace error: " + message) {}
};

// Container runtime client failure (create, start, logs, remove, build)
class SandboxError : public std::runtime_error {
public:
    explicit SandboxError(const std::string& message)
        : std::runtime_error("Sandbox error: " + message) {}
};

// Test report present but unreadable
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message)
        : std::runtime_error("Parse error: " + message) {}
};

// Store could not durably record a write
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& message)
        : std::runtime_error("Persistence error: " + message) {}
};

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& message)
        : std::runtime_error("Not found: " + message) {}
};

// Evaluation queue saturated, intake must back off
class QueueFullError : public std::runtime_error {
public:
    explicit QueueFullError(const std::string& message)
        : std::runtime_error("Queue full: " + message) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Config error: " + message) {}
};

} // namespace gradebox
