#include "problem_catalog.h"
#include "file_utils.h"
#include "constants.h"
#include "errors.h"

#include <json/json.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace gradebox {

namespace {

bool is_plain_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

} // namespace

DirectoryProblemCatalog::DirectoryProblemCatalog(const std::string& root_dir) : root_dir_(root_dir) {}

std::optional<Problem> DirectoryProblemCatalog::find_by_id(const std::string& problem_id) {
    if (!is_plain_name(problem_id)) {
        return std::nullopt;
    }

    fs::path dir = fs::path(root_dir_) / problem_id;
    fs::path manifest = dir / "problem.json";
    if (!fs::is_regular_file(manifest)) {
        return std::nullopt;
    }

    std::ifstream file(manifest);
    if (!file) {
        throw ConfigError("cannot read " + manifest.string());
    }
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        throw ConfigError("invalid " + manifest.string() + ": " + errors);
    }
    if (!root.isObject() || !root["language"].isString() || root["language"].asString().empty()) {
        throw ConfigError(manifest.string() + " must set \"language\"");
    }

    Problem problem;
    problem.id = problem_id;
    problem.language = root["language"].asString();

    if (root.isMember("timeout_seconds")) {
        if (!root["timeout_seconds"].isInt() || root["timeout_seconds"].asInt() <= 0) {
            throw ConfigError(manifest.string() + ": timeout_seconds must be a positive integer");
        }
        problem.timeout = std::chrono::seconds(root["timeout_seconds"].asInt());
    }
    if (root.isMember("memory_limit_mb")) {
        if (!root["memory_limit_mb"].isInt() || root["memory_limit_mb"].asInt() <= 0) {
            throw ConfigError(manifest.string() + ": memory_limit_mb must be a positive integer");
        }
        problem.memory_limit_bytes = static_cast<size_t>(root["memory_limit_mb"].asInt()) * 1024 * 1024;
    }

    try {
        for (auto& [path, content] : FileUtils::collect_files((dir / "tests").string(), "*", MAX_REPORT_SIZE)) {
            problem.test_files["tests/" + path] = std::move(content);
        }
        problem.scaffold_files = FileUtils::collect_files((dir / "scaffold").string(), "*", MAX_REPORT_SIZE);
    } catch (const std::exception& e) {
        throw ConfigError("cannot load files for problem " + problem_id + ": " + e.what());
    }

    return problem;
}

} // namespace gradebox
