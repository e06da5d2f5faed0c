#include <gtest/gtest.h>
#include "config.h"
#include "file_utils.h"
#include "errors.h"

#include <filesystem>
#include <fstream>

namespace gradebox {
namespace {

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
    EngineConfig config = parse_config("{}");
    EngineConfig defaults;

    EXPECT_EQ(config.runtime, "docker");
    EXPECT_EQ(config.worker_count, defaults.worker_count);
    EXPECT_EQ(config.queue_capacity, defaults.queue_capacity);
    EXPECT_EQ(config.persist_attempts, 2);
    EXPECT_EQ(config.limits.memory_bytes, DEFAULT_MEMORY_LIMIT_BYTES);
    EXPECT_EQ(config.limits.memory_swap_bytes, config.limits.memory_bytes);
    EXPECT_EQ(config.limits.timeout, std::chrono::seconds(DEFAULT_TIMEOUT_SECONDS));
    EXPECT_TRUE(config.languages.empty());
}

TEST(ConfigTest, ReadsAllSections) {
    EngineConfig config = parse_config(R"({
        "runtime": "native",
        "workspace_root": "/var/lib/gradebox",
        "workers": 8,
        "queue_capacity": 32,
        "persist_attempts": 3,
        "output_excerpt_bytes": 1024,
        "native": {"require_namespaces": false, "seccomp": false},
        "limits": {"memory_mb": 256, "cpus": 0.5, "timeout_seconds": 10, "pids": 16,
                   "tmpfs_mb": 8, "user": "1000:1000", "max_output_bytes": 4096},
        "validator": {"max_payload_bytes": 1000, "max_files": 3, "max_path_length": 64}
    })");

    EXPECT_EQ(config.runtime, "native");
    EXPECT_EQ(config.workspace_root, "/var/lib/gradebox");
    EXPECT_EQ(config.worker_count, 8u);
    EXPECT_EQ(config.queue_capacity, 32u);
    EXPECT_EQ(config.persist_attempts, 3);
    EXPECT_EQ(config.output_excerpt_bytes, 1024u);
    EXPECT_FALSE(config.native.require_namespaces);
    EXPECT_TRUE(config.native.drop_privileges);
    EXPECT_FALSE(config.native.enable_seccomp);
    EXPECT_EQ(config.limits.memory_bytes, 256u * 1024 * 1024);
    EXPECT_EQ(config.limits.memory_swap_bytes, 256u * 1024 * 1024);
    EXPECT_DOUBLE_EQ(config.limits.cpus, 0.5);
    EXPECT_EQ(config.limits.timeout, std::chrono::seconds(10));
    EXPECT_EQ(config.limits.pids_limit, 16);
    EXPECT_EQ(config.limits.tmpfs_bytes, 8u * 1024 * 1024);
    EXPECT_EQ(config.limits.user, "1000:1000");
    EXPECT_EQ(config.limits.max_stream_bytes, 4096u);
    EXPECT_EQ(config.validator.max_payload_bytes, 1000u);
    EXPECT_EQ(config.validator.max_files, 3u);
    EXPECT_EQ(config.validator.max_path_length, 64u);
}

TEST(ConfigTest, LanguageOverrideStartsFromBuiltIn) {
    EngineConfig config = parse_config(R"({
        "languages": {
            "python": {"image": "registry.local/python:3.12"},
            "ruby": {"image": "ruby:3", "command": "ruby run_tests.rb", "extensions": [".rb"],
                     "report_format": "json", "report_pattern": ".gradebox/results.json"}
        }
    })");

    ASSERT_EQ(config.languages.size(), 2u);
    const LanguageProfile& python = config.languages[0];
    EXPECT_EQ(python.name, "python");
    EXPECT_EQ(python.image, "registry.local/python:3.12");
    EXPECT_EQ(python.command, BuiltInLanguages::python().command) << "Unset fields keep the built-in";

    const LanguageProfile& ruby = config.languages[1];
    EXPECT_EQ(ruby.name, "ruby");
    EXPECT_EQ(ruby.report_format, ReportFormat::JSON_REPORT);
    EXPECT_EQ(ruby.extensions, std::vector<std::string>{".rb"});
}

TEST(ConfigTest, InvalidValuesAreConfigErrors) {
    EXPECT_THROW(parse_config("{ nope"), ConfigError);
    EXPECT_THROW(parse_config("[]"), ConfigError);
    EXPECT_THROW(parse_config(R"({"runtime": "podman"})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"workers": 0})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"workers": "four"})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"persist_attempts": 0})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"limits": {"timeout_seconds": 0}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"limits": {"memory_mb": 0}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"limits": {"cpus": "one"}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"limits": {"user": "0:0"}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"limits": {"user": "root"}})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"native": true})"), ConfigError);
    EXPECT_THROW(parse_config(R"({"languages": {"go": {"image": "golang:1"}}})"), ConfigError)
        << "A new language needs a command";
    EXPECT_THROW(parse_config(R"({"languages": {"python": {"report_format": "xml"}}})"), ConfigError);
}

TEST(ConfigTest, LoadConfigFromFile) {
    auto path = std::filesystem::temp_directory_path() / ("gradebox_config_" + FileUtils::random_hex(4) + ".json");
    std::ofstream(path) << R"({"workers": 2})";

    EngineConfig config = load_config(path.string());
    EXPECT_EQ(config.worker_count, 2u);

    std::filesystem::remove(path);
    EXPECT_THROW(load_config(path.string()), ConfigError);
}

} // namespace
} // namespace gradebox
