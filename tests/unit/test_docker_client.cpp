#include <gtest/gtest.h>
#include "docker_client.h"
#include <json/json.h>
#include <sstream>
#include <cstdlib>

namespace gradebox {
namespace {

Json::Value parse(const std::string& text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    EXPECT_TRUE(Json::parseFromStream(builder, stream, &root, &errors)) << errors;
    return root;
}

ContainerSpec hardened_spec() {
    ContainerSpec spec;
    spec.name = "sub_1_ab";
    spec.image = "gradebox/python:3.11";
    spec.command = {"/bin/sh", "-c", "python -m pytest tests"};
    spec.workspace_host_path = "/tmp/gradebox_jobs/sub_1_ab";
    spec.mount_point = "/workspace";
    spec.env = {{"HOME", "/tmp"}};
    spec.memory_bytes = 256 * 1024 * 1024;
    spec.memory_swap_bytes = 256 * 1024 * 1024;
    spec.cpus = 0.5;
    spec.pids_limit = 32;
    spec.tmpfs_bytes = 16 * 1024 * 1024;
    spec.user = "65534:65534";
    return spec;
}

// ============================================================================
// Container Create Body
// ============================================================================

TEST(DockerClientTest, CreateBodyAppliesIsolation) {
    Json::Value body = parse(DockerClient::create_body(hardened_spec()));
    const Json::Value& host = body["HostConfig"];

    EXPECT_TRUE(body["NetworkDisabled"].asBool());
    EXPECT_EQ(host["NetworkMode"].asString(), "none");
    ASSERT_EQ(host["CapDrop"].size(), 1u);
    EXPECT_EQ(host["CapDrop"][0].asString(), "ALL");
    ASSERT_EQ(host["SecurityOpt"].size(), 1u);
    EXPECT_EQ(host["SecurityOpt"][0].asString(), "no-new-privileges");
    EXPECT_FALSE(host["Privileged"].asBool());
    EXPECT_TRUE(host["ReadonlyRootfs"].asBool());
    EXPECT_EQ(body["User"].asString(), "65534:65534");
}

TEST(DockerClientTest, CreateBodyAppliesResourceLimits) {
    Json::Value host = parse(DockerClient::create_body(hardened_spec()))["HostConfig"];

    EXPECT_EQ(host["Memory"].asInt64(), 256LL * 1024 * 1024);
    EXPECT_EQ(host["MemorySwap"].asInt64(), host["Memory"].asInt64()) << "No swap beyond the memory limit";
    EXPECT_EQ(host["NanoCpus"].asInt64(), 500000000LL);
    EXPECT_EQ(host["PidsLimit"].asInt(), 32);
    EXPECT_EQ(host["Tmpfs"]["/tmp"].asString(), "rw,nosuid,nodev,size=16777216");
    ASSERT_EQ(host["Ulimits"].size(), 1u);
    EXPECT_EQ(host["Ulimits"][0]["Name"].asString(), "nofile");
}

TEST(DockerClientTest, CreateBodyBindsWorkspaceAndCommand) {
    Json::Value body = parse(DockerClient::create_body(hardened_spec()));

    ASSERT_EQ(body["HostConfig"]["Binds"].size(), 1u);
    EXPECT_EQ(body["HostConfig"]["Binds"][0].asString(), "/tmp/gradebox_jobs/sub_1_ab:/workspace:rw");
    EXPECT_EQ(body["WorkingDir"].asString(), "/workspace");
    EXPECT_EQ(body["Image"].asString(), "gradebox/python:3.11");
    ASSERT_EQ(body["Cmd"].size(), 3u);
    EXPECT_EQ(body["Cmd"][2].asString(), "python -m pytest tests");
    EXPECT_EQ(body["Env"][0].asString(), "HOME=/tmp");
    EXPECT_EQ(body["Labels"]["gradebox.execution"].asString(), "sub_1_ab");
}

// ============================================================================
// Build Context
// ============================================================================

TEST(DockerClientTest, BuildContextIsSingleFileTar) {
    std::string dockerfile = "FROM python:3.11-slim\nRUN pip install pytest\n";
    std::string tar = DockerClient::make_build_context(dockerfile);

    ASSERT_EQ(tar.size() % 512, 0u);
    EXPECT_EQ(tar.size(), 512u + 512u + 1024u) << "Header, one padded data block, end marker";
    EXPECT_EQ(std::string(tar.c_str()), "Dockerfile");
    EXPECT_EQ(tar.substr(257, 5), "ustar");
    EXPECT_EQ(tar[156], '0');
    EXPECT_EQ(std::strtoul(tar.substr(124, 11).c_str(), nullptr, 8), dockerfile.size());
    EXPECT_EQ(tar.substr(512, dockerfile.size()), dockerfile);
}

TEST(DockerClientTest, BuildContextChecksumIsValid) {
    std::string tar = DockerClient::make_build_context("FROM scratch\n");

    unsigned long expected = 0;
    for (size_t i = 0; i < 512; i++) {
        bool in_checksum = i >= 148 && i < 156;
        expected += in_checksum ? ' ' : static_cast<unsigned char>(tar[i]);
    }
    EXPECT_EQ(std::strtoul(tar.substr(148, 6).c_str(), nullptr, 8), expected);
}

// ============================================================================
// Unreachable Daemon
// ============================================================================

TEST(DockerClientTest, MissingSocketFailsCleanly) {
    DockerClient client("/nonexistent/gradebox/docker.sock");
    EXPECT_FALSE(client.ping());
    EXPECT_THROW(client.create(hardened_spec()), std::runtime_error);
    EXPECT_EQ(client.peak_memory("abc"), 0u);
}

} // namespace
} // namespace gradebox
