#pragma once

#include "container_runtime.h"
#include "constants.h"

#include <string>
#include <map>
#include <functional>

namespace gradebox {

// Docker Engine API client over the daemon's UNIX socket.
// Each request opens its own connection, so one client can be shared by
// every worker thread.
class DockerClient : public ContainerRuntime {
public:
    explicit DockerClient(const std::string& socket_path = DEFAULT_DOCKER_SOCKET);

    // GET /_ping
    bool ping();

    bool has_image(const std::string& tag) override;
    void build_image(const std::string& tag, const std::string& dockerfile) override;

    std::string create(const ContainerSpec& spec) override;
    void start(const std::string& container_id) override;
    void stream_logs(const std::string& container_id, LogSink& sink) override;
    WaitResult wait(const std::string& container_id,
                    std::chrono::milliseconds timeout) override;
    void kill(const std::string& container_id) override;
    void remove(const std::string& container_id) override;
    size_t peak_memory(const std::string& container_id) override;

    // Request body for POST /containers/create
    static std::string create_body(const ContainerSpec& spec);

    // Single-file ustar archive holding "Dockerfile", the /build context
    static std::string make_build_context(const std::string& dockerfile);

private:
    struct HttpReply {
        int status = 0;
        std::map<std::string, std::string> headers;   // Lowercased names
        std::string body;
    };

    using BodyCallback = std::function<void(const char*, size_t)>;

    // Buffered request; the body is capped at max_body bytes
    HttpReply request(const std::string& method, const std::string& path,
                      const std::string& body = "",
                      const std::string& content_type = "application/json",
                      std::chrono::milliseconds timeout = std::chrono::seconds(DOCKER_REQUEST_TIMEOUT_SECONDS),
                      size_t max_body = INITIAL_HTTP_BUFFER * 128);

    // Streams the response body to on_body. A zero timeout blocks indefinitely.
    int request_streaming(const std::string& method, const std::string& path,
                          const std::string& body, const std::string& content_type,
                          std::chrono::milliseconds timeout,
                          const BodyCallback& on_body,
                          std::map<std::string, std::string>* headers = nullptr);

    int connect_socket(std::chrono::milliseconds timeout);

    static std::string error_message(const HttpReply& reply);

    std::string socket_path_;
};

} // namespace gradebox
