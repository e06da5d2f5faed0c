#include "docker_client.h"
#include "stream_demux.h"
#include "errors.h"

#include <json/json.h>

#include <sys/socket.h>
#include <sys/un.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <cctype>
#include <sstream>
#include <iostream>
#include <algorithm>

namespace gradebox {

namespace {

constexpr const char* API_PREFIX = "/v1.41";

// Socket read or write hit SO_RCVTIMEO / SO_SNDTIMEO
class RequestTimeout : public SandboxError {
public:
    explicit RequestTimeout(const std::string& what) : SandboxError(what) {}
};

// Closes the connection on every exit path
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() { if (fd_ >= 0) close(fd_); }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;
    int get() const { return fd_; }
    int release() { int fd = fd_; fd_ = -1; return fd; }
private:
    int fd_;
};

std::string url_encode(const std::string& value) {
    std::ostringstream out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            out << hex;
        }
    }
    return out.str();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Json::Value parse_json(const std::string& text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw SandboxError("invalid JSON from Docker daemon: " + errors);
    }
    return root;
}

void set_timeout(int fd, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return;
    }
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        throw SandboxError(std::string("setsockopt failed: ") + strerror(errno));
    }
}

void send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw RequestTimeout("timed out writing to Docker socket");
            }
            throw SandboxError(std::string("write to Docker socket failed: ") + strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

// Returns 0 on EOF
size_t recv_some(int fd, char* buffer, size_t len) {
    while (true) {
        ssize_t n = recv(fd, buffer, len, 0);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw RequestTimeout("timed out reading from Docker socket");
        }
        throw SandboxError(std::string("read from Docker socket failed: ") + strerror(errno));
    }
}

// Octal field, NUL terminated, as ustar expects
void write_octal(char* field, size_t width, unsigned long value) {
    std::snprintf(field, width, "%0*lo", static_cast<int>(width - 1), value);
}

} // namespace

DockerClient::DockerClient(const std::string& socket_path) : socket_path_(socket_path) {}

int DockerClient::connect_socket(std::chrono::milliseconds timeout) {
    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw SandboxError(std::string("cannot create socket: ") + strerror(errno));
    }
    SocketGuard guard(fd);

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        throw SandboxError("Docker socket path too long: " + socket_path_);
    }
    std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    set_timeout(fd, timeout);

    if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw SandboxError("cannot connect to " + socket_path_ + ": " + strerror(errno));
    }

    return guard.release();
}

int DockerClient::request_streaming(const std::string& method, const std::string& path,
                                    const std::string& body, const std::string& content_type,
                                    std::chrono::milliseconds timeout,
                                    const BodyCallback& on_body,
                                    std::map<std::string, std::string>* headers_out) {
    SocketGuard conn(connect_socket(timeout));

    std::ostringstream req;
    req << method << " " << API_PREFIX << path << " HTTP/1.1\r\n"
        << "Host: docker\r\n"
        << "User-Agent: gradebox\r\n"
        << "Connection: close\r\n";
    if (!body.empty() || method == "POST") {
        req << "Content-Type: " << content_type << "\r\n"
            << "Content-Length: " << body.size() << "\r\n";
    }
    req << "\r\n";
    send_all(conn.get(), req.str());
    if (!body.empty()) {
        send_all(conn.get(), body);
    }

    // Read status line and headers
    std::string data;
    data.reserve(INITIAL_HTTP_BUFFER);
    char buffer[PIPE_BUFFER_SIZE];
    size_t header_end = std::string::npos;
    while ((header_end = data.find("\r\n\r\n")) == std::string::npos) {
        size_t n = recv_some(conn.get(), buffer, sizeof(buffer));
        if (n == 0) {
            throw SandboxError("Docker daemon closed connection before responding");
        }
        data.append(buffer, n);
        if (data.size() > INITIAL_HTTP_BUFFER * 8) {
            throw SandboxError("Docker response headers too large");
        }
    }

    std::istringstream head(data.substr(0, header_end));
    std::string line;
    std::getline(head, line);
    int status = 0;
    size_t space = line.find(' ');
    if (line.compare(0, 5, "HTTP/") != 0 || space == std::string::npos) {
        throw SandboxError("malformed HTTP status line from Docker daemon");
    }
    try {
        status = std::stoi(line.substr(space + 1, 3));
    } catch (const std::exception&) {
        throw SandboxError("malformed HTTP status line from Docker daemon");
    }

    std::map<std::string, std::string> headers;
    while (std::getline(head, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(' '));
        headers[to_lower(line.substr(0, colon))] = value;
    }
    if (headers_out) {
        *headers_out = headers;
    }

    // Error bodies are buffered so they can be reported
    std::string error_body;
    BodyCallback deliver = on_body;
    if (status >= 400) {
        deliver = [&error_body](const char* d, size_t n) {
            if (error_body.size() < INITIAL_HTTP_BUFFER) error_body.append(d, n);
        };
    }

    std::string leftover = data.substr(header_end + 4);
    auto te = headers.find("transfer-encoding");
    auto cl = headers.find("content-length");

    if (te != headers.end() && to_lower(te->second).find("chunked") != std::string::npos) {
        ChunkedDecoder decoder(deliver);
        decoder.feed(leftover.data(), leftover.size());
        while (!decoder.done()) {
            size_t n = recv_some(conn.get(), buffer, sizeof(buffer));
            if (n == 0) break;
            decoder.feed(buffer, n);
        }
    } else if (cl != headers.end()) {
        size_t remaining = 0;
        try {
            remaining = std::stoul(cl->second);
        } catch (const std::exception&) {
            throw SandboxError("bad Content-Length from Docker daemon: " + cl->second);
        }
        size_t take = std::min(remaining, leftover.size());
        if (take > 0) deliver(leftover.data(), take);
        remaining -= take;
        while (remaining > 0) {
            size_t n = recv_some(conn.get(), buffer, std::min(sizeof(buffer), remaining));
            if (n == 0) {
                throw SandboxError("Docker response body truncated");
            }
            deliver(buffer, n);
            remaining -= n;
        }
    } else {
        // Connection: close delimits the body
        if (!leftover.empty()) deliver(leftover.data(), leftover.size());
        size_t n;
        while ((n = recv_some(conn.get(), buffer, sizeof(buffer))) > 0) {
            deliver(buffer, n);
        }
    }

    if (status >= 400) {
        HttpReply reply;
        reply.status = status;
        reply.body = error_body;
        throw SandboxError(method + " " + path + " failed: " + error_message(reply));
    }
    return status;
}

DockerClient::HttpReply DockerClient::request(const std::string& method, const std::string& path,
                                              const std::string& body,
                                              const std::string& content_type,
                                              std::chrono::milliseconds timeout,
                                              size_t max_body) {
    HttpReply reply;
    std::string& collected = reply.body;
    reply.status = request_streaming(method, path, body, content_type, timeout,
        [&collected, max_body](const char* d, size_t n) {
            if (collected.size() + n > max_body) {
                throw SandboxError("Docker response exceeds " + std::to_string(max_body) + " bytes");
            }
            collected.append(d, n);
        },
        &reply.headers);
    return reply;
}

std::string DockerClient::error_message(const HttpReply& reply) {
    std::string message = "HTTP " + std::to_string(reply.status);
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(reply.body);
    if (Json::parseFromStream(builder, stream, &root, &errors) &&
        root.isObject() && root.isMember("message")) {
        message += ": " + root["message"].asString();
    } else if (!reply.body.empty()) {
        message += ": " + reply.body;
    }
    return message;
}

bool DockerClient::ping() {
    try {
        return request("GET", "/_ping").status == 200;
    } catch (const SandboxError& e) {
        std::cerr << "[Docker] Ping failed: " << e.what() << std::endl;
        return false;
    }
}

bool DockerClient::has_image(const std::string& tag) {
    try {
        request("GET", "/images/" + tag + "/json");
        return true;
    } catch (const SandboxError& e) {
        if (std::string(e.what()).find("HTTP 404") != std::string::npos) {
            return false;
        }
        throw;
    }
}

void DockerClient::build_image(const std::string& tag, const std::string& dockerfile) {
    std::cout << "[Docker] Building image " << tag << std::endl;

    // Progress arrives as newline-delimited JSON objects
    std::string pending;
    std::string build_error;
    auto on_line = [&build_error, &tag](const std::string& line) {
        if (line.find_first_not_of(" \r\t") == std::string::npos) return;
        Json::Value msg = parse_json(line);
        if (msg.isMember("error")) {
            build_error = msg["error"].asString();
        } else if (msg.isMember("stream")) {
            std::string text = msg["stream"].asString();
            if (text.compare(0, 5, "Step ") == 0) {
                std::cout << "[Docker] " << tag << ": " << text;
            }
        }
    };

    request_streaming("POST", "/build?t=" + url_encode(tag) + "&rm=1&forcerm=1",
                      make_build_context(dockerfile), "application/x-tar",
                      std::chrono::seconds(IMAGE_BUILD_TIMEOUT_SECONDS),
                      [&pending, &on_line](const char* d, size_t n) {
                          pending.append(d, n);
                          size_t nl;
                          while ((nl = pending.find('\n')) != std::string::npos) {
                              on_line(pending.substr(0, nl));
                              pending.erase(0, nl + 1);
                          }
                      });
    on_line(pending);

    if (!build_error.empty()) {
        throw SandboxError("image build for " + tag + " failed: " + build_error);
    }
    std::cout << "[Docker] Built image " << tag << std::endl;
}

std::string DockerClient::create_body(const ContainerSpec& spec) {
    Json::Value body;
    body["Image"] = spec.image;
    body["WorkingDir"] = spec.mount_point;
    body["Tty"] = false;
    body["OpenStdin"] = false;
    body["AttachStdout"] = true;
    body["AttachStderr"] = true;
    body["NetworkDisabled"] = spec.network_disabled;
    if (!spec.user.empty()) {
        body["User"] = spec.user;
    }

    Json::Value cmd(Json::arrayValue);
    for (const auto& arg : spec.command) {
        cmd.append(arg);
    }
    body["Cmd"] = cmd;

    Json::Value env(Json::arrayValue);
    for (const auto& [key, value] : spec.env) {
        env.append(key + "=" + value);
    }
    body["Env"] = env;
    body["Labels"]["gradebox.execution"] = spec.name;

    Json::Value& host = body["HostConfig"];
    host["Binds"].append(spec.workspace_host_path + ":" + spec.mount_point + ":rw");
    host["Memory"] = static_cast<Json::Int64>(spec.memory_bytes);
    host["MemorySwap"] = static_cast<Json::Int64>(spec.memory_swap_bytes);
    host["NanoCpus"] = static_cast<Json::Int64>(spec.cpus * 1e9);
    host["PidsLimit"] = spec.pids_limit;
    host["ReadonlyRootfs"] = spec.read_only_rootfs;
    host["Privileged"] = false;
    host["AutoRemove"] = false;
    if (spec.network_disabled) {
        host["NetworkMode"] = "none";
    }
    if (spec.drop_all_capabilities) {
        host["CapDrop"].append("ALL");
    }
    if (spec.no_new_privileges) {
        host["SecurityOpt"].append("no-new-privileges");
    }

    std::string tmpfs_opts = "rw,nosuid,nodev";
    if (spec.tmpfs_bytes > 0) {
        tmpfs_opts += ",size=" + std::to_string(spec.tmpfs_bytes);
    }
    host["Tmpfs"]["/tmp"] = tmpfs_opts;

    Json::Value ulimit;
    ulimit["Name"] = "nofile";
    ulimit["Soft"] = MAX_OPEN_FILES;
    ulimit["Hard"] = MAX_OPEN_FILES;
    host["Ulimits"].append(ulimit);

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, body);
}

std::string DockerClient::create(const ContainerSpec& spec) {
    HttpReply reply = request("POST", "/containers/create?name=gradebox_" + url_encode(spec.name),
                              create_body(spec));
    Json::Value root = parse_json(reply.body);
    std::string id = root.get("Id", "").asString();
    if (id.empty()) {
        throw SandboxError("container create returned no id");
    }
    for (const auto& warning : root["Warnings"]) {
        std::cerr << "[Docker] " << spec.name << ": " << warning.asString() << std::endl;
    }
    return id;
}

void DockerClient::start(const std::string& container_id) {
    request("POST", "/containers/" + container_id + "/start");
}

void DockerClient::stream_logs(const std::string& container_id, LogSink& sink) {
    DockerFrameDemuxer demux(sink);
    request_streaming("GET", "/containers/" + container_id + "/logs?follow=1&stdout=1&stderr=1",
                      "", "", std::chrono::milliseconds(0),
                      [&demux](const char* d, size_t n) { demux.feed(d, n); });
}

WaitResult DockerClient::wait(const std::string& container_id, std::chrono::milliseconds timeout) {
    WaitResult result;
    HttpReply reply;
    try {
        reply = request("POST", "/containers/" + container_id + "/wait?condition=not-running",
                        "", "application/json", timeout);
    } catch (const RequestTimeout&) {
        return result;
    }

    Json::Value root = parse_json(reply.body);
    if (root.isMember("Error") && root["Error"].isObject() &&
        !root["Error"].get("Message", "").asString().empty()) {
        throw SandboxError("wait failed: " + root["Error"]["Message"].asString());
    }
    result.exited = true;
    result.exit_code = root.get("StatusCode", -1).asInt();
    return result;
}

void DockerClient::kill(const std::string& container_id) {
    try {
        request("POST", "/containers/" + container_id + "/kill?signal=SIGKILL");
    } catch (const SandboxError& e) {
        // 409: not running anymore
        std::string what = e.what();
        if (what.find("HTTP 409") == std::string::npos && what.find("HTTP 404") == std::string::npos) {
            throw;
        }
    }
}

void DockerClient::remove(const std::string& container_id) {
    try {
        request("DELETE", "/containers/" + container_id + "?force=1&v=1");
    } catch (const SandboxError& e) {
        // 404: gone, 409: removal already in progress
        std::string what = e.what();
        if (what.find("HTTP 404") == std::string::npos && what.find("HTTP 409") == std::string::npos) {
            throw;
        }
    }
}

size_t DockerClient::peak_memory(const std::string& container_id) {
    try {
        HttpReply reply = request("GET", "/containers/" + container_id + "/stats?stream=false");
        Json::Value stats = parse_json(reply.body)["memory_stats"];
        // max_usage exists on cgroup v1 only
        if (stats.isMember("max_usage")) {
            return static_cast<size_t>(stats["max_usage"].asUInt64());
        }
        return static_cast<size_t>(stats.get("usage", 0).asUInt64());
    } catch (const SandboxError& e) {
        std::cerr << "[Docker] Memory stats unavailable for " << container_id
                  << ": " << e.what() << std::endl;
        return 0;
    }
}

std::string DockerClient::make_build_context(const std::string& dockerfile) {
    char header[512];
    std::memset(header, 0, sizeof(header));

    std::strncpy(header, "Dockerfile", 100);
    write_octal(header + 100, 8, 0644);                 // mode
    write_octal(header + 108, 8, 0);                    // uid
    write_octal(header + 116, 8, 0);                    // gid
    write_octal(header + 124, 12, dockerfile.size());   // size
    write_octal(header + 136, 12, 0);                   // mtime
    header[156] = '0';                                  // regular file
    std::memcpy(header + 257, "ustar", 6);
    std::memcpy(header + 263, "00", 2);

    // Checksum is computed with its own field filled with spaces
    std::memset(header + 148, ' ', 8);
    unsigned long sum = 0;
    for (unsigned char c : header) {
        sum += c;
    }
    std::snprintf(header + 148, 8, "%06lo", sum);
    header[155] = ' ';

    std::string archive(header, sizeof(header));
    archive += dockerfile;
    size_t padding = (512 - dockerfile.size() % 512) % 512;
    archive.append(padding, '\0');
    archive.append(1024, '\0');                         // end-of-archive marker
    return archive;
}

} // namespace gradebox
