#pragma once

#include "container_runtime.h"

#include <string>
#include <functional>
#include <cstdint>

namespace gradebox {

// Splits the Docker attach/logs stream into stdout and stderr.
// Each frame is an 8-byte header {stream, 0, 0, 0, size (big-endian u32)}
// followed by size bytes of payload. Frames may arrive split across reads.
class DockerFrameDemuxer {
public:
    explicit DockerFrameDemuxer(LogSink& sink);

    // Throws SandboxError on an unknown stream type
    void feed(const char* data, size_t len);

    // True while a frame is incomplete
    bool has_partial() const { return header_filled_ > 0 || remaining_ > 0; }

private:
    LogSink& sink_;
    uint8_t header_[8] = {};
    size_t header_filled_ = 0;
    uint8_t stream_ = 0;
    uint32_t remaining_ = 0;   // Payload bytes still expected for the current frame
};

// Incremental decoder for HTTP/1.1 chunked transfer encoding
class ChunkedDecoder {
public:
    using DataCallback = std::function<void(const char*, size_t)>;

    explicit ChunkedDecoder(DataCallback on_data);

    // Throws SandboxError on malformed input
    void feed(const char* data, size_t len);

    // Terminating zero-length chunk seen
    bool done() const { return state_ == State::DONE; }

private:
    enum class State { SIZE, DATA, DATA_CRLF, TRAILER, DONE };

    DataCallback on_data_;
    State state_ = State::SIZE;
    std::string line_;
    size_t chunk_remaining_ = 0;
};

} // namespace gradebox
