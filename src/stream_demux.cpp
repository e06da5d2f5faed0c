#include "stream_demux.h"
#include "constants.h"
#include "errors.h"
#include <algorithm>

namespace gradebox {

namespace {

constexpr uint8_t STREAM_STDOUT = 1;
constexpr uint8_t STREAM_STDERR = 2;

// Chunk size lines longer than this are not HTTP
constexpr size_t MAX_CHUNK_LINE = 1024;

} // namespace

DockerFrameDemuxer::DockerFrameDemuxer(LogSink& sink) : sink_(sink) {}

void DockerFrameDemuxer::feed(const char* data, size_t len) {
    size_t pos = 0;
    while (pos < len) {
        if (remaining_ == 0) {
            // Accumulate header
            size_t take = std::min(DOCKER_FRAME_HEADER_SIZE - header_filled_, len - pos);
            std::copy(data + pos, data + pos + take, header_ + header_filled_);
            header_filled_ += take;
            pos += take;
            if (header_filled_ < DOCKER_FRAME_HEADER_SIZE) {
                return;
            }

            stream_ = header_[0];
            if (stream_ > STREAM_STDERR) {
                throw SandboxError("Unknown log stream type " + std::to_string(stream_));
            }
            remaining_ = (static_cast<uint32_t>(header_[4]) << 24) |
                         (static_cast<uint32_t>(header_[5]) << 16) |
                         (static_cast<uint32_t>(header_[6]) << 8) |
                         static_cast<uint32_t>(header_[7]);
            header_filled_ = 0;
            continue;
        }

        size_t take = std::min(static_cast<size_t>(remaining_), len - pos);
        if (stream_ == STREAM_STDOUT) {
            sink_.on_stdout(data + pos, take);
        } else if (stream_ == STREAM_STDERR) {
            sink_.on_stderr(data + pos, take);
        }
        // stdin (0) payloads are dropped
        remaining_ -= static_cast<uint32_t>(take);
        pos += take;
    }
}

ChunkedDecoder::ChunkedDecoder(DataCallback on_data) : on_data_(std::move(on_data)) {}

void ChunkedDecoder::feed(const char* data, size_t len) {
    size_t pos = 0;
    while (pos < len && state_ != State::DONE) {
        switch (state_) {
            case State::SIZE:
            case State::DATA_CRLF:
            case State::TRAILER: {
                char c = data[pos++];
                if (c != '\n') {
                    line_ += c;
                    if (line_.size() > MAX_CHUNK_LINE) {
                        throw SandboxError("Malformed chunked encoding: line too long");
                    }
                    break;
                }
                if (!line_.empty() && line_.back() == '\r') {
                    line_.pop_back();
                }

                if (state_ == State::DATA_CRLF) {
                    if (!line_.empty()) {
                        throw SandboxError("Malformed chunked encoding: missing CRLF after data");
                    }
                    state_ = State::SIZE;
                } else if (state_ == State::TRAILER) {
                    // Blank line ends the trailer section
                    if (line_.empty()) {
                        state_ = State::DONE;
                    }
                } else {
                    // Chunk extensions after ';' are ignored
                    std::string size_str = line_.substr(0, line_.find(';'));
                    size_t parsed = 0;
                    try {
                        chunk_remaining_ = std::stoul(size_str, &parsed, 16);
                    } catch (const std::exception&) {
                        throw SandboxError("Malformed chunked encoding: bad size '" + size_str + "'");
                    }
                    if (parsed == 0) {
                        throw SandboxError("Malformed chunked encoding: bad size '" + size_str + "'");
                    }
                    state_ = chunk_remaining_ == 0 ? State::TRAILER : State::DATA;
                }
                line_.clear();
                break;
            }
            case State::DATA: {
                size_t take = std::min(chunk_remaining_, len - pos);
                on_data_(data + pos, take);
                chunk_remaining_ -= take;
                pos += take;
                if (chunk_remaining_ == 0) {
                    state_ = State::DATA_CRLF;
                }
                break;
            }
            case State::DONE:
                break;
        }
    }
}

} // namespace gradebox
