#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <system_error>
#include "process/unique_fd.hpp"

namespace relay::session {

// Buffers outgoing bytes for the agent's stdin; nothing reaches the pipe until
// the buffer fills up or flush() is called.
class LineWriter {
public:
    explicit LineWriter(process::UniqueFd fd, std::size_t capacity = 8192);

    std::error_code write(const std::string& data);
    std::error_code flush();

    std::size_t buffered() const { return buffer_.size(); }

private:
    std::error_code write_all(const char* data, std::size_t size);

    process::UniqueFd fd_;
    std::size_t capacity_;
    std::string buffer_;
};

enum class ReadStatus {
    Line,     // one line, trailing newline included when present
    Eof,      // stream closed with nothing buffered
    Error,
    Timeout
};

struct ReadOutcome {
    ReadStatus status = ReadStatus::Timeout;
    std::string line;
    std::error_code error;
};

// Reads newline-terminated lines from the agent's stdout. Bytes received but
// not yet returned stay buffered across calls, so a read that times out loses
// nothing.
class LineReader {
public:
    explicit LineReader(process::UniqueFd fd);

    ReadOutcome read_line(std::chrono::steady_clock::time_point deadline);

    // Returns a complete line only if one can be assembled without waiting.
    ReadOutcome try_read_line();

    std::size_t buffered() const { return buffer_.size(); }

private:
    bool pop_line(std::string& line);
    // Reads whatever is available right now; false on EOF or error.
    bool fill_available(std::error_code& error);

    process::UniqueFd fd_;
    std::string buffer_;
    bool eof_ = false;
};

}  // namespace relay::session
