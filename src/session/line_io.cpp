#include "session/line_io.hpp"

#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <utility>

namespace relay::session {

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

std::error_code last_error() {
    return std::error_code(errno, std::generic_category());
}

}  // namespace

LineWriter::LineWriter(process::UniqueFd fd, const std::size_t capacity)
    : fd_(std::move(fd)), capacity_(capacity) {}

std::error_code LineWriter::write_all(const char* data, std::size_t size) {
    if (!fd_.valid()) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    while (size > 0) {
        const ssize_t n = ::write(fd_.get(), data, size);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return last_error();
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code LineWriter::write(const std::string& data) {
    if (!fd_.valid()) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    buffer_ += data;
    if (buffer_.size() < capacity_) {
        return {};
    }
    return flush();
}

std::error_code LineWriter::flush() {
    if (buffer_.empty()) {
        return {};
    }
    // Partially written bytes cannot be retried without corrupting framing.
    const std::string pending = std::move(buffer_);
    buffer_.clear();
    return write_all(pending.data(), pending.size());
}

LineReader::LineReader(process::UniqueFd fd) : fd_(std::move(fd)) {
    if (fd_.valid()) {
        set_nonblocking(fd_.get());
    }
}

bool LineReader::pop_line(std::string& line) {
    const auto newline = buffer_.find('\n');
    if (newline == std::string::npos) {
        return false;
    }
    line = buffer_.substr(0, newline + 1);
    buffer_.erase(0, newline + 1);
    return true;
}

bool LineReader::fill_available(std::error_code& error) {
    char chunk[4096];
    while (true) {
        const ssize_t n = ::read(fd_.get(), chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            eof_ = true;
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        error = last_error();
        return false;
    }
}

ReadOutcome LineReader::read_line(const std::chrono::steady_clock::time_point deadline) {
    ReadOutcome outcome;
    if (!fd_.valid()) {
        outcome.status = ReadStatus::Error;
        outcome.error = std::make_error_code(std::errc::bad_file_descriptor);
        return outcome;
    }

    while (true) {
        if (pop_line(outcome.line)) {
            outcome.status = ReadStatus::Line;
            return outcome;
        }
        if (eof_) {
            if (buffer_.empty()) {
                outcome.status = ReadStatus::Eof;
            } else {
                outcome.status = ReadStatus::Line;
                outcome.line = std::move(buffer_);
                buffer_.clear();
            }
            return outcome;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            outcome.status = ReadStatus::Timeout;
            return outcome;
        }
        // Round up so a sub-millisecond remainder still waits.
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
            std::chrono::milliseconds(1);

        pollfd pfd{};
        pfd.fd = fd_.get();
        pfd.events = POLLIN;
        const int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            outcome.status = ReadStatus::Error;
            outcome.error = last_error();
            return outcome;
        }
        if (ready == 0) {
            continue;
        }

        std::error_code error;
        if (!fill_available(error) && error) {
            outcome.status = ReadStatus::Error;
            outcome.error = error;
            return outcome;
        }
    }
}

ReadOutcome LineReader::try_read_line() {
    ReadOutcome outcome;
    if (fd_.valid() && !eof_) {
        std::error_code error;
        if (!fill_available(error) && error) {
            outcome.status = ReadStatus::Error;
            outcome.error = error;
            return outcome;
        }
    }
    if (pop_line(outcome.line)) {
        outcome.status = ReadStatus::Line;
        return outcome;
    }
    outcome.status = eof_ && buffer_.empty() ? ReadStatus::Eof : ReadStatus::Timeout;
    return outcome;
}

}  // namespace relay::session
