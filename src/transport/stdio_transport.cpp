#include "toolsrv/transport/stdio_transport.hpp"
#include "toolsrv/error.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace toolsrv {

StdioTransport::StdioTransport()
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd) {
    buffer_.reserve(4096);
    if (::pipe(wakeup_pipe_) < 0) {
        throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    // Set non-blocking on write end of wakeup pipe
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::~StdioTransport() {
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

std::optional<std::string> StdioTransport::next_buffered_line() {
    while (true) {
        size_t nl = buffer_.find('\n');
        if (nl == std::string::npos) return std::nullopt;

        std::string line = buffer_.substr(0, nl);
        buffer_.erase(0, nl + 1);

        // Remove trailing \r if present (CRLF)
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) continue;
        return line;
    }
}

std::optional<std::string> StdioTransport::read_message() {
    char chunk[4096];

    while (!interrupted_) {
        auto line = next_buffered_line();
        if (!line && eof_ && !buffer_.empty()) {
            // Final frame without a terminator.
            line = std::move(buffer_);
            buffer_.clear();
            if (!line->empty() && line->back() == '\r') line->pop_back();
            if (line->empty()) line.reset();
        }
        if (line) {
            if (!Codec::valid_utf8(*line)) {
                throw TransportError("Input frame is not valid UTF-8");
            }
            return line;
        }
        if (eof_) return std::nullopt;

        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("poll failed: ") + std::strerror(errno));
        }

        // Wakeup pipe has data → interrupt() was called
        if (fds[1].revents & POLLIN) break;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw TransportError(std::string("Read error: ") + std::strerror(errno));
        }
        if (n == 0) {
            spdlog::debug("stdio: end of input stream");
            eof_ = true;
            continue;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
    return std::nullopt;
}

void StdioTransport::write_message(const JsonRpcMessage& msg) {
    std::string frame = Codec::serialize(msg);
    frame += '\n';

    std::lock_guard<std::timed_mutex> lock(write_mutex_);
    const char* data = frame.data();
    size_t remaining = frame.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("Write error: ") + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::interrupt() {
    if (interrupted_.exchange(true)) return;
    // Write to wakeup pipe to interrupt poll() in read_message().
    char b = 1;
    if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
        spdlog::warn("stdio: failed to signal wakeup pipe: {}", std::strerror(errno));
    }
}

bool StdioTransport::flush(std::chrono::milliseconds timeout) {
    // Frames are written straight to the descriptor; acquiring the lock
    // waits out a frame that is still being written.
    std::unique_lock<std::timed_mutex> lock(write_mutex_, std::defer_lock);
    return lock.try_lock_for(timeout);
}

} // namespace toolsrv
