#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <mutex>
#include <string>

namespace toolsrv {

/// StdioTransport reads newline-delimited JSON from stdin and writes to stdout.
/// Reads block in poll() on the input and an internal wakeup pipe so that
/// interrupt() can end a pending read from another thread.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// The descriptors are not closed by the transport.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    std::optional<std::string> read_message() override;
    void write_message(const JsonRpcMessage& msg) override;
    void interrupt() override;
    bool flush(std::chrono::milliseconds timeout) override;

    bool eof() const { return eof_; }

private:
    std::optional<std::string> next_buffered_line();

    int read_fd_;
    int write_fd_;

    std::string buffer_;
    bool eof_{false};
    std::atomic<bool> interrupted_{false};

    std::timed_mutex write_mutex_;

    int wakeup_pipe_[2]{-1, -1};
};

} // namespace toolsrv
