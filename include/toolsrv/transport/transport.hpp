#pragma once
#include "../json_rpc.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace toolsrv {

/// Abstract framed message channel.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Block until one complete frame is available.
    /// Returns std::nullopt on end of stream or after interrupt().
    /// Throws TransportError on unrecoverable I/O or encoding failure.
    virtual std::optional<std::string> read_message() = 0;

    /// Serialize and write one frame, then flush. Frames never interleave.
    virtual void write_message(const JsonRpcMessage& msg) = 0;

    /// Wake a blocked read_message() so it returns std::nullopt.
    /// Safe to call from another thread.
    virtual void interrupt() = 0;

    /// Wait up to `timeout` for an in-progress write to complete.
    /// Returns false if a write was still blocked when the time ran out.
    virtual bool flush(std::chrono::milliseconds timeout) = 0;
};

} // namespace toolsrv
