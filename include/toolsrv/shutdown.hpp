#pragma once
#include "transport/transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string_view>
#include <thread>

namespace toolsrv {

class Session;

enum class ShutdownReason {
    None,
    Request,
    Signal,
    EndOfInput,
    Fatal
};

std::string_view shutdown_reason_name(ShutdownReason r);

/// Coordinates orderly termination of the serve loop.
///
/// A shutdown request only raises a marker and wakes the transport; the
/// loop observes it at the next frame boundary. Signals are taken
/// synchronously on a watcher thread, which also enforces the grace period:
/// the in-flight tool call must finish and the serve loop must detach its
/// transport before it runs out, or the process is forced down.
class ShutdownController {
public:
    using ForceExit = std::function<void(int code)>;

    /// Tracks one in-flight tool call for the lifetime of the guard.
    class CallGuard {
    public:
        explicit CallGuard(ShutdownController& owner);
        ~CallGuard();

        CallGuard(const CallGuard&) = delete;
        CallGuard& operator=(const CallGuard&) = delete;

    private:
        ShutdownController& owner_;
    };

    ShutdownController(Session& session, std::chrono::milliseconds grace_period);
    ~ShutdownController();

    ShutdownController(const ShutdownController&) = delete;
    ShutdownController& operator=(const ShutdownController&) = delete;

    /// Transport to interrupt on shutdown, attached for as long as the serve
    /// loop runs. Passing nullptr detaches it and waits for an interrupt()
    /// that is still running on another thread, so the transport may be
    /// destroyed as soon as this returns.
    void attach(ITransport* transport);

    /// Block SIGINT and SIGTERM in the calling thread and start the watcher.
    /// Must run before any other thread is created so the mask is inherited.
    void watch_signals();

    /// Raise the shutdown marker. Non-blocking; the first reason wins.
    void request_shutdown(ShutdownReason reason);

    /// Handle a termination signal: request shutdown, then wait for the
    /// serve loop to drain and force the exit if the grace period runs out.
    void on_signal(int signo);

    /// Wait up to the grace period until no call is in flight and no
    /// transport is attached. Returns false if the period elapsed first.
    bool await_drain();

    [[nodiscard]] CallGuard begin_call() { return CallGuard(*this); }
    [[nodiscard]] bool call_in_flight() const;

    /// Replace the forced-exit action (tests).
    void set_force_exit(ForceExit fn);

    [[nodiscard]] bool requested() const { return requested_.load(); }
    [[nodiscard]] ShutdownReason reason() const;
    [[nodiscard]] std::chrono::milliseconds grace_period() const { return grace_period_; }

private:
    void watcher_loop();
    void force_exit(int code);

    Session& session_;
    std::chrono::milliseconds grace_period_;

    std::atomic<bool> requested_{false};
    std::atomic<ShutdownReason> reason_{ShutdownReason::None};
    // Held across interrupt() and the forced flush; always taken before
    // calls_mutex_ when both are needed.
    std::mutex transport_mutex_;
    ITransport* transport_{nullptr};

    mutable std::mutex calls_mutex_;
    std::condition_variable calls_cv_;
    int in_flight_{0};
    bool serving_{false};

    ForceExit force_exit_;
    std::mutex force_exit_mutex_;

    std::atomic<bool> stop_watcher_{false};
    std::thread watcher_;
};

} // namespace toolsrv
