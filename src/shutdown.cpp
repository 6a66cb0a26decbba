#include "toolsrv/shutdown.hpp"
#include "toolsrv/error.hpp"
#include "toolsrv/session.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <pthread.h>
#include <signal.h>

namespace toolsrv {

namespace {

// Upper bound on waiting for a blocked output write before a forced exit.
constexpr std::chrono::milliseconds kForcedFlushLimit{250};

} // anonymous namespace

std::string_view shutdown_reason_name(ShutdownReason r) {
    switch (r) {
        case ShutdownReason::None:       return "none";
        case ShutdownReason::Request:    return "shutdown request";
        case ShutdownReason::Signal:     return "signal";
        case ShutdownReason::EndOfInput: return "end of input";
        case ShutdownReason::Fatal:      return "fatal error";
    }
    return "unknown";
}

// ----------- CallGuard -----------

ShutdownController::CallGuard::CallGuard(ShutdownController& owner) : owner_(owner) {
    std::lock_guard<std::mutex> lock(owner_.calls_mutex_);
    ++owner_.in_flight_;
}

ShutdownController::CallGuard::~CallGuard() {
    {
        std::lock_guard<std::mutex> lock(owner_.calls_mutex_);
        --owner_.in_flight_;
    }
    owner_.calls_cv_.notify_all();
}

// ----------- ShutdownController -----------

ShutdownController::ShutdownController(Session& session, std::chrono::milliseconds grace_period)
    : session_(session), grace_period_(grace_period) {
    force_exit_ = [this](int code) {
        spdlog::critical("Server did not stop within {} ms; forcing exit", grace_period_.count());
        {
            std::lock_guard<std::mutex> lock(transport_mutex_);
            if (transport_ && !transport_->flush(kForcedFlushLimit)) {
                spdlog::critical("Output is blocked; abandoning the pending frame");
            }
        }
        spdlog::default_logger()->flush();
        std::_Exit(code);
    };
}

ShutdownController::~ShutdownController() {
    stop_watcher_ = true;
    if (watcher_.joinable()) {
        watcher_.join();
    }
}

void ShutdownController::attach(ITransport* transport) {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    transport_ = transport;
    {
        std::lock_guard<std::mutex> calls_lock(calls_mutex_);
        serving_ = transport != nullptr;
    }
    calls_cv_.notify_all();
}

void ShutdownController::watch_signals() {
    if (watcher_.joinable()) return;

    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        throw Error("pthread_sigmask failed: " + std::to_string(rc));
    }
    watcher_ = std::thread([this] { watcher_loop(); });
}

void ShutdownController::watcher_loop() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);

    // Poll so the destructor can stop the thread without a signal.
    const timespec tick{0, 100 * 1000 * 1000};
    while (!stop_watcher_) {
        int signo = sigtimedwait(&set, nullptr, &tick);
        if (signo > 0) {
            on_signal(signo);
        }
    }
}

void ShutdownController::request_shutdown(ShutdownReason reason) {
    ShutdownReason expected = ShutdownReason::None;
    if (reason_.compare_exchange_strong(expected, reason)) {
        spdlog::info("Shutting down ({})", shutdown_reason_name(reason));
    }
    requested_ = true;
    session_.begin_shutdown();

    std::lock_guard<std::mutex> lock(transport_mutex_);
    if (transport_) {
        transport_->interrupt();
    }
}

void ShutdownController::on_signal(int signo) {
    spdlog::info("Received signal {}", signo);
    request_shutdown(ShutdownReason::Signal);
    if (!await_drain()) {
        force_exit(exit_code::Forced);
    }
}

bool ShutdownController::await_drain() {
    std::unique_lock<std::mutex> lock(calls_mutex_);
    return calls_cv_.wait_for(lock, grace_period_,
                              [this] { return in_flight_ == 0 && !serving_; });
}

bool ShutdownController::call_in_flight() const {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    return in_flight_ > 0;
}

void ShutdownController::set_force_exit(ForceExit fn) {
    std::lock_guard<std::mutex> lock(force_exit_mutex_);
    force_exit_ = std::move(fn);
}

void ShutdownController::force_exit(int code) {
    ForceExit fn;
    {
        std::lock_guard<std::mutex> lock(force_exit_mutex_);
        fn = force_exit_;
    }
    if (fn) fn(code);
}

ShutdownReason ShutdownController::reason() const {
    return reason_.load();
}

} // namespace toolsrv
