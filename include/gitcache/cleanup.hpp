#pragma once

#include <gitcache/result.hpp>
#include <filesystem>
#include <functional>
#include <string>

namespace gitcache {

// Runs a callback when the scope ends, unless dismissed first.
class ScopedCleanup {
public:
    explicit ScopedCleanup(std::function<void()> fn) : fn_(std::move(fn)) {}
    ~ScopedCleanup() {
        if (fn_) fn_();
    }

    ScopedCleanup(const ScopedCleanup&) = delete;
    ScopedCleanup& operator=(const ScopedCleanup&) = delete;

    // Keep whatever the scope produced
    void dismiss() { fn_ = nullptr; }

private:
    std::function<void()> fn_;
};

// Uniquely named directory under the system temp dir, removed
// recursively on destruction whether or not the scope succeeded.
class TempDir {
public:
    static Result<TempDir> create(const std::string& prefix);

    TempDir(TempDir&& other) noexcept;
    TempDir& operator=(TempDir&&) = delete;
    TempDir(const TempDir&) = delete;
    ~TempDir();

    const std::filesystem::path& path() const { return path_; }

private:
    explicit TempDir(std::filesystem::path p) : path_(std::move(p)) {}
    std::filesystem::path path_;
};

// Installs handlers for SIGHUP, SIGINT, SIGQUIT and SIGTERM for its
// lifetime. Handlers only record the signal; run_command() and
// run_interactive() notice it, stop the child, and fail with
// Interrupted so cleanups unwind through normal returns.
class SignalGuard {
public:
    SignalGuard();
    ~SignalGuard();

    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;
};

// Signal recorded by an active SignalGuard, 0 if none
int pending_signal();

// Record `sig` as if it had been delivered; 0 clears it
void set_pending_signal(int sig);

inline void clear_pending_signal() { set_pending_signal(0); }

// Sets a recorded signal aside for the scope, so cleanup commands can
// still run after an interrupt. The signal is recorded again on exit.
class SignalPause {
public:
    SignalPause() : saved_(pending_signal()) { clear_pending_signal(); }
    ~SignalPause() {
        if (saved_) set_pending_signal(saved_);
    }

    SignalPause(const SignalPause&) = delete;
    SignalPause& operator=(const SignalPause&) = delete;

private:
    int saved_;
};

} // namespace gitcache
