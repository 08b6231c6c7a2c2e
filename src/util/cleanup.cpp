#include <gitcache/cleanup.hpp>
#include <gitcache/log.hpp>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <random>

#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace gitcache {

// ---------------------------------------------------------------------------
// TempDir
// ---------------------------------------------------------------------------

Result<TempDir> TempDir::create(const std::string& prefix) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        return GitcacheError{GitcacheError::IO,
            "cannot locate temp directory: " + ec.message()};
    }

    std::mt19937_64 rng(static_cast<uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count()) ^
        static_cast<uint64_t>(getpid()));

    for (int attempt = 0; attempt < 16; ++attempt) {
        fs::path candidate = base / (prefix + "." + std::to_string(rng() % 1000000007ULL));
        // create_directory reports false when the entry already exists
        if (fs::create_directory(candidate, ec)) {
            log::trace("created temp dir %s", candidate.c_str());
            return Result<TempDir>::ok(TempDir(candidate));
        }
        if (ec) {
            return GitcacheError{GitcacheError::IO,
                "cannot create temp directory " + candidate.string() + ": " + ec.message()};
        }
    }
    return GitcacheError{GitcacheError::IO,
        "cannot find a free temp directory name under " + base.string()};
}

TempDir::TempDir(TempDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempDir::~TempDir() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        log::warn("could not remove temp dir %s: %s", path_.c_str(), ec.message().c_str());
    } else {
        log::trace("removed temp dir %s", path_.c_str());
    }
}

// ---------------------------------------------------------------------------
// SignalGuard
// ---------------------------------------------------------------------------

static volatile std::sig_atomic_t s_pending_signal = 0;

static const int kGuardedSignals[] = {SIGHUP, SIGINT, SIGQUIT, SIGTERM};
static constexpr size_t kNumGuarded = sizeof(kGuardedSignals) / sizeof(kGuardedSignals[0]);

static struct sigaction s_previous[kNumGuarded];
static int s_guard_depth = 0;

extern "C" void gitcache_record_signal(int sig) {
    s_pending_signal = sig;
}

SignalGuard::SignalGuard() {
    if (s_guard_depth++ > 0) return;

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = gitcache_record_signal;
    sigemptyset(&sa.sa_mask);
    for (size_t i = 0; i < kNumGuarded; ++i) {
        sigaction(kGuardedSignals[i], &sa, &s_previous[i]);
    }
}

SignalGuard::~SignalGuard() {
    if (--s_guard_depth > 0) return;
    for (size_t i = 0; i < kNumGuarded; ++i) {
        sigaction(kGuardedSignals[i], &s_previous[i], nullptr);
    }
}

int pending_signal() {
    return static_cast<int>(s_pending_signal);
}

void set_pending_signal(int sig) {
    s_pending_signal = sig;
}

} // namespace gitcache
