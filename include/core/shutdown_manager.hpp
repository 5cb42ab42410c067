#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

/**
 * Centralized shutdown manager.
 * - Installs async-signal-safe handlers for SIGINT/SIGTERM/SIGQUIT
 * - Exposes a single observable shutdown state for the process
 * - Runs registered shutdown hooks (scheduler, segmenter, config watcher) once, newest first
 */
class ShutdownManager
{
public:
    using Hook = std::function<void()>;

    static ShutdownManager &getInstance();

    // Install signal handlers and start internal watcher thread
    void installSignalHandlers();

    // Programmatically request shutdown (safe from any thread, not from a signal handler)
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    // Block until shutdown has been requested
    void waitForShutdown();

    // Block for at most `timeout`; returns true when shutdown was requested
    bool waitForShutdownFor(std::chrono::milliseconds timeout);

    /**
     * @brief Register a named step to run when the process shuts down
     */
    void registerHook(const std::string &name, Hook hook);

    /**
     * @brief Run every registered hook once, in reverse registration order
     */
    void runHooks();

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    // Async-signal-safe handler (sets only sig_atomic_t flags)
    static void handleSignal(int sig) noexcept;

    // Background watcher translating signal flags into a shutdown request
    void startWatcher();
    void stopWatcher();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_in_progress_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::mutex hooks_mutex_;
    std::vector<std::pair<std::string, Hook>> hooks_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};
