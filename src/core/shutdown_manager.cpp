#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <csignal>
#include <unistd.h>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    signal(SIGINT, &ShutdownManager::handleSignal);
    signal(SIGTERM, &ShutdownManager::handleSignal);
    signal(SIGQUIT, &ShutdownManager::handleSignal);

    // A client hanging up on a pipe must not kill the server
    signal(SIGPIPE, SIG_IGN);

    startWatcher();
    Logger::info("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("Signal received", sig);
            }

            if (shutdown_requested_.load())
            {
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    watcher_running_.store(false);
    if (watcher_.joinable())
    {
        watcher_.join();
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_in_progress_.exchange(true))
    {
        return;
    }

    last_signal_.store(signal_number);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    if (signal_number != 0)
    {
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", initiating graceful shutdown");
    }
    else
    {
        Logger::info("ShutdownManager: shutdown requested - " + reason);
    }
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

bool ShutdownManager::waitForShutdownFor(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [this]
                        { return shutdown_requested_.load(); });
}

void ShutdownManager::registerHook(const std::string &name, Hook hook)
{
    std::lock_guard<std::mutex> lk(hooks_mutex_);
    hooks_.emplace_back(name, std::move(hook));
}

void ShutdownManager::runHooks()
{
    std::vector<std::pair<std::string, Hook>> hooks;
    {
        std::lock_guard<std::mutex> lk(hooks_mutex_);
        hooks.swap(hooks_);
    }

    for (auto it = hooks.rbegin(); it != hooks.rend(); ++it)
    {
        Logger::info("ShutdownManager: stopping " + it->first);
        try
        {
            it->second();
        }
        catch (const std::exception &e)
        {
            Logger::error("ShutdownManager: error while stopping " + it->first + ": " + std::string(e.what()));
        }
    }
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    shutdown_requested_.store(false);
    shutdown_in_progress_.store(false);
    last_signal_.store(0);

    signal_flag_ = 0;
    signal_num_ = 0;

    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_.clear();
    }
    {
        std::lock_guard<std::mutex> lk(hooks_mutex_);
        hooks_.clear();
    }
}
