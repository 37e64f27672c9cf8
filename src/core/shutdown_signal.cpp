#include "core/shutdown_signal.hpp"
#include "logging/logger.hpp"
#include <csignal>
#include <pthread.h>

namespace
{
    sigset_t shutdownSignals()
    {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGQUIT);
        return set;
    }
}

ShutdownSignal &ShutdownSignal::getInstance()
{
    static ShutdownSignal instance;
    return instance;
}

ShutdownSignal::~ShutdownSignal()
{
    if (watcher_.joinable())
    {
        // Wake the watcher if it is still parked in sigwait()
        pthread_kill(watcher_.native_handle(), SIGTERM);
        watcher_.join();
    }
}

void ShutdownSignal::install()
{
    if (watcher_.joinable())
    {
        return;
    }

    sigset_t set = shutdownSignals();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0)
    {
        Logger::error("ShutdownSignal: pthread_sigmask failed with code " + std::to_string(rc));
        return;
    }

    watcher_ = std::thread([this, set]()
                           {
        int sig = 0;
        if (sigwait(&set, &sig) != 0 || requested_.load())
        {
            return;
        }
        request("signal " + std::to_string(sig)); });

    Logger::debug("ShutdownSignal: signal handlers installed");
}

void ShutdownSignal::request(const std::string &reason)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requested_.load())
        {
            return;
        }
        reason_ = reason;
        requested_.store(true);
    }
    cv_.notify_all();
    Logger::info("ShutdownSignal: shutdown requested (" + reason + ")");
}

void ShutdownSignal::wait()
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]
             { return requested_.load(); });
}

std::string ShutdownSignal::reason() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}
