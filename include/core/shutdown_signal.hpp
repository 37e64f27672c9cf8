#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

/**
 * Process-wide shutdown latch for the long-running service.
 * - install() blocks SIGINT/SIGTERM/SIGQUIT and hands them to a sigwait() thread
 * - wait() returns once a signal arrives or request() is called
 *
 * install() must run before any other thread is spawned so every thread
 * inherits the blocked mask.
 */
class ShutdownSignal
{
public:
    static ShutdownSignal &getInstance();

    void install();
    void request(const std::string &reason);
    void wait();

    bool isRequested() const { return requested_.load(); }
    std::string reason() const;

private:
    ShutdownSignal() = default;
    ~ShutdownSignal();
    ShutdownSignal(const ShutdownSignal &) = delete;
    ShutdownSignal &operator=(const ShutdownSignal &) = delete;

    std::thread watcher_;
    std::atomic<bool> requested_{false};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};
