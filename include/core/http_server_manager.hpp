#pragma once

#include <httplib.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief Owns the HTTP server and its listening thread
 */
class HttpServerManager
{
public:
    static HttpServerManager &getInstance();

    // Server lifecycle
    void start(const std::string &host, int port);
    void stop();
    bool isRunning() const;

    std::string getCurrentHost() const;
    int getCurrentPort() const;

    // Route setup callback, invoked on every new server instance
    using RouteSetupCallback = std::function<void(httplib::Server &)>;
    void setRouteSetupCallback(RouteSetupCallback callback);

private:
    HttpServerManager();
    ~HttpServerManager();
    HttpServerManager(const HttpServerManager &) = delete;
    HttpServerManager &operator=(const HttpServerManager &) = delete;

    void serverThread();
    void stopLocked();

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};

    std::string current_host_;
    int current_port_;

    RouteSetupCallback route_setup_callback_;

    mutable std::mutex server_mutex_;
    mutable std::mutex config_mutex_;
};
