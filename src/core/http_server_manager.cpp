#include "core/http_server_manager.hpp"
#include "logging/logger.hpp"

HttpServerManager::HttpServerManager() : current_host_("0.0.0.0"), current_port_(8000)
{
}

HttpServerManager::~HttpServerManager()
{
    stop();
}

HttpServerManager &HttpServerManager::getInstance()
{
    static HttpServerManager instance;
    return instance;
}

void HttpServerManager::start(const std::string &host, int port)
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (running_.load())
    {
        Logger::warn("HttpServerManager: Server is already running. Stopping current instance first.");
        stopLocked();
    }

    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        current_host_ = host;
        current_port_ = port;
    }

    server_ = std::make_unique<httplib::Server>();
    if (route_setup_callback_)
    {
        route_setup_callback_(*server_);
    }
    else
    {
        Logger::warn("HttpServerManager: No routes registered");
    }

    running_.store(true);
    server_thread_ = std::thread(&HttpServerManager::serverThread, this);

    Logger::info("HttpServerManager: Server started on " + host + ":" + std::to_string(port));
}

void HttpServerManager::stop()
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    stopLocked();
}

void HttpServerManager::stopLocked()
{
    if (!server_)
    {
        return;
    }

    running_.store(false);
    server_->stop();

    if (server_thread_.joinable())
    {
        server_thread_.join();
    }

    server_.reset();

    Logger::info("HttpServerManager: Server stopped");
}

bool HttpServerManager::isRunning() const
{
    return running_.load();
}

std::string HttpServerManager::getCurrentHost() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return current_host_;
}

int HttpServerManager::getCurrentPort() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return current_port_;
}

void HttpServerManager::setRouteSetupCallback(RouteSetupCallback callback)
{
    route_setup_callback_ = std::move(callback);
}

void HttpServerManager::serverThread()
{
    std::string host;
    int port;

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        host = current_host_;
        port = current_port_;
    }

    try
    {
        if (!server_->listen(host, port))
        {
            Logger::error("HttpServerManager: Failed to start server on " + host + ":" + std::to_string(port));
            running_.store(false);
            return;
        }

        Logger::info("HttpServerManager: Server thread completed");
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: Server thread error: " + std::string(e.what()));
    }
    running_.store(false);
}
