#pragma once

#include "HttpMessage.hpp"
#include "ServerConfig.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <thread>

namespace itemstore {

class ServerImpl;
class ItemStore;

using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

// HTTP/1.1 front end of an ItemStore: one request per connection,
// served from a polling loop on a background thread
class Server {
public:
    Server(const ServerConfig& config, ItemStore& store);
    // serves every request through handler instead of the item routes
    Server(const ServerConfig& config, RequestHandler handler);
    ~Server();
    
    // binds and listens synchronously, then starts the loop thread
    bool start();
    void stop();
    bool isRunning() const;
    
    // bound port, resolved after start() when the config asked for port 0
    int getPort() const;
    size_t getConnectionCount() const;
    
private:
    void run();

    ServerConfig config_;
    std::atomic<bool> running_;
    std::atomic<int> boundPort_;
    std::unique_ptr<ServerImpl> impl_;
    std::thread serverThread_;
};

} // namespace itemstore
