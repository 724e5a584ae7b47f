#include "Server.hpp"
#include "ClientSession.hpp"
#include "HttpMessage.hpp"
#include "ItemApi.hpp"
#include "ItemStore.hpp"
#include <iostream>
#include <cerrno>
#include <cstring>
#include <vector>
#include <map>
#include <mutex>
#include <stdexcept>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <fcntl.h>
#include <arpa/inet.h>

namespace itemstore
{

    constexpr size_t kMaxDrainBytes = 64 * 1024;

    class ServerImpl
    {
    public:
        int serverSocket = -1;
        std::map<int, std::unique_ptr<ClientSession>> clients; // socket -> session
        mutable std::mutex clientsMutex;
        std::unique_ptr<ItemApi> api;
        RequestHandler handler;

        explicit ServerImpl(ItemStore &store) : api(std::make_unique<ItemApi>(store))
        {
            ItemApi *routes = api.get();
            handler = [routes](const HttpRequest &request) { return routes->handle(request); };
        }

        explicit ServerImpl(RequestHandler requestHandler) : handler(std::move(requestHandler))
        {
        }

        bool openListener(const ServerConfig &config);
        void closeListener();
        int localPort() const;

        void acceptClients();
        void handleClient(int clientSocket);
        HttpResponse dispatch(const HttpRequest &request, const std::string &peer);
        bool sendResponse(int socket, const HttpResponse &response);
        void closeIdleSessions(std::chrono::milliseconds idleTimeout);
        void closeAllSessions();
        void disconnectClientNoLock(int clientSocket); // caller holds clientsMutex
    };

    Server::Server(const ServerConfig &config, ItemStore &store)
        : config_(config), running_(false), boundPort_(0)
    {
        impl_ = std::make_unique<ServerImpl>(store);
    }

    Server::Server(const ServerConfig &config, RequestHandler handler)
        : config_(config), running_(false), boundPort_(0)
    {
        impl_ = std::make_unique<ServerImpl>(std::move(handler));
    }

    Server::~Server()
    {
        stop();
    }

    bool Server::start()
    {
        if (running_)
        {
            return true;
        }

        if (!impl_->openListener(config_))
        {
            return false;
        }

        boundPort_ = impl_->localPort();
        running_ = true;
        serverThread_ = std::thread(&Server::run, this);
        std::cout << "Server listening on " << config_.bindAddress << ":" << boundPort_ << std::endl;
        return true;
    }

    void Server::stop()
    {
        running_ = false;

        // the loop thread owns the sockets and closes them on exit
        if (serverThread_.joinable())
        {
            serverThread_.join();
            std::cout << "Server stopped" << std::endl;
        }
    }

    bool Server::isRunning() const
    {
        return running_;
    }

    int Server::getPort() const
    {
        return boundPort_;
    }

    size_t Server::getConnectionCount() const
    {
        std::lock_guard<std::mutex> lock(impl_->clientsMutex);
        return impl_->clients.size();
    }

    void Server::run()
    {
        while (running_)
        {
            impl_->acceptClients();

            std::vector<int> socketsToHandle;
            {
                std::lock_guard<std::mutex> lock(impl_->clientsMutex);
                for (auto &[socket, session] : impl_->clients)
                {
                    socketsToHandle.push_back(socket);
                }
            }

            for (int socket : socketsToHandle)
            {
                impl_->handleClient(socket);
            }

            impl_->closeIdleSessions(config_.idleTimeout);

            // avoid busy waiting
            usleep(10000); // 10ms
        }

        impl_->closeAllSessions();
        impl_->closeListener();
    }

    bool ServerImpl::openListener(const ServerConfig &config)
    {
        sockaddr_in serverAddr{};
        serverAddr.sin_family = AF_INET;
        serverAddr.sin_port = htons(static_cast<uint16_t>(config.port));
        if (inet_pton(AF_INET, config.bindAddress.c_str(), &serverAddr.sin_addr) != 1)
        {
            std::cerr << "Invalid bind address " << config.bindAddress << std::endl;
            return false;
        }

        serverSocket = socket(AF_INET, SOCK_STREAM, 0);
        if (serverSocket < 0)
        {
            std::cerr << "Failed to create socket: " << std::strerror(errno) << std::endl;
            return false;
        }

        int opt = 1;
        setsockopt(serverSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        // non-blocking socket
        fcntl(serverSocket, F_SETFL, O_NONBLOCK);

        if (bind(serverSocket, (sockaddr *)&serverAddr, sizeof(serverAddr)) < 0)
        {
            std::cerr << "Failed to bind socket on port " << config.port << ": " << std::strerror(errno) << std::endl;
            closeListener();
            return false;
        }

        if (listen(serverSocket, config.listenBacklog) < 0)
        {
            std::cerr << "Failed to listen on socket: " << std::strerror(errno) << std::endl;
            closeListener();
            return false;
        }

        return true;
    }

    void ServerImpl::closeListener()
    {
        if (serverSocket >= 0)
        {
            shutdown(serverSocket, SHUT_RDWR);
            close(serverSocket);
            serverSocket = -1;
        }
    }

    int ServerImpl::localPort() const
    {
        sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        if (getsockname(serverSocket, (sockaddr *)&addr, &len) < 0)
        {
            return 0;
        }
        return ntohs(addr.sin_port);
    }

    void ServerImpl::acceptClients()
    {
        while (true)
        {
            sockaddr_in clientAddr{};
            socklen_t clientLen = sizeof(clientAddr);

            int clientSocket = accept(serverSocket, (sockaddr *)&clientAddr, &clientLen);
            if (clientSocket < 0)
            {
                // EWOULDBLOCK or EAGAIN once the backlog is drained
                if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                {
                    std::cerr << "accept failed: " << std::strerror(errno) << std::endl;
                }
                return;
            }

            fcntl(clientSocket, F_SETFL, O_NONBLOCK);

            char peer[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &clientAddr.sin_addr, peer, sizeof(peer));

            std::lock_guard<std::mutex> lock(clientsMutex);
            clients[clientSocket] = std::make_unique<ClientSession>(peer);
        }
    }

    void ServerImpl::handleClient(int clientSocket)
    {
        std::lock_guard<std::mutex> lock(clientsMutex);

        auto it = clients.find(clientSocket);
        if (it == clients.end())
        {
            return;
        }
        ClientSession &session = *it->second;

        char buffer[4096];
        ssize_t bytesRead = recv(clientSocket, buffer, sizeof(buffer), 0);
        if (bytesRead == 0)
        {
            disconnectClientNoLock(clientSocket);
            return;
        }
        if (bytesRead < 0)
        {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
            {
                disconnectClientNoLock(clientSocket);
            }
            return;
        }

        session.appendData(buffer, static_cast<size_t>(bytesRead));

        HttpRequest request;
        size_t consumed = 0;
        ParseResult result = HttpRequest::parse(session.getBuffer(), request, consumed);

        if (result == ParseResult::INCOMPLETE)
        {
            return;
        }

        if (result == ParseResult::INVALID)
        {
            std::cerr << "Malformed request from " << session.getPeer() << std::endl;
            Json body;
            body["detail"] = "Bad Request";
            if (!sendResponse(clientSocket, HttpResponse::json(400, body)))
            {
                std::cerr << "Failed to send response to " << session.getPeer() << std::endl;
            }
            disconnectClientNoLock(clientSocket);
            return;
        }

        HttpResponse response = dispatch(request, session.getPeer());
        std::cout << session.getPeer() << " \"" << request.method << " " << request.target << "\" "
                  << response.status << std::endl;

        if (!sendResponse(clientSocket, response))
        {
            std::cerr << "Failed to send response to " << session.getPeer() << std::endl;
        }

        // one request per connection, pipelined bytes are dropped
        if (consumed < session.getBuffer().size())
        {
            std::cerr << "Dropping " << session.getBuffer().size() - consumed << " trailing bytes from "
                      << session.getPeer() << std::endl;
        }
        disconnectClientNoLock(clientSocket);
    }

    HttpResponse ServerImpl::dispatch(const HttpRequest &request, const std::string &peer)
    {
        // the loop thread must survive a failing handler
        try
        {
            return handler(request);
        }
        catch (const std::exception &e)
        {
            std::cerr << "Request " << request.method << " " << request.target << " from " << peer
                      << " failed: " << e.what() << std::endl;
        }

        Json body;
        body["detail"] = "Internal Server Error";
        return HttpResponse::json(500, body);
    }

    bool ServerImpl::sendResponse(int socket, const HttpResponse &response)
    {
        std::string data = response.serialize();
        size_t sent = 0;
        int retries = 0;

        while (sent < data.size())
        {
            ssize_t bytesSent = send(socket, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (bytesSent > 0)
            {
                sent += static_cast<size_t>(bytesSent);
                continue;
            }
            if (bytesSent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) && retries < 500)
            {
                // the socket is non-blocking, give the peer time to drain
                ++retries;
                usleep(1000);
                continue;
            }
            return false;
        }
        return true;
    }

    void ServerImpl::closeIdleSessions(std::chrono::milliseconds idleTimeout)
    {
        auto now = std::chrono::steady_clock::now();

        std::lock_guard<std::mutex> lock(clientsMutex);
        std::vector<int> idle;
        for (const auto &[socket, session] : clients)
        {
            if (session->isIdle(now, idleTimeout))
            {
                idle.push_back(socket);
            }
        }

        for (int socket : idle)
        {
            std::cout << "Closing idle connection from " << clients[socket]->getPeer() << std::endl;
            disconnectClientNoLock(socket);
        }
    }

    void ServerImpl::closeAllSessions()
    {
        std::lock_guard<std::mutex> lock(clientsMutex);
        for (auto &[socket, session] : clients)
        {
            shutdown(socket, SHUT_RDWR);
            close(socket);
        }
        clients.clear();
    }

    void ServerImpl::disconnectClientNoLock(int clientSocket)
    {
        clients.erase(clientSocket);

        // closing with unread input sends a reset that can discard the response,
        // so finish our side first and read away what the peer already sent
        shutdown(clientSocket, SHUT_WR);
        char scratch[4096];
        size_t drained = 0;
        while (drained < kMaxDrainBytes)
        {
            ssize_t n = recv(clientSocket, scratch, sizeof(scratch), 0);
            if (n <= 0)
            {
                break;
            }
            drained += static_cast<size_t>(n);
        }
        close(clientSocket);
    }

} // namespace itemstore
