#include "ItemStore.hpp"
#include "Server.hpp"
#include <catch2/catch.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <stdexcept>
#include <string>

using namespace itemstore;

namespace {

ServerConfig loopbackConfig() {
    ServerConfig config;
    config.bindAddress = "127.0.0.1";
    config.port = 0;
    return config;
}

// sends raw bytes and reads until the server closes the connection
std::string exchange(int port, const std::string& request) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);

    timeval timeout{};
    timeout.tv_sec = 5;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

    if (connect(fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        FAIL("connect failed");
    }

    send(fd, request.data(), request.size(), MSG_NOSIGNAL);

    std::string response;
    char buffer[4096];
    ssize_t n;
    while ((n = recv(fd, buffer, sizeof(buffer), 0)) > 0) {
        response.append(buffer, static_cast<size_t>(n));
    }
    close(fd);
    return response;
}

std::string bodyOf(const std::string& response) {
    size_t split = response.find("\r\n\r\n");
    return split == std::string::npos ? "" : response.substr(split + 4);
}

} // namespace

TEST_CASE("serves items over a loopback connection", "[server]") {
    ItemStore store;
    Server server(loopbackConfig(), store);
    REQUIRE(server.start());
    REQUIRE(server.isRunning());
    REQUIRE(server.getPort() > 0);

    std::string body = R"({"name":"Widget","price":9.99})";
    std::string created = exchange(server.getPort(),
                                   "POST /items HTTP/1.1\r\n"
                                   "Host: localhost\r\n"
                                   "Content-Type: application/json\r\n"
                                   "Content-Length: " + std::to_string(body.size()) + "\r\n"
                                   "\r\n" + body);

    CHECK(created.rfind("HTTP/1.1 201 Created\r\n", 0) == 0);
    CHECK(bodyOf(created) ==
          R"({"message":"Item created successfully","item":)"
          R"({"id":1,"name":"Widget","description":null,"price":9.99,"quantity":0}})");
    CHECK(store.count() == 1);

    std::string fetched = exchange(server.getPort(), "GET /items/1 HTTP/1.1\r\nHost: localhost\r\n\r\n");
    CHECK(fetched.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    CHECK(bodyOf(fetched) == R"({"id":1,"name":"Widget","description":null,"price":9.99,"quantity":0})");

    std::string missing = exchange(server.getPort(), "GET /items/2 HTTP/1.1\r\n\r\n");
    CHECK(missing.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);

    server.stop();
    CHECK_FALSE(server.isRunning());
}

TEST_CASE("answers malformed requests with 400", "[server]") {
    ItemStore store;
    Server server(loopbackConfig(), store);
    REQUIRE(server.start());

    std::string response = exchange(server.getPort(), "NOT HTTP\r\n\r\n");
    CHECK(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0);
    CHECK(bodyOf(response) == R"({"detail":"Bad Request"})");
}

TEST_CASE("fails to start on an unusable address", "[server]") {
    ItemStore store;
    ServerConfig config = loopbackConfig();
    config.bindAddress = "not-an-address";

    Server server(config, store);
    CHECK_FALSE(server.start());
    CHECK_FALSE(server.isRunning());
}

TEST_CASE("keeps serving after a body with invalid UTF-8", "[server]") {
    ItemStore store;
    Server server(loopbackConfig(), store);
    REQUIRE(server.start());

    std::string body = "{\"name\":\"\xff\",\"price\":1}";
    std::string rejected = exchange(server.getPort(),
                                    "POST /items HTTP/1.1\r\n"
                                    "Content-Length: " + std::to_string(body.size()) + "\r\n"
                                    "\r\n" + body);
    CHECK(rejected.rfind("HTTP/1.1 422 Unprocessable Entity\r\n", 0) == 0);
    CHECK(bodyOf(rejected).find("value_error.jsondecode") != std::string::npos);

    CHECK(server.isRunning());
    std::string listed = exchange(server.getPort(), "GET /items HTTP/1.1\r\n\r\n");
    CHECK(listed.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    CHECK(bodyOf(listed) == R"({"items":[],"count":0})");
}

TEST_CASE("a throwing handler is answered with 500", "[server]") {
    int calls = 0;
    Server server(loopbackConfig(), [&calls](const HttpRequest& request) -> HttpResponse {
        ++calls;
        if (request.path == "/boom") {
            throw std::runtime_error("handler failed");
        }
        return HttpResponse(204);
    });
    REQUIRE(server.start());

    std::string failed = exchange(server.getPort(), "GET /boom HTTP/1.1\r\n\r\n");
    CHECK(failed.rfind("HTTP/1.1 500 Internal Server Error\r\n", 0) == 0);
    CHECK(bodyOf(failed) == R"({"detail":"Internal Server Error"})");

    CHECK(server.isRunning());
    std::string next = exchange(server.getPort(), "GET /fine HTTP/1.1\r\n\r\n");
    CHECK(next.rfind("HTTP/1.1 204 No Content\r\n", 0) == 0);

    server.stop();
    CHECK(calls == 2);
}

TEST_CASE("pipelined requests still receive the first response in full", "[server]") {
    ItemStore store;
    Server server(loopbackConfig(), store);
    REQUIRE(server.start());

    std::string response = exchange(server.getPort(),
                                    "GET / HTTP/1.1\r\n\r\n"
                                    "GET /items HTTP/1.1\r\n\r\n"
                                    "GET /items/1 HTTP/1.1\r\n\r\n");

    CHECK(response.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    std::string body = bodyOf(response);
    REQUIRE_FALSE(body.empty());
    CHECK(Json::parse(body)["message"] == "Welcome to the Simple REST API");
}
