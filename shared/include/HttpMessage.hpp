#pragma once

#include "Item.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace itemstore {

// limits applied while a request is still being buffered
constexpr size_t kMaxHeaderBytes = 16 * 1024;
constexpr size_t kMaxBodyBytes = 1024 * 1024;

enum class ParseResult {
    COMPLETE,
    INCOMPLETE,
    INVALID
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method;
    std::string target;   // as sent, e.g. "/items/3?x=1"
    std::string path;     // target without the query string
    std::string query;
    std::string version;
    HeaderList headers;
    std::string body;

    // case-insensitive lookup of the first header with this name
    std::optional<std::string> getHeader(const std::string& name) const;

    // parses one request from the front of buffer. On COMPLETE, consumed holds
    // the number of bytes the request occupied.
    static ParseResult parse(const std::string& buffer, HttpRequest& request, size_t& consumed);
};

struct HttpResponse {
    int status;
    HeaderList headers;
    std::string body;

    HttpResponse() : status(200) {}
    explicit HttpResponse(int s) : status(s) {}

    void setHeader(const std::string& name, const std::string& value);
    std::optional<std::string> getHeader(const std::string& name) const;

    // wire format: status line, headers, Content-Length, Connection: close, body
    std::string serialize() const;

    static HttpResponse json(int status, const Json& body);
};

const char* reasonPhrase(int status);

} // namespace itemstore
