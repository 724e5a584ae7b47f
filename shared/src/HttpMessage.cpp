#include "HttpMessage.hpp"
#include <cctype>
#include <sstream>

namespace itemstore {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string trimSpaces(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

std::optional<std::string> findHeader(const HeaderList& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (equalsIgnoreCase(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

bool isTokenChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || std::string("!#$%&'*+-.^_`|~").find(c) != std::string::npos;
}

bool isToken(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!isTokenChar(c)) {
            return false;
        }
    }
    return true;
}

bool parseRequestLine(const std::string& line, HttpRequest& request) {
    // METHOD SP target SP version
    size_t firstSpace = line.find(' ');
    if (firstSpace == std::string::npos) {
        return false;
    }
    size_t secondSpace = line.find(' ', firstSpace + 1);
    if (secondSpace == std::string::npos || line.find(' ', secondSpace + 1) != std::string::npos) {
        return false;
    }

    request.method = line.substr(0, firstSpace);
    request.target = line.substr(firstSpace + 1, secondSpace - firstSpace - 1);
    request.version = line.substr(secondSpace + 1);

    if (!isToken(request.method) || request.target.empty() || request.target[0] != '/') {
        return false;
    }
    if (request.version != "HTTP/1.0" && request.version != "HTTP/1.1") {
        return false;
    }

    size_t question = request.target.find('?');
    if (question == std::string::npos) {
        request.path = request.target;
        request.query.clear();
    } else {
        request.path = request.target.substr(0, question);
        request.query = request.target.substr(question + 1);
    }
    return true;
}

bool parseHeaderLine(const std::string& line, HttpRequest& request) {
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return false;
    }
    std::string name = line.substr(0, colon);
    if (!isToken(name)) {
        return false;
    }
    request.headers.emplace_back(name, trimSpaces(line.substr(colon + 1)));
    return true;
}

// -1 when the value is not a plain decimal length
long long parseContentLength(const std::string& value) {
    if (value.empty() || value.size() > 18) {
        return -1;
    }
    long long length = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return -1;
        }
        length = length * 10 + (c - '0');
    }
    return length;
}

} // namespace

std::optional<std::string> HttpRequest::getHeader(const std::string& name) const {
    return findHeader(headers, name);
}

ParseResult HttpRequest::parse(const std::string& buffer, HttpRequest& request, size_t& consumed) {
    size_t headerEnd = buffer.find("\r\n\r\n");
    if (headerEnd == std::string::npos) {
        return buffer.size() > kMaxHeaderBytes ? ParseResult::INVALID : ParseResult::INCOMPLETE;
    }
    if (headerEnd > kMaxHeaderBytes) {
        return ParseResult::INVALID;
    }

    HttpRequest parsed;

    size_t lineEnd = buffer.find("\r\n");
    if (!parseRequestLine(buffer.substr(0, lineEnd), parsed)) {
        return ParseResult::INVALID;
    }

    // header lines sit between the request line and the blank line
    size_t pos = lineEnd + 2;
    while (pos < headerEnd + 2) {
        size_t next = buffer.find("\r\n", pos);
        if (!parseHeaderLine(buffer.substr(pos, next - pos), parsed)) {
            return ParseResult::INVALID;
        }
        pos = next + 2;
    }

    // only Content-Length framing is supported
    if (parsed.getHeader("Transfer-Encoding")) {
        return ParseResult::INVALID;
    }

    size_t bodyLength = 0;
    if (auto lengthHeader = parsed.getHeader("Content-Length")) {
        long long length = parseContentLength(*lengthHeader);
        if (length < 0 || static_cast<unsigned long long>(length) > kMaxBodyBytes) {
            return ParseResult::INVALID;
        }
        bodyLength = static_cast<size_t>(length);
    }

    size_t bodyStart = headerEnd + 4;
    if (buffer.size() < bodyStart + bodyLength) {
        return ParseResult::INCOMPLETE;
    }

    parsed.body = buffer.substr(bodyStart, bodyLength);
    request = std::move(parsed);
    consumed = bodyStart + bodyLength;
    return ParseResult::COMPLETE;
}

void HttpResponse::setHeader(const std::string& name, const std::string& value) {
    for (auto& [key, existing] : headers) {
        if (equalsIgnoreCase(key, name)) {
            existing = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::optional<std::string> HttpResponse::getHeader(const std::string& name) const {
    return findHeader(headers, name);
}

std::string HttpResponse::serialize() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << reasonPhrase(status) << "\r\n";
    for (const auto& [name, value] : headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n";
    oss << "\r\n";
    oss << body;
    return oss.str();
}

HttpResponse HttpResponse::json(int status, const Json& body) {
    HttpResponse response(status);
    response.setHeader("Content-Type", "application/json");
    // invalid UTF-8 inside string values is written as U+FFFD instead of throwing
    response.body = body.dump(-1, ' ', false, Json::error_handler_t::replace);
    return response;
}

const char* reasonPhrase(int status) {
    switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 422: return "Unprocessable Entity";
    case 500: return "Internal Server Error";
    default: return "Unknown";
    }
}

} // namespace itemstore
