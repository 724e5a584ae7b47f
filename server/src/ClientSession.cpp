#include "ClientSession.hpp"

namespace itemstore {

ClientSession::ClientSession(const std::string& peer)
    : peer_(peer),
      lastActivity_(std::chrono::steady_clock::now()) {
}

void ClientSession::appendData(const char* data, size_t size) {
    buffer_.append(data, size);
    lastActivity_ = std::chrono::steady_clock::now();
}

bool ClientSession::isIdle(std::chrono::steady_clock::time_point now, std::chrono::milliseconds timeout) const {
    return now - lastActivity_ > timeout;
}

} // namespace itemstore
