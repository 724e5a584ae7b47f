#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace itemstore {

// one accepted connection and the bytes received on it so far
class ClientSession {
public:
    explicit ClientSession(const std::string& peer);
    
    const std::string& getPeer() const { return peer_; }
    const std::string& getBuffer() const { return buffer_; }
    
    // appends received bytes and refreshes the activity timestamp
    void appendData(const char* data, size_t size);
    
    bool isIdle(std::chrono::steady_clock::time_point now, std::chrono::milliseconds timeout) const;
    
private:
    std::string peer_;
    std::string buffer_;
    std::chrono::steady_clock::time_point lastActivity_;
};

} // namespace itemstore
