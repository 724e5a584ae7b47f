#pragma once

#include <chrono>
#include <string>

namespace itemstore {

constexpr int kDefaultPort = 8000;

struct ServerConfig {
    std::string bindAddress = "0.0.0.0";
    int port = kDefaultPort;     // 0 picks an ephemeral port
    int listenBacklog = 16;
    std::chrono::milliseconds idleTimeout{30000};
};

// usage: item_store_server [port] [bind-address]
// invalid values are reported on stderr and replaced by the defaults
ServerConfig parseServerConfig(int argc, char* argv[]);

} // namespace itemstore
