#include "ServerConfig.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <iostream>

namespace itemstore {

ServerConfig parseServerConfig(int argc, char* argv[]) {
    ServerConfig config;

    if (argc > 1) {
        char* end = nullptr;
        errno = 0;
        long port = std::strtol(argv[1], &end, 10);
        if (errno != 0 || end == argv[1] || *end != '\0' || port <= 0 || port > 65535) {
            std::cerr << "Invalid port number. Using default: " << kDefaultPort << std::endl;
        } else {
            config.port = static_cast<int>(port);
        }
    }

    if (argc > 2) {
        in_addr addr{};
        if (inet_pton(AF_INET, argv[2], &addr) != 1) {
            std::cerr << "Invalid bind address " << argv[2] << ". Using default: " << config.bindAddress
                      << std::endl;
        } else {
            config.bindAddress = argv[2];
        }
    }

    return config;
}

} // namespace itemstore
