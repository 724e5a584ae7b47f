#include "ItemStore.hpp"
#include "Server.hpp"
#include "ServerConfig.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <chrono>
#include <thread>
#include <string>
#include <sstream>
#include <poll.h>
#include <unistd.h>

std::atomic<bool> running(true);

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        running = false;
    }
}

void printHelp() {
    std::cout << "\nAvailable commands:" << std::endl;
    std::cout << "  help          - Show this help" << std::endl;
    std::cout << "  items         - List all stored items" << std::endl;
    std::cout << "  count         - Show item count and next id" << std::endl;
    std::cout << "  status        - Show open connections" << std::endl;
    std::cout << "  quit          - Stop server\n" << std::endl;
}

void printItems(const itemstore::ItemStore& store) {
    auto items = store.listItems();
    std::cout << "\nStored items (" << items.size() << "):" << std::endl;
    for (const auto& item : items) {
        std::cout << "  [" << item.id << "] " << item.name
                  << " (price: " << item.price << ", quantity: " << item.quantity << ")";
        if (item.description) {
            std::cout << " - " << *item.description;
        }
        std::cout << std::endl;
    }
    std::cout << std::endl;
}

// waits up to 100ms for a console line so shutdown is not blocked on stdin
bool readCommand(std::string& line) {
    pollfd pfd{};
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    if (poll(&pfd, 1, 100) <= 0) {
        return false;
    }
    return static_cast<bool>(std::getline(std::cin, line));
}

int main(int argc, char* argv[]) {
    std::cout << "Item Store - Server" << std::endl;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    itemstore::ServerConfig config = itemstore::parseServerConfig(argc, argv);

    // the store lives as long as the process and is shared with the server by reference
    itemstore::ItemStore store;
    itemstore::Server server(config, store);

    if (!server.start()) {
        std::cerr << "Server failed to start" << std::endl;
        return 1;
    }

    std::cout << "Server running on port " << server.getPort() << std::endl;
    printHelp();
    std::cout << "Press Ctrl+C or type 'quit' to stop.\n" << std::endl;

    // basic command IO thread
    std::thread commandThread([&]() {
        bool stdinOpen = true;
        std::string line;
        while (running && server.isRunning()) {
            if (!stdinOpen) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                continue;
            }
            if (!readCommand(line)) {
                if (std::cin.eof()) {
                    // stdin closed, keep serving until a signal arrives
                    stdinOpen = false;
                }
                continue;
            }

            if (line.empty()) continue;

            std::istringstream iss(line);
            std::string cmd;
            iss >> cmd;

            if (cmd == "quit" || cmd == "exit") {
                running = false;
                break;
            }
            else if (cmd == "help") {
                printHelp();
            }
            else if (cmd == "items") {
                printItems(store);
            }
            else if (cmd == "count") {
                std::cout << store.count() << " items, next id " << store.nextId() << std::endl;
            }
            else if (cmd == "status") {
                std::cout << server.getConnectionCount() << " open connections" << std::endl;
            }
            else {
                std::cout << "Unknown command: " << cmd << " (type 'help' for commands)" << std::endl;
            }
        }
    });

    // wait for shutdown signal
    while (running && server.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down server..." << std::endl;

    if (commandThread.joinable()) {
        commandThread.join();
    }

    server.stop();
    std::cout << "Server shutdown complete." << std::endl;

    return 0;
}
