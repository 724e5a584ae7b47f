#include "ServerConfig.hpp"
#include <catch2/catch.hpp>
#include <vector>

using namespace itemstore;

namespace {

ServerConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "item_store_server");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    return parseServerConfig(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("defaults without arguments", "[config]") {
    ServerConfig config = parse({});
    CHECK(config.port == kDefaultPort);
    CHECK(config.bindAddress == "0.0.0.0");
}

TEST_CASE("port and bind address from arguments", "[config]") {
    ServerConfig config = parse({"9090", "127.0.0.1"});
    CHECK(config.port == 9090);
    CHECK(config.bindAddress == "127.0.0.1");
}

TEST_CASE("invalid arguments fall back to defaults", "[config]") {
    CHECK(parse({"0"}).port == kDefaultPort);
    CHECK(parse({"70000"}).port == kDefaultPort);
    CHECK(parse({"80abc"}).port == kDefaultPort);
    CHECK(parse({"8080", "localhost:1"}).bindAddress == "0.0.0.0");
}
