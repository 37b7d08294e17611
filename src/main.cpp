#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/ServerConfig.hpp"
#include "server/Server.hpp"
#include "utils/Logger.hpp"

int main(int argc, char **argv) {
    std::vector<std::string> args(argv, argv + argc);

    ServerConfig config;
    try {
        config = ServerConfig::fromArgs(args);
    } catch (const std::invalid_argument& e) {
        Logger::error(e.what());
        std::cerr << ServerConfig::usage(args[0]);
        return 1;
    }

    if (config.show_help) {
        std::cout << ServerConfig::usage(args[0]);
        return 0;
    }

    LogLevel level;
    if (!Logger::parseLevel(config.log_level, level)) {
        Logger::error("unknown log level '" + config.log_level + "'");
        return 1;
    }
    Logger::setLevel(level);

    Logger::info(std::string("emberkv starting as ") +
                 (config.isReplica() ? "replica of " + config.master_host + ":" +
                                           std::to_string(config.master_port)
                                     : "master"));

    Server server(config);

    std::string err;
    if (!server.listen(err)) {
        Logger::error(err);
        return 1;
    }

    server.loadSnapshot();
    server.run();

    return 0;
}
