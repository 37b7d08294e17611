#include "Server.hpp"
#include "EventLoop.hpp"

#include "../persistence/Rdb.hpp"
#include "../replication/ReplicaLink.hpp"
#include "../utils/Logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {
constexpr int CONNECTION_BACKLOG = 128;
}

Server::Server(ServerConfig cfg)
    : config(std::move(cfg)),
      replication(outbox),
      handler(keyspace, replication, outbox, config)
{
    if (config.isReplica())
        replication.configureAsReplica(config.master_host, config.master_port);
}

Server::~Server() {
    if (server_fd >= 0)
        ::close(server_fd);
}

bool Server::listen(std::string& err) {
    server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        err = std::string("failed to create server socket: ") + std::strerror(errno);
        return false;
    }

    // Restarts should not hit 'Address already in use'.
    int reuse = 1;
    if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        err = std::string("setsockopt failed: ") + std::strerror(errno);
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(config.port));
    if (inet_pton(AF_INET, config.bind.c_str(), &addr.sin_addr) != 1) {
        err = "invalid bind address " + config.bind;
        return false;
    }

    if (bind(server_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        err = "failed to bind to " + config.bind + ":" + std::to_string(config.port) +
              ": " + std::strerror(errno);
        return false;
    }

    if (::listen(server_fd, CONNECTION_BACKLOG) != 0) {
        err = std::string("listen failed: ") + std::strerror(errno);
        return false;
    }

    Logger::info("listening on " + config.bind + ":" + std::to_string(config.port));
    return true;
}

void Server::loadSnapshot() {
    const std::string path = config.snapshotPath();

    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        Logger::info("no snapshot at " + path + ", starting empty");
        return;
    }

    std::string err;
    if (!RdbLoader::loadFile(path, keyspace, err)) {
        Logger::error("snapshot load failed (" + path + "): " + err +
                      "; continuing with " + std::to_string(keyspace.size()) + " key(s)");
        return;
    }

    Logger::info("loaded " + std::to_string(keyspace.size()) + " key(s) from " + path);
}

void Server::run() {
    EventLoop loop(server_fd, handler, replication, config);

    if (config.isReplica()) {
        ReplicaLink link(config.master_host, config.master_port, config.port);
        std::string err;

        if (link.connectAndSync(err)) {
            std::string load_err;
            if (!RdbLoader::loadBuffer(link.snapshot(), keyspace, load_err))
                Logger::error("master snapshot rejected: " + load_err);
            else
                Logger::info("loaded " + std::to_string(keyspace.size()) + " key(s) from master");

            replication.adoptMasterState(link.masterReplid(), link.masterOffset());
            loop.attachMaster(link.releaseFd(), std::move(link.leftover()));
        } else {
            Logger::error("replication handshake with " + config.master_host + ":" +
                          std::to_string(config.master_port) + " failed: " + err);
            replication.setLinkUp(false);
        }
    }

    loop.run();
}
