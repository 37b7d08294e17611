#pragma once

#include <string>

#include "../commands/CommandHandler.hpp"
#include "../config/ServerConfig.hpp"
#include "../db/Keyspace.hpp"
#include "../replication/ReplicationManager.hpp"
#include "../types/Outbox.hpp"

/**
 * Owns every long-lived piece of server state and wires it together:
 * keyspace, replication bookkeeping, dispatcher and the listening socket.
 */
class Server {
public:
    explicit Server(ServerConfig config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // socket + bind + listen on config.bind:config.port
    bool listen(std::string& err);

    // Loads <dir>/<dbfilename> when the file exists.
    void loadSnapshot();

    // Replica role: handshake with the master first. Then serves forever.
    void run();

private:
    ServerConfig config;
    Keyspace keyspace;
    Outbox outbox;
    ReplicationManager replication;
    CommandHandler handler;
    int server_fd = -1;
};
