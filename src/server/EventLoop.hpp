#pragma once
#include <sys/select.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "../commands/CommandHandler.hpp"
#include "../config/ServerConfig.hpp"
#include "../replication/ReplicationManager.hpp"

/**
 * EventLoop
 * ---------
 * Single-threaded select() loop. Every command runs to completion before
 * the next one is read, so the dispatcher never needs a lock.
 *
 * Per tick (at most 50 ms apart):
 *   • accept new clients
 *   • read, frame and execute buffered commands
 *   • feed the master stream to the dispatcher (replica role)
 *   • answer timed-out XREAD / WAIT callers
 *   • send the periodic REPLCONF ACK (replica role)
 */
class EventLoop {
public:
    EventLoop(int serverFd, CommandHandler& handler,
              ReplicationManager& replication, const ServerConfig& config);

    // Replica role: the master connection and any stream bytes already read.
    void attachMaster(int fd, std::string buffered);

    void run();

    // One select() round plus timers. False when select() failed for good.
    bool tick();

private:
    struct Connection {
        std::string in;
        bool blocked = false;   // parked in XREAD BLOCK or WAIT
    };

    int server_fd;
    fd_set current_fds;
    int max_fd;

    CommandHandler& handler;
    ReplicationManager& replication;
    const ServerConfig& config;

    std::unordered_map<int, Connection> connections;

    // Connections whose blocked reply was just delivered and that may have
    // pipelined commands waiting in their buffer.
    std::vector<int> resumable;

    int master_fd = -1;
    std::string master_buffer;
    uint64_t last_ack_ms = 0;

    void acceptClient();
    void readClient(int fd);
    void processClient(int fd);
    void closeClient(int fd);

    void readMaster();
    void processMaster();
    void closeMaster(const std::string& reason);
    void sendPeriodicAck();

    // Delivers everything the dispatcher queued for other connections.
    void flushPending();

    // Blocking write of the whole payload; false when the peer is gone.
    static bool writeAll(int fd, const std::string& payload);
};
