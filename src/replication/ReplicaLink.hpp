#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * ReplicaLink
 * -----------
 * Replica-side connection to the master.
 *
 * connectAndSync() runs the whole handshake with blocking I/O before the
 * event loop starts:
 *
 *   PING                              → +PONG
 *   REPLCONF listening-port <port>    → +OK
 *   REPLCONF capa psync2              → +OK
 *   PSYNC ? -1                        → +FULLRESYNC <replid> <offset>
 *                                       $<len>\r\n<rdb>
 *
 * Bytes the master sent after the snapshot are kept in leftover(); they
 * are the first commands of the replication stream.
 */
class ReplicaLink {
public:
    ReplicaLink(std::string host, int port, int listening_port);
    ~ReplicaLink();

    ReplicaLink(const ReplicaLink&) = delete;
    ReplicaLink& operator=(const ReplicaLink&) = delete;

    bool connectAndSync(std::string& err);

    // Hands the socket over to the event loop; the link stops owning it.
    int releaseFd();

    const std::string& masterReplid() const { return replid; }
    uint64_t masterOffset() const { return offset; }
    std::string& snapshot() { return rdb; }
    std::string& leftover() { return pending; }

private:
    std::string host;
    int port;
    int listening_port;
    int fd = -1;

    std::string replid;
    uint64_t offset = 0;
    std::string rdb;
    std::string pending;

    bool openSocket(std::string& err);
    bool sendCommand(const std::vector<std::string>& args, std::string& err);
    bool readMore(std::string& err);
    bool expectSimple(const std::string& expected, std::string& err);
    bool readFullResync(std::string& err);
    void closeSocket();
};
