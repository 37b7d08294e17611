#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "../types/Outbox.hpp"

/**
 * ReplicationManager
 * ------------------
 * Replication bookkeeping shared by the dispatcher and the event loop.
 *
 * Master role:
 *   • tracks every connection that announced itself as a replica
 *     (HANDSHAKE until PSYNC, SYNCED afterwards)
 *   • encodes successful writes and queues them to synced replicas
 *   • keeps the replication offset and each replica's acknowledged offset
 *
 * Replica role:
 *   • remembers the master address and link status
 *   • counts the bytes of the master stream applied so far
 *
 * Nothing here touches a socket; outgoing bytes go to the Outbox.
 */
class ReplicationManager {
public:
    enum class Role { MASTER, REPLICA };

    struct ReplicaHandle {
        enum class State { HANDSHAKE, SYNCED };

        int fd = -1;
        State state = State::HANDSHAKE;
        uint64_t ack_offset = 0;
        int listening_port = 0;
        std::vector<std::string> capabilities;
    };

    explicit ReplicationManager(Outbox& outbox);

    // Switches to the replica role. Called once at startup.
    void configureAsReplica(const std::string& host, int port);

    Role role() const { return current_role; }
    bool isReplica() const { return current_role == Role::REPLICA; }

    const std::string& replid() const { return repl_id; }

    // Master: bytes propagated so far. Replica: bytes applied so far.
    uint64_t currentOffset() const { return offset; }

    // --- MASTER SIDE ---

    // Encodes `args` as a bulk array, queues it to every synced replica and
    // advances the offset by its size.
    void propagate(const std::vector<std::string>& args);

    // REPLCONF listening-port: the connection becomes a replica in HANDSHAKE.
    void beginHandshake(int fd, int listening_port);

    // REPLCONF capa <name>
    void addCapability(int fd, const std::string& capa);

    bool isReplicaConnection(int fd) const;

    // PSYNC completed: the replica is SYNCED with ack = current offset.
    // Connections that skipped REPLCONF are registered here.
    void promoteToSynced(int fd);

    // REPLCONF ACK. Offsets older than the recorded one are ignored.
    // Returns false when `fd` is not a known replica.
    bool recordAck(int fd, uint64_t ack_offset);

    // Synced replicas whose ack is at or beyond `target`.
    std::size_t countAcked(uint64_t target) const;

    std::size_t syncedReplicaCount() const;

    // Queues REPLCONF GETACK * to every synced replica; the request itself
    // is part of the stream and advances the offset.
    void requestAcks();

    void dropReplica(int fd);

    // Synced handles, ordered by fd (INFO output).
    std::vector<ReplicaHandle> replicas() const;

    // --- REPLICA SIDE ---

    void advanceProcessedOffset(uint64_t bytes) { offset += bytes; }

    // Adopts the master's replication id and offset after FULLRESYNC.
    void adoptMasterState(const std::string& master_replid, uint64_t master_offset);

    void setLinkUp(bool up) { link_up = up; }
    bool linkUp() const { return link_up; }

    const std::string& masterHost() const { return master_host; }
    int masterPort() const { return master_port; }

    // REPLCONF ACK <offset> in wire format.
    std::string ackCommand() const;

private:
    Outbox& outbox;

    Role current_role = Role::MASTER;
    std::string repl_id;
    uint64_t offset = 0;

    std::unordered_map<int, ReplicaHandle> handles;

    std::string master_host;
    int master_port = 0;
    bool link_up = false;

    static std::string generateReplid();
};
