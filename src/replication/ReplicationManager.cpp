#include "ReplicationManager.hpp"

#include "../protocol/RESPWriter.hpp"
#include "../utils/Logger.hpp"

#include <algorithm>
#include <random>

ReplicationManager::ReplicationManager(Outbox& out)
    : outbox(out),
      repl_id(generateReplid())
{
}

std::string ReplicationManager::generateReplid() {
    static const char hex[] = "0123456789abcdef";

    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<int> digit(0, 15);

    std::string id(40, '0');
    for (char& c : id)
        c = hex[digit(gen)];
    return id;
}

void ReplicationManager::configureAsReplica(const std::string& host, int port) {
    current_role = Role::REPLICA;
    master_host = host;
    master_port = port;
    link_up = false;
    offset = 0;
}

// ----------------------------------------------------
// Master side
// ----------------------------------------------------
void ReplicationManager::propagate(const std::vector<std::string>& args) {
    std::string payload = RESPWriter::bulkArray(args);

    for (const auto& entry : handles) {
        if (entry.second.state == ReplicaHandle::State::SYNCED)
            outbox.push(entry.first, payload);
    }

    offset += payload.size();
}

void ReplicationManager::beginHandshake(int fd, int listening_port) {
    ReplicaHandle& handle = handles[fd];
    handle.fd = fd;
    handle.listening_port = listening_port;
    Logger::info("replica handshake started on fd " + std::to_string(fd) +
                 " (listening port " + std::to_string(listening_port) + ")");
}

void ReplicationManager::addCapability(int fd, const std::string& capa) {
    auto it = handles.find(fd);
    if (it != handles.end())
        it->second.capabilities.push_back(capa);
}

bool ReplicationManager::isReplicaConnection(int fd) const {
    return handles.count(fd) > 0;
}

void ReplicationManager::promoteToSynced(int fd) {
    ReplicaHandle& handle = handles[fd];
    handle.fd = fd;
    handle.state = ReplicaHandle::State::SYNCED;
    handle.ack_offset = offset;
    Logger::info("replica on fd " + std::to_string(fd) + " attached at offset " +
                 std::to_string(offset));
}

bool ReplicationManager::recordAck(int fd, uint64_t ack_offset) {
    auto it = handles.find(fd);
    if (it == handles.end())
        return false;

    if (ack_offset > it->second.ack_offset)
        it->second.ack_offset = ack_offset;
    return true;
}

std::size_t ReplicationManager::countAcked(uint64_t target) const {
    std::size_t n = 0;
    for (const auto& entry : handles) {
        if (entry.second.state == ReplicaHandle::State::SYNCED &&
            entry.second.ack_offset >= target)
            ++n;
    }
    return n;
}

std::size_t ReplicationManager::syncedReplicaCount() const {
    return countAcked(0);
}

void ReplicationManager::requestAcks() {
    propagate({"REPLCONF", "GETACK", "*"});
}

void ReplicationManager::dropReplica(int fd) {
    if (handles.erase(fd) > 0)
        Logger::info("replica on fd " + std::to_string(fd) + " detached");
}

std::vector<ReplicationManager::ReplicaHandle> ReplicationManager::replicas() const {
    std::vector<ReplicaHandle> out;
    for (const auto& entry : handles) {
        if (entry.second.state == ReplicaHandle::State::SYNCED)
            out.push_back(entry.second);
    }
    std::sort(out.begin(), out.end(),
              [](const ReplicaHandle& a, const ReplicaHandle& b) { return a.fd < b.fd; });
    return out;
}

// ----------------------------------------------------
// Replica side
// ----------------------------------------------------
void ReplicationManager::adoptMasterState(const std::string& master_replid,
                                          uint64_t master_offset) {
    repl_id = master_replid;
    offset = master_offset;
}

std::string ReplicationManager::ackCommand() const {
    return RESPWriter::bulkArray({"REPLCONF", "ACK", std::to_string(offset)});
}
