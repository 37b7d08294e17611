#include "CommandHandler.hpp"

#include "../persistence/Rdb.hpp"
#include "../protocol/RESPWriter.hpp"
#include "../utils/Logger.hpp"
#include "../utils/Time.hpp"

/**
 * ----------------------------------------------------
 * handleREPLCONF
 * ----------------------------------------------------
 * RESP command: REPLCONF <option> <value> [<option> <value> ...]
 *
 *   listening-port <port> → the connection becomes a replica (HANDSHAKE)
 *   capa <name>           → capability announcement
 *   ACK <offset>          → replica acknowledgment, never answered
 *   GETACK *              → only meaningful on the master link of a
 *                           replica (see applyFromMaster)
 */
ExecResult CommandHandler::handleREPLCONF(const std::vector<std::string_view>& args) {
    if ((args.size() - 1) % 2 != 0)
        return reply(RESPWriter::error("ERR syntax error"));

    const std::string option = upper(args[1]);

    if (option == "ACK") {
        long long ack = 0;
        if (parseInt(args[2], ack) && ack >= 0 &&
            replication.recordAck(client_fd, static_cast<uint64_t>(ack)))
            evaluateWaitClients();
        return reply("");
    }

    if (option == "GETACK")
        return reply("");

    for (std::size_t i = 1; i + 1 < args.size(); i += 2) {
        const std::string name = upper(args[i]);

        if (name == "LISTENING-PORT") {
            long long port = 0;
            if (!parseInt(args[i + 1], port) || port < 0 || port > 65535)
                return reply(RESPWriter::error("ERR value is not an integer or out of range"));
            replication.beginHandshake(client_fd, static_cast<int>(port));
        } else if (name == "CAPA") {
            replication.addCapability(client_fd, std::string(args[i + 1]));
        } else {
            return reply(RESPWriter::error("ERR Unrecognized REPLCONF option: " +
                                           std::string(args[i])));
        }
    }

    return reply(RESPWriter::simpleString("OK"));
}

/**
 * ----------------------------------------------------
 * handlePSYNC
 * ----------------------------------------------------
 * RESP command: PSYNC <replid> <offset>
 *
 * Always answers with a full resynchronization:
 *   +FULLRESYNC <replid> <offset>\r\n$<len>\r\n<rdb>
 * (the snapshot has no trailing CRLF). From here on the connection
 * receives every propagated write.
 */
ExecResult CommandHandler::handlePSYNC(const std::vector<std::string_view>&) {
    if (replication.isReplica())
        return reply(RESPWriter::error("ERR PSYNC is not supported by replica instances"));

    std::string rdb = RdbWriter::serialize(db);

    std::string out = RESPWriter::simpleString(
        "FULLRESYNC " + replication.replid() + " " + std::to_string(replication.currentOffset()));
    out += "$" + std::to_string(rdb.size()) + "\r\n";
    out += rdb;

    replication.promoteToSynced(client_fd);

    return reply(out);
}

ExecResult CommandHandler::handleWAIT(const std::vector<std::string_view>& args) {
    if (replication.isReplica())
        return reply(RESPWriter::error("ERR WAIT cannot be used with replica instances."));

    long long wanted = 0;
    long long timeout = 0;
    if (!parseInt(args[1], wanted))
        return reply(RESPWriter::error("ERR value is not an integer or out of range"));
    if (!parseInt(args[2], timeout))
        return reply(RESPWriter::error("ERR timeout is not an integer or out of range"));
    if (timeout < 0)
        return reply(RESPWriter::error("ERR timeout is negative"));

    const uint64_t target = replication.currentOffset();
    const std::size_t acked = replication.countAcked(target);

    if (static_cast<long long>(acked) >= wanted || blocking_disabled)
        return reply(RESPWriter::integer(static_cast<long long>(acked)));

    if (target > 0)
        replication.requestAcks();

    BlockedWaitClient parked;
    parked.fd = client_fd;
    parked.deadline_ms = (timeout == 0) ? 0 : current_time_ms() + static_cast<uint64_t>(timeout);
    parked.target_offset = target;
    parked.num_replicas = wanted;
    blockedWaitClients.push_back(parked);

    Logger::debug("WAIT on fd " + std::to_string(client_fd) + " parked for offset " +
                  std::to_string(target));

    return ExecResult("", true, client_fd);
}

void CommandHandler::evaluateWaitClients() {
    for (auto it = blockedWaitClients.begin(); it != blockedWaitClients.end(); ) {
        const std::size_t acked = replication.countAcked(it->target_offset);

        if (static_cast<long long>(acked) >= it->num_replicas) {
            outbox.push(it->fd, RESPWriter::integer(static_cast<long long>(acked)));
            it = blockedWaitClients.erase(it);
        } else {
            ++it;
        }
    }
}
