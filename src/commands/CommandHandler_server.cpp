#include "CommandHandler.hpp"

#include "../persistence/Rdb.hpp"
#include "../protocol/RESPWriter.hpp"
#include "../utils/Logger.hpp"
#include "../utils/Time.hpp"

#include <cctype>

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    for (char& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

} // namespace

/**
 * ----------------------------------------------------
 * handleINFO
 * ----------------------------------------------------
 * RESP command: INFO [server | clients | replication | keyspace]
 *
 * Returns "# Section\r\nfield:value\r\n..." blocks in a Bulk String.
 * Without an argument (or with "all"/"default") every section is
 * included; an unknown section yields an empty string.
 */
ExecResult CommandHandler::handleINFO(const std::vector<std::string_view>& args) {
    if (args.size() > 2)
        return reply(RESPWriter::error("ERR syntax error"));

    const std::string section = args.size() == 2 ? lower(args[1]) : "all";
    const bool all = (section == "all" || section == "default" || section == "everything");

    std::string out;

    auto line = [&out](const std::string& field, const std::string& value) {
        out += field;
        out += ':';
        out += value;
        out += "\r\n";
    };

    if (all || section == "server") {
        out += "# Server\r\n";
        line("emberkv_version", "0.1.0");
        line("tcp_port", std::to_string(config.port));
        line("uptime_in_seconds", std::to_string((current_time_ms() - started_at_ms) / 1000));
        out += "\r\n";
    }

    if (all || section == "clients") {
        out += "# Clients\r\n";
        line("connected_clients", std::to_string(clients.size() - clients.count(MASTER_LINK_FD)));
        line("blocked_clients", std::to_string(blockedClientCount()));
        out += "\r\n";
    }

    if (all || section == "replication") {
        out += "# Replication\r\n";
        if (replication.isReplica()) {
            line("role", "slave");
            line("master_host", replication.masterHost());
            line("master_port", std::to_string(replication.masterPort()));
            line("master_link_status", replication.linkUp() ? "up" : "down");
            line("slave_repl_offset", std::to_string(replication.currentOffset()));
        } else {
            line("role", "master");
            auto handles = replication.replicas();
            line("connected_slaves", std::to_string(handles.size()));
            for (std::size_t i = 0; i < handles.size(); ++i) {
                line("slave" + std::to_string(i),
                     "port=" + std::to_string(handles[i].listening_port) +
                     ",state=online,offset=" + std::to_string(handles[i].ack_offset));
            }
        }
        line("master_replid", replication.replid());
        line("master_repl_offset", std::to_string(replication.currentOffset()));
        out += "\r\n";
    }

    if (all || section == "keyspace") {
        out += "# Keyspace\r\n";
        if (db.size() > 0) {
            line("db0", "keys=" + std::to_string(db.size()) +
                        ",expires=" + std::to_string(db.expiresCount()));
        }
        out += "\r\n";
    }

    // Trim the blank line after the last section.
    if (out.size() >= 4)
        out.erase(out.size() - 2);

    return reply(RESPWriter::bulk(out));
}

// CONFIG GET <parameter>
ExecResult CommandHandler::handleCONFIG(const std::vector<std::string_view>& args) {
    if (upper(args[1]) != "GET")
        return reply(RESPWriter::error("ERR unknown subcommand '" + std::string(args[1]) +
                                       "'. Try CONFIG GET."));

    std::vector<std::string> out;
    for (std::size_t i = 2; i < args.size(); ++i) {
        const std::string param = lower(args[i]);

        if (param == "dir") {
            out.insert(out.end(), {"dir", config.dir});
        } else if (param == "dbfilename") {
            out.insert(out.end(), {"dbfilename", config.dbfilename});
        } else if (param == "port") {
            out.insert(out.end(), {"port", std::to_string(config.port)});
        }
    }

    return reply(RESPWriter::bulkArray(out));
}

ExecResult CommandHandler::handleSAVE(const std::vector<std::string_view>&) {
    std::string err;
    if (!RdbWriter::save(config.snapshotPath(), db, err)) {
        Logger::error("SAVE failed: " + err);
        return reply(RESPWriter::error("ERR " + err));
    }

    Logger::info("DB saved on disk (" + config.snapshotPath() + ")");
    return reply(RESPWriter::simpleString("OK"));
}
