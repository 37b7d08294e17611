#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * Startup options. Every field maps to one `--name value` flag.
 */
struct ServerConfig {
    int port = 6379;
    std::string bind = "0.0.0.0";

    // Replica mode is on when master_host is non-empty.
    std::string master_host;
    int master_port = 0;

    std::string dir = ".";
    std::string dbfilename = "dump.rdb";

    std::string log_level = "info";

    // Replica → master REPLCONF ACK period, 0 disables periodic ACKs.
    uint64_t repl_ack_interval_ms = 1000;

    bool show_help = false;

    bool isReplica() const { return !master_host.empty(); }

    // <dir>/<dbfilename>
    std::string snapshotPath() const;

    /**
     * Parses argv-style options (args[0] is the program name).
     * Throws std::invalid_argument on unknown flags, missing values
     * or malformed numbers.
     */
    static ServerConfig fromArgs(const std::vector<std::string>& args);

    static std::string usage(const std::string& program);
};
