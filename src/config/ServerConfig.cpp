#include "ServerConfig.hpp"
#include "../utils/Logger.hpp"

#include <sstream>
#include <stdexcept>

namespace {

long long parseNumber(const std::string& flag, const std::string& value,
                      long long min, long long max) {
    if (value.empty())
        throw std::invalid_argument(flag + " expects a number");

    long long n = 0;
    for (char c : value) {
        if (c < '0' || c > '9')
            throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
        n = n * 10 + (c - '0');
        if (n > max)
            throw std::invalid_argument(flag + " is out of range: " + value);
    }

    if (n < min)
        throw std::invalid_argument(flag + " is out of range: " + value);

    return n;
}

// "--replicaof" takes "<host> <port>" as one argument (redis-server style);
// a separate port argument is accepted as well.
void parseReplicaOf(const std::string& value, ServerConfig& cfg) {
    std::istringstream in(value);
    std::string host;
    std::string port;
    std::string extra;

    in >> host >> port;
    if (host.empty() || port.empty() || (in >> extra))
        throw std::invalid_argument("--replicaof expects \"<host> <port>\", got '" + value + "'");

    cfg.master_host = host;
    cfg.master_port = static_cast<int>(parseNumber("--replicaof", port, 1, 65535));
}

} // namespace

std::string ServerConfig::snapshotPath() const {
    if (dir.empty())
        return dbfilename;
    if (dir.back() == '/')
        return dir + dbfilename;
    return dir + "/" + dbfilename;
}

ServerConfig ServerConfig::fromArgs(const std::vector<std::string>& args) {
    ServerConfig cfg;

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& flag = args[i];

        if (flag == "--help" || flag == "-h") {
            cfg.show_help = true;
            continue;
        }

        if (i + 1 >= args.size())
            throw std::invalid_argument("missing value for " + flag);

        const std::string& value = args[++i];

        if (flag == "--port") {
            cfg.port = static_cast<int>(parseNumber(flag, value, 1, 65535));
        } else if (flag == "--bind") {
            cfg.bind = value;
        } else if (flag == "--replicaof") {
            if (value.find(' ') == std::string::npos && i + 1 < args.size() &&
                args[i + 1].rfind("--", 0) != 0) {
                parseReplicaOf(value + " " + args[++i], cfg);
            } else {
                parseReplicaOf(value, cfg);
            }
        } else if (flag == "--dir") {
            cfg.dir = value;
        } else if (flag == "--dbfilename") {
            if (value.empty())
                throw std::invalid_argument("--dbfilename cannot be empty");
            cfg.dbfilename = value;
        } else if (flag == "--loglevel") {
            LogLevel level;
            if (!Logger::parseLevel(value, level))
                throw std::invalid_argument("--loglevel expects error|warn|info|debug, got '" + value + "'");
            cfg.log_level = value;
        } else if (flag == "--repl-ack-interval-ms") {
            cfg.repl_ack_interval_ms =
                static_cast<uint64_t>(parseNumber(flag, value, 0, 3600 * 1000));
        } else {
            throw std::invalid_argument("unknown option " + flag);
        }
    }

    return cfg;
}

std::string ServerConfig::usage(const std::string& program) {
    return "Usage: " + program +
           " [--port <port>] [--bind <addr>] [--replicaof \"<host> <port>\"]"
           " [--dir <path>] [--dbfilename <name>]"
           " [--loglevel <error|warn|info|debug>] [--repl-ack-interval-ms <ms>]\n";
}
