#include "CommandHandler.hpp"

#include "../protocol/RESPWriter.hpp"
#include "../utils/Logger.hpp"
#include "../utils/Time.hpp"

#include <algorithm>
#include <cctype>
#include <climits>

// ----------------------------------------------------
// Constructor: build command dispatch table
// ----------------------------------------------------
CommandHandler::CommandHandler(Keyspace& keyspace, ReplicationManager& repl,
                               Outbox& out, const ServerConfig& cfg)
    : client_fd(-1),
      db(keyspace),
      replication(repl),
      outbox(out),
      config(cfg),
      started_at_ms(current_time_ms())
{
    commandMap = {
        {"PING",     {&CommandHandler::handlePING,     -1, 0}},
        {"ECHO",     {&CommandHandler::handleECHO,      2, 0}},
        {"SET",      {&CommandHandler::handleSET,      -3, CMD_WRITE}},
        {"GET",      {&CommandHandler::handleGET,       2, 0}},
        {"INCR",     {&CommandHandler::handleINCR,      2, CMD_WRITE}},
        {"DEL",      {&CommandHandler::handleDEL,      -2, CMD_WRITE}},
        {"EXISTS",   {&CommandHandler::handleEXISTS,   -2, 0}},
        {"TYPE",     {&CommandHandler::handleTYPE,      2, 0}},
        {"KEYS",     {&CommandHandler::handleKEYS,      2, 0}},
        {"HSET",     {&CommandHandler::handleHSET,     -4, CMD_WRITE}},
        {"HGET",     {&CommandHandler::handleHGET,      3, 0}},
        {"HGETALL",  {&CommandHandler::handleHGETALL,   2, 0}},
        {"XADD",     {&CommandHandler::handleXADD,     -5, CMD_WRITE}},
        {"XRANGE",   {&CommandHandler::handleXRANGE,   -4, 0}},
        {"XREAD",    {&CommandHandler::handleXREAD,    -4, 0}},
        {"MULTI",    {&CommandHandler::handleMULTI,     1, CMD_NO_QUEUE}},
        {"EXEC",     {&CommandHandler::handleEXEC,      1, CMD_NO_QUEUE}},
        {"DISCARD",  {&CommandHandler::handleDISCARD,   1, CMD_NO_QUEUE}},
        {"INFO",     {&CommandHandler::handleINFO,     -1, 0}},
        {"CONFIG",   {&CommandHandler::handleCONFIG,   -3, 0}},
        {"SAVE",     {&CommandHandler::handleSAVE,      1, 0}},
        {"REPLCONF", {&CommandHandler::handleREPLCONF, -3, CMD_REPLICATION}},
        {"PSYNC",    {&CommandHandler::handlePSYNC,     3, CMD_REPLICATION}},
        {"WAIT",     {&CommandHandler::handleWAIT,      3, 0}},
    };
}

// ----------------------------------------------------
// Helpers
// ----------------------------------------------------
std::string CommandHandler::upper(std::string_view s) {
    std::string out(s);
    for (char& c : out)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

bool CommandHandler::parseInt(std::string_view s, long long& out) {
    if (s.empty() || s.size() > 20)
        return false;

    std::size_t i = 0;
    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = (s[0] == '-');
        i = 1;
        if (s.size() == 1)
            return false;
    }

    unsigned long long value = 0;
    const unsigned long long limit =
        static_cast<unsigned long long>(LLONG_MAX) + (negative ? 1ULL : 0ULL);
    for (; i < s.size(); ++i) {
        if (s[i] < '0' || s[i] > '9')
            return false;
        value = value * 10 + static_cast<unsigned long long>(s[i] - '0');
        if (value > limit)
            return false;
    }

    if (negative)
        out = (value == limit) ? LLONG_MIN : -static_cast<long long>(value);
    else
        out = static_cast<long long>(value);
    return true;
}

ExecResult CommandHandler::reply(std::string payload) const {
    return ExecResult(std::move(payload), false, client_fd);
}

const CommandHandler::CommandSpec* CommandHandler::lookup(const std::string& upper_name) const {
    auto it = commandMap.find(upper_name);
    return it == commandMap.end() ? nullptr : &it->second;
}

// Existence and arity. Returns the error reply, empty when valid.
std::string CommandHandler::validate(const std::string& upper_name, const CommandSpec* spec,
                                     const std::vector<std::string_view>& args) const {
    if (!spec) {
        std::string msg = "ERR unknown command '" + std::string(args[0]) +
                          "', with args beginning with: ";
        for (std::size_t i = 1; i < args.size(); ++i) {
            msg += '\'';
            msg += args[i];
            msg += "' ";
        }
        return RESPWriter::error(msg);
    }

    const long long argc = static_cast<long long>(args.size());
    if ((spec->arity > 0 && argc != spec->arity) ||
        (spec->arity < 0 && argc < -spec->arity)) {
        std::string lower(upper_name);
        for (char& c : lower)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return RESPWriter::error("ERR wrong number of arguments for '" + lower + "' command");
    }

    return "";
}

void CommandHandler::forwardWrite(std::vector<std::string> args) {
    if (exec_writes)
        exec_writes->push_back(std::move(args));
    else
        replication.propagate(args);
}

// Runs one validated command and forwards successful writes.
ExecResult CommandHandler::dispatch(const CommandSpec& spec,
                                    const std::vector<std::string_view>& args) {
    propagate_as.reset();
    skip_propagation = false;

    ExecResult result = (this->*(spec.fn))(args);

    const bool failed = !result.reply.empty() && result.reply[0] == '-';
    if ((spec.flags & CMD_WRITE) && !failed && !skip_propagation && !replication.isReplica()) {
        if (propagate_as)
            forwardWrite(std::move(*propagate_as));
        else
            forwardWrite(std::vector<std::string>(args.begin(), args.end()));
    }

    propagate_as.reset();
    return result;
}

// ----------------------------------------------------
// Main Command Dispatcher
// ----------------------------------------------------
ExecResult CommandHandler::execute(const std::vector<std::string_view>& args,
                                   int client_fd)
{
    this->client_fd = client_fd;

    if (args.empty())
        return reply(RESPWriter::error("ERR empty command"));

    const std::string name = upper(args[0]);
    const CommandSpec* spec = lookup(name);
    ClientState& client = clients[client_fd];

    if (client.txn.active() && !(spec && (spec->flags & CMD_NO_QUEUE)))
        return queueCommand(client, name, spec, args);

    std::string err = validate(name, spec, args);
    if (!err.empty())
        return reply(err);

    if (replication.isReplica() && (spec->flags & CMD_WRITE))
        return reply(RESPWriter::error("READONLY You can't write against a read only replica."));

    return dispatch(*spec, args);
}

std::string CommandHandler::applyFromMaster(const std::vector<std::string_view>& args,
                                            uint64_t byte_length)
{
    client_fd = MASTER_LINK_FD;
    std::string ack;

    if (!args.empty()) {
        const std::string name = upper(args[0]);
        const CommandSpec* spec = lookup(name);
        ClientState& link = clients[MASTER_LINK_FD];

        if (name == "REPLCONF" && args.size() >= 2 && upper(args[1]) == "GETACK") {
            // The ACK reports what was processed before this GETACK.
            ack = replication.ackCommand();
        } else if (link.txn.active() && !(spec && (spec->flags & CMD_NO_QUEUE))) {
            // MULTI ... EXEC from the master is applied as one batch on EXEC.
            const std::string queued = queueCommand(link, name, spec, args).reply;
            if (queued[0] == '-')
                Logger::warn("master stream: " + queued.substr(1, queued.size() - 3));
        } else {
            std::string err = validate(name, spec, args);
            if (!err.empty()) {
                Logger::warn("master stream: " + err.substr(1, err.size() - 3));
            } else if (!(spec->flags & CMD_REPLICATION)) {
                blocking_disabled = true;
                dispatch(*spec, args);
                blocking_disabled = false;
            }
        }
    }

    replication.advanceProcessedOffset(byte_length);
    return ack;
}

// ----------------------------------------------------
// Connection lifecycle
// ----------------------------------------------------
void CommandHandler::onConnect(int fd) {
    clients[fd];
}

void CommandHandler::onDisconnect(int fd) {
    clients.erase(fd);

    blockedXReadClients.erase(
        std::remove_if(blockedXReadClients.begin(), blockedXReadClients.end(),
                       [fd](const BlockedXReadClient& c) { return c.fd == fd; }),
        blockedXReadClients.end());

    blockedWaitClients.erase(
        std::remove_if(blockedWaitClients.begin(), blockedWaitClients.end(),
                       [fd](const BlockedWaitClient& c) { return c.fd == fd; }),
        blockedWaitClients.end());

    replication.dropReplica(fd);
}

// ----------------------------------------------------
// Timeouts for parked XREAD / WAIT callers
// ----------------------------------------------------
void CommandHandler::checkTimeouts() {
    const uint64_t now = current_time_ms();

    for (auto it = blockedXReadClients.begin(); it != blockedXReadClients.end(); ) {
        if (it->deadline_ms != 0 && now >= it->deadline_ms) {
            outbox.push(it->fd, RESPWriter::nullArray());
            it = blockedXReadClients.erase(it);
        } else {
            ++it;
        }
    }

    for (auto it = blockedWaitClients.begin(); it != blockedWaitClients.end(); ) {
        if (it->deadline_ms != 0 && now >= it->deadline_ms) {
            std::size_t acked = replication.countAcked(it->target_offset);
            Logger::debug("WAIT on fd " + std::to_string(it->fd) + " timed out with " +
                          std::to_string(acked) + " replica(s)");
            outbox.push(it->fd, RESPWriter::integer(static_cast<long long>(acked)));
            it = blockedWaitClients.erase(it);
        } else {
            ++it;
        }
    }
}
