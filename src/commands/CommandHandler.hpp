#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../config/ServerConfig.hpp"
#include "../db/Keyspace.hpp"
#include "../replication/ReplicationManager.hpp"
#include "../types/BlockedClient.hpp"
#include "../types/ExecResult.hpp"
#include "../types/Outbox.hpp"
#include "../types/TransactionState.hpp"

/**
 * CommandHandler
 * ---------------
 * Central dispatcher responsible for:
 *   • Routing commands through a static table (handler, arity, flags)
 *   • Executing string, hash, stream and server commands
 *   • MULTI / EXEC / DISCARD queuing per connection
 *   • Parking and waking blocked XREAD and WAIT callers
 *   • Handing successful writes to replication in execution order
 *
 * This class does NOT perform any I/O by itself. The caller's reply is
 * returned in ExecResult; bytes for any other connection (wake-ups,
 * replication stream, WAIT answers) are queued and collected with
 * takePendingWrites().
 */
class CommandHandler
{
public:
    CommandHandler(Keyspace& keyspace, ReplicationManager& replication,
                   Outbox& outbox, const ServerConfig& config);

    /**
     * Executes a parsed RESP command.
     * @param args      Parsed RESP tokens (command + arguments).
     * @param client_fd Calling client's file descriptor.
     * @return          Response payload + metadata.
    */
    ExecResult execute(const std::vector<std::string_view>& args, int client_fd);

    /**
     * Applies one command received from the master (replica role).
     * Nothing is answered except REPLCONF GETACK, whose ACK is returned.
     * The processed offset grows by `byte_length` afterwards.
     */
    std::string applyFromMaster(const std::vector<std::string_view>& args,
                                uint64_t byte_length);

    void onConnect(int client_fd);

    // Cancels parked state, drops the transaction and any replica handle.
    void onDisconnect(int client_fd);

    /**
     * Responses are returned to clients who have previously made a request but whose time has passed.
     */
    void checkTimeouts();

    // Writes addressed to connections other than the caller, in order.
    std::vector<ExecResult> takePendingWrites() { return outbox.drain(); }

    std::size_t blockedClientCount() const {
        return blockedXReadClients.size() + blockedWaitClients.size();
    }

private:
    enum CommandFlag : unsigned {
        CMD_WRITE       = 1u << 0,   // mutates the keyspace, propagated
        CMD_NO_QUEUE    = 1u << 1,   // runs immediately even inside MULTI
        CMD_REPLICATION = 1u << 2    // part of the replication protocol
    };

    /**
     * Command function pointer type.
     * Each command handler accepts a vector of arguments and returns an ExecResult.
    */
    using CmdFn = ExecResult (CommandHandler::*)(const std::vector<std::string_view>&);

    struct CommandSpec {
        CmdFn fn;
        int arity;        // > 0 exact, < 0 minimum
        unsigned flags;
    };

    struct ClientState {
        TransactionState txn;
    };

    // Client slot used for commands arriving over the master link.
    static constexpr int MASTER_LINK_FD = -1;

    // File descriptor of the currently executing client.
    int client_fd{};

    Keyspace& db;
    ReplicationManager& replication;
    Outbox& outbox;
    const ServerConfig& config;

    uint64_t started_at_ms;

    /**
     * Command dispatch table.
     * Maps uppercase RESP command names to their handler specs.
    */
    std::unordered_map<std::string, CommandSpec> commandMap;

    std::unordered_map<int, ClientState> clients;

    /**
     * Blocking client registries. The order in the deque ensures FIFO
     * wake-up semantics (first client to block is the first served).
    */
    std::deque<BlockedXReadClient> blockedXReadClients;
    std::deque<BlockedWaitClient> blockedWaitClients;

    // --- per-dispatch state ---

    // Set while an EXEC batch or the master stream is running; blocking
    // commands answer immediately instead of parking.
    bool blocking_disabled = false;

    // What replication receives instead of the raw arguments (XADD with
    // its resolved ID).
    std::optional<std::vector<std::string>> propagate_as;

    // Set by write handlers that ended up changing nothing.
    bool skip_propagation = false;

    // Writes of the running EXEC batch, sent to replicas as one
    // MULTI ... EXEC block when the batch ends.
    std::optional<std::vector<std::vector<std::string>>> exec_writes;

    // --------------------------------------------------------------------
    // Dispatch helpers (CommandHandler.cpp)
    // --------------------------------------------------------------------
    const CommandSpec* lookup(const std::string& upper_name) const;
    std::string validate(const std::string& upper_name, const CommandSpec* spec,
                         const std::vector<std::string_view>& args) const;
    ExecResult dispatch(const CommandSpec& spec, const std::vector<std::string_view>& args);
    ExecResult reply(std::string payload) const;

    // Hands one write to replication, or to the open EXEC batch.
    void forwardWrite(std::vector<std::string> args);

    static std::string upper(std::string_view s);
    static bool parseInt(std::string_view s, long long& out);

    // --------------------------------------------------------------------
    // String / generic key handlers (CommandHandler_string.cpp)
    // --------------------------------------------------------------------
    ExecResult handlePING  (const std::vector<std::string_view>& args);
    ExecResult handleECHO  (const std::vector<std::string_view>& args);
    ExecResult handleSET   (const std::vector<std::string_view>& args);
    ExecResult handleGET   (const std::vector<std::string_view>& args);
    ExecResult handleINCR  (const std::vector<std::string_view>& args);
    ExecResult handleDEL   (const std::vector<std::string_view>& args);
    ExecResult handleEXISTS(const std::vector<std::string_view>& args);
    ExecResult handleTYPE  (const std::vector<std::string_view>& args);
    ExecResult handleKEYS  (const std::vector<std::string_view>& args);

    // --------------------------------------------------------------------
    // Hash handlers (CommandHandler_hash.cpp)
    // --------------------------------------------------------------------
    ExecResult handleHSET   (const std::vector<std::string_view>& args);
    ExecResult handleHGET   (const std::vector<std::string_view>& args);
    ExecResult handleHGETALL(const std::vector<std::string_view>& args);

    // --------------------------------------------------------------------
    // Stream handlers (CommandHandler_stream.cpp)
    // --------------------------------------------------------------------
    ExecResult handleXADD  (const std::vector<std::string_view>& args);
    ExecResult handleXRANGE(const std::vector<std::string_view>& args);

    /**
     * XREAD [COUNT n] [BLOCK ms] STREAMS key... id...
     *
     * Behavior:
     *   • Any stream has entries after its ID → answer immediately.
     *   • Nothing yet and BLOCK given        → park the client
     *     (BLOCK 0 waits forever; the answer arrives through the Outbox)
     *   • Nothing and no BLOCK               → *-1
     */
    ExecResult handleXREAD (const std::vector<std::string_view>& args);

    // Re-checks parked readers in FIFO order after an XADD on `key`.
    void wakeBlockedXReadClients(const std::string& key);

    // Encoded XREAD answer for one reader, empty when it has nothing yet.
    std::string collectXRead(const std::vector<std::pair<std::string, StreamId>>& streams,
                             long long count);

    // --------------------------------------------------------------------
    // Transaction handlers (CommandHandler_transaction.cpp)
    // --------------------------------------------------------------------
    ExecResult handleMULTI  (const std::vector<std::string_view>& args);
    ExecResult handleEXEC   (const std::vector<std::string_view>& args);
    ExecResult handleDISCARD(const std::vector<std::string_view>& args);

    // Validates and queues a command while the client is inside MULTI.
    ExecResult queueCommand(ClientState& client, const std::string& upper_name,
                            const CommandSpec* spec,
                            const std::vector<std::string_view>& args);

    // --------------------------------------------------------------------
    // Server and replication handlers (CommandHandler_server.cpp,
    // CommandHandler_replication.cpp)
    // --------------------------------------------------------------------
    ExecResult handleINFO    (const std::vector<std::string_view>& args);
    ExecResult handleCONFIG  (const std::vector<std::string_view>& args);
    ExecResult handleSAVE    (const std::vector<std::string_view>& args);
    ExecResult handleREPLCONF(const std::vector<std::string_view>& args);
    ExecResult handlePSYNC   (const std::vector<std::string_view>& args);

    /**
     * WAIT numreplicas timeout
     *
     * The target is the replication offset at call time. Already satisfied
     * (or inside EXEC) → immediate integer. Otherwise GETACK is sent to the
     * replicas and the client is parked until enough ACKs or the timeout.
     */
    ExecResult handleWAIT    (const std::vector<std::string_view>& args);

    // Answers every parked WAIT whose quorum is now reached.
    void evaluateWaitClients();
};
