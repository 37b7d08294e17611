#include "CommandHandler.hpp"

#include "../protocol/RESPWriter.hpp"

ExecResult CommandHandler::handleMULTI(const std::vector<std::string_view>&) {
    TransactionState& txn = clients[client_fd].txn;

    if (txn.active())
        return reply(RESPWriter::error("ERR MULTI calls can not be nested"));

    txn.phase = TransactionState::Phase::QUEUING;
    return reply(RESPWriter::simpleString("OK"));
}

/**
 * ----------------------------------------------------
 * queueCommand
 * ----------------------------------------------------
 * Called for every command a client sends between MULTI and
 * EXEC/DISCARD.
 *
 *   valid command   → appended to the queue, "+QUEUED"
 *   invalid command → its error is returned right away and the
 *                     transaction is marked ABORTED
 *
 * Nothing touches the keyspace until EXEC.
 */
ExecResult CommandHandler::queueCommand(ClientState& client, const std::string& upper_name,
                                        const CommandSpec* spec,
                                        const std::vector<std::string_view>& args) {
    std::string err = validate(upper_name, spec, args);

    if (err.empty() && replication.isReplica() && client_fd != MASTER_LINK_FD &&
        (spec->flags & CMD_WRITE))
        err = RESPWriter::error("READONLY You can't write against a read only replica.");

    if (!err.empty()) {
        client.txn.phase = TransactionState::Phase::ABORTED;
        client.txn.abort_reason = err;
        return reply(err);
    }

    client.txn.queue.emplace_back(args.begin(), args.end());
    return reply(RESPWriter::simpleString("QUEUED"));
}

/**
 * ----------------------------------------------------
 * handleEXEC
 * ----------------------------------------------------
 * Runs the queued commands back to back. The event loop does not read
 * from any other connection until the batch returns, so no other client
 * observes a partial transaction.
 *
 * A command failing at runtime puts its error in the reply array and
 * the batch goes on. Writes of the batch reach replicas wrapped in
 * MULTI ... EXEC so they are applied together there as well.
 */
ExecResult CommandHandler::handleEXEC(const std::vector<std::string_view>&) {
    TransactionState& txn = clients[client_fd].txn;

    if (!txn.active())
        return reply(RESPWriter::error("ERR EXEC without MULTI"));

    if (txn.phase == TransactionState::Phase::ABORTED) {
        txn.reset();
        return reply(RESPWriter::error("EXECABORT Transaction discarded because of previous errors."));
    }

    std::vector<std::vector<std::string>> queued = std::move(txn.queue);
    txn.reset();

    std::string out = RESPWriter::arrayHeader(queued.size());

    const bool previous = blocking_disabled;
    blocking_disabled = true;
    exec_writes.emplace();

    for (const auto& command : queued) {
        std::vector<std::string_view> views(command.begin(), command.end());
        const CommandSpec* spec = lookup(upper(views[0]));

        out += dispatch(*spec, views).reply;
    }

    blocking_disabled = previous;

    std::vector<std::vector<std::string>> writes = std::move(*exec_writes);
    exec_writes.reset();

    if (!writes.empty()) {
        replication.propagate({"MULTI"});
        for (const auto& w : writes)
            replication.propagate(w);
        replication.propagate({"EXEC"});
    }

    return reply(out);
}

ExecResult CommandHandler::handleDISCARD(const std::vector<std::string_view>&) {
    TransactionState& txn = clients[client_fd].txn;

    if (!txn.active())
        return reply(RESPWriter::error("ERR DISCARD without MULTI"));

    txn.reset();
    return reply(RESPWriter::simpleString("OK"));
}
