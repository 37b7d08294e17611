#include "CommandHandler.hpp"

#include "../protocol/RESPWriter.hpp"
#include "../utils/Time.hpp"

#include <algorithm>

namespace {
const char* const WRONGTYPE_ERR = "WRONGTYPE Operation against a key holding the wrong kind of value";
}

/**
 * ----------------------------------------------------
 * handlePING
 * ----------------------------------------------------
 * RESP command: PING [message]
 *
 * Behavior:
 *   Without an argument responds with "+PONG\r\n",
 *   otherwise echoes the message as a Bulk String.
 */
ExecResult CommandHandler::handlePING(const std::vector<std::string_view>& args) {
    if (args.size() > 2)
        return reply(RESPWriter::error("ERR wrong number of arguments for 'ping' command"));

    if (args.size() == 2)
        return reply(RESPWriter::bulk(args[1]));

    return reply(RESPWriter::simpleString("PONG"));
}

ExecResult CommandHandler::handleECHO(const std::vector<std::string_view>& args) {
    return reply(RESPWriter::bulk(args[1]));
}

/**
 * ----------------------------------------------------
 * handleSET
 * ----------------------------------------------------
 * RESP command:
 *    SET <key> <value> [EX seconds | PX milliseconds | KEEPTTL] [NX | XX]
 *
 * Behavior:
 *   Stores a string value, replacing any previous value of any type.
 *   Returns "+OK\r\n" on success.
 *
 *   NX → only when the key does not exist
 *   XX → only when the key already exists
 *   A write prevented by NX/XX answers a Null Bulk String and is not
 *   propagated.
 *
 * Error Handling:
 *   - non-positive or overflowing expire → invalid expire time
 *   - conflicting or unknown options      → syntax error
 */
ExecResult CommandHandler::handleSET(const std::vector<std::string_view>& args) {
    const std::string key(args[1]);

    bool nx = false;
    bool xx = false;
    bool keep_ttl = false;
    std::optional<uint64_t> expire_at;

    for (std::size_t i = 3; i < args.size(); ++i) {
        const std::string opt = upper(args[i]);

        if (opt == "NX" && !xx) {
            nx = true;
        } else if (opt == "XX" && !nx) {
            xx = true;
        } else if (opt == "KEEPTTL" && !expire_at) {
            keep_ttl = true;
        } else if ((opt == "EX" || opt == "PX") && !keep_ttl && !expire_at &&
                   i + 1 < args.size()) {
            long long amount = 0;
            if (!parseInt(args[++i], amount))
                return reply(RESPWriter::error("ERR value is not an integer or out of range"));

            const uint64_t now = unix_time_ms();
            if (amount <= 0 ||
                (opt == "EX" && static_cast<uint64_t>(amount) > (UINT64_MAX - now) / 1000) ||
                static_cast<uint64_t>(amount) > UINT64_MAX - now)
                return reply(RESPWriter::error("ERR invalid expire time in 'set' command"));

            uint64_t ttl_ms = static_cast<uint64_t>(amount);
            if (opt == "EX")
                ttl_ms *= 1000;
            expire_at = now + ttl_ms;
        } else {
            return reply(RESPWriter::error("ERR syntax error"));
        }
    }

    if (nx || xx) {
        const bool present = db.exists(key);
        if ((nx && present) || (xx && !present)) {
            skip_propagation = true;
            return reply(RESPWriter::nullBulk());
        }
    }

    if (keep_ttl)
        db.setStringKeepTtl(key, std::string(args[2]));
    else
        db.setString(key, std::string(args[2]), expire_at);

    return reply(RESPWriter::simpleString("OK"));
}

ExecResult CommandHandler::handleGET(const std::vector<std::string_view>& args) {
    std::string value;

    switch (db.getString(std::string(args[1]), value)) {
        case LookupStatus::FOUND:
            return reply(RESPWriter::bulk(value));
        case LookupStatus::WRONG_TYPE:
            return reply(RESPWriter::error(WRONGTYPE_ERR));
        case LookupStatus::MISSING:
            break;
    }
    return reply(RESPWriter::nullBulk());
}

/**
 * ----------------------------------------------------
 * handleINCR
 * ----------------------------------------------------
 * RESP command: INCR <key>
 *
 * A missing key counts as 0. The TTL of an existing key is kept.
 */
ExecResult CommandHandler::handleINCR(const std::vector<std::string_view>& args) {
    long long result = 0;

    switch (db.incr(std::string(args[1]), result)) {
        case IncrStatus::OK:
            return reply(RESPWriter::integer(result));
        case IncrStatus::NOT_INTEGER:
            return reply(RESPWriter::error("ERR value is not an integer or out of range"));
        case IncrStatus::WOULD_OVERFLOW:
            return reply(RESPWriter::error("ERR increment or decrement would overflow"));
        case IncrStatus::WRONG_TYPE:
            break;
    }
    return reply(RESPWriter::error(WRONGTYPE_ERR));
}

ExecResult CommandHandler::handleDEL(const std::vector<std::string_view>& args) {
    long long removed = 0;
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (db.del(std::string(args[i])))
            ++removed;
    }

    if (removed == 0)
        skip_propagation = true;

    return reply(RESPWriter::integer(removed));
}

// Keys repeated in the argument list are counted each time.
ExecResult CommandHandler::handleEXISTS(const std::vector<std::string_view>& args) {
    long long found = 0;
    for (std::size_t i = 1; i < args.size(); ++i) {
        if (db.exists(std::string(args[i])))
            ++found;
    }
    return reply(RESPWriter::integer(found));
}

ExecResult CommandHandler::handleTYPE(const std::vector<std::string_view>& args) {
    return reply(RESPWriter::simpleString(db.typeOf(std::string(args[1]))));
}

ExecResult CommandHandler::handleKEYS(const std::vector<std::string_view>& args) {
    std::vector<std::string> keys = db.keys(std::string(args[1]));
    std::sort(keys.begin(), keys.end());
    return reply(RESPWriter::bulkArray(keys));
}
