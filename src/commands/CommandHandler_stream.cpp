#include "./CommandHandler.hpp"

#include "../protocol/RESPWriter.hpp"
#include "../utils/Time.hpp"

namespace {

const char* const ERR_INVALID_ID = "ERR Invalid stream ID specified as stream command argument";

// *2 [ $id, *2k [field, value, ...] ]
std::string encodeEntries(const std::vector<StreamEntry>& entries) {
    std::string out = RESPWriter::arrayHeader(entries.size());

    for (const auto& entry : entries) {
        out += RESPWriter::arrayHeader(2);
        out += RESPWriter::bulk(entry.id.toString());

        std::vector<std::string> flat;
        flat.reserve(entry.fields.size() * 2);
        for (const auto& field : entry.fields) {
            flat.push_back(field.first);
            flat.push_back(field.second);
        }
        out += RESPWriter::bulkArray(flat);
    }
    return out;
}

} // namespace

/**
 * ----------------------------------------------------
 * handleXADD
 * ----------------------------------------------------
 * RESP command: XADD <key> <id> <field> <value> [<field> <value> ...]
 *
 * <id> is explicit ("ms-seq"), partially generated ("ms-*") or fully
 * generated ("*"). The reply is the final ID as a Bulk String, and the
 * command is replicated with that final ID so replicas store the same
 * entry.
 */
ExecResult CommandHandler::handleXADD(const std::vector<std::string_view>& args) {
    if ((args.size() - 3) % 2 != 0)
        return reply(RESPWriter::error("ERR wrong number of arguments for 'xadd' command"));

    const std::string stream_name(args[1]);

    StoredValue* obj = db.getObject(stream_name);
    if (obj && obj->type != ValueType::STREAM)
        return reply(RESPWriter::error("WRONGTYPE Operation against a key holding the wrong kind of value"));

    // The ID is resolved before the key is created so a rejected XADD
    // leaves no empty stream behind.
    const Stream empty{};
    const Stream& current = obj ? std::get<Stream>(obj->value) : empty;

    StreamId id;
    std::string err;
    if (!current.resolveId(std::string(args[2]), unix_time_ms(), id, err))
        return reply(RESPWriter::error(err));

    StreamFields fields;
    fields.reserve((args.size() - 3) / 2);
    for (std::size_t i = 3; i + 1 < args.size(); i += 2)
        fields.emplace_back(std::string(args[i]), std::string(args[i + 1]));

    Stream& stream = db.getOrCreateStream(stream_name);
    stream.addEntry(id, fields);

    std::vector<std::string> replicated{"XADD", stream_name, id.toString()};
    for (auto& field : fields) {
        replicated.push_back(std::move(field.first));
        replicated.push_back(std::move(field.second));
    }
    propagate_as = std::move(replicated);

    wakeBlockedXReadClients(stream_name);

    return reply(RESPWriter::bulk(id.toString()));
}

/**
 * ----------------------------------------------------
 * handleXRANGE
 * ----------------------------------------------------
 * RESP command: XRANGE <key> <start> <end> [COUNT n]
 *
 *   "-"      → smallest possible ID
 *   "+"      → largest possible ID
 *   "<ms>"   → <ms>-0 as start, <ms>-MAX as end
 *
 * Both bounds are inclusive. A missing key is an empty array.
 */
ExecResult CommandHandler::handleXRANGE(const std::vector<std::string_view>& args) {
    long long count = -1;

    if (args.size() == 6 && upper(args[4]) == "COUNT") {
        if (!parseInt(args[5], count))
            return reply(RESPWriter::error("ERR value is not an integer or out of range"));
        if (count < 0)
            count = 0;
    } else if (args.size() != 4) {
        return reply(RESPWriter::error("ERR syntax error"));
    }

    StreamId start;
    StreamId end;
    if (!StreamId::parseRangeBound(std::string(args[2]), true, start) ||
        !StreamId::parseRangeBound(std::string(args[3]), false, end))
        return reply(RESPWriter::error(ERR_INVALID_ID));

    StoredValue* obj = db.getObject(std::string(args[1]));
    if (!obj)
        return reply(RESPWriter::arrayHeader(0));

    if (obj->type != ValueType::STREAM)
        return reply(RESPWriter::error("WRONGTYPE Operation against a key holding the wrong kind of value"));

    if (count == 0)
        return reply(RESPWriter::arrayHeader(0));

    const Stream& stream = std::get<Stream>(obj->value);
    auto entries = stream.range(start, end, count > 0 ? static_cast<std::size_t>(count) : 0);

    return reply(encodeEntries(entries));
}

std::string CommandHandler::collectXRead(
    const std::vector<std::pair<std::string, StreamId>>& streams,
    long long count
) {
    std::string blocks;
    std::size_t matched = 0;

    for (const auto& wanted : streams) {
        StoredValue* obj = db.getObject(wanted.first);
        if (!obj || obj->type != ValueType::STREAM)
            continue;

        const Stream& stream = std::get<Stream>(obj->value);
        auto entries = stream.entriesAfter(wanted.second,
                                           count > 0 ? static_cast<std::size_t>(count) : 0);
        if (entries.empty())
            continue;

        blocks += RESPWriter::arrayHeader(2);
        blocks += RESPWriter::bulk(wanted.first);
        blocks += encodeEntries(entries);
        ++matched;
    }

    if (matched == 0)
        return "";

    return RESPWriter::arrayHeader(matched) + blocks;
}

ExecResult CommandHandler::handleXREAD(const std::vector<std::string_view>& args) {
    long long count = 0;
    long long timeout = 0;
    bool block = false;
    std::size_t i = 1;
    bool found_streams = false;

    while (i < args.size()) {
        const std::string opt = upper(args[i]);

        if (opt == "STREAMS") {
            ++i;
            found_streams = true;
            break;
        }

        if (i + 1 >= args.size())
            return reply(RESPWriter::error("ERR syntax error"));

        if (opt == "COUNT") {
            if (!parseInt(args[i + 1], count))
                return reply(RESPWriter::error("ERR value is not an integer or out of range"));
            if (count < 0)
                count = 0;
        } else if (opt == "BLOCK") {
            if (!parseInt(args[i + 1], timeout))
                return reply(RESPWriter::error("ERR timeout is not an integer or out of range"));
            if (timeout < 0)
                return reply(RESPWriter::error("ERR timeout is negative"));
            block = true;
        } else {
            return reply(RESPWriter::error("ERR syntax error"));
        }
        i += 2;
    }

    const std::size_t rest = args.size() - i;
    if (!found_streams || rest == 0 || rest % 2 != 0)
        return reply(RESPWriter::error(
            "ERR Unbalanced 'xread' list of streams: for each stream key an ID or '$' must be specified."));

    const std::size_t n = rest / 2;
    std::vector<std::pair<std::string, StreamId>> streams;
    streams.reserve(n);

    for (std::size_t k = 0; k < n; ++k) {
        std::string key(args[i + k]);
        std::string id_text(args[i + n + k]);

        StoredValue* obj = db.getObject(key);
        if (obj && obj->type != ValueType::STREAM)
            return reply(RESPWriter::error("WRONGTYPE Operation against a key holding the wrong kind of value"));

        StreamId after;
        if (id_text == "$") {
            // Only entries added from now on.
            if (obj)
                after = std::get<Stream>(obj->value).lastId();
        } else if (!StreamId::parse(id_text, after, true, 0)) {
            return reply(RESPWriter::error(ERR_INVALID_ID));
        }

        streams.emplace_back(std::move(key), after);
    }

    std::string result = collectXRead(streams, count);
    if (!result.empty())
        return reply(result);

    if (!block || blocking_disabled)
        return reply(RESPWriter::nullArray());

    BlockedXReadClient parked;
    parked.fd = client_fd;
    parked.deadline_ms = (timeout == 0) ? 0 : current_time_ms() + static_cast<uint64_t>(timeout);
    parked.streams = std::move(streams);
    parked.count = count;
    blockedXReadClients.push_back(std::move(parked));

    // No reply now; XADD or checkTimeouts() answers through the Outbox.
    return ExecResult("", true, client_fd);
}

void CommandHandler::wakeBlockedXReadClients(const std::string& stream_name) {
    std::deque<BlockedXReadClient> stillBlocked;

    for (auto& bc : blockedXReadClients) {
        bool watches = false;
        for (const auto& s : bc.streams) {
            if (s.first == stream_name) {
                watches = true;
                break;
            }
        }

        std::string payload = watches ? collectXRead(bc.streams, bc.count) : "";
        if (payload.empty()) {
            stillBlocked.push_back(std::move(bc));
            continue;
        }

        outbox.push(bc.fd, payload);
    }

    blockedXReadClients = std::move(stillBlocked);
}
