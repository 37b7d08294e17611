#include "CommandHandler.hpp"

#include "../protocol/RESPWriter.hpp"

#include <algorithm>

/**
 * ----------------------------------------------------
 * handleHSET
 * ----------------------------------------------------
 * RESP command: HSET <key> <field> <value> [<field> <value> ...]
 *
 * Behavior:
 *   Creates the hash when missing and sets every pair in order.
 *   Returns the number of fields that did not exist before.
 */
ExecResult CommandHandler::handleHSET(const std::vector<std::string_view>& args) {
    if (args.size() % 2 != 0)
        return reply(RESPWriter::error("ERR wrong number of arguments for 'hset' command"));

    const std::string key(args[1]);
    StoredValue* obj = db.getObject(key);
    if (obj && obj->type != ValueType::HASH)
        return reply(RESPWriter::error("WRONGTYPE Operation against a key holding the wrong kind of value"));

    Hash& hash = db.getOrCreateHash(key);

    long long added = 0;
    for (std::size_t i = 2; i + 1 < args.size(); i += 2) {
        auto res = hash.insert_or_assign(std::string(args[i]), std::string(args[i + 1]));
        if (res.second)
            ++added;
    }

    return reply(RESPWriter::integer(added));
}

ExecResult CommandHandler::handleHGET(const std::vector<std::string_view>& args) {
    StoredValue* obj = db.getObject(std::string(args[1]));
    if (!obj)
        return reply(RESPWriter::nullBulk());

    if (obj->type != ValueType::HASH)
        return reply(RESPWriter::error("WRONGTYPE Operation against a key holding the wrong kind of value"));

    const Hash& hash = std::get<Hash>(obj->value);
    auto it = hash.find(std::string(args[2]));
    if (it == hash.end())
        return reply(RESPWriter::nullBulk());

    return reply(RESPWriter::bulk(it->second));
}

// Flat field, value, field, value... array ordered by field name.
ExecResult CommandHandler::handleHGETALL(const std::vector<std::string_view>& args) {
    StoredValue* obj = db.getObject(std::string(args[1]));
    if (!obj)
        return reply(RESPWriter::arrayHeader(0));

    if (obj->type != ValueType::HASH)
        return reply(RESPWriter::error("WRONGTYPE Operation against a key holding the wrong kind of value"));

    const Hash& hash = std::get<Hash>(obj->value);
    std::vector<std::pair<std::string, std::string>> pairs(hash.begin(), hash.end());
    std::sort(pairs.begin(), pairs.end());

    std::vector<std::string> flat;
    flat.reserve(pairs.size() * 2);
    for (auto& p : pairs) {
        flat.push_back(std::move(p.first));
        flat.push_back(std::move(p.second));
    }
    return reply(RESPWriter::bulkArray(flat));
}
