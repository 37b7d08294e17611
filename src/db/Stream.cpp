#include "Stream.hpp"

#include <algorithm>

namespace {

const char* const ERR_ID_TOO_SMALL =
    "ERR The ID specified in XADD is equal or smaller than the target stream top item";
const char* const ERR_ID_ZERO =
    "ERR The ID specified in XADD must be greater than 0-0";
const char* const ERR_ID_INVALID =
    "ERR Invalid stream ID specified as stream command argument";

bool parseUnsigned(const std::string& s, uint64_t& out) {
    if (s.empty() || s.size() > 20)
        return false;

    uint64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9')
            return false;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10)
            return false;
        value = value * 10 + digit;
    }

    out = value;
    return true;
}

bool idLess(const StreamEntry& entry, const StreamId& id) {
    return entry.id < id;
}

bool idGreater(const StreamId& id, const StreamEntry& entry) {
    return id < entry.id;
}

} // namespace

// ----------------------------------------------------
// StreamId
// ----------------------------------------------------
bool StreamId::parse(const std::string& text, StreamId& out,
                     bool allow_missing_seq, uint64_t missing_seq) {
    size_t pos = text.find('-');

    if (pos == std::string::npos) {
        if (!allow_missing_seq)
            return false;
        uint64_t ms = 0;
        if (!parseUnsigned(text, ms))
            return false;
        out = StreamId{ms, missing_seq};
        return true;
    }

    uint64_t ms = 0;
    uint64_t seq = 0;
    if (!parseUnsigned(text.substr(0, pos), ms) ||
        !parseUnsigned(text.substr(pos + 1), seq))
        return false;

    out = StreamId{ms, seq};
    return true;
}

bool StreamId::parseRangeBound(const std::string& text, bool is_start, StreamId& out) {
    if (text == "-") {
        out = StreamId::min();
        return true;
    }
    if (text == "+") {
        out = StreamId::max();
        return true;
    }
    return parse(text, out, true, is_start ? 0 : UINT64_MAX);
}

std::string StreamId::toString() const {
    return std::to_string(ms) + "-" + std::to_string(seq);
}

/*
===============================================================================
  returnStreamType()
-------------------------------------------------------------------------------
  "*"          → AUTO_GENERATED
  "<ms>-*"     → AUTO_SEQUENCE
  "<ms>-<seq>" → EXPLICIT
  otherwise    → INVALID
===============================================================================
*/
StreamIdType Stream::returnStreamType(const std::string& id) const {
    if (id == "*")
        return StreamIdType::AUTO_GENERATED;

    size_t pos = id.find('-');
    if (pos == std::string::npos)
        return StreamIdType::INVALID;

    std::string left = id.substr(0, pos);
    std::string right = id.substr(pos + 1);

    uint64_t scratch = 0;
    if (!parseUnsigned(left, scratch))
        return StreamIdType::INVALID;

    if (right == "*")
        return StreamIdType::AUTO_SEQUENCE;

    if (parseUnsigned(right, scratch))
        return StreamIdType::EXPLICIT;

    return StreamIdType::INVALID;
}

bool Stream::validateId(const StreamId& id, std::string& err) const {
    if (id == StreamId::min()) {
        err = ERR_ID_ZERO;
        return false;
    }

    if (id <= last_id) {
        err = ERR_ID_TOO_SMALL;
        return false;
    }

    return true;
}

/*
===============================================================================
  resolveId()
-------------------------------------------------------------------------------
  Produces the ID an XADD will append, or fails with the error the client
  gets back. Nothing is mutated here, so a rejected XADD leaves the stream
  exactly as it was.
===============================================================================
*/
bool Stream::resolveId(const std::string& spec, uint64_t now_ms,
                       StreamId& out, std::string& err) const {
    switch (returnStreamType(spec)) {
        case StreamIdType::INVALID:
            err = ERR_ID_INVALID;
            return false;

        case StreamIdType::EXPLICIT: {
            StreamId id;
            if (!StreamId::parse(spec, id)) {
                err = ERR_ID_INVALID;
                return false;
            }
            if (!validateId(id, err))
                return false;
            out = id;
            return true;
        }

        case StreamIdType::AUTO_SEQUENCE: {
            uint64_t ms = 0;
            parseUnsigned(spec.substr(0, spec.find('-')), ms);

            if (ms < last_id.ms) {
                err = ERR_ID_TOO_SMALL;
                return false;
            }

            StreamId id{ms, 0};
            if (ms == last_id.ms) {
                if (last_id.seq == UINT64_MAX) {
                    err = ERR_ID_TOO_SMALL;
                    return false;
                }
                id.seq = last_id.seq + 1;
            }

            if (!validateId(id, err))
                return false;
            out = id;
            return true;
        }

        case StreamIdType::AUTO_GENERATED: {
            StreamId id{now_ms, 0};

            // Clock behind (or equal to) the last ID: stay on the last
            // timestamp and bump the sequence.
            if (now_ms <= last_id.ms) {
                if (last_id.seq == UINT64_MAX) {
                    if (last_id.ms == UINT64_MAX) {
                        err = "ERR The stream has exhausted the last possible ID, unable to add more items";
                        return false;
                    }
                    id = StreamId{last_id.ms + 1, 0};
                } else {
                    id = StreamId{last_id.ms, last_id.seq + 1};
                }
            }

            if (!validateId(id, err))
                return false;
            out = id;
            return true;
        }
    }

    err = ERR_ID_INVALID;
    return false;
}

StreamId Stream::addEntry(const StreamId& id, StreamFields fields) {
    entries.push_back(StreamEntry{id, std::move(fields)});
    last_id = id;
    return id;
}

std::vector<StreamEntry> Stream::range(const StreamId& start, const StreamId& end,
                                       std::size_t count) const {
    std::vector<StreamEntry> result;

    if (entries.empty() || end < start)
        return result;

    auto first = std::lower_bound(entries.begin(), entries.end(), start, idLess);
    auto last  = std::upper_bound(entries.begin(), entries.end(), end, idGreater);

    for (auto it = first; it < last; ++it) {
        if (count != 0 && result.size() >= count)
            break;
        result.push_back(*it);
    }

    return result;
}

std::vector<StreamEntry> Stream::entriesAfter(const StreamId& after,
                                              std::size_t count) const {
    std::vector<StreamEntry> result;

    auto first = std::upper_bound(entries.begin(), entries.end(), after, idGreater);

    for (auto it = first; it != entries.end(); ++it) {
        if (count != 0 && result.size() >= count)
            break;
        result.push_back(*it);
    }

    return result;
}
