#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/*
------------------------------------------------------------------------------
  STREAM ID TYPES
------------------------------------------------------------------------------

XADD accepts three ID input modes:

1) EXPLICIT ("1526919030474-0")
     Must be greater than 0-0 and strictly greater than the last ID.

2) AUTO_SEQUENCE ("1526919030474-*")
     Timestamp fixed, sequence = last_seq + 1 when the timestamp equals
     the last one, 0 when it is larger (1 for timestamp 0).

3) AUTO_GENERATED ("*")
     ms  = current Unix time in ms
     seq = (last.ms == ms) ? last.seq + 1 : 0
     If the clock is behind the last ID, the last ms is reused so IDs
     keep increasing.

4) INVALID
     Anything else.
------------------------------------------------------------------------------
*/
enum class StreamIdType {
    EXPLICIT,
    AUTO_SEQUENCE,
    AUTO_GENERATED,
    INVALID
};

/**
 * (ms, seq) pair, ordered lexicographically.
 */
struct StreamId {
    uint64_t ms = 0;
    uint64_t seq = 0;

    static StreamId min() { return StreamId{0, 0}; }
    static StreamId max() { return StreamId{UINT64_MAX, UINT64_MAX}; }

    // "<ms>-<seq>", or "<ms>" alone when `missing_seq` may stand in for the sequence.
    static bool parse(const std::string& text, StreamId& out,
                      bool allow_missing_seq = false, uint64_t missing_seq = 0);

    // XRANGE bound: "-", "+", "<ms>" or "<ms>-<seq>".
    // A bare "<ms>" means <ms>-0 as a start and <ms>-MAX as an end.
    static bool parseRangeBound(const std::string& text, bool is_start, StreamId& out);

    std::string toString() const;

    bool operator==(const StreamId& o) const { return ms == o.ms && seq == o.seq; }
    bool operator!=(const StreamId& o) const { return !(*this == o); }
    bool operator<(const StreamId& o) const { return ms < o.ms || (ms == o.ms && seq < o.seq); }
    bool operator>(const StreamId& o) const { return o < *this; }
    bool operator<=(const StreamId& o) const { return !(o < *this); }
    bool operator>=(const StreamId& o) const { return !(*this < o); }
};

using StreamFields = std::vector<std::pair<std::string, std::string>>;

/*
------------------------------------------------------------------------------
  STREAM ENTRY
------------------------------------------------------------------------------
  id     → unique (ms, seq) identifier
  fields → field/value pairs in insertion order (duplicates allowed)
------------------------------------------------------------------------------
*/
struct StreamEntry {
    StreamId id;
    StreamFields fields;
};

/*
------------------------------------------------------------------------------
  STREAM CLASS
------------------------------------------------------------------------------

  Append-only log of StreamEntry items kept in ID order, so every range
  query is two binary searches plus a copy.

  Error strings are RESP error messages without the leading '-'.
------------------------------------------------------------------------------
*/
class Stream {
private:
    std::vector<StreamEntry> entries;

    // Highest ID ever appended, 0-0 for a fresh stream.
    StreamId last_id;

public:
    // Determines the type of ID supplied to XADD.
    StreamIdType returnStreamType(const std::string& id) const;

    // Turns an XADD ID argument into the concrete ID to append.
    // `now_ms` is the wall clock used for "*".
    bool resolveId(const std::string& spec, uint64_t now_ms,
                   StreamId& out, std::string& err) const;

    // Checks an explicit ID against 0-0 and the last ID.
    bool validateId(const StreamId& id, std::string& err) const;

    // Appends an entry. The ID must already be resolved and validated.
    StreamId addEntry(const StreamId& id, StreamFields fields);

    // Inclusive range scan; count 0 = unlimited.
    std::vector<StreamEntry> range(const StreamId& start, const StreamId& end,
                                   std::size_t count = 0) const;

    // Entries with ID strictly greater than `after`; count 0 = unlimited.
    std::vector<StreamEntry> entriesAfter(const StreamId& after,
                                          std::size_t count = 0) const;

    StreamId lastId() const { return last_id; }

    // Snapshot restore. Never moves the last ID backwards.
    void restoreLastId(const StreamId& id) {
        if (id > last_id)
            last_id = id;
    }

    const std::vector<StreamEntry>& allEntries() const { return entries; }
    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }
};
