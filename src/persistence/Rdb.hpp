#pragma once

#include <cstdint>
#include <string>

class Keyspace;

/*
------------------------------------------------------------------------------
  RDB SNAPSHOTS
------------------------------------------------------------------------------

  File layout handled here:

    "REDIS" + 4-digit version
    [0xFA aux-key aux-value]*
    0xFE db-number
    0xFB db-size expires-size
    ( [0xFC ms-u64-le | 0xFD sec-u32-le] type key value )*
    0xFF crc64-le

  Value types: 0 (string), 4 (hash) and 0xE0, a plain stream encoding
  private to emberkv (files holding streams are not readable by redis).
  Strings may be raw, integer encoded (int8/16/32) or LZF compressed.
------------------------------------------------------------------------------
*/

class RdbWriter {
public:
    // Point-in-time image of the keyspace.
    static std::string serialize(Keyspace& keyspace);

    // serialize() to a temporary file, then rename over `path`.
    static bool save(const std::string& path, Keyspace& keyspace, std::string& err);
};

class RdbLoader {
public:
    // Replaces the keyspace contents with the snapshot. Keys already
    // expired at load time are skipped. On error the keys decoded so far
    // stay loaded and `err` describes the failure.
    static bool loadBuffer(const std::string& data, Keyspace& keyspace, std::string& err);

    static bool loadFile(const std::string& path, Keyspace& keyspace, std::string& err);
};

// CRC-64/Jones as used by the RDB trailer.
uint64_t rdbCrc64(uint64_t crc, const unsigned char* data, std::size_t len);
