#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../types/Value.hpp"

enum class LookupStatus { FOUND, MISSING, WRONG_TYPE };

enum class IncrStatus { OK, NOT_INTEGER, WOULD_OVERFLOW, WRONG_TYPE };

// Central in-memory storage for every key (strings, hashes, streams)
// plus absolute expiry metadata.
//
// Expiry is lazy: every lookup first checks the key's deadline and, if it
// has passed, removes the key and reports it as missing. No background
// sweep is needed for correctness.
class Keyspace {
public:
    // --- STRING API ---

    // SET key value [expire_at_ms]
    // Replaces any previous value (of any type) and its expiry.
    void setString(const std::string& key, std::string value,
                   std::optional<uint64_t> expire_at_ms = std::nullopt);

    // SET ... KEEPTTL style write: the existing expiry survives.
    void setStringKeepTtl(const std::string& key, std::string value);

    // GET key
    LookupStatus getString(const std::string& key, std::string& out);

    // INCR key
    // A missing key starts at 0. The key's expiry is preserved.
    IncrStatus incr(const std::string& key, long long& result);

    // --- HASH API ---

    // Returns the hash at `key`, creating it when absent.
    // Callers check for WRONG_TYPE through getObject() first.
    Hash& getOrCreateHash(const std::string& key);

    // --- STREAM API ---

    // Returns the stream at `key`, creating it when absent.
    // Callers check for WRONG_TYPE through getObject() first.
    Stream& getOrCreateStream(const std::string& key);

    // --- GENERIC ---

    // Deletes any type of key. Returns true if it existed.
    bool del(const std::string& key);

    bool exists(const std::string& key);

    // "string", "hash", "stream" or "none".
    std::string typeOf(const std::string& key);

    // Raw access to the stored value, or nullptr if the key does not exist.
    StoredValue* getObject(const std::string& key);

    // Absolute expiry in Unix ms, if any.
    std::optional<uint64_t> expireAt(const std::string& key);

    // Sets the absolute expiry of an existing key.
    bool setExpireAt(const std::string& key, uint64_t expire_at_ms);

    // Live keys matching a glob pattern.
    std::vector<std::string> keys(const std::string& pattern);

    // Visits every live key. Expired keys are skipped (and removed).
    void forEach(const std::function<void(const std::string&,
                                          const StoredValue&,
                                          std::optional<uint64_t>)>& visit);

    std::size_t size() const { return data.size(); }
    std::size_t expiresCount() const { return expires.size(); }

    void clear();

private:
    // Main key → value dictionary
    std::unordered_map<std::string, StoredValue> data;

    // Key → absolute expiration time in Unix ms.
    // A key absent from this map never expires.
    std::unordered_map<std::string, uint64_t> expires;

    // Checks TTL and deletes the key if expired.
    // Returns true if the key is still valid (or has no TTL).
    bool ensureNotExpired(const std::string& key);

    void purgeExpired();
};
