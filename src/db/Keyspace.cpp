#include "Keyspace.hpp"
#include "../utils/Time.hpp"

#include <climits>
#include <fnmatch.h>

namespace {

bool parseStrictInteger(const std::string& s, long long& out) {
    if (s.empty() || s.size() > 20)
        return false;

    std::size_t i = 0;
    bool negative = false;
    if (s[0] == '-') {
        negative = true;
        i = 1;
        if (s.size() == 1)
            return false;
    }

    // Redis refuses "+1", "01", " 1" and friends.
    if (s[i] == '0' && s.size() > i + 1)
        return false;

    unsigned long long value = 0;
    for (; i < s.size(); i++) {
        if (s[i] < '0' || s[i] > '9')
            return false;
        value = value * 10 + static_cast<unsigned long long>(s[i] - '0');
        if (value > static_cast<unsigned long long>(LLONG_MAX) + (negative ? 1ULL : 0ULL))
            return false;
    }

    if (negative) {
        out = (value == static_cast<unsigned long long>(LLONG_MAX) + 1ULL)
                  ? LLONG_MIN
                  : -static_cast<long long>(value);
    } else {
        out = static_cast<long long>(value);
    }
    return true;
}

} // namespace

// Internal: check TTL and delete key if expired.
bool Keyspace::ensureNotExpired(const std::string& key) {
    auto ttl_it = expires.find(key);
    if (ttl_it == expires.end())
        return true;

    if (unix_time_ms() >= ttl_it->second) {
        data.erase(key);
        expires.erase(ttl_it);
        return false;
    }
    return true;
}

void Keyspace::purgeExpired() {
    uint64_t now = unix_time_ms();
    for (auto it = expires.begin(); it != expires.end(); ) {
        if (now >= it->second) {
            data.erase(it->first);
            it = expires.erase(it);
        } else {
            ++it;
        }
    }
}

// ----------------------------------------------------
// STRING
// ----------------------------------------------------
void Keyspace::setString(const std::string& key, std::string value,
                         std::optional<uint64_t> expire_at_ms) {
    data[key] = StoredValue{ValueType::STRING, std::move(value)};

    if (expire_at_ms)
        expires[key] = *expire_at_ms;
    else
        expires.erase(key);
}

void Keyspace::setStringKeepTtl(const std::string& key, std::string value) {
    ensureNotExpired(key);
    data[key] = StoredValue{ValueType::STRING, std::move(value)};
}

LookupStatus Keyspace::getString(const std::string& key, std::string& out) {
    StoredValue* obj = getObject(key);
    if (!obj)
        return LookupStatus::MISSING;

    if (obj->type != ValueType::STRING)
        return LookupStatus::WRONG_TYPE;

    out = std::get<std::string>(obj->value);
    return LookupStatus::FOUND;
}

IncrStatus Keyspace::incr(const std::string& key, long long& result) {
    StoredValue* obj = getObject(key);

    if (!obj) {
        // Absent: behaves as "0", keeps no TTL.
        setString(key, "1");
        result = 1;
        return IncrStatus::OK;
    }

    if (obj->type != ValueType::STRING)
        return IncrStatus::WRONG_TYPE;

    std::string& current = std::get<std::string>(obj->value);
    long long value = 0;
    if (!parseStrictInteger(current, value))
        return IncrStatus::NOT_INTEGER;

    if (value == LLONG_MAX)
        return IncrStatus::WOULD_OVERFLOW;

    result = value + 1;
    current = std::to_string(result);
    return IncrStatus::OK;
}

// ----------------------------------------------------
// HASH / STREAM helpers
// ----------------------------------------------------
Hash& Keyspace::getOrCreateHash(const std::string& key) {
    StoredValue* obj = getObject(key);
    if (!obj || obj->type != ValueType::HASH) {
        data[key] = StoredValue{ValueType::HASH, Hash{}};
        expires.erase(key);
        obj = &data[key];
    }
    return std::get<Hash>(obj->value);
}

Stream& Keyspace::getOrCreateStream(const std::string& key) {
    StoredValue* obj = getObject(key);
    if (!obj || obj->type != ValueType::STREAM) {
        data[key] = StoredValue{ValueType::STREAM, Stream{}};
        expires.erase(key);
        obj = &data[key];
    }
    return std::get<Stream>(obj->value);
}

// ----------------------------------------------------
// Generic
// ----------------------------------------------------
bool Keyspace::del(const std::string& key) {
    if (!ensureNotExpired(key))
        return false;

    expires.erase(key);
    return data.erase(key) > 0;
}

bool Keyspace::exists(const std::string& key) {
    return getObject(key) != nullptr;
}

std::string Keyspace::typeOf(const std::string& key) {
    StoredValue* obj = getObject(key);
    if (!obj)
        return "none";

    switch (obj->type) {
        case ValueType::STRING: return "string";
        case ValueType::HASH:   return "hash";
        case ValueType::STREAM: return "stream";
    }
    return "none";
}

StoredValue* Keyspace::getObject(const std::string& key) {
    auto it = data.find(key);
    if (it == data.end())
        return nullptr;

    if (!ensureNotExpired(key))
        return nullptr;

    return &it->second;
}

std::optional<uint64_t> Keyspace::expireAt(const std::string& key) {
    if (!getObject(key))
        return std::nullopt;

    auto it = expires.find(key);
    if (it == expires.end())
        return std::nullopt;
    return it->second;
}

bool Keyspace::setExpireAt(const std::string& key, uint64_t expire_at_ms) {
    if (!getObject(key))
        return false;

    expires[key] = expire_at_ms;
    ensureNotExpired(key);
    return true;
}

std::vector<std::string> Keyspace::keys(const std::string& pattern) {
    purgeExpired();

    std::vector<std::string> out;
    for (const auto& kv : data) {
        if (pattern == "*" || fnmatch(pattern.c_str(), kv.first.c_str(), 0) == 0)
            out.push_back(kv.first);
    }
    return out;
}

void Keyspace::forEach(const std::function<void(const std::string&,
                                                const StoredValue&,
                                                std::optional<uint64_t>)>& visit) {
    purgeExpired();

    for (const auto& kv : data) {
        std::optional<uint64_t> expire_at;
        auto ttl_it = expires.find(kv.first);
        if (ttl_it != expires.end())
            expire_at = ttl_it->second;

        visit(kv.first, kv.second, expire_at);
    }
}

void Keyspace::clear() {
    data.clear();
    expires.clear();
}
