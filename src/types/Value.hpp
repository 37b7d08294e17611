#pragma once

#include <string>
#include <unordered_map>
#include <variant>

#include "../db/Stream.hpp"

enum class ValueType { STRING, HASH, STREAM };

using Hash = std::unordered_map<std::string, std::string>;

// One keyspace entry. `type` always names the alternative held by `value`.
struct StoredValue {
    ValueType type;
    std::variant<std::string, Hash, Stream> value;
};
