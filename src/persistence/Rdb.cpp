#include "Rdb.hpp"

#include "../db/Keyspace.hpp"
#include "../utils/Logger.hpp"
#include "../utils/Time.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iterator>

namespace {

constexpr uint8_t RDB_OPCODE_AUX           = 0xFA;
constexpr uint8_t RDB_OPCODE_RESIZEDB      = 0xFB;
constexpr uint8_t RDB_OPCODE_EXPIRETIME_MS = 0xFC;
constexpr uint8_t RDB_OPCODE_EXPIRETIME    = 0xFD;
constexpr uint8_t RDB_OPCODE_SELECTDB      = 0xFE;
constexpr uint8_t RDB_OPCODE_EOF           = 0xFF;

constexpr uint8_t RDB_TYPE_STRING = 0;
constexpr uint8_t RDB_TYPE_HASH   = 4;

// emberkv's own stream encoding, outside the range redis uses:
//   last-ms last-seq entry-count ( ms seq pair-count (field value)* )*
// All numbers are length-encoded.
constexpr uint8_t RDB_TYPE_STREAM_PLAIN = 0xE0;

constexpr uint8_t RDB_ENC_INT8  = 0;
constexpr uint8_t RDB_ENC_INT16 = 1;
constexpr uint8_t RDB_ENC_INT32 = 2;
constexpr uint8_t RDB_ENC_LZF   = 3;

constexpr const char* RDB_MAGIC = "REDIS0011";

// Upper bound for a decoded string, so a corrupt length cannot force a
// huge allocation.
constexpr uint64_t RDB_MAX_STRING_LENGTH = 512ULL * 1024 * 1024;

// ----------------------------------------------------
// CRC64 lookup table (reflected Jones polynomial)
// ----------------------------------------------------
struct Crc64Table {
    uint64_t entries[256];

    Crc64Table() {
        const uint64_t poly = 0x95AC9329AC4BC9B5ULL;
        for (int i = 0; i < 256; ++i) {
            uint64_t crc = static_cast<uint64_t>(i);
            for (int j = 0; j < 8; ++j)
                crc = (crc & 1) ? (crc >> 1) ^ poly : (crc >> 1);
            entries[i] = crc;
        }
    }
};

const Crc64Table& crcTable() {
    static const Crc64Table table;
    return table;
}

// ----------------------------------------------------
// Writer side
// ----------------------------------------------------
class ByteWriter {
public:
    void u8(uint8_t v) { buf.push_back(static_cast<char>(v)); }

    void u32le(uint32_t v) {
        for (int i = 0; i < 4; ++i)
            u8(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }

    void u64le(uint64_t v) {
        for (int i = 0; i < 8; ++i)
            u8(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }

    void raw(const std::string& s) { buf += s; }

    void length(uint64_t len) {
        if (len < 64) {
            u8(static_cast<uint8_t>(len));
        } else if (len < 16384) {
            u8(static_cast<uint8_t>(0x40 | (len >> 8)));
            u8(static_cast<uint8_t>(len & 0xFF));
        } else if (len <= 0xFFFFFFFFULL) {
            u8(0x80);
            for (int i = 3; i >= 0; --i)
                u8(static_cast<uint8_t>((len >> (8 * i)) & 0xFF));
        } else {
            u8(0x81);
            for (int i = 7; i >= 0; --i)
                u8(static_cast<uint8_t>((len >> (8 * i)) & 0xFF));
        }
    }

    // Small canonical integers use the compact integer encodings.
    void string(const std::string& s) {
        long long v = 0;
        if (canonicalInteger(s, v)) {
            if (v >= -128 && v <= 127) {
                u8(0xC0 | RDB_ENC_INT8);
                u8(static_cast<uint8_t>(static_cast<int8_t>(v)));
                return;
            }
            if (v >= -32768 && v <= 32767) {
                u8(0xC0 | RDB_ENC_INT16);
                uint16_t w = static_cast<uint16_t>(static_cast<int16_t>(v));
                u8(static_cast<uint8_t>(w & 0xFF));
                u8(static_cast<uint8_t>(w >> 8));
                return;
            }
            if (v >= -2147483648LL && v <= 2147483647LL) {
                u8(0xC0 | RDB_ENC_INT32);
                u32le(static_cast<uint32_t>(static_cast<int32_t>(v)));
                return;
            }
        }
        length(s.size());
        raw(s);
    }

    std::string& data() { return buf; }

private:
    std::string buf;

    static bool canonicalInteger(const std::string& s, long long& out) {
        if (s.empty() || s.size() > 11)
            return false;
        size_t i = (s[0] == '-') ? 1 : 0;
        if (i == s.size())
            return false;
        if (s[i] == '0' && s.size() > i + 1)
            return false;
        if (s == "-0")
            return false;
        long long v = 0;
        for (; i < s.size(); ++i) {
            if (s[i] < '0' || s[i] > '9')
                return false;
            v = v * 10 + (s[i] - '0');
        }
        out = (s[0] == '-') ? -v : v;
        return true;
    }
};

// ----------------------------------------------------
// Reader side
// ----------------------------------------------------
class ByteReader {
public:
    ByteReader(const std::string& d, size_t start) : data(d), pos(start) {}

    size_t remaining() const { return pos < data.size() ? data.size() - pos : 0; }
    size_t position() const { return pos; }

    bool u8(uint8_t& v) {
        if (remaining() < 1) return false;
        v = static_cast<uint8_t>(data[pos++]);
        return true;
    }

    bool uintLe(int bytes, uint64_t& v) {
        if (remaining() < static_cast<size_t>(bytes)) return false;
        v = 0;
        for (int i = 0; i < bytes; ++i)
            v |= static_cast<uint64_t>(static_cast<uint8_t>(data[pos + i])) << (8 * i);
        pos += bytes;
        return true;
    }

    bool uintBe(int bytes, uint64_t& v) {
        if (remaining() < static_cast<size_t>(bytes)) return false;
        v = 0;
        for (int i = 0; i < bytes; ++i)
            v = (v << 8) | static_cast<uint8_t>(data[pos + i]);
        pos += bytes;
        return true;
    }

    bool bytes(size_t n, std::string& out) {
        if (remaining() < n) return false;
        out.assign(data, pos, n);
        pos += n;
        return true;
    }

    // Length encoding; `encoded` is set for the 11xxxxxx special forms.
    bool length(uint64_t& len, bool& encoded) {
        encoded = false;
        uint8_t first = 0;
        if (!u8(first)) return false;

        switch (first >> 6) {
            case 0:
                len = first & 0x3F;
                return true;
            case 1: {
                uint8_t next = 0;
                if (!u8(next)) return false;
                len = (static_cast<uint64_t>(first & 0x3F) << 8) | next;
                return true;
            }
            case 2:
                if (first == 0x80) return uintBe(4, len);
                if (first == 0x81) return uintBe(8, len);
                return false;
            default:
                encoded = true;
                len = first & 0x3F;
                return true;
        }
    }

    bool plainLength(uint64_t& len) {
        bool encoded = false;
        return length(len, encoded) && !encoded;
    }

    bool string(std::string& out) {
        uint64_t len = 0;
        bool encoded = false;
        if (!length(len, encoded)) return false;

        if (!encoded)
            return bytes(static_cast<size_t>(len), out);

        uint64_t v = 0;
        switch (len) {
            case RDB_ENC_INT8:
                if (!uintLe(1, v)) return false;
                out = std::to_string(static_cast<int8_t>(v));
                return true;
            case RDB_ENC_INT16:
                if (!uintLe(2, v)) return false;
                out = std::to_string(static_cast<int16_t>(v));
                return true;
            case RDB_ENC_INT32:
                if (!uintLe(4, v)) return false;
                out = std::to_string(static_cast<int32_t>(v));
                return true;
            case RDB_ENC_LZF: {
                uint64_t clen = 0;
                uint64_t ulen = 0;
                std::string compressed;
                if (!plainLength(clen) || !plainLength(ulen)) return false;
                if (ulen > RDB_MAX_STRING_LENGTH || clen > remaining()) return false;
                if (!bytes(static_cast<size_t>(clen), compressed)) return false;
                return lzfDecompress(compressed, static_cast<size_t>(ulen), out);
            }
            default:
                return false;
        }
    }

private:
    const std::string& data;
    size_t pos;

    static bool lzfDecompress(const std::string& in, size_t out_len, std::string& out) {
        out.assign(out_len, '\0');
        size_t ip = 0;
        size_t op = 0;

        while (ip < in.size()) {
            uint8_t ctrl = static_cast<uint8_t>(in[ip++]);

            if (ctrl < 32) {
                // literal run of ctrl + 1 bytes
                size_t run = static_cast<size_t>(ctrl) + 1;
                if (ip + run > in.size() || op + run > out_len) return false;
                std::memcpy(&out[op], in.data() + ip, run);
                ip += run;
                op += run;
                continue;
            }

            // back reference
            size_t run = ctrl >> 5;
            if (run == 7) {
                if (ip >= in.size()) return false;
                run += static_cast<uint8_t>(in[ip++]);
            }
            run += 2;

            if (ip >= in.size()) return false;
            size_t back = ((static_cast<size_t>(ctrl) & 0x1F) << 8) +
                          static_cast<uint8_t>(in[ip++]) + 1;
            if (back > op || op + run > out_len) return false;

            for (size_t i = 0; i < run; ++i, ++op)
                out[op] = out[op - back];
        }

        return op == out_len;
    }
};

// Entries must come in strictly increasing ID order.
bool readStream(ByteReader& r, Stream& stream, std::string& err) {
    StreamId last;
    uint64_t count = 0;
    if (!r.plainLength(last.ms) || !r.plainLength(last.seq) || !r.plainLength(count)) {
        err = "malformed stream header";
        return false;
    }

    for (uint64_t i = 0; i < count; ++i) {
        StreamId id;
        uint64_t pairs = 0;
        if (!r.plainLength(id.ms) || !r.plainLength(id.seq) || !r.plainLength(pairs)) {
            err = "malformed stream entry";
            return false;
        }

        std::string id_err;
        if (!stream.validateId(id, id_err)) {
            err = "stream entry " + id.toString() + " out of order";
            return false;
        }

        StreamFields fields;
        for (uint64_t k = 0; k < pairs; ++k) {
            std::string field;
            std::string value;
            if (!r.string(field) || !r.string(value)) {
                err = "malformed stream field";
                return false;
            }
            fields.emplace_back(std::move(field), std::move(value));
        }
        stream.addEntry(id, std::move(fields));
    }

    stream.restoreLastId(last);
    return true;
}

} // namespace

uint64_t rdbCrc64(uint64_t crc, const unsigned char* data, std::size_t len) {
    const Crc64Table& table = crcTable();
    for (std::size_t i = 0; i < len; ++i)
        crc = table.entries[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    return crc;
}

// ----------------------------------------------------
// RdbWriter
// ----------------------------------------------------
std::string RdbWriter::serialize(Keyspace& keyspace) {
    ByteWriter w;
    w.raw(RDB_MAGIC);

    auto aux = [&w](const std::string& key, const std::string& value) {
        w.u8(RDB_OPCODE_AUX);
        w.string(key);
        w.string(value);
    };
    aux("redis-ver", "7.2.0");
    aux("redis-bits", "64");
    aux("ctime", std::to_string(std::time(nullptr)));

    ByteWriter body;
    uint64_t key_count = 0;
    uint64_t expire_count = 0;

    keyspace.forEach([&](const std::string& key, const StoredValue& value,
                         std::optional<uint64_t> expire_at) {
        if (expire_at) {
            body.u8(RDB_OPCODE_EXPIRETIME_MS);
            body.u64le(*expire_at);
            ++expire_count;
        }

        if (value.type == ValueType::STRING) {
            body.u8(RDB_TYPE_STRING);
            body.string(key);
            body.string(std::get<std::string>(value.value));
        } else if (value.type == ValueType::HASH) {
            const Hash& hash = std::get<Hash>(value.value);
            body.u8(RDB_TYPE_HASH);
            body.string(key);
            body.length(hash.size());
            for (const auto& field : hash) {
                body.string(field.first);
                body.string(field.second);
            }
        } else {
            const Stream& stream = std::get<Stream>(value.value);
            body.u8(RDB_TYPE_STREAM_PLAIN);
            body.string(key);
            body.length(stream.lastId().ms);
            body.length(stream.lastId().seq);
            body.length(stream.size());
            for (const auto& entry : stream.allEntries()) {
                body.length(entry.id.ms);
                body.length(entry.id.seq);
                body.length(entry.fields.size());
                for (const auto& field : entry.fields) {
                    body.string(field.first);
                    body.string(field.second);
                }
            }
        }
        ++key_count;
    });

    if (key_count > 0) {
        w.u8(RDB_OPCODE_SELECTDB);
        w.length(0);
        w.u8(RDB_OPCODE_RESIZEDB);
        w.length(key_count);
        w.length(expire_count);
        w.raw(body.data());
    }

    w.u8(RDB_OPCODE_EOF);

    std::string& out = w.data();
    uint64_t crc = rdbCrc64(0, reinterpret_cast<const unsigned char*>(out.data()), out.size());
    w.u64le(crc);

    return std::move(out);
}

bool RdbWriter::save(const std::string& path, Keyspace& keyspace, std::string& err) {
    const std::string payload = serialize(keyspace);
    const std::string tmp = path + ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            err = "cannot open " + tmp + " for writing";
            return false;
        }
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.flush();
        if (!out) {
            err = "write to " + tmp + " failed";
            return false;
        }
    }

    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        err = "rename " + tmp + " -> " + path + " failed: " + std::strerror(errno);
        std::remove(tmp.c_str());
        return false;
    }

    return true;
}

// ----------------------------------------------------
// RdbLoader
// ----------------------------------------------------
bool RdbLoader::loadBuffer(const std::string& data, Keyspace& keyspace, std::string& err) {
    err.clear();
    keyspace.clear();

    if (data.size() < 9 || data.compare(0, 5, "REDIS") != 0) {
        err = "invalid RDB header";
        return false;
    }

    int version = 0;
    for (size_t i = 5; i < 9; ++i) {
        if (data[i] < '0' || data[i] > '9') {
            err = "invalid RDB version";
            return false;
        }
        version = version * 10 + (data[i] - '0');
    }
    if (version < 1 || version > 12) {
        err = "unsupported RDB version " + std::to_string(version);
        return false;
    }

    ByteReader r(data, 9);
    std::optional<uint64_t> pending_expire;
    const uint64_t now = unix_time_ms();

    while (true) {
        uint8_t op = 0;
        if (!r.u8(op)) {
            err = "unexpected end of RDB data";
            return false;
        }

        if (op == RDB_OPCODE_EOF)
            break;

        if (op == RDB_OPCODE_AUX) {
            std::string key;
            std::string value;
            if (!r.string(key) || !r.string(value)) {
                err = "malformed AUX field";
                return false;
            }
            continue;
        }

        if (op == RDB_OPCODE_SELECTDB) {
            uint64_t db = 0;
            if (!r.plainLength(db)) {
                err = "malformed SELECTDB";
                return false;
            }
            if (db != 0)
                Logger::warn("RDB database " + std::to_string(db) + " merged into db 0");
            continue;
        }

        if (op == RDB_OPCODE_RESIZEDB) {
            uint64_t db_size = 0;
            uint64_t expires_size = 0;
            if (!r.plainLength(db_size) || !r.plainLength(expires_size)) {
                err = "malformed RESIZEDB";
                return false;
            }
            continue;
        }

        if (op == RDB_OPCODE_EXPIRETIME_MS) {
            uint64_t ms = 0;
            if (!r.uintLe(8, ms)) {
                err = "malformed EXPIRETIME_MS";
                return false;
            }
            pending_expire = ms;
            continue;
        }

        if (op == RDB_OPCODE_EXPIRETIME) {
            uint64_t sec = 0;
            if (!r.uintLe(4, sec)) {
                err = "malformed EXPIRETIME";
                return false;
            }
            pending_expire = sec * 1000;
            continue;
        }

        std::string key;
        if (!r.string(key)) {
            err = "malformed key";
            return false;
        }

        std::optional<uint64_t> expire_at = pending_expire;
        pending_expire.reset();
        const bool expired = expire_at && *expire_at <= now;

        if (op == RDB_TYPE_STRING) {
            std::string value;
            if (!r.string(value)) {
                err = "malformed string value for key '" + key + "'";
                return false;
            }
            if (!expired)
                keyspace.setString(key, std::move(value), expire_at);
        } else if (op == RDB_TYPE_HASH) {
            uint64_t fields = 0;
            if (!r.plainLength(fields)) {
                err = "malformed hash length for key '" + key + "'";
                return false;
            }
            Hash hash;
            for (uint64_t i = 0; i < fields; ++i) {
                std::string field;
                std::string value;
                if (!r.string(field) || !r.string(value)) {
                    err = "malformed hash field for key '" + key + "'";
                    return false;
                }
                hash[field] = std::move(value);
            }
            if (!expired && !hash.empty()) {
                keyspace.getOrCreateHash(key) = std::move(hash);
                if (expire_at)
                    keyspace.setExpireAt(key, *expire_at);
            }
        } else if (op == RDB_TYPE_STREAM_PLAIN) {
            Stream stream;
            if (!readStream(r, stream, err)) {
                err += " for key '" + key + "'";
                return false;
            }
            if (!expired) {
                keyspace.getOrCreateStream(key) = std::move(stream);
                if (expire_at)
                    keyspace.setExpireAt(key, *expire_at);
            }
        } else {
            err = "unsupported RDB value type " + std::to_string(op) + " for key '" + key + "'";
            return false;
        }
    }

    // Trailer: 8-byte CRC64, zero when the writer disabled checksums.
    uint64_t stored_crc = 0;
    const size_t body_len = r.position();
    if (r.uintLe(8, stored_crc) && stored_crc != 0) {
        uint64_t crc = rdbCrc64(0, reinterpret_cast<const unsigned char*>(data.data()), body_len);
        if (crc != stored_crc) {
            err = "RDB checksum mismatch";
            return false;
        }
    }

    return true;
}

bool RdbLoader::loadFile(const std::string& path, Keyspace& keyspace, std::string& err) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        err = "cannot open " + path;
        return false;
    }

    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return loadBuffer(data, keyspace, err);
}
