#include <gtest/gtest.h>

#include <cstdio>
#include <string>

#include "../src/persistence/Rdb.hpp"
#include "../src/utils/Time.hpp"
#include "TestHelpers.hpp"

namespace {

std::string u64le(uint64_t v) {
    std::string out;
    for (int i = 0; i < 8; ++i)
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    return out;
}

std::string rawString(const std::string& s) {
    return std::string(1, static_cast<char>(s.size())) + s;
}

// Minimal hand-built file: header, one db, the given body, EOF, zero CRC.
std::string buildRdb(const std::string& body) {
    return std::string("REDIS0011") + std::string("\xFE\x00", 2) + body + "\xFF" + u64le(0);
}

} // namespace

TEST(RdbTest, Crc64MatchesReferenceVector) {
    const std::string input = "123456789";
    EXPECT_EQ(0xe9c6d914c4b8d9caULL,
              rdbCrc64(0, reinterpret_cast<const unsigned char*>(input.data()), input.size()));
}

TEST(RdbTest, EmptyKeyspaceSnapshot) {
    Keyspace ks;
    const std::string rdb = RdbWriter::serialize(ks);

    EXPECT_EQ(0u, rdb.rfind("REDIS0011", 0));
    EXPECT_EQ('\xFF', rdb[rdb.size() - 9]);

    Keyspace loaded;
    std::string err;
    EXPECT_TRUE(RdbLoader::loadBuffer(rdb, loaded, err)) << err;
    EXPECT_EQ(0u, loaded.size());
}

TEST(RdbTest, StringsHashesAndExpiriesRoundTrip) {
    Keyspace ks;
    const uint64_t at = unix_time_ms() + 3600 * 1000;

    ks.setString("plain", "hello world");
    ks.setString("small", "42");
    ks.setString("neg", "-30000");
    ks.setString("wide", "2000000000");
    ks.setString("padded", "007");
    ks.setString("binary", std::string("a\0b", 3));
    ks.setString("long", std::string(20000, 'x'));
    ks.setString("ttl", "v", at);
    ks.getOrCreateHash("h")["field"] = "value";
    ks.getOrCreateHash("h")["n"] = "1";
    ks.setExpireAt("h", at);

    Keyspace loaded;
    std::string err;
    ASSERT_TRUE(RdbLoader::loadBuffer(RdbWriter::serialize(ks), loaded, err)) << err;

    EXPECT_EQ(ks.size(), loaded.size());

    for (const char* key : {"plain", "small", "neg", "wide", "padded", "binary", "long", "ttl"}) {
        std::string want;
        std::string got;
        ks.getString(key, want);
        ASSERT_EQ(LookupStatus::FOUND, loaded.getString(key, got)) << key;
        EXPECT_EQ(want, got) << key;
    }

    EXPECT_EQ(at, loaded.expireAt("ttl").value());
    EXPECT_FALSE(loaded.expireAt("plain").has_value());

    StoredValue* h = loaded.getObject("h");
    ASSERT_NE(nullptr, h);
    ASSERT_EQ(ValueType::HASH, h->type);
    EXPECT_EQ("value", std::get<Hash>(h->value).at("field"));
    EXPECT_EQ(at, loaded.expireAt("h").value());
}

TEST(RdbTest, StreamsRoundTrip) {
    Keyspace ks;
    Stream& events = ks.getOrCreateStream("events");
    events.addEntry(StreamId{1, 0}, {{"f", "v"}, {"f", "dup"}});
    events.addEntry(StreamId{1, 5}, {{"temp", "21"}});
    events.addEntry(StreamId{1700000000000ULL, 0}, {{"big", std::string(300, 'z')}});
    events.restoreLastId(StreamId{1700000000000ULL, 9});
    ks.setExpireAt("events", unix_time_ms() + 60000);

    Keyspace loaded;
    std::string err;
    ASSERT_TRUE(RdbLoader::loadBuffer(RdbWriter::serialize(ks), loaded, err)) << err;

    StoredValue* obj = loaded.getObject("events");
    ASSERT_NE(nullptr, obj);
    ASSERT_EQ(ValueType::STREAM, obj->type);
    EXPECT_TRUE(loaded.expireAt("events").has_value());

    const Stream& copy = std::get<Stream>(obj->value);
    ASSERT_EQ(3u, copy.size());
    EXPECT_EQ((StreamId{1700000000000ULL, 9}), copy.lastId());

    const auto& entries = copy.allEntries();
    EXPECT_EQ((StreamId{1, 5}), entries[1].id);
    ASSERT_EQ(2u, entries[0].fields.size());
    EXPECT_EQ("dup", entries[0].fields[1].second);
    EXPECT_EQ(std::string(300, 'z'), entries[2].fields[0].second);
}

TEST(RdbTest, RejectsStreamEntriesOutOfOrder) {
    // last 0-0, two entries: 2-0 then 1-0.
    const std::string body =
        '\xE0' + rawString("s") + std::string("\x00\x00\x02", 3) +
        std::string("\x02\x00\x01", 3) + rawString("f") + rawString("v") +
        std::string("\x01\x00\x01", 3) + rawString("f") + rawString("v");

    Keyspace ks;
    std::string err;
    EXPECT_FALSE(RdbLoader::loadBuffer(buildRdb(body), ks, err));
    EXPECT_NE(std::string::npos, err.find("out of order"));
}

TEST(RdbTest, LoadReplacesExistingKeys) {
    Keyspace source;
    source.setString("new", "1");

    Keyspace target;
    target.setString("stale", "x");

    std::string err;
    ASSERT_TRUE(RdbLoader::loadBuffer(RdbWriter::serialize(source), target, err));
    EXPECT_FALSE(target.exists("stale"));
    EXPECT_TRUE(target.exists("new"));
}

TEST(RdbTest, ExpiredKeysAreSkippedOnLoad) {
    const uint64_t past = unix_time_ms() - 1000;
    const uint64_t future_sec = unix_time_ms() / 1000 + 3600;

    std::string future_le;
    for (int i = 0; i < 4; ++i)
        future_le.push_back(static_cast<char>((future_sec >> (8 * i)) & 0xFF));

    const std::string body =
        std::string("\xFB\x03\x02", 3) +
        "\xFC" + u64le(past) + '\x00' + rawString("gone") + rawString("x") +
        "\xFD" + future_le + '\x00' + rawString("secs") + rawString("y") +
        '\x00' + rawString("kept") + rawString("z");

    Keyspace ks;
    std::string err;
    ASSERT_TRUE(RdbLoader::loadBuffer(buildRdb(body), ks, err)) << err;

    EXPECT_FALSE(ks.exists("gone"));
    EXPECT_TRUE(ks.exists("kept"));
    EXPECT_EQ(future_sec * 1000, ks.expireAt("secs").value());
}

TEST(RdbTest, DecodesIntegerEncodings) {
    const std::string body =
        '\x00' + rawString("i8") + std::string("\xC0\x85", 2) +
        '\x00' + rawString("i16") + std::string("\xC1\x39\x30", 3) +
        '\x00' + rawString("i32") + std::string("\xC2\x00\x94\x35\x77", 5);

    Keyspace ks;
    std::string err;
    ASSERT_TRUE(RdbLoader::loadBuffer(buildRdb(body), ks, err)) << err;

    std::string out;
    ks.getString("i8", out);
    EXPECT_EQ("-123", out);
    ks.getString("i16", out);
    EXPECT_EQ("12345", out);
    ks.getString("i32", out);
    EXPECT_EQ("2000000000", out);
}

TEST(RdbTest, DecodesLzfStrings) {
    // 'a' literal followed by a back reference of length 9.
    const std::string compressed("\x00" "a" "\xE0\x00\x00", 5);
    const std::string body =
        '\x00' + rawString("lzf") + '\xC3' + '\x05' + '\x0A' + compressed;

    Keyspace ks;
    std::string err;
    ASSERT_TRUE(RdbLoader::loadBuffer(buildRdb(body), ks, err)) << err;

    std::string out;
    ASSERT_EQ(LookupStatus::FOUND, ks.getString("lzf", out));
    EXPECT_EQ(std::string(10, 'a'), out);
}

TEST(RdbTest, RejectsCorruptInput) {
    Keyspace ks;
    ks.setString("key", "value");
    std::string rdb = RdbWriter::serialize(ks);

    Keyspace loaded;
    std::string err;

    std::string flipped = rdb;
    flipped[rdb.find("value")] = 'V';
    EXPECT_FALSE(RdbLoader::loadBuffer(flipped, loaded, err));
    EXPECT_EQ("RDB checksum mismatch", err);

    EXPECT_FALSE(RdbLoader::loadBuffer("NOTREDIS0", loaded, err));
    EXPECT_FALSE(RdbLoader::loadBuffer(rdb.substr(0, rdb.size() / 2), loaded, err));

    // Type 1 (list) is not supported.
    EXPECT_FALSE(RdbLoader::loadBuffer(buildRdb('\x01' + rawString("l") + '\x01' + rawString("a")),
                                       loaded, err));
    EXPECT_NE(std::string::npos, err.find("unsupported"));
}

TEST(RdbTest, RejectsOversizedLzfLength) {
    // clen 1, ulen 0x7fffffffffffffff (64-bit length form).
    const std::string body =
        '\x00' + rawString("big") + '\xC3' + '\x01' +
        std::string("\x81\x7F\xFF\xFF\xFF\xFF\xFF\xFF\xFF", 9) + '\x00';

    Keyspace ks;
    std::string err;
    EXPECT_FALSE(RdbLoader::loadBuffer(buildRdb(body), ks, err));
    EXPECT_FALSE(ks.exists("big"));
}

TEST(RdbTest, SaveCommandWritesLoadableFile) {
    ServerConfig cfg;
    cfg.dir = ::testing::TempDir();
    cfg.dbfilename = "emberkv-save-test.rdb";
    TestServer srv(cfg);

    srv.run({"SET", "k", "v"});
    srv.run({"HSET", "h", "f", "1"});
    EXPECT_EQ("+OK\r\n", srv.run({"SAVE"}).reply);

    Keyspace loaded;
    std::string err;
    ASSERT_TRUE(RdbLoader::loadFile(cfg.snapshotPath(), loaded, err)) << err;
    EXPECT_EQ(2u, loaded.size());

    std::remove(cfg.snapshotPath().c_str());
}

TEST(RdbTest, MissingFileIsAnError) {
    Keyspace ks;
    std::string err;
    EXPECT_FALSE(RdbLoader::loadFile("/nonexistent/dir/dump.rdb", ks, err));
    EXPECT_FALSE(err.empty());
}
