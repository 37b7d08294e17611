#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <climits>
#include <string>
#include <thread>
#include <vector>

#include "../src/db/Keyspace.hpp"
#include "../src/utils/Time.hpp"

TEST(KeyspaceTest, SetAndGetStringValue) {
    Keyspace ks;
    ks.setString("foo", "bar");

    std::string out;
    EXPECT_EQ(LookupStatus::FOUND, ks.getString("foo", out));
    EXPECT_EQ("bar", out);
}

TEST(KeyspaceTest, BinaryValuesRoundTrip) {
    Keyspace ks;
    const std::string value("a\0b\r\n", 5);
    ks.setString("bin", value);

    std::string out;
    ASSERT_EQ(LookupStatus::FOUND, ks.getString("bin", out));
    EXPECT_EQ(value, out);
}

TEST(KeyspaceTest, ExpiredKeyDisappearsLazily) {
    Keyspace ks;
    ks.setString("temp", "value", unix_time_ms() + 5);

    std::this_thread::sleep_for(std::chrono::milliseconds(15));

    std::string out;
    EXPECT_EQ(LookupStatus::MISSING, ks.getString("temp", out));
    EXPECT_FALSE(ks.exists("temp"));
    EXPECT_EQ(0u, ks.expiresCount());
}

TEST(KeyspaceTest, PlainSetClearsExpiry) {
    Keyspace ks;
    ks.setString("k", "1", unix_time_ms() + 100000);
    ASSERT_TRUE(ks.expireAt("k").has_value());

    ks.setString("k", "2");
    EXPECT_FALSE(ks.expireAt("k").has_value());
}

TEST(KeyspaceTest, KeepTtlPreservesExpiry) {
    Keyspace ks;
    const uint64_t at = unix_time_ms() + 100000;
    ks.setString("k", "1", at);
    ks.setStringKeepTtl("k", "2");

    std::string out;
    ks.getString("k", out);
    EXPECT_EQ("2", out);
    EXPECT_EQ(at, ks.expireAt("k").value());
}

TEST(KeyspaceTest, DeleteRemovesValueAndTtl) {
    Keyspace ks;
    ks.setString("foo", "bar", unix_time_ms() + 2000);
    EXPECT_TRUE(ks.del("foo"));
    EXPECT_FALSE(ks.del("foo"));

    std::string out;
    EXPECT_EQ(LookupStatus::MISSING, ks.getString("foo", out));
    EXPECT_EQ(0u, ks.expiresCount());
}

TEST(KeyspaceTest, IncrStartsFromZeroAndKeepsTtl) {
    Keyspace ks;
    long long result = 0;

    EXPECT_EQ(IncrStatus::OK, ks.incr("n", result));
    EXPECT_EQ(1, result);

    const uint64_t at = unix_time_ms() + 100000;
    ks.setExpireAt("n", at);
    EXPECT_EQ(IncrStatus::OK, ks.incr("n", result));
    EXPECT_EQ(2, result);
    EXPECT_EQ(at, ks.expireAt("n").value());
}

TEST(KeyspaceTest, IncrRejectsNonIntegersAndOverflow) {
    Keyspace ks;
    long long result = 0;

    ks.setString("s", "abc");
    EXPECT_EQ(IncrStatus::NOT_INTEGER, ks.incr("s", result));

    ks.setString("lead", "01");
    EXPECT_EQ(IncrStatus::NOT_INTEGER, ks.incr("lead", result));

    ks.setString("max", std::to_string(LLONG_MAX));
    EXPECT_EQ(IncrStatus::WOULD_OVERFLOW, ks.incr("max", result));

    std::string out;
    ks.getString("max", out);
    EXPECT_EQ(std::to_string(LLONG_MAX), out);
}

TEST(KeyspaceTest, TypeReporting) {
    Keyspace ks;
    ks.setString("s", "v");
    ks.getOrCreateHash("h")["f"] = "v";
    ks.getOrCreateStream("x");

    EXPECT_EQ("string", ks.typeOf("s"));
    EXPECT_EQ("hash", ks.typeOf("h"));
    EXPECT_EQ("stream", ks.typeOf("x"));
    EXPECT_EQ("none", ks.typeOf("missing"));

    std::string out;
    EXPECT_EQ(LookupStatus::WRONG_TYPE, ks.getString("h", out));

    long long n = 0;
    EXPECT_EQ(IncrStatus::WRONG_TYPE, ks.incr("x", n));
}

TEST(KeyspaceTest, KeysMatchesGlobPatterns) {
    Keyspace ks;
    ks.setString("user:1", "a");
    ks.setString("user:2", "b");
    ks.setString("order:1", "c");

    auto keys = ks.keys("user:*");
    std::sort(keys.begin(), keys.end());
    ASSERT_EQ(2u, keys.size());
    EXPECT_EQ("user:1", keys[0]);
    EXPECT_EQ("user:2", keys[1]);

    EXPECT_EQ(3u, ks.keys("*").size());
    EXPECT_EQ(1u, ks.keys("order:?").size());
}

TEST(KeyspaceTest, ForEachSkipsExpiredKeys) {
    Keyspace ks;
    ks.setString("live", "1", unix_time_ms() + 100000);
    ks.setString("dead", "2", unix_time_ms() + 1);
    ks.setString("plain", "3");

    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    std::vector<std::string> seen;
    int with_expiry = 0;
    ks.forEach([&](const std::string& key, const StoredValue&, std::optional<uint64_t> at) {
        seen.push_back(key);
        if (at) ++with_expiry;
    });

    std::sort(seen.begin(), seen.end());
    ASSERT_EQ(2u, seen.size());
    EXPECT_EQ("live", seen[0]);
    EXPECT_EQ("plain", seen[1]);
    EXPECT_EQ(1, with_expiry);
}

TEST(KeyspaceTest, ClearDropsEverything) {
    Keyspace ks;
    ks.setString("a", "1", unix_time_ms() + 100000);
    ks.setString("b", "2");
    ks.clear();

    EXPECT_EQ(0u, ks.size());
    EXPECT_EQ(0u, ks.expiresCount());
}
