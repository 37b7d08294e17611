#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "../src/config/ServerConfig.hpp"

TEST(ServerConfigTest, Defaults) {
    ServerConfig cfg = ServerConfig::fromArgs({"emberkv-server"});

    EXPECT_EQ(6379, cfg.port);
    EXPECT_EQ("0.0.0.0", cfg.bind);
    EXPECT_FALSE(cfg.isReplica());
    EXPECT_EQ("./dump.rdb", cfg.snapshotPath());
    EXPECT_EQ(1000u, cfg.repl_ack_interval_ms);
    EXPECT_FALSE(cfg.show_help);
}

TEST(ServerConfigTest, ParsesEveryOption) {
    ServerConfig cfg = ServerConfig::fromArgs({
        "emberkv-server",
        "--port", "6380",
        "--bind", "127.0.0.1",
        "--replicaof", "localhost 6379",
        "--dir", "/var/lib/emberkv/",
        "--dbfilename", "snap.rdb",
        "--loglevel", "debug",
        "--repl-ack-interval-ms", "0",
    });

    EXPECT_EQ(6380, cfg.port);
    EXPECT_EQ("127.0.0.1", cfg.bind);
    EXPECT_TRUE(cfg.isReplica());
    EXPECT_EQ("localhost", cfg.master_host);
    EXPECT_EQ(6379, cfg.master_port);
    EXPECT_EQ("/var/lib/emberkv/snap.rdb", cfg.snapshotPath());
    EXPECT_EQ("debug", cfg.log_level);
    EXPECT_EQ(0u, cfg.repl_ack_interval_ms);
}

TEST(ServerConfigTest, ReplicaofAcceptsSeparatePort) {
    ServerConfig cfg = ServerConfig::fromArgs({"emberkv-server", "--replicaof", "10.0.0.1", "7000"});

    EXPECT_EQ("10.0.0.1", cfg.master_host);
    EXPECT_EQ(7000, cfg.master_port);
}

TEST(ServerConfigTest, HelpFlag) {
    EXPECT_TRUE(ServerConfig::fromArgs({"emberkv-server", "--help"}).show_help);
    EXPECT_NE(std::string::npos, ServerConfig::usage("emberkv-server").find("--replicaof"));
}

TEST(ServerConfigTest, RejectsInvalidValues) {
    const std::vector<std::vector<std::string>> bad = {
        {"emberkv-server", "--port", "abc"},
        {"emberkv-server", "--port", "0"},
        {"emberkv-server", "--port", "70000"},
        {"emberkv-server", "--port"},
        {"emberkv-server", "--replicaof", "onlyhost"},
        {"emberkv-server", "--replicaof", "host port"},
        {"emberkv-server", "--replicaof", "host 1 2"},
        {"emberkv-server", "--loglevel", "loud"},
        {"emberkv-server", "--dbfilename", ""},
        {"emberkv-server", "--unknown", "1"},
    };

    for (const auto& args : bad) {
        EXPECT_THROW(ServerConfig::fromArgs(args), std::invalid_argument) << args[1];
    }
}
