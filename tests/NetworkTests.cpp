#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "../src/persistence/Rdb.hpp"
#include "../src/protocol/RESPWriter.hpp"
#include "../src/replication/ReplicaLink.hpp"
#include "../src/server/EventLoop.hpp"
#include "TestHelpers.hpp"

namespace {

// Listening socket on 127.0.0.1 with a kernel-chosen port.
int listenLoopback(int& port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
        return -1;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    socklen_t len = sizeof(addr);
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        listen(fd, 16) != 0 ||
        getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        ::close(fd);
        return -1;
    }

    port = ntohs(addr.sin_port);
    return fd;
}

int connectLoopback(int port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
        return -1;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return -1;
    }

    timeval tv{};
    tv.tv_sec = 2;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    return fd;
}

void sendRaw(int fd, const std::string& bytes) {
    ASSERT_EQ(static_cast<ssize_t>(bytes.size()),
              ::send(fd, bytes.data(), bytes.size(), MSG_NOSIGNAL));
}

std::string frame(std::vector<std::string> args) {
    return RESPWriter::bulkArray(args);
}

// Number of complete replies at the front of `buffer`.
std::size_t countReplies(const std::string& buffer) {
    std::size_t n = 0;
    std::size_t pos = 0;
    while (pos < buffer.size()) {
        RespValue value;
        std::size_t consumed = 0;
        std::string err;
        if (RESPParser::parseReply(std::string_view(buffer).substr(pos), value, consumed, err) !=
            ParseStatus::OK)
            break;
        pos += consumed;
        ++n;
    }
    return n;
}

// Whatever is readable right now, without waiting.
std::string drain(int fd, bool* closed = nullptr) {
    std::string out;
    char buffer[4096];
    while (true) {
        ssize_t n = ::recv(fd, buffer, sizeof(buffer), MSG_DONTWAIT);
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0 && closed)
            *closed = true;
        break;
    }
    return out;
}

// Runs the loop until `fd` has received `want` replies (or gives up).
std::string collect(EventLoop& loop, int fd, std::size_t want) {
    std::string received;
    for (int i = 0; i < 40 && countReplies(received) < want; ++i) {
        loop.tick();
        received += drain(fd);
    }
    return received;
}

void pump(EventLoop& loop, int ticks) {
    for (int i = 0; i < ticks; ++i)
        loop.tick();
}

class EventLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_fd = listenLoopback(port);
        ASSERT_GE(server_fd, 0);
        srv.reset(new TestServer());
        loop.reset(new EventLoop(server_fd, srv->handler, srv->replication, srv->config));
    }

    void TearDown() override {
        for (int fd : clients)
            ::close(fd);
        loop.reset();
        if (server_fd >= 0)
            ::close(server_fd);
    }

    int client() {
        int fd = connectLoopback(port);
        EXPECT_GE(fd, 0);
        clients.push_back(fd);
        pump(*loop, 1);
        return fd;
    }

    int port = 0;
    int server_fd = -1;
    std::unique_ptr<TestServer> srv;
    std::unique_ptr<EventLoop> loop;
    std::vector<int> clients;
};

} // namespace

TEST_F(EventLoopTest, PipelinedCommandsAreAnsweredInOrder) {
    int fd = client();

    sendRaw(fd, frame({"PING"}) + frame({"SET", "k", "v"}) + frame({"GET", "k"}));

    EXPECT_EQ("+PONG\r\n+OK\r\n$1\r\nv\r\n", collect(*loop, fd, 3));
}

TEST_F(EventLoopTest, PartialFrameWaitsForTheRest) {
    int fd = client();
    const std::string set = frame({"SET", "key", "value"});

    sendRaw(fd, set.substr(0, 10));
    pump(*loop, 3);
    EXPECT_EQ("", drain(fd));
    EXPECT_FALSE(srv->keyspace.exists("key"));

    sendRaw(fd, set.substr(10));
    EXPECT_EQ("+OK\r\n", collect(*loop, fd, 1));
    EXPECT_TRUE(srv->keyspace.exists("key"));
}

TEST_F(EventLoopTest, ProtocolErrorClosesTheConnection) {
    int fd = client();

    sendRaw(fd, "*1\r\n:1\r\n");
    const std::string reply = collect(*loop, fd, 1);
    EXPECT_EQ(0u, reply.rfind("-ERR Protocol error", 0)) << reply;

    bool closed = false;
    for (int i = 0; i < 10 && !closed; ++i) {
        loop->tick();
        drain(fd, &closed);
    }
    EXPECT_TRUE(closed);
}

TEST_F(EventLoopTest, PipelinedInputResumesAfterBlockedRead) {
    int reader = client();
    int writer = client();

    sendRaw(reader, frame({"XREAD", "BLOCK", "0", "STREAMS", "s", "$"}) + frame({"PING"}));
    pump(*loop, 3);
    EXPECT_EQ("", drain(reader));
    EXPECT_EQ(1u, srv->handler.blockedClientCount());

    sendRaw(writer, frame({"XADD", "s", "1-0", "f", "v"}));
    EXPECT_EQ("$3\r\n1-0\r\n", collect(*loop, writer, 1));

    const std::string got = collect(*loop, reader, 2);
    EXPECT_EQ("*1\r\n*2\r\n$1\r\ns\r\n*1\r\n*2\r\n$3\r\n1-0\r\n*2\r\n$1\r\nf\r\n$1\r\nv\r\n"
              "+PONG\r\n",
              got);
    EXPECT_EQ(0u, srv->handler.blockedClientCount());
}

TEST(MasterLinkTest, SplitFramesAndGetAckOverTheLink) {
    ServerConfig cfg;
    cfg.port = 6380;
    cfg.master_host = "127.0.0.1";
    cfg.master_port = 6379;
    cfg.repl_ack_interval_ms = 0;
    TestServer replica(cfg);

    int port = 0;
    int server_fd = listenLoopback(port);
    ASSERT_GE(server_fd, 0);

    int pair[2];
    ASSERT_EQ(0, socketpair(AF_UNIX, SOCK_STREAM, 0, pair));
    timeval tv{};
    tv.tv_sec = 2;
    setsockopt(pair[1], SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    const std::string set = frame({"SET", "k", "v"});
    const std::string getack = frame({"REPLCONF", "GETACK", "*"});

    {
        EventLoop loop(server_fd, replica.handler, replica.replication, replica.config);

        // Half of SET arrived together with the snapshot.
        loop.attachMaster(pair[0], set.substr(0, 7));
        EXPECT_TRUE(replica.replication.linkUp());
        EXPECT_FALSE(replica.keyspace.exists("k"));

        sendRaw(pair[1], set.substr(7) + getack);
        const std::string ack = collect(loop, pair[1], 1);

        EXPECT_EQ(frame({"REPLCONF", "ACK", std::to_string(set.size())}), ack);
        EXPECT_EQ("$1\r\nv\r\n", replica.run({"GET", "k"}).reply);
        EXPECT_EQ(set.size() + getack.size(), replica.replication.currentOffset());
    }

    ::close(pair[0]);
    ::close(pair[1]);
    ::close(server_fd);
}

TEST(ReplicaLinkTest, HandshakeAgainstMasterHandler) {
    int port = 0;
    int listen_fd = listenLoopback(port);
    ASSERT_GE(listen_fd, 0);

    TestServer master;
    master.run({"SET", "seed", "1"});
    master.run({"XADD", "s", "5-0", "f", "v"});

    const std::string trailing = frame({"SET", "after", "sync"});
    std::vector<std::string> seen;

    // Master side: answers every handshake command with the real handler,
    // then appends one stream frame to the PSYNC reply.
    std::thread master_thread([&]() {
        int fd = accept(listen_fd, nullptr, nullptr);
        if (fd < 0)
            return;

        std::string in;
        char buffer[4096];
        bool synced = false;
        while (!synced) {
            ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0)
                break;
            in.append(buffer, static_cast<std::size_t>(n));

            while (true) {
                std::vector<std::string> args;
                std::size_t consumed = 0;
                std::string err;
                if (RESPParser::parseCommand(in, args, consumed, err) != ParseStatus::OK)
                    break;
                in.erase(0, consumed);

                seen.push_back(args[0]);
                std::string out = master.run(args, 5).reply;
                if (args[0] == "PSYNC") {
                    out += trailing;
                    synced = true;
                }
                ::send(fd, out.data(), out.size(), MSG_NOSIGNAL);
            }
        }
        ::close(fd);
    });

    ReplicaLink link("127.0.0.1", port, 6380);
    std::string err;
    const bool ok = link.connectAndSync(err);
    master_thread.join();
    ::close(listen_fd);

    ASSERT_TRUE(ok) << err;
    EXPECT_EQ((std::vector<std::string>{"PING", "REPLCONF", "REPLCONF", "PSYNC"}), seen);

    EXPECT_EQ(master.replication.replid(), link.masterReplid());
    EXPECT_EQ(master.replication.currentOffset(), link.masterOffset());
    EXPECT_EQ(trailing, link.leftover());

    Keyspace loaded;
    ASSERT_TRUE(RdbLoader::loadBuffer(link.snapshot(), loaded, err)) << err;
    EXPECT_TRUE(loaded.exists("seed"));
    EXPECT_EQ("stream", loaded.typeOf("s"));

    int fd = link.releaseFd();
    EXPECT_GE(fd, 0);
    ::close(fd);
}

TEST(ReplicaLinkTest, RefusedPingFailsTheHandshake) {
    int port = 0;
    int listen_fd = listenLoopback(port);
    ASSERT_GE(listen_fd, 0);

    std::thread master_thread([&]() {
        int fd = accept(listen_fd, nullptr, nullptr);
        if (fd < 0)
            return;
        char buffer[256];
        if (::recv(fd, buffer, sizeof(buffer), 0) > 0) {
            const std::string reply = "-NOAUTH Authentication required.\r\n";
            ::send(fd, reply.data(), reply.size(), MSG_NOSIGNAL);
        }
        ::close(fd);
    });

    ReplicaLink link("127.0.0.1", port, 6380);
    std::string err;
    EXPECT_FALSE(link.connectAndSync(err));
    master_thread.join();
    ::close(listen_fd);

    EXPECT_NE(std::string::npos, err.find("NOAUTH"));
}
