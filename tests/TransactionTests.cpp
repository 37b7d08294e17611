#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "TestHelpers.hpp"

TEST(TransactionTest, QueuesAndExecutesInOrder) {
    TestServer srv;

    EXPECT_EQ("+OK\r\n", srv.run({"MULTI"}).reply);
    EXPECT_EQ("+QUEUED\r\n", srv.run({"SET", "a", "1"}).reply);
    EXPECT_EQ("+QUEUED\r\n", srv.run({"INCR", "a"}).reply);
    EXPECT_EQ("+QUEUED\r\n", srv.run({"GET", "a"}).reply);

    // Nothing ran yet.
    EXPECT_FALSE(srv.keyspace.exists("a"));

    EXPECT_EQ("*3\r\n+OK\r\n:2\r\n$1\r\n2\r\n", srv.run({"EXEC"}).reply);
    EXPECT_EQ("$1\r\n2\r\n", srv.run({"GET", "a"}).reply);
}

TEST(TransactionTest, OtherClientsAreNotQueued) {
    TestServer srv;

    srv.run({"MULTI"}, 1);
    srv.run({"INCR", "counter"}, 1);
    srv.run({"INCR", "counter"}, 1);

    EXPECT_EQ(":1\r\n", srv.run({"INCR", "counter"}, 2).reply);

    EXPECT_EQ("*2\r\n:2\r\n:3\r\n", srv.run({"EXEC"}, 1).reply);
}

TEST(TransactionTest, EmptyTransaction) {
    TestServer srv;

    srv.run({"MULTI"});
    EXPECT_EQ("*0\r\n", srv.run({"EXEC"}).reply);
}

TEST(TransactionTest, ExecAndDiscardWithoutMulti) {
    TestServer srv;

    EXPECT_EQ("-ERR EXEC without MULTI\r\n", srv.run({"EXEC"}).reply);
    EXPECT_EQ("-ERR DISCARD without MULTI\r\n", srv.run({"DISCARD"}).reply);
}

TEST(TransactionTest, NestedMultiIsRejectedButStateKept) {
    TestServer srv;

    srv.run({"MULTI"});
    srv.run({"SET", "k", "v"});
    EXPECT_EQ("-ERR MULTI calls can not be nested\r\n", srv.run({"MULTI"}).reply);

    EXPECT_EQ("*1\r\n+OK\r\n", srv.run({"EXEC"}).reply);
}

TEST(TransactionTest, DiscardDropsQueue) {
    TestServer srv;

    srv.run({"MULTI"});
    srv.run({"SET", "k", "v"});
    EXPECT_EQ("+OK\r\n", srv.run({"DISCARD"}).reply);

    EXPECT_EQ("$-1\r\n", srv.run({"GET", "k"}).reply);
    EXPECT_EQ("-ERR EXEC without MULTI\r\n", srv.run({"EXEC"}).reply);
}

TEST(TransactionTest, InvalidCommandAbortsTransaction) {
    TestServer srv;

    srv.run({"MULTI"});
    srv.run({"SET", "k", "v"});
    EXPECT_EQ("-ERR unknown command 'NOPE', with args beginning with: \r\n",
              srv.run({"NOPE"}).reply);
    EXPECT_EQ("-ERR wrong number of arguments for 'get' command\r\n", srv.run({"GET"}).reply);

    EXPECT_EQ("-EXECABORT Transaction discarded because of previous errors.\r\n",
              srv.run({"EXEC"}).reply);
    EXPECT_FALSE(srv.keyspace.exists("k"));

    // Back to normal mode.
    EXPECT_EQ("+OK\r\n", srv.run({"SET", "k", "v"}).reply);
}

TEST(TransactionTest, RuntimeErrorsDoNotStopTheBatch) {
    TestServer srv;
    srv.run({"SET", "s", "text"});

    srv.run({"MULTI"});
    srv.run({"INCR", "s"});
    srv.run({"SET", "after", "1"});

    EXPECT_EQ("*2\r\n-ERR value is not an integer or out of range\r\n+OK\r\n",
              srv.run({"EXEC"}).reply);
    EXPECT_TRUE(srv.keyspace.exists("after"));
}

TEST(TransactionTest, BlockingCommandsDoNotBlockInsideExec) {
    TestServer srv;

    srv.run({"MULTI"});
    srv.run({"XREAD", "BLOCK", "0", "STREAMS", "s", "$"});
    srv.run({"WAIT", "1", "0"});

    auto reply = srv.run({"EXEC"});
    EXPECT_FALSE(reply.blocked);
    EXPECT_EQ("*2\r\n*-1\r\n:0\r\n", reply.reply);
    EXPECT_EQ(0u, srv.handler.blockedClientCount());
}

TEST(TransactionTest, ExecWakesBlockedReaders) {
    TestServer srv;

    srv.run({"XREAD", "BLOCK", "0", "STREAMS", "s", "$"}, 2);

    srv.run({"MULTI"}, 1);
    srv.run({"XADD", "s", "1-0", "f", "v"}, 1);
    EXPECT_TRUE(srv.pending().empty());

    srv.run({"EXEC"}, 1);
    auto writes = srv.pending();
    ASSERT_EQ(1u, writes.size());
    EXPECT_EQ(2, writes[0].target_fd);
}

TEST(TransactionTest, DisconnectDropsQueue) {
    TestServer srv;

    srv.run({"MULTI"}, 7);
    srv.run({"SET", "k", "v"}, 7);
    srv.handler.onDisconnect(7);

    // A new connection reusing the fd starts clean.
    EXPECT_EQ("-ERR EXEC without MULTI\r\n", srv.run({"EXEC"}, 7).reply);
    EXPECT_FALSE(srv.keyspace.exists("k"));
}
