/**
 * This file tests class `Connection`.
 *
 *       File: Connection_test.cpp
 *
 *    Copyright 2023 University Corporation for Atmospheric Research
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
 * in compliance with the License. You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software distributed under the License
 * is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
 * or implied. See the License for the specific language governing permissions and limitations under
 * the License.
 */

#include "Connection.h"
#include "error.h"
#include "logging.h"

#include <atomic>
#include <gtest/gtest.h>
#include <libgen.h>
#include <signal.h>
#include <unistd.h>
#include <vector>

namespace {

using namespace sockcast;

/// The fixture for testing class `Connection`
class ConnectionTest : public ::testing::Test, public Listener
{
protected:
    SockAddr            srvrAddr;
    Mutex               mutex;
    Cond                cond;
    std::vector<String> msgs;      ///< Messages received by the listener
    int                 numClosed; ///< Number of closures reported to the listener
    TcpSrvrSock         lstnSock;

    ConnectionTest()
        : srvrAddr{"127.0.0.1:38802"}
        , mutex()
        , cond()
        , msgs()
        , numClosed(0)
        , lstnSock(srvrAddr)
    {}

public:
    void onMessage(const String& msg) override {
        Guard guard{mutex};
        msgs.push_back(msg);
        cond.notify_all();
    }

    void onClosedStatus(const bool isClosed) override {
        Guard guard{mutex};
        if (isClosed)
            ++numClosed;
        cond.notify_all();
    }

protected:
    void waitForMsgs(const size_t num) {
        Lock lock{mutex};
        cond.wait(lock, [&]{return msgs.size() == num;});
    }

    void waitForClosed(const int num) {
        Lock lock{mutex};
        cond.wait(lock, [&]{return numClosed == num;});
    }

    /**
     * Returns a connection to a new client.
     * @param[out] clntSock  Client's socket
     * @return               Server-side connection to the client
     */
    Connection connect(TcpClntSock& clntSock) {
        clntSock = TcpClntSock(srvrAddr);
        return Connection(lstnSock.accept(), *this, DebugFlags(DebugFlags::ALL), Millis(1000));
    }
};

// Tests default construction
TEST_F(ConnectionTest, DefaultConstruction)
{
    Connection conn{};
    EXPECT_FALSE(conn);
    EXPECT_FALSE(conn.isOpen());
    EXPECT_FALSE(conn.close());
    EXPECT_EQ("<unset>", conn.to_string());
}

// Tests that the reader loop delivers lines in order and closes on end-of-stream
TEST_F(ConnectionTest, ReaderLoop)
{
    TcpClntSock clntSock;
    auto        conn = connect(clntSock);
    Thread      reader(conn);

    EXPECT_TRUE(conn.isOpen());
    EXPECT_TRUE(clntSock.writeLine("first"));
    EXPECT_TRUE(clntSock.writeLine("second"));
    waitForMsgs(2);

    clntSock.shutdown();
    waitForClosed(1);
    reader.join();

    EXPECT_FALSE(conn.isOpen());
    Guard guard{mutex};
    EXPECT_EQ("first", msgs[0]);
    EXPECT_EQ("second", msgs[1]);
    EXPECT_EQ(1, numClosed);
}

// Tests writing lines
TEST_F(ConnectionTest, WriteLine)
{
    TcpClntSock clntSock;
    auto        conn = connect(clntSock);

    conn.writeLine("hello");
    String line;
    ASSERT_TRUE(clntSock.readLine(line));
    EXPECT_EQ("hello", line);

    EXPECT_TRUE(conn.close());
    EXPECT_THROW(conn.writeLine("world"), StreamFault);
}

// Tests that closing is idempotent and reported once
TEST_F(ConnectionTest, CloseIdempotent)
{
    TcpClntSock clntSock;
    auto        conn = connect(clntSock);
    int         numHookCalls = 0;

    EXPECT_TRUE(conn.setCloseHook([&](const Connection& closed) {
        EXPECT_EQ(conn, closed);
        ++numHookCalls;
    }));

    EXPECT_TRUE(conn.close());
    EXPECT_FALSE(conn.close());
    EXPECT_FALSE(conn.setCloseHook([](const Connection&){}));

    EXPECT_EQ(1, numHookCalls);
    Guard guard{mutex};
    EXPECT_EQ(1, numClosed);
}

// Tests concurrent closing by the reader loop and other threads
TEST_F(ConnectionTest, ConcurrentClose)
{
    TcpClntSock         clntSock;
    auto                conn = connect(clntSock);
    Thread              reader(conn);
    std::atomic<int>    numTrue(0);
    std::vector<Thread> threads;

    for (int i = 0; i < 4; ++i)
        threads.emplace_back([&]{
            if (conn.close())
                ++numTrue;
        });
    for (auto& thread : threads)
        thread.join();
    reader.join();

    EXPECT_EQ(1, numTrue);
    Guard guard{mutex};
    EXPECT_EQ(1, numClosed);
}

// Tests that a write to a vanished peer fails
TEST_F(ConnectionTest, WriteToVanishedPeer)
{
    TcpClntSock clntSock;
    auto        conn = connect(clntSock);

    clntSock = TcpClntSock(); // Closes the client's socket
    ::usleep(100000);

    EXPECT_THROW(for (int i = 0; i < 1000; ++i) conn.writeLine("hello"), StreamFault);
}

// Tests connecting to a server that isn't there
TEST_F(ConnectionTest, ConnectionRefused)
{
    EXPECT_THROW(Connection::connect(SockAddr{"127.0.0.1:38819"}, *this), ConnectionError);

    Config config{};
    config.host = "no.such.host.invalid";
    EXPECT_THROW(Connection::connect(config, *this), ConnectionError);

    Guard guard{mutex};
    EXPECT_EQ(0, numClosed);
}

// Tests connecting as a client
TEST_F(ConnectionTest, Connect)
{
    Config config{};
    config.host = "127.0.0.1";
    config.port = srvrAddr.getPort();

    auto       clntConn = Connection::connect(config, *this);
    TcpSock    srvrSock = lstnSock.accept();
    Connection srvrConn(srvrSock, *this);

    EXPECT_EQ(srvrAddr, clntConn.getRmtAddr());
    clntConn.writeLine("ping");
    String line;
    ASSERT_TRUE(srvrConn.readLine(line));
    EXPECT_EQ("ping", line);

    srvrConn.close();
    EXPECT_FALSE(clntConn.readLine(line)); // End-of-stream
    clntConn.close();

    Guard guard{mutex};
    EXPECT_EQ(2, numClosed);
}

}  // namespace

int main(int argc, char **argv) {
  struct sigaction sigact;
  sigact.sa_handler = SIG_IGN;
  sigemptyset(&sigact.sa_mask);
  sigact.sa_flags = 0;
  (void)sigaction(SIGPIPE, &sigact, NULL);

  log_setName(::basename(argv[0]));
  log_setLevel(LogLevel::DEBUG);

  std::set_terminate(&sockcast::terminate);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
