/**
 * This file tests class `McastConn`.
 *
 *       File: McastConn_test.cpp
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

#include "error.h"
#include "logging.h"
#include "McastConn.h"

#include <gtest/gtest.h>
#include <libgen.h>
#include <vector>

namespace {

using namespace sockcast;

/// The fixture for testing class `McastConn`
class McastConnTest : public ::testing::Test, public Listener
{
protected:
    Config              config;
    Mutex               mutex;
    Cond                cond;
    std::vector<String> msgs;      ///< Datagrams passed to the listener
    int                 numOpened; ///< Number of `onClosedStatus(false)` calls
    int                 numClosed; ///< Number of `onClosedStatus(true)` calls

    McastConnTest()
        : config()
        , mutex()
        , cond()
        , msgs()
        , numOpened(0)
        , numClosed(0)
    {
        config.group = "227.27.27.27";
        config.port = 38807;
        config.mcastIface = "127.0.0.1";
        config.debug = DebugFlags(DebugFlags::ALL);
    }

public:
    void onMessage(const String& msg) override {
        Guard guard{mutex};
        msgs.push_back(msg);
        cond.notify_all();
    }

    void onClosedStatus(const bool isClosed) override {
        Guard guard{mutex};
        if (isClosed) {
            ++numClosed;
        }
        else {
            ++numOpened;
        }
        cond.notify_all();
    }

protected:
    void waitForMsgs(const size_t num) {
        Lock lock{mutex};
        cond.wait(lock, [&]{return msgs.size() == num;});
    }
};

// Tests an instance that hasn't joined the group
TEST_F(McastConnTest, NotJoined)
{
    McastConn conn{config, *this};

    EXPECT_FALSE(conn.isOpen());
    EXPECT_THROW(conn.getGroupAddr(), LogicError);
    EXPECT_THROW(conn.send("hello"), LogicError);

    String msg;
    EXPECT_THROW(conn.receive(msg), LogicError);

    EXPECT_TRUE(conn.close());
    EXPECT_THROW(conn.join(), LogicError);

    Guard guard{mutex};
    EXPECT_EQ(0, numOpened);
    EXPECT_EQ(0, numClosed);
}

// Tests joining an address that isn't a multicast group
TEST_F(McastConnTest, BadGroup)
{
    config.group = "127.0.0.1";
    McastConn conn{config, *this};

    EXPECT_THROW(conn.join(), ConnectionError);
    EXPECT_FALSE(conn.isOpen());
    EXPECT_THROW(conn.join(), LogicError);
    EXPECT_FALSE(conn.close());

    Guard guard{mutex};
    EXPECT_EQ(0, numOpened);
    EXPECT_EQ(2, numClosed); // Initial state and the failure
}

// Tests one member sending to another
TEST_F(McastConnTest, SendReceive)
{
    McastConn sender{config, *this};
    McastConn receiver{config, *this};

    sender.join();          // Reader passes datagrams to the listener
    receiver.join(false);   // Datagrams are obtained by `receive()`
    {
        Guard guard{mutex};
        EXPECT_EQ(2, numClosed); // Initial state of each
    }
    EXPECT_TRUE(sender.isOpen());
    EXPECT_EQ(SockAddr("227.27.27.27:38807"), receiver.getGroupAddr());
    EXPECT_THROW(receiver.join(), LogicError);

    sender.send("ping");

    String msg;
    ASSERT_TRUE(receiver.receive(msg));
    EXPECT_EQ("ping", msg);

    waitForMsgs(1); // The sender also receives its own datagram
    {
        Guard guard{mutex};
        EXPECT_EQ("ping", msgs[0]);
        EXPECT_EQ(2, numOpened);
    }

    EXPECT_TRUE(receiver.leave());
    EXPECT_FALSE(receiver.receive(msg));
    EXPECT_TRUE(sender.close());

    Guard guard{mutex};
    EXPECT_EQ(4, numClosed);
}

// Tests that oversize messages are rejected
TEST_F(McastConnTest, Oversize)
{
    const String big(20, 'x');

    config.maxDatagram = 10;
    McastConn small{config, *this};
    EXPECT_THROW(small.send(big), OversizeMessageError); // Before joining
    small.join(false);
    try {
        small.send(big);
        FAIL() << "No exception";
    }
    catch (const OversizeMessageError& ex) {
        EXPECT_EQ(big.size(), ex.getSize());
    }

    config.maxDatagram = Config::DEF_MAX_DATAGRAM;
    McastConn sender{config, *this};
    sender.join(false);
    sender.send(big);
    sender.send("small");

    String msg;
    EXPECT_THROW(small.receive(msg), OversizeMessageError);
    ASSERT_TRUE(small.receive(msg)); // Oversize datagram was discarded
    EXPECT_EQ("small", msg);
}

// Tests that closing is idempotent and reported once
TEST_F(McastConnTest, CloseIdempotent)
{
    McastConn conn{config, *this};

    conn.join();
    EXPECT_TRUE(conn.close());
    EXPECT_FALSE(conn.close());
    EXPECT_FALSE(conn.leave());
    EXPECT_FALSE(conn.isOpen());
    EXPECT_THROW(conn.send("hello"), StreamFault);

    Guard guard{mutex};
    EXPECT_EQ(1, numOpened);
    EXPECT_EQ(2, numClosed); // Initial and final
}

// Tests that destruction closes the connection
TEST_F(McastConnTest, Destruction)
{
    {
        McastConn conn{config, *this};
        conn.join();
    }

    Guard guard{mutex};
    EXPECT_EQ(2, numClosed);
}

}  // namespace

int main(int argc, char **argv) {
  log_setName(::basename(argv[0]));
  log_setLevel(LogLevel::DEBUG);
  std::set_terminate(&sockcast::terminate);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
