/**
 * This file tests class `StreamPeer`.
 *
 *       File: StreamPeer_test.cpp
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
#include "StreamPeer.h"

#include <gtest/gtest.h>
#include <libgen.h>
#include <signal.h>
#include <thread>
#include <vector>

namespace {

using namespace sockcast;

/// Records what a peer tells its listener
class Recorder : public Listener
{
    Mutex               mutex;
    Cond                cond;
    std::vector<String> msgs;
    int                 numOpened;
    int                 numClosed;

public:
    Recorder()
        : mutex()
        , cond()
        , msgs()
        , numOpened(0)
        , numClosed(0)
    {}

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

    String waitForMsg(const size_t index) {
        Lock lock{mutex};
        cond.wait(lock, [&]{return msgs.size() > index;});
        return msgs[index];
    }

    void waitForClosed(const int num) {
        Lock lock{mutex};
        cond.wait(lock, [&]{return numClosed == num;});
    }

    int getNumOpened() {
        Guard guard{mutex};
        return numOpened;
    }

    int getNumClosed() {
        Guard guard{mutex};
        return numClosed;
    }
};

/// The fixture for testing class `StreamPeer`
class StreamPeerTest : public ::testing::Test
{
protected:
    Config     config;
    Recorder   srvrRecorder;
    Recorder   clntRecorder;
    StreamPeer srvrPeer;
    Thread     srvrThread;

    StreamPeerTest()
        : config()
        , srvrRecorder()
        , clntRecorder()
        , srvrPeer()
        , srvrThread()
    {
        config.host = "127.0.0.1";
        config.port = 38806;
        config.debug = DebugFlags(DebugFlags::ALL);
    }

    ~StreamPeerTest() {
        if (srvrThread.joinable())
            srvrThread.join();
    }

    /**
     * Starts accepting a peer on a separate thread and returns a peer connected to it.
     * @return Client-side peer
     */
    StreamPeer connect() {
        srvrThread = Thread([&]{
            try {
                srvrPeer = StreamPeer::accept(config, srvrRecorder);
            }
            catch (const std::exception& ex) {
                LOG_ERROR(ex, "Couldn't accept peer");
            }
        });

        for (int i = 0; ; ++i) {
            try {
                return StreamPeer::connect(config, clntRecorder);
            }
            catch (const ConnectionError& ex) {
                if (i == 100)
                    throw;
                std::this_thread::sleep_for(Millis(10)); // Server isn't listening yet
            }
        }
    }
};

// Tests default construction
TEST_F(StreamPeerTest, DefaultConstruction)
{
    StreamPeer peer{};
    EXPECT_FALSE(peer);
    EXPECT_TRUE(peer.isClosed());
    EXPECT_EQ("<unset>", peer.to_string());
    EXPECT_NO_THROW(peer.shutdown());
}

// Tests exchanging messages
TEST_F(StreamPeerTest, Exchange)
{
    auto clntPeer = connect();
    srvrThread.join();
    ASSERT_TRUE(srvrPeer);
    ASSERT_TRUE(clntPeer);

    EXPECT_FALSE(clntPeer.isClosed());
    EXPECT_FALSE(srvrPeer.isClosed());
    EXPECT_EQ(config.port, clntPeer.getRmtAddr().getPort());
    EXPECT_EQ(1, srvrRecorder.getNumOpened());
    EXPECT_EQ(1, clntRecorder.getNumOpened());

    clntPeer.sendMessage("hello");
    EXPECT_EQ("hello", srvrRecorder.waitForMsg(0));
    srvrPeer.sendMessage("world");
    EXPECT_EQ("world", clntRecorder.waitForMsg(0));

    clntPeer.shutdown();
    clntRecorder.waitForClosed(1);
    srvrRecorder.waitForClosed(1); // Remote peer sees end-of-stream
    EXPECT_TRUE(clntPeer.isClosed());
    EXPECT_TRUE(srvrPeer.isClosed());

    clntPeer.shutdown();
    EXPECT_EQ(1, clntRecorder.getNumClosed());
    EXPECT_THROW(clntPeer.sendMessage("again"), StreamFault);
}

// Tests that the listening socket is released after a peer is accepted
TEST_F(StreamPeerTest, SingleAccept)
{
    auto clntPeer = connect();
    srvrThread.join();

    Recorder other;
    EXPECT_THROW(StreamPeer::connect(config, other), ConnectionError);
    EXPECT_EQ(0, other.getNumOpened());
}

// Tests connecting when no server is listening
TEST_F(StreamPeerTest, ConnectionRefused)
{
    EXPECT_THROW(StreamPeer::connect(config, clntRecorder), ConnectionError);
    EXPECT_EQ(0, clntRecorder.getNumOpened());
    EXPECT_EQ(0, clntRecorder.getNumClosed());
}

// Tests that destruction closes the connection
TEST_F(StreamPeerTest, Destruction)
{
    {
        auto clntPeer = connect();
        srvrThread.join();
    }
    EXPECT_EQ(1, clntRecorder.getNumClosed());
    srvrRecorder.waitForClosed(1);
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
