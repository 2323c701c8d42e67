/**
 * This file tests class `SockAddr`.
 *
 *       File: SockAddr_test.cpp
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
#include "SockAddr.h"

#include <gtest/gtest.h>
#include <libgen.h>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unordered_set>

namespace {

using namespace sockcast;

// The fixture for testing class SockAddr.
class SockAddrTest : public testing::Test {
protected:
    #define IPV4_HOST1 "128.117.140.56"
    #define IPV4_HOST2 "128.117.140.57"

    #define IPV6_HOST1 "2001:db8::ff00:42"

    const char* sockAddrInSpec_1;
    const char* sockAddrInSpec_2;
    const char* sockAddrIn6Spec_1;

    SockAddrTest()
        : sockAddrInSpec_1{IPV4_HOST1 ":1"}
        , sockAddrInSpec_2{IPV4_HOST2 ":2"}
        , sockAddrIn6Spec_1{"[" IPV6_HOST1 "]:1"}
    {}
};

TEST_F(SockAddrTest, DefaultConstruction) {
    SockAddr sockAddr{}; // Braces are necessary
    EXPECT_FALSE(sockAddr);
    EXPECT_EQ("<unset>", sockAddr.to_string());
    EXPECT_EQ(0, sockAddr.getPort());
}

TEST_F(SockAddrTest, BadSpec) {
    EXPECT_THROW(SockAddr("#"), std::invalid_argument);
    EXPECT_THROW(SockAddr("127.0.0.1:99999"), std::invalid_argument);
    EXPECT_THROW(SockAddr("localhost:999999"), std::invalid_argument);
    EXPECT_THROW(SockAddr("127.0.0.1:port"), std::invalid_argument);
    EXPECT_THROW(SockAddr("[ax:zz]:1"), std::invalid_argument);
}

// Tests construction of an IPv4 socket address
TEST_F(SockAddrTest, IPv4Construction) {
    SockAddr sockAddr{sockAddrInSpec_1};

    EXPECT_TRUE(sockAddr);
    EXPECT_EQ(AF_INET, sockAddr.getFamily());
    EXPECT_EQ(1, sockAddr.getPort());
    EXPECT_STREQ(sockAddrInSpec_1, sockAddr.to_string().data());

    SockAddr sockAddr2{sockAddrInSpec_2};
    EXPECT_TRUE(sockAddr < sockAddr2);
    EXPECT_FALSE(sockAddr2 < sockAddr);
    EXPECT_NE(sockAddr, sockAddr2);
}

// Tests construction of an IPv6 socket address
TEST_F(SockAddrTest, IPv6Construction) {
    SockAddr sockAddr{sockAddrIn6Spec_1};

    EXPECT_TRUE(sockAddr);
    EXPECT_EQ(AF_INET6, sockAddr.getFamily());
    EXPECT_STREQ(sockAddrIn6Spec_1, sockAddr.to_string().data());
}

// Tests construction from a host and a port number
TEST_F(SockAddrTest, HostAndPort) {
    SockAddr sockAddr{"127.0.0.1", 2011};
    EXPECT_EQ("127.0.0.1:2011", sockAddr.to_string());

    sockAddr = SockAddr{"localhost", 2011};
    EXPECT_TRUE(sockAddr);
    EXPECT_EQ(2011, sockAddr.getPort());

    sockAddr = SockAddr{"", 2011};
    EXPECT_EQ("0.0.0.0:2011", sockAddr.to_string());

    EXPECT_THROW(SockAddr("no.such.host.invalid", 2011), InvalidArgument);
}

// Tests construction given a default port number
TEST_F(SockAddrTest, DefaultPortNumber) {
    auto sockAddr = SockAddr{IPV4_HOST1};
    EXPECT_TRUE(sockAddr);
    EXPECT_EQ(0, sockAddr.getPort());

    sockAddr = SockAddr{IPV6_HOST1};
    EXPECT_TRUE(sockAddr);
    EXPECT_EQ(0, sockAddr.getPort());
}

// Tests wildcard addresses and cloning
TEST_F(SockAddrTest, WildcardAndClone) {
    auto sockAddr = SockAddr::wildcard(AF_INET, 2011);
    EXPECT_EQ("0.0.0.0:2011", sockAddr.to_string());
    EXPECT_EQ("0.0.0.0:9999", sockAddr.clone(9999).to_string());
    EXPECT_EQ(2011, sockAddr.getPort());

    EXPECT_EQ("[::]:0", SockAddr::wildcard(AF_INET6, 0).to_string());
    EXPECT_THROW(SockAddr::wildcard(AF_UNIX, 0), InvalidArgument);
}

// Tests multicast detection
TEST_F(SockAddrTest, Multicast) {
    EXPECT_TRUE(SockAddr("227.27.27.27:2011").isMulticast());
    EXPECT_FALSE(SockAddr("127.0.0.1:2011").isMulticast());
    EXPECT_TRUE(SockAddr("[ff02::1]:2011").isMulticast());
}

// Tests use in a hash table
TEST_F(SockAddrTest, Hashing) {
    std::unordered_set<SockAddr> set;
    set.insert(SockAddr{sockAddrInSpec_1});
    set.insert(SockAddr{sockAddrInSpec_1});
    set.insert(SockAddr{sockAddrInSpec_2});
    EXPECT_EQ(2, set.size());
    EXPECT_EQ(1, set.count(SockAddr{IPV4_HOST1, 1}));
}

}  // namespace

int main(int argc, char **argv) {
  log_setName(::basename(argv[0]));
  log_setLevel(LogLevel::DEBUG);
  std::set_terminate(&sockcast::terminate);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
