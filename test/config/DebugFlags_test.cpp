/**
 * This file tests class `DebugFlags`.
 *
 *       File: DebugFlags_test.cpp
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

#include "DebugFlags.h"
#include "error.h"
#include "logging.h"

#include <gtest/gtest.h>
#include <libgen.h>

namespace {

using namespace sockcast;

/// The fixture for testing class `DebugFlags`
class DebugFlagsTest : public ::testing::Test
{};

// Tests default construction
TEST_F(DebugFlagsTest, DefaultConstruction)
{
    DebugFlags flags{};
    EXPECT_EQ(DebugFlags::NONE, flags.getMask());
    EXPECT_FALSE(flags.isSet(DebugFlags::SEND));
    EXPECT_FALSE(flags.isSet(DebugFlags::NONE));
    EXPECT_EQ("DEBUG_NONE", flags.to_string());
}

// Tests that the channels are independent
TEST_F(DebugFlagsTest, IndependentChannels)
{
    DebugFlags flags{DebugFlags::SEND};
    EXPECT_TRUE(flags.isSet(DebugFlags::SEND));
    EXPECT_FALSE(flags.isSet(DebugFlags::RECV));
    EXPECT_FALSE(flags.isSet(DebugFlags::IO));

    flags.set(DebugFlags::RECV);
    EXPECT_TRUE(flags.isSet(DebugFlags::IO));
    EXPECT_FALSE(flags.isSet(DebugFlags::STATUS));
    EXPECT_EQ("DEBUG_SEND | DEBUG_RECV", flags.to_string());

    flags.clear(DebugFlags::SEND);
    EXPECT_FALSE(flags.isSet(DebugFlags::SEND));
    EXPECT_TRUE(flags.isSet(DebugFlags::RECV));
    EXPECT_EQ(DebugFlags(DebugFlags::RECV), flags);
}

// Tests the union of all channels
TEST_F(DebugFlagsTest, All)
{
    DebugFlags flags{DebugFlags::ALL};
    EXPECT_TRUE(flags.isSet(DebugFlags::SEND));
    EXPECT_TRUE(flags.isSet(DebugFlags::RECV));
    EXPECT_TRUE(flags.isSet(DebugFlags::EXCEPTIONS));
    EXPECT_TRUE(flags.isSet(DebugFlags::STATUS));
    EXPECT_EQ("DEBUG_SEND | DEBUG_RECV | DEBUG_EXCEPTIONS | DEBUG_STATUS", flags.to_string());
}

// Tests parsing channel names
TEST_F(DebugFlagsTest, Parsing)
{
    EXPECT_EQ(DebugFlags::NONE, DebugFlags::parse("none"));
    EXPECT_EQ(DebugFlags::SEND, DebugFlags::parse("SEND"));
    EXPECT_EQ(DebugFlags::RECV, DebugFlags::parse("recv"));
    EXPECT_EQ(DebugFlags::RECV, DebugFlags::parse("Receive"));
    EXPECT_EQ(DebugFlags::EXCEPTIONS, DebugFlags::parse("exceptions"));
    EXPECT_EQ(DebugFlags::STATUS, DebugFlags::parse("status"));
    EXPECT_EQ(DebugFlags::IO, DebugFlags::parse("io"));
    EXPECT_EQ(DebugFlags::ALL, DebugFlags::parse("all"));
    EXPECT_THROW(DebugFlags::parse("verbose"), InvalidArgument);

    const auto flags = DebugFlags::parse(std::vector<String>{"status", "exceptions"});
    EXPECT_EQ(DebugFlags::STATUS | DebugFlags::EXCEPTIONS, flags.getMask());
}

}  // namespace

int main(int argc, char **argv) {
  log_setName(::basename(argv[0]));
  log_setLevel(LogLevel::DEBUG);
  std::set_terminate(&sockcast::terminate);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
