/**
 * This file tests class `Config`.
 *
 *       File: Config_test.cpp
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

#include "Config.h"
#include "error.h"
#include "logging.h"

#include <fstream>
#include <gtest/gtest.h>
#include <libgen.h>
#include <unistd.h>

namespace {

using namespace sockcast;

/// The fixture for testing class `Config`
class ConfigTest : public ::testing::Test
{
protected:
    String pathname;

    ConfigTest()
        : pathname("/tmp/Config_test-" + std::to_string(::getpid()) + ".yaml")
    {}

    ~ConfigTest() {
        ::unlink(pathname.data());
    }

    void writeFile(const String& contents) {
        std::ofstream file(pathname);
        file << contents;
    }
};

// Tests the defaults
TEST_F(ConfigTest, Defaults)
{
    Config config{};

    EXPECT_EQ(2011, config.port);
    EXPECT_EQ("localhost", config.host);
    EXPECT_EQ("227.27.27.27", config.group);
    EXPECT_EQ("", config.mcastIface);
    EXPECT_EQ(1, config.mcastTtl);
    EXPECT_EQ(1000, config.maxDatagram);
    EXPECT_EQ(DebugFlags(), config.debug);
    EXPECT_EQ(8, config.queueSize);
    EXPECT_EQ(10, config.poolSize);
    EXPECT_EQ(Millis(5000), config.writeTimeout);
    EXPECT_EQ(1048576, config.maxLine);
    EXPECT_FALSE(config.closePeersOnShutdown);
    EXPECT_NO_THROW(config.vet());
}

// Tests setting from command-line options
TEST_F(ConfigTest, Options)
{
    Config config{};

    EXPECT_TRUE(config.setFromOption('p', "9999"));
    EXPECT_TRUE(config.setFromOption('s', "example.com"));
    EXPECT_TRUE(config.setFromOption('g', "239.1.2.3"));
    EXPECT_TRUE(config.setFromOption('d', "send"));
    EXPECT_TRUE(config.setFromOption('d', "status"));
    EXPECT_FALSE(config.setFromOption('x', "whatever"));

    EXPECT_EQ(9999, config.port);
    EXPECT_EQ("example.com", config.host);
    EXPECT_EQ("239.1.2.3", config.group);
    EXPECT_EQ(DebugFlags(DebugFlags::SEND | DebugFlags::STATUS), config.debug);

    EXPECT_THROW(config.setFromOption('p', "65536"), InvalidArgument);
    EXPECT_THROW(config.setFromOption('p', "port"), InvalidArgument);
    EXPECT_THROW(config.setFromOption('d', "loud"), InvalidArgument);
}

// Tests setting from a YAML file
TEST_F(ConfigTest, Yaml)
{
    writeFile(
"port: 9999\n"
"host: 127.0.0.1\n"
"debug:\n"
"  - send\n"
"  - recv\n"
"stream:\n"
"  queueSize: 16\n"
"  poolSize: 4\n"
"  writeTimeout: 250\n"
"  maxLine: 4096\n"
"  closePeersOnShutdown: true\n"
"multicast:\n"
"  group: 239.0.0.1\n"
"  iface: 127.0.0.1\n"
"  ttl: 0\n"
"  maxDatagram: 512\n");

    Config config{};
    config.setFromYaml(pathname);

    EXPECT_EQ(9999, config.port);
    EXPECT_EQ("127.0.0.1", config.host);
    EXPECT_EQ(DebugFlags(DebugFlags::IO), config.debug);
    EXPECT_EQ(16, config.queueSize);
    EXPECT_EQ(4, config.poolSize);
    EXPECT_EQ(Millis(250), config.writeTimeout);
    EXPECT_EQ(4096, config.maxLine);
    EXPECT_TRUE(config.closePeersOnShutdown);
    EXPECT_EQ("239.0.0.1", config.group);
    EXPECT_EQ("127.0.0.1", config.mcastIface);
    EXPECT_EQ(0, config.mcastTtl);
    EXPECT_EQ(512, config.maxDatagram);
    EXPECT_NO_THROW(config.vet());
}

// Tests a single diagnostic-channel name in a YAML file
TEST_F(ConfigTest, YamlScalarDebug)
{
    writeFile("debug: exceptions\n");

    Config config{};
    config.setFromYaml(pathname);
    EXPECT_EQ(DebugFlags(DebugFlags::EXCEPTIONS), config.debug);
    EXPECT_EQ(2011, config.port);
}

// Tests an empty YAML file
TEST_F(ConfigTest, EmptyYaml)
{
    writeFile("");

    Config config{};
    config.setFromYaml(pathname);
    EXPECT_EQ(2011, config.port);
}

// Tests invalid YAML files
TEST_F(ConfigTest, InvalidYaml)
{
    Config config{};

    writeFile("port: [1, 2\n");
    EXPECT_THROW(config.setFromYaml(pathname), RuntimeError);

    writeFile("port: 70000\n");
    EXPECT_THROW(config.setFromYaml(pathname), RuntimeError);

    EXPECT_THROW(config.setFromYaml("/nonexistent/config.yaml"), RuntimeError);
    EXPECT_THROW(config.setFromOption('c', "/nonexistent/config.yaml"), RuntimeError);
}

// Tests vetting
TEST_F(ConfigTest, Vetting)
{
    Config config{};
    config.maxDatagram = 0;
    EXPECT_THROW(config.vet(), InvalidArgument);

    config = Config{};
    config.maxDatagram = 65508;
    EXPECT_THROW(config.vet(), InvalidArgument);

    config = Config{};
    config.poolSize = 0;
    EXPECT_THROW(config.vet(), InvalidArgument);

    config = Config{};
    config.mcastTtl = 256;
    EXPECT_THROW(config.vet(), InvalidArgument);

    config = Config{};
    config.host.clear();
    EXPECT_THROW(config.vet(), InvalidArgument);

    config = Config{};
    config.writeTimeout = Millis(0);
    EXPECT_THROW(config.vet(), InvalidArgument);

    config = Config{};
    config.maxLine = 0;
    EXPECT_THROW(config.vet(), InvalidArgument);
}

}  // namespace

int main(int argc, char **argv) {
  log_setName(::basename(argv[0]));
  log_setLevel(LogLevel::DEBUG);
  std::set_terminate(&sockcast::terminate);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
