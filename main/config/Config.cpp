/**
 * Configuration of the broadcast components.
 *
 *        File: Config.cpp
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
#include "Parser.h"

#include <climits>
#include <cstdio>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace sockcast {

constexpr in_port_t   Config::DEF_PORT;
constexpr const char* Config::DEF_GROUP;
constexpr const char* Config::DEF_HOST;
constexpr size_t      Config::DEF_MAX_DATAGRAM;
constexpr size_t      Config::DEF_MAX_LINE;
constexpr const char* Config::OPTIONS;

/// Maximum UDP payload over IPv4
static const size_t MAX_UDP_PAYLOAD = 65507;

Config::Config()
    : port(DEF_PORT)
    , host(DEF_HOST)
    , group(DEF_GROUP)
    , mcastIface()
    , mcastTtl(1)
    , maxDatagram(DEF_MAX_DATAGRAM)
    , debug(DebugFlags::NONE)
    , queueSize(8)
    , poolSize(10)
    , writeTimeout(std::chrono::seconds(5))
    , maxLine(DEF_MAX_LINE)
    , closePeersOnShutdown(false)
    , logLevel(log_getLevel().to_string())
{}

/**
 * Decodes a port number.
 * @param[in]  node        Map containing the port number
 * @param[in]  key         Name of the port number
 * @param[out] port        Port number
 * @throw InvalidArgument  Invalid port number
 */
static void decodePort(
        const YAML::Node& node,
        const String&     key,
        in_port_t&        port)
{
    int value;
    if (Parser::tryDecode<int>(node, key, value)) {
        if (value < 0 || value > USHRT_MAX)
            throw INVALID_ARGUMENT("Invalid port number: " + std::to_string(value));
        port = static_cast<in_port_t>(value);
    }
}

void Config::setFromYaml(const String& pathname)
{
    try {
        auto node0 = YAML::LoadFile(pathname);

        if (node0.IsNull())
            return; // Empty file

        String level;
        if (Parser::tryDecode<String>(node0, "logLevel", level)) {
            log_setLevel(level);
            logLevel = level;
        }

        decodePort(node0, "port", port);
        Parser::tryDecode<String>(node0, "host", host);

        std::vector<String> names;
        if (Parser::tryDecode<String>(node0, "debug", names))
            debug = DebugFlags::parse(names);

        auto node1 = Parser::getMap(node0, "stream");
        if (node1) {
            Parser::tryDecode<int>(node1, "queueSize", queueSize);
            Parser::tryDecode<unsigned>(node1, "poolSize", poolSize);

            int millis;
            if (Parser::tryDecode<int>(node1, "writeTimeout", millis))
                writeTimeout = Millis(millis);

            Parser::tryDecode<size_t>(node1, "maxLine", maxLine);

            Parser::tryDecode<bool>(node1, "closePeersOnShutdown", closePeersOnShutdown);
        }

        node1 = Parser::getMap(node0, "multicast");
        if (node1) {
            Parser::tryDecode<String>(node1, "group", group);
            decodePort(node1, "port", port);
            Parser::tryDecode<String>(node1, "iface", mcastIface);
            Parser::tryDecode<int>(node1, "ttl", mcastTtl);
            Parser::tryDecode<size_t>(node1, "maxDatagram", maxDatagram);
        }
    } // YAML file loaded
    catch (const std::exception& ex) {
        std::throw_with_nested(RUNTIME_ERROR("Couldn't parse YAML file \"" + pathname + "\""));
    }
}

bool Config::setFromOption(
        const int   c,
        const char* arg)
{
    switch (c) {
        case 'c': {
            setFromYaml(arg);
            break;
        }
        case 'd': {
            debug.set(DebugFlags::parse(arg));
            break;
        }
        case 'g': {
            group = String(arg);
            break;
        }
        case 's': {
            host = String(arg);
            break;
        }
        case 'l': {
            log_setLevel(arg);
            logLevel = arg;
            break;
        }
        case 'p': {
            unsigned value;
            if (::sscanf(arg, "%u", &value) != 1 || value > USHRT_MAX)
                throw INVALID_ARGUMENT(String("Invalid \"-") + static_cast<char>(c) +
                        "\" option argument");
            port = static_cast<in_port_t>(value);
            break;
        }
        default:
            return false;
    }

    return true;
}

void Config::vet() const
{
    if (host.empty())
        throw INVALID_ARGUMENT("Host is the empty string");

    if (group.empty())
        throw INVALID_ARGUMENT("Multicast group is the empty string");

    if (mcastTtl < 0 || mcastTtl > 255)
        throw INVALID_ARGUMENT("Multicast time-to-live isn't in [0, 255]");

    if (maxDatagram == 0)
        throw INVALID_ARGUMENT("Maximum datagram size is zero");
    if (maxDatagram > MAX_UDP_PAYLOAD)
        throw INVALID_ARGUMENT("Maximum datagram size is greater than " +
                std::to_string(MAX_UDP_PAYLOAD));

    if (queueSize <= 0)
        throw INVALID_ARGUMENT("Size of listen queue is not positive");

    if (poolSize == 0)
        throw INVALID_ARGUMENT("Size of worker pool is zero");

    if (writeTimeout.count() <= 0)
        throw INVALID_ARGUMENT("Write timeout is not positive");

    if (maxLine == 0)
        throw INVALID_ARGUMENT("Maximum line length is zero");
}

String Config::to_string() const
{
    return "{port=" + std::to_string(port) +
            ", host=" + host +
            ", group=" + group +
            ", iface=" + (mcastIface.empty() ? String("*") : mcastIface) +
            ", ttl=" + std::to_string(mcastTtl) +
            ", maxDatagram=" + std::to_string(maxDatagram) +
            ", debug=" + debug.to_string() +
            ", queueSize=" + std::to_string(queueSize) +
            ", poolSize=" + std::to_string(poolSize) +
            ", writeTimeout=" + std::to_string(writeTimeout.count()) + "ms" +
            ", maxLine=" + std::to_string(maxLine) +
            ", closePeersOnShutdown=" + (closePeersOnShutdown ? "true" : "false") +
            ", logLevel=" + logLevel + "}";
}

} // namespace
