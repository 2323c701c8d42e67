/**
 * Configuration of the broadcast components.
 *
 *        File: Config.h
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

#ifndef MAIN_CONFIG_CONFIG_H_
#define MAIN_CONFIG_CONFIG_H_

#include "CommonTypes.h"
#include "DebugFlags.h"

#include <cstddef>
#include <netinet/in.h>

namespace sockcast {

/**
 * Configuration parameters. An instance is passed by value to every component that needs one;
 * there is no process-wide configuration.
 */
struct Config
{
    static constexpr in_port_t   DEF_PORT         = 2011;           ///< Default port number
    static constexpr const char* DEF_GROUP        = "227.27.27.27"; ///< Default multicast group
    static constexpr const char* DEF_HOST         = "localhost";    ///< Default host
    static constexpr size_t      DEF_MAX_DATAGRAM = 1000;           ///< Default maximum payload
    static constexpr size_t      DEF_MAX_LINE     = 1048576;        ///< Default maximum line

    /// Options understood by `setFromOption()`. For use with `getopt()`.
    static constexpr const char* OPTIONS = "c:d:g:l:p:s:";

    in_port_t  port;                 ///< Port number of the stream server or multicast group
    String     host;                 ///< Host of the stream server
    String     group;                ///< Multicast group address
    String     mcastIface;           ///< IPv4 address of the multicast interface. Empty => any.
    int        mcastTtl;             ///< Time-to-live of outgoing multicast datagrams
    size_t     maxDatagram;          ///< Maximum multicast payload in bytes
    DebugFlags debug;                ///< Diagnostic channels
    int        queueSize;            ///< Maximum number of pending connections
    unsigned   poolSize;             ///< Number of threads that send a broadcast message
    Millis     writeTimeout;         ///< Maximum time a write to a stalled peer may block
    size_t     maxLine;              ///< Maximum length of a received line in bytes
    bool       closePeersOnShutdown; ///< Whether `shutdown()` also closes connected peers
    String     logLevel;             ///< Name of the logging level

    /**
     * Default constructs.
     */
    Config();

    /**
     * Sets parameters from a YAML configuration-file. Parameters that aren't in the file are
     * unchanged. Sets the logging level if the file specifies one.
     *
     * @param[in] pathname      Pathname of the file
     * @throw     RuntimeError  Couldn't parse the file. Cause is nested.
     */
    void setFromYaml(const String& pathname);

    /**
     * Sets a parameter from a command-line option.
     *
     * @param[in] c                Option character (one of `OPTIONS`)
     * @param[in] arg              Option argument
     * @retval    true             The option was recognized
     * @retval    false            The option wasn't recognized
     * @throw     InvalidArgument  Invalid option argument
     * @throw     RuntimeError     Couldn't parse the configuration-file
     */
    bool setFromOption(
            const int   c,
            const char* arg);

    /**
     * Vets the parameters.
     *
     * @throw InvalidArgument  A parameter is invalid
     */
    void vet() const;

    /**
     * Returns the string representation of this instance.
     * @return String representation of this instance
     */
    String to_string() const;
};

} // namespace

#endif /* MAIN_CONFIG_CONFIG_H_ */
