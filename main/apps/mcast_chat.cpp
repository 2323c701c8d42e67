/**
 * @file mcast_chat.cpp
 * Program that joins a multicast group, sends each line of standard input to the group, and logs
 * every datagram received from the group.
 *
 * @section Legal
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

#include <iostream>
#include <libgen.h>
#include <unistd.h>

using namespace sockcast;

static Config config; ///< Runtime parameters

static void usage()
{
    std::cerr <<
"Usage:\n"
"    " << log_getName() << " -h\n"
"    " << log_getName() << " [options]\n"
"Options:\n"
"    -c <configFile>  Pathname of YAML configuration-file. Overrides previous\n"
"                     arguments; overridden by subsequent ones.\n"
"    -d <channel>     Diagnostic channel to enable: \"send\", \"recv\", \"status\",\n"
"                     \"exceptions\", \"io\", or \"all\". May be repeated.\n"
"    -g <group>       IPv4 multicast group address. Default is \"" << config.group << "\".\n"
"    -h               Print this help message on standard error, then exit.\n"
"    -l <logLevel>    Logging level: \"FATAL\", \"ERROR\", \"WARN\", \"NOTE\", \"INFO\",\n"
"                     \"DEBUG\", or \"TRACE\". Default is \"" << config.logLevel << "\".\n"
"    -p <port>        Port number of the group. Default is " << config.port << ".\n"
"Each line of standard input is sent to the group. End-of-file quits.\n";
}

/**
 * Sets the runtime parameters from the command line.
 *
 * @param[in] argc             Number of command-line arguments
 * @param[in] argv             Command-line arguments
 * @throw     InvalidArgument  Invalid command line
 */
static void setConfig(
        const int    argc,
        char* const* argv)
{
    const String opts = String(":h") + Config::OPTIONS;

    opterr = 0;    // 0 => getopt() won't write to `stderr`
    int c;
    while ((c = ::getopt(argc, argv, opts.data())) != -1) {
        switch (c) {
            case 'h': {
                usage();
                ::exit(0);
            }
            case ':': {
                throw INVALID_ARGUMENT(String("Option \"-") + static_cast<char>(optopt) +
                        "\" is missing an argument");
            }
            default: {
                if (!config.setFromOption(c, optarg))
                    throw INVALID_ARGUMENT(String("Unknown option: \"") +
                            static_cast<char>(optopt) + "\"");
            }
        }
    }

    if (optind != argc)
        throw INVALID_ARGUMENT("Too many operands");

    config.vet();
}

static void onMessage(const String& msg)
{
    LOG_NOTE("Received \"%s\"", msg.data());
}

static void onClosedStatus(const bool isClosed)
{
    LOG_NOTE("Group %s", isClosed ? "left" : "joined");
}

/**
 * Main entry point.
 *
 * @param[in] argc  Number of command-line arguments
 * @param[in] argv  Command-line arguments
 * @retval    0     Success
 * @retval    1     Command-line error
 * @retval    2     Runtime error
 */
int main(
        const int    argc,
        char* const* argv)
{
    int status = 0;

    std::set_terminate(&terminate);

    try {
        log_setName(::basename(argv[0]));
        log_setLevelSignal(SIGUSR2);

        setConfig(argc, argv);
        LOG_INFO("Configuration: " + config.to_string());

        FuncListener listener(&onMessage, &onClosedStatus);
        McastConn    conn(config, listener);

        conn.join();
        LOG_NOTE("Joined group %s. Each line is sent to the group.",
                conn.getGroupAddr().to_string().data());

        String line;
        while (std::getline(std::cin, line) && conn.isOpen()) {
            try {
                conn.send(line);
            }
            catch (const OversizeMessageError& ex) {
                LOG_WARNING(ex);
            }
        }

        conn.leave();
    }
    catch (const std::invalid_argument& ex) {
        LOG_FATAL(ex);
        usage();
        status = 1;
    }
    catch (const std::exception& ex) {
        LOG_FATAL(ex);
        status = 2;
    }
    LOG_NOTE("Exiting with status %d", status);

    return status;
}
