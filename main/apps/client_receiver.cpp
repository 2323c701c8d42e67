/**
 * @file client_receiver.cpp
 * Program that connects to a broadcast server and logs every line it receives.
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
#include "StreamPeer.h"

#include <csignal>
#include <iostream>
#include <libgen.h>
#include <unistd.h>

using namespace sockcast;

/// Time to wait before trying to connect again
static constexpr unsigned RETRY_SECONDS = 2;

static Config config; ///< Runtime parameters
static Mutex  mutex;  ///< Protects `closed`
static Cond   cond;   ///< Signals closure of the connection
static bool   closed; ///< Has the connection closed?

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
"    -h               Print this help message on standard error, then exit.\n"
"    -l <logLevel>    Logging level: \"FATAL\", \"ERROR\", \"WARN\", \"NOTE\", \"INFO\",\n"
"                     \"DEBUG\", or \"TRACE\". Default is \"" << config.logLevel << "\".\n"
"    -p <port>        Port number of the server. Default is " << config.port << ".\n"
"    -s <host>        Host of the server. Default is \"" << config.host << "\".\n";
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
    LOG_NOTE("Connection %s", isClosed ? "closed" : "opened");
    if (isClosed) {
        Guard guard{mutex};
        closed = true;
        cond.notify_all();
    }
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
        ::signal(SIGPIPE, SIG_IGN);

        setConfig(argc, argv);
        LOG_INFO("Configuration: " + config.to_string());

        FuncListener listener(&onMessage, &onClosedStatus);
        StreamPeer   peer;

        while (!peer) {
            try {
                peer = StreamPeer::connect(config, listener);
            }
            catch (const ConnectionError& ex) {
                LOG_INFO(ex);
                LOG_NOTE("Couldn't connect to %s:%u. Retrying in %u seconds.",
                        config.host.data(), static_cast<unsigned>(config.port), RETRY_SECONDS);
                ::sleep(RETRY_SECONDS);
            }
        }
        LOG_NOTE("Connected to %s", peer.getRmtAddr().to_string().data());

        Lock lock{mutex};
        cond.wait(lock, []{return closed;});
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
