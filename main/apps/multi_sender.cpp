/**
 * @file multi_sender.cpp
 * Program that broadcasts a message to every connected client each time RETURN is pressed.
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

#include "Broadcaster.h"
#include "error.h"
#include "logging.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <libgen.h>
#include <unistd.h>

using namespace sockcast;

static Config                    config; ///< Runtime parameters
static std::atomic<Broadcaster*> server; ///< The broadcast server

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
"    -p <port>        Port number on which to listen. Default is " << config.port << ".\n"
"Each RETURN sends \"message <n>\" to every client. \"q\" quits.\n";
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
    auto broadcaster = server.load();
    if (broadcaster) {
        LOG_NOTE("Status: %s. Number of listeners: %zu", isClosed ? "closed" : "open",
                broadcaster->getNumberOfListeners());
    }
    else {
        LOG_NOTE("Status: %s", isClosed ? "closed" : "open");
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
        Broadcaster  broadcaster(config, listener);

        broadcaster.start();
        LOG_NOTE("Listening on %s. Press RETURN to send a message; \"q\" to quit.",
                broadcaster.getLclAddr().to_string().data());
        server = &broadcaster;

        String   line;
        unsigned count = 0;
        while (std::getline(std::cin, line) && line != "q") {
            const auto msg = "message " + std::to_string(++count);
            const auto num = broadcaster.postMessage(msg);
            LOG_NOTE("Sent \"%s\" to %zu listener(s)", msg.data(), num);
        }

        broadcaster.shutdown();
        server = nullptr;
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
