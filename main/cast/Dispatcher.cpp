/**
 * Sends a message to every connection of a snapshot concurrently.
 *
 *        File: Dispatcher.cpp
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

#include "Dispatcher.h"
#include "error.h"
#include "logging.h"
#include "WorkerPool.h"

#include <atomic>

namespace sockcast {

/// Implementation of a dispatcher
class Dispatcher::Impl
{
    const DebugFlags  debug;   ///< Diagnostic channels
    std::atomic<bool> stopped; ///< `shutdown()` has been called?
    WorkerPool        pool;    ///< Sending threads

    /**
     * Sends a message to one connection. Closes the connection on failure.
     *
     * @param[in] conn  Connection
     * @param[in] msg   Message
     */
    void send(
            Connection    conn,
            const String& msg) {
        try {
            conn.writeLine(msg);
        }
        catch (const std::exception& ex) {
            LOG_DIAG(debug, DebugFlags::EXCEPTIONS, ex, "Couldn't send to connection %s",
                    conn.to_string().data());
            try {
                conn.close(); // Removes it from its registry
            }
            catch (const std::exception& closeEx) {
                LOG_ERROR(closeEx, "Couldn't close connection %s", conn.to_string().data());
            }
        }
    }

public:
    Impl(   const unsigned poolSize,
            DebugFlags     debug)
        : debug(debug)
        , stopped(false)
        , pool(poolSize)
    {}

    size_t post(
            const ListenerSet::Snapshot& snapshot,
            const String&                msg) {
        size_t count = 0;

        if (stopped)
            return count;

        for (auto& conn : snapshot) {
            try {
                pool.submit([this, conn, msg]{send(conn, msg);});
                ++count;
            }
            catch (const LogicError& ex) {
                LOG_DEBUG("Dispatcher is shut down: message not sent to %s",
                        conn.to_string().data());
                break;
            }
            catch (const std::exception& ex) {
                LOG_ERROR(ex, "Couldn't dispatch message to %s", conn.to_string().data());
                break;
            }
        }

        return count;
    }

    void awaitIdle() {
        pool.awaitIdle();
    }

    void shutdown() {
        stopped = true;
        pool.shutdown();
    }
};

/******************************************************************************/

Dispatcher::Dispatcher(
        const unsigned poolSize,
        DebugFlags     debug)
    : pImpl(std::make_shared<Impl>(poolSize, debug))
{}

size_t Dispatcher::post(
        const ListenerSet::Snapshot& snapshot,
        const String&                msg) const {
    return pImpl->post(snapshot, msg);
}

void Dispatcher::awaitIdle() const {
    pImpl->awaitIdle();
}

void Dispatcher::shutdown() const {
    pImpl->shutdown();
}

} // namespace
