/**
 * Server that broadcasts lines of text to every connected client.
 *
 *        File: Broadcaster.h
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

#ifndef MAIN_CAST_BROADCASTER_H_
#define MAIN_CAST_BROADCASTER_H_

#include "CommonTypes.h"
#include "Config.h"
#include "Listener.h"
#include "SockAddr.h"

#include <memory>

namespace sockcast {

/**
 * A TCP server that accepts any number of clients and sends each posted message to all of them.
 * Lines received from any client are passed to the listener.
 *
 * Status changes reported to the listener:
 *   - `onClosedStatus(true)` once when the server starts;
 *   - `onClosedStatus(false)` when a client is accepted and `onClosedStatus(true)` when that
 *     client's connection closes; and
 *   - `onClosedStatus(true)` once when the server stops accepting clients or couldn't listen.
 */
class Broadcaster
{
public:
    class Impl;

    /// State of the acceptor
    enum class State {
        IDLE,      ///< Not started
        BINDING,   ///< Creating the listening socket
        LISTENING, ///< Accepting clients
        STOPPED    ///< No longer accepting clients
    };

private:
    std::shared_ptr<Impl> pImpl;

public:
    /**
     * Constructs. Doesn't listen.
     *
     * @param[in] config           Configuration. The server listens on `config.port`.
     * @param[in] listener         Receiver of messages and status changes. Must exist for the
     *                             lifetime of this instance.
     * @throw     InvalidArgument  Invalid configuration
     */
    Broadcaster(
            const Config& config,
            Listener&     listener);

    Broadcaster(const Broadcaster& other) =delete;
    Broadcaster& operator=(const Broadcaster& rhs) =delete;

    /**
     * Destroys. Stops accepting, closes every client connection, and joins every thread started
     * by this instance.
     */
    ~Broadcaster() noexcept;

    /**
     * Creates the listening socket and starts accepting clients on a separate thread.
     *
     * @throw ConnectionError  Couldn't create the listening socket. Cause is nested.
     * @throw LogicError       Already started or shut down
     */
    void start() const;

    /**
     * Creates the listening socket and accepts clients on the current thread until `shutdown()`
     * is called or accepting fails.
     *
     * @throw ConnectionError  Couldn't create the listening socket. Cause is nested.
     * @throw LogicError       Already started or shut down
     */
    void run() const;

    /**
     * Sends a message to every connected client. Returns as soon as the writes have been
     * dispatched. A client whose write fails is disconnected. Never throws because of a client.
     *
     * @param[in] msg  Message to send. Shouldn't contain a newline.
     * @return         Number of clients to which the message was dispatched
     * @threadsafety   Safe
     */
    size_t postMessage(const String& msg) const;

    /**
     * Returns the number of connected clients.
     *
     * @return        Number of connected clients
     * @threadsafety  Safe
     */
    size_t getNumberOfListeners() const;

    /**
     * Returns the local address of the listening socket.
     *
     * @return             Local address of the listening socket
     * @throw  LogicError  Not listening
     */
    SockAddr getLclAddr() const;

    /**
     * Returns the state of the acceptor.
     * @return State of the acceptor
     */
    State getState() const;

    /**
     * Stops accepting clients and waits for the acceptor to stop (unless called on the acceptor's
     * thread). Connected clients are also closed if the configuration says so. Idempotent.
     *
     * @threadsafety  Safe
     */
    void shutdown() const;
};

} // namespace

#endif /* MAIN_CAST_BROADCASTER_H_ */
