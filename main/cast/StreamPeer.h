/**
 * A single line-oriented connection to a remote peer.
 *
 *        File: StreamPeer.h
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

#ifndef MAIN_CAST_STREAMPEER_H_
#define MAIN_CAST_STREAMPEER_H_

#include "CommonTypes.h"
#include "Config.h"
#include "Listener.h"
#include "SockAddr.h"

#include <memory>

namespace sockcast {

/**
 * One connection to a remote peer with its own reader thread. Created either as a client or as a
 * server that accepts exactly one peer. The listener is told `onClosedStatus(false)` when the
 * connection opens and `onClosedStatus(true)` once when it closes.
 */
class StreamPeer
{
public:
    class Impl;

private:
    std::shared_ptr<Impl> pImpl;

    explicit StreamPeer(Impl* impl);

public:
    /**
     * Default constructs. The resulting instance will test false.
     */
    StreamPeer() =default;

    /**
     * Returns a peer connected to the server given by a configuration's host and port.
     *
     * @param[in] config           Configuration
     * @param[in] listener         Receiver of messages and status changes. Must exist for the
     *                             lifetime of the returned instance.
     * @return                     Connected peer
     * @throw     ConnectionError  Couldn't connect. Cause is nested.
     */
    static StreamPeer connect(
            const Config& config,
            Listener&     listener);

    /**
     * Listens on a configuration's port, accepts one peer, and stops listening.
     *
     * @param[in] config           Configuration
     * @param[in] listener         Receiver of messages and status changes. Must exist for the
     *                             lifetime of the returned instance.
     * @return                     Connected peer
     * @throw     ConnectionError  Couldn't listen or accept. Cause is nested.
     */
    static StreamPeer accept(
            const Config& config,
            Listener&     listener);

    /**
     * Indicates if this instance is valid (i.e., not default constructed).
     */
    operator bool() const noexcept {
        return static_cast<bool>(pImpl);
    }

    /**
     * Returns the string representation of this instance.
     * @return String representation of this instance
     */
    String to_string() const;

    /**
     * Returns the socket address of the remote peer.
     * @return Socket address of the remote peer
     */
    SockAddr getRmtAddr() const;

    /**
     * Sends a message to the remote peer.
     *
     * @param[in] msg          Message. Shouldn't contain a newline.
     * @throw     StreamFault  The connection is closed or the write failed. The connection is
     *                         closed.
     * @threadsafety           Safe
     */
    void sendMessage(const String& msg) const;

    /**
     * Indicates if the connection is closed.
     *
     * @retval true   The connection is closed
     * @retval false  The connection is open
     */
    bool isClosed() const noexcept;

    /**
     * Closes the connection. Idempotent.
     */
    void shutdown() const;
};

} // namespace

#endif /* MAIN_CAST_STREAMPEER_H_ */
