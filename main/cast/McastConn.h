/**
 * Connection to an IPv4 multicast group.
 *
 *        File: McastConn.h
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

#ifndef MAIN_CAST_MCASTCONN_H_
#define MAIN_CAST_MCASTCONN_H_

#include "CommonTypes.h"
#include "Config.h"
#include "Listener.h"
#include "SockAddr.h"

#include <memory>

namespace sockcast {

/**
 * A member of a multicast group. The group is the only peer: a sent message is a single datagram
 * to the group, and every datagram received from the group is passed to the listener.
 *
 * The listener is told `onClosedStatus(true)` when `join()` starts, `onClosedStatus(false)` when
 * the group is joined, and `onClosedStatus(true)` once more when the connection closes or the
 * join fails.
 */
class McastConn
{
public:
    class Impl;

private:
    std::shared_ptr<Impl> pImpl;

public:
    /**
     * Constructs. Doesn't join the group.
     *
     * @param[in] config    Configuration. The group is `config.group:config.port`.
     * @param[in] listener  Receiver of datagrams and status changes. Must exist for the lifetime of
     *                      this instance.
     */
    McastConn(
            const Config& config,
            Listener&     listener);

    McastConn(const McastConn& other) =delete;
    McastConn& operator=(const McastConn& rhs) =delete;

    /**
     * Destroys. Closes the connection and joins the reader thread.
     */
    ~McastConn() noexcept;

    /**
     * Joins the group.
     *
     * @param[in] startReader      Whether to start a thread that passes received datagrams to the
     *                             listener. If false, the caller should use `receive()`.
     * @throw     ConnectionError  Couldn't bind or join. Cause is nested.
     * @throw     LogicError       Already joined or closed
     */
    void join(const bool startReader = true) const;

    /**
     * Returns the socket address of the group.
     *
     * @return             Socket address of the group
     * @throw  LogicError  The group hasn't been joined
     */
    SockAddr getGroupAddr() const;

    /**
     * Receives the next datagram from the group.
     *
     * @param[out] msg                   Datagram payload
     * @retval     true                  Success
     * @retval     false                 The connection was closed
     * @throw      OversizeMessageError  The datagram was larger than `config.maxDatagram`. It's
     *                                   discarded.
     * @throw      StreamFault           I/O failure. Cause is nested.
     * @throw      LogicError            The group hasn't been joined
     */
    bool receive(String& msg) const;

    /**
     * Sends a message to the group as a single datagram.
     *
     * @param[in] msg                   Message
     * @throw     OversizeMessageError  The message is larger than `config.maxDatagram`. Nothing
     *                                  was sent.
     * @throw     StreamFault           The connection is closed or an I/O failure occurred
     * @throw     LogicError            The group hasn't been joined
     * @threadsafety                    Safe
     */
    void send(const String& msg) const;

    /**
     * Indicates if the group has been joined and the connection hasn't been closed.
     *
     * @retval true   The connection is open
     * @retval false  The connection isn't open
     */
    bool isOpen() const;

    /**
     * Leaves the group. Idempotent. Leaving is terminal.
     *
     * @retval true   The connection was closed by this call
     * @retval false  The connection was already closed
     */
    bool close() const;

    /**
     * Synonym for `close()`.
     */
    bool leave() const {
        return close();
    }
};

} // namespace

#endif /* MAIN_CAST_MCASTCONN_H_ */
