/**
 * A line-oriented connection to a single remote peer.
 *
 *        File: Connection.h
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

#ifndef MAIN_CAST_CONNECTION_H_
#define MAIN_CAST_CONNECTION_H_

#include "CommonTypes.h"
#include "Config.h"
#include "DebugFlags.h"
#include "Listener.h"
#include "SockAddr.h"
#include "Socket.h"

#include <functional>
#include <memory>

namespace sockcast {

/**
 * A connection to a remote peer that exchanges newline-delimited text. A connection is either open
 * or closed. Closing is terminal: a closed connection is never reopened.
 *
 * Instances are cheap to copy. Copies refer to the same connection.
 */
class Connection
{
public:
    class Impl;

    /// Function called once when the connection closes, before the listener is notified
    using CloseHook = std::function<void(const Connection&)>;

private:
    std::shared_ptr<Impl> pImpl;

    explicit Connection(std::shared_ptr<Impl> impl);

public:
    /**
     * Default constructs. The resulting instance will test false.
     */
    Connection() =default;

    /**
     * Constructs from a connected socket. The connection is open.
     *
     * @param[in] sock          Connected socket
     * @param[in] listener      Receiver of inbound messages and of the closure. Must exist for the
     *                          lifetime of the connection.
     * @param[in] debug         Diagnostic channels
     * @param[in] writeTimeout  Maximum time a write may block. Non-positive means indefinite.
     * @param[in] maxLine       Maximum length of a received line. 0 means unlimited.
     */
    Connection(
            TcpSock      sock,
            Listener&    listener,
            DebugFlags   debug = DebugFlags(),
            const Millis writeTimeout = Millis(0),
            const size_t maxLine = 0);

    /**
     * Returns a new connection to a remote server.
     *
     * @param[in] srvrAddr         Socket address of the server
     * @param[in] listener         Receiver of inbound messages and of the closure
     * @param[in] debug            Diagnostic channels
     * @param[in] writeTimeout     Maximum time a write may block
     * @param[in] maxLine          Maximum length of a received line. 0 means unlimited.
     * @return                     Open connection
     * @throw     ConnectionError  Couldn't connect. Cause is nested.
     */
    static Connection connect(
            const SockAddr& srvrAddr,
            Listener&       listener,
            DebugFlags      debug = DebugFlags(),
            const Millis    writeTimeout = Millis(0),
            const size_t    maxLine = 0);

    /**
     * Returns a new connection to the server specified by a configuration's host and port.
     *
     * @param[in] config           Configuration
     * @param[in] listener         Receiver of inbound messages and of the closure
     * @return                     Open connection
     * @throw     ConnectionError  Couldn't resolve or connect. Cause is nested.
     */
    static Connection connect(
            const Config& config,
            Listener&     listener);

    /**
     * Indicates if this instance is valid (i.e., not default constructed).
     */
    operator bool() const noexcept {
        return static_cast<bool>(pImpl);
    }

    bool operator==(const Connection& rhs) const noexcept {
        return pImpl == rhs.pImpl;
    }

    bool operator!=(const Connection& rhs) const noexcept {
        return pImpl != rhs.pImpl;
    }

    bool operator<(const Connection& rhs) const noexcept {
        return pImpl < rhs.pImpl;
    }

    /**
     * Returns the hash code of this instance.
     * @return The hash code of this instance
     */
    size_t hash() const noexcept {
        return std::hash<Impl*>()(pImpl.get());
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
     * Sets the function to be called when this connection closes. Replaces any previous one.
     *
     * @param[in] hook   Function to be called
     * @retval    true   Hook was set
     * @retval    false  Connection is already closed. Hook wasn't set.
     */
    bool setCloseHook(CloseHook hook) const;

    /**
     * Indicates if this connection is open.
     * @retval true     Connection is open
     * @retval false    Connection is closed
     */
    bool isOpen() const noexcept;

    /**
     * Reads the next line. Blocks until a line is available, the stream ends, or the connection is
     * closed.
     *
     * @param[out] line         Line without its terminator
     * @retval     true         Success
     * @retval     false        End-of-stream or connection closed
     * @throw      StreamFault  I/O failure
     */
    bool readLine(String& line) const;

    /**
     * Writes a line. Concurrent writes to the same connection are serialized.
     *
     * @param[in] line          Line without its terminator
     * @throw     StreamFault   Connection is closed, the peer is gone, or the write failed or
     *                          timed-out
     * @threadsafety            Safe
     */
    void writeLine(const String& line) const;

    /**
     * Closes this connection. The first call marks the connection closed, shuts down the socket,
     * calls the close hook, and then calls `onClosedStatus(true)` on the listener. Subsequent and
     * concurrent calls do nothing.
     *
     * @retval true   This call closed the connection
     * @retval false  The connection was already closed
     * @threadsafety  Safe
     */
    bool close() const;

    /**
     * Executes the reader loop: reads lines and passes them to the listener until the stream ends
     * or fails, and then closes the connection. Exceptions aren't propagated.
     */
    void operator()() const;
};

} // namespace

namespace std {
    /// Hash code class function for a connection
    template<>
    struct hash<sockcast::Connection> {
        size_t operator()(const sockcast::Connection& conn) const {
            return conn.hash();
        }
    };
}

#endif /* MAIN_CAST_CONNECTION_H_ */
