/**
 * BSD sockets.
 *
 *        File: Socket.h
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

#ifndef MAIN_INET_SOCKET_H_
#define MAIN_INET_SOCKET_H_

#include "CommonTypes.h"
#include "SockAddr.h"

#include <cstddef>
#include <memory>
#include <sys/socket.h>

namespace sockcast {

/// A socket
class Socket
{
public:
    class Impl;

protected:
    std::shared_ptr<Impl> pImpl;

    Socket(Impl* impl);

public:
    Socket() =default;

    virtual ~Socket();

    /**
     * Indicates if this instance is valid (i.e., not default constructed).
     * @retval true     This instance is valid
     * @retval false    This instance is not valid
     */
    operator bool() const noexcept;

    /**
     * Returns the hash code of this instance.
     * @return The hash code of this instance
     */
    size_t hash() const noexcept;

    /**
     * Returns the string representation of this instance.
     * @return The string representation of this instance
     */
    std::string to_string() const;

    /**
     * Indicates if this instance is less than another.
     * @param[in] rhs      The other, right-hand-side instance
     * @retval    true     This instance is less than the other
     * @retval    false    This instance is not less than the other
     */
    bool operator<(const Socket& rhs) const noexcept;

    /**
     * Indicates if this instance is the same socket as another.
     * @param[in] rhs      The other, right-hand-side instance
     * @retval    true     This instance is the same socket as the other
     * @retval    false    This instance is not the same socket as the other
     */
    bool operator==(const Socket& rhs) const noexcept {
        return pImpl == rhs.pImpl;
    }

    /**
     * Returns the socket descriptor.
     * @return The socket descriptor
     */
    int getSockDesc() const;

    /**
     * Returns the socket address of the local endpoint.
     * @return The socket address of the local endpoint
     * @throw  SystemError  `getsockname()` failure
     */
    SockAddr getLclAddr() const;

    /**
     * Returns the port number of the local endpoint.
     * @return The port number of the local endpoint in host byte-order
     * @throw  SystemError  `getsockname()` failure
     */
    in_port_t getLclPort() const;

    /**
     * Returns the socket address of the remote endpoint.
     * @return The socket address of the remote endpoint. Will test false if there isn't one.
     */
    SockAddr getRmtAddr() const noexcept;

    /**
     * Shuts down the socket. Blocking reads will return false and `accept()` will return an
     * invalid socket. Idempotent.
     *
     * @param what          What to shut down. One of `SHUT_RD`, `SHUT_WR`, or `SHUT_RDWR`.
     * @throws SystemError  Couldn't shutdown socket
     */
    void shutdown(const int what = SHUT_RDWR) const;

    /**
     * Indicates if `shutdown()` has been called.
     * @retval true     `shutdown()` has been called
     * @retval false    `shutdown()` has not been called
     */
    bool isShutdown() const;
};

/******************************************************************************/

/// A connected TCP socket that exchanges newline-delimited lines of text
class TcpSock : public Socket
{
public:
    class Impl;

protected:
    friend class TcpSrvrSock;

    TcpSock(Impl* impl);

public:
    TcpSock() =default;

    ~TcpSock();

    /**
     * Sets the Nagle algorithm.
     *
     * @param[in] enable        Whether or not to delay sending in order to coalesce data
     * @return                  This instance
     * @throws    SystemError   `setsockopt()` failure
     */
    const TcpSock& setDelay(bool enable) const;

    /**
     * Sets the maximum amount of time that a write may wait for the remote peer.
     *
     * @param[in] timeout       Timeout. Non-positive means indefinite.
     * @return                  This instance
     */
    const TcpSock& setWriteTimeout(const Millis timeout) const;

    /**
     * Sets the maximum length of a line that `readLine()` will accept.
     *
     * @param[in] maxLine  Maximum number of bytes in a line, excluding the terminator. 0 means
     *                     unlimited.
     * @return             This instance
     */
    const TcpSock& setMaxLine(const size_t maxLine) const;

    /**
     * Writes bytes.
     *
     * @param[in] data          Bytes to write
     * @param[in] nbytes        Number of bytes to write
     * @retval    true          Success
     * @retval    false         Lost connection
     * @throw     RuntimeError  The write timeout expired before every byte was written
     * @throw     SystemError   I/O failure
     */
    bool write(const void*  data,
               const size_t nbytes) const;

    /**
     * Writes a line. A newline is appended.
     *
     * @param[in] line          Line to write. Shouldn't contain a newline.
     * @retval    true          Success
     * @retval    false         Lost connection
     * @throw     RuntimeError  Write timed-out
     * @throw     SystemError   I/O failure
     */
    bool writeLine(const String& line) const;

    /**
     * Reads the next line. The line terminator (`\n` or `\r\n`) isn't returned. A final,
     * unterminated line before end-of-stream is returned as a line.
     *
     * @param[out] line         Line
     * @retval     true         Success
     * @retval     false        End-of-stream or `shutdown()` called
     * @throw      StreamFault  The line is longer than the maximum
     * @throw      SystemError  I/O failure
     */
    bool readLine(String& line) const;
};

/******************************************************************************/

/// A listening TCP socket
class TcpSrvrSock final : public Socket
{
    class Impl;

public:
    TcpSrvrSock() =default;

    /**
     * Constructs. Sets SO_REUSEADDR, binds, and calls `listen()`.
     *
     * @param[in] lclSockAddr   Server's local socket address. The IP address may be the wildcard.
     *                          The port number may be zero, in which case it will be chosen by the
     *                          operating system.
     * @param[in] queueSize     Size of listening queue
     * @throws    SystemError   Couldn't create, configure, bind, or listen on the socket
     */
    TcpSrvrSock(
            const SockAddr lclSockAddr,
            const int      queueSize = 8);

    /**
     * Accepts the next incoming connection.
     *
     * @return                  The accepted socket. Will test false if `shutdown()` was called.
     * @throws  SystemError     Couldn't accept the connection
     */
    TcpSock accept() const;
};

/******************************************************************************/

/// A client-side TCP socket
class TcpClntSock final : public TcpSock
{
    class Impl;

public:
    TcpClntSock() =default;

    /**
     * Constructs. Sets SO_REUSEADDR and connects to a remote server.
     *
     * @param[in] srvrAddr      Address of remote server
     * @throw     LogicError    Destination port number is zero
     * @throw     RuntimeError  Couldn't connect to remote server at this time
     * @throw     SystemError   System failure
     */
    explicit TcpClntSock(const SockAddr srvrAddr);
};

/******************************************************************************/

/// A UDP socket that is a member of an IPv4 multicast group
class McastSock final : public Socket
{
    class Impl;

public:
    McastSock() =default;

    /**
     * Constructs. Binds to the group's port on all interfaces and joins the group.
     *
     * @param[in] groupAddr        Socket address of the multicast group
     * @param[in] iface            IPv4 address of the interface to use. Empty means the system
     *                             chooses.
     * @param[in] ttl              Time-to-live of outgoing datagrams
     * @throw     InvalidArgument  `groupAddr` isn't an IPv4 multicast address
     * @throw     InvalidArgument  `iface` isn't an IPv4 address
     * @throw     SystemError      Couldn't create, configure, bind, or join the socket
     */
    McastSock(
            const SockAddr groupAddr,
            const String&  iface = "",
            const int      ttl = 1);

    /**
     * Sends a datagram to the group.
     *
     * @param[in] payload       Datagram payload
     * @throw     SystemError   I/O failure
     */
    void send(const String& payload) const;

    /**
     * Receives the next datagram.
     *
     * @param[out] payload       Datagram payload
     * @param[in]  maxSize       Maximum payload size in bytes
     * @retval     true          Success
     * @retval     false         `shutdown()` was called
     * @throw OversizeMessageError  Datagram is larger than `maxSize`. It's discarded.
     * @throw SystemError        I/O failure
     */
    bool recv(
            String&      payload,
            const size_t maxSize) const;

    /**
     * Leaves the group and shuts down the socket. Idempotent.
     *
     * @throw SystemError  Couldn't shut down the socket
     */
    void leave() const;
};

} // namespace

#endif /* MAIN_INET_SOCKET_H_ */
