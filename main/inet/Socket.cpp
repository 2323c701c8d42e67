/**
 * BSD sockets.
 *
 *        File: Socket.cpp
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

#include "error.h"
#include "logging.h"
#include "SockAddr.h"
#include "Socket.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace sockcast {

/// Base implementation of a socket
class Socket::Impl
{
    Impl()
        : mutex()
        , rmtSockAddr()
        , sd{-1}
        , shutdownCalled{false}
    {}

protected:
    mutable Mutex mutex;          ///< Mutex for maintaining consistency
    SockAddr      rmtSockAddr;    ///< Socket address of remote endpoint
    int           sd;             ///< Socket descriptor
    bool          shutdownCalled; ///< `shutdown()` has been called?

    /**
     * Constructs from an existing socket descriptor. Closes the socket descriptor on destruction.
     *
     * @param[in] sd        Socket descriptor
     */
    explicit Impl(const int sd)
        : Impl()
    {
        this->sd = sd;

        struct sockaddr_storage storage = {};
        socklen_t               socklen = sizeof(storage);

        if (::getpeername(sd, reinterpret_cast<struct sockaddr*>(&storage), &socklen) == 0)
            rmtSockAddr = SockAddr(storage);
    }

    /**
     * Constructs an unbound and unconnected socket of a given address family and type.
     *
     * @param[in] family    Address family (e.g., `AF_INET`, `AF_INET6`)
     * @param[in] type      Type of socket (e.g., `SOCK_STREAM`, `SOCK_DGRAM`)
     * @param[in] protocol  Socket protocol (e.g., `IPPROTO_TCP`, `IPPROTO_UDP`)
     * @throw SystemError   Couldn't create socket
     */
    Impl(   const int family,
            const int type,
            const int protocol)
        : Impl()
    {
        sd = ::socket(family, type, protocol);
        if (sd == -1)
            throw SYSTEM_ERROR("Couldn't create socket {family=" + std::to_string(family) +
                    ", type=" + std::to_string(type) + ", proto=" + std::to_string(protocol) + "}");
    }

    /**
     * Sets a boolean socket option.
     * @param[in] level        Protocol level (e.g., `SOL_SOCKET`)
     * @param[in] option       Option (e.g., `SO_REUSEADDR`)
     * @param[in] name         Name of the option for error messages
     * @throw     SystemError  `setsockopt()` failure
     */
    void enable(
            const int   level,
            const int   option,
            const char* name) {
        const int enable = 1;
        if (::setsockopt(sd, level, option, &enable, sizeof(enable)))
            throw SYSTEM_ERROR(String("Couldn't set ") + name + " on socket " +
                    std::to_string(sd));
    }

    /**
     * Idempotent.
     *
     * @pre                `mutex` is locked
     * @param[in] what     What to shut down. One of `SHUT_RD`, `SHUT_WR`, or
     *                     `SHUT_RDWR`.
     * @throw SystemError  Couldn't shutdown socket
     */
    void shut(const int what) {
        if (::shutdown(sd, what) && errno != ENOTCONN)
            throw SYSTEM_ERROR("::shutdown failure on socket " + std::to_string(sd));
        shutdownCalled = true;
    }

public:
    virtual ~Impl() noexcept {
        if (sd >= 0)
            ::close(sd);
    }

    /**
     * Returns the hash code of this instance.
     * @return The hash code of this instance
     */
    size_t hash() const noexcept {
        return std::hash<int>()(sd) ^ rmtSockAddr.hash();
    }

    /**
     * Indicates if this instance is less than another.
     * @param[in] rhs      The other, right-hand-side instance
     * @retval    true     This instance is less than the other
     * @retval    false    This instance is not less than the other
     */
    bool operator<(const Impl& rhs) const noexcept {
        return sd < rhs.sd;
    }

    /**
     * Returns the socket descriptor.
     *
     * @return Socket descriptor
     */
    int getSockDesc() const noexcept {
        return sd;
    }

    /**
     * Returns the socket address of the local endpoint.
     * @return The socket address of the local endpoint
     */
    SockAddr getLclAddr() const {
        struct sockaddr_storage storage = {};
        socklen_t               socklen = sizeof(storage);

        if (::getsockname(sd, reinterpret_cast<struct sockaddr*>(&storage), &socklen))
            throw SYSTEM_ERROR("getsockname() failure on socket " + std::to_string(sd));

        return SockAddr(storage);
    }

    /**
     * Returns the socket address of the remote endpoint.
     * @return The socket address of the remote endpoint
     */
    SockAddr getRmtAddr() const noexcept {
        return rmtSockAddr;
    }

    /**
     * Returns the string representation of this instance.
     * @return The string representation of this instance
     */
    virtual std::string to_string() const =0;

    /**
     * Shuts down the socket. Idempotent.
     *
     * @param what          What to shut down. One of `SHUT_RD`, `SHUT_WR`, or
     *                      `SHUT_RDWR`
     * @throws SystemError  Couldn't shutdown socket
     */
    virtual void shutdown(const int what) {
        Guard guard{mutex};
        shut(what);
    }

    /**
     * Indicates if this instance is shut down.
     * @retval true     This instance is shut down
     * @retval false    This instance is not shut down
     */
    bool isShutdown() const {
        Guard guard{mutex};
        return shutdownCalled;
    }
};

Socket::Socket(Impl* impl)
    : pImpl(impl)
{}

Socket::~Socket()
{}

Socket::operator bool() const noexcept {
    return static_cast<bool>(pImpl);
}

size_t Socket::hash() const noexcept {
    return pImpl ? pImpl->hash() : 0;
}

std::string Socket::to_string() const {
    return pImpl ? pImpl->to_string() : "<unset>";
}

bool Socket::operator<(const Socket& rhs) const noexcept {
    auto impl1 = pImpl.get();
    auto impl2 = rhs.pImpl.get();

    return (impl1 == impl2)
            ? false
            : (impl1 == nullptr || impl2 == nullptr)
                  ? (impl1 == nullptr)
                  : *impl1 < *impl2;
}

int Socket::getSockDesc() const {
    return pImpl->getSockDesc();
}

SockAddr Socket::getLclAddr() const {
    return pImpl->getLclAddr();
}

in_port_t Socket::getLclPort() const {
    return pImpl->getLclAddr().getPort();
}

SockAddr Socket::getRmtAddr() const noexcept {
    return pImpl ? pImpl->getRmtAddr() : SockAddr();
}

void Socket::shutdown(const int what) const
{
    if (pImpl)
        pImpl->shutdown(what);
}

bool Socket::isShutdown() const
{
    return pImpl ? pImpl->isShutdown() : true;
}

/******************************************************************************/

/// Implementation of a connected TCP socket
class TcpSock::Impl : public Socket::Impl
{
    static const size_t CHUNK = 4096; ///< Size of a single read

    String inBuf;        ///< Bytes read but not yet returned as a line
    size_t scanned;      ///< Number of leading bytes of `inBuf` known to have no newline
    size_t maxLine;      ///< Maximum length of a line. 0 => unlimited.
    bool   eof;          ///< End-of-stream was read?
    int    writeTimeout; ///< Write timeout in milliseconds. <0 => indefinite.

    /**
     * Reads the next chunk of bytes into the input buffer.
     *
     * @retval     true         Success
     * @retval     false        EOF or `shutdown()` called
     * @throw      SystemError  I/O failure
     */
    bool readChunk() {
        /*
         * Sending process closes connection => FIN sent => EOF
         * Sending process crashes => FIN sent => EOF
         * This end calls shutdown() => EOF
         */
        struct pollfd pollfd;
        pollfd.fd = sd;
        pollfd.events = POLLIN;

        for (;;) {
            if (::poll(&pollfd, 1, -1) == -1) { // -1 => indefinite timeout
                if (errno == EINTR)
                    continue;
                throw SYSTEM_ERROR("poll() failure on socket " + to_string());
            }
            if (pollfd.revents & (POLLIN | POLLHUP | POLLERR))
                break;
            if (pollfd.revents & POLLNVAL)
                return false;
        }

        char buf[CHUNK];
        auto nread = ::recv(sd, buf, sizeof(buf), 0);

        if (nread == -1) {
            if (errno == ECONNRESET || isShutdown())
                return false;
            throw SYSTEM_ERROR("Couldn't read from socket " + to_string());
        }
        if (nread == 0) {
            LOG_TRACE("EOF on socket %d", sd);
            return false; // EOF
        }

        inBuf.append(buf, nread);
        return true;
    }

public:
    /**
     * Constructs.
     * @param[in] sd  The underlying socket descriptor
     */
    explicit Impl(const int sd)
        : Socket::Impl(sd)
        , inBuf()
        , scanned(0)
        , maxLine(0)
        , eof(false)
        , writeTimeout(-1)
    {}

    /**
     * Constructs an unconnected socket.
     * @param[in] family  Address family: `AF_INET` or `AF_INET6`
     */
    Impl(   const int  family,
            const bool dummy)
        : Socket::Impl{family, SOCK_STREAM, IPPROTO_TCP}
        , inBuf()
        , scanned(0)
        , maxLine(0)
        , eof(false)
        , writeTimeout(-1)
    {}

    std::string to_string() const override
    {
        return "{sd=" + std::to_string(sd) + ", lcl=" + getLclAddr().to_string()
                + ", proto=TCP, rmt=" + getRmtAddr().to_string() + "}";
    }

    /**
     * Sets the Nagle algorithm.
     *
     * @param[in] enable             Whether or not to enable the Nagle
     *                               algorithm
     * @throws    std::system_error  `setsockopt()` failure
     */
    void setDelay(int enable)
    {
        enable = !enable; // TCP_NODELAY disables delay
        if (::setsockopt(sd, IPPROTO_TCP, TCP_NODELAY, &enable, sizeof(enable))) {
            throw SYSTEM_ERROR("Couldn't set TCP_NODELAY to " +
                    std::to_string(enable) + " on socket " + to_string());
        }
    }

    void setWriteTimeout(const Millis timeout) noexcept {
        writeTimeout = timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1;
    }

    void setMaxLine(const size_t maxLine) noexcept {
        this->maxLine = maxLine;
    }

    /**
     * Writes to the socket. Blocks until all bytes are written or the write timeout expires. The
     * timeout applies to the whole write.
     *
     * @param[in] data          Bytes to write
     * @param[in] nbytes        Number of bytes to write
     * @retval    false         Connection is closed
     * @retval    true          Success
     * @throws    RuntimeError  Timeout
     * @throws    SystemError   System error
     */
    bool write(const void* data,
               size_t      nbytes) {
        const char*   bytes = static_cast<const char*>(data);
        const auto    deadline = SteadyClock::now() + Millis(writeTimeout);
        struct pollfd pollfd;

        pollfd.fd = sd;
        pollfd.events = POLLOUT;

        while (nbytes) {
            /*
             * The send is non-blocking so that only poll(2) waits and a stalled peer can't hold
             * this thread beyond the deadline
             */
            auto nwritten = ::send(sd, bytes, nbytes, MSG_NOSIGNAL | MSG_DONTWAIT);

            if (nwritten > 0) {
                nbytes -= nwritten;
                bytes += nwritten;
                continue;
            }
            if (nwritten == 0)
                return false;
            if (errno == ECONNRESET || errno == EPIPE)
                return false;
            if (errno == EINTR)
                continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                throw SYSTEM_ERROR("send() failure on socket " + to_string());

            int timeout = -1;
            if (writeTimeout >= 0) {
                const auto left = std::chrono::duration_cast<Millis>(deadline -
                        SteadyClock::now()).count();
                if (left <= 0)
                    throw RUNTIME_ERROR("Write to socket " + to_string() + " timed-out after " +
                            std::to_string(writeTimeout) + " ms");
                timeout = static_cast<int>(left);
            }

            const int status = ::poll(&pollfd, 1, timeout);
            if (status == -1) {
                if (errno == EINTR)
                    continue;
                throw SYSTEM_ERROR("poll() failure for socket " + to_string());
            }
            if (status == 0)
                throw RUNTIME_ERROR("Write to socket " + to_string() + " timed-out after " +
                        std::to_string(writeTimeout) + " ms");
            if (pollfd.revents & (POLLHUP | POLLNVAL))
                return false;
        }

        return true;
    }

    bool writeLine(const String& line) {
        const String record = line + '\n';
        return write(record.data(), record.size());
    }

    bool readLine(String& line) {
        for (;;) {
            auto pos = inBuf.find('\n', scanned);

            if (pos != inBuf.npos) {
                line = inBuf.substr(0, pos);
                inBuf.erase(0, pos + 1);
                scanned = 0;
                break;
            }
            scanned = inBuf.size();

            if (maxLine && scanned > maxLine)
                throw STREAM_FAULT("Line from socket " + to_string() + " is longer than " +
                        std::to_string(maxLine) + " bytes");

            if (eof || !readChunk()) {
                eof = true;
                if (inBuf.empty())
                    return false;
                line = inBuf; // Unterminated final line
                inBuf.clear();
                scanned = 0;
                break;
            }
        }

        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        return true;
    }
};

TcpSock::TcpSock(Impl* impl)
    : Socket(impl) {
}

TcpSock::~TcpSock() {
}

const TcpSock& TcpSock::setDelay(bool enable) const {
    static_cast<TcpSock::Impl*>(pImpl.get())->setDelay(enable);
    return *this;
}

const TcpSock& TcpSock::setWriteTimeout(const Millis timeout) const {
    static_cast<TcpSock::Impl*>(pImpl.get())->setWriteTimeout(timeout);
    return *this;
}

const TcpSock& TcpSock::setMaxLine(const size_t maxLine) const {
    static_cast<TcpSock::Impl*>(pImpl.get())->setMaxLine(maxLine);
    return *this;
}

bool TcpSock::write(
        const void*  data,
        const size_t nbytes) const {
    return static_cast<TcpSock::Impl*>(pImpl.get())->write(data, nbytes);
}

bool TcpSock::writeLine(const String& line) const {
    return static_cast<TcpSock::Impl*>(pImpl.get())->writeLine(line);
}

bool TcpSock::readLine(String& line) const {
    return static_cast<TcpSock::Impl*>(pImpl.get())->readLine(line);
}

/******************************************************************************/

/// Implementation of a listening TCP socket
class TcpSrvrSock::Impl final : public Socket::Impl
{
    int queueSize; ///< Size of the listen(2) queue

public:
    /**
     * Constructs. Calls listen() on the created socket.
     *
     * @param[in] lclSockAddr   Server's local socket address
     * @param[in] queueSize     Size of listening queue
     * @throws    SystemError   Couldn't create socket
     * @throws    SystemError   Couldn't set SO_REUSEADDR on socket
     * @throws    SystemError   Couldn't bind socket to `sockAddr`
     * @throws    SystemError   Couldn't listen on socket
     */
    Impl(   const SockAddr lclSockAddr,
            const int      queueSize)
        : Socket::Impl{lclSockAddr.getFamily(), SOCK_STREAM, IPPROTO_TCP}
        , queueSize(queueSize)
    {
        enable(SOL_SOCKET, SO_REUSEADDR, "SO_REUSEADDR");

        lclSockAddr.bind(sd);

        if (::listen(sd, queueSize))
            throw SYSTEM_ERROR("listen() failure on socket " + to_string() + ", queueSize=" +
                    std::to_string(queueSize));
    }

    std::string to_string() const override
    {
        return "{sd=" + std::to_string(sd) + ", lcl=" + getLclAddr().to_string() + ", proto=TCP"
                ", queueSize=" + std::to_string(queueSize) + "}";
    }

    /**
     * Accepts the next, incoming connection.
     *
     * @retval  `nullptr`    Socket was shut down
     * @return               The accepted socket
     * @throws  SystemError  Couldn't accept the connection
     */
    TcpSock::Impl* accept() {
        for (;;) {
            const int fd = ::accept(sd, nullptr, nullptr);

            if (fd != -1)
                return new TcpSock::Impl(fd);

            {
                Guard guard{mutex};
                if (shutdownCalled)
                    return nullptr;
            }

            if (errno != EINTR && errno != ECONNABORTED)
                throw SYSTEM_ERROR("accept() failure on socket " + to_string());
        }
    }
};

TcpSrvrSock::TcpSrvrSock(
        const SockAddr sockAddr,
        const int      queueSize)
    : Socket(new Impl(sockAddr, queueSize)) {
}

TcpSock TcpSrvrSock::accept() const {
    auto impl = static_cast<TcpSrvrSock::Impl*>(pImpl.get())->accept();
    return impl ? TcpSock{impl} : TcpSock{};
}

/******************************************************************************/

/// Implementation of a client-side TCP socket
class TcpClntSock::Impl final : public TcpSock::Impl
{
public:
    /**
     * Constructs. Attempts to connect to a remote server.
     *
     * @param[in] srvrAddr         Address of remote server
     * @throw     LogicError       Destination port number is zero
     * @throw     RuntimeError     Couldn't connect to remote server at this time
     * @throw     SystemError      System failure
     */
    Impl(const SockAddr srvrAddr)
        : TcpSock::Impl(srvrAddr.getFamily(), true)
    {
        if (srvrAddr.getPort() == 0)
            throw LOGIC_ERROR("Port number of " + srvrAddr.to_string() + " is zero");

        enable(SOL_SOCKET, SO_REUSEADDR, "SO_REUSEADDR");

        struct sockaddr_storage storage;
        if (::connect(sd, srvrAddr.get_sockaddr(storage), srvrAddr.getSockLen())) {
            if (errno == EADDRNOTAVAIL || errno == ECONNREFUSED || errno == ENETUNREACH ||
                    errno == ETIMEDOUT || errno == ECONNRESET || errno == EHOSTUNREACH ||
                    errno == ENETDOWN)
                throw RUNTIME_ERROR("Couldn't connect socket " + std::to_string(sd) + " to " +
                        srvrAddr.to_string() + ": " + ::strerror(errno));
            throw SYSTEM_ERROR("connect() failure to " + srvrAddr.to_string());
        }

        rmtSockAddr = srvrAddr;
        LOG_DEBUG("Connected socket %s", to_string().data());
    }
};

TcpClntSock::TcpClntSock(const SockAddr srvrAddr)
    : TcpSock(new Impl(srvrAddr))
{}

/******************************************************************************/

/// Implementation of a multicast UDP socket
class McastSock::Impl final : public Socket::Impl
{
    static const size_t MAX_PAYLOAD = 65535; ///< Size of the receive buffer

    SockAddr       groupAddr; ///< Socket address of the multicast group
    struct ip_mreq mreq;      ///< Membership request
    bool           joined;    ///< Member of the group?

    /**
     * Decodes an IPv4 interface address.
     * @param[in]  iface            Dotted-quad address. Empty => any.
     * @param[out] addr             IPv4 address
     * @throw      InvalidArgument  Not an IPv4 address
     */
    static void decodeIface(
            const String&   iface,
            struct in_addr& addr) {
        if (iface.empty()) {
            addr.s_addr = htonl(INADDR_ANY);
        }
        else if (::inet_pton(AF_INET, iface.data(), &addr) != 1) {
            throw INVALID_ARGUMENT("Invalid IPv4 interface address: \"" + iface + "\"");
        }
    }

    /**
     * Leaves the group.
     * @pre `mutex` is locked
     */
    void drop() {
        if (joined) {
            if (::setsockopt(sd, IPPROTO_IP, IP_DROP_MEMBERSHIP, &mreq, sizeof(mreq)))
                LOG_SYSERR("Couldn't leave multicast group %s", groupAddr.to_string().data());
            joined = false;
        }
    }

public:
    /**
     * Constructs a UDP socket that sends to and receives from a multicast group.
     *
     * @param[in] groupAddr        Socket address of multicast group
     * @param[in] iface            IPv4 address of interface to use. Empty => system chooses.
     * @param[in] ttl              Time-to-live of outgoing datagrams
     * @throw     InvalidArgument  Invalid group or interface address
     * @throw     SystemError      System failure
     */
    Impl(   const SockAddr groupAddr,
            const String&  iface,
            const int      ttl)
        : Socket::Impl(AF_INET, SOCK_DGRAM, IPPROTO_UDP)
        , groupAddr(groupAddr)
        , mreq()
        , joined(false)
    {
        if (groupAddr.getFamily() != AF_INET || !groupAddr.isMulticast())
            throw INVALID_ARGUMENT("Address " + groupAddr.to_string() +
                    " isn't an IPv4 multicast group");

        enable(SOL_SOCKET, SO_REUSEADDR, "SO_REUSEADDR");
#ifdef SO_REUSEPORT
        enable(SOL_SOCKET, SO_REUSEPORT, "SO_REUSEPORT");
#endif

        SockAddr::wildcard(AF_INET, groupAddr.getPort()).bind(sd);

        struct sockaddr_storage storage;
        mreq.imr_multiaddr = reinterpret_cast<struct sockaddr_in*>(
                groupAddr.get_sockaddr(storage))->sin_addr;
        decodeIface(iface, mreq.imr_interface);

        if (::setsockopt(sd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)))
            throw SYSTEM_ERROR("Couldn't join socket " + std::to_string(sd) +
                    " to multicast group " + groupAddr.to_string() + " on interface " +
                    (iface.empty() ? String("*") : iface));
        joined = true;

        if (!iface.empty() && ::setsockopt(sd, IPPROTO_IP, IP_MULTICAST_IF, &mreq.imr_interface,
                sizeof(mreq.imr_interface)))
            throw SYSTEM_ERROR("Couldn't set multicast interface of socket " +
                    std::to_string(sd) + " to " + iface);

        const unsigned char loop = 1;
        if (::setsockopt(sd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)))
            throw SYSTEM_ERROR("Couldn't enable local loopback of multicast on socket " +
                    std::to_string(sd));

        const unsigned char hops = static_cast<unsigned char>(ttl);
        if (::setsockopt(sd, IPPROTO_IP, IP_MULTICAST_TTL, &hops, sizeof(hops)))
            throw SYSTEM_ERROR("Couldn't set time-to-live for multicast packets");

        rmtSockAddr = groupAddr;

        LOG_DEBUG("Joined socket %d to multicast group %s", sd, groupAddr.to_string().data());
    }

    std::string to_string() const override {
        return "{sd=" + std::to_string(sd) + ", lcl=" + getLclAddr().to_string()
                + ", proto=UDP, group=" + groupAddr.to_string() + "}";
    }

    void send(const String& payload) const {
        struct sockaddr_storage storage;
        const auto nbytes = ::sendto(sd, payload.data(), payload.size(), 0,
                groupAddr.get_sockaddr(storage), groupAddr.getSockLen());

        if (nbytes == -1)
            throw SYSTEM_ERROR("Couldn't send " + std::to_string(payload.size()) +
                    "-byte datagram to " + groupAddr.to_string());
    }

    bool recv(
            String&      payload,
            const size_t maxSize) {
        struct pollfd pollfd;
        pollfd.fd = sd;
        pollfd.events = POLLIN;

        for (;;) {
            if (::poll(&pollfd, 1, -1) == -1) { // -1 => indefinite wait
                if (errno == EINTR)
                    continue;
                throw SYSTEM_ERROR("::poll() failure on socket " + to_string());
            }
            break;
        }

        if (isShutdown() || (pollfd.revents & (POLLHUP | POLLNVAL)))
            return false;

        char       buf[MAX_PAYLOAD];
        const auto nbytes = ::recv(sd, buf, sizeof(buf), MSG_TRUNC);

        if (nbytes < 0) {
            if (isShutdown())
                return false;
            throw SYSTEM_ERROR("Couldn't read from socket " + to_string());
        }

        if (static_cast<size_t>(nbytes) > maxSize)
            throw OVERSIZE_ERROR("Datagram from group " + groupAddr.to_string() + " has " +
                    std::to_string(nbytes) + " bytes; maximum is " + std::to_string(maxSize),
                    nbytes);

        payload.assign(buf, nbytes);
        return true;
    }

    void shutdown(const int what) override {
        Guard guard{mutex};
        drop();
        shut(what);
    }
};

McastSock::McastSock(
        const SockAddr groupAddr,
        const String&  iface,
        const int      ttl)
    : Socket(new Impl(groupAddr, iface, ttl))
{}

void McastSock::send(const String& payload) const {
    static_cast<McastSock::Impl*>(pImpl.get())->send(payload);
}

bool McastSock::recv(
        String&      payload,
        const size_t maxSize) const {
    return static_cast<McastSock::Impl*>(pImpl.get())->recv(payload, maxSize);
}

void McastSock::leave() const {
    shutdown(SHUT_RDWR);
}

} // namespace
