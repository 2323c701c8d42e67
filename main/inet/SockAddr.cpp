/**
 * This file implements a socket address.
 *
 *  @file:  SockAddr.cpp
 *
 *    Copyright 2023 University Corporation for Atmospheric Research
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you may not
 * use this file except in compliance with the License. You may obtain a copy of
 * the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
 * WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
 * License for the specific language governing permissions and limitations under
 * the License.
 */

#include "CommonTypes.h"
#include "error.h"
#include "logging.h"
#include "SockAddr.h"

#include <arpa/inet.h>
#include <cstdio>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>

namespace sockcast {

/// Implementation of a socket address
class SockAddr::Impl
{
    struct sockaddr_storage storage; ///< Socket address in network byte-order

    /**
     * Returns the bytes of the IP address.
     * @param[out] len  Number of bytes
     * @return          Pointer to the bytes
     */
    const void* getAddrBytes(size_t& len) const noexcept {
        if (storage.ss_family == AF_INET) {
            auto addr = reinterpret_cast<const struct sockaddr_in*>(&storage);
            len = sizeof(addr->sin_addr);
            return &addr->sin_addr;
        }
        auto addr = reinterpret_cast<const struct sockaddr_in6*>(&storage);
        len = sizeof(addr->sin6_addr);
        return &addr->sin6_addr;
    }

public:
    /**
     * Constructs.
     * @param[in] storage          Socket address
     * @throw     InvalidArgument  Unsupported address family
     */
    Impl(const struct sockaddr_storage& storage)
        : storage(storage)
    {
        if (storage.ss_family != AF_INET && storage.ss_family != AF_INET6)
            throw INVALID_ARGUMENT("Unsupported address family: " +
                    std::to_string(storage.ss_family));
    }

    int getFamily() const noexcept {
        return storage.ss_family;
    }

    socklen_t getSockLen() const noexcept {
        return (storage.ss_family == AF_INET)
                ? sizeof(struct sockaddr_in)
                : sizeof(struct sockaddr_in6);
    }

    /**
     * Returns the port number.
     * @return The port number in host byte-order
     */
    in_port_t getPort() const noexcept {
        return (storage.ss_family == AF_INET)
                ? ntohs(reinterpret_cast<const struct sockaddr_in*>(&storage)->sin_port)
                : ntohs(reinterpret_cast<const struct sockaddr_in6*>(&storage)->sin6_port);
    }

    /**
     * Sets the port number.
     * @param[in] port  The port number in host byte-order
     */
    void setPort(const in_port_t port) noexcept {
        if (storage.ss_family == AF_INET) {
            reinterpret_cast<struct sockaddr_in*>(&storage)->sin_port = htons(port);
        }
        else {
            reinterpret_cast<struct sockaddr_in6*>(&storage)->sin6_port = htons(port);
        }
    }

    bool isMulticast() const noexcept {
        if (storage.ss_family == AF_INET)
            return IN_MULTICAST(ntohl(
                    reinterpret_cast<const struct sockaddr_in*>(&storage)->sin_addr.s_addr));
        return IN6_IS_ADDR_MULTICAST(
                &reinterpret_cast<const struct sockaddr_in6*>(&storage)->sin6_addr);
    }

    /**
     * Returns the string representation of this instance.
     * @return              The string representation of this instance
     */
    std::string to_string() const noexcept
    {
        char   buf[INET6_ADDRSTRLEN];
        size_t len;

        if (::inet_ntop(storage.ss_family, getAddrBytes(len), buf, sizeof(buf)) == nullptr)
            return "<invalid>";

        return (storage.ss_family == AF_INET6)
                ? "[" + std::string(buf) + "]:" + std::to_string(getPort())
                : std::string(buf) + ":" + std::to_string(getPort());
    }

    /**
     * Indicates if this instance is less than another.
     * @param[in] rhs      The other, right-hand-side instance
     * @retval    true     This instance is less than the other
     * @retval    false    This instance is not less than the other
     */
    bool operator<(const Impl& rhs) const noexcept {
        if (storage.ss_family != rhs.storage.ss_family)
            return storage.ss_family < rhs.storage.ss_family;

        size_t len;
        const void* lhsBytes = getAddrBytes(len);
        const void* rhsBytes = rhs.getAddrBytes(len);
        const int   cmp = ::memcmp(lhsBytes, rhsBytes, len);

        return (cmp < 0)
                ? true
                : (cmp > 0)
                  ? false
                  : (getPort() < rhs.getPort());
    }

    bool operator==(const Impl& rhs) const noexcept {
        return !(*this < rhs) && !(rhs < *this);
    }

    /**
     * Returns the hash value of this instance.
     *
     * @return The hash value of this instance
     */
    size_t hash() const noexcept {
        size_t len;
        auto   bytes = static_cast<const char*>(getAddrBytes(len));
        return std::hash<std::string>()(std::string(bytes, len)) ^
                std::hash<in_port_t>()(getPort());
    }

    /**
     * Sets and returns a socket address structure.
     * @param[out] storage  Storage for the socket address
     * @return              Pointer to `storage` as a socket address structure
     */
    struct sockaddr* get_sockaddr(struct sockaddr_storage& storage) const
    {
        storage = this->storage;
        return reinterpret_cast<struct sockaddr*>(&storage);
    }

    /**
     * Binds a socket to a local socket address. Address is server's listening address or incoming
     * multicast destination address.
     *
     * @param[in] sd                 Socket descriptor
     * @throws    SystemError        Bind failure
     * @threadsafety                 Safe
     */
    void bind(const int sd) const
    {
        if (::bind(sd, reinterpret_cast<const struct sockaddr*>(&storage), getSockLen()))
            throw SYSTEM_ERROR("Couldn't bind socket " + std::to_string(sd) + " to " + to_string());
    }
};

/******************************************************************************/

/**
 * Resolves a host into a socket address. An IPv4 address is preferred.
 * @param[in]  host            Hostname or IP address
 * @param[in]  port            Port number in host byte-order
 * @param[out] storage         Socket address
 * @throw      InvalidArgument  Couldn't resolve host
 */
static void resolve(
        const std::string&       host,
        const in_port_t          port,
        struct sockaddr_storage& storage)
{
    struct addrinfo  hints = {};
    struct addrinfo* list;

    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const int status = ::getaddrinfo(host.data(), nullptr, &hints, &list);
    if (status)
        throw INVALID_ARGUMENT("Couldn't resolve \"" + host + "\": " + ::gai_strerror(status));

    const struct addrinfo* chosen = nullptr;
    for (auto entry = list; entry; entry = entry->ai_next) {
        if (entry->ai_family == AF_INET) {
            chosen = entry;
            break;
        }
        if (entry->ai_family == AF_INET6 && chosen == nullptr)
            chosen = entry;
    }

    if (chosen == nullptr) {
        ::freeaddrinfo(list);
        throw INVALID_ARGUMENT("No IP address for \"" + host + "\"");
    }

    storage = {};
    ::memcpy(&storage, chosen->ai_addr, chosen->ai_addrlen);
    ::freeaddrinfo(list);

    if (storage.ss_family == AF_INET) {
        reinterpret_cast<struct sockaddr_in*>(&storage)->sin_port = htons(port);
    }
    else {
        reinterpret_cast<struct sockaddr_in6*>(&storage)->sin6_port = htons(port);
    }
}

/**
 * Splits a socket specification into Internet and port number specifications
 * @param[in]  spec        Socket specification with optional port number
 * @param[out] inet        Internet specification with no brackets
 * @param[out] port        Port number specification. Empty if not specified.
 * @throw InvalidArgument  Not a socket specification
 */
static void splitSpec(
        const String& spec,
        String&       inet,
        String&       port)
{
    bool success = false;
    auto colonPos = spec.rfind(':');

    if (colonPos == spec.npos) {
        port.clear();
        inet = spec;
        success = true;
    }
    else if (colonPos) {
        if (spec[colonPos-1] == ']') {
            if (spec[0] == '[') {
                inet = spec.substr(1, colonPos-2);
                port = spec.substr(colonPos+1);
                success = true;
            }
        }
        else if (spec.find(':') == colonPos){
            inet = spec.substr(0, colonPos);
            port = spec.substr(colonPos+1);
            success = true;
        }
        else {
            // Bracketless IPv6 address without a port number
            inet = spec;
            port.clear();
            success = true;
        }
    }

    if (!success || inet.empty())
        throw INVALID_ARGUMENT("Invalid socket specification: \"" + spec + "\"");
}

static in_port_t decodePort(const String& portSpec)
{
    unsigned long long port;
    char               extra;
    static const in_port_t MAX_PORT = ~0;

    if (::sscanf(portSpec.data(), "%llu%c" , &port, &extra) != 1 || port > MAX_PORT)
        throw INVALID_ARGUMENT("Invalid port specification: \"" + portSpec + "\"");

    return port;
}

SockAddr::SockAddr() noexcept
    : pImpl()
{}

SockAddr::SockAddr(const struct sockaddr_storage& storage)
    : pImpl(new Impl(storage))
{}

SockAddr::SockAddr(
        const std::string& host,
        const in_port_t    port)
    : pImpl()
{
    struct sockaddr_storage storage;

    if (host.empty()) {
        *this = wildcard(AF_INET, port);
    }
    else {
        resolve(host, port, storage);
        pImpl.reset(new Impl(storage));
    }
}

SockAddr::SockAddr(const std::string& spec)
    : SockAddr()
{
    String inetSpec;
    String portSpec;

    splitSpec(spec, inetSpec, portSpec);

    *this = SockAddr(inetSpec, portSpec.empty() ? 0 : decodePort(portSpec));
}

SockAddr SockAddr::wildcard(
        const int       family,
        const in_port_t port)
{
    struct sockaddr_storage storage = {};

    if (family == AF_INET) {
        auto addr = reinterpret_cast<struct sockaddr_in*>(&storage);
        addr->sin_family = AF_INET;
        addr->sin_addr.s_addr = htonl(INADDR_ANY);
        addr->sin_port = htons(port);
    }
    else if (family == AF_INET6) {
        auto addr = reinterpret_cast<struct sockaddr_in6*>(&storage);
        addr->sin6_family = AF_INET6;
        addr->sin6_addr = in6addr_any;
        addr->sin6_port = htons(port);
    }
    else {
        throw INVALID_ARGUMENT("Unsupported address family: " + std::to_string(family));
    }

    return SockAddr(storage);
}

SockAddr SockAddr::clone(const in_port_t port) const
{
    struct sockaddr_storage storage;
    Impl impl{*pImpl};
    impl.setPort(port);
    return SockAddr(*reinterpret_cast<struct sockaddr_storage*>(impl.get_sockaddr(storage)));
}

SockAddr::operator bool() const noexcept
{
    return static_cast<bool>(pImpl);
}

int SockAddr::getFamily() const noexcept
{
    return pImpl ? pImpl->getFamily() : AF_UNSPEC;
}

in_port_t SockAddr::getPort() const noexcept
{
    return pImpl ? pImpl->getPort() : 0;
}

bool SockAddr::isMulticast() const noexcept
{
    return pImpl && pImpl->isMulticast();
}

bool SockAddr::operator<(const SockAddr& rhs) const noexcept
{
    auto impl1 = pImpl.get();
    auto impl2 = rhs.pImpl.get();
    return (impl1 == impl2)
            ? false
            : (impl1 == nullptr || impl2 == nullptr)
                ? (impl1 == nullptr)
                : *impl1 < *impl2;
}

bool SockAddr::operator==(const SockAddr& rhs) const noexcept
{
    auto impl1 = pImpl.get();
    auto impl2 = rhs.pImpl.get();
    return (impl1 == impl2)
            ? true
            : (impl1 == nullptr || impl2 == nullptr)
                ? false
                : *impl1 == *impl2;
}

size_t SockAddr::hash() const noexcept
{
    return pImpl ? pImpl->hash() : 0;
}

std::string SockAddr::to_string() const noexcept
{
    return pImpl ? pImpl->to_string() : "<unset>";
}

struct sockaddr* SockAddr::get_sockaddr(struct sockaddr_storage& storage) const
{
    if (!pImpl)
        throw LOGIC_ERROR("Socket address is unset");
    return pImpl->get_sockaddr(storage);
}

socklen_t SockAddr::getSockLen() const noexcept
{
    return pImpl ? pImpl->getSockLen() : 0;
}

void SockAddr::bind(const int sd) const
{
    if (!pImpl)
        throw LOGIC_ERROR("Socket address is unset");
    pImpl->bind(sd);
}

/**
 * Writes a socket address to an output stream.
 * @param[in] ostream  The output stream
 * @param[in] addr     The socket address
 * @return             A reference to the output stream
 */
std::ostream& operator<<(std::ostream& ostream, const SockAddr& addr) {
    return ostream << addr.to_string();
}

} // namespace
