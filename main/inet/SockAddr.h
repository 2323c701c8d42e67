/**
 * This file declares a socket address.
 *
 *  @file:  SockAddr.h
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

#ifndef MAIN_INET_SOCKADDR_H_
#define MAIN_INET_SOCKADDR_H_

#include <functional>
#include <iostream>
#include <memory>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>

namespace sockcast {

/// A socket address. Socket address comprise an Internet address and a port number.
class SockAddr
{
    class                 Impl;  ///< An implementation
    std::shared_ptr<Impl> pImpl; ///< Smart pointer to an implementation

public:
    /**
     * Default constructs. The resulting instance will test false.
     * @see operator bool()
     */
    SockAddr() noexcept;

    /**
     * Constructs from a generic socket address.
     *
     * @param[in] storage          Generic socket address
     * @throws    InvalidArgument  Address family isn't supported
     */
    explicit SockAddr(const struct sockaddr_storage& storage);

    /**
     * Constructs from a host and a port number. The host is resolved immediately; an IPv4 address
     * is preferred over an IPv6 one.
     *
     * @param[in] host             Hostname or IP address. The empty string is the IPv4 wildcard.
     * @param[in] port             Port number in host byte-order. `0` obtains a system-chosen
     *                             port number.
     * @throws    InvalidArgument  Host couldn't be resolved
     */
    SockAddr(
            const std::string& host,
            in_port_t          port);

    /**
     * Constructs from a socket string-specification.
     *
     * @param[in] spec  Socket specification. E.g.,
     *                    - host.name:38800
     *                    - 192.168.0.1:2400
     *                    - [fe80::20c:29ff:fe6b:3bda]:34084
     *                  The colon and port number specification is optional. If it's not specified,
     *                  then the port number is zero.
     * @throws    InvalidArgument  Invalid specification or host couldn't be resolved
     */
    explicit SockAddr(const std::string& spec);

    /**
     * Returns the wildcard socket address of an address family.
     *
     * @param[in] family  Address family: `AF_INET` or `AF_INET6`
     * @param[in] port    Port number in host byte-order
     * @return            Wildcard socket address
     * @throws    InvalidArgument  Unsupported address family
     */
    static SockAddr wildcard(
            const int       family,
            const in_port_t port);

    /**
     * Clones this instance and changes the port number.
     *
     * @param[in] port      New port number in host byte-order
     */
    SockAddr clone(in_port_t port) const;

    /**
     * Indicates if this instance is valid (i.e., wasn't default constructed).
     * @retval true     This instance is valid
     * @retval false    This instance is not valid
     */
    operator bool() const noexcept;

    /**
     * Returns the address family.
     * @return Address family: `AF_INET` or `AF_INET6`
     */
    int getFamily() const noexcept;

    /**
     * Returns the port number in host byte-order.
     *
     * @return  Port number in host byte-order
     */
    in_port_t getPort() const noexcept;

    /**
     * Indicates if the IP address is a multicast group.
     * @retval true     The IP address is a multicast group
     * @retval false    The IP address is not a multicast group
     */
    bool isMulticast() const noexcept;

    /**
     * Returns the string representation of this instance.
     *
     * @return String representation of this instance
     */
    std::string to_string() const noexcept;

    /**
     * Returns the hash value of this instance.
     *
     * @return The hash value of this instance
     */
    size_t hash() const noexcept;

    /**
     * Sets a socket address storage structure.
     *
     * @param[out] storage  The structure to be set
     * @return              Pointer to the structure
     */
    struct sockaddr* get_sockaddr(struct sockaddr_storage& storage) const;

    /**
     * Returns the length of the socket address structure.
     * @return Length of the socket address structure in bytes
     */
    socklen_t getSockLen() const noexcept;

    /**
     * Indicates if this instance is considered less than another.
     *
     * @param[in] rhs      The other instance
     * @retval    true     This instance is less than `rhs`
     * @retval    false    This instance is not less than `rhs`
     */
    bool operator <(const SockAddr& rhs) const noexcept;

    /**
     * Indicates if this instance is considered equal to another.
     *
     * @param[in] rhs      The other instance
     * @retval    true     This instance is equal to `rhs`
     * @retval    false    This instance is not equal to `rhs`
     */
    bool operator ==(const SockAddr& rhs) const noexcept;

    bool operator !=(const SockAddr& rhs) const noexcept {
        return !(*this == rhs);
    }

    /**
     * Binds a socket to this local socket address.
     *
     * @param[in] sd                 Socket descriptor
     * @throws    SystemError        Bind failure
     * @threadsafety                 Safe
     */
    void bind(const int sd) const;
};

std::ostream& operator<<(std::ostream& ostream, const SockAddr& addr);

} // namespace

namespace std {
    /// Hash code class function for a socket address
    template<>
    struct hash<sockcast::SockAddr> {
        /**
         * Returns the hash code of a socket address.
         * @param[in] sockAddr  The socket address
         * @return The hash code of the socket address
         */
        size_t operator()(const sockcast::SockAddr& sockAddr) const {
            return sockAddr.hash();
        }
    };
}

#endif /* MAIN_INET_SOCKADDR_H_ */
