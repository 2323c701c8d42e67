/**
 * Connection to an IPv4 multicast group.
 *
 *        File: McastConn.cpp
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
#include "McastConn.h"
#include "Socket.h"

#include <atomic>

namespace sockcast {

/// Implementation of a multicast connection
class McastConn::Impl
{
    const Config      config;    ///< Configuration
    Listener&         listener;  ///< Receiver of datagrams and status changes
    mutable Mutex     mutex;      ///< Protects `sock`, `groupAddr`, `joinCalled`, and `joined`
    McastSock         sock;       ///< Multicast socket
    SockAddr          groupAddr;  ///< Socket address of the group
    bool              joinCalled; ///< `join()` has been called?
    bool              joined;     ///< Group has been joined?
    std::atomic<bool> closed;    ///< Connection is closed?
    Thread            reader;    ///< Reader thread

    McastSock getSock() const {
        Guard guard{mutex};
        if (!joined)
            throw LOGIC_ERROR("Group " + config.group + " hasn't been joined");
        return sock;
    }

    /**
     * Passes received datagrams to the listener until the connection closes or fails.
     */
    void read() {
        try {
            String msg;
            for (;;) {
                try {
                    if (!receive(msg))
                        break; // Closed
                }
                catch (const OversizeMessageError& ex) {
                    LOG_DIAG(config.debug, DebugFlags::EXCEPTIONS, ex, "Dropped datagram");
                    continue;
                }
                LOG_DIAG(config.debug, DebugFlags::RECV, "recv> %s", msg.data());
                listener.onMessage(msg);
            }
        }
        catch (const std::exception& ex) {
            LOG_DIAG(config.debug, DebugFlags::EXCEPTIONS, ex, "Reader of group %s failed",
                    to_string().data());
        }

        try {
            close();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(ex, "Couldn't close connection to group %s", to_string().data());
        }
    }

public:
    Impl(   const Config& config,
            Listener&     listener)
        : config(config)
        , listener(listener)
        , mutex()
        , sock()
        , groupAddr()
        , joinCalled(false)
        , joined(false)
        , closed(false)
        , reader()
    {}

    ~Impl() noexcept {
        try {
            close();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(ex, "Couldn't close connection to group %s", to_string().data());
        }

        if (reader.joinable()) {
            if (reader.get_id() == std::this_thread::get_id()) {
                reader.detach();
            }
            else {
                reader.join();
            }
        }
    }

    String to_string() const {
        return config.group + ":" + std::to_string(config.port);
    }

    void join(const bool startReader) {
        {
            Guard guard{mutex};

            if (closed)
                throw LOGIC_ERROR("Connection to group " + to_string() + " is closed");
            if (joinCalled)
                throw LOGIC_ERROR("Group " + to_string() + " has already been joined");
            joinCalled = true;
        }

        listener.onClosedStatus(true); // Initial state

        try {
            Guard guard{mutex};

            if (closed)
                throw LOGIC_ERROR("Connection was closed while joining");
            groupAddr = SockAddr(config.group, config.port);
            sock = McastSock(groupAddr, config.mcastIface, config.mcastTtl);
            joined = true;
        }
        catch (const std::exception& ex) {
            if (!closed.exchange(true))
                listener.onClosedStatus(true);
            std::throw_with_nested(CONNECTION_ERROR("Couldn't join group " + to_string()));
        }

        LOG_DIAG(config.debug, DebugFlags::STATUS, "Joined group %s", to_string().data());
        listener.onClosedStatus(false);

        if (startReader)
            reader = Thread(&Impl::read, this);
    }

    SockAddr getGroupAddr() const {
        Guard guard{mutex};
        if (!joined)
            throw LOGIC_ERROR("Group " + to_string() + " hasn't been joined");
        return groupAddr;
    }

    bool receive(String& msg) {
        auto mcastSock = getSock();
        try {
            return mcastSock.recv(msg, config.maxDatagram);
        }
        catch (const OversizeMessageError& ex) {
            throw;
        }
        catch (const std::exception& ex) {
            if (closed)
                return false;
            std::throw_with_nested(STREAM_FAULT("Couldn't receive from group " + to_string()));
        }
    }

    void send(const String& msg) {
        if (msg.size() > config.maxDatagram)
            throw OVERSIZE_ERROR("Message has " + std::to_string(msg.size()) +
                    " bytes; maximum is " + std::to_string(config.maxDatagram), msg.size());

        auto mcastSock = getSock();
        if (closed)
            throw STREAM_FAULT("Connection to group " + to_string() + " is closed");

        LOG_DIAG(config.debug, DebugFlags::SEND, "send> %s", msg.data());

        try {
            mcastSock.send(msg);
        }
        catch (const std::exception& ex) {
            std::throw_with_nested(STREAM_FAULT("Couldn't send to group " + to_string()));
        }
    }

    bool isOpen() const {
        Guard guard{mutex};
        return joined && !closed;
    }

    bool close() {
        if (closed.exchange(true))
            return false;

        McastSock mcastSock;
        bool      wasJoined;
        {
            Guard guard{mutex};
            mcastSock = sock;
            wasJoined = joined;
        }

        if (mcastSock) {
            try {
                mcastSock.leave(); // Unblocks the reader
            }
            catch (const std::exception& ex) {
                LOG_DIAG(config.debug, DebugFlags::EXCEPTIONS, ex, "Couldn't leave group %s",
                        to_string().data());
            }
        }

        if (wasJoined) {
            LOG_DIAG(config.debug, DebugFlags::STATUS, "Connection to group %s closed",
                    to_string().data());
            listener.onClosedStatus(true);
        }

        return true;
    }
};

/******************************************************************************/

McastConn::McastConn(
        const Config& config,
        Listener&     listener)
    : pImpl(new Impl(config, listener))
{}

McastConn::~McastConn() noexcept
{}

void McastConn::join(const bool startReader) const {
    pImpl->join(startReader);
}

SockAddr McastConn::getGroupAddr() const {
    return pImpl->getGroupAddr();
}

bool McastConn::receive(String& msg) const {
    return pImpl->receive(msg);
}

void McastConn::send(const String& msg) const {
    pImpl->send(msg);
}

bool McastConn::isOpen() const {
    return pImpl->isOpen();
}

bool McastConn::close() const {
    return pImpl->close();
}

} // namespace
