/**
 * A line-oriented connection to a single remote peer.
 *
 *        File: Connection.cpp
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

#include "Connection.h"
#include "error.h"
#include "logging.h"

#include <atomic>

namespace sockcast {

/// Implementation of a connection
class Connection::Impl final : public std::enable_shared_from_this<Impl>
{
    mutable Mutex     hookMutex;  ///< Protects `closeHook`
    mutable Mutex     writeMutex; ///< Serializes writes
    TcpSock           sock;       ///< Connected socket
    Listener&         listener;   ///< Receiver of messages and closure
    const DebugFlags  debug;      ///< Diagnostic channels
    std::atomic<bool> closed;     ///< Connection is closed?
    CloseHook         closeHook;  ///< Called on closure

public:
    Impl(   TcpSock      sock,
            Listener&    listener,
            DebugFlags   debug,
            const Millis writeTimeout,
            const size_t maxLine)
        : hookMutex()
        , writeMutex()
        , sock(sock)
        , listener(listener)
        , debug(debug)
        , closed(false)
        , closeHook()
    {
        if (!sock)
            throw INVALID_ARGUMENT("Socket is invalid");
        sock.setWriteTimeout(writeTimeout);
        sock.setMaxLine(maxLine);
        sock.setDelay(false);
    }

    String to_string() const {
        return "{rmt=" + sock.getRmtAddr().to_string() + ", sd=" +
                std::to_string(sock.getSockDesc()) + "}";
    }

    SockAddr getRmtAddr() const {
        return sock.getRmtAddr();
    }

    bool setCloseHook(CloseHook hook) {
        Guard guard{hookMutex};
        if (closed)
            return false;
        closeHook = hook;
        return true;
    }

    bool isOpen() const noexcept {
        return !closed;
    }

    bool readLine(String& line) {
        try {
            return sock.readLine(line);
        }
        catch (const std::exception& ex) {
            std::throw_with_nested(STREAM_FAULT("Couldn't read from connection " + to_string()));
        }
    }

    void writeLine(const String& line) {
        Guard guard{writeMutex};

        if (closed)
            throw STREAM_FAULT("Connection " + to_string() + " is closed");

        LOG_DIAG(debug, DebugFlags::SEND, "send> %s", line.data());

        try {
            if (!sock.writeLine(line))
                throw STREAM_FAULT("Connection " + to_string() + " was lost");
        }
        catch (const StreamFault& ex) {
            throw;
        }
        catch (const std::exception& ex) {
            std::throw_with_nested(STREAM_FAULT("Couldn't write to connection " + to_string()));
        }
    }

    bool close() {
        if (closed.exchange(true))
            return false;

        try {
            sock.shutdown(SHUT_RDWR);
        }
        catch (const std::exception& ex) {
            LOG_DIAG(debug, DebugFlags::EXCEPTIONS, ex, "Couldn't shut down connection %s",
                    to_string().data());
        }

        CloseHook hook;
        {
            Guard guard{hookMutex};
            hook.swap(closeHook); // Releases whatever the hook refers to
        }
        if (hook)
            hook(Connection(shared_from_this()));

        LOG_DIAG(debug, DebugFlags::STATUS, "Connection %s closed", to_string().data());
        listener.onClosedStatus(true);

        return true;
    }

    void read() {
        try {
            String line;
            while (readLine(line)) {
                LOG_DIAG(debug, DebugFlags::RECV, "recv> %s", line.data());
                listener.onMessage(line);
            }
            LOG_DIAG(debug, DebugFlags::STATUS, "End of stream on connection %s",
                    to_string().data());
        }
        catch (const std::exception& ex) {
            LOG_DIAG(debug, DebugFlags::EXCEPTIONS, ex, "Reader of connection %s failed",
                    to_string().data());
        }

        try {
            close();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(ex, "Couldn't close connection %s", to_string().data());
        }
    }
};

/******************************************************************************/

Connection::Connection(std::shared_ptr<Impl> impl)
    : pImpl(impl)
{}

Connection::Connection(
        TcpSock      sock,
        Listener&    listener,
        DebugFlags   debug,
        const Millis writeTimeout,
        const size_t maxLine)
    : pImpl(std::make_shared<Impl>(sock, listener, debug, writeTimeout, maxLine))
{}

Connection Connection::connect(
        const SockAddr& srvrAddr,
        Listener&       listener,
        DebugFlags      debug,
        const Millis    writeTimeout,
        const size_t    maxLine)
{
    try {
        return Connection(TcpClntSock(srvrAddr), listener, debug, writeTimeout, maxLine);
    }
    catch (const std::exception& ex) {
        std::throw_with_nested(CONNECTION_ERROR("Couldn't connect to " + srvrAddr.to_string()));
    }
}

Connection Connection::connect(
        const Config& config,
        Listener&     listener)
{
    SockAddr srvrAddr;
    try {
        srvrAddr = SockAddr(config.host, config.port);
    }
    catch (const std::exception& ex) {
        std::throw_with_nested(CONNECTION_ERROR("Couldn't resolve " + config.host + ":" +
                std::to_string(config.port)));
    }
    return connect(srvrAddr, listener, config.debug, config.writeTimeout, config.maxLine);
}

String Connection::to_string() const {
    return pImpl ? pImpl->to_string() : "<unset>";
}

SockAddr Connection::getRmtAddr() const {
    return pImpl->getRmtAddr();
}

bool Connection::setCloseHook(CloseHook hook) const {
    return pImpl->setCloseHook(hook);
}

bool Connection::isOpen() const noexcept {
    return pImpl && pImpl->isOpen();
}

bool Connection::readLine(String& line) const {
    return pImpl->readLine(line);
}

void Connection::writeLine(const String& line) const {
    pImpl->writeLine(line);
}

bool Connection::close() const {
    return pImpl ? pImpl->close() : false;
}

void Connection::operator()() const {
    pImpl->read();
}

} // namespace
