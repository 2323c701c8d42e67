/**
 * A single line-oriented connection to a remote peer.
 *
 *        File: StreamPeer.cpp
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
#include "Socket.h"
#include "StreamPeer.h"

namespace sockcast {

/// Implementation of a stream peer
class StreamPeer::Impl
{
    Connection conn;   ///< Connection to the remote peer
    Thread     reader; ///< Executes the connection's reader loop

public:
    Impl(   const Connection& conn,
            Listener&         listener,
            const DebugFlags  debug)
        : conn(conn)
        , reader()
    {
        LOG_DIAG(debug, DebugFlags::STATUS, "Connection %s opened", conn.to_string().data());
        listener.onClosedStatus(false);
        reader = Thread(conn);
    }

    Impl(const Impl& impl) =delete;
    Impl& operator=(const Impl& rhs) =delete;

    ~Impl() noexcept {
        try {
            conn.close();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(ex, "Couldn't close connection %s", conn.to_string().data());
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
        return conn.to_string();
    }

    SockAddr getRmtAddr() const {
        return conn.getRmtAddr();
    }

    void sendMessage(const String& msg) {
        try {
            conn.writeLine(msg);
        }
        catch (const std::exception& ex) {
            conn.close();
            throw;
        }
    }

    bool isClosed() const noexcept {
        return !conn.isOpen();
    }

    void shutdown() {
        conn.close();
    }
};

/******************************************************************************/

StreamPeer::StreamPeer(Impl* impl)
    : pImpl(impl)
{}

StreamPeer StreamPeer::connect(
        const Config& config,
        Listener&     listener)
{
    return StreamPeer(new Impl(Connection::connect(config, listener), listener, config.debug));
}

StreamPeer StreamPeer::accept(
        const Config& config,
        Listener&     listener)
{
    TcpSock sock;
    try {
        // The listening socket is closed when this block is exited
        TcpSrvrSock srvrSock(SockAddr::wildcard(AF_INET, config.port), 1);
        LOG_DIAG(config.debug, DebugFlags::STATUS, "Waiting for a connection on %s",
                srvrSock.getLclAddr().to_string().data());
        sock = srvrSock.accept();
    }
    catch (const std::exception& ex) {
        std::throw_with_nested(CONNECTION_ERROR("Couldn't accept a connection on port " +
                std::to_string(config.port)));
    }
    if (!sock)
        throw CONNECTION_ERROR("Listening socket on port " + std::to_string(config.port) +
                " was shut down");

    return StreamPeer(new Impl(Connection(sock, listener, config.debug, config.writeTimeout,
            config.maxLine), listener, config.debug));
}

String StreamPeer::to_string() const {
    return pImpl ? pImpl->to_string() : "<unset>";
}

SockAddr StreamPeer::getRmtAddr() const {
    return pImpl->getRmtAddr();
}

void StreamPeer::sendMessage(const String& msg) const {
    pImpl->sendMessage(msg);
}

bool StreamPeer::isClosed() const noexcept {
    return !pImpl || pImpl->isClosed();
}

void StreamPeer::shutdown() const {
    if (pImpl)
        pImpl->shutdown();
}

} // namespace
