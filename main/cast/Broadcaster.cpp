/**
 * Server that broadcasts lines of text to every connected client.
 *
 *        File: Broadcaster.cpp
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

#include "Broadcaster.h"
#include "Connection.h"
#include "Dispatcher.h"
#include "error.h"
#include "ListenerSet.h"
#include "logging.h"
#include "Socket.h"

#include <atomic>

namespace sockcast {

/// Implementation of a broadcast server
class Broadcaster::Impl
{
    const Config      config;      ///< Configuration
    Listener&         listener;    ///< Receiver of messages and status changes
    mutable Mutex     mutex;       ///< Protects state
    mutable Cond      cond;        ///< Signals a change of state
    State             state;       ///< State of the acceptor
    Thread::id        acceptorId;  ///< Identifier of the acceptor's thread
    TcpSrvrSock       srvrSock;    ///< Listening socket
    std::atomic<bool> stopCalled;  ///< `shutdown()` has been called?
    std::atomic<bool> stopSent;    ///< Final status has been reported?
    ListenerSet       registry;    ///< Connected clients
    Dispatcher        dispatcher;  ///< Sends to clients
    Thread            acceptThread;

    /**
     * Creates the listening socket.
     *
     * @throw ConnectionError  Couldn't create the listening socket
     * @throw LogicError       Already started or shut down
     */
    void bind() {
        {
            Guard guard{mutex};
            if (state != State::IDLE)
                throw LOGIC_ERROR("Server has already been started");
            if (stopCalled)
                throw LOGIC_ERROR("Server has been shut down");
            state = State::BINDING;
        }

        listener.onClosedStatus(true);

        TcpSrvrSock sock;
        try {
            sock = TcpSrvrSock(SockAddr::wildcard(AF_INET, config.port), config.queueSize);
        }
        catch (const std::exception& ex) {
            try {
                stopped();
            }
            catch (const std::exception& stopEx) {
                LOG_ERROR(stopEx, "Couldn't report stop of server");
            }
            std::throw_with_nested(CONNECTION_ERROR("Couldn't listen on port " +
                    std::to_string(config.port)));
        }

        bool stopNow;
        {
            Guard guard{mutex};
            srvrSock = sock;
            stopNow = stopCalled;
            state = State::LISTENING;
            cond.notify_all();
        }
        if (stopNow)
            sock.shutdown();

        LOG_DIAG(config.debug, DebugFlags::STATUS, "Listening on %s",
                sock.getLclAddr().to_string().data());
    }

    /**
     * Adds a newly-accepted client.
     * @param[in] sock  Client's socket
     */
    void add(TcpSock sock) {
        Connection conn;
        try {
            conn = Connection(sock, listener, config.debug, config.writeTimeout, config.maxLine);
            if (registry.insert(conn)) {
                LOG_DIAG(config.debug, DebugFlags::STATUS, "Accepted connection %s",
                        conn.to_string().data());
                listener.onClosedStatus(false);
                registry.activate(conn);
            }
        }
        catch (const std::exception& ex) {
            LOG_DIAG(config.debug, DebugFlags::EXCEPTIONS, ex, "Couldn't add client %s",
                    sock.getRmtAddr().to_string().data());
            if (conn) {
                conn.close();
            }
            else {
                sock.shutdown();
            }
        }
    }

    /**
     * Releases the listening socket and reports the final status. Only the first call has an
     * effect.
     */
    void stopped() {
        {
            Guard guard{mutex};
            srvrSock = TcpSrvrSock();
            state = State::STOPPED;
            cond.notify_all();
        }

        if (!stopSent.exchange(true)) {
            LOG_DIAG(config.debug, DebugFlags::STATUS, "Server on port %u stopped",
                    static_cast<unsigned>(config.port));
            listener.onClosedStatus(true);
        }
    }

    /**
     * Accepts clients until the listening socket is shut down or fails.
     */
    void accept() {
        TcpSrvrSock sock;
        {
            Guard guard{mutex};
            acceptorId = std::this_thread::get_id();
            sock = srvrSock;
        }

        try {
            for (;;) {
                auto clntSock = sock.accept();
                if (!clntSock)
                    break; // `shutdown()` called
                add(clntSock);
            }
        }
        catch (const std::exception& ex) {
            LOG_ERROR(ex, "Acceptor of server on port %u failed",
                    static_cast<unsigned>(config.port));
        }

        try {
            stopped();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(ex, "Couldn't report stop of server");
        }
    }

public:
    Impl(   const Config& config,
            Listener&     listener)
        : config(config)
        , listener(listener)
        , mutex()
        , cond()
        , state(State::IDLE)
        , acceptorId()
        , srvrSock()
        , stopCalled(false)
        , stopSent(false)
        , registry()
        , dispatcher((config.vet(), config.poolSize), config.debug)
        , acceptThread()
    {}

    ~Impl() noexcept {
        try {
            shutdown();
            if (acceptThread.joinable())
                acceptThread.join();
            registry.closeAll();
            dispatcher.shutdown();
            registry.awaitEmpty();
        }
        catch (const std::exception& ex) {
            LOG_ERROR(ex, "Couldn't destroy server on port %u", static_cast<unsigned>(config.port));
        }
    }

    void start() {
        bind();
        acceptThread = Thread(&Impl::accept, this);
    }

    void run() {
        bind();
        accept();
    }

    size_t postMessage(const String& msg) {
        return dispatcher.post(registry.snapshot(), msg);
    }

    size_t getNumberOfListeners() const {
        return registry.size();
    }

    SockAddr getLclAddr() const {
        TcpSrvrSock sock;
        {
            Guard guard{mutex};
            sock = srvrSock;
        }
        if (!sock)
            throw LOGIC_ERROR("Server isn't listening");
        return sock.getLclAddr();
    }

    State getState() const {
        Guard guard{mutex};
        return state;
    }

    void shutdown() {
        if (!stopCalled.exchange(true)) {
            TcpSrvrSock sock;
            {
                Guard guard{mutex};
                sock = srvrSock;
            }
            if (sock)
                sock.shutdown(); // Causes `accept()` to return an invalid socket
        }

        {
            Lock lock{mutex};
            if (acceptorId != std::this_thread::get_id())
                cond.wait(lock, [&]{return state == State::IDLE || state == State::STOPPED;});
        }

        // A stopped acceptor adds no more clients
        if (config.closePeersOnShutdown)
            registry.closeAll();
    }
};

/******************************************************************************/

Broadcaster::Broadcaster(
        const Config& config,
        Listener&     listener)
    : pImpl(new Impl(config, listener))
{}

Broadcaster::~Broadcaster() noexcept
{}

void Broadcaster::start() const {
    pImpl->start();
}

void Broadcaster::run() const {
    pImpl->run();
}

size_t Broadcaster::postMessage(const String& msg) const {
    return pImpl->postMessage(msg);
}

size_t Broadcaster::getNumberOfListeners() const {
    return pImpl->getNumberOfListeners();
}

SockAddr Broadcaster::getLclAddr() const {
    return pImpl->getLclAddr();
}

Broadcaster::State Broadcaster::getState() const {
    return pImpl->getState();
}

void Broadcaster::shutdown() const {
    pImpl->shutdown();
}

} // namespace
