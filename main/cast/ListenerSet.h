/**
 * Registry of the live connections of a broadcast server.
 *
 *        File: ListenerSet.h
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

#ifndef MAIN_CAST_LISTENERSET_H_
#define MAIN_CAST_LISTENERSET_H_

#include "Connection.h"

#include <memory>
#include <vector>

namespace sockcast {

/**
 * A set of open connections, each with its own reader thread. A connection removes itself when it
 * closes. Reader threads of removed connections are joined by an internal thread.
 *
 * Reader threads don't keep the set alive. Destroying the last copy closes every connection and
 * joins every reader thread, so it must not be done by a listener's callback.
 */
class ListenerSet
{
public:
    class Impl;

    /// Immutable, point-in-time copy of the set
    using Snapshot = std::vector<Connection>;

private:
    std::shared_ptr<Impl> pImpl;

public:
    /**
     * Constructs. Starts the thread that joins the reader threads of removed connections.
     */
    ListenerSet();

    /**
     * Adds a connection and arranges for it to remove itself when it closes. Doesn't start the
     * connection's reader thread.
     *
     * @param[in] conn   Connection to be added
     * @retval    true   Connection was added
     * @retval    false  Connection is already in the set or is closed
     * @threadsafety     Safe
     */
    bool insert(const Connection& conn) const;

    /**
     * Starts the reader thread of a connection in the set.
     *
     * @param[in] conn         The connection
     * @retval    true         Reader thread was started
     * @retval    false        Connection isn't in the set or its reader is already running
     * @throw     SystemError  Couldn't create thread
     * @threadsafety           Safe
     */
    bool activate(const Connection& conn) const;

    /**
     * Removes a connection. Doesn't close it. Removing a connection that isn't in the set does
     * nothing.
     *
     * @param[in] conn   Connection to be removed
     * @retval    true   Connection was removed
     * @retval    false  Connection wasn't in the set
     * @threadsafety     Safe
     */
    bool erase(const Connection& conn) const;

    /**
     * Returns a snapshot of the connections in the set.
     *
     * @return        Snapshot of the set
     * @threadsafety  Safe
     */
    Snapshot snapshot() const;

    /**
     * Returns the number of connections in the set.
     *
     * @return        Number of connections
     * @threadsafety  Safe
     */
    size_t size() const;

    /**
     * Closes and removes every connection in the set.
     *
     * @threadsafety  Safe
     */
    void closeAll() const;

    /**
     * Blocks until the set is empty and the reader threads of all removed connections have been
     * joined. Must not be called by a reader thread.
     */
    void awaitEmpty() const;
};

} // namespace

#endif /* MAIN_CAST_LISTENERSET_H_ */
