/**
 * Sends a message to every connection of a snapshot concurrently.
 *
 *        File: Dispatcher.h
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

#ifndef MAIN_CAST_DISPATCHER_H_
#define MAIN_CAST_DISPATCHER_H_

#include "DebugFlags.h"
#include "ListenerSet.h"

#include <memory>

namespace sockcast {

/**
 * Fans a message out to a set of connections using a fixed number of threads. A connection whose
 * write fails is closed, which removes it from its registry. Other connections are unaffected.
 */
class Dispatcher
{
    class Impl;

    std::shared_ptr<Impl> pImpl;

public:
    /**
     * Constructs.
     *
     * @param[in] poolSize         Number of sending threads
     * @param[in] debug            Diagnostic channels
     * @throw     InvalidArgument  `poolSize == 0`
     */
    explicit Dispatcher(
            const unsigned poolSize,
            DebugFlags     debug = DebugFlags());

    /**
     * Submits one write per connection of a snapshot and returns without waiting for the writes
     * to complete. Never throws because of a connection's failure.
     *
     * @param[in] snapshot  Connections to send to
     * @param[in] msg       Message to send
     * @return              Number of writes submitted
     * @threadsafety        Safe
     */
    size_t post(
            const ListenerSet::Snapshot& snapshot,
            const String&                msg) const;

    /**
     * Blocks until all submitted writes have completed.
     */
    void awaitIdle() const;

    /**
     * Completes the submitted writes and then stops the sending threads. Subsequent posts are
     * ignored. Idempotent.
     */
    void shutdown() const;
};

} // namespace

#endif /* MAIN_CAST_DISPATCHER_H_ */
