/**
 * Receiver of inbound messages and connection-status changes.
 *
 *        File: Listener.h
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

#ifndef MAIN_CAST_LISTENER_H_
#define MAIN_CAST_LISTENER_H_

#include "CommonTypes.h"

#include <functional>

namespace sockcast {

/**
 * Interface for the receiver of messages and status changes. Methods may be called concurrently
 * from different connections' threads.
 */
class Listener
{
public:
    virtual ~Listener() noexcept {}

    /**
     * Accepts an inbound message. Called once per message, in the order of receipt, for each
     * connection.
     *
     * @param[in] msg  Message without its line terminator
     */
    virtual void onMessage(const String& msg) =0;

    /**
     * Accepts a change of connection status.
     *
     * @param[in] isClosed  Whether the connection is now closed
     */
    virtual void onClosedStatus(const bool isClosed) =0;
};

/// A listener that forwards to functions
class FuncListener final : public Listener
{
public:
    using MsgFunc    = std::function<void(const String&)>; ///< Message function
    using StatusFunc = std::function<void(bool)>;          ///< Status function

private:
    MsgFunc    msgFunc;
    StatusFunc statusFunc;

public:
    /**
     * Constructs.
     * @param[in] msgFunc     Function to call with each message. May be empty.
     * @param[in] statusFunc  Function to call with each status change. May be empty.
     */
    FuncListener(
            MsgFunc    msgFunc,
            StatusFunc statusFunc = StatusFunc())
        : msgFunc(msgFunc)
        , statusFunc(statusFunc)
    {}

    void onMessage(const String& msg) override {
        if (msgFunc)
            msgFunc(msg);
    }

    void onClosedStatus(const bool isClosed) override {
        if (statusFunc)
            statusFunc(isClosed);
    }
};

} // namespace

#endif /* MAIN_CAST_LISTENER_H_ */
