/**
 * Bitmask of independent diagnostic channels.
 *
 *        File: DebugFlags.h
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

#ifndef MAIN_CONFIG_DEBUGFLAGS_H_
#define MAIN_CONFIG_DEBUGFLAGS_H_

#include "CommonTypes.h"
#include "logging.h"

#include <vector>

namespace sockcast {

/**
 * Set of diagnostic channels. Each channel is independent of the others and only controls whether
 * a component logs the corresponding events.
 */
class DebugFlags
{
public:
    using Mask = unsigned;

    static constexpr Mask NONE       = 0x0; ///< No diagnostics
    static constexpr Mask SEND       = 0x1; ///< Outbound lines and datagrams
    static constexpr Mask RECV       = 0x2; ///< Inbound lines and datagrams
    static constexpr Mask EXCEPTIONS = 0x4; ///< Contained exceptions
    static constexpr Mask STATUS     = 0x8; ///< Open/closed transitions
    static constexpr Mask IO         = SEND | RECV;
    static constexpr Mask ALL        = SEND | RECV | EXCEPTIONS | STATUS;

private:
    Mask mask;

public:
    /**
     * Constructs.
     * @param[in] mask  Initial set of channels
     */
    DebugFlags(const Mask mask = NONE) noexcept
        : mask(mask & ALL)
    {}

    /**
     * Returns the bitmask.
     * @return The bitmask
     */
    Mask getMask() const noexcept {
        return mask;
    }

    /**
     * Indicates if every channel in a set is enabled.
     * @param[in] flags  Set of channels
     * @retval    true   All are enabled
     * @retval    false  At least one isn't enabled
     */
    bool isSet(const Mask flags) const noexcept {
        return flags && (mask & flags) == flags;
    }

    /**
     * Enables channels.
     * @param[in] flags  Channels to be enabled
     * @return           Reference to this instance
     */
    DebugFlags& set(const Mask flags) noexcept {
        mask |= flags & ALL;
        return *this;
    }

    /**
     * Disables channels.
     * @param[in] flags  Channels to be disabled
     * @return           Reference to this instance
     */
    DebugFlags& clear(const Mask flags) noexcept {
        mask &= ~flags;
        return *this;
    }

    bool operator==(const DebugFlags& rhs) const noexcept {
        return mask == rhs.mask;
    }

    bool operator!=(const DebugFlags& rhs) const noexcept {
        return mask != rhs.mask;
    }

    /**
     * Returns the string representation of this instance (e.g., "DEBUG_SEND | DEBUG_RECV").
     * @return String representation of this instance
     */
    String to_string() const;

    /**
     * Returns the channels that correspond to a name.
     *
     * @param[in] name             One of "none", "send", "recv", "receive", "exceptions", "status",
     *                             "io", or "all". Matching is case independent.
     * @return                     Corresponding channels
     * @throw     InvalidArgument  Unknown name
     */
    static Mask parse(const String& name);

    /**
     * Returns the channels that correspond to a list of names.
     *
     * @param[in] names            Names of channels
     * @return                     Union of the corresponding channels
     * @throw     InvalidArgument  Unknown name
     * @see `parse(const String&)`
     */
    static DebugFlags parse(const std::vector<String>& names);
};

} // namespace

/**
 * Logs a diagnostic message at the NOTE level if a channel is enabled.
 * @param[in] flags    Diagnostic channels of the component
 * @param[in] channel  Channel of the message (e.g., `DebugFlags::SEND`)
 */
#define LOG_DIAG(flags, channel, ...) \
    do \
        if ((flags).isSet(channel)) \
            LOG_NOTE(__VA_ARGS__); \
    while(false)

#endif /* MAIN_CONFIG_DEBUGFLAGS_H_ */
