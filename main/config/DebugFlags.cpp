/**
 * Bitmask of independent diagnostic channels.
 *
 *        File: DebugFlags.cpp
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

#include "DebugFlags.h"
#include "error.h"

#include <cctype>

namespace sockcast {

constexpr DebugFlags::Mask DebugFlags::NONE;
constexpr DebugFlags::Mask DebugFlags::SEND;
constexpr DebugFlags::Mask DebugFlags::RECV;
constexpr DebugFlags::Mask DebugFlags::EXCEPTIONS;
constexpr DebugFlags::Mask DebugFlags::STATUS;
constexpr DebugFlags::Mask DebugFlags::IO;
constexpr DebugFlags::Mask DebugFlags::ALL;

String DebugFlags::to_string() const
{
    static const struct Entry {
        Mask        flag;
        const char* name;
    } entries[] = {
        {SEND,       "DEBUG_SEND"},
        {RECV,       "DEBUG_RECV"},
        {EXCEPTIONS, "DEBUG_EXCEPTIONS"},
        {STATUS,     "DEBUG_STATUS"},
        {NONE,       nullptr}
    };

    String str;
    for (const Entry* entry = entries; entry->name; ++entry) {
        if (mask & entry->flag) {
            if (!str.empty())
                str += " | ";
            str += entry->name;
        }
    }

    return str.empty() ? String("DEBUG_NONE") : str;
}

DebugFlags::Mask DebugFlags::parse(const String& name)
{
    static const struct Entry {
        const char* id;
        Mask        flags;
    } entries[] = {
        {"NONE",       NONE},
        {"SEND",       SEND},
        {"RECV",       RECV},
        {"RECEIVE",    RECV},
        {"EXCEPTIONS", EXCEPTIONS},
        {"STATUS",     STATUS},
        {"IO",         IO},
        {"ALL",        ALL},
        {nullptr,      NONE}
    };

    String upperName = name;
    for (auto& c : upperName)
        c = ::toupper(c);

    for (const Entry* entry = entries; entry->id; ++entry)
        if (upperName == entry->id)
            return entry->flags;

    throw INVALID_ARGUMENT("Invalid diagnostic-channel name: \"" + name + "\"");
}

DebugFlags DebugFlags::parse(const std::vector<String>& names)
{
    DebugFlags flags{};
    for (auto& name : names)
        flags.set(parse(name));
    return flags;
}

} // namespace
