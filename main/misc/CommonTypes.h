/**
 * @file: CommonTypes.h
 * @brief: Common types used in the code.
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

#ifndef MAIN_MISC_COMMONTYPES_H_
#define MAIN_MISC_COMMONTYPES_H_

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace sockcast {

/// Convenience types
using Thread       = std::thread;                ///< A thread
using Mutex        = std::mutex;                 ///< A mutex
using Guard        = std::lock_guard<Mutex>;     ///< A guard lock
using Lock         = std::unique_lock<Mutex>;    ///< A condition variable lock
using Cond         = std::condition_variable;    ///< A condition variable
using String       = std::string;                ///< A string
using SteadyClock  = std::chrono::steady_clock;  ///< A monotonic clock
using Millis       = std::chrono::milliseconds;  ///< A duration in milliseconds

} // namespace

#endif /* MAIN_MISC_COMMONTYPES_H_ */
