/**
 * Fixed-size pool of threads that execute submitted tasks.
 *
 *        File: WorkerPool.h
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

#ifndef MAIN_MISC_WORKERPOOL_H_
#define MAIN_MISC_WORKERPOOL_H_

#include <cstddef>
#include <functional>
#include <memory>

namespace sockcast {

/**
 * A fixed number of threads that execute tasks in the order in which they were submitted. Tasks
 * are independent: an exception thrown by one is logged and doesn't affect the others.
 */
class WorkerPool
{
public:
    class Impl;

    /// Type of task executed by the pool
    using Task = std::function<void()>;

private:
    std::shared_ptr<Impl> pImpl;

public:
    /**
     * Constructs. Starts the threads.
     *
     * @param[in] numThreads       Number of threads
     * @throw     InvalidArgument  `numThreads == 0`
     * @throw     SystemError      Couldn't create a thread
     */
    explicit WorkerPool(const unsigned numThreads);

    /**
     * Destroys. Calls `shutdown()`.
     */
    ~WorkerPool() noexcept;

    WorkerPool(const WorkerPool& pool) =delete;
    WorkerPool& operator=(const WorkerPool& rhs) =delete;

    /**
     * Submits a task for execution.
     *
     * @param[in] task        Task to be executed
     * @throw     LogicError  `shutdown()` has been called
     * @threadsafety          Safe
     */
    void submit(Task task) const;

    /**
     * Returns the number of threads.
     * @return Number of threads
     */
    unsigned size() const noexcept;

    /**
     * Returns the number of tasks that have been submitted but not yet completed.
     * @return Number of outstanding tasks
     * @threadsafety  Safe
     */
    size_t getPending() const;

    /**
     * Blocks until every submitted task has completed.
     * @threadsafety  Safe
     */
    void awaitIdle() const;

    /**
     * Executes tasks that have already been submitted, then stops and joins the threads.
     * Idempotent.
     */
    void shutdown() const;
};

} // namespace

#endif /* MAIN_MISC_WORKERPOOL_H_ */
