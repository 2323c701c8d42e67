/**
 * Fixed-size pool of threads that execute submitted tasks.
 *
 *        File: WorkerPool.cpp
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

#include "CommonTypes.h"
#include "error.h"
#include "logging.h"
#include "WorkerPool.h"

#include <list>
#include <queue>
#include <vector>

namespace sockcast {

/// Implementation of a worker pool
class WorkerPool::Impl
{
    mutable Mutex                     mutex;    ///< Protects state
    mutable Cond                      cond;     ///< Signals a new task or a stop
    mutable Cond                      idleCond; ///< Signals completion of a task
    std::queue<Task, std::list<Task>> tasks;    ///< Tasks awaiting execution
    size_t                            pending;  ///< Number of submitted, uncompleted tasks
    bool                              done;     ///< `shutdown()` has been called?
    std::vector<Thread>               threads;  ///< Worker threads

    /**
     * Executes tasks until `shutdown()` is called and the task queue is empty. Executed on its own
     * thread.
     */
    void work() {
        Lock lock{mutex};

        for (;;) {
            cond.wait(lock, [&]{return done || !tasks.empty();});
            if (tasks.empty())
                break; // `done` must be true

            auto task = tasks.front();
            tasks.pop();

            lock.unlock();
            try {
                task();
            }
            catch (const std::exception& ex) {
                LOG_ERROR(ex, "Task threw an exception");
            }
            lock.lock();

            if (--pending == 0)
                idleCond.notify_all();
        }
    }

public:
    Impl(const unsigned numThreads)
        : mutex()
        , cond()
        , idleCond()
        , tasks()
        , pending(0)
        , done(false)
        , threads()
    {
        if (numThreads == 0)
            throw INVALID_ARGUMENT("Number of threads is zero");

        threads.reserve(numThreads);
        try {
            for (unsigned i = 0; i < numThreads; ++i)
                threads.emplace_back(&Impl::work, this);
        }
        catch (const std::exception& ex) {
            shutdown();
            std::throw_with_nested(RUNTIME_ERROR("Couldn't create worker thread"));
        }
    }

    ~Impl() noexcept {
        shutdown();
    }

    void submit(Task task) {
        Guard guard{mutex};
        if (done)
            throw LOGIC_ERROR("Worker pool has been shut down");
        tasks.push(task);
        ++pending;
        cond.notify_one();
    }

    unsigned size() const noexcept {
        return threads.size();
    }

    size_t getPending() const {
        Guard guard{mutex};
        return pending;
    }

    void awaitIdle() const {
        Lock lock{mutex};
        idleCond.wait(lock, [&]{return pending == 0;});
    }

    void shutdown() {
        {
            Guard guard{mutex};
            if (done)
                return;
            done = true;
            cond.notify_all();
        }

        for (auto& thread : threads)
            if (thread.joinable() && thread.get_id() != std::this_thread::get_id())
                thread.join();
    }
};

/******************************************************************************/

WorkerPool::WorkerPool(const unsigned numThreads)
    : pImpl(new Impl(numThreads))
{}

WorkerPool::~WorkerPool() noexcept {
}

void WorkerPool::submit(Task task) const {
    pImpl->submit(task);
}

unsigned WorkerPool::size() const noexcept {
    return pImpl->size();
}

size_t WorkerPool::getPending() const {
    return pImpl->getPending();
}

void WorkerPool::awaitIdle() const {
    pImpl->awaitIdle();
}

void WorkerPool::shutdown() const {
    pImpl->shutdown();
}

} // namespace
