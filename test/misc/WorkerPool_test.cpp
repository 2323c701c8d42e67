/**
 * This file tests class `WorkerPool`.
 *
 *       File: WorkerPool_test.cpp
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

#include <atomic>
#include <gtest/gtest.h>
#include <libgen.h>

namespace {

using namespace sockcast;

/// The fixture for testing class `WorkerPool`
class WorkerPoolTest : public ::testing::Test
{
protected:
    Mutex    mutex;
    Cond     cond;
    unsigned numBlocked;
    bool     released;

    WorkerPoolTest()
        : mutex()
        , cond()
        , numBlocked(0)
        , released(false)
    {}

    /// Blocks until `release()` is called
    void block() {
        Lock lock{mutex};
        ++numBlocked;
        cond.notify_all();
        cond.wait(lock, [&]{return released;});
    }

    void release() {
        Guard guard{mutex};
        released = true;
        cond.notify_all();
    }

    void waitForBlocked(const unsigned num) {
        Lock lock{mutex};
        cond.wait(lock, [&]{return numBlocked == num;});
    }
};

// Tests construction
TEST_F(WorkerPoolTest, Construction)
{
    WorkerPool pool(3);
    EXPECT_EQ(3, pool.size());
    EXPECT_EQ(0, pool.getPending());
    EXPECT_THROW(WorkerPool(0), InvalidArgument);
}

// Tests that every submitted task is executed
TEST_F(WorkerPoolTest, AllTasksExecuted)
{
    WorkerPool            pool(4);
    std::atomic<unsigned> count(0);

    for (int i = 0; i < 100; ++i)
        pool.submit([&count]{++count;});
    pool.awaitIdle();

    EXPECT_EQ(100, count);
    EXPECT_EQ(0, pool.getPending());
}

// Tests that tasks execute concurrently up to the number of threads
TEST_F(WorkerPoolTest, Concurrency)
{
    WorkerPool pool(3);

    for (int i = 0; i < 3; ++i)
        pool.submit([this]{block();});
    waitForBlocked(3); // Would hang if the tasks weren't concurrent

    std::atomic<bool> ran(false);
    pool.submit([&ran]{ran = true;});
    EXPECT_EQ(4, pool.getPending());
    EXPECT_FALSE(ran);

    release();
    pool.awaitIdle();
    EXPECT_TRUE(ran);
}

// Tests that a throwing task doesn't stop its thread
TEST_F(WorkerPoolTest, ThrowingTask)
{
    WorkerPool        pool(1);
    std::atomic<bool> ran(false);

    pool.submit([]{throw RUNTIME_ERROR("Task failure");});
    pool.submit([&ran]{ran = true;});
    pool.awaitIdle();

    EXPECT_TRUE(ran);
}

// Tests shutdown
TEST_F(WorkerPoolTest, Shutdown)
{
    WorkerPool            pool(2);
    std::atomic<unsigned> count(0);

    for (int i = 0; i < 10; ++i)
        pool.submit([&count]{++count;});
    pool.shutdown(); // Completes the queued tasks
    EXPECT_EQ(10, count);

    EXPECT_THROW(pool.submit([&count]{++count;}), LogicError);
    pool.shutdown();
    EXPECT_EQ(10, count);
}

}  // namespace

int main(int argc, char **argv) {
  log_setName(::basename(argv[0]));
  log_setLevel(LogLevel::DEBUG);
  std::set_terminate(&sockcast::terminate);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
