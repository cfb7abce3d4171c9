/*
 *    Copyright (c) 2024, The OpenThread Authors.
 *    All rights reserved.
 *
 *    Redistribution and use in source and binary forms, with or without
 *    modification, are permitted provided that the following conditions are met:
 *    1. Redistributions of source code must retain the above copyright
 *       notice, this list of conditions and the following disclaimer.
 *    2. Redistributions in binary form must reproduce the above copyright
 *       notice, this list of conditions and the following disclaimer in the
 *       documentation and/or other materials provided with the distribution.
 *    3. Neither the name of the copyright holder nor the
 *       names of its contributors may be used to endorse or promote products
 *       derived from this software without specific prior written permission.
 *
 *    THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 *    AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 *    IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 *    ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 *    LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 *    CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 *    SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 *    INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 *    CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 *    ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 *    POSSIBILITY OF SUCH DAMAGE.
 */

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <unistd.h>

#include "common/task_runner.hpp"

static int WaitForTasks(dnssd::TaskRunner &aTaskRunner, time_t aTimeoutSec)
{
    int                    rval;
    dnssd::MainloopContext mainloop;

    mainloop.mMaxFd   = -1;
    mainloop.mTimeout = {aTimeoutSec, 0};

    FD_ZERO(&mainloop.mReadFdSet);
    FD_ZERO(&mainloop.mWriteFdSet);
    FD_ZERO(&mainloop.mErrorFdSet);

    aTaskRunner.Update(mainloop);
    rval = select(mainloop.mMaxFd + 1, &mainloop.mReadFdSet, &mainloop.mWriteFdSet, &mainloop.mErrorFdSet,
                  &mainloop.mTimeout);
    aTaskRunner.Process(mainloop);

    return rval;
}

TEST(TaskRunner, TestSingleThread)
{
    int               counter = 0;
    dnssd::TaskRunner taskRunner;

    // Increase the `counter` to 3.
    taskRunner.Post([&]() {
        ++counter;
        taskRunner.Post([&]() {
            ++counter;
            taskRunner.Post([&]() { ++counter; });
        });
    });

    EXPECT_EQ(1, WaitForTasks(taskRunner, 10));
    EXPECT_EQ(3, counter);
}

TEST(TaskRunner, TestTasksOrder)
{
    std::string       str;
    dnssd::TaskRunner taskRunner;

    taskRunner.Post([&]() { str.push_back('a'); });
    taskRunner.Post([&]() { str.push_back('b'); });
    taskRunner.Post([&]() { str.push_back('c'); });

    EXPECT_EQ(1, WaitForTasks(taskRunner, 2));

    // Make sure the tasks are executed in the order of posting.
    EXPECT_STREQ("abc", str.c_str());
}

TEST(TaskRunner, TestMultipleThreads)
{
    std::atomic<int>         counter{0};
    dnssd::TaskRunner        taskRunner;
    std::vector<std::thread> threads;

    // Increase the `counter` to 10 in separate threads.
    for (size_t i = 0; i < 10; ++i)
    {
        threads.emplace_back([&]() { taskRunner.Post([&]() { ++counter; }); });
    }

    while (counter.load() < 10)
    {
        EXPECT_EQ(1, WaitForTasks(taskRunner, 10));
    }

    for (auto &th : threads)
    {
        th.join();
    }

    EXPECT_EQ(10, counter.load());
}

TEST(TaskRunner, TestClear)
{
    int               counter = 0;
    dnssd::TaskRunner taskRunner;

    taskRunner.Post([&]() { ++counter; });
    taskRunner.Post([&]() { ++counter; });
    taskRunner.Clear();

    // The wakeup of the cleared tasks is still pending.
    EXPECT_EQ(1, WaitForTasks(taskRunner, 2));
    EXPECT_EQ(0, counter);

    // The runner keeps working after being cleared.
    taskRunner.Post([&]() { ++counter; });
    EXPECT_EQ(1, WaitForTasks(taskRunner, 2));
    EXPECT_EQ(1, counter);
}
