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

/**
 * @file
 *   These tests talk to the mDNSResponder daemon of this host.
 */

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "op/browse_op.hpp"
#include "op/query_op.hpp"
#include "op/register_op.hpp"
#include "op/resolve_op.hpp"

using namespace dnssd;

static void StartStopHelper(Operation &aOp)
{
    ASSERT_EQ(aOp.Start(), DNSSD_ERROR_NONE);
    EXPECT_TRUE(aOp.IsActive());
    aOp.Stop();
    EXPECT_FALSE(aOp.IsActive());
}

TEST(Daemon, TestRegisterStartStop)
{
    RegisterOp op("go", "_go-dnssd._tcp", 9,
                  [](RegisterOp &, dnssdError, bool, const std::string &, const std::string &, const std::string &) {});

    StartStopHelper(op);
}

TEST(Daemon, TestBrowseStartStop)
{
    BrowseOp op("_go-dnssd._tcp", [](BrowseOp &, dnssdError, bool, uint32_t, const std::string &,
                                     const std::string &, const std::string &) {});

    StartStopHelper(op);
}

TEST(Daemon, TestResolveStartStop)
{
    ResolveOp op(kInterfaceIndexAny, "go", "_go-dnssd._tcp", "local",
                 [](ResolveOp &, dnssdError, const std::string &, uint16_t, const TxtMap &) {});

    StartStopHelper(op);
}

TEST(Daemon, TestQueryStartStop)
{
    QueryOp op(kInterfaceIndexAny, "golang.org.", 1, 1,
               [](QueryOp &, dnssdError, bool, bool, uint32_t, const std::string &, uint16_t, uint16_t,
                  const std::vector<uint8_t> &, uint32_t) {});

    StartStopHelper(op);
}

TEST(Daemon, TestRegisterPort)
{
    const uint16_t    kPort = 0xcafe;
    const std::string kName = "dnssd-daemon-test";
    const std::string kType = "_" + kName + "._udp";
    std::mutex        mutex;
    std::string       failure;
    std::atomic<bool> resolved{false};

    ResolveOp resolveOp(kInterfaceIndexLocalOnly, kName, kType, "local",
                        [&](ResolveOp &, dnssdError aError, const std::string &, uint16_t aPort, const TxtMap &) {
                            std::lock_guard<std::mutex> lock(mutex);

                            if (aError != DNSSD_ERROR_NONE)
                            {
                                failure = std::string("resolve callback error: ") + dnssdErrorString(aError);
                            }
                            else if (aPort != kPort)
                            {
                                failure = "resolve callback bad port: " + std::to_string(aPort);
                            }
                            else
                            {
                                resolved = true;
                            }
                        });

    RegisterOp registerOp(kName, kType, kPort,
                          [&](RegisterOp &, dnssdError aError, bool, const std::string &, const std::string &,
                              const std::string &) {
                              dnssdError error = aError;

                              if (error == DNSSD_ERROR_NONE)
                              {
                                  error = resolveOp.Start();
                              }

                              if (error != DNSSD_ERROR_NONE && error != DNSSD_ERROR_STARTED)
                              {
                                  std::lock_guard<std::mutex> lock(mutex);

                                  failure = std::string("register callback error: ") + dnssdErrorString(error);
                              }
                          });

    ASSERT_EQ(registerOp.SetNoAutoRename(true), DNSSD_ERROR_NONE);
    ASSERT_EQ(registerOp.SetInterfaceIndex(kInterfaceIndexLocalOnly), DNSSD_ERROR_NONE);
    ASSERT_EQ(registerOp.SetDomain("local"), DNSSD_ERROR_NONE);
    ASSERT_EQ(registerOp.Start(), DNSSD_ERROR_NONE);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);

    while (!resolved && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    resolveOp.Stop();
    registerOp.Stop();

    std::lock_guard<std::mutex> lock(mutex);

    EXPECT_EQ(failure, "");
    EXPECT_TRUE(resolved) << "test took longer than a second";
}
