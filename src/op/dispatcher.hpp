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
 *   This file includes definitions for the callback dispatcher of an active operation.
 */

#ifndef DNSSD_OP_DISPATCHER_HPP_
#define DNSSD_OP_DISPATCHER_HPP_

#include "dnssd/config.h"

#include <atomic>
#include <functional>
#include <thread>

#include "channel/channel.hpp"
#include "common/code_utils.hpp"
#include "common/mainloop.hpp"
#include "common/task_runner.hpp"

namespace dnssd {

/**
 * This class implements the delivery context of one active operation.
 *
 * The dispatcher owns the channel handle and a thread running a select() based mainloop
 * over the handle and a task runner. Channel events are delivered on that thread, in the
 * order the channel produces them, until `Stop()` is called.
 *
 */
class Dispatcher : private NonCopyable
{
public:
    typedef std::function<void(dnssdError aError)>               ErrorHandler;
    typedef std::function<dnssdError(Channel::Handle &aHandle)> HandleTask;

    Dispatcher(void);
    ~Dispatcher(void);

    /**
     * This method wraps an event handler so that events are dropped once a stop is requested.
     *
     * @param[in] aHandler  The event handler.
     *
     * @returns The guarded event handler.
     *
     */
    template <typename EventType>
    std::function<void(const EventType &)> MakeHandler(std::function<void(const EventType &)> aHandler)
    {
        return [this, aHandler](const EventType &aEvent) {
            if (!IsStopRequested())
            {
                aHandler(aEvent);
            }
        };
    }

    /**
     * This method takes ownership of the channel handle and starts the delivery thread.
     *
     * @param[in] aSelf          A shared pointer to this dispatcher, kept by the delivery thread.
     * @param[in] aHandle        The channel handle to process.
     * @param[in] aErrorHandler  The handler of channel failures.
     *
     */
    static void Start(const std::shared_ptr<Dispatcher> &aSelf,
                      Channel::HandlePtr                 aHandle,
                      ErrorHandler                       aErrorHandler);

    /**
     * This method runs @p aTask with the channel handle on the delivery thread.
     *
     * A failure returned by @p aTask goes to the error handler.
     *
     * @param[in] aTask  The task to run.
     *
     */
    void Post(HandleTask aTask);

    /**
     * This method stops the delivery.
     *
     * No event handler starts after this method returns. When called from any delivery thread,
     * this one's or another dispatcher's, the running handler finishes and the thread exits on
     * its own. Otherwise this method waits for the thread to exit.
     *
     */
    void Stop(void);

    bool IsStopRequested(void) const { return mStopRequested.load(); }

    /**
     * This function indicates whether the calling thread is the delivery thread of any dispatcher.
     *
     */
    static bool IsDeliveryThread(void);

private:
    void Run(void);
    void ReportError(dnssdError aError);

    TaskRunner         mTaskRunner;
    Channel::HandlePtr mHandle;
    ErrorHandler       mErrorHandler;
    std::thread        mThread;
    std::atomic<bool>  mStopRequested;
    bool               mHandleFailed;
};

} // namespace dnssd

#endif // DNSSD_OP_DISPATCHER_HPP_
