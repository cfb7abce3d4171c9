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
 *   This file implements the callback dispatcher of an active operation.
 */

#define DNSSD_LOG_TAG "DISP"

#include "op/dispatcher.hpp"

#include <errno.h>
#include <string.h>

#include "common/logging.hpp"
#include "common/time.hpp"

namespace dnssd {

// Set for the whole life of a delivery thread. Joining from a delivery thread could wait on a
// thread which is itself joining this one.
static thread_local bool sIsDeliveryThread = false;

Dispatcher::Dispatcher(void)
    : mStopRequested(false)
    , mHandleFailed(false)
{
}

Dispatcher::~Dispatcher(void)
{
    if (mThread.joinable())
    {
        mStopRequested = true;

        if (IsDeliveryThread())
        {
            mThread.detach();
        }
        else
        {
            mTaskRunner.Post([]() {});
            mThread.join();
        }
    }
}

void Dispatcher::Start(const std::shared_ptr<Dispatcher> &aSelf, Channel::HandlePtr aHandle, ErrorHandler aErrorHandler)
{
    std::shared_ptr<Dispatcher> self = aSelf;

    assert(aHandle != nullptr);

    self->mHandle       = std::move(aHandle);
    self->mErrorHandler = std::move(aErrorHandler);

    // The delivery thread keeps the dispatcher alive, a stop requested from within a handler
    // lets the thread finish on its own.
    self->mThread = std::thread([self]() { self->Run(); });
}

void Dispatcher::Post(HandleTask aTask)
{
    mTaskRunner.Post([this, aTask]() {
        dnssdError error = aTask(*mHandle);

        if (error != DNSSD_ERROR_NONE)
        {
            ReportError(error);
        }
    });
}

void Dispatcher::Stop(void)
{
    mStopRequested = true;

    VerifyOrExit(mThread.joinable());

    // Wake up the select() of the delivery thread, which drops the remaining events.
    mTaskRunner.Post([]() {});

    if (IsDeliveryThread())
    {
        mThread.detach();
    }
    else
    {
        mThread.join();
    }

exit:
    return;
}

bool Dispatcher::IsDeliveryThread(void)
{
    return sIsDeliveryThread;
}

void Dispatcher::Run(void)
{
    sIsDeliveryThread = true;

    while (!IsStopRequested())
    {
        MainloopContext mainloop;
        int             fd = mHandleFailed ? -1 : mHandle->GetFd();
        int             rval;

        mainloop.Reset(GetTimeval(Milliseconds(DNSSD_CONFIG_DISPATCH_POLL_TIMEOUT_MS)));
        mTaskRunner.Update(mainloop);

        if (fd >= 0)
        {
            mainloop.AddFdToReadSet(fd);
        }

        rval = select(mainloop.mMaxFd + 1, &mainloop.mReadFdSet, &mainloop.mWriteFdSet, &mainloop.mErrorFdSet,
                      &mainloop.mTimeout);

        if (rval < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }

            dnssdLogCrit("select() failed: %s", strerror(errno));
            ReportError(DNSSD_ERROR_ERRNO);
            break;
        }

        mTaskRunner.Process(mainloop);

        if (IsStopRequested())
        {
            break;
        }

        if (fd >= 0 && FD_ISSET(fd, &mainloop.mReadFdSet))
        {
            dnssdError error = mHandle->Process();

            if (error != DNSSD_ERROR_NONE)
            {
                // The connection to the responder is gone, stop watching it until the operation is restarted.
                mHandleFailed = true;
                ReportError(error);
            }
        }
    }

    mTaskRunner.Clear();
    mHandle.reset();
}

void Dispatcher::ReportError(dnssdError aError)
{
    dnssdLogWarn("Channel failure: %s", dnssdErrorString(aError));

    if (!IsStopRequested() && mErrorHandler)
    {
        mErrorHandler(aError);
    }
}

} // namespace dnssd
