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
 *   This file implements the operation state machine.
 */

#define DNSSD_LOG_TAG "OP"

#include "op/operation.hpp"

#include "common/logging.hpp"

namespace dnssd {

Operation::Operation(Channel &aChannel, const char *aKind)
    : mChannel(aChannel)
    , mKind(aKind)
    , mState(State::kIdle)
{
}

Operation::~Operation(void)
{
    Stop();
}

dnssdError Operation::Start(void)
{
    dnssdError                  error = DNSSD_ERROR_NONE;
    std::shared_ptr<Dispatcher> dispatcher;
    Channel::HandlePtr          handle;
    std::lock_guard<std::mutex> lock(mMutex);

    VerifyOrExit(mState == State::kIdle, error = DNSSD_ERROR_STARTED);

    dispatcher = std::make_shared<Dispatcher>();
    SuccessOrExit(error = Open(mChannel, *dispatcher, handle));
    VerifyOrExit(handle != nullptr, error = DNSSD_ERROR_INVALID_STATE);

    Dispatcher::Start(dispatcher, std::move(handle), dispatcher->MakeHandler<dnssdError>(
                                                         [this](const dnssdError &aError) { HandleChannelError(aError); }));

    mDispatcher = std::move(dispatcher);
    mState      = State::kActive;

exit:
    if (error == DNSSD_ERROR_STARTED)
    {
        dnssdLogDebg("%s operation %p is already active", mKind, static_cast<void *>(this));
    }
    else
    {
        dnssdLogResult(error, "Start %s operation %p", mKind, static_cast<void *>(this));
    }
    return error;
}

bool Operation::IsActive(void) const
{
    std::lock_guard<std::mutex> lock(mMutex);

    return IsActiveLocked();
}

void Operation::Stop(void)
{
    std::shared_ptr<Dispatcher> dispatcher;

    // The braces here are necessary for auto-releasing of the mutex, the dispatcher is
    // stopped without it so that an in-flight callback can still use this operation.
    {
        std::lock_guard<std::mutex> lock(mMutex);

        VerifyOrExit(mState == State::kActive);

        dispatcher = std::move(mDispatcher);
        mState     = State::kIdle;
    }

    dispatcher->Stop();
    dnssdLogInfo("Stopped %s operation %p", mKind, static_cast<void *>(this));

exit:
    return;
}

void Operation::PostToDispatcher(Dispatcher::HandleTask aTask)
{
    assert(mState == State::kActive);

    mDispatcher->Post(std::move(aTask));
}

} // namespace dnssd
