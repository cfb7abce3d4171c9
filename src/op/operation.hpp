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
 *   This file includes definitions for the operation state machine shared by all operation kinds.
 */

#ifndef DNSSD_OP_OPERATION_HPP_
#define DNSSD_OP_OPERATION_HPP_

#include "dnssd/config.h"

#include <memory>
#include <mutex>

#include "channel/channel.hpp"
#include "common/code_utils.hpp"
#include "common/types.hpp"
#include "op/dispatcher.hpp"

namespace dnssd {

/**
 * This class implements the Start/Active/Stop lifecycle of a discovery operation.
 *
 * `Start()`, `IsActive()` and `Stop()` may be called from any thread, including from within
 * the callback of any operation. Callbacks are invoked without the operation lock held.
 *
 */
class Operation : private NonCopyable
{
public:
    enum class State : uint8_t
    {
        kIdle,   ///< The channel is closed.
        kActive, ///< The channel is open and events are delivered.
    };

    virtual ~Operation(void);

    /**
     * This method opens the discovery channel and starts delivering events to the callback.
     *
     * It returns as soon as the channel accepted the request.
     *
     * @retval DNSSD_ERROR_NONE     Successfully started the operation.
     * @retval DNSSD_ERROR_STARTED  The operation is already active, it is left untouched.
     * @retval ...                  The responder rejected the request.
     *
     */
    dnssdError Start(void);

    /**
     * This method indicates whether the operation is active.
     *
     */
    bool IsActive(void) const;

    /**
     * This method closes the discovery channel.
     *
     * No callback of this operation starts after this method returns. It does nothing when the
     * operation is not active.
     *
     */
    void Stop(void);

protected:
    Operation(Channel &aChannel, const char *aKind);

    /**
     * This method opens the channel request of this operation.
     *
     * It is called with `mMutex` held. Event handlers must be wrapped by `aDispatcher.MakeHandler()`.
     *
     * @param[in]  aChannel     The discovery channel.
     * @param[in]  aDispatcher  The dispatcher that will deliver the events.
     * @param[out] aHandle      The handle of the open request.
     *
     */
    virtual dnssdError Open(Channel &aChannel, Dispatcher &aDispatcher, Channel::HandlePtr &aHandle) = 0;

    /**
     * This method delivers a channel failure to the callback.
     *
     * It is called on the delivery thread without `mMutex` held.
     *
     * @param[in] aError  The failure.
     *
     */
    virtual void HandleChannelError(dnssdError aError) = 0;

    /**
     * This method runs @p aTask with the channel handle on the delivery thread.
     *
     * It must be called with `mMutex` held while the operation is active.
     *
     * @param[in] aTask  The task to run.
     *
     */
    void PostToDispatcher(Dispatcher::HandleTask aTask);

    bool IsActiveLocked(void) const { return mState == State::kActive; }

    mutable std::mutex mMutex;

private:
    Channel                    &mChannel;
    const char                 *mKind;
    State                       mState;
    std::shared_ptr<Dispatcher> mDispatcher;
};

} // namespace dnssd

#endif // DNSSD_OP_OPERATION_HPP_
