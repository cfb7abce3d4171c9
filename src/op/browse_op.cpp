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
 *   This file implements the service browsing operation.
 */

#define DNSSD_LOG_TAG "BROWSE"

#include "op/browse_op.hpp"

#include <inttypes.h>

#include "common/logging.hpp"

namespace dnssd {

BrowseOp::BrowseOp(std::string aType, Callback aCallback, Channel &aChannel)
    : Operation(aChannel, "browse")
    , mType(std::move(aType))
    , mCallback(std::move(aCallback))
    , mInterfaceIndex(kInterfaceIndexAny)
{
}

BrowseOp::~BrowseOp(void)
{
    Stop();
}

dnssdError BrowseOp::SetDomain(const std::string &aDomain)
{
    dnssdError                  error = DNSSD_ERROR_NONE;
    std::lock_guard<std::mutex> lock(mMutex);

    VerifyOrExit(!IsActiveLocked(), error = DNSSD_ERROR_STARTED);
    mDomain = aDomain;

exit:
    return error;
}

dnssdError BrowseOp::SetInterfaceIndex(uint32_t aInterfaceIndex)
{
    dnssdError                  error = DNSSD_ERROR_NONE;
    std::lock_guard<std::mutex> lock(mMutex);

    VerifyOrExit(!IsActiveLocked(), error = DNSSD_ERROR_STARTED);
    mInterfaceIndex = aInterfaceIndex;

exit:
    return error;
}

std::string BrowseOp::GetDomain(void) const
{
    std::lock_guard<std::mutex> lock(mMutex);

    return mDomain;
}

uint32_t BrowseOp::GetInterfaceIndex(void) const
{
    std::lock_guard<std::mutex> lock(mMutex);

    return mInterfaceIndex;
}

dnssdError BrowseOp::Open(Channel &aChannel, Dispatcher &aDispatcher, Channel::HandlePtr &aHandle)
{
    BrowseRequest request;

    request.mInterfaceIndex = mInterfaceIndex;
    request.mType           = mType;
    request.mDomain         = mDomain;

    return aChannel.Browse(
        request,
        aDispatcher.MakeHandler<BrowseEvent>([this](const BrowseEvent &aEvent) { HandleBrowseEvent(aEvent); }),
        aHandle);
}

void BrowseOp::HandleChannelError(dnssdError aError)
{
    mCallback(*this, aError, /* aAdd */ false, GetInterfaceIndex(), std::string(), mType, GetDomain());
}

void BrowseOp::HandleBrowseEvent(const BrowseEvent &aEvent)
{
    dnssdLogDebg("Instance %s.%s%s %s on inf %" PRIu32, aEvent.mName.c_str(), aEvent.mType.c_str(),
                 aEvent.mDomain.c_str(), aEvent.mAdd ? "added" : "removed", aEvent.mInterfaceIndex);

    mCallback(*this, aEvent.mError, aEvent.mAdd, aEvent.mInterfaceIndex, aEvent.mName, aEvent.mType, aEvent.mDomain);
}

} // namespace dnssd
