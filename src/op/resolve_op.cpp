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
 *   This file implements the service instance resolution operation.
 */

#define DNSSD_LOG_TAG "RESOLVE"

#include "op/resolve_op.hpp"

#include "common/logging.hpp"

namespace dnssd {

ResolveOp::ResolveOp(uint32_t    aInterfaceIndex,
                     std::string aName,
                     std::string aType,
                     std::string aDomain,
                     Callback    aCallback,
                     Channel    &aChannel)
    : Operation(aChannel, "resolve")
    , mInterfaceIndex(aInterfaceIndex)
    , mName(std::move(aName))
    , mType(std::move(aType))
    , mDomain(std::move(aDomain))
    , mCallback(std::move(aCallback))
{
}

ResolveOp::~ResolveOp(void)
{
    Stop();
}

dnssdError ResolveOp::Open(Channel &aChannel, Dispatcher &aDispatcher, Channel::HandlePtr &aHandle)
{
    ResolveRequest request;

    request.mInterfaceIndex = mInterfaceIndex;
    request.mName           = mName;
    request.mType           = mType;
    request.mDomain         = mDomain;

    return aChannel.Resolve(
        request,
        aDispatcher.MakeHandler<ResolveEvent>([this](const ResolveEvent &aEvent) { HandleResolveEvent(aEvent); }),
        aHandle);
}

void ResolveOp::HandleChannelError(dnssdError aError)
{
    mCallback(*this, aError, std::string(), /* aPort */ 0, TxtMap());
}

void ResolveOp::HandleResolveEvent(const ResolveEvent &aEvent)
{
    TxtMap txt;

    if (aEvent.mError == DNSSD_ERROR_NONE)
    {
        txt = DecodeTxtData(aEvent.mTxtData);
        dnssdLogDebg("Resolved %s to %s:%u with %zu TXT pairs", aEvent.mFullName.c_str(), aEvent.mHostName.c_str(),
                     aEvent.mPort, txt.size());
    }

    mCallback(*this, aEvent.mError, aEvent.mHostName, aEvent.mPort, txt);
}

} // namespace dnssd
