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
 *   This file implements the resource record query operation.
 */

#define DNSSD_LOG_TAG "QUERY"

#include "op/query_op.hpp"

#include "common/logging.hpp"

namespace dnssd {

QueryOp::QueryOp(uint32_t    aInterfaceIndex,
                 std::string aFullName,
                 uint16_t    aRrType,
                 uint16_t    aRrClass,
                 Callback    aCallback,
                 Channel    &aChannel)
    : Operation(aChannel, "query")
    , mInterfaceIndex(aInterfaceIndex)
    , mFullName(std::move(aFullName))
    , mRrType(aRrType)
    , mRrClass(aRrClass)
    , mCallback(std::move(aCallback))
{
}

QueryOp::~QueryOp(void)
{
    Stop();
}

dnssdError QueryOp::Open(Channel &aChannel, Dispatcher &aDispatcher, Channel::HandlePtr &aHandle)
{
    QueryRequest request;

    request.mInterfaceIndex = mInterfaceIndex;
    request.mFullName       = mFullName;
    request.mRrType         = mRrType;
    request.mRrClass        = mRrClass;

    return aChannel.Query(
        request, aDispatcher.MakeHandler<QueryEvent>([this](const QueryEvent &aEvent) { HandleQueryEvent(aEvent); }),
        aHandle);
}

void QueryOp::HandleChannelError(dnssdError aError)
{
    mCallback(*this, aError, /* aAdd */ false, /* aMore */ false, mInterfaceIndex, mFullName, mRrType, mRrClass,
              std::vector<uint8_t>(), /* aTtl */ 0);
}

void QueryOp::HandleQueryEvent(const QueryEvent &aEvent)
{
    dnssdDump(DNSSD_LOG_LEVEL_DEBG, DNSSD_LOG_TAG, aEvent.mFullName.c_str(), aEvent.mRdata.data(),
              aEvent.mRdata.size());

    mCallback(*this, aEvent.mError, aEvent.mAdd, aEvent.mMoreComing, aEvent.mInterfaceIndex, aEvent.mFullName,
              aEvent.mRrType, aEvent.mRrClass, aEvent.mRdata, aEvent.mTtl);
}

} // namespace dnssd
