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
 *   This file implements the service registration operation.
 */

#define DNSSD_LOG_TAG "REG"

#include "op/register_op.hpp"

#include "common/logging.hpp"

namespace dnssd {

RegisterOp::RegisterOp(std::string aName, std::string aType, uint16_t aPort, Callback aCallback, Channel &aChannel)
    : Operation(aChannel, "register")
    , mName(std::move(aName))
    , mType(std::move(aType))
    , mPort(aPort)
    , mCallback(std::move(aCallback))
    , mInterfaceIndex(kInterfaceIndexAny)
    , mNoAutoRename(false)
{
}

RegisterOp::~RegisterOp(void)
{
    Stop();
}

dnssdError RegisterOp::SetTXTPair(const std::string &aKey, const std::string &aValue)
{
    dnssdError                  error;
    std::lock_guard<std::mutex> lock(mMutex);

    SuccessOrExit(error = mTxt.SetPair(aKey, aValue));
    UpdateTxtLocked();

exit:
    return error;
}

dnssdError RegisterOp::DeleteTXTPair(const std::string &aKey)
{
    dnssdError                  error;
    std::lock_guard<std::mutex> lock(mMutex);
    size_t                      length = mTxt.GetLength();

    SuccessOrExit(error = mTxt.DeletePair(aKey));
    VerifyOrExit(mTxt.GetLength() != length);
    UpdateTxtLocked();

exit:
    return error;
}

dnssdError RegisterOp::SetNoAutoRename(bool aNoAutoRename)
{
    dnssdError                  error = DNSSD_ERROR_NONE;
    std::lock_guard<std::mutex> lock(mMutex);

    VerifyOrExit(!IsActiveLocked(), error = DNSSD_ERROR_STARTED);
    mNoAutoRename = aNoAutoRename;

exit:
    return error;
}

dnssdError RegisterOp::SetInterfaceIndex(uint32_t aInterfaceIndex)
{
    dnssdError                  error = DNSSD_ERROR_NONE;
    std::lock_guard<std::mutex> lock(mMutex);

    VerifyOrExit(!IsActiveLocked(), error = DNSSD_ERROR_STARTED);
    mInterfaceIndex = aInterfaceIndex;

exit:
    return error;
}

dnssdError RegisterOp::SetDomain(const std::string &aDomain)
{
    dnssdError                  error = DNSSD_ERROR_NONE;
    std::lock_guard<std::mutex> lock(mMutex);

    VerifyOrExit(!IsActiveLocked(), error = DNSSD_ERROR_STARTED);
    mDomain = aDomain;

exit:
    return error;
}

dnssdError RegisterOp::SetHost(const std::string &aHost)
{
    dnssdError                  error = DNSSD_ERROR_NONE;
    std::lock_guard<std::mutex> lock(mMutex);

    VerifyOrExit(!IsActiveLocked(), error = DNSSD_ERROR_STARTED);
    mHost = aHost;

exit:
    return error;
}

std::string RegisterOp::GetDomain(void) const
{
    std::lock_guard<std::mutex> lock(mMutex);

    return mDomain;
}

std::string RegisterOp::GetHost(void) const
{
    std::lock_guard<std::mutex> lock(mMutex);

    return mHost;
}

uint32_t RegisterOp::GetInterfaceIndex(void) const
{
    std::lock_guard<std::mutex> lock(mMutex);

    return mInterfaceIndex;
}

bool RegisterOp::IsNoAutoRename(void) const
{
    std::lock_guard<std::mutex> lock(mMutex);

    return mNoAutoRename;
}

size_t RegisterOp::GetTxtLength(void) const
{
    std::lock_guard<std::mutex> lock(mMutex);

    return mTxt.GetLength();
}

TxtData RegisterOp::GetTxtData(void) const
{
    std::lock_guard<std::mutex> lock(mMutex);

    return mTxt.GetData();
}

void RegisterOp::UpdateTxtLocked(void)
{
    TxtData txtData = mTxt.GetData();

    VerifyOrExit(IsActiveLocked());

    dnssdLogInfo("Queue TXT update of %s.%s (%zuB)", mName.c_str(), mType.c_str(), txtData.size());
    PostToDispatcher([txtData](Channel::Handle &aHandle) { return aHandle.UpdateTxtData(txtData); });

exit:
    return;
}

dnssdError RegisterOp::Open(Channel &aChannel, Dispatcher &aDispatcher, Channel::HandlePtr &aHandle)
{
    RegisterRequest request;

    request.mName           = mName;
    request.mType           = mType;
    request.mDomain         = mDomain;
    request.mHost           = mHost;
    request.mPort           = mPort;
    request.mInterfaceIndex = mInterfaceIndex;
    request.mNoAutoRename   = mNoAutoRename;
    request.mTxtData        = mTxt.GetData();

    return aChannel.Register(request,
                             aDispatcher.MakeHandler<RegisterEvent>(
                                 [this](const RegisterEvent &aEvent) { HandleRegisterEvent(aEvent); }),
                             aHandle);
}

void RegisterOp::HandleChannelError(dnssdError aError)
{
    std::string domain = GetDomain();

    mCallback(*this, aError, /* aAdd */ false, mName, mType, domain);
}

void RegisterOp::HandleRegisterEvent(const RegisterEvent &aEvent)
{
    dnssdLogInfo("Service %s.%s%s %s: %s", aEvent.mName.c_str(), aEvent.mType.c_str(), aEvent.mDomain.c_str(),
                 aEvent.mAdd ? "registered" : "removed", dnssdErrorString(aEvent.mError));

    mCallback(*this, aEvent.mError, aEvent.mAdd, aEvent.mName, aEvent.mType, aEvent.mDomain);
}

} // namespace dnssd
