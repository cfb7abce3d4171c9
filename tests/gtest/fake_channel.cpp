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

#include "fake_channel.hpp"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include "common/code_utils.hpp"

namespace dnssd {
namespace test {

constexpr const char *FakeChannel::kHostName;

FakeChannel::FakeHandle::FakeHandle(FakeChannel &aChannel, Kind aKind)
    : mChannel(aChannel)
    , mKind(aKind)
{
    VerifyOrDie(pipe(mPipe) != -1, strerror(errno));
    VerifyOrDie(fcntl(mPipe[0], F_SETFL, fcntl(mPipe[0], F_GETFL, 0) | O_NONBLOCK) != -1, strerror(errno));
    VerifyOrDie(fcntl(mPipe[1], F_SETFL, fcntl(mPipe[1], F_GETFL, 0) | O_NONBLOCK) != -1, strerror(errno));
}

FakeChannel::FakeHandle::~FakeHandle(void)
{
    mChannel.RemoveHandle(*this);
    close(mPipe[0]);
    close(mPipe[1]);
}

dnssdError FakeChannel::FakeHandle::Process(void)
{
    std::vector<std::function<void(void)>> events;
    dnssdError                             error;
    uint8_t                                n;

    while (read(mPipe[0], &n, sizeof(n)) == sizeof(n))
    {
    }

    {
        std::lock_guard<std::mutex> lock(mQueueMutex);

        error    = mFailure;
        mFailure = DNSSD_ERROR_NONE;
        events.swap(mQueue);
    }

    SuccessOrExit(error);

    for (std::function<void(void)> &event : events)
    {
        event();
    }

exit:
    return error;
}

dnssdError FakeChannel::FakeHandle::UpdateTxtData(const TxtData &aTxtData)
{
    dnssdError                  error = DNSSD_ERROR_NONE;
    std::lock_guard<std::mutex> lock(mChannel.mMutex);

    VerifyOrExit(mKind == Kind::kRegister, error = DNSSD_ERROR_NOT_IMPLEMENTED);

    mRegisterRequest.mTxtData = aTxtData;
    mChannel.mTxtUpdateCount++;
    mChannel.mLastTxtData = aTxtData;

    for (FakeHandle *handle : mChannel.mHandles)
    {
        if (handle->mKind == Kind::kResolve && mChannel.FindRegistrationLocked(handle->mResolveRequest.mName,
                                                                               handle->mResolveRequest.mType,
                                                                               handle->mResolveRequest.mDomain) == this)
        {
            mChannel.AnswerResolveLocked(*handle, *this);
        }
    }

exit:
    return error;
}

void FakeChannel::FakeHandle::Push(std::function<void(void)> aEvent)
{
    {
        std::lock_guard<std::mutex> lock(mQueueMutex);

        mQueue.push_back(std::move(aEvent));
    }

    Wakeup();
}

void FakeChannel::FakeHandle::Fail(dnssdError aError)
{
    {
        std::lock_guard<std::mutex> lock(mQueueMutex);

        mFailure = aError;
    }

    Wakeup();
}

void FakeChannel::FakeHandle::Wakeup(void)
{
    const uint8_t kOne = 1;
    ssize_t       rval;

    do
    {
        rval = write(mPipe[1], &kOne, sizeof(kOne));
    } while (rval == -1 && errno == EINTR);

    // A full pipe is already readable.
    VerifyOrDie(rval == sizeof(kOne) || errno == EAGAIN || errno == EWOULDBLOCK, strerror(errno));
}

std::string FakeChannel::NormalizeDomain(const std::string &aDomain)
{
    std::string domain = aDomain;

    if (!domain.empty() && domain.back() == '.')
    {
        domain.pop_back();
    }

    return domain.empty() ? std::string("local") : domain;
}

std::string FakeChannel::NormalizeType(const std::string &aType)
{
    std::string type = aType;

    if (!type.empty() && type.back() == '.')
    {
        type.pop_back();
    }

    return type;
}

FakeChannel::FakeHandle *FakeChannel::FindRegistrationLocked(const std::string &aName,
                                                             const std::string &aType,
                                                             const std::string &aDomain)
{
    FakeHandle *registration = nullptr;

    for (FakeHandle *handle : mHandles)
    {
        if (handle->mKind == Kind::kRegister && handle->mRegisteredName == aName &&
            NormalizeType(handle->mRegisterRequest.mType) == NormalizeType(aType) &&
            NormalizeDomain(handle->mRegisterRequest.mDomain) == NormalizeDomain(aDomain))
        {
            registration = handle;
            break;
        }
    }

    return registration;
}

void FakeChannel::AnnounceLocked(FakeHandle &aRegistration, bool aAdd)
{
    for (FakeHandle *handle : mHandles)
    {
        if (handle->mKind == Kind::kBrowse &&
            NormalizeType(handle->mBrowseRequest.mType) == NormalizeType(aRegistration.mRegisterRequest.mType) &&
            NormalizeDomain(handle->mBrowseRequest.mDomain) ==
                NormalizeDomain(aRegistration.mRegisterRequest.mDomain))
        {
            BrowseEvent event;

            event.mError          = DNSSD_ERROR_NONE;
            event.mAdd            = aAdd;
            event.mMoreComing     = false;
            event.mInterfaceIndex = aRegistration.mRegisterRequest.mInterfaceIndex;
            event.mName           = aRegistration.mRegisteredName;
            event.mType           = NormalizeType(aRegistration.mRegisterRequest.mType) + ".";
            event.mDomain         = NormalizeDomain(aRegistration.mRegisterRequest.mDomain) + ".";

            BrowseHandler handler = handle->mBrowseHandler;
            handle->Push([handler, event]() { handler(event); });
        }
        else if (aAdd && handle->mKind == Kind::kResolve &&
                 FindRegistrationLocked(handle->mResolveRequest.mName, handle->mResolveRequest.mType,
                                        handle->mResolveRequest.mDomain) == &aRegistration)
        {
            AnswerResolveLocked(*handle, aRegistration);
        }
    }
}

void FakeChannel::AnswerResolveLocked(FakeHandle &aResolution, const FakeHandle &aRegistration)
{
    const RegisterRequest &request = aRegistration.mRegisterRequest;
    ResolveEvent           event;

    event.mError          = DNSSD_ERROR_NONE;
    event.mMoreComing     = false;
    event.mInterfaceIndex = request.mInterfaceIndex;
    event.mFullName = aRegistration.mRegisteredName + "." + NormalizeType(request.mType) + "." +
                      NormalizeDomain(request.mDomain) + ".";
    event.mHostName = request.mHost.empty() ? std::string(kHostName) : request.mHost;
    event.mPort     = request.mPort;
    event.mTxtData  = request.mTxtData;

    ResolveHandler handler = aResolution.mResolveHandler;
    aResolution.Push([handler, event]() { handler(event); });
}

void FakeChannel::RemoveHandle(FakeHandle &aHandle)
{
    std::lock_guard<std::mutex> lock(mMutex);

    mHandles.remove(&aHandle);

    if (aHandle.mKind == Kind::kRegister && !aHandle.mRegisteredName.empty())
    {
        AnnounceLocked(aHandle, /* aAdd */ false);
    }
}

dnssdError FakeChannel::Register(const RegisterRequest &aRequest, RegisterHandler aHandler, HandlePtr &aHandle)
{
    dnssdError                  error = DNSSD_ERROR_NONE;
    std::lock_guard<std::mutex> lock(mMutex);
    std::unique_ptr<FakeHandle> handle;
    RegisterEvent               event;
    std::string                 name;

    SuccessOrExit(error = mOpenError);
    VerifyOrExit(!aRequest.mType.empty(), error = DNSSD_ERROR_INVALID_ARGS);

    handle.reset(new FakeHandle(*this, Kind::kRegister));
    handle->mRegisterRequest = aRequest;
    handle->mRegisterHandler = std::move(aHandler);

    name = aRequest.mName.empty() ? std::string("fake-service") : aRequest.mName;

    event.mError  = DNSSD_ERROR_NONE;
    event.mAdd    = true;
    event.mType   = NormalizeType(aRequest.mType) + ".";
    event.mDomain = NormalizeDomain(aRequest.mDomain) + ".";

    if (FindRegistrationLocked(name, aRequest.mType, aRequest.mDomain) != nullptr)
    {
        if (aRequest.mNoAutoRename)
        {
            event.mError = DNSSD_ERROR_DUPLICATED;
            event.mAdd   = false;
        }
        else
        {
            std::string base = name;

            for (int suffix = 2; FindRegistrationLocked(name, aRequest.mType, aRequest.mDomain) != nullptr; suffix++)
            {
                name = base + " (" + std::to_string(suffix) + ")";
            }
        }
    }

    event.mName = name;

    {
        RegisterHandler handler = handle->mRegisterHandler;
        handle->Push([handler, event]() { handler(event); });
    }

    mHandles.push_back(handle.get());

    if (event.mError == DNSSD_ERROR_NONE)
    {
        handle->mRegisteredName = name;
        AnnounceLocked(*handle, /* aAdd */ true);
    }

    aHandle = std::move(handle);

exit:
    return error;
}

dnssdError FakeChannel::Browse(const BrowseRequest &aRequest, BrowseHandler aHandler, HandlePtr &aHandle)
{
    dnssdError                  error = DNSSD_ERROR_NONE;
    std::lock_guard<std::mutex> lock(mMutex);
    std::unique_ptr<FakeHandle> handle;

    SuccessOrExit(error = mOpenError);
    VerifyOrExit(!aRequest.mType.empty(), error = DNSSD_ERROR_INVALID_ARGS);

    handle.reset(new FakeHandle(*this, Kind::kBrowse));
    handle->mBrowseRequest = aRequest;
    handle->mBrowseHandler = std::move(aHandler);
    mHandles.push_back(handle.get());

    for (FakeHandle *registration : mHandles)
    {
        if (registration->mKind == Kind::kRegister && !registration->mRegisteredName.empty() &&
            NormalizeType(registration->mRegisterRequest.mType) == NormalizeType(aRequest.mType) &&
            NormalizeDomain(registration->mRegisterRequest.mDomain) == NormalizeDomain(aRequest.mDomain))
        {
            BrowseEvent event;

            event.mError          = DNSSD_ERROR_NONE;
            event.mAdd            = true;
            event.mMoreComing     = false;
            event.mInterfaceIndex = registration->mRegisterRequest.mInterfaceIndex;
            event.mName           = registration->mRegisteredName;
            event.mType           = NormalizeType(aRequest.mType) + ".";
            event.mDomain         = NormalizeDomain(aRequest.mDomain) + ".";

            BrowseHandler handler = handle->mBrowseHandler;
            handle->Push([handler, event]() { handler(event); });
        }
    }

    aHandle = std::move(handle);

exit:
    return error;
}

dnssdError FakeChannel::Resolve(const ResolveRequest &aRequest, ResolveHandler aHandler, HandlePtr &aHandle)
{
    dnssdError                  error = DNSSD_ERROR_NONE;
    std::lock_guard<std::mutex> lock(mMutex);
    std::unique_ptr<FakeHandle> handle;
    FakeHandle                 *registration;

    SuccessOrExit(error = mOpenError);
    VerifyOrExit(!aRequest.mName.empty() && !aRequest.mType.empty(), error = DNSSD_ERROR_INVALID_ARGS);

    handle.reset(new FakeHandle(*this, Kind::kResolve));
    handle->mResolveRequest = aRequest;
    handle->mResolveHandler = std::move(aHandler);
    mHandles.push_back(handle.get());

    registration = FindRegistrationLocked(aRequest.mName, aRequest.mType, aRequest.mDomain);

    if (registration != nullptr)
    {
        AnswerResolveLocked(*handle, *registration);
    }

    aHandle = std::move(handle);

exit:
    return error;
}

dnssdError FakeChannel::Query(const QueryRequest &aRequest, QueryHandler aHandler, HandlePtr &aHandle)
{
    dnssdError                  error = DNSSD_ERROR_NONE;
    std::lock_guard<std::mutex> lock(mMutex);
    std::unique_ptr<FakeHandle> handle;
    std::vector<QueryEvent>     events;

    SuccessOrExit(error = mOpenError);
    VerifyOrExit(!aRequest.mFullName.empty(), error = DNSSD_ERROR_INVALID_ARGS);

    handle.reset(new FakeHandle(*this, Kind::kQuery));
    handle->mQueryRequest = aRequest;
    handle->mQueryHandler = std::move(aHandler);
    mHandles.push_back(handle.get());

    for (const Record &record : mRecords)
    {
        if (record.mFullName == aRequest.mFullName && record.mRrType == aRequest.mRrType &&
            record.mRrClass == aRequest.mRrClass)
        {
            QueryEvent event;

            event.mError          = DNSSD_ERROR_NONE;
            event.mAdd            = true;
            event.mMoreComing     = true;
            event.mInterfaceIndex = aRequest.mInterfaceIndex;
            event.mFullName       = record.mFullName;
            event.mRrType         = record.mRrType;
            event.mRrClass        = record.mRrClass;
            event.mRdata          = record.mRdata;
            event.mTtl            = 120;

            events.push_back(event);
        }
    }

    if (!events.empty())
    {
        events.back().mMoreComing = false;
    }

    for (const QueryEvent &event : events)
    {
        QueryHandler handler = handle->mQueryHandler;
        handle->Push([handler, event]() { handler(event); });
    }

    aHandle = std::move(handle);

exit:
    return error;
}

void FakeChannel::SetOpenError(dnssdError aError)
{
    std::lock_guard<std::mutex> lock(mMutex);

    mOpenError = aError;
}

void FakeChannel::AddRecord(const std::string   &aFullName,
                            uint16_t             aRrType,
                            uint16_t             aRrClass,
                            std::vector<uint8_t> aRdata)
{
    std::lock_guard<std::mutex> lock(mMutex);
    Record                      record;

    record.mFullName = aFullName;
    record.mRrType   = aRrType;
    record.mRrClass  = aRrClass;
    record.mRdata    = std::move(aRdata);

    for (FakeHandle *handle : mHandles)
    {
        const QueryRequest &request = handle->mQueryRequest;

        if (handle->mKind == Kind::kQuery && request.mFullName == aFullName && request.mRrType == aRrType &&
            request.mRrClass == aRrClass)
        {
            QueryEvent event;

            event.mError          = DNSSD_ERROR_NONE;
            event.mAdd            = true;
            event.mMoreComing     = false;
            event.mInterfaceIndex = request.mInterfaceIndex;
            event.mFullName       = record.mFullName;
            event.mRrType         = record.mRrType;
            event.mRrClass        = record.mRrClass;
            event.mRdata          = record.mRdata;
            event.mTtl            = 120;

            QueryHandler handler = handle->mQueryHandler;
            handle->Push([handler, event]() { handler(event); });
        }
    }

    mRecords.push_back(std::move(record));
}

void FakeChannel::InjectBrowseEvents(size_t aCount)
{
    std::lock_guard<std::mutex> lock(mMutex);

    for (FakeHandle *handle : mHandles)
    {
        if (handle->mKind != Kind::kBrowse)
        {
            continue;
        }

        for (size_t i = 0; i < aCount; i++)
        {
            BrowseEvent event;

            event.mError          = DNSSD_ERROR_NONE;
            event.mAdd            = true;
            event.mMoreComing     = (i + 1 < aCount);
            event.mInterfaceIndex = kInterfaceIndexLocalOnly;
            event.mName           = "injected-" + std::to_string(mInjectedCount++);
            event.mType           = NormalizeType(handle->mBrowseRequest.mType) + ".";
            event.mDomain         = NormalizeDomain(handle->mBrowseRequest.mDomain) + ".";

            BrowseHandler handler = handle->mBrowseHandler;
            handle->Push([handler, event]() { handler(event); });
        }
    }
}

void FakeChannel::FailProcessing(dnssdError aError)
{
    std::lock_guard<std::mutex> lock(mMutex);

    for (FakeHandle *handle : mHandles)
    {
        handle->Fail(aError);
    }
}

size_t FakeChannel::GetOpenHandleCount(void) const
{
    std::lock_guard<std::mutex> lock(mMutex);

    return mHandles.size();
}

size_t FakeChannel::GetTxtUpdateCount(void) const
{
    std::lock_guard<std::mutex> lock(mMutex);

    return mTxtUpdateCount;
}

TxtData FakeChannel::GetLastTxtData(void) const
{
    std::lock_guard<std::mutex> lock(mMutex);

    return mLastTxtData;
}

} // namespace test
} // namespace dnssd
