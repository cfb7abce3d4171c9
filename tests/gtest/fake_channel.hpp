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
 *   This file includes definitions for an in-process discovery channel used by tests.
 */

#ifndef DNSSD_TESTS_FAKE_CHANNEL_HPP_
#define DNSSD_TESTS_FAKE_CHANNEL_HPP_

#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <vector>

#include "channel/channel.hpp"

namespace dnssd {
namespace test {

/**
 * This class implements a discovery channel that answers requests from an in-process registry.
 *
 * Registrations are announced to browsers and resolvers of the same channel. Events are
 * queued on the handle of each request and delivered when the handle is processed.
 *
 */
class FakeChannel : public Channel
{
public:
    static constexpr const char *kHostName = "fake-host.local.";

    FakeChannel(void)  = default;
    ~FakeChannel(void) = default;

    dnssdError Register(const RegisterRequest &aRequest, RegisterHandler aHandler, HandlePtr &aHandle) override;
    dnssdError Browse(const BrowseRequest &aRequest, BrowseHandler aHandler, HandlePtr &aHandle) override;
    dnssdError Resolve(const ResolveRequest &aRequest, ResolveHandler aHandler, HandlePtr &aHandle) override;
    dnssdError Query(const QueryRequest &aRequest, QueryHandler aHandler, HandlePtr &aHandle) override;

    /**
     * This method makes every following request fail with @p aError until it is set back to DNSSD_ERROR_NONE.
     *
     */
    void SetOpenError(dnssdError aError);

    /**
     * This method adds a record answered to queries of its name, type and class, open ones included.
     *
     */
    void AddRecord(const std::string &aFullName, uint16_t aRrType, uint16_t aRrClass, std::vector<uint8_t> aRdata);

    /**
     * This method queues @p aCount browse events of made-up instances on every open browse request.
     *
     */
    void InjectBrowseEvents(size_t aCount);

    /**
     * This method makes the next processing of every open request fail with @p aError.
     *
     */
    void FailProcessing(dnssdError aError);

    size_t  GetOpenHandleCount(void) const;
    size_t  GetTxtUpdateCount(void) const;
    TxtData GetLastTxtData(void) const;

private:
    enum class Kind : uint8_t
    {
        kRegister,
        kBrowse,
        kResolve,
        kQuery,
    };

    class FakeHandle : public Handle
    {
    public:
        FakeHandle(FakeChannel &aChannel, Kind aKind);
        ~FakeHandle(void) override;

        int        GetFd(void) const override { return mPipe[0]; }
        dnssdError Process(void) override;
        dnssdError UpdateTxtData(const TxtData &aTxtData) override;

        void Push(std::function<void(void)> aEvent);
        void Fail(dnssdError aError);

        FakeChannel    &mChannel;
        Kind            mKind;
        RegisterRequest mRegisterRequest;
        BrowseRequest   mBrowseRequest;
        ResolveRequest  mResolveRequest;
        QueryRequest    mQueryRequest;
        std::string     mRegisteredName;
        RegisterHandler mRegisterHandler;
        BrowseHandler   mBrowseHandler;
        ResolveHandler  mResolveHandler;
        QueryHandler    mQueryHandler;

    private:
        void Wakeup(void);

        int                                    mPipe[2];
        std::mutex                             mQueueMutex;
        std::vector<std::function<void(void)>> mQueue;
        dnssdError                             mFailure = DNSSD_ERROR_NONE;
    };

    struct Record
    {
        std::string          mFullName;
        uint16_t             mRrType;
        uint16_t             mRrClass;
        std::vector<uint8_t> mRdata;
    };

    static std::string NormalizeDomain(const std::string &aDomain);
    static std::string NormalizeType(const std::string &aType);

    FakeHandle *FindRegistrationLocked(const std::string &aName, const std::string &aType, const std::string &aDomain);
    void        AnnounceLocked(FakeHandle &aRegistration, bool aAdd);
    void        AnswerResolveLocked(FakeHandle &aResolution, const FakeHandle &aRegistration);
    void        RemoveHandle(FakeHandle &aHandle);

    mutable std::mutex     mMutex;
    std::list<FakeHandle *> mHandles;
    std::vector<Record>    mRecords;
    dnssdError             mOpenError      = DNSSD_ERROR_NONE;
    size_t                 mTxtUpdateCount = 0;
    TxtData                mLastTxtData;
    size_t                 mInjectedCount  = 0;
};

} // namespace test
} // namespace dnssd

#endif // DNSSD_TESTS_FAKE_CHANNEL_HPP_
