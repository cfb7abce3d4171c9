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
 *   This file includes definition for the discovery channel based on mDNSResponder.
 */

#ifndef DNSSD_CHANNEL_CHANNEL_MDNSSD_HPP_
#define DNSSD_CHANNEL_CHANNEL_MDNSSD_HPP_

#include "dnssd/config.h"

#include <string>

#include <dns_sd.h>

#include "channel/channel.hpp"
#include "common/code_utils.hpp"
#include "common/types.hpp"

namespace dnssd {

/**
 * This class implements the discovery channel with mDNSResponder.
 *
 * Every request owns its own `DNSServiceRef`, so handles of different requests may be
 * processed on different threads.
 *
 */
class ChannelMDnsSd : public Channel
{
public:
    // Implementation of Channel.

    dnssdError Register(const RegisterRequest &aRequest, RegisterHandler aHandler, HandlePtr &aHandle) override;
    dnssdError Browse(const BrowseRequest &aRequest, BrowseHandler aHandler, HandlePtr &aHandle) override;
    dnssdError Resolve(const ResolveRequest &aRequest, ResolveHandler aHandler, HandlePtr &aHandle) override;
    dnssdError Query(const QueryRequest &aRequest, QueryHandler aHandler, HandlePtr &aHandle) override;

private:
    class ServiceRef : public Handle
    {
    public:
        ~ServiceRef(void) override { Release(); }

        int        GetFd(void) const override;
        dnssdError Process(void) override;

    protected:
        void Release(void);

        DNSServiceRef mServiceRef = nullptr;
    };

    class ServiceRegistration : public ServiceRef
    {
    public:
        explicit ServiceRegistration(RegisterHandler aHandler)
            : mHandler(std::move(aHandler))
        {
        }

        DNSServiceErrorType Register(const RegisterRequest &aRequest);
        dnssdError          UpdateTxtData(const TxtData &aTxtData) override;

    private:
        static void HandleRegisterResult(DNSServiceRef       aServiceRef,
                                         DNSServiceFlags     aFlags,
                                         DNSServiceErrorType aError,
                                         const char         *aName,
                                         const char         *aType,
                                         const char         *aDomain,
                                         void               *aContext);
        void        HandleRegisterResult(DNSServiceFlags     aFlags,
                                         DNSServiceErrorType aError,
                                         const char         *aName,
                                         const char         *aType,
                                         const char         *aDomain);

        RegisterHandler mHandler;
    };

    class ServiceBrowsing : public ServiceRef
    {
    public:
        explicit ServiceBrowsing(BrowseHandler aHandler)
            : mHandler(std::move(aHandler))
        {
        }

        DNSServiceErrorType Browse(const BrowseRequest &aRequest);

    private:
        static void HandleBrowseResult(DNSServiceRef       aServiceRef,
                                       DNSServiceFlags     aFlags,
                                       uint32_t            aInterfaceIndex,
                                       DNSServiceErrorType aErrorCode,
                                       const char         *aInstanceName,
                                       const char         *aType,
                                       const char         *aDomain,
                                       void               *aContext);
        void        HandleBrowseResult(DNSServiceFlags     aFlags,
                                       uint32_t            aInterfaceIndex,
                                       DNSServiceErrorType aErrorCode,
                                       const char         *aInstanceName,
                                       const char         *aType,
                                       const char         *aDomain);

        BrowseHandler mHandler;
    };

    class ServiceResolution : public ServiceRef
    {
    public:
        explicit ServiceResolution(ResolveHandler aHandler)
            : mHandler(std::move(aHandler))
        {
        }

        DNSServiceErrorType Resolve(const ResolveRequest &aRequest);

    private:
        static void HandleResolveResult(DNSServiceRef        aServiceRef,
                                        DNSServiceFlags      aFlags,
                                        uint32_t             aInterfaceIndex,
                                        DNSServiceErrorType  aErrorCode,
                                        const char          *aFullName,
                                        const char          *aHostTarget,
                                        uint16_t             aPort, // In network byte order.
                                        uint16_t             aTxtLen,
                                        const unsigned char *aTxtRecord,
                                        void                *aContext);
        void        HandleResolveResult(DNSServiceFlags      aFlags,
                                        uint32_t             aInterfaceIndex,
                                        DNSServiceErrorType  aErrorCode,
                                        const char          *aFullName,
                                        const char          *aHostTarget,
                                        uint16_t             aPort, // In network byte order.
                                        uint16_t             aTxtLen,
                                        const unsigned char *aTxtRecord);

        ResolveHandler mHandler;
    };

    class RecordQuery : public ServiceRef
    {
    public:
        explicit RecordQuery(QueryHandler aHandler)
            : mHandler(std::move(aHandler))
        {
        }

        DNSServiceErrorType Query(const QueryRequest &aRequest);

    private:
        static void HandleQueryResult(DNSServiceRef       aServiceRef,
                                      DNSServiceFlags     aFlags,
                                      uint32_t            aInterfaceIndex,
                                      DNSServiceErrorType aErrorCode,
                                      const char         *aFullName,
                                      uint16_t            aRrType,
                                      uint16_t            aRrClass,
                                      uint16_t            aRdLen,
                                      const void         *aRdata,
                                      uint32_t            aTtl,
                                      void               *aContext);
        void        HandleQueryResult(DNSServiceFlags     aFlags,
                                      uint32_t            aInterfaceIndex,
                                      DNSServiceErrorType aErrorCode,
                                      const char         *aFullName,
                                      uint16_t            aRrType,
                                      uint16_t            aRrClass,
                                      uint16_t            aRdLen,
                                      const void         *aRdata,
                                      uint32_t            aTtl);

        QueryHandler mHandler;
    };
};

} // namespace dnssd

#endif // DNSSD_CHANNEL_CHANNEL_MDNSSD_HPP_
