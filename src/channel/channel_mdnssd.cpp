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
 *   This file implements the discovery channel based on mDNSResponder.
 */

#define DNSSD_LOG_TAG "MDNS"

#include "channel/channel_mdnssd.hpp"

#include <arpa/inet.h>
#include <assert.h>
#include <inttypes.h>
#include <netinet/in.h>

#include "common/code_utils.hpp"
#include "common/logging.hpp"

namespace dnssd {

static_assert(kInterfaceIndexAny == kDNSServiceInterfaceIndexAny, "kInterfaceIndexAny mismatch");
static_assert(kInterfaceIndexLocalOnly == kDNSServiceInterfaceIndexLocalOnly, "kInterfaceIndexLocalOnly mismatch");
static_assert(kInterfaceIndexUnicast == kDNSServiceInterfaceIndexUnicast, "kInterfaceIndexUnicast mismatch");
static_assert(kInterfaceIndexP2P == kDNSServiceInterfaceIndexP2P, "kInterfaceIndexP2P mismatch");

static dnssdError DNSErrorToDnssdError(DNSServiceErrorType aError)
{
    dnssdError error;

    switch (aError)
    {
    case kDNSServiceErr_NoError:
        error = DNSSD_ERROR_NONE;
        break;

    case kDNSServiceErr_NoSuchKey:
    case kDNSServiceErr_NoSuchName:
    case kDNSServiceErr_NoSuchRecord:
        error = DNSSD_ERROR_NOT_FOUND;
        break;

    case kDNSServiceErr_Invalid:
    case kDNSServiceErr_BadParam:
    case kDNSServiceErr_BadFlags:
    case kDNSServiceErr_BadInterfaceIndex:
        error = DNSSD_ERROR_INVALID_ARGS;
        break;

    case kDNSServiceErr_NameConflict:
    case kDNSServiceErr_AlreadyRegistered:
        error = DNSSD_ERROR_DUPLICATED;
        break;

    case kDNSServiceErr_Unsupported:
        error = DNSSD_ERROR_NOT_IMPLEMENTED;
        break;

    case kDNSServiceErr_ServiceNotRunning:
    case kDNSServiceErr_BadState:
    case kDNSServiceErr_BadReference:
    case kDNSServiceErr_NotInitialized:
        error = DNSSD_ERROR_INVALID_STATE;
        break;

    case kDNSServiceErr_NoMemory:
        error = DNSSD_ERROR_NO_MEMORY;
        break;

    case kDNSServiceErr_Refused:
    case kDNSServiceErr_NoAuth:
    case kDNSServiceErr_Firewall:
        error = DNSSD_ERROR_REFUSED;
        break;

    case kDNSServiceErr_Timeout:
        error = DNSSD_ERROR_TIMEOUT;
        break;

    default:
        error = DNSSD_ERROR_MDNS;
        break;
    }

    return error;
}

static const char *DNSErrorToString(DNSServiceErrorType aError)
{
    switch (aError)
    {
    case kDNSServiceErr_NoError:
        return "OK";

    case kDNSServiceErr_Unknown:
        // 0xFFFE FFFF
        return "Unknown";

    case kDNSServiceErr_NoSuchName:
        return "No Such Name";

    case kDNSServiceErr_NoMemory:
        return "No Memory";

    case kDNSServiceErr_BadParam:
        return "Bad Param";

    case kDNSServiceErr_BadReference:
        return "Bad Reference";

    case kDNSServiceErr_BadState:
        return "Bad State";

    case kDNSServiceErr_BadFlags:
        return "Bad Flags";

    case kDNSServiceErr_Unsupported:
        return "Unsupported";

    case kDNSServiceErr_NotInitialized:
        return "Not Initialized";

    case kDNSServiceErr_AlreadyRegistered:
        return "Already Registered";

    case kDNSServiceErr_NameConflict:
        return "Name Conflict";

    case kDNSServiceErr_Invalid:
        return "Invalid";

    case kDNSServiceErr_Firewall:
        return "Firewall";

    case kDNSServiceErr_Incompatible:
        // client library incompatible with daemon
        return "Incompatible";

    case kDNSServiceErr_BadInterfaceIndex:
        return "Bad Interface Index";

    case kDNSServiceErr_Refused:
        return "Refused";

    case kDNSServiceErr_NoSuchRecord:
        return "No Such Record";

    case kDNSServiceErr_NoAuth:
        return "No Auth";

    case kDNSServiceErr_NoSuchKey:
        return "No Such Key";

    case kDNSServiceErr_NATTraversal:
        return "NAT Traversal";

    case kDNSServiceErr_DoubleNAT:
        return "Double NAT";

    case kDNSServiceErr_BadTime:
        // Codes up to here existed in Tiger
        return "Bad Time";

    case kDNSServiceErr_BadSig:
        return "Bad Sig";

    case kDNSServiceErr_BadKey:
        return "Bad Key";

    case kDNSServiceErr_Transient:
        return "Transient";

    case kDNSServiceErr_ServiceNotRunning:
        // Background daemon not running
        return "Service Not Running";

    case kDNSServiceErr_NATPortMappingUnsupported:
        // NAT doesn't support NAT-PMP or UPnP
        return "NAT Port Mapping Unsupported";

    case kDNSServiceErr_NATPortMappingDisabled:
        // NAT supports NAT-PMP or UPnP but it's disabled by the administrator
        return "NAT Port Mapping Disabled";

    case kDNSServiceErr_NoRouter:
        // No router currently configured (probably no network connectivity)
        return "No Router";

    case kDNSServiceErr_PollingMode:
        return "Polling Mode";

    case kDNSServiceErr_Timeout:
        return "Timeout";

    default:
        return "Unrecognized";
    }
}

static const char *NullIfEmpty(const std::string &aString)
{
    return aString.empty() ? nullptr : aString.c_str();
}

static std::string StringOrEmpty(const char *aString)
{
    return aString == nullptr ? std::string() : std::string(aString);
}

dnssdError ChannelMDnsSd::Register(const RegisterRequest &aRequest, RegisterHandler aHandler, HandlePtr &aHandle)
{
    std::unique_ptr<ServiceRegistration> registration(new ServiceRegistration(std::move(aHandler)));
    DNSServiceErrorType                  dnsError = registration->Register(aRequest);

    if (dnsError == kDNSServiceErr_NoError)
    {
        aHandle = std::move(registration);
    }

    return DNSErrorToDnssdError(dnsError);
}

dnssdError ChannelMDnsSd::Browse(const BrowseRequest &aRequest, BrowseHandler aHandler, HandlePtr &aHandle)
{
    std::unique_ptr<ServiceBrowsing> browsing(new ServiceBrowsing(std::move(aHandler)));
    DNSServiceErrorType              dnsError = browsing->Browse(aRequest);

    if (dnsError == kDNSServiceErr_NoError)
    {
        aHandle = std::move(browsing);
    }

    return DNSErrorToDnssdError(dnsError);
}

dnssdError ChannelMDnsSd::Resolve(const ResolveRequest &aRequest, ResolveHandler aHandler, HandlePtr &aHandle)
{
    std::unique_ptr<ServiceResolution> resolution(new ServiceResolution(std::move(aHandler)));
    DNSServiceErrorType                dnsError = resolution->Resolve(aRequest);

    if (dnsError == kDNSServiceErr_NoError)
    {
        aHandle = std::move(resolution);
    }

    return DNSErrorToDnssdError(dnsError);
}

dnssdError ChannelMDnsSd::Query(const QueryRequest &aRequest, QueryHandler aHandler, HandlePtr &aHandle)
{
    std::unique_ptr<RecordQuery> query(new RecordQuery(std::move(aHandler)));
    DNSServiceErrorType          dnsError = query->Query(aRequest);

    if (dnsError == kDNSServiceErr_NoError)
    {
        aHandle = std::move(query);
    }

    return DNSErrorToDnssdError(dnsError);
}

int ChannelMDnsSd::ServiceRef::GetFd(void) const
{
    return mServiceRef == nullptr ? -1 : DNSServiceRefSockFD(mServiceRef);
}

dnssdError ChannelMDnsSd::ServiceRef::Process(void)
{
    DNSServiceErrorType dnsError = kDNSServiceErr_BadReference;

    VerifyOrExit(mServiceRef != nullptr);

    dnsError = DNSServiceProcessResult(mServiceRef);

exit:
    if (dnsError != kDNSServiceErr_NoError)
    {
        dnssdLogWarn("DNSServiceProcessResult failed: %s (serviceRef = %p)", DNSErrorToString(dnsError),
                     static_cast<void *>(mServiceRef));
    }

    return DNSErrorToDnssdError(dnsError);
}

void ChannelMDnsSd::ServiceRef::Release(void)
{
    VerifyOrExit(mServiceRef != nullptr);

    dnssdLogDebg("Deallocating DNSServiceRef %p", static_cast<void *>(mServiceRef));
    DNSServiceRefDeallocate(mServiceRef);
    mServiceRef = nullptr;

exit:
    return;
}

DNSServiceErrorType ChannelMDnsSd::ServiceRegistration::Register(const RegisterRequest &aRequest)
{
    DNSServiceFlags     flags = aRequest.mNoAutoRename ? kDNSServiceFlagsNoAutoRename : 0;
    DNSServiceErrorType dnsError;

    assert(mServiceRef == nullptr);

    dnssdLogInfo("DNSServiceRegister %s.%s port %u inf %" PRIu32 " TXT=%zuB", aRequest.mName.c_str(),
                 aRequest.mType.c_str(), aRequest.mPort, aRequest.mInterfaceIndex, aRequest.mTxtData.size());

    dnsError = DNSServiceRegister(&mServiceRef, flags, aRequest.mInterfaceIndex, NullIfEmpty(aRequest.mName),
                                  aRequest.mType.c_str(), NullIfEmpty(aRequest.mDomain), NullIfEmpty(aRequest.mHost),
                                  htons(aRequest.mPort), static_cast<uint16_t>(aRequest.mTxtData.size()),
                                  aRequest.mTxtData.data(), HandleRegisterResult, this);

    if (dnsError != kDNSServiceErr_NoError)
    {
        dnssdLogWarn("DNSServiceRegister %s.%s failed: %s", aRequest.mName.c_str(), aRequest.mType.c_str(),
                     DNSErrorToString(dnsError));
        mServiceRef = nullptr;
    }

    return dnsError;
}

dnssdError ChannelMDnsSd::ServiceRegistration::UpdateTxtData(const TxtData &aTxtData)
{
    DNSServiceErrorType dnsError = kDNSServiceErr_BadReference;

    VerifyOrExit(mServiceRef != nullptr);

    dnsError = DNSServiceUpdateRecord(mServiceRef, /* RecordRef */ nullptr, /* flags */ 0,
                                      static_cast<uint16_t>(aTxtData.size()), aTxtData.data(), /* ttl */ 0);

exit:
    dnssdLogResult(DNSErrorToDnssdError(dnsError), "Update TXT record (%zuB)", aTxtData.size());
    return DNSErrorToDnssdError(dnsError);
}

void ChannelMDnsSd::ServiceRegistration::HandleRegisterResult(DNSServiceRef       aServiceRef,
                                                              DNSServiceFlags     aFlags,
                                                              DNSServiceErrorType aError,
                                                              const char         *aName,
                                                              const char         *aType,
                                                              const char         *aDomain,
                                                              void               *aContext)
{
    DNSSD_UNUSED_VARIABLE(aServiceRef);

    static_cast<ServiceRegistration *>(aContext)->HandleRegisterResult(aFlags, aError, aName, aType, aDomain);
}

void ChannelMDnsSd::ServiceRegistration::HandleRegisterResult(DNSServiceFlags     aFlags,
                                                              DNSServiceErrorType aError,
                                                              const char         *aName,
                                                              const char         *aType,
                                                              const char         *aDomain)
{
    RegisterEvent event;

    if (aError == kDNSServiceErr_NoError)
    {
        dnssdLogInfo("DNSServiceRegister reply: %s %s.%s%s", (aFlags & kDNSServiceFlagsAdd) ? "add" : "remove",
                     StringOrEmpty(aName).c_str(), StringOrEmpty(aType).c_str(), StringOrEmpty(aDomain).c_str());
    }
    else
    {
        dnssdLogWarn("DNSServiceRegister reply: %s", DNSErrorToString(aError));
    }

    event.mError  = DNSErrorToDnssdError(aError);
    event.mAdd    = (aFlags & kDNSServiceFlagsAdd) != 0;
    event.mName   = StringOrEmpty(aName);
    event.mType   = StringOrEmpty(aType);
    event.mDomain = StringOrEmpty(aDomain);

    mHandler(event);
}

DNSServiceErrorType ChannelMDnsSd::ServiceBrowsing::Browse(const BrowseRequest &aRequest)
{
    DNSServiceErrorType dnsError;

    assert(mServiceRef == nullptr);

    dnssdLogInfo("DNSServiceBrowse %s inf %" PRIu32, aRequest.mType.c_str(), aRequest.mInterfaceIndex);

    dnsError = DNSServiceBrowse(&mServiceRef, /* flags */ 0, aRequest.mInterfaceIndex, aRequest.mType.c_str(),
                                NullIfEmpty(aRequest.mDomain), HandleBrowseResult, this);

    if (dnsError != kDNSServiceErr_NoError)
    {
        dnssdLogWarn("DNSServiceBrowse %s failed: %s", aRequest.mType.c_str(), DNSErrorToString(dnsError));
        mServiceRef = nullptr;
    }

    return dnsError;
}

void ChannelMDnsSd::ServiceBrowsing::HandleBrowseResult(DNSServiceRef       aServiceRef,
                                                        DNSServiceFlags     aFlags,
                                                        uint32_t            aInterfaceIndex,
                                                        DNSServiceErrorType aErrorCode,
                                                        const char         *aInstanceName,
                                                        const char         *aType,
                                                        const char         *aDomain,
                                                        void               *aContext)
{
    DNSSD_UNUSED_VARIABLE(aServiceRef);

    static_cast<ServiceBrowsing *>(aContext)->HandleBrowseResult(aFlags, aInterfaceIndex, aErrorCode, aInstanceName,
                                                                 aType, aDomain);
}

void ChannelMDnsSd::ServiceBrowsing::HandleBrowseResult(DNSServiceFlags     aFlags,
                                                        uint32_t            aInterfaceIndex,
                                                        DNSServiceErrorType aErrorCode,
                                                        const char         *aInstanceName,
                                                        const char         *aType,
                                                        const char         *aDomain)
{
    BrowseEvent event;

    dnssdLogInfo("DNSServiceBrowse reply: %s %s.%s inf %" PRIu32 ", flags=%" PRIu32 ", error=%s",
                 (aFlags & kDNSServiceFlagsAdd) ? "add" : "remove", StringOrEmpty(aInstanceName).c_str(),
                 StringOrEmpty(aType).c_str(), aInterfaceIndex, static_cast<uint32_t>(aFlags),
                 DNSErrorToString(aErrorCode));

    event.mError          = DNSErrorToDnssdError(aErrorCode);
    event.mAdd            = (aFlags & kDNSServiceFlagsAdd) != 0;
    event.mMoreComing     = (aFlags & kDNSServiceFlagsMoreComing) != 0;
    event.mInterfaceIndex = aInterfaceIndex;
    event.mName           = StringOrEmpty(aInstanceName);
    event.mType           = StringOrEmpty(aType);
    event.mDomain         = StringOrEmpty(aDomain);

    mHandler(event);
}

DNSServiceErrorType ChannelMDnsSd::ServiceResolution::Resolve(const ResolveRequest &aRequest)
{
    DNSServiceErrorType dnsError;

    assert(mServiceRef == nullptr);

    dnssdLogInfo("DNSServiceResolve %s %s inf %" PRIu32, aRequest.mName.c_str(), aRequest.mType.c_str(),
                 aRequest.mInterfaceIndex);

    dnsError = DNSServiceResolve(&mServiceRef, /* flags */ 0, aRequest.mInterfaceIndex, aRequest.mName.c_str(),
                                 aRequest.mType.c_str(), aRequest.mDomain.c_str(), HandleResolveResult, this);

    if (dnsError != kDNSServiceErr_NoError)
    {
        dnssdLogWarn("DNSServiceResolve %s %s failed: %s", aRequest.mName.c_str(), aRequest.mType.c_str(),
                     DNSErrorToString(dnsError));
        mServiceRef = nullptr;
    }

    return dnsError;
}

void ChannelMDnsSd::ServiceResolution::HandleResolveResult(DNSServiceRef        aServiceRef,
                                                           DNSServiceFlags      aFlags,
                                                           uint32_t             aInterfaceIndex,
                                                           DNSServiceErrorType  aErrorCode,
                                                           const char          *aFullName,
                                                           const char          *aHostTarget,
                                                           uint16_t             aPort,
                                                           uint16_t             aTxtLen,
                                                           const unsigned char *aTxtRecord,
                                                           void                *aContext)
{
    DNSSD_UNUSED_VARIABLE(aServiceRef);

    static_cast<ServiceResolution *>(aContext)->HandleResolveResult(aFlags, aInterfaceIndex, aErrorCode, aFullName,
                                                                    aHostTarget, aPort, aTxtLen, aTxtRecord);
}

void ChannelMDnsSd::ServiceResolution::HandleResolveResult(DNSServiceFlags      aFlags,
                                                           uint32_t             aInterfaceIndex,
                                                           DNSServiceErrorType  aErrorCode,
                                                           const char          *aFullName,
                                                           const char          *aHostTarget,
                                                           uint16_t             aPort,
                                                           uint16_t             aTxtLen,
                                                           const unsigned char *aTxtRecord)
{
    ResolveEvent event;

    dnssdLogInfo("DNSServiceResolve reply: %s host %s:%u, TXT=%uB inf %" PRIu32 ", flags=%" PRIu32 ", error=%s",
                 StringOrEmpty(aFullName).c_str(), StringOrEmpty(aHostTarget).c_str(), ntohs(aPort), aTxtLen,
                 aInterfaceIndex, static_cast<uint32_t>(aFlags), DNSErrorToString(aErrorCode));

    event.mError          = DNSErrorToDnssdError(aErrorCode);
    event.mMoreComing     = (aFlags & kDNSServiceFlagsMoreComing) != 0;
    event.mInterfaceIndex = aInterfaceIndex;
    event.mFullName       = StringOrEmpty(aFullName);
    event.mHostName       = StringOrEmpty(aHostTarget);
    event.mPort           = ntohs(aPort);

    if (aTxtRecord != nullptr)
    {
        event.mTxtData.assign(aTxtRecord, aTxtRecord + aTxtLen);
    }

    mHandler(event);
}

DNSServiceErrorType ChannelMDnsSd::RecordQuery::Query(const QueryRequest &aRequest)
{
    DNSServiceErrorType dnsError;

    assert(mServiceRef == nullptr);

    dnssdLogInfo("DNSServiceQueryRecord %s type %u class %u inf %" PRIu32, aRequest.mFullName.c_str(),
                 aRequest.mRrType, aRequest.mRrClass, aRequest.mInterfaceIndex);

    dnsError = DNSServiceQueryRecord(&mServiceRef, /* flags */ 0, aRequest.mInterfaceIndex,
                                     aRequest.mFullName.c_str(), aRequest.mRrType, aRequest.mRrClass,
                                     HandleQueryResult, this);

    if (dnsError != kDNSServiceErr_NoError)
    {
        dnssdLogWarn("DNSServiceQueryRecord %s failed: %s", aRequest.mFullName.c_str(), DNSErrorToString(dnsError));
        mServiceRef = nullptr;
    }

    return dnsError;
}

void ChannelMDnsSd::RecordQuery::HandleQueryResult(DNSServiceRef       aServiceRef,
                                                   DNSServiceFlags     aFlags,
                                                   uint32_t            aInterfaceIndex,
                                                   DNSServiceErrorType aErrorCode,
                                                   const char         *aFullName,
                                                   uint16_t            aRrType,
                                                   uint16_t            aRrClass,
                                                   uint16_t            aRdLen,
                                                   const void         *aRdata,
                                                   uint32_t            aTtl,
                                                   void               *aContext)
{
    DNSSD_UNUSED_VARIABLE(aServiceRef);

    static_cast<RecordQuery *>(aContext)->HandleQueryResult(aFlags, aInterfaceIndex, aErrorCode, aFullName, aRrType,
                                                            aRrClass, aRdLen, aRdata, aTtl);
}

void ChannelMDnsSd::RecordQuery::HandleQueryResult(DNSServiceFlags     aFlags,
                                                   uint32_t            aInterfaceIndex,
                                                   DNSServiceErrorType aErrorCode,
                                                   const char         *aFullName,
                                                   uint16_t            aRrType,
                                                   uint16_t            aRrClass,
                                                   uint16_t            aRdLen,
                                                   const void         *aRdata,
                                                   uint32_t            aTtl)
{
    QueryEvent     event;
    const uint8_t *rdata = static_cast<const uint8_t *>(aRdata);

    dnssdLogDebg("DNSServiceQueryRecord reply: %s %s type %u class %u, RDATA=%uB ttl %" PRIu32 ", error=%s",
                 (aFlags & kDNSServiceFlagsAdd) ? "add" : "remove", StringOrEmpty(aFullName).c_str(), aRrType,
                 aRrClass, aRdLen, aTtl, DNSErrorToString(aErrorCode));

    event.mError          = DNSErrorToDnssdError(aErrorCode);
    event.mAdd            = (aFlags & kDNSServiceFlagsAdd) != 0;
    event.mMoreComing     = (aFlags & kDNSServiceFlagsMoreComing) != 0;
    event.mInterfaceIndex = aInterfaceIndex;
    event.mFullName       = StringOrEmpty(aFullName);
    event.mRrType         = aRrType;
    event.mRrClass        = aRrClass;
    event.mTtl            = aTtl;

    if (rdata != nullptr)
    {
        event.mRdata.assign(rdata, rdata + aRdLen);
    }

    mHandler(event);
}

Channel &Channel::GetDefault(void)
{
    static ChannelMDnsSd sChannel;

    return sChannel;
}

} // namespace dnssd
