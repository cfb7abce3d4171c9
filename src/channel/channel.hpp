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
 *   This file includes definitions for the discovery channel, the boundary between
 *   operations and the local DNS-SD responder.
 */

#ifndef DNSSD_CHANNEL_CHANNEL_HPP_
#define DNSSD_CHANNEL_CHANNEL_HPP_

#include "dnssd/config.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <stdint.h>

#include "common/code_utils.hpp"
#include "common/types.hpp"

namespace dnssd {

/**
 * This structure represents the parameters of a service registration.
 *
 */
struct RegisterRequest
{
    std::string mName;           ///< The service instance name, empty to let the responder pick one.
    std::string mType;           ///< The service type, e.g. "_http._tcp".
    std::string mDomain;         ///< The domain, empty for the default domain.
    std::string mHost;           ///< The target host name, empty for this host.
    uint16_t    mPort;           ///< The port in host byte order.
    uint32_t    mInterfaceIndex; ///< The interface index.
    bool        mNoAutoRename;   ///< Whether a name conflict is reported instead of renaming.
    TxtData     mTxtData;        ///< The encoded TXT record.
};

/**
 * This structure represents the parameters of a service browsing.
 *
 */
struct BrowseRequest
{
    uint32_t    mInterfaceIndex; ///< The interface index.
    std::string mType;           ///< The service type.
    std::string mDomain;         ///< The domain, empty for the default domains.
};

/**
 * This structure represents the parameters of a service instance resolution.
 *
 */
struct ResolveRequest
{
    uint32_t    mInterfaceIndex; ///< The interface index.
    std::string mName;           ///< The service instance name.
    std::string mType;           ///< The service type.
    std::string mDomain;         ///< The domain.
};

/**
 * This structure represents the parameters of a resource record query.
 *
 */
struct QueryRequest
{
    uint32_t    mInterfaceIndex; ///< The interface index.
    std::string mFullName;       ///< The full domain name of the record.
    uint16_t    mRrType;         ///< The resource record type.
    uint16_t    mRrClass;        ///< The resource record class.
};

struct RegisterEvent
{
    dnssdError  mError;
    bool        mAdd;
    std::string mName;
    std::string mType;
    std::string mDomain;
};

struct BrowseEvent
{
    dnssdError  mError;
    bool        mAdd;
    bool        mMoreComing;
    uint32_t    mInterfaceIndex;
    std::string mName;
    std::string mType;
    std::string mDomain;
};

struct ResolveEvent
{
    dnssdError  mError;
    bool        mMoreComing;
    uint32_t    mInterfaceIndex;
    std::string mFullName;
    std::string mHostName;
    uint16_t    mPort; ///< In host byte order.
    TxtData     mTxtData;
};

struct QueryEvent
{
    dnssdError           mError;
    bool                 mAdd;
    bool                 mMoreComing;
    uint32_t             mInterfaceIndex;
    std::string          mFullName;
    uint16_t             mRrType;
    uint16_t             mRrClass;
    std::vector<uint8_t> mRdata;
    uint32_t             mTtl;
};

/**
 * This interface defines the discovery channel.
 *
 * Every request opens a handle which produces events until it is destroyed. Events are
 * only produced from within `Handle::Process()`, on the thread calling it.
 *
 */
class Channel
{
public:
    /**
     * This class represents an open request.
     *
     * Destroying the handle closes the request.
     *
     */
    class Handle : private NonCopyable
    {
    public:
        virtual ~Handle(void) = default;

        /**
         * This method returns the file descriptor that becomes readable when events are pending.
         *
         */
        virtual int GetFd(void) const = 0;

        /**
         * This method reads pending events and invokes the request handler once per event.
         *
         * @retval DNSSD_ERROR_NONE  Successfully processed pending events.
         * @retval ...               The connection to the responder failed.
         *
         */
        virtual dnssdError Process(void) = 0;

        /**
         * This method replaces the TXT record of a registration.
         *
         * @param[in] aTxtData  The new TXT record.
         *
         * @retval DNSSD_ERROR_NONE             Successfully updated the record.
         * @retval DNSSD_ERROR_NOT_IMPLEMENTED  The handle is not a registration.
         *
         */
        virtual dnssdError UpdateTxtData(const TxtData &aTxtData)
        {
            DNSSD_UNUSED_VARIABLE(aTxtData);
            return DNSSD_ERROR_NOT_IMPLEMENTED;
        }
    };

    typedef std::unique_ptr<Handle> HandlePtr;

    typedef std::function<void(const RegisterEvent &aEvent)> RegisterHandler;
    typedef std::function<void(const BrowseEvent &aEvent)>   BrowseHandler;
    typedef std::function<void(const ResolveEvent &aEvent)>  ResolveHandler;
    typedef std::function<void(const QueryEvent &aEvent)>    QueryHandler;

    virtual ~Channel(void) = default;

    /**
     * This method registers a service.
     *
     * @param[in]  aRequest  The registration parameters.
     * @param[in]  aHandler  The handler of registration events.
     * @param[out] aHandle   The handle of the open request.
     *
     * @retval DNSSD_ERROR_NONE  Successfully opened the request, @p aHandle is set.
     * @retval ...               The responder rejected the request.
     *
     */
    virtual dnssdError Register(const RegisterRequest &aRequest, RegisterHandler aHandler, HandlePtr &aHandle) = 0;

    /**
     * This method browses for service instances.
     *
     * @param[in]  aRequest  The browsing parameters.
     * @param[in]  aHandler  The handler of browsing events.
     * @param[out] aHandle   The handle of the open request.
     *
     * @retval DNSSD_ERROR_NONE  Successfully opened the request, @p aHandle is set.
     * @retval ...               The responder rejected the request.
     *
     */
    virtual dnssdError Browse(const BrowseRequest &aRequest, BrowseHandler aHandler, HandlePtr &aHandle) = 0;

    /**
     * This method resolves a service instance.
     *
     * @param[in]  aRequest  The resolution parameters.
     * @param[in]  aHandler  The handler of resolution events.
     * @param[out] aHandle   The handle of the open request.
     *
     * @retval DNSSD_ERROR_NONE  Successfully opened the request, @p aHandle is set.
     * @retval ...               The responder rejected the request.
     *
     */
    virtual dnssdError Resolve(const ResolveRequest &aRequest, ResolveHandler aHandler, HandlePtr &aHandle) = 0;

    /**
     * This method queries resource records.
     *
     * @param[in]  aRequest  The query parameters.
     * @param[in]  aHandler  The handler of query events.
     * @param[out] aHandle   The handle of the open request.
     *
     * @retval DNSSD_ERROR_NONE  Successfully opened the request, @p aHandle is set.
     * @retval ...               The responder rejected the request.
     *
     */
    virtual dnssdError Query(const QueryRequest &aRequest, QueryHandler aHandler, HandlePtr &aHandle) = 0;

    /**
     * This function returns the channel to the system responder.
     *
     */
    static Channel &GetDefault(void);
};

} // namespace dnssd

#endif // DNSSD_CHANNEL_CHANNEL_HPP_
