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
 *   This file includes definitions for the service instance resolution operation.
 */

#ifndef DNSSD_OP_RESOLVE_OP_HPP_
#define DNSSD_OP_RESOLVE_OP_HPP_

#include "dnssd/config.h"

#include <functional>
#include <string>

#include "op/operation.hpp"
#include "txt/txt_record.hpp"

namespace dnssd {

/**
 * This class implements the resolution of a service instance to its host, port and TXT record.
 *
 */
class ResolveOp : public Operation
{
public:
    /**
     * This function is called for every resolution result.
     *
     * @param[in] aOp     The resolution operation.
     * @param[in] aError  The error, other arguments are only meaningful when it is DNSSD_ERROR_NONE.
     * @param[in] aHost   The target host name.
     * @param[in] aPort   The port in host byte order.
     * @param[in] aTxt    The decoded TXT record.
     *
     */
    typedef std::function<
        void(ResolveOp &aOp, dnssdError aError, const std::string &aHost, uint16_t aPort, const TxtMap &aTxt)>
        Callback;

    ResolveOp(uint32_t    aInterfaceIndex,
              std::string aName,
              std::string aType,
              std::string aDomain,
              Callback    aCallback,
              Channel    &aChannel = Channel::GetDefault());
    ~ResolveOp(void) override;

    uint32_t           GetInterfaceIndex(void) const { return mInterfaceIndex; }
    const std::string &GetName(void) const { return mName; }
    const std::string &GetType(void) const { return mType; }
    const std::string &GetDomain(void) const { return mDomain; }

private:
    dnssdError Open(Channel &aChannel, Dispatcher &aDispatcher, Channel::HandlePtr &aHandle) override;
    void       HandleChannelError(dnssdError aError) override;
    void       HandleResolveEvent(const ResolveEvent &aEvent);

    const uint32_t    mInterfaceIndex;
    const std::string mName;
    const std::string mType;
    const std::string mDomain;
    Callback          mCallback;
};

} // namespace dnssd

#endif // DNSSD_OP_RESOLVE_OP_HPP_
