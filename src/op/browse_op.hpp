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
 *   This file includes definitions for the service browsing operation.
 */

#ifndef DNSSD_OP_BROWSE_OP_HPP_
#define DNSSD_OP_BROWSE_OP_HPP_

#include "dnssd/config.h"

#include <functional>
#include <string>

#include "op/operation.hpp"

namespace dnssd {

/**
 * This class implements the browsing of service instances of one type.
 *
 * The setters return `DNSSD_ERROR_STARTED` while the operation is active.
 *
 */
class BrowseOp : public Operation
{
public:
    /**
     * This function is called once per service instance appearing or disappearing.
     *
     */
    typedef std::function<void(BrowseOp          &aOp,
                               dnssdError         aError,
                               bool               aAdd,
                               uint32_t           aInterfaceIndex,
                               const std::string &aName,
                               const std::string &aType,
                               const std::string &aDomain)>
        Callback;

    BrowseOp(std::string aType, Callback aCallback, Channel &aChannel = Channel::GetDefault());
    ~BrowseOp(void) override;

    dnssdError SetDomain(const std::string &aDomain);
    dnssdError SetInterfaceIndex(uint32_t aInterfaceIndex);

    const std::string &GetType(void) const { return mType; }
    std::string        GetDomain(void) const;
    uint32_t           GetInterfaceIndex(void) const;

private:
    dnssdError Open(Channel &aChannel, Dispatcher &aDispatcher, Channel::HandlePtr &aHandle) override;
    void       HandleChannelError(dnssdError aError) override;
    void       HandleBrowseEvent(const BrowseEvent &aEvent);

    const std::string mType;
    Callback          mCallback;
    std::string       mDomain;
    uint32_t          mInterfaceIndex;
};

} // namespace dnssd

#endif // DNSSD_OP_BROWSE_OP_HPP_
