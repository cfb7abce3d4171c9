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
 *   This file includes definitions for the service registration operation.
 */

#ifndef DNSSD_OP_REGISTER_OP_HPP_
#define DNSSD_OP_REGISTER_OP_HPP_

#include "dnssd/config.h"

#include <functional>
#include <string>

#include "op/operation.hpp"
#include "txt/txt_record.hpp"

namespace dnssd {

/**
 * This class implements the registration of a service.
 *
 * The TXT record may be changed at any time, while the operation is active the new record is
 * pushed to the responder from the delivery thread. Every other setter returns
 * `DNSSD_ERROR_STARTED` while the operation is active.
 *
 */
class RegisterOp : public Operation
{
public:
    /**
     * This function is called for every registration event.
     *
     * @param[in] aOp      The registration operation.
     * @param[in] aError   The error, other arguments are only meaningful when it is DNSSD_ERROR_NONE.
     * @param[in] aAdd     Whether the service is registered (true) or was removed (false).
     * @param[in] aName    The registered service instance name, may differ from the requested one.
     * @param[in] aType    The service type.
     * @param[in] aDomain  The domain.
     *
     */
    typedef std::function<void(RegisterOp        &aOp,
                               dnssdError         aError,
                               bool               aAdd,
                               const std::string &aName,
                               const std::string &aType,
                               const std::string &aDomain)>
        Callback;

    RegisterOp(std::string aName,
               std::string aType,
               uint16_t    aPort,
               Callback    aCallback,
               Channel    &aChannel = Channel::GetDefault());
    ~RegisterOp(void) override;

    dnssdError SetTXTPair(const std::string &aKey, const std::string &aValue);
    dnssdError DeleteTXTPair(const std::string &aKey);
    dnssdError SetNoAutoRename(bool aNoAutoRename);
    dnssdError SetInterfaceIndex(uint32_t aInterfaceIndex);
    dnssdError SetDomain(const std::string &aDomain);
    dnssdError SetHost(const std::string &aHost);

    const std::string &GetName(void) const { return mName; }
    const std::string &GetType(void) const { return mType; }
    uint16_t           GetPort(void) const { return mPort; }
    std::string        GetDomain(void) const;
    std::string        GetHost(void) const;
    uint32_t           GetInterfaceIndex(void) const;
    bool               IsNoAutoRename(void) const;
    size_t             GetTxtLength(void) const;
    TxtData            GetTxtData(void) const;

private:
    dnssdError Open(Channel &aChannel, Dispatcher &aDispatcher, Channel::HandlePtr &aHandle) override;
    void       HandleChannelError(dnssdError aError) override;
    void       HandleRegisterEvent(const RegisterEvent &aEvent);
    void       UpdateTxtLocked(void);

    const std::string mName;
    const std::string mType;
    const uint16_t    mPort;
    Callback          mCallback;
    std::string       mDomain;
    std::string       mHost;
    uint32_t          mInterfaceIndex;
    bool              mNoAutoRename;
    TxtRecord         mTxt;
};

} // namespace dnssd

#endif // DNSSD_OP_REGISTER_OP_HPP_
