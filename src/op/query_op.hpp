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
 *   This file includes definitions for the resource record query operation.
 */

#ifndef DNSSD_OP_QUERY_OP_HPP_
#define DNSSD_OP_QUERY_OP_HPP_

#include "dnssd/config.h"

#include <functional>
#include <string>
#include <vector>

#include "op/operation.hpp"

namespace dnssd {

/**
 * This class implements a query of raw resource records.
 *
 */
class QueryOp : public Operation
{
public:
    /**
     * This function is called for every record added or removed.
     *
     * When @p aMore is true more records of the same update follow immediately, callers
     * should buffer records until a call with @p aMore false.
     *
     */
    typedef std::function<void(QueryOp                    &aOp,
                               dnssdError                  aError,
                               bool                        aAdd,
                               bool                        aMore,
                               uint32_t                    aInterfaceIndex,
                               const std::string          &aFullName,
                               uint16_t                    aRrType,
                               uint16_t                    aRrClass,
                               const std::vector<uint8_t> &aRdata,
                               uint32_t                    aTtl)>
        Callback;

    QueryOp(uint32_t    aInterfaceIndex,
            std::string aFullName,
            uint16_t    aRrType,
            uint16_t    aRrClass,
            Callback    aCallback,
            Channel    &aChannel = Channel::GetDefault());
    ~QueryOp(void) override;

    uint32_t           GetInterfaceIndex(void) const { return mInterfaceIndex; }
    const std::string &GetFullName(void) const { return mFullName; }
    uint16_t           GetRrType(void) const { return mRrType; }
    uint16_t           GetRrClass(void) const { return mRrClass; }

private:
    dnssdError Open(Channel &aChannel, Dispatcher &aDispatcher, Channel::HandlePtr &aHandle) override;
    void       HandleChannelError(dnssdError aError) override;
    void       HandleQueryEvent(const QueryEvent &aEvent);

    const uint32_t    mInterfaceIndex;
    const std::string mFullName;
    const uint16_t    mRrType;
    const uint16_t    mRrClass;
    Callback          mCallback;
};

} // namespace dnssd

#endif // DNSSD_OP_QUERY_OP_HPP_
