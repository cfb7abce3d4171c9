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
 *   This file includes definition for data types used by the DNS-SD client library.
 */

#ifndef DNSSD_COMMON_TYPES_HPP_
#define DNSSD_COMMON_TYPES_HPP_

#include "dnssd/config.h"

#include <stdint.h>
#include <string>
#include <vector>

/**
 * This enumeration represents error codes used throughout the DNS-SD client library.
 */
enum dnssdError
{
    DNSSD_ERROR_NONE = 0, ///< No error.

    DNSSD_ERROR_ERRNO           = -1,  ///< Error defined by errno.
    DNSSD_ERROR_MDNS            = -2,  ///< Unclassified error reported by the mDNS responder.
    DNSSD_ERROR_NOT_FOUND       = -3,  ///< Not found.
    DNSSD_ERROR_PARSE           = -4,  ///< Parse error.
    DNSSD_ERROR_NOT_IMPLEMENTED = -5,  ///< Not implemented error.
    DNSSD_ERROR_INVALID_ARGS    = -6,  ///< Invalid arguments error.
    DNSSD_ERROR_DUPLICATED      = -7,  ///< Duplicated operation, resource or name.
    DNSSD_ERROR_INVALID_STATE   = -8,  ///< Invalid state, the responder may not be running.
    DNSSD_ERROR_NO_MEMORY       = -9,  ///< The responder or this library ran out of resources.
    DNSSD_ERROR_REFUSED         = -10, ///< The request was refused by the responder.
    DNSSD_ERROR_TIMEOUT         = -11, ///< The request timed out.
    DNSSD_ERROR_STARTED         = -12, ///< The operation is already active.
    DNSSD_ERROR_TXT_LEN         = -13, ///< The TXT record would exceed 65535 bytes.
    DNSSD_ERROR_TXT_STRING_LEN  = -14, ///< A TXT entry payload would exceed 255 bytes.
};

namespace dnssd {

/**
 * Interface index values with a special meaning for every operation.
 *
 */
enum : uint32_t
{
    kInterfaceIndexAny       = 0,          ///< All interfaces.
    kInterfaceIndexLocalOnly = 0xffffffff, ///< Local machine only.
    kInterfaceIndexUnicast   = 0xfffffffe, ///< Unicast DNS only.
    kInterfaceIndexP2P       = 0xfffffffd, ///< Peer-to-peer interfaces only.
};

typedef std::vector<uint8_t> TxtData; ///< Raw TXT RDATA bytes.

} // namespace dnssd

#endif // DNSSD_COMMON_TYPES_HPP_
