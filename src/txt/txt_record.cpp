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
 *   This file implements the DNS-SD TXT record codec.
 */

#define DNSSD_LOG_TAG "TXT"

#include "txt/txt_record.hpp"

#include <algorithm>

#include "common/code_utils.hpp"
#include "common/logging.hpp"

namespace dnssd {

constexpr size_t TxtRecord::kMaxLength;
constexpr size_t TxtRecord::kMaxEntryLength;

dnssdError TxtRecord::SetPair(const std::string &aKey, const std::string &aValue)
{
    dnssdError error       = DNSSD_ERROR_NONE;
    size_t     entryLength = aKey.size() + sizeof(uint8_t) + aValue.size(); // for `=` char.

    VerifyOrExit(!aKey.empty(), error = DNSSD_ERROR_INVALID_ARGS);
    VerifyOrExit(entryLength <= kMaxEntryLength, error = DNSSD_ERROR_TXT_STRING_LEN);
    VerifyOrExit(mData.size() + sizeof(uint8_t) + entryLength <= kMaxLength, error = DNSSD_ERROR_TXT_LEN);

    mData.push_back(static_cast<uint8_t>(entryLength));
    mData.insert(mData.end(), aKey.begin(), aKey.end());
    mData.push_back('=');
    mData.insert(mData.end(), aValue.begin(), aValue.end());

exit:
    if (error != DNSSD_ERROR_NONE)
    {
        dnssdLogDebg("Rejected TXT pair with key length %zu, value length %zu: %s", aKey.size(), aValue.size(),
                     dnssdErrorString(error));
    }
    return error;
}

dnssdError TxtRecord::DeletePair(const std::string &aKey)
{
    dnssdError error = DNSSD_ERROR_NONE;
    size_t     r     = 0;

    VerifyOrExit(!aKey.empty());

    while (r < mData.size())
    {
        size_t         entrySize = mData[r];
        size_t         entryEnd  = r + sizeof(uint8_t) + entrySize;
        const uint8_t *payload   = mData.data() + r + sizeof(uint8_t);
        bool           match;

        VerifyOrExit(entryEnd <= mData.size(), error = DNSSD_ERROR_PARSE);

        match = (entrySize >= aKey.size()) && std::equal(aKey.begin(), aKey.end(), payload) &&
                (entrySize == aKey.size() || payload[aKey.size()] == '=');

        if (match)
        {
            mData.erase(mData.begin() + r, mData.begin() + entryEnd);
        }
        else
        {
            r = entryEnd;
        }
    }

exit:
    if (error != DNSSD_ERROR_NONE)
    {
        dnssdLogWarn("TXT record is malformed at offset %zu", r);
    }
    return error;
}

TxtMap TxtRecord::Decode(void) const
{
    return DecodeTxtData(mData);
}

TxtMap DecodeTxtData(const uint8_t *aTxtData, size_t aTxtLength)
{
    TxtMap txtMap;

    for (size_t r = 0; r < aTxtLength;)
    {
        size_t entrySize = aTxtData[r];
        size_t keyStart  = r + 1;
        size_t entryEnd  = keyStart + entrySize;
        size_t keyEnd;

        if (entryEnd > aTxtLength)
        {
            dnssdLogDebg("Dropping truncated TXT entry at offset %zu", r);
            break;
        }

        if (entrySize > 0)
        {
            // A key is at least one byte long, so the separator search starts after the first byte.
            keyEnd = keyStart + 1;

            while (keyEnd < entryEnd && aTxtData[keyEnd] != '=')
            {
                keyEnd++;
            }

            std::string key(reinterpret_cast<const char *>(&aTxtData[keyStart]), keyEnd - keyStart);
            std::string value;

            if (keyEnd < entryEnd)
            {
                value.assign(reinterpret_cast<const char *>(&aTxtData[keyEnd + 1]), entryEnd - keyEnd - 1);
            }

            // std::map::emplace keeps the first entry of a duplicated key.
            txtMap.emplace(std::move(key), std::move(value));
        }

        r = entryEnd;
    }

    return txtMap;
}

} // namespace dnssd
