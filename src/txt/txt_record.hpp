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
 *   This file includes definitions for the DNS-SD TXT record codec.
 */

#ifndef DNSSD_TXT_TXT_RECORD_HPP_
#define DNSSD_TXT_TXT_RECORD_HPP_

#include "dnssd/config.h"

#include <map>
#include <string>

#include <stddef.h>
#include <stdint.h>

#include "common/types.hpp"

namespace dnssd {

/**
 * This type represents the decoded key/value pairs of a TXT record.
 *
 */
typedef std::map<std::string, std::string> TxtMap;

/**
 * This class implements a TXT record in standard DNS-SD TXT data format.
 *
 * The record is a sequence of entries, each one made of a length byte followed by
 * that many bytes of `key=value` payload.
 *
 */
class TxtRecord
{
public:
    static constexpr size_t kMaxLength      = 65535; ///< Max length of the whole record in bytes.
    static constexpr size_t kMaxEntryLength = 255;   ///< Max length of one entry payload in bytes.

    /**
     * This method appends a `key=value` entry to the record.
     *
     * An entry already present with the same key is kept as is, so duplicate entries
     * may coexist. The record is left unchanged when an error is returned.
     *
     * @param[in] aKey    The key, must not be empty.
     * @param[in] aValue  The value, may be empty.
     *
     * @retval DNSSD_ERROR_NONE             Successfully appended the entry.
     * @retval DNSSD_ERROR_INVALID_ARGS     @p aKey is empty.
     * @retval DNSSD_ERROR_TXT_STRING_LEN   The entry payload would be longer than 255 bytes.
     * @retval DNSSD_ERROR_TXT_LEN          The record would be longer than 65535 bytes.
     *
     */
    dnssdError SetPair(const std::string &aKey, const std::string &aValue);

    /**
     * This method removes every entry with key @p aKey.
     *
     * @param[in] aKey  The key to remove.
     *
     * @retval DNSSD_ERROR_NONE   Successfully removed the entries, or there was none.
     * @retval DNSSD_ERROR_PARSE  The record is malformed.
     *
     */
    dnssdError DeletePair(const std::string &aKey);

    /**
     * This method decodes the record.
     *
     * @returns The key/value pairs of the record.
     *
     */
    TxtMap Decode(void) const;

    size_t         GetLength(void) const { return mData.size(); }
    const TxtData &GetData(void) const { return mData; }
    bool           IsEmpty(void) const { return mData.empty(); }
    void           Clear(void) { mData.clear(); }

private:
    TxtData mData;
};

/**
 * This function decodes TXT data into key/value pairs.
 *
 * Decoding never fails. An entry whose length byte runs past the end of the data stops
 * decoding, the pairs decoded so far are returned. For a duplicated key the first entry wins.
 *
 * @param[in] aTxtData    A pointer to the TXT data.
 * @param[in] aTxtLength  The TXT data length in bytes.
 *
 * @returns The decoded key/value pairs.
 *
 */
TxtMap DecodeTxtData(const uint8_t *aTxtData, size_t aTxtLength);

/**
 * This function decodes TXT data into key/value pairs.
 *
 * @param[in] aTxtData  The TXT data.
 *
 * @returns The decoded key/value pairs.
 *
 */
inline TxtMap DecodeTxtData(const TxtData &aTxtData)
{
    return DecodeTxtData(aTxtData.data(), aTxtData.size());
}

} // namespace dnssd

#endif // DNSSD_TXT_TXT_RECORD_HPP_
