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
 *   This file includes definition for time helpers.
 */

#ifndef DNSSD_COMMON_TIME_HPP_
#define DNSSD_COMMON_TIME_HPP_

#include "dnssd/config.h"

#include <chrono>

#include <stdint.h>

#include <sys/time.h>

namespace dnssd {

using Clock        = std::chrono::steady_clock;
using MicroSeconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;

/**
 * This function returns microseconds in timeval.
 *
 * @param  aMicroSeconds  the microseconds to convert to timeval.
 *
 * @returns microseconds in timeval.
 *
 */
inline struct timeval GetTimeval(MicroSeconds aMicroSeconds)
{
    struct timeval ret;

    ret.tv_sec  = aMicroSeconds.count() / 1000000;
    ret.tv_usec = aMicroSeconds.count() % 1000000;

    return ret;
}

} // namespace dnssd

#endif // DNSSD_COMMON_TIME_HPP_
