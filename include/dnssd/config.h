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
 *   This file includes the compile-time configuration of the DNS-SD client library.
 */

#ifndef DNSSD_CONFIG_H_
#define DNSSD_CONFIG_H_

#ifdef DNSSD_CONFIG_PROJECT_FILE
#include DNSSD_CONFIG_PROJECT_FILE
#endif

/**
 * @def DNSSD_CONFIG_LOG_LEVEL
 *
 * The default log level used until `dnssdLogInit()` or `dnssdLogSetLevel()` changes it.
 *
 */
#ifndef DNSSD_CONFIG_LOG_LEVEL
#define DNSSD_CONFIG_LOG_LEVEL DNSSD_LOG_LEVEL_INFO
#endif

/**
 * @def DNSSD_CONFIG_DISPATCH_POLL_TIMEOUT_MS
 *
 * The maximum time in milliseconds an operation dispatcher sleeps in `select()` before it
 * re-checks its stop request.
 *
 */
#ifndef DNSSD_CONFIG_DISPATCH_POLL_TIMEOUT_MS
#define DNSSD_CONFIG_DISPATCH_POLL_TIMEOUT_MS 1000
#endif

#endif // DNSSD_CONFIG_H_
