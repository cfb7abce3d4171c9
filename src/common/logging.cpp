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

#include "common/logging.hpp"

#include <assert.h>
#include <errno.h>
#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <syslog.h>

#include <atomic>

static std::atomic<dnssdLogLevel> sLevel{DNSSD_CONFIG_LOG_LEVEL};

static int ConvertToSyslogPriority(dnssdLogLevel aLevel)
{
    int priority;

    switch (aLevel)
    {
    case DNSSD_LOG_LEVEL_CRIT:
        priority = LOG_CRIT;
        break;
    case DNSSD_LOG_LEVEL_WARN:
        priority = LOG_WARNING;
        break;
    case DNSSD_LOG_LEVEL_NOTE:
        priority = LOG_NOTICE;
        break;
    case DNSSD_LOG_LEVEL_INFO:
        priority = LOG_INFO;
        break;
    case DNSSD_LOG_LEVEL_DEBG:
    default:
        priority = LOG_DEBUG;
        break;
    }

    return priority;
}

/** Get the current debug log level */
dnssdLogLevel dnssdLogGetLevel(void)
{
    return sLevel.load();
}

void dnssdLogSetLevel(dnssdLogLevel aLevel)
{
    assert(aLevel >= DNSSD_LOG_LEVEL_CRIT && aLevel <= DNSSD_LOG_LEVEL_DEBG);
    sLevel.store(aLevel);
}

/** Initialize logging */
void dnssdLogInit(const char *aIdent, dnssdLogLevel aLevel, bool aPrintStderr)
{
    assert(aIdent);

    openlog(aIdent, (LOG_CONS | LOG_PID) | (aPrintStderr ? LOG_PERROR : 0), LOG_USER);
    dnssdLogSetLevel(aLevel);
}

/** log to the syslog or log file */
void dnssdLog(dnssdLogLevel aLevel, const char *aLogTag, const char *aFormat, ...)
{
    const size_t kBufferSize = 1024;
    char         buffer[kBufferSize];
    va_list      ap;

    if (aLevel > sLevel.load())
    {
        return;
    }

    va_start(ap, aFormat);
    vsnprintf(buffer, sizeof(buffer), aFormat, ap);
    va_end(ap);

    if (aLogTag != nullptr && aLogTag[0] != '\0')
    {
        syslog(ConvertToSyslogPriority(aLevel), "[%s] %s", aLogTag, buffer);
    }
    else
    {
        syslog(ConvertToSyslogPriority(aLevel), "%s", buffer);
    }
}

/** log to the syslog or log file */
void dnssdLogv(dnssdLogLevel aLevel, const char *aFormat, va_list ap)
{
    assert(aFormat);

    if (aLevel <= sLevel.load())
    {
        vsyslog(ConvertToSyslogPriority(aLevel), aFormat, ap);
    }
}

/** Hex dump data to the log */
void dnssdDump(dnssdLogLevel aLevel, const char *aLogTag, const char *aPrefix, const void *aMemory, size_t aSize)
{
    static const char kHexChars[] = "0123456789abcdef";

    assert(aPrefix && (aMemory || aSize == 0));

    const uint8_t *p8   = static_cast<const uint8_t *>(aMemory);
    size_t         addr = 0;

    if (aLevel > sLevel.load())
    {
        return;
    }

    // break hex dumps into 16byte lines
    // In the form ADDR: XX XX XX XX ...
    while (aSize > 0)
    {
        size_t thisSize = aSize > 16 ? 16 : aSize;
        char   hex[16 * 3 + 1];
        char  *ch = hex;

        for (size_t i = 0; i < thisSize; i++)
        {
            *ch++ = kHexChars[p8[addr + i] >> 4];
            *ch++ = kHexChars[p8[addr + i] & 0x0f];
            *ch++ = ' ';
        }
        *(ch - 1) = '\0';

        dnssdLog(aLevel, aLogTag, "%s: %04zx: %s", aPrefix, addr, hex);

        addr += thisSize;
        aSize -= thisSize;
    }
}

const char *dnssdErrorString(dnssdError aError)
{
    const char *error;

    switch (aError)
    {
    case DNSSD_ERROR_NONE:
        error = "OK";
        break;

    case DNSSD_ERROR_ERRNO:
        error = strerror(errno);
        break;

    case DNSSD_ERROR_MDNS:
        error = "MDNS error";
        break;

    case DNSSD_ERROR_NOT_FOUND:
        error = "Not found";
        break;

    case DNSSD_ERROR_PARSE:
        error = "Parse error";
        break;

    case DNSSD_ERROR_NOT_IMPLEMENTED:
        error = "Not implemented";
        break;

    case DNSSD_ERROR_INVALID_ARGS:
        error = "Invalid arguments";
        break;

    case DNSSD_ERROR_DUPLICATED:
        error = "Duplicated";
        break;

    case DNSSD_ERROR_INVALID_STATE:
        error = "Invalid state";
        break;

    case DNSSD_ERROR_NO_MEMORY:
        error = "No memory";
        break;

    case DNSSD_ERROR_REFUSED:
        error = "Refused";
        break;

    case DNSSD_ERROR_TIMEOUT:
        error = "Timeout";
        break;

    case DNSSD_ERROR_STARTED:
        error = "Operation already started";
        break;

    case DNSSD_ERROR_TXT_LEN:
        error = "TXT record too long";
        break;

    case DNSSD_ERROR_TXT_STRING_LEN:
        error = "TXT entry too long";
        break;

    default:
        error = "Unknown";
    }

    return error;
}

void dnssdLogDeinit(void)
{
    closelog();
}
