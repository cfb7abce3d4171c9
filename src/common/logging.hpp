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
 * This file define logging interface.
 */
#ifndef DNSSD_COMMON_LOGGING_HPP_
#define DNSSD_COMMON_LOGGING_HPP_

#include "dnssd/config.h"

#include <stdarg.h>
#include <stddef.h>

#include "common/types.hpp"

#ifndef DNSSD_LOG_TAG
#define DNSSD_LOG_TAG ""
#endif

/**
 * Logging level.
 *
 */
typedef enum
{
    DNSSD_LOG_LEVEL_CRIT, ///< Critical conditions.
    DNSSD_LOG_LEVEL_WARN, ///< Warning conditions.
    DNSSD_LOG_LEVEL_NOTE, ///< Normal but significant condition.
    DNSSD_LOG_LEVEL_INFO, ///< Informational.
    DNSSD_LOG_LEVEL_DEBG, ///< Debug-level messages.
} dnssdLogLevel;

/**
 * Get current log level
 */
dnssdLogLevel dnssdLogGetLevel(void);

/**
 * Set current log level
 *
 * @param[in] aLevel  The new log level.
 *
 */
void dnssdLogSetLevel(dnssdLogLevel aLevel);

/**
 * This function initialize the logging service.
 *
 * @param[in]   aIdent          Identity of the logger.
 * @param[in]   aLevel          Log level of the logger.
 * @param[in]   aPrintStderr    Whether to log to stderr.
 *
 */
void dnssdLogInit(const char *aIdent, dnssdLogLevel aLevel, bool aPrintStderr);

/**
 * This function log at level @p aLevel.
 *
 * @param[in]   aLevel         Log level of the logger.
 * @param[in]   aLogTag        Log tag.
 * @param[in]   aFormat        Format string as in printf.
 *
 */
void dnssdLog(dnssdLogLevel aLevel, const char *aLogTag, const char *aFormat, ...)
    __attribute__((format(printf, 3, 4)));

/**
 * This function log at level @p aLevel.
 *
 * @param[in]   aLevel  Log level of the logger.
 * @param[in]   aFormat Format string as in printf.
 *
 */
void dnssdLogv(dnssdLogLevel aLevel, const char *aFormat, va_list);

/**
 * This function dump memory as hex string at level @p aLevel.
 *
 * @param[in]   aLevel  Log level of the logger.
 * @param[in]   aLogTag Log tag.
 * @param[in]   aPrefix String before dumping memory.
 * @param[in]   aMemory The pointer to the memory to be dumped.
 * @param[in]   aSize   The size of memory in bytes to be dumped.
 *
 */
void dnssdDump(dnssdLogLevel aLevel, const char *aLogTag, const char *aPrefix, const void *aMemory, size_t aSize);

/**
 * This function converts error code to string.
 *
 * @param[in]   aError      The error code.
 *
 * @returns The string information of error.
 *
 */
const char *dnssdErrorString(dnssdError aError);

/**
 * This function deinitializes the logging service.
 *
 */
void dnssdLogDeinit(void);

/**
 * This macro log a action result according to @p aError.
 *
 * If @p aError is DNSSD_ERROR_NONE, the log level will be DNSSD_LOG_LEVEL_INFO,
 * otherwise DNSSD_LOG_LEVEL_WARN.
 *
 * @param[in]   aError    The action result.
 * @param[in]   aFormat   Format string as in printf.
 * @param[in]   ...       Arguments for the format specification.
 *
 */
#define dnssdLogResult(aError, aFormat, ...)                                                                          \
    do                                                                                                                \
    {                                                                                                                 \
        dnssdError _err = (aError);                                                                                   \
        dnssdLog(_err == DNSSD_ERROR_NONE ? DNSSD_LOG_LEVEL_INFO : DNSSD_LOG_LEVEL_WARN, DNSSD_LOG_TAG, aFormat ": %s", \
                 ##__VA_ARGS__, dnssdErrorString(_err));                                                              \
    } while (0)

/**
 * @def dnssdLogCrit
 *
 * Logging at log level critical.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */
/**
 * @def dnssdLogWarn
 *
 * Logging at log level warning.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */
/**
 * @def dnssdLogNote
 *
 * Logging at log level notice.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */
/**
 * @def dnssdLogInfo
 *
 * Logging at log level information.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */
/**
 * @def dnssdLogDebg
 *
 * Logging at log level debug.
 *
 * @param[in] ...  Arguments for the format specification.
 *
 */
#define dnssdLogCrit(...) dnssdLog(DNSSD_LOG_LEVEL_CRIT, DNSSD_LOG_TAG, __VA_ARGS__)
#define dnssdLogWarn(...) dnssdLog(DNSSD_LOG_LEVEL_WARN, DNSSD_LOG_TAG, __VA_ARGS__)
#define dnssdLogNote(...) dnssdLog(DNSSD_LOG_LEVEL_NOTE, DNSSD_LOG_TAG, __VA_ARGS__)
#define dnssdLogInfo(...) dnssdLog(DNSSD_LOG_LEVEL_INFO, DNSSD_LOG_TAG, __VA_ARGS__)
#define dnssdLogDebg(...) dnssdLog(DNSSD_LOG_LEVEL_DEBG, DNSSD_LOG_TAG, __VA_ARGS__)

#endif // DNSSD_COMMON_LOGGING_HPP_
