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

#define DNSSD_LOG_TAG "TOOL"

#include "dnssd/config.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <errno.h>
#include <getopt.h>
#include <inttypes.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "common/code_utils.hpp"
#include "common/logging.hpp"
#include "common/types.hpp"
#include "op/browse_op.hpp"
#include "op/query_op.hpp"
#include "op/register_op.hpp"
#include "op/resolve_op.hpp"

enum
{
    DNSSD_OPT_DOMAIN          = 'd',
    DNSSD_OPT_HELP            = 'h',
    DNSSD_OPT_INTERFACE_INDEX = 'i',
    DNSSD_OPT_TXT             = 't',
    DNSSD_OPT_TIMEOUT         = 'T',
    DNSSD_OPT_VERBOSE         = 'v',
    DNSSD_OPT_NO_RENAME       = 128,
    DNSSD_OPT_HOST,
};

static const struct option kOptions[] = {{"domain", required_argument, nullptr, DNSSD_OPT_DOMAIN},
                                         {"help", no_argument, nullptr, DNSSD_OPT_HELP},
                                         {"interface", required_argument, nullptr, DNSSD_OPT_INTERFACE_INDEX},
                                         {"txt", required_argument, nullptr, DNSSD_OPT_TXT},
                                         {"timeout", required_argument, nullptr, DNSSD_OPT_TIMEOUT},
                                         {"verbose", no_argument, nullptr, DNSSD_OPT_VERBOSE},
                                         {"no-rename", no_argument, nullptr, DNSSD_OPT_NO_RENAME},
                                         {"host", required_argument, nullptr, DNSSD_OPT_HOST},
                                         {0, 0, 0, 0}};

static volatile sig_atomic_t sTerminated = 0;

struct ToolOptions
{
    std::string              mDomain;
    std::string              mHost;
    uint32_t                 mInterfaceIndex = dnssd::kInterfaceIndexAny;
    std::vector<std::string> mTxtPairs;
    long                     mTimeout  = 0;
    bool                     mNoRename = false;
};

static void HandleSignal(int aSignal)
{
    DNSSD_UNUSED_VARIABLE(aSignal);

    sTerminated = 1;
}

static bool ParseInteger(const char *aStr, long &aOutResult)
{
    bool  successful = true;
    char *strEnd;
    long  result;

    VerifyOrExit(aStr != nullptr, successful = false);
    errno  = 0;
    result = strtol(aStr, &strEnd, 0);
    VerifyOrExit(errno != ERANGE, successful = false);
    VerifyOrExit(aStr != strEnd && *strEnd == '\0', successful = false);

    aOutResult = result;

exit:
    return successful;
}

static bool ParseInterfaceIndex(const char *aStr, uint32_t &aInterfaceIndex)
{
    bool successful = true;
    long index;

    if (strcmp(aStr, "any") == 0)
    {
        aInterfaceIndex = dnssd::kInterfaceIndexAny;
    }
    else if (strcmp(aStr, "local") == 0)
    {
        aInterfaceIndex = dnssd::kInterfaceIndexLocalOnly;
    }
    else if (strcmp(aStr, "unicast") == 0)
    {
        aInterfaceIndex = dnssd::kInterfaceIndexUnicast;
    }
    else if (strcmp(aStr, "p2p") == 0)
    {
        aInterfaceIndex = dnssd::kInterfaceIndexP2P;
    }
    else
    {
        VerifyOrExit(ParseInteger(aStr, index) && index >= 0 && index <= UINT32_MAX, successful = false);
        aInterfaceIndex = static_cast<uint32_t>(index);
    }

exit:
    return successful;
}

static void PrintHelp(const char *aProgramName)
{
    fprintf(stderr,
            "Usage: %s [options] COMMAND ARGS...\n"
            "Commands:\n"
            "     register NAME TYPE PORT      Register a service instance.\n"
            "     browse TYPE                  Browse for instances of a service type.\n"
            "     resolve NAME TYPE            Resolve a service instance.\n"
            "     query FULLNAME [TYPE CLASS]  Query resource records (default: A IN).\n"
            "Options:\n"
            "     -d, --domain DOMAIN          The domain (default: the responder's default domains).\n"
            "     -i, --interface INDEX        The interface index, or any, local, unicast, p2p (default: any).\n"
            "     -t, --txt KEY=VALUE          A TXT pair of the registration (can be specified multiple times).\n"
            "     -T, --timeout SECONDS        Stop after the given time (default: run until interrupted).\n"
            "     --host HOST                  The target host of the registration.\n"
            "     --no-rename                  Report a name conflict instead of renaming the registration.\n"
            "     -v, --verbose                Enable debug logging to stderr.\n"
            "     -h, --help                   Show this help text.\n"
            "\n",
            aProgramName);
}

static std::string FormatTxt(const dnssd::TxtMap &aTxt)
{
    std::string str;

    for (const auto &pair : aTxt)
    {
        str += (str.empty() ? "" : " ") + pair.first + "=" + pair.second;
    }

    return str;
}

static void WaitForTermination(long aTimeout)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(aTimeout);

    while (!sTerminated && (aTimeout == 0 || std::chrono::steady_clock::now() < deadline))
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

static dnssdError RunRegister(const ToolOptions &aOptions, char *aArgs[], int aArgCount)
{
    dnssdError                         error = DNSSD_ERROR_NONE;
    long                               port;
    std::unique_ptr<dnssd::RegisterOp> op;

    VerifyOrExit(aArgCount == 3, error = DNSSD_ERROR_INVALID_ARGS);
    VerifyOrExit(ParseInteger(aArgs[2], port) && port >= 0 && port <= UINT16_MAX, error = DNSSD_ERROR_INVALID_ARGS);

    op = MakeUnique<dnssd::RegisterOp>(
        aArgs[0], aArgs[1], static_cast<uint16_t>(port),
        [](dnssd::RegisterOp &, dnssdError aError, bool aAdd, const std::string &aName, const std::string &aType,
           const std::string &aDomain) {
            if (aError != DNSSD_ERROR_NONE)
            {
                printf("register failed: %s\n", dnssdErrorString(aError));
            }
            else
            {
                printf("%s %s.%s%s\n", aAdd ? "registered" : "removed", aName.c_str(), aType.c_str(),
                       aDomain.c_str());
            }
            fflush(stdout);
        });

    for (const std::string &pair : aOptions.mTxtPairs)
    {
        size_t separator = pair.find('=');

        if (separator == std::string::npos)
        {
            SuccessOrExit(error = op->SetTXTPair(pair, ""));
        }
        else
        {
            SuccessOrExit(error = op->SetTXTPair(pair.substr(0, separator), pair.substr(separator + 1)));
        }
    }

    SuccessOrExit(error = op->SetDomain(aOptions.mDomain));
    SuccessOrExit(error = op->SetHost(aOptions.mHost));
    SuccessOrExit(error = op->SetInterfaceIndex(aOptions.mInterfaceIndex));
    SuccessOrExit(error = op->SetNoAutoRename(aOptions.mNoRename));
    SuccessOrExit(error = op->Start());

    WaitForTermination(aOptions.mTimeout);
    op->Stop();

exit:
    return error;
}

static dnssdError RunBrowse(const ToolOptions &aOptions, char *aArgs[], int aArgCount)
{
    dnssdError                       error = DNSSD_ERROR_NONE;
    std::unique_ptr<dnssd::BrowseOp> op;

    VerifyOrExit(aArgCount == 1, error = DNSSD_ERROR_INVALID_ARGS);

    op = MakeUnique<dnssd::BrowseOp>(aArgs[0], [](dnssd::BrowseOp &, dnssdError aError, bool aAdd,
                                                         uint32_t aInterfaceIndex, const std::string &aName,
                                                         const std::string &aType, const std::string &aDomain) {
        if (aError != DNSSD_ERROR_NONE)
        {
            printf("browse failed: %s\n", dnssdErrorString(aError));
        }
        else
        {
            printf("%s %s.%s%s on interface %" PRIu32 "\n", aAdd ? "add" : "rmv", aName.c_str(), aType.c_str(),
                   aDomain.c_str(), aInterfaceIndex);
        }
        fflush(stdout);
    });

    SuccessOrExit(error = op->SetDomain(aOptions.mDomain));
    SuccessOrExit(error = op->SetInterfaceIndex(aOptions.mInterfaceIndex));
    SuccessOrExit(error = op->Start());

    WaitForTermination(aOptions.mTimeout);
    op->Stop();

exit:
    return error;
}

static dnssdError RunResolve(const ToolOptions &aOptions, char *aArgs[], int aArgCount)
{
    dnssdError                        error = DNSSD_ERROR_NONE;
    std::unique_ptr<dnssd::ResolveOp> op;

    VerifyOrExit(aArgCount == 2, error = DNSSD_ERROR_INVALID_ARGS);

    op = MakeUnique<dnssd::ResolveOp>(
        aOptions.mInterfaceIndex, aArgs[0], aArgs[1], aOptions.mDomain.empty() ? "local" : aOptions.mDomain,
        [](dnssd::ResolveOp &, dnssdError aError, const std::string &aHost, uint16_t aPort, const dnssd::TxtMap &aTxt) {
            if (aError != DNSSD_ERROR_NONE)
            {
                printf("resolve failed: %s\n", dnssdErrorString(aError));
            }
            else
            {
                printf("%s:%u %s\n", aHost.c_str(), aPort, FormatTxt(aTxt).c_str());
            }
            fflush(stdout);
        });

    SuccessOrExit(error = op->Start());

    WaitForTermination(aOptions.mTimeout);
    op->Stop();

exit:
    return error;
}

static dnssdError RunQuery(const ToolOptions &aOptions, char *aArgs[], int aArgCount)
{
    dnssdError                      error   = DNSSD_ERROR_NONE;
    long                            rrType  = 1;
    long                            rrClass = 1;
    std::unique_ptr<dnssd::QueryOp> op;

    VerifyOrExit(aArgCount == 1 || aArgCount == 3, error = DNSSD_ERROR_INVALID_ARGS);

    if (aArgCount == 3)
    {
        VerifyOrExit(ParseInteger(aArgs[1], rrType) && rrType >= 0 && rrType <= UINT16_MAX,
                     error = DNSSD_ERROR_INVALID_ARGS);
        VerifyOrExit(ParseInteger(aArgs[2], rrClass) && rrClass >= 0 && rrClass <= UINT16_MAX,
                     error = DNSSD_ERROR_INVALID_ARGS);
    }

    op = MakeUnique<dnssd::QueryOp>(
        aOptions.mInterfaceIndex, aArgs[0], static_cast<uint16_t>(rrType), static_cast<uint16_t>(rrClass),
        [](dnssd::QueryOp &, dnssdError aError, bool aAdd, bool aMore, uint32_t aInterfaceIndex,
           const std::string &aFullName, uint16_t aRrType, uint16_t aRrClass, const std::vector<uint8_t> &aRdata,
           uint32_t aTtl) {
            if (aError != DNSSD_ERROR_NONE)
            {
                printf("query failed: %s\n", dnssdErrorString(aError));
            }
            else
            {
                printf("%s %s type %u class %u ttl %" PRIu32 " on interface %" PRIu32 ":", aAdd ? "add" : "rmv",
                       aFullName.c_str(), aRrType, aRrClass, aTtl, aInterfaceIndex);

                for (uint8_t byte : aRdata)
                {
                    printf(" %02x", byte);
                }

                printf("%s\n", aMore ? " (more coming)" : "");
            }
            fflush(stdout);
        });

    SuccessOrExit(error = op->Start());

    WaitForTermination(aOptions.mTimeout);
    op->Stop();

exit:
    return error;
}

int main(int argc, char *argv[])
{
    int         opt;
    int         ret     = EXIT_SUCCESS;
    bool        verbose = false;
    ToolOptions options;
    const char *command;
    dnssdError  error = DNSSD_ERROR_NONE;

    while ((opt = getopt_long(argc, argv, "d:hi:t:T:v", kOptions, nullptr)) != -1)
    {
        switch (opt)
        {
        case DNSSD_OPT_DOMAIN:
            options.mDomain = optarg;
            break;

        case DNSSD_OPT_INTERFACE_INDEX:
            if (!ParseInterfaceIndex(optarg, options.mInterfaceIndex))
            {
                fprintf(stderr, "Invalid interface index: %s\n", optarg);
                ExitNow(ret = EXIT_FAILURE);
            }
            break;

        case DNSSD_OPT_TXT:
            options.mTxtPairs.push_back(optarg);
            break;

        case DNSSD_OPT_TIMEOUT:
            if (!ParseInteger(optarg, options.mTimeout) || options.mTimeout < 0)
            {
                fprintf(stderr, "Invalid timeout: %s\n", optarg);
                ExitNow(ret = EXIT_FAILURE);
            }
            break;

        case DNSSD_OPT_VERBOSE:
            verbose = true;
            break;

        case DNSSD_OPT_NO_RENAME:
            options.mNoRename = true;
            break;

        case DNSSD_OPT_HOST:
            options.mHost = optarg;
            break;

        case DNSSD_OPT_HELP:
            PrintHelp(argv[0]);
            ExitNow(ret = EXIT_SUCCESS);
            break;

        default:
            PrintHelp(argv[0]);
            ExitNow(ret = EXIT_FAILURE);
            break;
        }
    }

    if (optind >= argc)
    {
        PrintHelp(argv[0]);
        ExitNow(ret = EXIT_FAILURE);
    }

    dnssdLogInit("dnssd-tool", verbose ? DNSSD_LOG_LEVEL_DEBG : DNSSD_CONFIG_LOG_LEVEL, verbose);

    signal(SIGINT, HandleSignal);
    signal(SIGTERM, HandleSignal);

    command = argv[optind];

    if (strcmp(command, "register") == 0)
    {
        error = RunRegister(options, &argv[optind + 1], argc - optind - 1);
    }
    else if (strcmp(command, "browse") == 0)
    {
        error = RunBrowse(options, &argv[optind + 1], argc - optind - 1);
    }
    else if (strcmp(command, "resolve") == 0)
    {
        error = RunResolve(options, &argv[optind + 1], argc - optind - 1);
    }
    else if (strcmp(command, "query") == 0)
    {
        error = RunQuery(options, &argv[optind + 1], argc - optind - 1);
    }
    else
    {
        fprintf(stderr, "Unknown command: %s\n", command);
        PrintHelp(argv[0]);
        ret = EXIT_FAILURE;
    }

    if (error != DNSSD_ERROR_NONE)
    {
        fprintf(stderr, "%s failed: %s\n", command, dnssdErrorString(error));

        if (error == DNSSD_ERROR_INVALID_ARGS)
        {
            PrintHelp(argv[0]);
        }

        ret = EXIT_FAILURE;
    }

    dnssdLogDeinit();

exit:
    return ret;
}
