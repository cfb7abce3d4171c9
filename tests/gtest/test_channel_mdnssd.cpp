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

#include <gtest/gtest.h>

#include "channel/channel_mdnssd.cpp"

TEST(ChannelMDnsSd, TestDNSErrorToString)
{
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_NoError), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_Unknown), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_NoSuchName), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_NoMemory), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_BadParam), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_BadReference), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_BadState), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_BadFlags), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_Unsupported), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_NotInitialized), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_AlreadyRegistered), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_NameConflict), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_Invalid), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_Firewall), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_Incompatible), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_BadInterfaceIndex), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_Refused), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_NoSuchRecord), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_NoAuth), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_NoSuchKey), nullptr);
    EXPECT_NE(dnssd::DNSErrorToString(kDNSServiceErr_Timeout), nullptr);
    EXPECT_STREQ(dnssd::DNSErrorToString(kDNSServiceErr_NoError), "OK");
    EXPECT_STREQ(dnssd::DNSErrorToString(12345), "Unrecognized");
}

TEST(ChannelMDnsSd, TestDNSErrorToDnssdError)
{
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_NoError), DNSSD_ERROR_NONE);
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_NoSuchName), DNSSD_ERROR_NOT_FOUND);
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_NoSuchRecord), DNSSD_ERROR_NOT_FOUND);
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_BadParam), DNSSD_ERROR_INVALID_ARGS);
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_BadInterfaceIndex), DNSSD_ERROR_INVALID_ARGS);
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_NameConflict), DNSSD_ERROR_DUPLICATED);
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_AlreadyRegistered), DNSSD_ERROR_DUPLICATED);
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_Unsupported), DNSSD_ERROR_NOT_IMPLEMENTED);
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_ServiceNotRunning), DNSSD_ERROR_INVALID_STATE);
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_NoMemory), DNSSD_ERROR_NO_MEMORY);
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_Refused), DNSSD_ERROR_REFUSED);
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_Timeout), DNSSD_ERROR_TIMEOUT);
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_Unknown), DNSSD_ERROR_MDNS);
    EXPECT_EQ(dnssd::DNSErrorToDnssdError(kDNSServiceErr_DoubleNAT), DNSSD_ERROR_MDNS);
}
