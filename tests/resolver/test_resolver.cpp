// Copyright (c) 2024-2025 Lars-Christian Schulz
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include "qnet/resolver.hpp"
#include "qnet/store.hpp"

#include "gtest/gtest.h"
#include "utilities.hpp"


static const char* MAC = "00:16:3e:5e:6c:00";
static const char* OTHER_MAC = "00:16:3e:5e:6c:01";

TEST(Resolver, Mac)
{
    using namespace qnet;
    EXPECT_TRUE(isValidMac("00:16:3e:5e:6c:00"));
    EXPECT_TRUE(isValidMac("00:16:3E:5E:6C:00"));
    EXPECT_FALSE(isValidMac(""));
    EXPECT_FALSE(isValidMac("00:16:3e:5e:6c"));
    EXPECT_FALSE(isValidMac("00-16-3e-5e-6c-00"));
    EXPECT_FALSE(isValidMac("00:16:3e:5e:6c:0g"));
    EXPECT_EQ(normalizeMac(" 00:16:3E:5E:6C:00\n"), "00:16:3e:5e:6c:00");
}

TEST(Resolver, PerInterfaceKeys)
{
    using namespace qnet;
    MemoryStore store;
    store.set("/net-config/00:16:3e:5e:6c:00/ip", "10.137.0.5");
    store.set("/net-config/00:16:3e:5e:6c:00/netmask", "255.255.255.0");
    store.set("/net-config/00:16:3e:5e:6c:00/gateway", "10.137.0.1");
    store.set("/net-config/00:16:3e:5e:6c:00/ip6", "fd09:24ef:4179::a89:5");
    store.set("/net-config/00:16:3e:5e:6c:00/netmask6", "64");
    store.set("/net-config/00:16:3e:5e:6c:00/gateway6", "fd09:24ef:4179::a89:1");
    store.set("/qubes-ip", "10.0.0.1");
    store.set("/qubes-gateway", "10.0.0.254");
    store.set("/qubes-primary-dns", "10.139.1.1");
    store.set("/qubes-secondary-dns", "10.139.1.2");

    auto config = unwrap(resolveConfig(store, MAC));
    EXPECT_EQ(config.ip, "10.137.0.5");
    EXPECT_EQ(config.netmask, "255.255.255.0");
    EXPECT_EQ(config.gateway, "10.137.0.1");
    EXPECT_EQ(config.ip6, "fd09:24ef:4179::a89:5");
    EXPECT_EQ(config.netmask6, "64");
    EXPECT_EQ(config.gateway6, "fd09:24ef:4179::a89:1");
    EXPECT_EQ(config.primaryDns, "10.139.1.1");
    EXPECT_EQ(config.secondaryDns, "10.139.1.2");

    // Upper case MAC addresses are looked up in lower case
    EXPECT_EQ(unwrap(resolveConfig(store, "00:16:3E:5E:6C:00")), config);
}

TEST(Resolver, LegacyKeys)
{
    using namespace qnet;
    MemoryStore store;
    store.set("/qubes-ip", "10.137.0.5");
    store.set("/qubes-gateway", "10.138.0.1");
    store.set("/qubes-netmask", "255.255.0.0");
    store.set("/qubes-primary-dns", "10.139.1.1");

    // No legacy MAC recorded, the VM-wide keys apply to every interface
    auto config = unwrap(resolveConfig(store, MAC));
    EXPECT_EQ(config.ip, "10.137.0.5");
    EXPECT_EQ(config.gateway, "10.138.0.1");
    EXPECT_EQ(config.netmask, "255.255.255.255");
    EXPECT_EQ(config.netmask6, "128");
    EXPECT_EQ(config.ip6, "");
    EXPECT_EQ(unwrap(resolveConfig(store, OTHER_MAC)), config);

    // Legacy MAC restricts the VM-wide keys to one interface
    store.set("/qubes-mac", "00:16:3E:5E:6C:00");
    EXPECT_EQ(unwrap(resolveConfig(store, MAC)), config);
    auto other = resolveConfig(store, OTHER_MAC);
    ASSERT_TRUE(isError(other));
    EXPECT_EQ(other.error(), QnetError::NoAddress);

    // Per-interface keys win over VM-wide keys
    store.set("/net-config/00:16:3e:5e:6c:00/gateway", "10.137.0.1");
    EXPECT_EQ(unwrap(resolveConfig(store, MAC)).gateway, "10.137.0.1");
    store.set("/net-config/00:16:3e:5e:6c:01/ip", "10.137.0.6");
    auto second = unwrap(resolveConfig(store, OTHER_MAC));
    EXPECT_EQ(second.ip, "10.137.0.6");
    EXPECT_EQ(second.gateway, "");
}

TEST(Resolver, LookupField)
{
    using namespace qnet;
    MemoryStore store;
    store.set("/qubes-netmask", "255.0.0.0");
    store.set("/qubes-ip6", "fd09:24ef:4179::a89:5");
    EXPECT_EQ(lookupField(store, ConfigField::Netmask, MAC, ""), "");
    EXPECT_EQ(lookupField(store, ConfigField::Ip6, MAC, ""), "fd09:24ef:4179::a89:5");
    EXPECT_EQ(lookupField(store, ConfigField::Ip6, MAC, OTHER_MAC), "");
}

TEST(Resolver, Dns)
{
    using namespace qnet;
    MemoryStore store;
    store.set("/qubes-ip", "10.137.0.5");
    store.set("/qubes-gateway", "10.138.0.1");
    store.set("/qubes-secondary-dns", "10.139.1.2");

    auto config = unwrap(resolveConfig(store, MAC));
    EXPECT_EQ(config.primaryDns, "10.138.0.1");
    EXPECT_EQ(config.secondaryDns, "10.139.1.2");

    store.set("/qubes-primary-dns", "10.139.1.1");
    EXPECT_EQ(unwrap(resolveConfig(store, MAC)).primaryDns, "10.139.1.1");
}

TEST(Resolver, Errors)
{
    using namespace qnet;
    MemoryStore store;

    auto config = resolveConfig(store, MAC);
    ASSERT_TRUE(isError(config));
    EXPECT_EQ(config.error(), QnetError::NoAddress);

    store.set("/qubes-ip", "10.137.0.5");
    config = resolveConfig(store, "not a mac");
    ASSERT_TRUE(isError(config));
    EXPECT_EQ(config.error(), QnetError::InvalidArgument);
}
