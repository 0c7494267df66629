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

#include "qnet/policy.hpp"

#include "gtest/gtest.h"
#include "utilities.hpp"


class PolicyTest : public TempDirTest {};

TEST_F(PolicyTest, ServiceFlags)
{
    using namespace qnet;
    auto flags = root / "qubes-service";

    auto policy = loadPolicy(flags);
    EXPECT_FALSE(policy.disableDefaultRoute);
    EXPECT_FALSE(policy.disableDnsServer);
    EXPECT_FALSE(policy.networkManager);

    writeTextFile(flags / "disable-dns-server", "");
    writeTextFile(flags / "network-manager", "");
    EXPECT_TRUE(isServiceEnabled(flags, "network-manager"));
    EXPECT_FALSE(isServiceEnabled(flags, "disable-default-route"));

    policy = loadPolicy(flags);
    EXPECT_FALSE(policy.disableDefaultRoute);
    EXPECT_TRUE(policy.disableDnsServer);
    EXPECT_TRUE(policy.networkManager);
}

TEST_F(PolicyTest, ProtectedFiles)
{
    using namespace qnet;
    auto confDir = root / "protected-files.d";

    EXPECT_FALSE(isProtectedFile(confDir, "/etc/resolv.conf"));

    writeTextFile(confDir / "hosts.conf", "/etc/hosts\n");
    writeTextFile(confDir / "resolv.txt", "/etc/resolv.conf\n");
    EXPECT_TRUE(isProtectedFile(confDir, "/etc/hosts"));
    EXPECT_FALSE(isProtectedFile(confDir, "/etc/resolv.conf"));

    writeTextFile(confDir / "dns.conf", "/etc/hostname\n  /etc/resolv.conf  \n");
    EXPECT_TRUE(isProtectedFile(confDir, "/etc/resolv.conf"));
    EXPECT_FALSE(isProtectedFile(confDir, "/etc/resolv"));
}
