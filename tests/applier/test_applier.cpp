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

#include "qnet/applier.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "mocks.hpp"
#include "utilities.hpp"


class ApplierTest : public TempDirTest
{
protected:
    void SetUp() override
    {
        TempDirTest::SetUp();
        paths.resolvConf = root / "resolv.conf";
        paths.protectedFilesDir = root / "protected-files.d";
        writeTextFile(paths.resolvConf, "nameserver 192.0.2.1\n");

        config.ip = "10.137.0.5";
        config.netmask = "255.255.255.255";
        config.gateway = "10.138.0.1";
        config.netmask6 = "128";
        config.primaryDns = "10.139.1.1";
        config.secondaryDns = "10.139.1.2";
    }

    qnet::Paths paths;
    qnet::ResolvedConfig config;
    MockAdministrator admin;
};

TEST_F(ApplierTest, IPv4)
{
    using namespace qnet;
    using testing::Return;
    DirectApplier applier(admin, paths);

    testing::InSequence seq;
    EXPECT_CALL(admin, assignAddress("eth0", ipAddr("10.137.0.5"), 32));
    EXPECT_CALL(admin, setInterfaceState("eth0", true));
    EXPECT_CALL(admin, addHostRoute("eth0", ipAddr("10.138.0.1")));
    EXPECT_CALL(admin, setDefaultRoute("eth0", ipAddr("10.138.0.1")));

    auto ec = applier.apply("eth0", config, Policy{});
    ASSERT_FALSE(ec) << fmtError(ec);
    EXPECT_EQ(readTextFile(paths.resolvConf), "nameserver 10.139.1.1\nnameserver 10.139.1.2\n");
}

TEST_F(ApplierTest, StaleAddress)
{
    using namespace qnet;
    using testing::_;
    using testing::Return;
    using InterfaceAddress = NetworkAdministrator::InterfaceAddress;
    DirectApplier applier(admin, paths);

    testing::InSequence seq;
    EXPECT_CALL(admin, listAddresses("eth0", false))
        .WillOnce(Return(std::vector<InterfaceAddress>{
            {ipAddr("10.137.0.4"), 32},
            {ipAddr("10.137.0.5"), 24},
        }));
    EXPECT_CALL(admin, removeAddress("eth0", ipAddr("10.137.0.4"), 32));
    EXPECT_CALL(admin, assignAddress("eth0", ipAddr("10.137.0.5"), 32));
    EXPECT_CALL(admin, setInterfaceState("eth0", true));
    EXPECT_CALL(admin, addHostRoute(_, _));
    EXPECT_CALL(admin, setDefaultRoute(_, _));

    auto ec = applier.apply("eth0", config, Policy{});
    ASSERT_FALSE(ec) << fmtError(ec);
}

TEST_F(ApplierTest, ListAddressesFails)
{
    using namespace qnet;
    using testing::_;
    using testing::Return;
    DirectApplier applier(admin, paths);

    EXPECT_CALL(admin, listAddresses("eth0", false))
        .WillOnce(Return(Error(QnetError::InterfaceNotFound)));
    EXPECT_CALL(admin, assignAddress(_, _, _)).Times(0);
    EXPECT_EQ(applier.apply("eth0", config, Policy{}), QnetError::InterfaceNotFound);
}

TEST_F(ApplierTest, IPv6)
{
    using namespace qnet;
    DirectApplier applier(admin, paths);
    config.netmask = "255.255.255.0";
    config.ip6 = "fd09:24ef:4179::a89:5";
    config.netmask6 = "64";
    config.gateway6 = "fd09:24ef:4179::a89:1";

    testing::InSequence seq;
    EXPECT_CALL(admin, assignAddress("eth0", ipAddr("10.137.0.5"), 24));
    EXPECT_CALL(admin, assignAddress("eth0", ipAddr("fd09:24ef:4179::a89:5"), 64));
    EXPECT_CALL(admin, setInterfaceState("eth0", true));
    EXPECT_CALL(admin, addHostRoute("eth0", ipAddr("10.138.0.1")));
    EXPECT_CALL(admin, setDefaultRoute("eth0", ipAddr("10.138.0.1")));
    EXPECT_CALL(admin, addHostRoute("eth0", ipAddr("fd09:24ef:4179::a89:1")));
    EXPECT_CALL(admin, setDefaultRoute("eth0", ipAddr("fd09:24ef:4179::a89:1")));

    auto ec = applier.apply("eth0", config, Policy{});
    ASSERT_FALSE(ec) << fmtError(ec);
}

TEST_F(ApplierTest, LinkLocalGateway6)
{
    using namespace qnet;
    using testing::_;
    DirectApplier applier(admin, paths);
    config.ip6 = "fd09:24ef:4179::a89:5";
    config.gateway6 = "fe80::1";

    EXPECT_CALL(admin, assignAddress("eth0", _, _)).Times(2);
    EXPECT_CALL(admin, setInterfaceState("eth0", true));
    EXPECT_CALL(admin, addHostRoute("eth0", ipAddr("10.138.0.1")));
    EXPECT_CALL(admin, setDefaultRoute("eth0", ipAddr("10.138.0.1")));

    auto ec = applier.apply("eth0", config, Policy{});
    ASSERT_FALSE(ec) << fmtError(ec);
}

TEST_F(ApplierTest, Policy)
{
    using namespace qnet;
    using testing::_;
    DirectApplier applier(admin, paths);
    Policy policy;
    policy.disableDefaultRoute = true;
    policy.disableDnsServer = true;

    EXPECT_CALL(admin, assignAddress("eth0", ipAddr("10.137.0.5"), 32));
    EXPECT_CALL(admin, setInterfaceState("eth0", true));
    EXPECT_CALL(admin, addHostRoute("eth0", ipAddr("10.138.0.1")));
    EXPECT_CALL(admin, setDefaultRoute(_, _)).Times(0);

    auto ec = applier.apply("eth0", config, policy);
    ASSERT_FALSE(ec) << fmtError(ec);
    EXPECT_EQ(readTextFile(paths.resolvConf), "");
}

TEST_F(ApplierTest, Errors)
{
    using namespace qnet;
    using testing::_;
    using testing::Return;
    DirectApplier applier(admin, paths);

    // Stop at the first failure
    EXPECT_CALL(admin, assignAddress("eth0", ipAddr("10.137.0.5"), 32))
        .WillOnce(Return(std::make_error_code(std::errc::operation_not_permitted)));
    EXPECT_CALL(admin, setInterfaceState(_, _)).Times(0);
    EXPECT_CALL(admin, addHostRoute(_, _)).Times(0);
    auto ec = applier.apply("eth0", config, Policy{});
    EXPECT_EQ(ec, std::errc::operation_not_permitted);
    EXPECT_EQ(readTextFile(paths.resolvConf), "nameserver 192.0.2.1\n");

    // Routes that already exist are not an error
    EXPECT_CALL(admin, assignAddress("eth0", ipAddr("10.137.0.5"), 32));
    EXPECT_CALL(admin, setInterfaceState("eth0", true));
    EXPECT_CALL(admin, addHostRoute("eth0", ipAddr("10.138.0.1")))
        .WillOnce(Return(std::make_error_code(std::errc::file_exists)));
    EXPECT_CALL(admin, setDefaultRoute("eth0", ipAddr("10.138.0.1")))
        .WillOnce(Return(std::make_error_code(std::errc::file_exists)));
    ec = applier.apply("eth0", config, Policy{});
    ASSERT_FALSE(ec) << fmtError(ec);

    // Malformed configuration is rejected before changing anything
    auto bad = config;
    bad.netmask = "255.0.255.0";
    EXPECT_EQ(applier.apply("eth0", bad, Policy{}), QnetError::InvalidArgument);
    bad = config;
    bad.ip = "fd09:24ef:4179::a89:5";
    EXPECT_EQ(applier.apply("eth0", bad, Policy{}), QnetError::InvalidArgument);
}

TEST_F(ApplierTest, ResolvConf)
{
    using namespace qnet;
    namespace fs = std::filesystem;
    DirectApplier applier(admin, paths);

    // Symlinks are followed
    auto target = root / "run" / "resolv.conf";
    writeTextFile(target, "");
    fs::remove(paths.resolvConf);
    fs::create_symlink(target, paths.resolvConf);
    config.secondaryDns.clear();
    ASSERT_FALSE(applier.updateResolvConf(config, Policy{}));
    EXPECT_TRUE(fs::is_symlink(paths.resolvConf));
    EXPECT_EQ(readTextFile(target), "nameserver 10.139.1.1\n");

    // Protected files are left alone
    writeTextFile(paths.protectedFilesDir / "resolv.conf", paths.resolvConf.string() + "\n");
    config.primaryDns = "10.139.1.3";
    ASSERT_FALSE(applier.updateResolvConf(config, Policy{}));
    EXPECT_EQ(readTextFile(target), "nameserver 10.139.1.1\n");
}
