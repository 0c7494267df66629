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

#pragma once

#include "qnet/admin.hpp"
#include "qnet/paths.hpp"
#include "qnet/process.hpp"
#include "qnet/store.hpp"

#include <string>
#include <system_error>


namespace qnet {

/// \brief DNS servers a network VM offers to its clients.
struct NetVmDns
{
    std::string primary;
    std::string secondary;
};

/// \brief Turns a VM into a gateway for the VMs connected to it.
class GatewayEnabler
{
public:
    GatewayEnabler(
        ConfigStore& store, NetworkAdministrator& admin, CommandRunner& runner, const Paths& paths)
        : store(store), admin(admin), runner(runner), paths(paths)
    {}

    /// \brief Whether this VM provides network access to other VMs.
    bool isNetworkVm();

    /// \brief DNS servers for client VMs. The gateway address is used if no
    /// primary DNS server is configured.
    NetVmDns readDns();

    /// \brief Set up forwarding if this VM is a network VM, otherwise do
    /// nothing. Only failing to enable forwarding is reported as an error,
    /// the other steps are best effort.
    std::error_code run();

    /// \brief Load the Xen network backend driver.
    void loadBackendModule();

    /// \brief Record DNS servers and install the DNAT rules redirecting client
    /// DNS traffic to them.
    void setupDnsRedirection(const NetVmDns& dns);

    /// \brief Enable IPv4 and optionally IPv6 forwarding.
    std::error_code enableForwarding(bool ipv6);

private:
    ConfigStore& store;
    NetworkAdministrator& admin;
    CommandRunner& runner;
    const Paths& paths;
};

} // namespace qnet
