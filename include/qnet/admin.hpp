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

#include "qnet/error_codes.hpp"

#include <boost/asio/ip/address.hpp>

#include <string>
#include <system_error>
#include <vector>


namespace qnet {

/// \brief Changes the network configuration of the running system.
class NetworkAdministrator
{
public:
    using IPAddress = boost::asio::ip::address;
    using PrefixLen = unsigned char;

    struct InterfaceAddress
    {
        IPAddress addr;
        PrefixLen prefixlen = 0;
    };

    virtual ~NetworkAdministrator() = default;

    /// \brief List the IPv4 or IPv6 addresses of interface `dev`.
    virtual Maybe<std::vector<InterfaceAddress>> listAddresses(const std::string& dev, bool v6) = 0;

    /// \brief Assign an address to interface `dev`. Assigning an address the
    /// interface already has updates its prefix length. Equivalent to
    /// "ip addr replace <addr>/<prefixlen> dev <dev>".
    virtual std::error_code assignAddress(
        const std::string& dev, const IPAddress& addr, PrefixLen prefixlen) = 0;

    /// \brief Remove an address from interface `dev`. Equivalent to
    /// "ip addr del <addr>/<prefixlen> dev <dev>".
    virtual std::error_code removeAddress(
        const std::string& dev, const IPAddress& addr, PrefixLen prefixlen) = 0;

    /// \brief Set a network interface administratively up or down. Equivalent
    /// to "ip link set dev <dev> up".
    virtual std::error_code setInterfaceState(const std::string& dev, bool up) = 0;

    /// \brief Add a link scope route to a single host. Equivalent to
    /// "ip route replace <dst> dev <dev>".
    virtual std::error_code addHostRoute(const std::string& dev, const IPAddress& dst) = 0;

    /// \brief Set the default route of the address family of `gateway`.
    /// Equivalent to "ip route replace default via <gateway> dev <dev>".
    virtual std::error_code setDefaultRoute(const std::string& dev, const IPAddress& gateway) = 0;

    /// \brief Enable or disable scatter-gather offload. Equivalent to
    /// "ethtool -K <dev> sg on|off".
    virtual std::error_code setScatterGather(const std::string& dev, bool enable) = 0;
};

} // namespace qnet
