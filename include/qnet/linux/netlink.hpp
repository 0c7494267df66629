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
#include "qnet/error_codes.hpp"

#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

struct mnl_socket;
struct nlmsghdr;


namespace qnet {

/// \brief Configures interfaces and routes via a netlink ROUTE socket and
/// offloads via the ethtool ioctl.
class NetlinkAdministrator : public NetworkAdministrator
{
public:
    NetlinkAdministrator();
    NetlinkAdministrator(const NetlinkAdministrator& other) = delete;
    NetlinkAdministrator& operator=(const NetlinkAdministrator& other) = delete;

    /// \brief Open netlink socket.
    std::error_code open();

    void close();

    ~NetlinkAdministrator() { close(); }

    Maybe<std::vector<InterfaceAddress>> listAddresses(const std::string& dev, bool v6) override;
    std::error_code assignAddress(
        const std::string& dev, const IPAddress& addr, PrefixLen prefixlen) override;
    std::error_code removeAddress(
        const std::string& dev, const IPAddress& addr, PrefixLen prefixlen) override;
    std::error_code setInterfaceState(const std::string& dev, bool up) override;
    std::error_code addHostRoute(const std::string& dev, const IPAddress& dst) override;
    std::error_code setDefaultRoute(const std::string& dev, const IPAddress& gateway) override;
    std::error_code setScatterGather(const std::string& dev, bool enable) override;

private:
    std::error_code modAddress(
        std::uint16_t type, std::uint16_t flags,
        const std::string& dev, const IPAddress& addr, PrefixLen prefixlen);
    std::error_code replaceRoute(
        const std::string& dev, const IPAddress* dst, PrefixLen prefixlen,
        const IPAddress* via, unsigned char scope);
    std::error_code execute(nlmsghdr* nlh, char* buf, std::size_t bufsize);

private:
    mnl_socket* nl = nullptr;
    std::uint32_t seq = 0;
};

} // namespace qnet
