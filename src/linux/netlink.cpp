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

#include "qnet/linux/netlink.hpp"

#include <libmnl/libmnl.h>
#include <linux/ethtool.h>
#include <linux/rtnetlink.h>
#include <linux/sockios.h>
#include <net/if.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <memory>

using std::uint32_t;
using std::size_t;


namespace qnet {

static std::error_code lastError()
{
    return std::error_code(errno, std::generic_category());
}

static bool putAddress(
    nlmsghdr* nlh, size_t bufsize, std::uint16_t type, const NetworkAdministrator::IPAddress& addr)
{
    if (addr.is_v4()) {
        auto bytes = addr.to_v4().to_bytes();
        return mnl_attr_put_check(nlh, bufsize, type, bytes.size(), bytes.data());
    } else {
        auto bytes = addr.to_v6().to_bytes();
        return mnl_attr_put_check(nlh, bufsize, type, bytes.size(), bytes.data());
    }
}

//////////////////////////
// NetlinkAdministrator //
//////////////////////////

NetlinkAdministrator::NetlinkAdministrator()
    : seq(time(NULL))
{}

std::error_code NetlinkAdministrator::open()
{
    if (nl) return QnetError::Ok;
    nl = mnl_socket_open(NETLINK_ROUTE);
    if (!nl) return lastError();
    if (mnl_socket_bind(nl, 0, MNL_SOCKET_AUTOPID) < 0) {
        auto ec = lastError();
        mnl_socket_close(nl);
        nl = nullptr;
        return ec;
    }
    return QnetError::Ok;
}

void NetlinkAdministrator::close()
{
    if (nl) mnl_socket_close(nl);
    nl = nullptr;
}

namespace {
struct AddressDump
{
    unsigned int iface;
    unsigned char family;
    std::vector<NetworkAdministrator::InterfaceAddress> addrs;
};
}

static int addressCallback(const nlmsghdr* nlh, void* data)
{
    auto dump = reinterpret_cast<AddressDump*>(data);
    auto msg = (const ifaddrmsg*)mnl_nlmsg_get_payload(nlh);
    if (msg->ifa_index != dump->iface || msg->ifa_family != dump->family)
        return MNL_CB_OK;

    const nlattr* local = nullptr;
    const nlattr* address = nullptr;
    // see mnl_attr_for_each
    auto attr = (const nlattr*)mnl_nlmsg_get_payload_offset(nlh, sizeof(ifaddrmsg));
    while (mnl_attr_ok(attr, (const char*)mnl_nlmsg_get_payload_tail(nlh) - (const char*)attr)) {
        auto type = mnl_attr_get_type(attr);
        if (type == IFA_LOCAL) local = attr;
        else if (type == IFA_ADDRESS) address = attr;
        attr = mnl_attr_next(attr);
    }
    // IFA_ADDRESS is the peer address on point-to-point links
    if (!local) local = address;
    if (!local) return MNL_CB_OK;

    NetworkAdministrator::InterfaceAddress entry;
    entry.prefixlen = msg->ifa_prefixlen;
    if (msg->ifa_family == AF_INET) {
        boost::asio::ip::address_v4::bytes_type bytes;
        if (mnl_attr_get_payload_len(local) != bytes.size()) return MNL_CB_OK;
        std::memcpy(bytes.data(), mnl_attr_get_payload(local), bytes.size());
        entry.addr = boost::asio::ip::address_v4(bytes);
    } else {
        boost::asio::ip::address_v6::bytes_type bytes;
        if (mnl_attr_get_payload_len(local) != bytes.size()) return MNL_CB_OK;
        std::memcpy(bytes.data(), mnl_attr_get_payload(local), bytes.size());
        entry.addr = boost::asio::ip::address_v6(bytes);
    }
    dump->addrs.push_back(entry);
    return MNL_CB_OK;
}

Maybe<std::vector<NetworkAdministrator::InterfaceAddress>>
NetlinkAdministrator::listAddresses(const std::string& dev, bool v6)
{
    if (!nl) return Error(QnetError::SocketClosed);
    unsigned int iface = if_nametoindex(dev.c_str());
    if (iface == 0) return Error(QnetError::InterfaceNotFound);

    size_t bufsize = MNL_SOCKET_BUFFER_SIZE;
    auto buf = std::make_unique<char[]>(bufsize);

    auto nlh = mnl_nlmsg_put_header(buf.get());
    nlh->nlmsg_type = RTM_GETADDR;
    nlh->nlmsg_flags = NLM_F_REQUEST | NLM_F_DUMP;
    nlh->nlmsg_seq = seq++;
    auto reqSeq = nlh->nlmsg_seq;

    auto msg = (ifaddrmsg*)mnl_nlmsg_put_extra_header(nlh, sizeof(ifaddrmsg));
    msg->ifa_family = v6 ? AF_INET6 : AF_INET;

    auto portid = mnl_socket_get_portid(nl);
    if (mnl_socket_sendto(nl, nlh, nlh->nlmsg_len) < 0) {
        return Error(lastError());
    }

    AddressDump dump{iface, (unsigned char)(v6 ? AF_INET6 : AF_INET), {}};
    while (true) {
        ssize_t numbytes = mnl_socket_recvfrom(nl, buf.get(), bufsize);
        if (numbytes < 0) return Error(lastError());
        int res = mnl_cb_run(buf.get(), numbytes, reqSeq, portid, addressCallback, &dump);
        if (res < 0) return Error(lastError());
        if (res == MNL_CB_STOP) break;
    }
    return dump.addrs;
}

std::error_code NetlinkAdministrator::assignAddress(
    const std::string& dev, const IPAddress& addr, PrefixLen prefixlen)
{
    return modAddress(RTM_NEWADDR, NLM_F_CREATE | NLM_F_REPLACE, dev, addr, prefixlen);
}

std::error_code NetlinkAdministrator::removeAddress(
    const std::string& dev, const IPAddress& addr, PrefixLen prefixlen)
{
    return modAddress(RTM_DELADDR, 0, dev, addr, prefixlen);
}

std::error_code NetlinkAdministrator::modAddress(
    std::uint16_t type, std::uint16_t flags,
    const std::string& dev, const IPAddress& addr, PrefixLen prefixlen)
{
    if (!nl) return QnetError::SocketClosed;
    unsigned int iface = if_nametoindex(dev.c_str());
    if (iface == 0) return QnetError::InterfaceNotFound;

    size_t bufsize = MNL_SOCKET_BUFFER_SIZE;
    auto buf = std::make_unique<char[]>(bufsize);

    auto nlh = mnl_nlmsg_put_header(buf.get());
    nlh->nlmsg_type = type;
    nlh->nlmsg_flags = NLM_F_REQUEST | NLM_F_ACK | flags;
    nlh->nlmsg_seq = seq++;

    auto msg = (ifaddrmsg*)mnl_nlmsg_put_extra_header(nlh, sizeof(ifaddrmsg));
    msg->ifa_family = addr.is_v4() ? AF_INET : AF_INET6;
    msg->ifa_prefixlen = prefixlen;
    msg->ifa_scope = RT_SCOPE_UNIVERSE;
    msg->ifa_index = iface;
    if (!putAddress(nlh, bufsize, IFA_LOCAL, addr))
        return QnetError::LogicError;
    if (!putAddress(nlh, bufsize, IFA_ADDRESS, addr))
        return QnetError::LogicError;

    return execute(nlh, buf.get(), bufsize);
}

std::error_code NetlinkAdministrator::setInterfaceState(const std::string& dev, bool up)
{
    if (!nl) return QnetError::SocketClosed;
    unsigned int iface = if_nametoindex(dev.c_str());
    if (iface == 0) return QnetError::InterfaceNotFound;

    size_t bufsize = MNL_SOCKET_BUFFER_SIZE;
    auto buf = std::make_unique<char[]>(bufsize);

    auto nlh = mnl_nlmsg_put_header(buf.get());
    nlh->nlmsg_type = RTM_SETLINK;
    nlh->nlmsg_flags = NLM_F_REQUEST | NLM_F_ACK;
    nlh->nlmsg_seq = seq++;

    auto info = (ifinfomsg*)mnl_nlmsg_put_extra_header(nlh, sizeof(ifinfomsg));
    info->ifi_family = AF_UNSPEC;
    info->ifi_index = (int)iface;
    info->ifi_flags = up ? IFF_UP : 0;
    info->ifi_change = IFF_UP;

    return execute(nlh, buf.get(), bufsize);
}

std::error_code NetlinkAdministrator::addHostRoute(const std::string& dev, const IPAddress& dst)
{
    PrefixLen prefixlen = dst.is_v4() ? 32 : 128;
    return replaceRoute(dev, &dst, prefixlen, nullptr, RT_SCOPE_LINK);
}

std::error_code NetlinkAdministrator::setDefaultRoute(
    const std::string& dev, const IPAddress& gateway)
{
    return replaceRoute(dev, nullptr, 0, &gateway, RT_SCOPE_UNIVERSE);
}

std::error_code NetlinkAdministrator::replaceRoute(
    const std::string& dev, const IPAddress* dst, PrefixLen prefixlen,
    const IPAddress* via, unsigned char scope)
{
    if (!nl) return QnetError::SocketClosed;
    unsigned int iface = if_nametoindex(dev.c_str());
    if (iface == 0) return QnetError::InterfaceNotFound;

    const IPAddress* any = dst ? dst : via;
    if (!any) return QnetError::InvalidArgument;

    size_t bufsize = MNL_SOCKET_BUFFER_SIZE;
    auto buf = std::make_unique<char[]>(bufsize);

    auto nlh = mnl_nlmsg_put_header(buf.get());
    nlh->nlmsg_type = RTM_NEWROUTE;
    nlh->nlmsg_flags = NLM_F_REQUEST | NLM_F_ACK | NLM_F_CREATE | NLM_F_REPLACE;
    nlh->nlmsg_seq = seq++;

    auto rtm = (rtmsg*)mnl_nlmsg_put_extra_header(nlh, sizeof(rtmsg));
    rtm->rtm_family = any->is_v4() ? AF_INET : AF_INET6;
    rtm->rtm_dst_len = dst ? prefixlen : 0;
    rtm->rtm_protocol = RTPROT_BOOT;
    rtm->rtm_table = RT_TABLE_MAIN;
    rtm->rtm_type = RTN_UNICAST;
    rtm->rtm_scope = scope;
    if (!mnl_attr_put_u32_check(nlh, bufsize, RTA_OIF, iface))
        return QnetError::LogicError;
    if (dst && !putAddress(nlh, bufsize, RTA_DST, *dst))
        return QnetError::LogicError;
    if (via && !putAddress(nlh, bufsize, RTA_GATEWAY, *via))
        return QnetError::LogicError;

    return execute(nlh, buf.get(), bufsize);
}

std::error_code NetlinkAdministrator::setScatterGather(const std::string& dev, bool enable)
{
    ifreq req = {};
    if (dev.size() >= sizeof(req.ifr_name)) return QnetError::InvalidArgument;
    std::strncpy(req.ifr_name, dev.c_str(), sizeof(req.ifr_name) - 1);

    ethtool_value value = {};
    value.cmd = ETHTOOL_SSG;
    value.data = enable ? 1 : 0;
    req.ifr_data = reinterpret_cast<char*>(&value);

    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return lastError();
    std::error_code ec;
    if (::ioctl(fd, SIOCETHTOOL, &req) < 0) {
        ec = (errno == ENODEV) ? make_error_code(QnetError::InterfaceNotFound) : lastError();
    }
    ::close(fd);
    return ec;
}

std::error_code NetlinkAdministrator::execute(nlmsghdr* nlh, char* buf, size_t bufsize)
{
    auto portid = mnl_socket_get_portid(nl);
    auto reqSeq = nlh->nlmsg_seq;
    if (mnl_socket_sendto(nl, nlh, nlh->nlmsg_len) < 0) {
        return lastError();
    }
    ssize_t numbytes = mnl_socket_recvfrom(nl, buf, bufsize);
    if (numbytes < 0) {
        return lastError();
    }
    // the reply overwrites the request in buf
    if (mnl_cb_run(buf, numbytes, reqSeq, portid, nullptr, nullptr) < 0) {
        return lastError();
    }
    return QnetError::Ok;
}

} // namespace qnet
