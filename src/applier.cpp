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
#include "qnet/files.hpp"
#include "qnet/profile.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>


namespace qnet {

using IPAddress = NetworkAdministrator::IPAddress;
using PrefixLen = NetworkAdministrator::PrefixLen;

static Maybe<IPAddress> parseAddress(const std::string& str, bool v6)
{
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(str, ec);
    if (ec || addr.is_v6() != v6) {
        spdlog::error("'{}' is not a valid IPv{} address", str, v6 ? 6 : 4);
        return Error(QnetError::InvalidArgument);
    }
    return addr;
}

// Writing through a symlink must replace the link target, not the link.
static std::filesystem::path resolveLink(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::is_symlink(path, ec)) return path;
    auto target = std::filesystem::weakly_canonical(path, ec);
    return ec ? path : target;
}

// A route that is already present after a quick remove and re-add is fine.
static std::error_code ignoreExisting(std::error_code ec)
{
    if (ec == std::errc::file_exists) return QnetError::Ok;
    return ec;
}

// The interface keeps a single IPv4 address. Addresses assigned on an earlier
// event with a different configuration are dropped.
std::error_code DirectApplier::removeStaleAddresses(const std::string& iface, const IPAddress& ip)
{
    auto current = admin.listAddresses(iface, false);
    if (isError(current)) {
        spdlog::error("Listing addresses of {} failed: {}", iface, fmtError(current.error()));
        return current.error();
    }
    for (const auto& entry : *current) {
        if (entry.addr == ip) continue;
        spdlog::info("Removing stale address {}/{} from {}",
            entry.addr.to_string(), (int)entry.prefixlen, iface);
        if (auto ec = admin.removeAddress(iface, entry.addr, entry.prefixlen); ec) {
            spdlog::error("Removing {} from {} failed: {}",
                entry.addr.to_string(), iface, ec.message());
            return ec;
        }
    }
    return QnetError::Ok;
}

std::error_code DirectApplier::apply(
    const std::string& iface, const ResolvedConfig& config, const Policy& policy)
{
    auto ip = parseAddress(config.ip, false);
    if (isError(ip)) return ip.error();
    auto prefix = netmaskToPrefix(config.netmask);
    if (isError(prefix)) {
        spdlog::error("Invalid netmask '{}'", config.netmask);
        return prefix.error();
    }
    if (auto ec = removeStaleAddresses(iface, *ip); ec) return ec;
    if (auto ec = admin.assignAddress(iface, *ip, (PrefixLen)*prefix); ec) {
        spdlog::error("Assigning {}/{} to {} failed: {}", config.ip, *prefix, iface, ec.message());
        return ec;
    }

    if (!config.ip6.empty()) {
        auto ip6 = parseAddress(config.ip6, true);
        if (isError(ip6)) return ip6.error();
        auto prefix6 = parsePrefix6(config.netmask6);
        if (isError(prefix6)) {
            spdlog::error("Invalid IPv6 prefix length '{}'", config.netmask6);
            return prefix6.error();
        }
        if (auto ec = admin.assignAddress(iface, *ip6, (PrefixLen)*prefix6); ec) {
            spdlog::error("Assigning {}/{} to {} failed: {}",
                config.ip6, *prefix6, iface, ec.message());
            return ec;
        }
    }

    if (auto ec = admin.setInterfaceState(iface, true); ec) {
        spdlog::error("Can't bring {} up: {}", iface, ec.message());
        return ec;
    }

    if (!config.gateway.empty()) {
        auto gateway = parseAddress(config.gateway, false);
        if (isError(gateway)) return gateway.error();
        if (auto ec = ignoreExisting(admin.addHostRoute(iface, *gateway)); ec) {
            spdlog::error("Adding route to gateway {} failed: {}", config.gateway, ec.message());
            return ec;
        }
        if (!policy.disableDefaultRoute) {
            if (auto ec = ignoreExisting(admin.setDefaultRoute(iface, *gateway)); ec) {
                spdlog::error("Setting default route via {} failed: {}",
                    config.gateway, ec.message());
                return ec;
            }
        }
    }

    if (!config.gateway6.empty()) {
        auto gateway6 = parseAddress(config.gateway6, true);
        if (isError(gateway6)) return gateway6.error();
        if (gateway6->to_v6().is_link_local()) {
            spdlog::debug("Not adding routes for link-local gateway {}", config.gateway6);
        } else {
            if (auto ec = ignoreExisting(admin.addHostRoute(iface, *gateway6)); ec) {
                spdlog::error("Adding route to gateway {} failed: {}",
                    config.gateway6, ec.message());
                return ec;
            }
            if (!policy.disableDefaultRoute) {
                if (auto ec = ignoreExisting(admin.setDefaultRoute(iface, *gateway6)); ec) {
                    spdlog::error("Setting default route via {} failed: {}",
                        config.gateway6, ec.message());
                    return ec;
                }
            }
        }
    }

    spdlog::info("Configured {} with address {}/{}", iface, config.ip, *prefix);
    return updateResolvConf(config, policy);
}

std::error_code DirectApplier::updateResolvConf(const ResolvedConfig& config, const Policy& policy)
{
    if (isProtectedFile(paths.protectedFilesDir, paths.resolvConf)) {
        spdlog::debug("{} is protected, not updating", paths.resolvConf.string());
        return QnetError::Ok;
    }

    std::string content;
    if (!policy.disableDnsServer)
        content = formatResolvConf({config.primaryDns, config.secondaryDns});

    auto target = resolveLink(paths.resolvConf);
    if (auto ec = writeFileAtomic(target, content); ec) {
        spdlog::error("Writing {} failed: {}", target.string(), ec.message());
        return ec;
    }
    return QnetError::Ok;
}

} // namespace qnet
