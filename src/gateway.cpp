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

#include "qnet/files.hpp"
#include "qnet/gateway.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <filesystem>


namespace qnet {

// Name of the Xen network backend driver on old and current kernels
static const std::array<const char*, 2> BACKEND_MODULES = {"netbk", "xen-netback"};

bool GatewayEnabler::isNetworkVm()
{
    return !store.readOrEmpty("/qubes-netvm-network").empty();
}

NetVmDns GatewayEnabler::readDns()
{
    NetVmDns dns;
    dns.primary = store.readOrEmpty("/qubes-netvm-primary-dns");
    dns.secondary = store.readOrEmpty("/qubes-netvm-secondary-dns");
    if (dns.primary.empty()) dns.primary = store.readOrEmpty("/qubes-netvm-gateway");
    return dns;
}

std::error_code GatewayEnabler::run()
{
    if (!isNetworkVm()) {
        spdlog::debug("Not a network VM, nothing to do");
        return QnetError::Ok;
    }

    auto dns = readDns();
    bool ipv6 = !store.readOrEmpty("/qubes-ip6").empty();

    loadBackendModule();
    setupDnsRedirection(dns);
    auto ec = enableForwarding(ipv6);

    if (auto sg = admin.setScatterGather(paths.uplink, false); sg) {
        spdlog::warn("Can't disable scatter-gather on {}: {}", paths.uplink, sg.message());
    }
    return ec;
}

void GatewayEnabler::loadBackendModule()
{
    for (const char* module : BACKEND_MODULES) {
        auto res = runner.run({paths.modprobe, module});
        if (!isError(res) && *res == 0) {
            spdlog::debug("Loaded kernel module {}", module);
            return;
        }
    }

    // The module is either built-in or module loading is not supported at all
    // if procfs is mounted but has no modules_disabled entry.
    std::error_code ec;
    bool noModules = std::filesystem::exists(paths.procSys / "kernel", ec)
        && !std::filesystem::exists(paths.procSys / "kernel" / "modules_disabled", ec);
    if (noModules)
        spdlog::debug("Kernel has no module support, assuming network backend is built-in");
    else
        spdlog::error("Loading the Xen network backend driver failed");
}

void GatewayEnabler::setupDnsRedirection(const NetVmDns& dns)
{
    std::error_code ec;
    std::filesystem::create_directories(paths.nsRecord.parent_path(), ec);
    if (!ec) ec = writeFileAtomic(paths.nsRecord, formatNsRecord(dns.primary, dns.secondary));
    if (ec) {
        spdlog::error("Writing {} failed: {}", paths.nsRecord.string(), ec.message());
    }

    auto res = runner.run({paths.dnatToNs});
    if (isError(res))
        spdlog::warn("Can't run {}: {}", paths.dnatToNs, fmtError(res.error()));
    else if (*res != 0)
        spdlog::warn("{} failed with exit status {}", paths.dnatToNs, *res);
}

std::error_code GatewayEnabler::enableForwarding(bool ipv6)
{
    auto ipv4Path = paths.procSys / "net" / "ipv4" / "ip_forward";
    if (auto ec = writeFileInPlace(ipv4Path, "1\n"); ec) {
        spdlog::error("Enabling IPv4 forwarding failed: {}", ec.message());
        return ec;
    }
    if (ipv6) {
        auto ipv6Path = paths.procSys / "net" / "ipv6" / "conf" / "all" / "forwarding";
        if (auto ec = writeFileInPlace(ipv6Path, "1\n"); ec) {
            spdlog::error("Enabling IPv6 forwarding failed: {}", ec.message());
            return ec;
        }
    }
    spdlog::info("Enabled {} forwarding", ipv6 ? "IPv4 and IPv6" : "IPv4");
    return QnetError::Ok;
}

} // namespace qnet
