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

#include <filesystem>
#include <string>
#include <vector>


namespace qnet {

// Locations of files and helper programs used by the setup tools. All of them
// can be overridden from the command line or a configuration file.
struct Paths
{
    // System DNS resolver configuration
    std::filesystem::path resolvConf = "/etc/resolv.conf";
    // Directory NetworkManager loads connection profiles from
    std::filesystem::path nmConnectionDir = "/etc/NetworkManager/system-connections";
    // DNS servers recorded for the DNAT-to-DNS redirector
    std::filesystem::path nsRecord = "/var/run/qubes/qubes-ns";
    // One file per enabled service flag
    std::filesystem::path serviceFlagDir = "/run/qubes-service";
    // Lists of files the tools must not overwrite
    std::filesystem::path protectedFilesDir = "/etc/qubes/protected-files.d";
    // Hook directories, run in order before the user hook
    std::vector<std::filesystem::path> hookDirs = {
        "/etc/qubes/qubes-ip-change-hook.d",
        "/rw/config/qubes-ip-change-hook.d",
    };
    std::filesystem::path userHook = "/rw/config/qubes-ip-change-hook";
    // Firewall scripts, run in order before the user script
    std::vector<std::filesystem::path> firewallHookDirs = {
        "/etc/qubes/qubes-firewall.d",
        "/rw/config/qubes-firewall.d",
    };
    std::filesystem::path firewallUserScript = "/rw/config/qubes-firewall-user-script";
    std::filesystem::path sysClassNet = "/sys/class/net";
    std::filesystem::path procSys = "/proc/sys";

    std::string qubesdbRead = "qubesdb-read";
    std::string qubesdbList = "qubesdb-list";
    std::string nmcli = "nmcli";
    std::string modprobe = "modprobe";
    std::string dnatToNs = "/usr/lib/qubes/qubes-setup-dnat-to-ns";
    std::string nft = "nft";
    std::string iptables = "iptables";
    std::string ip6tables = "ip6tables";
    std::string iptablesRestore = "iptables-restore";
    std::string ip6tablesRestore = "ip6tables-restore";

    // Uplink interface of a network VM
    std::string uplink = "eth0";
};

} // namespace qnet
