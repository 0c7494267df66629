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

#include "cli_args.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <format>
#include <iostream>
#include <map>
#include <stdexcept>


void addCommonOptions(CLI::App& app, CommonArguments& args)
{
    static const std::map<std::string, spdlog::level::level_enum> levels = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"off", spdlog::level::off},
    };
    auto& paths = args.paths;

    app.add_option("--log-level", args.logLevel,
        "Log verbosity: trace, debug, info, warn, error, or off (default info)")
        ->transform(CLI::CheckedTransformer(levels, CLI::ignore_case));
    app.add_option("-l,--log-file", args.logFile,
        "Path to log file. Log is written to stderr if this option is not given.");
    app.add_option("--store", args.storeFile,
        "Read configuration from a file of key=value lines instead of QubesDB");

    auto group = app.add_option_group("Paths", "Locations of system files and helper programs");
    group->add_option("--resolv-conf", paths.resolvConf,
        "DNS resolver configuration (default \"/etc/resolv.conf\")");
    group->add_option("--nm-connection-dir", paths.nmConnectionDir,
        "NetworkManager connection profile directory");
    group->add_option("--ns-record", paths.nsRecord,
        "DNS server record for the DNAT redirector (default \"/var/run/qubes/qubes-ns\")");
    group->add_option("--service-flag-dir", paths.serviceFlagDir,
        "Directory of service flag files (default \"/run/qubes-service\")");
    group->add_option("--protected-files-dir", paths.protectedFilesDir,
        "Directory of protected file lists (default \"/etc/qubes/protected-files.d\")");
    group->add_option("--hook-dir", paths.hookDirs,
        "Directories of IP change hooks, replaces the default list");
    group->add_option("--user-hook", paths.userHook,
        "User IP change hook (default \"/rw/config/qubes-ip-change-hook\")");
    group->add_option("--sysfs-net", paths.sysClassNet,
        "sysfs network class directory (default \"/sys/class/net\")");
    group->add_option("--procfs-sys", paths.procSys,
        "procfs sysctl directory (default \"/proc/sys\")");
    group->add_option("--firewall-hook-dir", paths.firewallHookDirs,
        "Directories of firewall scripts, replaces the default list");
    group->add_option("--firewall-user-script", paths.firewallUserScript,
        "User firewall script (default \"/rw/config/qubes-firewall-user-script\")");
    group->add_option("--qubesdb-read", paths.qubesdbRead, "qubesdb-read program");
    group->add_option("--qubesdb-list", paths.qubesdbList, "qubesdb-list program");
    group->add_option("--nmcli", paths.nmcli, "nmcli program");
    group->add_option("--modprobe", paths.modprobe, "modprobe program");
    group->add_option("--dnat-to-ns", paths.dnatToNs, "DNAT-to-DNS redirector program");
    group->add_option("--nft", paths.nft, "nft program");
    group->add_option("--iptables", paths.iptables, "iptables program");
    group->add_option("--ip6tables", paths.ip6tables, "ip6tables program");
    group->add_option("--iptables-restore", paths.iptablesRestore, "iptables-restore program");
    group->add_option("--ip6tables-restore", paths.ip6tablesRestore, "ip6tables-restore program");
}

void setupLogging(const CommonArguments& args)
{
    try {
        if (args.logFile.empty())
            spdlog::set_default_logger(spdlog::stderr_color_mt("log"));
        else
            spdlog::set_default_logger(spdlog::basic_logger_mt("log", args.logFile.string()));
        spdlog::set_pattern("[%Y-%m-%d %T.%e] [%^%l%$] %v");
        spdlog::set_level(args.logLevel);
        spdlog::flush_on(spdlog::level::info);
    }
    catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Log init failed: " << e.what() << std::endl;
    }
}

std::unique_ptr<qnet::ConfigStore> openStore(const CommonArguments& args, qnet::CommandRunner& runner)
{
    if (args.storeFile.empty())
        return std::make_unique<qnet::QubesDbStore>(
            runner, args.paths.qubesdbRead, args.paths.qubesdbList);

    auto store = std::make_unique<qnet::MemoryStore>();
    if (auto ec = store->loadFile(args.storeFile); ec) {
        throw std::runtime_error(std::format(
            "Can't load configuration from '{}': {}", args.storeFile.string(), ec.message()));
    }
    return store;
}
