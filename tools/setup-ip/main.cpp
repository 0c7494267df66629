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
#include "qnet/configurator.hpp"
#include "qnet/linux/netlink.hpp"
#include "qnet/policy.hpp"
#include "qnet/process.hpp"
#include "qnet/profile.hpp"
#include "qnet/resolver.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <memory>


struct Arguments : CommonArguments
{
    std::string action;
    std::string interface;
    std::string mac;
    bool show = false;
};

static std::unique_ptr<Arguments> parseCommandLine(int argc, char* argv[])
{
    auto args = std::make_unique<Arguments>();
    CLI::App app{"qubes-setup-ip: Configure network interfaces of a Qubes VM"};
    app.add_option("action,--action", args->action,
        "Hotplug action, \"add\" or \"remove\". Other actions are ignored.")
        ->envname("ACTION");
    app.add_option("interface,--interface", args->interface,
        "Name of the network interface")
        ->envname("INTERFACE");
    app.add_option("-m,--mac", args->mac,
        "Hardware address of the interface. Read from sysfs if not given.");
    app.add_flag("--show", args->show,
        "Print the resolved configuration and connection profile of the interface"
        " without changing anything");
    addCommonOptions(app, *args);
    app.set_version_flag("-v,--version", QNET_VERSION);
    app.set_config("--config", "",
        "Configuration file containing command line options in ini or TOML syntax.");
    try {
        app.parse(argc, argv);
        if (args->show && args->interface.empty())
            throw CLI::RequiredError("--interface");
        return args;
    }
    catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }
}

static int showInterface(const Arguments& args, qnet::ConfigStore& store, qnet::InterfaceConfigurator& cfg)
{
    using namespace qnet;

    std::string mac = args.mac;
    if (mac.empty()) {
        auto addr = cfg.readMacAddress(args.interface);
        if (isError(addr)) {
            std::cerr << "Can't read hardware address of " << args.interface << ": "
                << fmtError(addr.error()) << std::endl;
            return EXIT_FAILURE;
        }
        mac = std::move(*addr);
    }

    auto config = resolveConfig(store, mac);
    if (isError(config)) {
        std::cerr << args.interface << " (" << mac << "): " << config.error().message() << std::endl;
        return config.error() == QnetError::NoAddress ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    std::cout << "# " << args.interface << " (" << mac << ")\n"
        << "# ip=" << config->ip << " netmask=" << config->netmask
        << " gateway=" << config->gateway << '\n'
        << "# ip6=" << config->ip6 << " netmask6=" << config->netmask6
        << " gateway6=" << config->gateway6 << '\n'
        << "# dns=" << config->primaryDns << ' ' << config->secondaryDns << '\n';

    auto policy = loadPolicy(args.paths.serviceFlagDir);
    auto profile = makeProfile(args.interface, mac, *config, policy);
    if (isError(profile)) {
        std::cerr << "Invalid configuration: " << fmtError(profile.error()) << std::endl;
        return EXIT_FAILURE;
    }
    auto current = cfg.profiles().load(args.interface);
    if (isError(current))
        std::cout << "# no profile at " << cfg.profiles().profilePath(args.interface).string() << '\n';
    else if (*current == *profile)
        std::cout << "# profile on disk is up to date\n";
    else
        std::cout << "# profile on disk differs\n";
    writeProfile(std::cout, *profile);
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    auto args = parseCommandLine(argc, argv);
    setupLogging(*args);

    try {
        qnet::ProcessRunner runner;
        auto store = openStore(*args, runner);
        qnet::NetlinkAdministrator netlink;
        qnet::InterfaceConfigurator cfg(*store, netlink, runner, args->paths);

        if (args->show) return showInterface(*args, *store, cfg);

        if (qnet::parseAction(args->action) == qnet::HotplugAction::Add) {
            if (auto ec = netlink.open(); ec) {
                spdlog::error("Can't open netlink socket: {}", ec.message());
                return EXIT_FAILURE;
            }
        }
        if (auto ec = cfg.handleEvent(args->action, args->interface, args->mac); ec) {
            spdlog::error("Configuring {} failed: {}", args->interface, qnet::fmtError(ec));
            return EXIT_FAILURE;
        }
    }
    catch (const std::exception& e) {
        spdlog::error(e.what());
        std::cerr << e.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
