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
#include "qnet/gateway.hpp"
#include "qnet/linux/netlink.hpp"
#include "qnet/process.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <memory>


struct Arguments : CommonArguments
{
    bool show = false;
};

static std::unique_ptr<Arguments> parseCommandLine(int argc, char* argv[])
{
    auto args = std::make_unique<Arguments>();
    CLI::App app{"qubes-network-proxy-setup: Enable packet forwarding in a Qubes network VM"};
    app.add_option("-u,--uplink", args->paths.uplink,
        "Interface through which client traffic is forwarded (default \"eth0\")");
    app.add_flag("--show", args->show,
        "Print whether this VM is a network VM and the DNS servers offered to clients");
    addCommonOptions(app, *args);
    app.set_version_flag("-v,--version", QNET_VERSION);
    app.set_config("--config", "",
        "Configuration file containing command line options in ini or TOML syntax.");
    try {
        app.parse(argc, argv);
        return args;
    }
    catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }
}

int main(int argc, char* argv[])
{
    auto args = parseCommandLine(argc, argv);
    setupLogging(*args);

    try {
        qnet::ProcessRunner runner;
        auto store = openStore(*args, runner);
        // Only the ethtool ioctl is used, no netlink socket is needed.
        qnet::NetlinkAdministrator admin;
        qnet::GatewayEnabler gateway(*store, admin, runner, args->paths);

        if (args->show) {
            if (!gateway.isNetworkVm()) {
                std::cout << "not a network VM\n";
            } else {
                auto dns = gateway.readDns();
                std::cout << "NS1=" << dns.primary << "\nNS2=" << dns.secondary << '\n';
            }
            return EXIT_SUCCESS;
        }

        if (auto ec = gateway.run(); ec) {
            spdlog::error("Network VM setup failed: {}", qnet::fmtError(ec));
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
