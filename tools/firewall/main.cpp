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
#include "qnet/firewall.hpp"
#include "qnet/process.hpp"

#include <boost/process/search_path.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>


enum class Backend
{
    Auto,
    Nftables,
    Iptables,
};

struct Arguments : CommonArguments
{
    Backend backend = Backend::Auto;
    bool cleanup = false;
};

static std::unique_ptr<Arguments> parseCommandLine(int argc, char* argv[])
{
    static const std::map<std::string, Backend> backends = {
        {"auto", Backend::Auto},
        {"nft", Backend::Nftables},
        {"iptables", Backend::Iptables},
    };
    auto args = std::make_unique<Arguments>();
    CLI::App app{"qubes-firewall: Apply the client firewall rules of a Qubes network VM"};
    app.add_option("-b,--backend", args->backend,
        "Firewall backend: auto, nft, or iptables (default auto, nft if installed)")
        ->transform(CLI::CheckedTransformer(backends, CLI::ignore_case));
    app.add_flag("--cleanup", args->cleanup,
        "Remove the client firewall and exit. With iptables only QBS-FORWARD is flushed.");
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

static std::unique_ptr<qnet::FirewallBackend> makeBackend(
    Backend backend, qnet::CommandRunner& runner, const qnet::Paths& paths)
{
    if (backend == Backend::Auto) {
        if (std::filesystem::path(paths.nft).is_absolute())
            backend = std::filesystem::exists(paths.nft) ? Backend::Nftables : Backend::Iptables;
        else
            backend = boost::process::search_path(paths.nft).empty() ?
                Backend::Iptables : Backend::Nftables;
    }
    if (backend == Backend::Nftables) {
        spdlog::debug("Using nftables");
        return std::make_unique<qnet::NftablesBackend>(runner, paths);
    } else {
        spdlog::debug("Using iptables");
        return std::make_unique<qnet::IptablesBackend>(runner, paths);
    }
}

int main(int argc, char* argv[])
{
    auto args = parseCommandLine(argc, argv);
    setupLogging(*args);

    try {
        qnet::ProcessRunner runner;
        auto backend = makeBackend(args->backend, runner, args->paths);

        if (args->cleanup) {
            if (auto ec = backend->cleanup(); ec) {
                spdlog::error("Firewall cleanup failed: {}", qnet::fmtError(ec));
                return EXIT_FAILURE;
            }
            return EXIT_SUCCESS;
        }

        auto store = openStore(*args, runner);
        qnet::FirewallWorker worker(*store, *backend, runner, args->paths);
        if (auto ec = worker.run(); ec) {
            spdlog::error("Firewall setup failed: {}", qnet::fmtError(ec));
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
