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
#include "qnet/configurator.hpp"
#include "qnet/files.hpp"
#include "qnet/hooks.hpp"
#include "qnet/policy.hpp"
#include "qnet/resolver.hpp"

#include <spdlog/spdlog.h>


namespace qnet {

HotplugAction parseAction(std::string_view action)
{
    if (action == "add")
        return HotplugAction::Add;
    else if (action == "remove")
        return HotplugAction::Remove;
    else
        return HotplugAction::Other;
}

///////////////////////////
// InterfaceConfigurator //
///////////////////////////

std::error_code InterfaceConfigurator::handleEvent(
    std::string_view action, const std::string& iface, std::string mac)
{
    switch (parseAction(action)) {
    case HotplugAction::Add:
        return add(iface, std::move(mac));
    case HotplugAction::Remove:
        return remove(iface);
    default:
        spdlog::debug("Ignoring action '{}' for {}", action, iface);
        return QnetError::Ok;
    }
}

std::error_code InterfaceConfigurator::add(const std::string& iface, std::string mac)
{
    if (iface.empty()) return QnetError::InvalidArgument;
    if (mac.empty()) {
        auto addr = readMacAddress(iface);
        if (isError(addr)) {
            spdlog::error("Can't read hardware address of {}: {}", iface, fmtError(addr.error()));
            return addr.error();
        }
        mac = std::move(*addr);
    }

    auto config = resolveConfig(store, mac);
    if (isError(config)) {
        if (config.error() == QnetError::NoAddress) {
            spdlog::info("No IP address configured for {} ({}), skipping", iface, mac);
            return QnetError::Ok;
        }
        return config.error();
    }

    auto policy = loadPolicy(paths.serviceFlagDir);
    if (policy.networkManager) {
        auto profile = makeProfile(iface, mac, *config, policy);
        if (isError(profile)) return profile.error();
        if (auto ec = emitter.emit(iface, *profile); ec) return ec;
    } else {
        DirectApplier applier(admin, paths);
        if (auto ec = applier.apply(iface, *config, policy); ec) return ec;
    }

    runHooks(runner, paths.hookDirs, paths.userHook);
    return QnetError::Ok;
}

std::error_code InterfaceConfigurator::remove(const std::string& iface)
{
    if (iface.empty()) return QnetError::InvalidArgument;
    return emitter.remove(iface);
}

Maybe<std::string> InterfaceConfigurator::readMacAddress(const std::string& iface) const
{
    auto line = readFirstLine(paths.sysClassNet / iface / "address");
    if (isError(line)) {
        if (line.error() == QnetError::NotFound) return Error(QnetError::InterfaceNotFound);
        return Error(line.error());
    }
    return normalizeMac(*line);
}

} // namespace qnet
