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
#include "qnet/paths.hpp"
#include "qnet/process.hpp"
#include "qnet/profile.hpp"
#include "qnet/store.hpp"

#include <string>
#include <string_view>


namespace qnet {

enum class HotplugAction
{
    Add,
    Remove,
    Other,
};

HotplugAction parseAction(std::string_view action);

/// \brief Handles interface hotplug events of a client VM.
class InterfaceConfigurator
{
public:
    InterfaceConfigurator(
        ConfigStore& store, NetworkAdministrator& admin, CommandRunner& runner, const Paths& paths)
        : store(store), admin(admin), runner(runner), paths(paths)
        , emitter(paths.nmConnectionDir, runner, paths.nmcli)
    {}

    /// \brief Dispatch a hotplug event. `mac` may be empty, in which case the
    /// hardware address is read from sysfs. Unknown actions are ignored.
    std::error_code handleEvent(std::string_view action, const std::string& iface, std::string mac = {});

    /// \brief Configure a newly added interface. Interfaces without an IPv4
    /// address in the configuration store are left alone.
    std::error_code add(const std::string& iface, std::string mac = {});

    /// \brief Forget the configuration of a removed interface.
    std::error_code remove(const std::string& iface);

    /// \brief Read the hardware address of `iface` from sysfs.
    Maybe<std::string> readMacAddress(const std::string& iface) const;

    const ProfileEmitter& profiles() const { return emitter; }

private:
    ConfigStore& store;
    NetworkAdministrator& admin;
    CommandRunner& runner;
    const Paths& paths;
    ProfileEmitter emitter;
};

} // namespace qnet
