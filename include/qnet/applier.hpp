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
#include "qnet/paths.hpp"
#include "qnet/policy.hpp"
#include "qnet/resolver.hpp"

#include <string>
#include <system_error>


namespace qnet {

/// \brief Applies a resolved configuration to the live system when no
/// network management daemon is in charge of the interface. Other IPv4
/// addresses of the interface are removed.
class DirectApplier
{
public:
    DirectApplier(NetworkAdministrator& admin, const Paths& paths)
        : admin(admin), paths(paths)
    {}

    /// \brief Configure addresses and routes of `iface` and update the
    /// resolver configuration. Stops at the first failing operation.
    std::error_code apply(
        const std::string& iface, const ResolvedConfig& config, const Policy& policy);

    /// \brief Rewrite the resolver configuration with the DNS servers from
    /// `config`. The file is emptied if DNS servers are disabled by policy
    /// and left untouched if it is protected.
    std::error_code updateResolvConf(const ResolvedConfig& config, const Policy& policy);

private:
    std::error_code removeStaleAddresses(
        const std::string& iface, const NetworkAdministrator::IPAddress& ip);

    NetworkAdministrator& admin;
    const Paths& paths;
};

} // namespace qnet
