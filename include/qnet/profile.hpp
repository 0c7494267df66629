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

#include "qnet/error_codes.hpp"
#include "qnet/policy.hpp"
#include "qnet/process.hpp"
#include "qnet/resolver.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace qnet {

/// \brief Address configuration of one IP protocol in a NetworkManager
/// connection profile.
struct IPSettings
{
    enum class Method
    {
        Ignore,
        Manual,
    };

    Method method = Method::Ignore;
    std::string address;
    unsigned int prefix = 0;
    // Default gateway. Not written if empty.
    std::string gateway;
    // Written as a dns= line if not empty.
    std::vector<std::string> dns;
    std::optional<bool> mayFail;

    bool operator==(const IPSettings&) const = default;
};

/// \brief NetworkManager keyfile connection profile binding an uplink
/// interface to a static configuration.
struct ConnectionProfile
{
    // [802-3-ethernet]
    std::string duplex = "full";
    // [ethernet]
    std::string macAddress;
    // [connection]
    std::string id;
    std::string uuid;
    std::string type = "802-3-ethernet";
    // [ipv4] and [ipv6]
    IPSettings ipv4;
    IPSettings ipv6;

    bool operator==(const ConnectionProfile&) const = default;
};

/// \brief Convert a dotted IPv4 netmask to a prefix length. Fails with
/// QnetError::InvalidArgument if the mask is malformed or not contiguous.
Maybe<unsigned int> netmaskToPrefix(std::string_view netmask);

/// \brief Parse an IPv6 prefix length (0 to 128).
Maybe<unsigned int> parsePrefix6(std::string_view prefix);

/// \brief Deterministic connection UUID for the interface with hardware
/// address `mac`. Re-creating the profile for the same MAC therefore
/// replaces the connection known to NetworkManager instead of adding a
/// second one.
std::string connectionUuid(std::string_view mac);

/// \brief Name of the profile file for interface `iface`.
std::string profileFileName(std::string_view iface);

/// \brief Build the connection profile for interface `iface`.
Maybe<ConnectionProfile> makeProfile(
    std::string_view iface, std::string_view mac,
    const ResolvedConfig& config, const Policy& policy);

/// \brief Serialize a profile in NetworkManager keyfile format.
void writeProfile(std::ostream& out, const ConnectionProfile& profile);
std::string formatProfile(const ConnectionProfile& profile);

/// \brief Parse a profile written by writeProfile().
Maybe<ConnectionProfile> parseProfile(std::istream& in);

/// \brief Manages the connection profiles in NetworkManager's connection
/// directory.
class ProfileEmitter
{
public:
    ProfileEmitter(std::filesystem::path connectionDir, CommandRunner& runner, std::string nmcli)
        : connectionDir(std::move(connectionDir)), runner(runner), nmcli(std::move(nmcli))
    {}

    std::filesystem::path profilePath(std::string_view iface) const
    {
        return connectionDir / profileFileName(iface);
    }

    /// \brief Write the profile of `iface` (accessible by the owner only) and
    /// ask NetworkManager to load it. Failure to notify NetworkManager is
    /// logged but not reported.
    std::error_code emit(std::string_view iface, const ConnectionProfile& profile);

    /// \brief Delete the profile of `iface` if there is one.
    std::error_code remove(std::string_view iface);

    /// \brief Read back the profile of `iface`.
    Maybe<ConnectionProfile> load(std::string_view iface) const;

private:
    std::filesystem::path connectionDir;
    CommandRunner& runner;
    std::string nmcli;
};

} // namespace qnet
