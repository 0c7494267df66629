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
#include "qnet/store.hpp"

#include <string>
#include <string_view>


namespace qnet {

/// \brief Network configuration of a single interface.
struct ResolvedConfig
{
    std::string ip;
    std::string ip6;
    std::string netmask;
    std::string netmask6;
    std::string gateway;
    std::string gateway6;
    std::string primaryDns;
    std::string secondaryDns;

    auto operator<=>(const ResolvedConfig&) const = default;
};

/// \brief Per-interface configuration keys.
enum class ConfigField
{
    Ip,
    Ip6,
    Netmask,
    Netmask6,
    Gateway,
    Gateway6,
};

/// \brief Name of the field as used in QubesDB keys.
std::string_view fieldName(ConfigField field);

/// \brief Whether a VM-wide legacy key exists for the field.
bool hasLegacyKey(ConfigField field);

/// \brief Check that `mac` consists of six colon-separated hex octets.
bool isValidMac(std::string_view mac);

/// \brief Convert a MAC address to the lower case form used in QubesDB keys.
std::string normalizeMac(std::string_view mac);

/// \brief Look up a configuration field of the interface with hardware
/// address `mac`.
///
/// The per-interface key /net-config/<mac>/<field> takes precedence. If it is
/// empty, the VM-wide key /qubes-<field> is used instead, but only if
/// `legacyMac` is empty or equal to `mac`. A recorded legacy MAC therefore
/// restricts the VM-wide configuration to the interface it was meant for.
/// Netmasks have no VM-wide key.
std::string lookupField(
    ConfigStore& store, ConfigField field, std::string_view mac, std::string_view legacyMac);

/// \brief Resolve the complete configuration of the interface with hardware
/// address `mac`.
///
/// Missing netmasks default to a single host (255.255.255.255 and 128). DNS
/// servers are always taken from the VM-wide keys; the gateway is used if no
/// primary DNS server is configured.
///
/// \return The resolved configuration, QnetError::NoAddress if no IPv4
/// address could be found, or QnetError::InvalidArgument if the MAC address
/// is malformed.
Maybe<ResolvedConfig> resolveConfig(ConfigStore& store, std::string_view mac);

} // namespace qnet
