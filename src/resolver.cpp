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

#include "qnet/resolver.hpp"

#include <boost/algorithm/string.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <format>


namespace qnet {

static const char* DEFAULT_NETMASK = "255.255.255.255";
static const char* DEFAULT_NETMASK6 = "128";

std::string_view fieldName(ConfigField field)
{
    switch (field) {
    case ConfigField::Ip:
        return "ip";
    case ConfigField::Ip6:
        return "ip6";
    case ConfigField::Netmask:
        return "netmask";
    case ConfigField::Netmask6:
        return "netmask6";
    case ConfigField::Gateway:
        return "gateway";
    case ConfigField::Gateway6:
        return "gateway6";
    }
    return "";
}

bool hasLegacyKey(ConfigField field)
{
    return field != ConfigField::Netmask && field != ConfigField::Netmask6;
}

bool isValidMac(std::string_view mac)
{
    // xx:xx:xx:xx:xx:xx
    if (mac.size() != 17) return false;
    for (std::size_t i = 0; i < mac.size(); ++i) {
        if (i % 3 == 2) {
            if (mac[i] != ':') return false;
        } else if (!std::isxdigit((unsigned char)mac[i])) {
            return false;
        }
    }
    return true;
}

std::string normalizeMac(std::string_view mac)
{
    return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string(mac)));
}

std::string lookupField(
    ConfigStore& store, ConfigField field, std::string_view mac, std::string_view legacyMac)
{
    auto value = store.readOrEmpty(std::format("/net-config/{}/{}", mac, fieldName(field)));
    if (value.empty() && hasLegacyKey(field) && (legacyMac.empty() || legacyMac == mac)) {
        value = store.readOrEmpty(std::format("/qubes-{}", fieldName(field)));
    }
    return value;
}

Maybe<ResolvedConfig> resolveConfig(ConfigStore& store, std::string_view mac)
{
    auto addr = normalizeMac(mac);
    if (!isValidMac(addr)) {
        spdlog::error("Invalid MAC address '{}'", mac);
        return Error(QnetError::InvalidArgument);
    }
    auto legacyMac = normalizeMac(store.readOrEmpty("/qubes-mac"));

    ResolvedConfig config;
    config.ip = lookupField(store, ConfigField::Ip, addr, legacyMac);
    if (config.ip.empty()) {
        return Error(QnetError::NoAddress);
    }
    config.ip6 = lookupField(store, ConfigField::Ip6, addr, legacyMac);
    config.netmask = lookupField(store, ConfigField::Netmask, addr, legacyMac);
    config.netmask6 = lookupField(store, ConfigField::Netmask6, addr, legacyMac);
    config.gateway = lookupField(store, ConfigField::Gateway, addr, legacyMac);
    config.gateway6 = lookupField(store, ConfigField::Gateway6, addr, legacyMac);

    if (config.netmask.empty()) config.netmask = DEFAULT_NETMASK;
    if (config.netmask6.empty()) config.netmask6 = DEFAULT_NETMASK6;

    config.primaryDns = store.readOrEmpty("/qubes-primary-dns");
    config.secondaryDns = store.readOrEmpty("/qubes-secondary-dns");
    if (config.primaryDns.empty()) config.primaryDns = config.gateway;

    return config;
}

} // namespace qnet
