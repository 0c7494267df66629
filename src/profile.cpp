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

#include "qnet/files.hpp"
#include "qnet/profile.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <spdlog/spdlog.h>

#include <bit>
#include <charconv>
#include <format>
#include <fstream>
#include <ostream>
#include <sstream>


namespace qnet {

// Fixed part of the connection UUID, the MAC address provides the last 48 bits.
static const char* UUID_PREFIX = "de85f79b-8c3d-405f-a652-";

static const char* PROFILE_PREFIX = "qubes-uplink-";

Maybe<unsigned int> netmaskToPrefix(std::string_view netmask)
{
    boost::system::error_code ec;
    auto mask = boost::asio::ip::make_address_v4(std::string(netmask), ec);
    if (ec) return Error(QnetError::InvalidArgument);

    std::uint32_t bits = mask.to_uint();
    std::uint32_t host = ~bits;
    if ((host & (host + 1)) != 0) return Error(QnetError::InvalidArgument);
    return (unsigned int)std::popcount(bits);
}

Maybe<unsigned int> parsePrefix6(std::string_view prefix)
{
    unsigned int value = 0;
    auto end = prefix.data() + prefix.size();
    auto [ptr, ec] = std::from_chars(prefix.data(), end, value);
    if (ec != std::errc() || ptr != end || prefix.empty() || value > 128)
        return Error(QnetError::InvalidArgument);
    return value;
}

std::string connectionUuid(std::string_view mac)
{
    std::string suffix = normalizeMac(mac);
    std::erase(suffix, ':');
    return UUID_PREFIX + suffix;
}

std::string profileFileName(std::string_view iface)
{
    return PROFILE_PREFIX + std::string(iface);
}

Maybe<ConnectionProfile> makeProfile(
    std::string_view iface, std::string_view mac,
    const ResolvedConfig& config, const Policy& policy)
{
    ConnectionProfile profile;
    profile.macAddress = normalizeMac(mac);
    profile.id = std::format("VM uplink {}", iface);
    profile.uuid = connectionUuid(mac);

    if (!config.ip.empty()) {
        auto prefix = netmaskToPrefix(config.netmask);
        if (isError(prefix)) {
            spdlog::error("Invalid netmask '{}' for {}", config.netmask, iface);
            return Error(prefix.error());
        }
        auto& ipv4 = profile.ipv4;
        ipv4.method = IPSettings::Method::Manual;
        ipv4.address = config.ip;
        ipv4.prefix = *prefix;
        if (!policy.disableDefaultRoute) ipv4.gateway = config.gateway;
        ipv4.mayFail = false;
        if (!policy.disableDnsServer) {
            if (!config.primaryDns.empty()) ipv4.dns.push_back(config.primaryDns);
            if (!config.secondaryDns.empty()) ipv4.dns.push_back(config.secondaryDns);
        }
    }

    if (!config.ip6.empty()) {
        auto prefix = parsePrefix6(config.netmask6);
        if (isError(prefix)) {
            spdlog::error("Invalid IPv6 prefix length '{}' for {}", config.netmask6, iface);
            return Error(prefix.error());
        }
        auto& ipv6 = profile.ipv6;
        ipv6.method = IPSettings::Method::Manual;
        ipv6.address = config.ip6;
        ipv6.prefix = *prefix;
        if (!policy.disableDefaultRoute) ipv6.gateway = config.gateway6;
    }

    return profile;
}

static void writeIPSection(std::ostream& out, const char* name, const IPSettings& ip)
{
    out << '[' << name << "]\n";
    if (ip.method == IPSettings::Method::Ignore) {
        out << "method=ignore\n";
        return;
    }
    out << "method=manual\n";
    if (ip.mayFail.has_value())
        out << "may-fail=" << (*ip.mayFail ? "true" : "false") << '\n';
    if (!ip.dns.empty())
        out << "dns=" << boost::algorithm::join(ip.dns, ";") << ";\n";
    out << "addresses1=" << ip.address << ';' << ip.prefix;
    if (!ip.gateway.empty()) out << ';' << ip.gateway;
    out << '\n';
}

void writeProfile(std::ostream& out, const ConnectionProfile& profile)
{
    out << "[802-3-ethernet]\n"
        << "duplex=" << profile.duplex << "\n\n";

    out << "[ethernet]\n"
        << "mac-address=" << profile.macAddress << "\n\n";

    out << "[connection]\n"
        << "id=" << profile.id << '\n'
        << "uuid=" << profile.uuid << '\n'
        << "type=" << profile.type << "\n\n";

    writeIPSection(out, "ipv6", profile.ipv6);
    out << '\n';
    writeIPSection(out, "ipv4", profile.ipv4);
}

std::string formatProfile(const ConnectionProfile& profile)
{
    std::ostringstream stream;
    writeProfile(stream, profile);
    return stream.str();
}

static std::error_code parseIPSection(
    const boost::property_tree::ptree& section, IPSettings& ip)
{
    using namespace boost::algorithm;

    auto method = section.get<std::string>("method", "ignore");
    if (method == "ignore") {
        ip.method = IPSettings::Method::Ignore;
        return QnetError::Ok;
    } else if (method != "manual") {
        return QnetError::SyntaxError;
    }
    ip.method = IPSettings::Method::Manual;

    if (auto mayFail = section.get_optional<std::string>("may-fail"); mayFail) {
        ip.mayFail = (*mayFail == "true");
    }

    if (auto dns = section.get_optional<std::string>("dns"); dns) {
        split(ip.dns, *dns, is_any_of(";"));
        std::erase_if(ip.dns, [] (const std::string& s) { return s.empty(); });
    }

    std::vector<std::string> parts;
    split(parts, section.get<std::string>("addresses1", ""), is_any_of(";"));
    if (parts.size() < 2 || parts.size() > 3) return QnetError::SyntaxError;
    ip.address = parts[0];
    auto end = parts[1].data() + parts[1].size();
    if (auto res = std::from_chars(parts[1].data(), end, ip.prefix); res.ptr != end)
        return QnetError::SyntaxError;
    if (parts.size() == 3) ip.gateway = parts[2];
    return QnetError::Ok;
}

Maybe<ConnectionProfile> parseProfile(std::istream& in)
{
    namespace pt = boost::property_tree;

    pt::ptree tree;
    try {
        pt::ini_parser::read_ini(in, tree);
    }
    catch (const pt::ini_parser_error& e) {
        spdlog::debug("Parsing connection profile failed: {}", e.what());
        return Error(QnetError::SyntaxError);
    }

    ConnectionProfile profile;
    try {
        profile.duplex = tree.get<std::string>("802-3-ethernet.duplex", "");
        profile.macAddress = tree.get<std::string>("ethernet.mac-address");
        profile.id = tree.get<std::string>("connection.id");
        profile.uuid = tree.get<std::string>("connection.uuid");
        profile.type = tree.get<std::string>("connection.type");
    }
    catch (const pt::ptree_error& e) {
        spdlog::debug("Incomplete connection profile: {}", e.what());
        return Error(QnetError::SyntaxError);
    }

    pt::ptree empty;
    if (auto ec = parseIPSection(tree.get_child("ipv4", empty), profile.ipv4); ec)
        return Error(ec);
    if (auto ec = parseIPSection(tree.get_child("ipv6", empty), profile.ipv6); ec)
        return Error(ec);
    return profile;
}

////////////////////
// ProfileEmitter //
////////////////////

std::error_code ProfileEmitter::emit(std::string_view iface, const ConnectionProfile& profile)
{
    using std::filesystem::perms;

    auto path = profilePath(iface);
    if (auto ec = writeFileAtomic(path, formatProfile(profile), perms::owner_read | perms::owner_write);
        ec) {
        spdlog::error("Writing connection profile '{}' failed: {}", path.string(), ec.message());
        return ec;
    }
    spdlog::info("Wrote connection profile {}", path.string());

    auto res = runner.run({nmcli, "connection", "load", path.string()});
    if (isError(res)) {
        spdlog::warn("Can't run {}: {}", nmcli, fmtError(res.error()));
    } else if (*res != 0) {
        spdlog::warn("NetworkManager did not load {} (exit status {})", path.string(), *res);
    }
    return QnetError::Ok;
}

std::error_code ProfileEmitter::remove(std::string_view iface)
{
    auto path = profilePath(iface);
    if (auto ec = removeFile(path); ec) {
        spdlog::error("Removing connection profile '{}' failed: {}", path.string(), ec.message());
        return ec;
    }
    spdlog::debug("Removed connection profile {}", path.string());
    return QnetError::Ok;
}

Maybe<ConnectionProfile> ProfileEmitter::load(std::string_view iface) const
{
    std::ifstream file(profilePath(iface));
    if (!file.is_open()) return Error(QnetError::NotFound);
    return parseProfile(file);
}

} // namespace qnet
