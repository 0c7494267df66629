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

#include "qnet/firewall.hpp"
#include "qnet/hooks.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <optional>


namespace qnet {

static const char* FIREWALL_PREFIX = "/qubes-firewall/";
static const char* NFT_TABLE = "qubes-firewall";
static const char* IPT_FORWARD_CHAIN = "QBS-FORWARD";

static const std::vector<FirewallRule> DROP_ALL = {FirewallRule{.action = "drop"}};

static const char* fullMask(IPFamily family)
{
    return family == IPFamily::V6 ? "/128" : "/32";
}

static const char* nftFamily(IPFamily family)
{
    return family == IPFamily::V6 ? "ip6" : "ip";
}

static std::size_t familyIndex(IPFamily family)
{
    return family == IPFamily::V6 ? 1 : 0;
}

Maybe<FirewallRule> parseRule(std::string_view rule)
{
    using namespace boost::algorithm;

    std::vector<std::string> elems;
    split(elems, std::string(rule), is_any_of(" "), token_compress_on);

    FirewallRule parsed;
    for (const auto& elem : elems) {
        if (elem.empty()) continue;
        auto sep = elem.find('=');
        if (sep == std::string::npos || elem.find('=', sep + 1) != std::string::npos) {
            spdlog::debug("Malformed rule element '{}'", elem);
            return Error(QnetError::SyntaxError);
        }
        auto key = elem.substr(0, sep);
        auto value = elem.substr(sep + 1);
        if (key == "action") parsed.action = value;
        else if (key == "proto") parsed.proto = value;
        else if (key == "dst4") parsed.dst4 = value;
        else if (key == "dst6") parsed.dst6 = value;
        else if (key == "dsthost") parsed.dsthost = value;
        else if (key == "dstports") parsed.dstports = value;
        else if (key == "specialtarget") parsed.specialtarget = value;
        else if (key == "icmptype") parsed.icmptype = value;
        else {
            spdlog::debug("Unsupported rule option '{}'", key);
            return Error(QnetError::SyntaxError);
        }
    }

    if (parsed.action != "accept" && parsed.action != "drop") {
        spdlog::debug("Rule '{}' lacks a valid action", rule);
        return Error(QnetError::SyntaxError);
    }
    return parsed;
}

std::set<std::string> listTargets(ConfigStore& store)
{
    std::set<std::string> targets;
    auto keys = store.list(FIREWALL_PREFIX);
    if (isError(keys)) {
        spdlog::error("Listing firewall rules failed: {}", fmtError(keys.error()));
        return targets;
    }
    auto prefixLen = std::string_view(FIREWALL_PREFIX).size();
    for (const auto& key : *keys) {
        auto name = key.substr(prefixLen, key.find('/', prefixLen) - prefixLen);
        if (!name.empty()) targets.insert(name);
    }
    return targets;
}

Maybe<std::vector<FirewallRule>> readRules(ConfigStore& store, const std::string& target)
{
    auto prefix = std::format("{}{}/", FIREWALL_PREFIX, target);
    auto keys = store.list(prefix);
    if (isError(keys)) return Error(keys.error());

    std::optional<FirewallRule> policy;
    std::vector<FirewallRule> rules;
    for (const auto& key : *keys) {
        auto name = key.substr(prefix.size());
        auto value = store.read(key);
        if (isError(value)) return Error(value.error());

        if (name == "policy") {
            auto rule = parseRule("action=" + *value);
            if (isError(rule)) {
                spdlog::debug("Invalid policy '{}' for {}", *value, target);
                return Error(rule.error());
            }
            policy = std::move(*rule);
            continue;
        }
        if (name.size() != 4 || !std::ranges::all_of(name, [] (char c) {
            return c >= '0' && c <= '9';
        })) {
            spdlog::debug("Unexpected key {}={}", key, *value);
            return Error(QnetError::SyntaxError);
        }
        // keys are listed in order, so rules are in order as well
        auto rule = parseRule(*value);
        if (isError(rule)) return Error(rule.error());
        rules.push_back(std::move(*rule));
    }

    if (!policy) {
        spdlog::debug("No policy defined for {}", target);
        return Error(QnetError::SyntaxError);
    }
    rules.push_back(std::move(*policy));
    return rules;
}

IPFamily addressFamily(std::string_view addr)
{
    return addr.find(':') != std::string_view::npos ? IPFamily::V6 : IPFamily::V4;
}

std::vector<std::string> readNameservers(const std::filesystem::path& resolvConf, IPFamily family)
{
    using namespace boost::algorithm;
    std::vector<std::string> servers;

    std::ifstream file(resolvConf);
    std::string line;
    while (std::getline(file, line)) {
        trim(line);
        if (!line.starts_with("nameserver")) continue;
        std::vector<std::string> fields;
        split(fields, line, is_space(), token_compress_on);
        if (fields.size() < 2) continue;
        auto& addr = fields[1];
        bool isV4 = std::ranges::count(addr, '.') == 3;
        bool isV6 = addr.find(':') != std::string::npos;
        if ((family == IPFamily::V4 && isV4) || (family == IPFamily::V6 && isV6))
            servers.push_back(addr + fullMask(family));
    }
    return servers;
}

Maybe<std::vector<std::string>> resolveHost(const std::string& host, IPFamily family)
{
    using boost::asio::ip::tcp;

    boost::asio::io_context ioCtx;
    tcp::resolver resolver(ioCtx);
    boost::system::error_code ec;
    auto protocol = family == IPFamily::V6 ? tcp::v6() : tcp::v4();
    auto results = resolver.resolve(protocol, host, "", ec);
    if (ec) {
        spdlog::warn("Failed to resolve {}: {}", host, ec.message());
        return Error(QnetError::NotFound);
    }

    std::set<std::string> addrs;
    for (const auto& entry : results) {
        addrs.insert(entry.endpoint().address().to_string() + fullMask(family));
    }
    return std::vector<std::string>(addrs.begin(), addrs.end());
}

std::string nftChainName(std::string_view addr)
{
    std::string name(addr);
    std::ranges::replace(name, '.', '-');
    std::ranges::replace(name, ':', '-');
    return "qbs-" + name;
}

std::string iptablesChainName(std::string_view addr)
{
    // iptables limits chain names to 28 characters
    std::string name(addr);
    std::ranges::replace(name, '.', '-');
    std::ranges::replace(name, ':', '-');
    if (name.size() > 20) name.erase(0, name.size() - 20);
    return "qbs-" + name;
}

static std::error_code checkFamily(const FirewallRule& rule, IPFamily family)
{
    if (!rule.dst4.empty() && family == IPFamily::V6) {
        spdlog::debug("IPv4 rule found for IPv6 address");
        return QnetError::SyntaxError;
    }
    if (!rule.dst6.empty() && family == IPFamily::V4) {
        spdlog::debug("IPv6 rule found for IPv4 address");
        return QnetError::SyntaxError;
    }
    return QnetError::Ok;
}

static Maybe<std::vector<std::string>> resolveDstHost(
    const FirewallRule& rule, const RenderContext& ctx)
{
    auto addrs = ctx.resolve(rule.dsthost, ctx.family);
    if (isError(addrs)) return Error(QnetError::SyntaxError);
    return addrs;
}

Maybe<std::string> renderNftRules(
    const std::string& chain, const std::vector<FirewallRule>& rules, const RenderContext& ctx)
{
    using boost::algorithm::join;
    const bool v6 = ctx.family == IPFamily::V6;
    const char* ipMatch = nftFamily(ctx.family);

    std::vector<std::string> lines;
    for (const auto& rule : rules) {
        if (auto ec = checkFamily(rule, ctx.family); ec) return Error(ec);

        std::string match;
        if (!rule.proto.empty()) {
            if (v6)
                match += std::format(" ip6 nexthdr {}", rule.proto == "icmp" ? "icmpv6" : rule.proto);
            else
                match += std::format(" ip protocol {}", rule.proto);
        }

        if (!rule.dst4.empty()) {
            match += std::format(" ip daddr {}", rule.dst4);
        } else if (!rule.dst6.empty()) {
            match += std::format(" ip6 daddr {}", rule.dst6);
        } else if (!rule.dsthost.empty()) {
            auto addrs = resolveDstHost(rule, ctx);
            if (isError(addrs)) return Error(addrs.error());
            match += std::format(" {} daddr {{ {} }}", ipMatch, join(*addrs, ", "));
        }

        std::string ports = rule.dstports;
        if (auto dash = ports.find('-'); dash != std::string::npos) {
            if (ports.substr(0, dash) == ports.substr(dash + 1)) ports.resize(dash);
        }

        if (rule.specialtarget == "dns") {
            if (!ports.empty() && ports != "53") continue;
            ports = "53";
            if (ctx.dns.empty()) continue;
            match += std::format(" {} daddr {{ {} }}", ipMatch, join(ctx.dns, ", "));
        }

        if (!rule.icmptype.empty())
            match += std::format(" {} type {}", v6 ? "icmpv6" : "icmp", rule.icmptype);

        // "tcp dport x || udp dport x" cannot be expressed in a single rule
        if (!ports.empty()) {
            if (rule.proto.empty()) {
                lines.push_back(std::format("{} tcp dport {} {}", match, ports, rule.action));
                lines.push_back(std::format("{} udp dport {} {}", match, ports, rule.action));
            } else {
                lines.push_back(std::format("{} {} dport {} {}", match, rule.proto, ports, rule.action));
            }
        } else {
            lines.push_back(std::format("{} {}", match, rule.action));
        }
    }

    return std::format(
        "flush chain {0} {1} {2}\n"
        "table {0} {1} {{\n"
        "  chain {2} {{\n"
        "   {3}\n"
        "  }}\n"
        "}}\n",
        ipMatch, NFT_TABLE, chain, join(lines, "\n   "));
}

static std::vector<std::string> intersect(
    std::vector<std::string> a, std::vector<std::string> b)
{
    std::ranges::sort(a);
    std::ranges::sort(b);
    std::vector<std::string> result;
    std::ranges::set_intersection(a, b, std::back_inserter(result));
    return result;
}

Maybe<std::string> renderIptablesRules(
    const std::string& chain, const std::vector<FirewallRule>& rules, const RenderContext& ctx)
{
    const bool v6 = ctx.family == IPFamily::V6;
    std::string script = "*filter\n";

    for (const auto& rule : rules) {
        if (auto ec = checkFamily(rule, ctx.family); ec) return Error(ec);

        using StringList = std::vector<std::string>;
        std::optional<StringList> protos;
        if (!rule.proto.empty())
            protos = StringList{(rule.proto == "icmp" && v6) ? std::string("icmpv6") : rule.proto};

        std::optional<StringList> hosts;
        if (!rule.dst4.empty()) {
            hosts = StringList{rule.dst4};
        } else if (!rule.dst6.empty()) {
            hosts = StringList{rule.dst6};
        } else if (!rule.dsthost.empty()) {
            auto addrs = resolveDstHost(rule, ctx);
            if (isError(addrs)) return Error(addrs.error());
            hosts = std::move(*addrs);
        }

        std::string ports = rule.dstports;
        std::ranges::replace(ports, '-', ':');

        if (rule.specialtarget == "dns") {
            if (!ports.empty() && ports != "53:53") continue;
            ports = "53:53";
            if (ctx.dns.empty()) continue;
            StringList dnsProtos = {"tcp", "udp"};
            protos = protos ? intersect(dnsProtos, *protos) : dnsProtos;
            hosts = hosts ? intersect(ctx.dns, *hosts) : ctx.dns;
        }

        if (!protos) protos = StringList{""};
        if (!hosts) hosts = StringList{""};
        std::ranges::sort(*protos);
        std::ranges::sort(*hosts);
        auto target = boost::algorithm::to_upper_copy(rule.action);

        for (const auto& proto : *protos) {
            for (const auto& host : *hosts) {
                script += "-A " + chain;
                if (!host.empty()) script += " -d " + host;
                if (!proto.empty()) script += " -p " + proto;
                if (!ports.empty()) script += " --dport " + ports;
                if (!rule.icmptype.empty()) script += " --icmp-type " + rule.icmptype;
                script += " -j " + target + "\n";
            }
        }
    }

    script += "COMMIT\n";
    return script;
}

/////////////////////
// NftablesBackend //
/////////////////////

std::error_code NftablesBackend::runNft(const std::string& script)
{
    auto res = runner.runWithInput({paths.nft, "-f", "/dev/stdin"}, script);
    if (isError(res)) {
        spdlog::error("Can't run {}: {}", paths.nft, fmtError(res.error()));
        return res.error();
    }
    if (res->status != 0) {
        spdlog::error("nft failed: {}", boost::algorithm::trim_copy(res->output));
        return QnetError::CommandFailed;
    }
    return QnetError::Ok;
}

std::error_code NftablesBackend::init()
{
    // Recreate the tables, dropping client chains left over from earlier runs
    std::string script;
    for (auto family : {IPFamily::V4, IPFamily::V6}) {
        script += std::format(
            "table {0} {1} {{}}\n"
            "delete table {0} {1}\n"
            "table {0} {1} {{\n"
            "  chain forward {{\n"
            "    type filter hook forward priority 0;\n"
            "    policy drop;\n"
            "    ct state established,related accept\n"
            "  }}\n"
            "}}\n",
            nftFamily(family), NFT_TABLE);
    }
    if (auto ec = runNft(script); ec) return ec;
    for (auto& set : chains) set.clear();
    return QnetError::Ok;
}

std::error_code NftablesBackend::createChain(
    const std::string& addr, const std::string& chain, IPFamily family)
{
    auto script = std::format(
        "table {0} {1} {{\n"
        "  chain {2} {{\n"
        "  }}\n"
        "  chain forward {{\n"
        "    {0} saddr {3} jump {2}\n"
        "  }}\n"
        "}}\n",
        nftFamily(family), NFT_TABLE, chain, addr);
    if (auto ec = runNft(script); ec) return ec;
    chains[familyIndex(family)].insert(chain);
    return QnetError::Ok;
}

std::error_code NftablesBackend::applyRules(
    const std::string& addr, const std::vector<FirewallRule>& rules)
{
    auto family = addressFamily(addr);
    auto chain = nftChainName(addr);
    RenderContext ctx{family, readNameservers(paths.resolvConf, family), resolve};

    auto script = renderNftRules(chain, rules, ctx);
    if (isError(script)) return script.error();

    if (!chains[familyIndex(family)].contains(chain)) {
        if (auto ec = createChain(addr, chain, family); ec) return ec;
    }
    return runNft(*script);
}

std::error_code NftablesBackend::cleanup()
{
    auto ec = runNft(std::format(
        "delete table ip {0}\n"
        "delete table ip6 {0}\n", NFT_TABLE));
    for (auto& set : chains) set.clear();
    return ec;
}

/////////////////////
// IptablesBackend //
/////////////////////

std::error_code IptablesBackend::runIptables(IPFamily family, std::vector<std::string> args)
{
    const auto& program = family == IPFamily::V6 ? paths.ip6tables : paths.iptables;
    args.insert(args.begin(), program);
    auto res = runner.run(args);
    if (isError(res)) {
        spdlog::error("Can't run {}: {}", program, fmtError(res.error()));
        return res.error();
    }
    if (*res != 0) {
        spdlog::debug("'{}' failed with exit status {}", boost::algorithm::join(args, " "), *res);
        return QnetError::CommandFailed;
    }
    return QnetError::Ok;
}

std::error_code IptablesBackend::init()
{
    for (auto family : {IPFamily::V4, IPFamily::V6}) {
        auto ec = runIptables(family, {"-F", IPT_FORWARD_CHAIN});
        if (!ec) ec = runIptables(family, {"-A", IPT_FORWARD_CHAIN, "-j", "DROP"});
        if (ec) {
            spdlog::error("'{}' chain not found, create it first", IPT_FORWARD_CHAIN);
            return ec;
        }
    }
    for (auto& set : chains) set.clear();
    return QnetError::Ok;
}

std::error_code IptablesBackend::createChain(
    const std::string& addr, const std::string& chain, IPFamily family)
{
    // The chain may survive from an earlier run, its old rules are flushed
    // before new ones are loaded.
    if (auto ec = runIptables(family, {"-N", chain}); ec && ec != QnetError::CommandFailed)
        return ec;
    if (auto ec = runIptables(family, {"-I", IPT_FORWARD_CHAIN, "-s", addr, "-j", chain}); ec)
        return ec;
    chains[familyIndex(family)].insert(chain);
    return QnetError::Ok;
}

std::error_code IptablesBackend::applyRules(
    const std::string& addr, const std::vector<FirewallRule>& rules)
{
    auto family = addressFamily(addr);
    auto chain = iptablesChainName(addr);
    RenderContext ctx{family, readNameservers(paths.resolvConf, family), resolve};

    auto script = renderIptablesRules(chain, rules, ctx);
    if (isError(script)) return script.error();

    if (!chains[familyIndex(family)].contains(chain)) {
        if (auto ec = createChain(addr, chain, family); ec) return ec;
    }
    if (auto ec = runIptables(family, {"-F", chain}); ec) return ec;

    const auto& restore = family == IPFamily::V6 ? paths.ip6tablesRestore : paths.iptablesRestore;
    auto res = runner.runWithInput({restore, "-n"}, *script);
    if (isError(res)) {
        spdlog::error("Can't run {}: {}", restore, fmtError(res.error()));
        return res.error();
    }
    if (res->status != 0) {
        spdlog::error("{} failed: {}", restore, boost::algorithm::trim_copy(res->output));
        return QnetError::CommandFailed;
    }
    return QnetError::Ok;
}

std::error_code IptablesBackend::cleanup()
{
    std::error_code result;
    for (auto family : {IPFamily::V4, IPFamily::V6}) {
        auto ec = runIptables(family, {"-F", IPT_FORWARD_CHAIN});
        if (ec && !result) result = ec;
        for (const auto& chain : chains[familyIndex(family)]) {
            ec = runIptables(family, {"-F", chain});
            if (!ec) ec = runIptables(family, {"-X", chain});
            if (ec && !result) result = ec;
        }
        chains[familyIndex(family)].clear();
    }
    return result;
}

////////////////////
// FirewallWorker //
////////////////////

std::error_code FirewallWorker::run()
{
    if (auto ec = backend.init(); ec) {
        spdlog::error("Initializing the firewall failed: {}", fmtError(ec));
        return ec;
    }
    runScripts();

    std::error_code result;
    for (const auto& target : listTargets(store)) {
        if (auto ec = handleTarget(target); ec && !result) result = ec;
    }
    return result;
}

std::error_code FirewallWorker::handleTarget(const std::string& target)
{
    boost::system::error_code addrEc;
    boost::asio::ip::make_address(target, addrEc);
    if (addrEc) {
        spdlog::error("Ignoring firewall rules for invalid address '{}'", target);
        return QnetError::InvalidArgument;
    }

    auto rules = readRules(store, target);
    if (isError(rules)) {
        spdlog::error("Failed to parse rules for {} ({}), blocking traffic",
            target, fmtError(rules.error()));
    } else {
        auto ec = backend.applyRules(target, *rules);
        if (!ec) {
            spdlog::info("Applied {} firewall rules for {}", rules->size(), target);
            return QnetError::Ok;
        }
        spdlog::error("Failed to apply rules for {} ({}), blocking traffic", target, fmtError(ec));
    }

    if (auto ec = backend.applyRules(target, DROP_ALL); ec) {
        spdlog::error("Failed to block traffic for {}", target);
        return ec;
    }
    return QnetError::Ok;
}

void FirewallWorker::runScripts()
{
    runHooks(runner, paths.firewallHookDirs, paths.firewallUserScript);
}

} // namespace qnet
