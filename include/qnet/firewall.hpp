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
#include "qnet/paths.hpp"
#include "qnet/process.hpp"
#include "qnet/store.hpp"

#include <array>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>


namespace qnet {

enum class IPFamily
{
    V4,
    V6,
};

/// \brief One rule of a client VM firewall. Empty fields are not set.
struct FirewallRule
{
    // "accept" or "drop"
    std::string action;
    std::string proto;
    std::string dst4;
    std::string dst6;
    std::string dsthost;
    // Single port or range "<first>-<last>"
    std::string dstports;
    // Only "dns" is defined
    std::string specialtarget;
    std::string icmptype;

    bool operator==(const FirewallRule&) const = default;
};

/// \brief Parse a rule of the form "action=accept proto=tcp dstports=443-443".
/// Fails with QnetError::SyntaxError if an element is not a key=value pair,
/// the key is unknown, or the action is missing or invalid.
Maybe<FirewallRule> parseRule(std::string_view rule);

/// \brief Source addresses for which firewall rules exist in the store, i.e.,
/// the names of the subtrees of /qubes-firewall/.
std::set<std::string> listTargets(ConfigStore& store);

/// \brief Read the rules for `target` from /qubes-firewall/<target>/. Rule
/// keys are four-digit numbers and are applied in order. The mandatory
/// `policy` key becomes a final catch-all rule.
Maybe<std::vector<FirewallRule>> readRules(ConfigStore& store, const std::string& target);

/// \brief Address family of a source address.
IPFamily addressFamily(std::string_view addr);

/// \brief Read the DNS servers of `family` from a resolver configuration.
/// Addresses are returned as single host prefixes (/32 or /128).
std::vector<std::string> readNameservers(const std::filesystem::path& resolvConf, IPFamily family);

/// \brief Resolves a host name to the addresses of one family.
using HostResolver = std::function<
    Maybe<std::vector<std::string>>(const std::string& host, IPFamily family)>;

/// \brief Resolve host names with the system resolver.
Maybe<std::vector<std::string>> resolveHost(const std::string& host, IPFamily family);

/// \brief Input for rule rendering besides the rules themselves.
struct RenderContext
{
    IPFamily family = IPFamily::V4;
    // DNS servers for rules with specialtarget=dns, as host prefixes
    std::vector<std::string> dns;
    HostResolver resolve = resolveHost;
};

/// \brief Per-client chain names.
std::string nftChainName(std::string_view addr);
std::string iptablesChainName(std::string_view addr);

/// \brief Render the nft script replacing the content of `chain`.
/// Fails with QnetError::SyntaxError if a rule does not match the address
/// family or a host name cannot be resolved.
Maybe<std::string> renderNftRules(
    const std::string& chain, const std::vector<FirewallRule>& rules, const RenderContext& ctx);

/// \brief Render iptables-restore input for `chain`. Fails like
/// renderNftRules().
Maybe<std::string> renderIptablesRules(
    const std::string& chain, const std::vector<FirewallRule>& rules, const RenderContext& ctx);

/////////////////////
// FirewallBackend //
/////////////////////

/// \brief Enforces client firewall rules in the kernel.
class FirewallBackend
{
public:
    virtual ~FirewallBackend() = default;

    /// \brief Set up the forwarding chain dropping all traffic of clients
    /// without rules. Existing client chains are discarded.
    virtual std::error_code init() = 0;

    /// \brief Replace the rules for traffic from source address `addr`.
    /// Returns QnetError::SyntaxError for rules that cannot be rendered and
    /// QnetError::CommandFailed if the kernel rejected them.
    virtual std::error_code applyRules(
        const std::string& addr, const std::vector<FirewallRule>& rules) = 0;

    /// \brief Remove everything created by init() and applyRules().
    virtual std::error_code cleanup() = 0;
};

/// \brief Firewall using nftables through the nft utility.
class NftablesBackend : public FirewallBackend
{
public:
    NftablesBackend(CommandRunner& runner, const Paths& paths, HostResolver resolve = resolveHost)
        : runner(runner), paths(paths), resolve(std::move(resolve))
    {}

    std::error_code init() override;
    std::error_code applyRules(
        const std::string& addr, const std::vector<FirewallRule>& rules) override;
    std::error_code cleanup() override;

private:
    std::error_code runNft(const std::string& script);
    std::error_code createChain(const std::string& addr, const std::string& chain, IPFamily family);

    CommandRunner& runner;
    const Paths& paths;
    HostResolver resolve;
    std::array<std::set<std::string>, 2> chains;
};

/// \brief Firewall using iptables and ip6tables. Relies on the QBS-FORWARD
/// chain created by the network VM's base firewall.
class IptablesBackend : public FirewallBackend
{
public:
    IptablesBackend(CommandRunner& runner, const Paths& paths, HostResolver resolve = resolveHost)
        : runner(runner), paths(paths), resolve(std::move(resolve))
    {}

    std::error_code init() override;
    std::error_code applyRules(
        const std::string& addr, const std::vector<FirewallRule>& rules) override;
    std::error_code cleanup() override;

private:
    std::error_code runIptables(IPFamily family, std::vector<std::string> args);
    std::error_code createChain(const std::string& addr, const std::string& chain, IPFamily family);

    CommandRunner& runner;
    const Paths& paths;
    HostResolver resolve;
    std::array<std::set<std::string>, 2> chains;
};

////////////////////
// FirewallWorker //
////////////////////

/// \brief Loads the client firewall rules of a network VM from the store and
/// applies them.
class FirewallWorker
{
public:
    FirewallWorker(
        ConfigStore& store, FirewallBackend& backend, CommandRunner& runner, const Paths& paths)
        : store(store), backend(backend), runner(runner), paths(paths)
    {}

    /// \brief Initialize the backend, run the firewall scripts and apply the
    /// rules of all clients. Fails only if the backend cannot be initialized
    /// or the traffic of some client could not be blocked.
    std::error_code run();

    /// \brief Apply the rules of one client. If its rules are invalid or are
    /// rejected, all traffic from the client is dropped instead.
    std::error_code handleTarget(const std::string& target);

    /// \brief Run the firewall script directories and the user script.
    void runScripts();

private:
    ConfigStore& store;
    FirewallBackend& backend;
    CommandRunner& runner;
    const Paths& paths;
};

} // namespace qnet
