// src/firewall/FirewallRuleManager.hpp

// ---- FirewallRuleManager Usage ---- //

// This class owns one nftables table (ip family) that forwards hotspot
// clients into the tunnel interface and masquerades them on the way out.

// Example:
// FirewallRuleManager firewall(executor, /*use_sudo=*/true);
// firewall.applyRules("throne_hotspot", "nekoray-tun", "wlan0");
// ...
// firewall.removeRules("throne_hotspot");

// the table holds two chains:
// postrouting (nat hook)    oifname <tun> masquerade
// forward     (filter hook) iifname <hs> oifname <tun> accept
//                           iifname <tun> oifname <hs> ct state
//                           established,related accept

// applyRules() deletes any previous table first, so applying twice leaves the
// same table as applying once. Every step is best-effort: a failed step is
// logged and the remaining steps still run. There is no rollback, a partial
// table is repaired by running disable then enable again.

// Order matters: table, then chain, then the chain's rules.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "Command.hpp"
#include "CommandExecutor.hpp"

struct FirewallChain {
  std::string name;
  std::string type; // nat | filter
  std::string hook;
  std::string priority;

  // each rule is a list of nft words, string literals keep their quotes
  std::vector<std::vector<std::string>> rules;

  // "{ type nat hook postrouting priority srcnat; policy accept; }"
  std::string body() const;
};

struct FirewallTable {
  std::string family;
  std::string name;
  std::vector<FirewallChain> chains;
};

// the table the hotspot needs, as data
FirewallTable hotspotTable(const std::string &table_name,
                           const std::string &tunnel_iface,
                           const std::string &hotspot_iface);

// nft string literal, e.g. wlan0 => "wlan0"
// throws std::invalid_argument for values containing '"' or a newline,
// nft cannot express them
std::string nftString(const std::string &value);

// {"sudo", "nft"} or {"nft"}
std::vector<std::string> nftPrefix(bool use_sudo);

// space separated nft words, as printed by "nft list table"
std::string ruleText(const std::vector<std::string> &rule);

class FirewallRuleManager {
public:
  FirewallRuleManager(CommandExecutor &executor, bool use_sudo);

  // returns the number of steps that failed (0 => table fully applied)
  std::size_t applyRules(const std::string &table_name,
                         const std::string &tunnel_iface,
                         const std::string &hotspot_iface);
  std::size_t applyTable(const FirewallTable &table);

  // always succeeds, a missing table is fine
  void removeRules(const std::string &table_name);

  // lists the table and checks every chain and rule is present
  bool verifyRules(const FirewallTable &expected);

  // the commands applyRules() would run, in order
  std::vector<Command> applyCommands(const FirewallTable &table) const;
  Command removeCommand(const std::string &table_name) const;

private:
  CommandExecutor &executor_;
  bool use_sudo_;

  std::string prefix() const;
};
