// src/firewall/FirewallRuleManager.cpp

#include "FirewallRuleManager.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace {

constexpr const char *NAT_CHAIN = "postrouting";
constexpr const char *FORWARD_CHAIN = "forward";

std::string join(const std::vector<std::string> &words, bool quote) {
  std::string line;
  for (const auto &word : words) {
    if (!line.empty()) {
      line += ' ';
    }
    line += quote ? shellQuote(word) : word;
  }
  return line;
}

} // namespace

std::string FirewallChain::body() const {
  return "{ type " + type + " hook " + hook + " priority " + priority +
         "; policy accept; }";
}

std::string nftString(const std::string &value) {
  // nft has no escape for '"' inside a string literal
  if (value.find_first_of("\"\n") != std::string::npos) {
    throw std::invalid_argument("Interface name cannot be used in an nftables "
                                "rule: " +
                                value);
  }
  return "\"" + value + "\"";
}

std::vector<std::string> nftPrefix(bool use_sudo) {
  if (use_sudo) {
    return {"sudo", "nft"};
  }
  return {"nft"};
}

std::string ruleText(const std::vector<std::string> &rule) {
  return join(rule, false);
}

FirewallTable hotspotTable(const std::string &table_name,
                           const std::string &tunnel_iface,
                           const std::string &hotspot_iface) {
  const std::string tun = nftString(tunnel_iface);
  const std::string hs = nftString(hotspot_iface);

  FirewallChain postrouting{NAT_CHAIN, "nat", "postrouting", "srcnat", {}};
  postrouting.rules.push_back({"oifname", tun, "masquerade"});

  FirewallChain forward{FORWARD_CHAIN, "filter", "forward", "filter", {}};
  forward.rules.push_back({"iifname", hs, "oifname", tun, "accept"});
  // replies only, nothing unsolicited from the tunnel reaches clients
  forward.rules.push_back({"iifname", tun, "oifname", hs, "ct", "state",
                           "established,related", "accept"});

  return FirewallTable{"ip", table_name, {postrouting, forward}};
}

FirewallRuleManager::FirewallRuleManager(CommandExecutor &executor,
                                         bool use_sudo)
    : executor_(executor), use_sudo_(use_sudo) {}

std::string FirewallRuleManager::prefix() const {
  return join(nftPrefix(use_sudo_), true);
}

Command FirewallRuleManager::removeCommand(const std::string &table_name) const {
  return Command::shell(prefix() + " delete table ip " +
                        shellQuote(table_name) + " 2>/dev/null || true");
}

std::vector<Command>
FirewallRuleManager::applyCommands(const FirewallTable &table) const {
  const std::string target = table.family + " " + shellQuote(table.name);

  std::vector<Command> commands;
  commands.push_back(removeCommand(table.name));
  commands.push_back(Command::shell(prefix() + " add table " + target));

  for (const auto &chain : table.chains) {
    commands.push_back(Command::shell(prefix() + " add chain " + target + " " +
                                      shellQuote(chain.name) + " " +
                                      shellQuote(chain.body())));
    for (const auto &rule : chain.rules) {
      commands.push_back(Command::shell(prefix() + " add rule " + target +
                                        " " + shellQuote(chain.name) + " " +
                                        join(rule, true)));
    }
  }
  return commands;
}

std::size_t FirewallRuleManager::applyRules(const std::string &table_name,
                                            const std::string &tunnel_iface,
                                            const std::string &hotspot_iface) {
  return applyTable(hotspotTable(table_name, tunnel_iface, hotspot_iface));
}

std::size_t FirewallRuleManager::applyTable(const FirewallTable &table) {
  spdlog::info("Setting up nftables table '{}'.", table.name);

  std::size_t failed = 0;
  for (const auto &command : applyCommands(table)) {
    // keep going, later steps may still succeed
    if (!executor_.run(command, Tolerance::BestEffort).ok()) {
      ++failed;
    }
  }

  if (failed > 0) {
    spdlog::warn("{} nftables step(s) failed, table '{}' may be incomplete.",
                 failed, table.name);
  } else {
    spdlog::debug("nftables table '{}' applied.", table.name);
  }
  return failed;
}

void FirewallRuleManager::removeRules(const std::string &table_name) {
  spdlog::info("Removing nftables table '{}'.", table_name);
  executor_.run(removeCommand(table_name), Tolerance::BestEffort);
}

bool FirewallRuleManager::verifyRules(const FirewallTable &expected) {
  auto args = nftPrefix(use_sudo_);
  args.insert(args.end(), {"list", "table", expected.family, expected.name});
  const ProcessResult listing = executor_.capture(Command::args(args));

  if (!listing.succeeded()) {
    spdlog::warn("nftables table '{}' is missing after apply.", expected.name);
    return false;
  }

  bool complete = true;
  for (const auto &chain : expected.chains) {
    if (listing.out.find("chain " + chain.name + " {") == std::string::npos) {
      spdlog::warn("nftables chain '{}' is missing.", chain.name);
      complete = false;
    }
    for (const auto &rule : chain.rules) {
      if (listing.out.find(ruleText(rule)) == std::string::npos) {
        spdlog::warn("nftables rule '{}' is missing from chain '{}'.",
                     ruleText(rule), chain.name);
        complete = false;
      }
    }
  }
  return complete;
}
