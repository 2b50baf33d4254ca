#include "CommandExecutor.hpp"
#include "FakeProcessRunner.hpp"
#include "FirewallRuleManager.hpp"
#include "InMemoryNftables.hpp"

#include <stdexcept>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace {

const std::vector<std::string> EXPECTED_APPLY{
    "sudo nft delete table ip throne_hotspot 2>/dev/null || true",
    "sudo nft add table ip throne_hotspot",
    "sudo nft add chain ip throne_hotspot postrouting '{ type nat hook "
    "postrouting priority srcnat; policy accept; }'",
    "sudo nft add rule ip throne_hotspot postrouting oifname "
    "'\"nekoray-tun\"' masquerade",
    "sudo nft add chain ip throne_hotspot forward '{ type filter hook "
    "forward priority filter; policy accept; }'",
    "sudo nft add rule ip throne_hotspot forward iifname '\"wlan0\"' "
    "oifname '\"nekoray-tun\"' accept",
    "sudo nft add rule ip throne_hotspot forward iifname '\"nekoray-tun\"' "
    "oifname '\"wlan0\"' ct state established,related accept",
};

constexpr const char *REMOVE =
    "sudo nft delete table ip throne_hotspot 2>/dev/null || true";

std::vector<std::string> toStrings(const std::vector<Command> &commands) {
  std::vector<std::string> lines;
  for (const auto &command : commands) {
    lines.push_back(command.toString());
  }
  return lines;
}

} // namespace

TEST(FirewallRuleManagerTests, HotspotTableModel) {
  const FirewallTable table =
      hotspotTable("throne_hotspot", "nekoray-tun", "wlan0");

  EXPECT_EQ(table.family, "ip");
  EXPECT_EQ(table.name, "throne_hotspot");
  ASSERT_EQ(table.chains.size(), 2u);

  EXPECT_EQ(table.chains[0].name, "postrouting");
  EXPECT_EQ(table.chains[0].body(),
            "{ type nat hook postrouting priority srcnat; policy accept; }");
  ASSERT_EQ(table.chains[0].rules.size(), 1u);
  EXPECT_EQ(ruleText(table.chains[0].rules[0]),
            "oifname \"nekoray-tun\" masquerade");

  EXPECT_EQ(table.chains[1].name, "forward");
  ASSERT_EQ(table.chains[1].rules.size(), 2u);
  EXPECT_EQ(ruleText(table.chains[1].rules[0]),
            "iifname \"wlan0\" oifname \"nekoray-tun\" accept");
  EXPECT_EQ(ruleText(table.chains[1].rules[1]),
            "iifname \"nekoray-tun\" oifname \"wlan0\" ct state "
            "established,related accept");
}

TEST(FirewallRuleManagerTests, ApplyRunsStepsInOrder) {
  FakeProcessRunner runner;
  CommandExecutor executor(runner, false);
  FirewallRuleManager firewall(executor, true);

  EXPECT_EQ(firewall.applyRules("throne_hotspot", "nekoray-tun", "wlan0"), 0u);
  EXPECT_EQ(runner.executed(), EXPECTED_APPLY);
}

TEST(FirewallRuleManagerTests, ApplyCommandsMatchExecution) {
  FakeProcessRunner runner;
  CommandExecutor executor(runner, false);
  FirewallRuleManager firewall(executor, true);

  EXPECT_EQ(toStrings(firewall.applyCommands(
                hotspotTable("throne_hotspot", "nekoray-tun", "wlan0"))),
            EXPECTED_APPLY);
}

TEST(FirewallRuleManagerTests, WithoutSudo) {
  FakeProcessRunner runner;
  CommandExecutor executor(runner, false);
  FirewallRuleManager firewall(executor, false);

  firewall.removeRules("t");
  EXPECT_THAT(runner.executed(),
              ElementsAre("nft delete table ip t 2>/dev/null || true"));
}

TEST(FirewallRuleManagerTests, HostileNamesStayInsideOneWord) {
  FakeProcessRunner runner;
  CommandExecutor executor(runner, false);
  FirewallRuleManager firewall(executor, true);

  firewall.applyRules("my table", "tun0", "wl'an; reboot");

  // every word survives the shell split intact
  const auto words = InMemoryNftables::splitWords(runner.executed()[5]);
  EXPECT_THAT(words,
              ElementsAre("sudo", "nft", "add", "rule", "ip", "my table",
                          "forward", "iifname", "\"wl'an; reboot\"", "oifname",
                          "\"tun0\"", "accept"));
}

TEST(FirewallRuleManagerTests, QuoteInInterfaceNameIsRejected) {
  EXPECT_EQ(nftString("wlan0"), "\"wlan0\"");
  EXPECT_THROW(nftString("wl\"an0"), std::invalid_argument);
  EXPECT_THROW(nftString("wlan0\n"), std::invalid_argument);

  FakeProcessRunner runner;
  CommandExecutor executor(runner, false);
  FirewallRuleManager firewall(executor, true);
  EXPECT_THROW(firewall.applyRules("throne_hotspot", "tun\"0", "wlan0"),
               std::invalid_argument);
  EXPECT_THAT(runner.executed(), IsEmpty());
}

TEST(FirewallRuleManagerTests, EveryStepIsAttemptedWhenStepsFail) {
  FakeProcessRunner runner;
  for (std::size_t i = 1; i < EXPECTED_APPLY.size(); ++i) {
    runner.respond(EXPECTED_APPLY[i], 1, "", "Error: Operation not permitted");
  }
  CommandExecutor executor(runner, false);
  FirewallRuleManager firewall(executor, true);

  EXPECT_EQ(firewall.applyRules("throne_hotspot", "nekoray-tun", "wlan0"), 6u);
  EXPECT_EQ(runner.executed(), EXPECTED_APPLY);
}

TEST(FirewallRuleManagerTests, DryRunPrintsButDoesNotExecute) {
  FakeProcessRunner runner;
  CommandExecutor executor(runner, true);
  FirewallRuleManager firewall(executor, true);

  EXPECT_EQ(firewall.applyRules("throne_hotspot", "nekoray-tun", "wlan0"), 0u);
  firewall.removeRules("throne_hotspot");

  EXPECT_THAT(runner.executed(), IsEmpty());
  auto expected = EXPECTED_APPLY;
  expected.push_back(REMOVE);
  EXPECT_EQ(executor.dryRunLog(), expected);
}

// ---- against the in-memory nftables model ---- //

class FirewallStateTests : public ::testing::Test {
protected:
  FirewallStateTests() { runner.attachNftables(nftables); }

  InMemoryNftables nftables;
  FakeProcessRunner runner;
};

TEST_F(FirewallStateTests, ApplyBuildsTheFullTable) {
  CommandExecutor executor(runner, false);
  FirewallRuleManager firewall(executor, true);

  firewall.applyRules("throne_hotspot", "nekoray-tun", "wlan0");

  EXPECT_EQ(nftables.listing("ip", "throne_hotspot"),
            "table ip throne_hotspot {\n"
            "\tchain postrouting {\n"
            "\t\ttype nat hook postrouting priority srcnat; policy accept;\n"
            "\t\toifname \"nekoray-tun\" masquerade\n"
            "\t}\n"
            "\tchain forward {\n"
            "\t\ttype filter hook forward priority filter; policy accept;\n"
            "\t\tiifname \"wlan0\" oifname \"nekoray-tun\" accept\n"
            "\t\tiifname \"nekoray-tun\" oifname \"wlan0\" ct state "
            "established,related accept\n"
            "\t}\n"
            "}\n");
}

TEST_F(FirewallStateTests, ApplyTwiceEqualsApplyOnce) {
  CommandExecutor executor(runner, false);
  FirewallRuleManager firewall(executor, true);

  firewall.applyRules("throne_hotspot", "nekoray-tun", "wlan0");
  const std::string once = nftables.listing("ip", "throne_hotspot");

  EXPECT_EQ(firewall.applyRules("throne_hotspot", "nekoray-tun", "wlan0"), 0u);
  EXPECT_EQ(nftables.listing("ip", "throne_hotspot"), once);
}

TEST_F(FirewallStateTests, ReapplyWithNewInterfaceReplacesRules) {
  CommandExecutor executor(runner, false);
  FirewallRuleManager firewall(executor, true);

  firewall.applyRules("throne_hotspot", "nekoray-tun", "wlan0");
  firewall.applyRules("throne_hotspot", "nekoray-tun", "wlan1");

  const std::string listing = nftables.listing("ip", "throne_hotspot");
  EXPECT_EQ(listing.find("\"wlan0\""), std::string::npos);
  EXPECT_NE(listing.find("\"wlan1\""), std::string::npos);
}

TEST_F(FirewallStateTests, RemoveWhenAbsentSucceeds) {
  CommandExecutor executor(runner, false);
  FirewallRuleManager firewall(executor, true);

  EXPECT_NO_THROW(firewall.removeRules("throne_hotspot"));
  EXPECT_FALSE(nftables.hasTable("ip", "throne_hotspot"));
}

TEST_F(FirewallStateTests, RemoveDropsTheTable) {
  CommandExecutor executor(runner, false);
  FirewallRuleManager firewall(executor, true);

  firewall.applyRules("throne_hotspot", "nekoray-tun", "wlan0");
  ASSERT_TRUE(nftables.hasTable("ip", "throne_hotspot"));

  firewall.removeRules("throne_hotspot");
  EXPECT_FALSE(nftables.hasTable("ip", "throne_hotspot"));

  firewall.removeRules("throne_hotspot");
  EXPECT_FALSE(nftables.hasTable("ip", "throne_hotspot"));
}

TEST_F(FirewallStateTests, VerifyAfterApply) {
  CommandExecutor executor(runner, false);
  FirewallRuleManager firewall(executor, true);
  const auto expected = hotspotTable("throne_hotspot", "nekoray-tun", "wlan0");

  EXPECT_FALSE(firewall.verifyRules(expected));

  firewall.applyRules("throne_hotspot", "nekoray-tun", "wlan0");
  EXPECT_TRUE(firewall.verifyRules(expected));

  nftables.dropRule("ip", "throne_hotspot", "forward", 1);
  EXPECT_FALSE(firewall.verifyRules(expected));
}
