#include "OsRelease.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::HasSubstr;
using ::testing::Not;

TEST(OsReleaseTests, ParsesQuotedAndUnquotedValues) {
  const auto fields = parseOsRelease("NAME=\"Ubuntu\"\n"
                                     "ID=ubuntu\n"
                                     "# comment\n"
                                     "\n"
                                     "ID_LIKE=debian\n"
                                     "PRETTY_NAME='Ubuntu 24.04 LTS'\n");
  EXPECT_EQ(fields.at("NAME"), "Ubuntu");
  EXPECT_EQ(fields.at("ID"), "ubuntu");
  EXPECT_EQ(fields.at("ID_LIKE"), "debian");
  EXPECT_EQ(fields.at("PRETTY_NAME"), "Ubuntu 24.04 LTS");
}

TEST(OsReleaseTests, MissingFileIsEmpty) {
  EXPECT_TRUE(readOsRelease("/definitely/not/os-release").empty());
}

TEST(OsReleaseTests, FamilyFromId) {
  EXPECT_EQ(detectDistroFamily({{"ID", "debian"}}), DistroFamily::Debian);
  EXPECT_EQ(detectDistroFamily({{"ID", "fedora"}}), DistroFamily::Fedora);
  EXPECT_EQ(detectDistroFamily({{"ID", "arch"}}), DistroFamily::Arch);
}

TEST(OsReleaseTests, FamilyFromIdLike) {
  EXPECT_EQ(detectDistroFamily({{"ID", "neon"}, {"ID_LIKE", "ubuntu debian"}}),
            DistroFamily::Debian);
  EXPECT_EQ(detectDistroFamily({{"ID", "nobara"}, {"ID_LIKE", "fedora"}}),
            DistroFamily::Fedora);
  EXPECT_EQ(detectDistroFamily({{"ID", "cachyos"}, {"ID_LIKE", "arch"}}),
            DistroFamily::Arch);
}

TEST(OsReleaseTests, UnknownFamily) {
  EXPECT_EQ(detectDistroFamily({}), DistroFamily::Unknown);
  EXPECT_EQ(detectDistroFamily({{"ID", "gentoo"}}), DistroFamily::Unknown);
}

TEST(OsReleaseTests, HintMatchesFamily) {
  EXPECT_EQ(installHint("nmcli", DistroFamily::Debian),
            "   Debian/Ubuntu: sudo apt install network-manager");
  EXPECT_EQ(installHint("nmcli", DistroFamily::Fedora),
            "   Fedora:        sudo dnf install NetworkManager");
  EXPECT_EQ(installHint("nft", DistroFamily::Arch),
            "   Arch:          sudo pacman -S nftables");

  const auto hint = installHint("iw", DistroFamily::Debian);
  EXPECT_THAT(hint, Not(HasSubstr("pacman")));
}

TEST(OsReleaseTests, UnknownFamilyListsEveryPackageManager) {
  const auto hint = installHint("nft", DistroFamily::Unknown);
  EXPECT_THAT(hint, HasSubstr("apt install nftables"));
  EXPECT_THAT(hint, HasSubstr("dnf install nftables"));
  EXPECT_THAT(hint, HasSubstr("pacman -S nftables"));
}
