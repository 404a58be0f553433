#include <gtest/gtest.h>
#include <lockbox/config/deployment.hpp>
#include <lockbox/testing/common.hpp>

#include <fstream>
#include <sstream>
#include <string>

using namespace lockbox::config;
using namespace lockbox::testing;

namespace {

constexpr auto kConfig =
    "[local]\n"
    "poll-interval = 5\n"
    "\n"
    "[testnet]\n"
    "trigger-registry = "
    "0x1112131415161718191a1b1c1d1e1f202122232425262728292a2b2c2d2e2f30\n"
    "poll-interval = 300\n"
    "\n"
    "[broken]\n"
    "trigger-registry = 0xdead\n"
    "\n"
    "[stalled]\n"
    "trigger-registry = "
    "0x1112131415161718191a1b1c1d1e1f202122232425262728292a2b2c2d2e2f30\n"
    "poll-interval = 0\n";

}  // namespace

TEST(deployment, local_defaults_are_built_in) {
  auto deployment = default_deployment();
  EXPECT_EQ(deployment.network, "local");
  EXPECT_EQ(deployment.trigger_registry, lockbox::schema::make_zero_hash());
  EXPECT_EQ(deployment.poll_interval, std::chrono::seconds{60});

  auto error = std::string{};
  auto from_empty_path = load_deployment_file("", "local", error);
  ASSERT_TRUE(from_empty_path.has_value()) << error;
  EXPECT_EQ(from_empty_path->poll_interval, std::chrono::seconds{60});
}

TEST(deployment, network_section_is_selected) {
  auto input = std::istringstream{kConfig};
  auto error = std::string{};
  auto deployment = load_deployment(input, "testnet", error);
  ASSERT_TRUE(deployment.has_value()) << error;
  EXPECT_EQ(deployment->network, "testnet");
  EXPECT_EQ(deployment->trigger_registry, make_account(0x11));
  EXPECT_EQ(deployment->poll_interval, std::chrono::seconds{300});
}

TEST(deployment, local_section_overrides_only_what_it_sets) {
  auto input = std::istringstream{kConfig};
  auto error = std::string{};
  auto deployment = load_deployment(input, "local", error);
  ASSERT_TRUE(deployment.has_value()) << error;
  EXPECT_EQ(deployment->trigger_registry, lockbox::schema::make_zero_hash());
  EXPECT_EQ(deployment->poll_interval, std::chrono::seconds{5});
}

TEST(deployment, bad_sections_and_unknown_networks_fail) {
  auto error = std::string{};
  {
    auto input = std::istringstream{kConfig};
    EXPECT_FALSE(load_deployment(input, "mainnet", error).has_value());
    EXPECT_NE(error.find("unknown network"), std::string::npos);
  }
  {
    auto input = std::istringstream{kConfig};
    EXPECT_FALSE(load_deployment(input, "broken", error).has_value());
    EXPECT_NE(error.find("trigger-registry"), std::string::npos);
  }
  {
    auto input = std::istringstream{kConfig};
    EXPECT_FALSE(load_deployment(input, "stalled", error).has_value());
    EXPECT_NE(error.find("poll-interval"), std::string::npos);
  }
  {
    auto input = std::istringstream{"[odd]\npoll-interval = soon\n"};
    EXPECT_FALSE(load_deployment(input, "odd", error).has_value());
    EXPECT_FALSE(error.empty());
  }
}

TEST(deployment, config_file_is_read_from_disk) {
  auto path = make_db_path("lockbox_deployment") + ".ini";
  {
    auto output = std::ofstream{path};
    output << kConfig;
  }
  auto error = std::string{};
  auto deployment = load_deployment_file(path, "testnet", error);
  ASSERT_TRUE(deployment.has_value()) << error;
  EXPECT_EQ(deployment->poll_interval, std::chrono::seconds{300});

  EXPECT_FALSE(load_deployment_file(path + ".missing", "testnet", error)
                   .has_value());
  remove_path(path);
}
