#include <gtest/gtest.h>
#include <lockbox/automation/expiry_poller.hpp>
#include <lockbox/testing/engine_fixture.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using namespace lockbox::automation;
using namespace lockbox::schema;
using namespace lockbox::testing;

namespace {

const auto kParticipationAmount = units(0, 2'000'000'000'000'000);

}  // namespace

TEST(expiry_poller, run_once_sweeps_lapsed_roles_through_the_engine) {
  auto fixture = engine_fixture{"lockbox_poller_once"};
  auto& vault = fixture.engine();
  auto alice = make_account(0x11);
  vault.deposit(alice, kParticipationAmount, kShortLockDuration, kGenesisTime);

  auto now = std::atomic<timestamp_seconds_t>{kGenesisTime + days(1)};
  auto poller = expiry_poller{vault, lockbox::config::default_deployment(),
                              [&] { return now.load(); }};

  EXPECT_EQ(poller.run_once(), 0u);
  EXPECT_TRUE(vault.timed_role(alice)->active);

  now = kGenesisTime + days(9);
  EXPECT_EQ(poller.run_once(), 1u);
  EXPECT_FALSE(vault.timed_role(alice)->active);
  EXPECT_EQ(poller.run_once(), 0u);
}

TEST(expiry_poller, run_once_drains_at_most_one_batch) {
  auto fixture = engine_fixture{"lockbox_poller_batch"};
  auto& vault = fixture.engine();
  for (uint32_t i = 0; i < 150; ++i) {
    vault.deposit(make_indexed_account(i), kParticipationAmount,
                  kShortLockDuration, kGenesisTime);
  }
  auto poller = expiry_poller{vault, lockbox::config::default_deployment(),
                              [] { return kGenesisTime + days(10); }};
  EXPECT_EQ(poller.run_once(), 100u);
  EXPECT_EQ(poller.run_once(), 50u);
  EXPECT_EQ(poller.run_once(), 0u);
}

TEST(expiry_poller, background_thread_polls_until_stopped) {
  auto fixture = engine_fixture{"lockbox_poller_thread"};
  auto& vault = fixture.engine();
  auto alice = make_account(0x12);
  vault.deposit(alice, kParticipationAmount, kShortLockDuration, kGenesisTime);

  auto deployment = lockbox::config::default_deployment();
  deployment.poll_interval = std::chrono::seconds{1};
  auto polls = std::atomic<int>{0};
  auto poller = expiry_poller{vault, deployment, [&] {
                                ++polls;
                                return kGenesisTime + days(9);
                              }};
  poller.start();
  poller.start();

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{10};
  while (vault.timed_role(alice)->active &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
  }
  poller.stop();
  poller.stop();

  EXPECT_FALSE(vault.timed_role(alice)->active);
  EXPECT_GE(polls.load(), 1);
}
