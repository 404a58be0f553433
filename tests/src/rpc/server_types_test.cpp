#include <gtest/gtest.h>
#include <lockbox/rpc/server.hpp>
#include <lockbox/testing/engine_fixture.hpp>

#include <string>
#include <vector>

using namespace lockbox::schema;
using namespace lockbox::testing;

namespace {

constexpr auto kAliceHex =
    "0x1112131415161718191a1b1c1d1e1f202122232425262728292a2b2c2d2e2f30";

constexpr auto kInvalidRequest =
    static_cast<uint32_t>(transaction_error_code::invalid_request);

}  // namespace

TEST(rpc_server, deposit_and_queries_use_decimal_and_hex_on_the_wire) {
  auto fixture = engine_fixture{"lockbox_rpc_deposit"};
  auto now = kGenesisTime;
  auto listener = lockbox::rpc::listener{fixture.engine(), [&] { return now; }};

  {
    auto request = lockbox::v1::DepositRequest{};
    request.set_account(kAliceHex);
    request.set_amount("5000000000000000000");
    request.set_lock_period_seconds(kShortLockDuration);
    auto response = lockbox::v1::DepositResponse{};
    auto context = grpc::CallbackServerContext{};
    auto* reactor = listener.Deposit(&context, &request, &response);
    ASSERT_NE(reactor, nullptr);
    ASSERT_EQ(response.result().code(), 0u);
    EXPECT_EQ(response.result().codespace(), "lockbox.deposit");
    EXPECT_EQ(response.index(), 0u);
    EXPECT_EQ(response.record().amount(), "5000000000000000000");
    EXPECT_EQ(response.record().lock_until(), now + kShortLockDuration);
    EXPECT_EQ(response.record().status(), "locked");
    ASSERT_EQ(response.result().events_size(), 2);
    EXPECT_EQ(response.result().events(1).type(),
              std::string{kRoleGrantedEventType});
  }
  {
    auto request = lockbox::v1::TotalLockedRequest{};
    auto response = lockbox::v1::AmountResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.TotalLocked(&context, &request, &response);
    EXPECT_EQ(response.amount(), "5000000000000000000");
  }
  {
    auto request = lockbox::v1::AccountRequest{};
    request.set_account(kAliceHex);
    auto response = lockbox::v1::RolesResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Roles(&context, &request, &response);
    EXPECT_EQ(response.code(), 0u);
    ASSERT_EQ(response.roles_size(), 1);
    EXPECT_EQ(response.roles(0), "big_depositor");
    EXPECT_FALSE(response.has_timed_role());
  }
  {
    auto request = lockbox::v1::DepositAtRequest{};
    request.set_account(kAliceHex);
    request.set_index(3);
    auto response = lockbox::v1::DepositAtResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.DepositAt(&context, &request, &response);
    EXPECT_EQ(response.code(),
              static_cast<uint32_t>(transaction_error_code::invalid_index));
  }
  {
    auto request = lockbox::v1::InfoRequest{};
    auto response = lockbox::v1::InfoResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Info(&context, &request, &response);
    EXPECT_EQ(response.last_sequence(), 1u);
    EXPECT_EQ(response.state_root().size(), 32u);
  }
}

TEST(rpc_server, malformed_wire_input_is_an_invalid_request) {
  auto fixture = engine_fixture{"lockbox_rpc_invalid"};
  auto listener = lockbox::rpc::listener{fixture.engine(),
                                         [] { return kGenesisTime; }};

  {
    auto request = lockbox::v1::DepositRequest{};
    request.set_account("0x1234");
    request.set_amount("1");
    request.set_lock_period_seconds(kShortLockDuration);
    auto response = lockbox::v1::DepositResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Deposit(&context, &request, &response);
    EXPECT_EQ(response.result().code(), kInvalidRequest);
  }
  {
    auto request = lockbox::v1::DepositRequest{};
    request.set_account(kAliceHex);
    request.set_amount("1.5");
    request.set_lock_period_seconds(kShortLockDuration);
    auto response = lockbox::v1::DepositResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Deposit(&context, &request, &response);
    EXPECT_EQ(response.result().code(), kInvalidRequest);
  }
  {
    auto request = lockbox::v1::SweepRequest{};
    request.add_candidates(kAliceHex);
    request.add_candidates("nope");
    auto response = lockbox::v1::SweepResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Sweep(&context, &request, &response);
    EXPECT_EQ(response.result().code(), kInvalidRequest);
  }
  {
    auto request = lockbox::v1::AccountRequest{};
    request.set_account("");
    auto response = lockbox::v1::AmountResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.LifetimeDeposited(&context, &request, &response);
    EXPECT_EQ(response.code(), kInvalidRequest);
  }
  EXPECT_EQ(fixture.engine().info().last_sequence, 0u);
}

TEST(rpc_server, withdraw_probe_and_sweep_follow_the_server_clock) {
  auto fixture = engine_fixture{"lockbox_rpc_sweep"};
  auto now = kGenesisTime;
  auto listener = lockbox::rpc::listener{fixture.engine(), [&] { return now; }};

  {
    auto request = lockbox::v1::DepositRequest{};
    request.set_account(kAliceHex);
    request.set_amount("2000000000000000");
    request.set_lock_period_seconds(kShortLockDuration);
    auto response = lockbox::v1::DepositResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Deposit(&context, &request, &response);
    ASSERT_EQ(response.result().code(), 0u);
  }

  now = kGenesisTime + days(9);
  auto candidates = std::vector<std::string>{};
  {
    auto request = lockbox::v1::ProbeRequest{};
    auto response = lockbox::v1::ProbeResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Probe(&context, &request, &response);
    ASSERT_TRUE(response.work_needed());
    ASSERT_EQ(response.candidates_size(), 1);
    EXPECT_EQ(response.candidates(0), kAliceHex);
    candidates.assign(std::begin(response.candidates()),
                      std::end(response.candidates()));
  }
  {
    auto request = lockbox::v1::SweepRequest{};
    for (const auto& candidate : candidates) {
      request.add_candidates(candidate);
    }
    auto response = lockbox::v1::SweepResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Sweep(&context, &request, &response);
    EXPECT_EQ(response.result().code(), 0u);
    EXPECT_EQ(response.deactivated(), 1u);
  }
  {
    auto request = lockbox::v1::WithdrawRequest{};
    request.set_account(kAliceHex);
    request.set_index(0);
    auto response = lockbox::v1::WithdrawResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Withdraw(&context, &request, &response);
    EXPECT_EQ(response.result().code(),
              static_cast<uint32_t>(transaction_error_code::lock_not_expired));
  }

  now = kGenesisTime + kShortLockDuration;
  {
    auto request = lockbox::v1::WithdrawRequest{};
    request.set_account(kAliceHex);
    request.set_index(0);
    auto response = lockbox::v1::WithdrawResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Withdraw(&context, &request, &response);
    ASSERT_EQ(response.result().code(), 0u);
    EXPECT_EQ(response.amount(), "2000000000000000");
  }
  {
    auto request = lockbox::v1::EventsRequest{};
    request.set_from_sequence(0);
    request.set_to_sequence(10);
    auto response = lockbox::v1::EventsResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Events(&context, &request, &response);
    ASSERT_EQ(response.events_size(), 4);
    EXPECT_EQ(response.events(2).event().type(),
              std::string{kTemporaryRoleRevokedEventType});
    EXPECT_EQ(response.events(3).event().type(),
              std::string{kWithdrawEventType});
  }
  {
    auto request = lockbox::v1::AccountRequest{};
    request.set_account(kAliceHex);
    auto response = lockbox::v1::DepositsResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.Deposits(&context, &request, &response);
    ASSERT_EQ(response.deposits_size(), 1);
    EXPECT_TRUE(response.deposits(0).withdrawn());
    EXPECT_EQ(response.deposits(0).amount(), "0");
    EXPECT_EQ(response.deposits(0).status(), "unlocked");
  }
  {
    auto request = lockbox::v1::AccountRequest{};
    request.set_account(kAliceHex);
    auto response = lockbox::v1::AmountResponse{};
    auto context = grpc::CallbackServerContext{};
    listener.ActiveDeposited(&context, &request, &response);
    EXPECT_EQ(response.amount(), "0");
  }
}
