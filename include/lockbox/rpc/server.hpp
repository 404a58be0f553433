#pragma once

#include <lockbox/v1/lockbox.grpc.pb.h>
#include <lockbox/common/clock.hpp>
#include <lockbox/execution/engine.hpp>

namespace lockbox::rpc {

/// gRPC callback listener exposing the vault.
///
/// Mutating calls stamp `now` from the injected clock. Malformed accounts,
/// amounts or candidates are answered with `invalid_request` without touching
/// the engine.
struct listener final : public lockbox::v1::Lockbox::CallbackService {
  explicit listener(
      lockbox::execution::engine& engine,
      lockbox::common::now_source_t now = lockbox::common::system_now);

  /// Lock an amount for one of the canonical periods.
  virtual grpc::ServerUnaryReactor* Deposit(
      grpc::CallbackServerContext* context,
      const lockbox::v1::DepositRequest* request,
      lockbox::v1::DepositResponse* response) override final;

  /// Withdraw an expired deposit slot.
  virtual grpc::ServerUnaryReactor* Withdraw(
      grpc::CallbackServerContext* context,
      const lockbox::v1::WithdrawRequest* request,
      lockbox::v1::WithdrawResponse* response) override final;

  /// Read-only scan for lapsed temporary roles.
  virtual grpc::ServerUnaryReactor* Probe(
      grpc::CallbackServerContext* context,
      const lockbox::v1::ProbeRequest* request,
      lockbox::v1::ProbeResponse* response) override final;

  /// Deactivate lapsed temporary roles among the candidates.
  virtual grpc::ServerUnaryReactor* Sweep(
      grpc::CallbackServerContext* context,
      const lockbox::v1::SweepRequest* request,
      lockbox::v1::SweepResponse* response) override final;

  virtual grpc::ServerUnaryReactor* TotalLocked(
      grpc::CallbackServerContext* context,
      const lockbox::v1::TotalLockedRequest* request,
      lockbox::v1::AmountResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Deposits(
      grpc::CallbackServerContext* context,
      const lockbox::v1::AccountRequest* request,
      lockbox::v1::DepositsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* DepositAt(
      grpc::CallbackServerContext* context,
      const lockbox::v1::DepositAtRequest* request,
      lockbox::v1::DepositAtResponse* response) override final;

  virtual grpc::ServerUnaryReactor* LifetimeDeposited(
      grpc::CallbackServerContext* context,
      const lockbox::v1::AccountRequest* request,
      lockbox::v1::AmountResponse* response) override final;

  /// Sum of slots still locked at the server's current time.
  virtual grpc::ServerUnaryReactor* ActiveDeposited(
      grpc::CallbackServerContext* context,
      const lockbox::v1::AccountRequest* request,
      lockbox::v1::AmountResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Roles(
      grpc::CallbackServerContext* context,
      const lockbox::v1::AccountRequest* request,
      lockbox::v1::RolesResponse* response) override final;

  /// Committed sequence and state root.
  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const lockbox::v1::InfoRequest* request,
      lockbox::v1::InfoResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Events(
      grpc::CallbackServerContext* context,
      const lockbox::v1::EventsRequest* request,
      lockbox::v1::EventsResponse* response) override final;

  lockbox::execution::engine& engine_;
  lockbox::common::now_source_t now_;
};

}  // namespace lockbox::rpc
