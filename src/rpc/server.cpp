#include <spdlog/spdlog.h>
#include <lockbox/rpc/server.hpp>
#include <lockbox/schema/encoding/scale/encoder.hpp>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

using namespace lockbox::rpc;
using namespace lockbox::schema;

namespace {

using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

constexpr auto kInvalidRequest = transaction_error_code::invalid_request;

template <typename Response>
void set_invalid_request(Response* response, const std::string& detail) {
  response->set_code(static_cast<uint32_t>(kInvalidRequest));
  response->set_log(std::string{to_string(kInvalidRequest)} + ": " + detail);
}

template <typename Response>
void set_error(Response* response, const transaction_error_code code) {
  response->set_code(static_cast<uint32_t>(code));
  response->set_log(std::string{to_string(code)});
}

void populate_event(const transaction_event_t& source,
                    lockbox::v1::Event* destination) {
  destination->set_type(source.type);
  for (const auto& attribute : source.attributes) {
    auto* out = destination->add_attributes();
    out->set_key(attribute.key);
    out->set_value(attribute.value);
    out->set_index(attribute.index);
  }
}

void populate_result(const transaction_result_t& source,
                     lockbox::v1::Result* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    populate_event(event, destination->add_events());
  }
}

void populate_record(const deposit_record_t& source,
                     lockbox::v1::DepositRecord* destination) {
  destination->set_amount(to_string(source.amount));
  destination->set_created_at(source.created_at);
  destination->set_lock_until(source.lock_until);
  destination->set_status(std::string{to_string(source.status)});
  destination->set_withdrawn(source.withdrawn);
}

bytes_view_t view_of(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

listener::listener(lockbox::execution::engine& engine,
                   lockbox::common::now_source_t now)
    : engine_{engine}, now_{std::move(now)} {}

grpc::ServerUnaryReactor* listener::Deposit(
    grpc::CallbackServerContext* context,
    const lockbox::v1::DepositRequest* request,
    lockbox::v1::DepositResponse* response) {
  auto account = try_make_account_id(request->account());
  if (!account) {
    set_invalid_request(response->mutable_result(), "malformed account");
    return finish_ok(context);
  }
  auto amount = try_make_amount(request->amount());
  if (!amount) {
    set_invalid_request(response->mutable_result(), "malformed amount");
    return finish_ok(context);
  }

  auto result = engine_.deposit(account.value(), amount.value(),
                                request->lock_period_seconds(), now_());
  populate_result(result, response->mutable_result());
  if (result.code == 0) {
    auto encoder = encoder_t{};
    auto [index, record] =
        encoder.decode<std::tuple<uint64_t, deposit_record_t>>(
            view_of(result.data));
    response->set_index(index);
    populate_record(record, response->mutable_record());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Withdraw(
    grpc::CallbackServerContext* context,
    const lockbox::v1::WithdrawRequest* request,
    lockbox::v1::WithdrawResponse* response) {
  auto account = try_make_account_id(request->account());
  if (!account) {
    set_invalid_request(response->mutable_result(), "malformed account");
    return finish_ok(context);
  }

  auto result = engine_.withdraw(account.value(), request->index(), now_());
  populate_result(result, response->mutable_result());
  if (result.code == 0) {
    auto encoder = encoder_t{};
    response->set_amount(
        to_string(encoder.decode<amount_t>(view_of(result.data))));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Probe(
    grpc::CallbackServerContext* context,
    const lockbox::v1::ProbeRequest*,
    lockbox::v1::ProbeResponse* response) {
  auto probe = engine_.probe(now_());
  response->set_work_needed(probe.work_needed);
  for (const auto& candidate : probe.candidates) {
    response->add_candidates(to_string(candidate));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Sweep(
    grpc::CallbackServerContext* context,
    const lockbox::v1::SweepRequest* request,
    lockbox::v1::SweepResponse* response) {
  auto candidates = std::vector<account_id_t>{};
  candidates.reserve(static_cast<std::size_t>(request->candidates_size()));
  for (const auto& hex : request->candidates()) {
    auto candidate = try_make_account_id(hex);
    if (!candidate) {
      set_invalid_request(response->mutable_result(),
                          "malformed candidate " + hex);
      return finish_ok(context);
    }
    candidates.push_back(candidate.value());
  }

  auto result = engine_.sweep(candidates, now_());
  populate_result(result, response->mutable_result());
  if (result.code == 0) {
    auto encoder = encoder_t{};
    response->set_deactivated(encoder.decode<uint32_t>(view_of(result.data)));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::TotalLocked(
    grpc::CallbackServerContext* context,
    const lockbox::v1::TotalLockedRequest*,
    lockbox::v1::AmountResponse* response) {
  response->set_amount(to_string(engine_.total_locked()));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Deposits(
    grpc::CallbackServerContext* context,
    const lockbox::v1::AccountRequest* request,
    lockbox::v1::DepositsResponse* response) {
  auto account = try_make_account_id(request->account());
  if (!account) {
    set_invalid_request(response, "malformed account");
    return finish_ok(context);
  }
  for (const auto& record : engine_.deposits(account.value())) {
    populate_record(record, response->add_deposits());
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::DepositAt(
    grpc::CallbackServerContext* context,
    const lockbox::v1::DepositAtRequest* request,
    lockbox::v1::DepositAtResponse* response) {
  auto account = try_make_account_id(request->account());
  if (!account) {
    set_invalid_request(response, "malformed account");
    return finish_ok(context);
  }
  auto record = engine_.deposit_at(account.value(), request->index());
  std::visit(overloaded{[&](const deposit_record_t& value) {
                          populate_record(value, response->mutable_record());
                        },
                        [&](const transaction_error_code code) {
                          set_error(response, code);
                        }},
             record);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::LifetimeDeposited(
    grpc::CallbackServerContext* context,
    const lockbox::v1::AccountRequest* request,
    lockbox::v1::AmountResponse* response) {
  auto account = try_make_account_id(request->account());
  if (!account) {
    set_invalid_request(response, "malformed account");
    return finish_ok(context);
  }
  response->set_amount(to_string(engine_.lifetime_deposited(account.value())));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ActiveDeposited(
    grpc::CallbackServerContext* context,
    const lockbox::v1::AccountRequest* request,
    lockbox::v1::AmountResponse* response) {
  auto account = try_make_account_id(request->account());
  if (!account) {
    set_invalid_request(response, "malformed account");
    return finish_ok(context);
  }
  response->set_amount(
      to_string(engine_.active_deposited(account.value(), now_())));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Roles(
    grpc::CallbackServerContext* context,
    const lockbox::v1::AccountRequest* request,
    lockbox::v1::RolesResponse* response) {
  auto account = try_make_account_id(request->account());
  if (!account) {
    set_invalid_request(response, "malformed account");
    return finish_ok(context);
  }
  for (const auto role : engine_.roles(account.value())) {
    response->add_roles(std::string{to_string(role)});
  }
  if (auto timed = engine_.timed_role(account.value())) {
    auto* out = response->mutable_timed_role();
    out->set_active(timed->active);
    out->set_last_active(timed->last_active);
    out->set_expiry(timed->expiry);
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Info(grpc::CallbackServerContext* context,
                                         const lockbox::v1::InfoRequest*,
                                         lockbox::v1::InfoResponse* response) {
  auto info = engine_.info();
  response->set_app_version(info.app_version);
  response->set_last_sequence(info.last_sequence);
  response->set_state_root(std::string{std::begin(info.state_root),
                                       std::end(info.state_root)});
  spdlog::debug("Info requested at sequence {}", info.last_sequence);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Events(
    grpc::CallbackServerContext* context,
    const lockbox::v1::EventsRequest* request,
    lockbox::v1::EventsResponse* response) {
  for (const auto& record :
       engine_.events(request->from_sequence(), request->to_sequence())) {
    auto* out = response->add_events();
    out->set_sequence(record.sequence);
    out->set_operation(record.operation);
    out->set_timestamp(record.timestamp);
    populate_event(record.event, out->mutable_event());
  }
  return finish_ok(context);
}
