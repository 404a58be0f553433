#include <spdlog/spdlog.h>
#include <lockbox/automation/expiry_poller.hpp>
#include <lockbox/schema/encoding/scale/encoder.hpp>
#include <utility>

using namespace lockbox::schema;

namespace lockbox::automation {

expiry_poller::expiry_poller(lockbox::execution::engine& engine,
                             lockbox::config::network_deployment deployment,
                             lockbox::common::now_source_t now)
    : engine_{engine},
      deployment_{std::move(deployment)},
      now_{std::move(now)} {}

expiry_poller::~expiry_poller() { stop(); }

uint32_t expiry_poller::run_once() {
  auto now = now_();
  auto probe = engine_.probe(now);
  if (!probe.work_needed) {
    return 0;
  }

  auto result = engine_.sweep(probe.candidates, now);
  if (result.code != 0) {
    spdlog::warn("Expiry sweep on {} failed: {}", deployment_.network,
                 result.log);
    return 0;
  }
  auto encoder = encoding::encoder<encoding::scale_encoder_tag>{};
  auto revoked = encoder.decode<uint32_t>(
      bytes_view_t{result.data.data(), result.data.size()});
  spdlog::info("Registry {} swept {} lapsed role(s) on {}",
               to_string(deployment_.trigger_registry), revoked,
               deployment_.network);
  return revoked;
}

void expiry_poller::start() {
  auto lock = std::scoped_lock{mutex_};
  if (thread_.joinable()) {
    return;
  }
  stopping_ = false;
  thread_ = std::thread{[this] { run(); }};
  spdlog::info("Expiry poller started on {} every {}s", deployment_.network,
               deployment_.poll_interval.count());
}

void expiry_poller::stop() {
  {
    auto lock = std::scoped_lock{mutex_};
    if (!thread_.joinable()) {
      return;
    }
    stopping_ = true;
  }
  wake_.notify_all();
  thread_.join();
  spdlog::info("Expiry poller stopped");
}

void expiry_poller::run() {
  auto lock = std::unique_lock{mutex_};
  while (!stopping_) {
    if (wake_.wait_for(lock, deployment_.poll_interval,
                       [this] { return stopping_; })) {
      break;
    }
    lock.unlock();
    run_once();
    lock.lock();
  }
}

}  // namespace lockbox::automation
