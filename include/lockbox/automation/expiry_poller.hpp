#pragma once

#include <lockbox/common/clock.hpp>
#include <lockbox/config/deployment.hpp>
#include <lockbox/execution/engine.hpp>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace lockbox::automation {

/// Optional self-scheduling trigger for the expiry sweep.
///
/// Acts on behalf of the deployment's trigger registry: every poll interval it
/// calls `probe` and, when work is reported, `sweep` with the returned
/// candidates. It goes through the public engine calls only.
class expiry_poller final {
 public:
  expiry_poller(lockbox::execution::engine& engine,
                lockbox::config::network_deployment deployment,
                lockbox::common::now_source_t now = lockbox::common::system_now);
  ~expiry_poller();

  expiry_poller(const expiry_poller&) = delete;
  expiry_poller& operator=(const expiry_poller&) = delete;

  /// One probe/sweep round. Returns the number of roles deactivated.
  uint32_t run_once();

  void start();
  void stop();

 private:
  void run();

  lockbox::execution::engine& engine_;
  lockbox::config::network_deployment deployment_;
  lockbox::common::now_source_t now_;
  std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_{false};
  std::thread thread_;
};

}  // namespace lockbox::automation
