#pragma once

#include <lockbox/schema/primitives.hpp>
#include <chrono>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

// Per-network deployment settings: which registry account drives the expiry
// sweep and how often the poller probes.
namespace lockbox::config {

inline constexpr std::string_view kDefaultNetwork{"local"};
inline constexpr auto kDefaultPollInterval = std::chrono::seconds{60};

struct network_deployment final {
  std::string network;
  lockbox::schema::account_id_t trigger_registry{};
  std::chrono::seconds poll_interval{kDefaultPollInterval};
};

/// Built-in settings for the `local` network.
network_deployment default_deployment();

/// Resolve `network` from INI text with one `[network]` section per network.
///
/// Returns std::nullopt and fills `error` when the network is unknown or a
/// value does not parse. Sections for other networks are ignored.
std::optional<network_deployment> load_deployment(std::istream& config,
                                                  std::string_view network,
                                                  std::string& error);

/// Same as `load_deployment` but reads `path`; an empty path yields the
/// built-in settings when `network` is `local`.
std::optional<network_deployment> load_deployment_file(const std::string& path,
                                                       std::string_view network,
                                                       std::string& error);

}  // namespace lockbox::config
