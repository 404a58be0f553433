#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <lockbox/config/deployment.hpp>
#include <fstream>

namespace po = boost::program_options;

namespace lockbox::config {

namespace {

std::optional<network_deployment> missing_network(std::string_view network,
                                                  std::string& error) {
  if (network == kDefaultNetwork) {
    return default_deployment();
  }
  error = "unknown network '" + std::string{network} + "'";
  return std::nullopt;
}

}  // namespace

network_deployment default_deployment() {
  return network_deployment{.network = std::string{kDefaultNetwork},
                            .trigger_registry = lockbox::schema::make_zero_hash(),
                            .poll_interval = kDefaultPollInterval};
}

std::optional<network_deployment> load_deployment(std::istream& config,
                                                  std::string_view network,
                                                  std::string& error) {
  if (network.empty()) {
    error = "network name must not be empty";
    return std::nullopt;
  }

  auto section = std::string{network};
  auto registry_option = section + ".trigger-registry";
  auto interval_option = section + ".poll-interval";

  auto description = po::options_description{"Deployment"};
  description.add_options()(registry_option.c_str(), po::value<std::string>(),
                            "Hex account allowed to trigger the expiry sweep")(
      interval_option.c_str(), po::value<int64_t>(),
      "Seconds between expiry probes");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_config_file(config, description, true), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    error = e.what();
    return std::nullopt;
  }

  if (!vm.contains(registry_option) && !vm.contains(interval_option)) {
    return missing_network(network, error);
  }

  auto deployment = network == kDefaultNetwork ? default_deployment()
                                               : network_deployment{};
  deployment.network = section;

  if (vm.contains(registry_option)) {
    auto hex = vm[registry_option].as<std::string>();
    auto account = lockbox::schema::try_make_account_id(hex);
    if (!account) {
      error = "invalid trigger-registry '" + hex + "' for network " + section;
      return std::nullopt;
    }
    deployment.trigger_registry = account.value();
  } else if (network != kDefaultNetwork) {
    error = "network " + section + " has no trigger-registry";
    return std::nullopt;
  }

  if (vm.contains(interval_option)) {
    auto seconds = vm[interval_option].as<int64_t>();
    if (seconds <= 0) {
      error = "poll-interval for network " + section + " must be positive";
      return std::nullopt;
    }
    deployment.poll_interval =
        std::chrono::seconds{static_cast<std::chrono::seconds::rep>(seconds)};
  }

  spdlog::debug("Deployment {}: registry {} polling every {}s",
                deployment.network,
                lockbox::schema::to_string(deployment.trigger_registry),
                deployment.poll_interval.count());
  return deployment;
}

std::optional<network_deployment> load_deployment_file(const std::string& path,
                                                       std::string_view network,
                                                       std::string& error) {
  if (path.empty()) {
    return missing_network(network, error);
  }
  auto input = std::ifstream{path};
  if (!input.good()) {
    error = "cannot open config file '" + path + "'";
    return std::nullopt;
  }
  return load_deployment(input, network, error);
}

}  // namespace lockbox::config
