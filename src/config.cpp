#include <cann/common/error.hpp>
#include <cann/config.hpp>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <istream>

namespace po = boost::program_options;

namespace cann {

namespace {

[[noreturn]] void configuration_error(const std::string& message) {
  cann::common::throw_error(cann::common::error_code::configuration_error,
                            message);
}

cann::schema::locking_bytecode_t parse_locking_bytecode(
    const po::variables_map& vm,
    const std::string& key) {
  auto bytes = cann::schema::try_from_hex(vm[key].as<std::string>());
  if (!bytes || bytes->empty()) {
    configuration_error(
        fmt::format("{} must be a non-empty locking bytecode hex", key));
  }
  return *bytes;
}

po::options_description make_options() {
  auto options = po::options_description{"cann configuration"};
  options.add_options()("category", po::value<std::string>(),
                        "32-byte token category hex (display order)")(
      "min_starting_bid", po::value<uint64_t>(), "minimum starting bid (sats)")(
      "min_bid_increase_percentage", po::value<uint64_t>(),
      "minimum bid increase percentage")(
      "inactivity_expiry_time", po::value<uint32_t>()->default_value(0),
      "domain inactivity expiry (blocks)")(
      "min_wait_time", po::value<uint32_t>(),
      "auction settle wait time (blocks)")(
      "max_platform_fee_percentage", po::value<uint64_t>()->default_value(0),
      "maximum platform fee percentage")(
      "creator_incentive_address", po::value<std::string>(),
      "creator incentive locking bytecode hex")(
      "platform_fee_address", po::value<std::string>(),
      "platform fee locking bytecode hex")(
      "tld", po::value<std::string>()->default_value(".bch"),
      "top level domain suffix")("indexer_url", po::value<std::string>(),
                                 "token index endpoint")(
      "fee_per_byte", po::value<uint64_t>()->default_value(kDefaultFeePerByte),
      "fee rate (sats per byte)");
  return options;
}

}  // namespace

config_t load_config(std::istream& stream) {
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_config_file(stream, make_options()), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    configuration_error(fmt::format("invalid configuration: {}", e.what()));
  }

  for (const auto* key : {"category", "min_starting_bid",
                          "min_bid_increase_percentage", "min_wait_time"}) {
    if (!vm.contains(key)) {
      configuration_error(fmt::format("missing configuration key {}", key));
    }
  }

  auto category = cann::schema::try_make_hash32(vm["category"].as<std::string>());
  if (!category) {
    configuration_error("category must be 64 hex characters");
  }

  auto config = config_t{
      .category = *category,
      .min_starting_bid = vm["min_starting_bid"].as<uint64_t>(),
      .min_bid_increase_percentage =
          vm["min_bid_increase_percentage"].as<uint64_t>(),
      .inactivity_expiry_time = vm["inactivity_expiry_time"].as<uint32_t>(),
      .min_wait_time = vm["min_wait_time"].as<uint32_t>(),
      .max_platform_fee_percentage =
          vm["max_platform_fee_percentage"].as<uint64_t>(),
      .tld = vm["tld"].as<std::string>(),
      .fee_per_byte = vm["fee_per_byte"].as<uint64_t>()};
  if (vm.contains("creator_incentive_address")) {
    config.creator_incentive_address =
        parse_locking_bytecode(vm, "creator_incentive_address");
  }
  if (vm.contains("platform_fee_address")) {
    config.platform_fee_address =
        parse_locking_bytecode(vm, "platform_fee_address");
  }
  if (vm.contains("indexer_url")) {
    config.indexer_url = vm["indexer_url"].as<std::string>();
  }
  if (config.max_platform_fee_percentage > 100) {
    configuration_error("max_platform_fee_percentage must be at most 100");
  }

  spdlog::debug("loaded configuration for category {}",
                cann::schema::to_hex(config.category));
  return config;
}

config_t load_config(const std::filesystem::path& path) {
  auto stream = std::ifstream{path};
  if (!stream) {
    configuration_error(
        fmt::format("cannot open configuration file {}", path.string()));
  }
  return load_config(stream);
}

}  // namespace cann
