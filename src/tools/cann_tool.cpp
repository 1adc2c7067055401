#include <boost/program_options.hpp>
#include <cann/common/error.hpp>
#include <cann/protocol/constants.hpp>
#include <cann/protocol/name.hpp>
#include <cann/protocol/price.hpp>
#include <cann/protocol/records.hpp>
#include <cann/schema/encoding/bch/encoder.hpp>
#include <cann/schema/transaction.hpp>
#include <cann/script/script.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

namespace {

using encoder_t =
    cann::schema::encoding::encoder<cann::schema::encoding::bch_encoder_tag>;
namespace po = boost::program_options;

void print_help(const po::options_description& options) {
  std::cout << "usage: cann_tool <price|validate-name|revoke-record|decode-tx> "
               "[options]\n"
            << options << '\n';
}

void setup_logging(const bool verbose) {
  auto logger = std::make_shared<spdlog::logger>(
      "cann_tool", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

std::string require_string(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    cann::common::throw_error(cann::common::error_code::invalid_argument,
                              "missing --" + name);
  }
  return vm[name].as<std::string>();
}

int run_price(const po::variables_map& vm) {
  if (!vm.contains("id")) {
    cann::common::throw_error(cann::common::error_code::invalid_argument,
                              "price requires --id");
  }
  auto id = vm["id"].as<uint64_t>();
  auto price = cann::protocol::auction_price(
      id, vm["min-starting-bid"].as<uint64_t>());
  auto incentive = id <= cann::protocol::kIncentiveScale
                       ? cann::protocol::creator_incentive(price, id)
                       : cann::schema::satoshis_t{0};
  std::cout << "auction_price " << price << '\n'
            << "minimum_bid "
            << cann::protocol::minimum_bid(price,
                                           vm["percentage"].as<uint64_t>())
            << '\n'
            << "creator_incentive " << incentive << '\n';
  return 0;
}

int run_validate_name(const po::variables_map& vm) {
  auto name = require_string(vm, "name");
  if (cann::protocol::is_valid_name(name)) {
    std::cout << "valid\n";
    return 0;
  }
  std::cout << "invalid "
            << cann::protocol::find_first_invalid_character_index(name)
            << '\n';
  return 1;
}

int run_revoke_record(const po::variables_map& vm) {
  std::cout << cann::protocol::make_revocation_record(
                   require_string(vm, "record"))
            << '\n';
  return 0;
}

int run_decode_tx(const po::variables_map& vm) {
  auto raw = cann::schema::try_from_hex(require_string(vm, "hex"));
  if (!raw) {
    cann::common::throw_error(cann::common::error_code::invalid_argument,
                              "--hex is not hex");
  }
  auto tx = encoder_t{}.try_decode<cann::schema::transaction_t>(*raw);
  if (!tx) {
    cann::common::throw_error(cann::common::error_code::decode_failure,
                              "not a transaction");
  }

  std::cout << "version " << tx->version << " inputs " << tx->inputs.size()
            << " outputs " << tx->outputs.size() << " locktime "
            << tx->locktime << '\n';
  for (auto i = size_t{0}; i < tx->outputs.size(); ++i) {
    const auto& output = tx->outputs[i];
    std::cout << "output " << i << " value " << output.satoshis << " script "
              << cann::schema::to_hex(output.locking_bytecode) << '\n';
    if (output.token) {
      std::cout << "  token " << cann::schema::to_hex(output.token->category)
                << " amount " << output.token->amount;
      if (output.token->nft) {
        std::cout << ' ' << cann::schema::to_string(output.token->nft->capability)
                  << " commitment "
                  << cann::schema::to_hex(output.token->nft->commitment);
      }
      std::cout << '\n';
    }
    if (output.satoshis == 0) {
      if (auto payload = cann::script::try_extract_op_return_payload(
              output.locking_bytecode)) {
        std::cout << "  record " << cann::schema::make_string(*payload)
                  << '\n';
      }
    }
  }
  return 0;
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"cann_tool options"};
  options.add_options()("help,h", "show help")("verbose,v", "debug logging")(
      "command", po::value<std::string>(&command),
      "price|validate-name|revoke-record|decode-tx")(
      "id", po::value<uint64_t>(), "registration id")(
      "min-starting-bid",
      po::value<uint64_t>()->default_value(cann::protocol::kMinimalAuctionPrice),
      "registry minimum starting bid")(
      "percentage", po::value<uint64_t>()->default_value(5),
      "minimum bid increase percentage")("name", po::value<std::string>(),
                                         "name to validate")(
      "record", po::value<std::string>(), "record to revoke")(
      "hex", po::value<std::string>(), "raw transaction hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    return 2;
  }

  setup_logging(vm.contains("verbose"));

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  try {
    if (command == "price") {
      return run_price(vm);
    }
    if (command == "validate-name") {
      return run_validate_name(vm);
    }
    if (command == "revoke-record") {
      return run_revoke_record(vm);
    }
    if (command == "decode-tx") {
      return run_decode_tx(vm);
    }
  } catch (const cann::common::error& e) {
    spdlog::error("{}: {}", cann::common::to_string(e.code()), e.what());
    return 1;
  }

  spdlog::error("unknown command '{}'", command);
  return 2;
}
