#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <peggy/common/critical.hpp>
#include <peggy/execution/engine.hpp>
#include <peggy/schema/encoding/scale/encoder.hpp>
#include <peggy/schema/message_type.hpp>
#include <peggy/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using encoder_t = peggy::schema::encoding::scale_encoder_t;
namespace po = boost::program_options;

void install_logger(const po::variables_map& vm) {
  spdlog::init_thread_pool(8192, 1);

  // stdout carries command output; logs go to stderr and optionally a file.
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (vm.contains("log-file")) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        vm["log-file"].as<std::string>(), false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "bridge_tool", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::warn);
}

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    peggy::common::critical("missing required argument", "--{} is required",
                            name);
  }
  return vm[name].as<std::string>();
}

// Message party flags default to --signer.
peggy::schema::native_address_t get_party(const po::variables_map& vm,
                                          const std::string& name) {
  return vm.contains(name) ? vm[name].as<std::string>()
                           : get_string(vm, "signer");
}

peggy::schema::eth_address_t get_eth_address(const po::variables_map& vm,
                                             const std::string& name) {
  auto address = peggy::schema::try_make_eth_address(get_string(vm, name));
  if (!address) {
    peggy::common::critical("invalid ethereum address argument",
                            "--{} is not a 20 byte hex address", name);
  }
  return *address;
}

peggy::schema::amount_t parse_amount(const std::string_view text) {
  auto amount = peggy::schema::try_make_amount(text);
  if (!amount) {
    peggy::common::critical("invalid amount argument",
                            "'{}' is not a decimal amount", text);
  }
  return *amount;
}

peggy::schema::bytes_t get_hex(const po::variables_map& vm,
                               const std::string& name) {
  auto bytes = peggy::schema::try_from_hex(get_string(vm, name));
  if (!bytes) {
    peggy::common::critical("invalid hex argument", "--{} is not valid hex",
                            name);
  }
  return *bytes;
}

// "<contract>:<amount>"
std::vector<peggy::schema::erc20_token_t> get_tokens(
    const po::variables_map& vm,
    const std::string& name) {
  auto tokens = std::vector<peggy::schema::erc20_token_t>{};
  if (!vm.contains(name)) {
    return tokens;
  }
  for (const auto& value : vm[name].as<std::vector<std::string>>()) {
    auto separator = value.find(':');
    auto contract = separator == std::string::npos
                        ? std::nullopt
                        : peggy::schema::try_make_eth_address(
                              std::string_view{value}.substr(0, separator));
    if (!contract) {
      peggy::common::critical("invalid token argument",
                              "--{} expects <contract>:<amount>, got '{}'",
                              name, value);
    }
    tokens.push_back(peggy::schema::erc20_token_t{
        .contract = *contract,
        .amount = parse_amount(std::string_view{value}.substr(separator + 1))});
  }
  return tokens;
}

// "<operator address>:<stake>"
std::vector<peggy::schema::bonded_validator_t> get_bonded_validators(
    const po::variables_map& vm) {
  auto validators = std::vector<peggy::schema::bonded_validator_t>{};
  if (!vm.contains("validator")) {
    return validators;
  }
  for (const auto& value : vm["validator"].as<std::vector<std::string>>()) {
    auto separator = value.rfind(':');
    if (separator == std::string::npos) {
      peggy::common::critical(
          "invalid validator argument",
          "--validator expects <address>:<stake>, got '{}'", value);
    }
    auto stake = parse_amount(std::string_view{value}.substr(separator + 1));
    if (stake > std::numeric_limits<uint64_t>::max()) {
      peggy::common::critical("validator stake exceeds 64 bits");
    }
    validators.push_back(peggy::schema::bonded_validator_t{
        .operator_address = value.substr(0, separator),
        .power = stake.convert_to<uint64_t>()});
  }
  return validators;
}

peggy::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto name = get_string(vm, "payload");
  auto type = peggy::schema::try_from_string<peggy::schema::message_type_t>(name);
  if (!type) {
    peggy::common::critical("unsupported payload type",
                            "unknown payload type '{}'", name);
  }

  switch (*type) {
    case peggy::schema::message_type_t::register_eth_address:
      return peggy::schema::register_eth_address_t{
          .validator = get_party(vm, "validator-address"),
          .eth_address = get_eth_address(vm, "eth-address")};
    case peggy::schema::message_type_t::request_valset:
      return peggy::schema::request_valset_t{
          .requester = get_party(vm, "requester")};
    case peggy::schema::message_type_t::send_to_eth: {
      auto denom = get_string(vm, "denom");
      return peggy::schema::send_to_eth_t{
          .sender = get_party(vm, "sender"),
          .eth_dest = get_eth_address(vm, "eth-dest"),
          .amount = {.denom = denom,
                     .amount = parse_amount(get_string(vm, "amount"))},
          .bridge_fee = {.denom = denom,
                         .amount = parse_amount(get_string(vm, "fee"))}};
    }
    case peggy::schema::message_type_t::cancel_send_to_eth:
      return peggy::schema::cancel_send_to_eth_t{
          .sender = get_party(vm, "sender"),
          .transaction_id = vm["transaction-id"].as<uint64_t>()};
    case peggy::schema::message_type_t::request_batch:
      return peggy::schema::request_batch_t{
          .requester = get_party(vm, "requester"),
          .denom = get_string(vm, "denom")};
    case peggy::schema::message_type_t::valset_confirm:
      return peggy::schema::valset_confirm_t{
          .nonce = vm["nonce"].as<uint64_t>(),
          .orchestrator = get_party(vm, "orchestrator"),
          .eth_address = get_eth_address(vm, "eth-address"),
          .signature = get_hex(vm, "signature-hex")};
    case peggy::schema::message_type_t::batch_confirm:
      return peggy::schema::batch_confirm_t{
          .nonce = vm["nonce"].as<uint64_t>(),
          .token_contract = get_eth_address(vm, "token-contract"),
          .orchestrator = get_party(vm, "orchestrator"),
          .eth_signer = get_eth_address(vm, "eth-address"),
          .signature = get_hex(vm, "signature-hex")};
    case peggy::schema::message_type_t::logic_call_confirm:
      return peggy::schema::logic_call_confirm_t{
          .invalidation_id = get_hex(vm, "invalidation-id"),
          .invalidation_nonce = vm["invalidation-nonce"].as<uint64_t>(),
          .orchestrator = get_party(vm, "orchestrator"),
          .eth_signer = get_eth_address(vm, "eth-address"),
          .signature = get_hex(vm, "signature-hex")};
    case peggy::schema::message_type_t::submit_logic_call:
      return peggy::schema::submit_logic_call_t{
          .call = {.transfers = get_tokens(vm, "transfer"),
                   .fees = get_tokens(vm, "logic-fee"),
                   .logic_contract_address =
                       get_eth_address(vm, "logic-contract"),
                   .payload = vm.contains("call-data")
                                  ? get_hex(vm, "call-data")
                                  : peggy::schema::bytes_t{},
                   .timeout = vm["timeout"].as<uint64_t>(),
                   .invalidation_id = get_hex(vm, "invalidation-id"),
                   .invalidation_nonce =
                       vm["invalidation-nonce"].as<uint64_t>()}};
    case peggy::schema::message_type_t::set_asset_mapping:
      return peggy::schema::set_asset_mapping_t{
          .denom = get_string(vm, "denom"),
          .erc20 = get_eth_address(vm, "erc20"),
          .cosmos_originated = vm["cosmos-originated"].as<bool>()};
  }
  peggy::common::critical("unsupported payload type");
}

peggy::execution::engine_options make_engine_options(
    const po::variables_map& vm) {
  auto options = peggy::execution::engine_options{};
  if (vm.contains("authority")) {
    options.authority = vm["authority"].as<std::string>();
  }
  options.max_batch_size = vm["max-batch-size"].as<std::size_t>();
  options.last_requests_limit = vm["last-limit"].as<std::size_t>();
  options.voucher_denom_prefix = vm["voucher-prefix"].as<std::string>();
  return options;
}

// Stand-in bank and staking modules: escrow always succeeds and the staking
// table comes from --validator flags.
peggy::bridge::collaborators make_collaborators(const po::variables_map& vm) {
  auto bonded = get_bonded_validators(vm);
  return peggy::bridge::collaborators{
      .staking = [bonded] { return bonded; },
      .escrow =
          [](const peggy::schema::native_address_t& account,
             const peggy::schema::coin_t& coin) {
            spdlog::info("Escrowed {} {} from {}",
                         peggy::schema::to_string(coin.amount), coin.denom,
                         account);
            return true;
          },
      .refund =
          [](const peggy::schema::native_address_t& account,
             const peggy::schema::coin_t& coin) {
            spdlog::warn("Refund of {} {} to {} is not backed by a bank module",
                         peggy::schema::to_string(coin.amount), coin.denom,
                         account);
          }};
}

int run_execute(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto storage = peggy::storage::make_storage<peggy::storage::rocksdb_storage_tag>(
      get_string(vm, "db"));
  auto engine = peggy::execution::engine{encoder, storage,
                                         make_collaborators(vm),
                                         make_engine_options(vm)};

  auto txs = std::vector<peggy::schema::bytes_t>{};
  if (vm.contains("tx")) {
    for (const auto& encoded : vm["tx"].as<std::vector<std::string>>()) {
      auto raw = peggy::schema::try_from_base64(encoded);
      if (!raw) {
        peggy::common::critical("--tx must be base64");
      }
      txs.push_back(std::move(*raw));
    }
  }

  auto block = engine.finalize_block(vm["height"].as<uint64_t>(), txs);
  for (std::size_t i = 0; i < block.tx_results.size(); ++i) {
    const auto& result = block.tx_results[i];
    std::cout << "tx " << i << " code=" << result.code;
    if (!result.codespace.empty()) {
      std::cout << " codespace=" << result.codespace;
    }
    if (!result.log.empty()) {
      std::cout << " log=\"" << result.log << '"';
    }
    if (!result.info.empty()) {
      std::cout << " info=\"" << result.info << '"';
    }
    std::cout << '\n';
  }

  auto committed = engine.commit();
  std::cout << "committed height=" << committed.committed_height
            << " state_root=" << peggy::schema::to_hex(committed.state_root)
            << '\n';
  return 0;
}

int run_query(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto storage = peggy::storage::make_storage<peggy::storage::rocksdb_storage_tag>(
      get_string(vm, "db"));
  auto engine = peggy::execution::engine{encoder, storage,
                                         make_collaborators(vm),
                                         make_engine_options(vm)};

  auto result = engine.query(get_string(vm, "path"), {});
  std::cout << "code=" << result.code << " height=" << result.height << '\n';
  if (!result.info.empty()) {
    std::cout << "info=" << result.info << '\n';
  }
  std::cout << "value=" << peggy::schema::to_base64(result.value) << '\n';
  return result.code == 0 ? 0 : 1;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  bridge_tool transaction --payload <type> --signer <addr> "
               "[options]\n"
            << "  bridge_tool execute --db <path> --height <h> --tx <base64>... "
               "[options]\n"
            << "  bridge_tool query --db <path> --path <route>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"bridge_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|execute|query")("verbose,v", "debug logging")(
      "log-file", po::value<std::string>(), "also log to this file")(
      "payload", po::value<std::string>(), "message type")(
      "signer", po::value<std::string>(), "signing account (bech32)")(
      "validator-address", po::value<std::string>(),
      "validator account, defaults to signer")(
      "requester", po::value<std::string>(), "requesting account")(
      "sender", po::value<std::string>(), "sending account")(
      "orchestrator", po::value<std::string>(), "confirming orchestrator")(
      "eth-address", po::value<std::string>(), "ethereum signer address")(
      "eth-dest", po::value<std::string>(), "ethereum destination address")(
      "denom", po::value<std::string>(), "native denom")(
      "amount", po::value<std::string>()->default_value("0"),
      "decimal transfer amount")("fee",
                                 po::value<std::string>()->default_value("0"),
                                 "decimal bridge fee")(
      "transaction-id", po::value<uint64_t>()->default_value(0),
      "outgoing transfer id")("nonce", po::value<uint64_t>()->default_value(0),
                              "valset or batch nonce")(
      "token-contract", po::value<std::string>(), "batch token contract")(
      "signature-hex", po::value<std::string>()->default_value(""),
      "confirmation signature bytes hex")(
      "invalidation-id", po::value<std::string>(), "logic call id hex")(
      "invalidation-nonce", po::value<uint64_t>()->default_value(0),
      "logic call nonce")("logic-contract", po::value<std::string>(),
                          "logic call target contract")(
      "call-data", po::value<std::string>(), "logic call payload hex")(
      "timeout", po::value<uint64_t>()->default_value(0),
      "logic call ethereum timeout")(
      "transfer", po::value<std::vector<std::string>>()->multitoken(),
      "logic call transfer <contract>:<amount>")(
      "logic-fee", po::value<std::vector<std::string>>()->multitoken(),
      "logic call fee <contract>:<amount>")(
      "erc20", po::value<std::string>(), "mapped token contract")(
      "cosmos-originated", po::value<bool>()->default_value(false),
      "asset is issued by the native chain")(
      "db", po::value<std::string>(), "RocksDB directory")(
      "height", po::value<uint64_t>()->default_value(1), "block height")(
      "tx", po::value<std::vector<std::string>>()->multitoken(),
      "base64 transactions in block order")(
      "validator", po::value<std::vector<std::string>>()->multitoken(),
      "bonded validator <address>:<stake>")(
      "authority", po::value<std::string>(), "module authority account")(
      "max-batch-size", po::value<std::size_t>()->default_value(100),
      "transfers per batch")("last-limit",
                             po::value<std::size_t>()->default_value(5),
                             "default page size of last-N queries")(
      "voucher-prefix", po::value<std::string>()->default_value("peggy"),
      "denom prefix of ethereum-originated vouchers")(
      "path", po::value<std::string>(), "query route");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  install_logger(vm);

  auto status = 0;
  if (command == "transaction" || command == "tx") {
    auto transaction = peggy::schema::transaction_t{
        .version = 1,
        .signer = get_string(vm, "signer"),
        .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << peggy::schema::to_base64(encoded) << '\n';
  } else if (command == "execute") {
    status = run_execute(vm);
  } else if (command == "query") {
    status = run_query(vm);
  } else {
    peggy::common::critical("command must be transaction|execute|query");
  }

  spdlog::shutdown();
  return status;
}
