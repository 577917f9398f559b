#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <credo/common/critical.hpp>
#include <credo/execution/engine.hpp>
#include <credo/schema/authorization_mode.hpp>
#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/schema/recovery_authority.hpp>
#include <credo/storage/rocksdb/storage.hpp>
#include <array>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace {

namespace po = boost::program_options;
using encoder_t = credo::schema::encoding::encoder<
    credo::schema::encoding::scale_encoder_tag>;

credo::schema::hash32_t get_hash32(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    credo::common::critical("missing required --" + name);
  }
  return credo::schema::make_hash32(vm[name].as<std::string>());
}

credo::schema::hash32_t get_hash32_or_zero(const po::variables_map& vm,
                                           const std::string& name) {
  if (!vm.contains(name)) {
    return credo::schema::make_zero_hash();
  }
  return credo::schema::make_hash32(vm[name].as<std::string>());
}

credo::schema::amount_t parse_amount(const std::string& value) {
  try {
    return credo::schema::amount_t{value};
  } catch (const std::exception& ex) {
    spdlog::error("'{}' is not a decimal amount: {}", value, ex.what());
    credo::common::critical("invalid amount");
  }
}

std::optional<credo::schema::signer_id_t> parse_signer(
    const po::variables_map& vm) {
  auto kind = vm["signer-kind"].as<std::string>();
  if (kind == "none") {
    return std::nullopt;
  }
  if (!vm.contains("signer-hex")) {
    credo::common::critical("--signer-kind requires --signer-hex");
  }
  auto signer = credo::schema::try_make_signer_id(
      kind, vm["signer-hex"].as<std::string>());
  if (!signer) {
    credo::common::critical(
        "--signer-hex must be a 32 byte ed25519 key, a 33 byte secp256k1 key "
        "or a 32 byte named reference matching --signer-kind");
  }
  return signer;
}

template <typename Enum, std::size_t N>
Enum parse_enum(const po::variables_map& vm,
                const std::string& name,
                const std::array<std::pair<std::string_view, Enum>, N>& map) {
  auto parsed =
      credo::schema::from_string(vm[name].as<std::string>(), map);
  if (!parsed) {
    credo::common::critical("--" + name + " must be " +
                            credo::schema::joined_names(map));
  }
  return *parsed;
}

credo::execution::engine_config_t make_config(const po::variables_map& vm) {
  auto config = credo::execution::engine_config_t{};
  config.domain_id = get_hash32(vm, "domain-id");
  config.owner = get_hash32_or_zero(vm, "owner");
  config.treasury = get_hash32_or_zero(vm, "treasury");
  config.trusted_signer = parse_signer(vm);
  config.base_uri = vm["base-uri"].as<std::string>();
  config.authorization_mode = parse_enum(
      vm, "authorization-mode", credo::schema::kAuthorizationModeMappings);
  config.recovery_authority = parse_enum(
      vm, "recovery-authority", credo::schema::kRecoveryAuthorityMappings);
  return config;
}

std::string hex_of(const credo::schema::hash32_t& value) {
  return credo::schema::to_hex(
      credo::schema::bytes_view_t{value.data(), value.size()});
}

void print_info(const credo::execution::engine& engine) {
  auto settings = engine.settings();
  std::cout << "owner: " << hex_of(settings.owner) << '\n'
            << "treasury: " << hex_of(settings.treasury) << '\n'
            << "domain_id: " << hex_of(settings.domain_id) << '\n'
            << "paused: " << (settings.paused ? "true" : "false") << '\n'
            << "authorization_mode: "
            << credo::schema::to_string(settings.authorization_mode) << '\n'
            << "recovery_authority: "
            << credo::schema::to_string(settings.recovery_authority) << '\n'
            << "signer_configured: "
            << (settings.trusted_signer ? "true" : "false") << '\n'
            << "base_uri: " << settings.base_uri << '\n'
            << "credential_types: " << engine.next_credential_type_id() << '\n'
            << "events: " << engine.event_count() << '\n';
}

void print_events(const credo::execution::engine& engine,
                  const uint64_t from,
                  const uint64_t to) {
  for (const auto& event : engine.events(from, to)) {
    std::cout << event.sequence << ' ' << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
}

int execute(credo::execution::engine& engine, const po::variables_map& vm) {
  if (!vm.contains("operation-base64")) {
    credo::common::critical("execute requires --operation-base64");
  }
  auto raw = credo::schema::try_from_base64(
      vm["operation-base64"].as<std::string>());
  if (!raw) {
    credo::common::critical("--operation-base64 is not valid base64");
  }
  auto context = credo::schema::call_context_t{
      .caller = get_hash32(vm, "caller"),
      .now = vm["now"].as<uint64_t>(),
      .value = parse_amount(vm["value"].as<std::string>())};
  auto result = engine.execute_encoded(
      context, credo::schema::bytes_view_t{raw->data(), raw->size()});
  std::cout << "code: " << result.code << '\n'
            << "log: " << result.log << '\n';
  if (!result.info.empty()) {
    std::cout << "info: " << result.info << '\n';
  }
  for (const auto& event : result.events) {
    std::cout << "event: " << event.sequence << ' ' << event.type << '\n';
  }
  return credo::schema::succeeded(result) ? 0 : 1;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  credo info [options]\n"
            << "  credo balance --holder HEX --credential-type-id N\n"
            << "  credo uri --credential-type-id N\n"
            << "  credo nonce --holder HEX\n"
            << "  credo events [--from N] [--to N]\n"
            << "  credo execute --caller HEX --now T [--value V] "
               "--operation-base64 B64\n"
            << "Every command needs --domain-id. The first run of a store also "
               "needs --owner and --treasury.\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};

  auto options = po::options_description{"credo options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "info|balance|uri|nonce|events|execute")(
      "db-path,d", po::value<std::string>(&db_path)->default_value("credo.db"),
      "RocksDB directory")(
      "log-file", po::value<std::string>(&log_file)->default_value("credo.log"),
      "log file path")("verbose,v", "enable debug logging")(
      "domain-id", po::value<std::string>(),
      "deployment domain hash32 hex (required, non-zero)")(
      "owner", po::value<std::string>(), "initial owner account hex")(
      "treasury", po::value<std::string>(), "initial treasury account hex")(
      "signer-kind", po::value<std::string>()->default_value("none"),
      "none|ed25519|secp256k1|named")("signer-hex", po::value<std::string>(),
                                "trusted signer public key hex")(
      "base-uri", po::value<std::string>()->default_value(""),
      "initial metadata base uri")(
      "authorization-mode",
      po::value<std::string>()->default_value("minter_role"),
      credo::schema::joined_names(credo::schema::kAuthorizationModeMappings)
          .c_str())(
      "recovery-authority", po::value<std::string>()->default_value("owner"),
      credo::schema::joined_names(credo::schema::kRecoveryAuthorityMappings)
          .c_str())("holder", po::value<std::string>(), "holder account hex")(
      "credential-type-id", po::value<uint64_t>(), "credential type id")(
      "from", po::value<uint64_t>()->default_value(0), "first event sequence")(
      "to", po::value<uint64_t>()->default_value(UINT64_MAX),
      "last event sequence")("caller", po::value<std::string>(),
                             "calling account hex")(
      "now", po::value<uint64_t>()->default_value(0),
      "ledger time in seconds")("value",
                                po::value<std::string>()->default_value("0"),
                                "attached value")(
      "operation-base64", po::value<std::string>(),
      "SCALE encoded operation");

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

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "credo", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto encoder = encoder_t{};
  auto storage =
      credo::storage::make_storage<credo::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = credo::execution::engine{encoder, storage, make_config(vm)};

  auto status = 0;
  if (command == "info") {
    print_info(engine);
  } else if (command == "balance") {
    if (!vm.contains("credential-type-id")) {
      credo::common::critical("balance requires --credential-type-id");
    }
    std::cout << engine
                     .balance_of(get_hash32(vm, "holder"),
                                 vm["credential-type-id"].as<uint64_t>())
                     .str()
              << '\n';
  } else if (command == "uri") {
    if (!vm.contains("credential-type-id")) {
      credo::common::critical("uri requires --credential-type-id");
    }
    auto uri = engine.uri(vm["credential-type-id"].as<uint64_t>());
    if (!uri) {
      spdlog::error("credential type {} is not created",
                    vm["credential-type-id"].as<uint64_t>());
      status = 1;
    } else {
      std::cout << *uri << '\n';
    }
  } else if (command == "nonce") {
    std::cout << engine.nonce_of(get_hash32(vm, "holder")) << '\n';
  } else if (command == "events") {
    print_events(engine, vm["from"].as<uint64_t>(), vm["to"].as<uint64_t>());
  } else if (command == "execute") {
    status = execute(engine, vm);
  } else {
    credo::common::critical(
        "command must be info|balance|uri|nonce|events|execute");
  }

  spdlog::shutdown();
  return status;
}
