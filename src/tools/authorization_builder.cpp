#include <boost/program_options.hpp>
#include <credo/authorization/mint_message.hpp>
#include <credo/blake3/hash.hpp>
#include <credo/common/critical.hpp>
#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/schema/operation.hpp>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = credo::schema::encoding::encoder<
    credo::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

credo::schema::hash32_t get_hash32(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    credo::common::critical("missing required hash argument --" + name);
  }
  return credo::schema::make_hash32(vm[name].as<std::string>());
}

uint64_t get_uint64(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    credo::common::critical("missing required integer argument --" + name);
  }
  return vm[name].as<uint64_t>();
}

credo::schema::amount_t get_amount(const po::variables_map& vm,
                                   const std::string& name) {
  auto value = vm[name].as<std::string>();
  try {
    return credo::schema::amount_t{value};
  } catch (const std::exception& ex) {
    std::cerr << "invalid --" << name << " '" << value << "': " << ex.what()
              << '\n';
    credo::common::critical("amount must be a decimal integer");
  }
}

std::string hex_of(const credo::schema::bytes_t& bytes) {
  return credo::schema::to_hex(
      credo::schema::bytes_view_t{bytes.data(), bytes.size()});
}

std::string hex_of(const credo::schema::hash32_t& hash) {
  return credo::schema::to_hex(
      credo::schema::bytes_view_t{hash.data(), hash.size()});
}

credo::authorization::mint_claim_t make_claim(const po::variables_map& vm) {
  return credo::authorization::mint_claim_t{
      .recipient = get_hash32(vm, "recipient"),
      .credential_type_id = get_uint64(vm, "credential-type-id"),
      .price = get_amount(vm, "price"),
      .deadline = get_uint64(vm, "deadline"),
      .domain_id = get_hash32(vm, "domain-id"),
      .nonce = vm["nonce"].as<uint64_t>()};
}

std::optional<credo::schema::signer_id_t> make_signer(
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

credo::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto bytes = vm["signature-hex"].as<std::string>().empty()
                   ? credo::schema::bytes_t{}
                   : credo::schema::from_hex(
                         vm["signature-hex"].as<std::string>());
  if (kind == "ed25519") {
    auto signature = credo::schema::ed25519_signature_t{};
    if (!bytes.empty()) {
      if (bytes.size() != signature.size()) {
        credo::common::critical("ed25519 signature must be 64 bytes");
      }
      std::ranges::copy(bytes, std::begin(signature));
    }
    return credo::schema::signature_t{signature};
  }
  if (kind == "secp256k1") {
    auto signature = credo::schema::secp256k1_signature_t{};
    if (!bytes.empty()) {
      if (bytes.size() != signature.size()) {
        credo::common::critical("secp256k1 signature must be 65 bytes");
      }
      std::ranges::copy(bytes, std::begin(signature));
    }
    return credo::schema::signature_t{signature};
  }
  credo::common::critical("unsupported signature-kind");
}

std::vector<credo::schema::credential_type_id_t> get_ids(
    const po::variables_map& vm) {
  if (vm.contains("credential-type-ids")) {
    return vm["credential-type-ids"].as<std::vector<uint64_t>>();
  }
  return {get_uint64(vm, "credential-type-id")};
}

std::vector<credo::schema::amount_t> get_amounts(
    const po::variables_map& vm,
    const std::size_t count) {
  if (!vm.contains("amounts")) {
    return std::vector<credo::schema::amount_t>(count, get_amount(vm, "amount"));
  }
  auto amounts = std::vector<credo::schema::amount_t>{};
  for (const auto& value : vm["amounts"].as<std::vector<std::string>>()) {
    try {
      amounts.emplace_back(value);
    } catch (const std::exception& ex) {
      std::cerr << "invalid amount '" << value << "': " << ex.what() << '\n';
      credo::common::critical("amounts must be decimal integers");
    }
  }
  return amounts;
}

credo::schema::operation_t build_operation(const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "create_credential_type") {
    return credo::schema::create_credential_type_t{
        .name = vm["name"].as<std::string>(),
        .description = vm["description"].as<std::string>(),
        .mint_start = vm["mint-start"].as<uint64_t>(),
        .mint_end = vm["mint-end"].as<uint64_t>(),
        .price = get_amount(vm, "price")};
  }
  if (payload == "add_minter") {
    return credo::schema::add_minter_t{.account = get_hash32(vm, "account")};
  }
  if (payload == "remove_minter") {
    return credo::schema::remove_minter_t{.account = get_hash32(vm, "account")};
  }
  if (payload == "set_signer") {
    return credo::schema::set_signer_t{.signer = make_signer(vm)};
  }
  if (payload == "set_treasury") {
    return credo::schema::set_treasury_t{.treasury = get_hash32(vm, "account")};
  }
  if (payload == "set_base_uri") {
    return credo::schema::set_base_uri_t{
        .base_uri = vm["base-uri"].as<std::string>()};
  }
  if (payload == "pause") {
    return credo::schema::set_paused_t{.paused = true};
  }
  if (payload == "unpause") {
    return credo::schema::set_paused_t{.paused = false};
  }
  if (payload == "transfer_ownership") {
    return credo::schema::transfer_ownership_t{
        .new_owner = get_hash32(vm, "account")};
  }
  if (payload == "mint") {
    return credo::schema::mint_t{
        .to = get_hash32(vm, "recipient"),
        .credential_type_id = get_uint64(vm, "credential-type-id")};
  }
  if (payload == "mint_with_authorization") {
    return credo::schema::mint_with_authorization_t{
        .to = get_hash32(vm, "recipient"),
        .credential_type_id = get_uint64(vm, "credential-type-id"),
        .authorization = credo::schema::mint_authorization_t{
            .price = get_amount(vm, "price"),
            .deadline = get_uint64(vm, "deadline"),
            .signature = make_signature(vm)}};
  }
  if (payload == "burn") {
    return credo::schema::burn_t{
        .holder = get_hash32(vm, "holder"),
        .credential_type_id = get_uint64(vm, "credential-type-id"),
        .amount = get_amount(vm, "amount")};
  }
  if (payload == "burn_batch") {
    auto ids = get_ids(vm);
    auto amounts = get_amounts(vm, ids.size());
    return credo::schema::burn_batch_t{.holder = get_hash32(vm, "holder"),
                                       .credential_type_ids = ids,
                                       .amounts = amounts};
  }
  if (payload == "set_approval_for_all") {
    return credo::schema::set_approval_for_all_t{
        .operator_id = get_hash32(vm, "operator"),
        .approved = vm["approved"].as<bool>()};
  }
  if (payload == "safe_transfer_from") {
    return credo::schema::safe_transfer_from_t{
        .from = get_hash32(vm, "holder"),
        .to = get_hash32(vm, "recipient"),
        .credential_type_id = get_uint64(vm, "credential-type-id"),
        .amount = get_amount(vm, "amount")};
  }
  if (payload == "safe_batch_transfer_from") {
    auto ids = get_ids(vm);
    auto amounts = get_amounts(vm, ids.size());
    return credo::schema::safe_batch_transfer_from_t{
        .from = get_hash32(vm, "holder"),
        .to = get_hash32(vm, "recipient"),
        .credential_type_ids = ids,
        .amounts = amounts};
  }
  if (payload == "recover") {
    return credo::schema::recover_t{
        .old_holder = get_hash32(vm, "holder"),
        .new_holder = get_hash32(vm, "recipient")};
  }
  if (payload == "receive") {
    return credo::schema::receive_value_t{};
  }
  credo::common::critical("unsupported operation payload");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  authorization_builder message [options]\n"
            << "  authorization_builder digest [options]\n"
            << "  authorization_builder operation --payload NAME [options]\n"
            << "  authorization_builder domain-id --label TEXT\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"authorization_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "message|digest|operation|domain-id")(
      "payload", po::value<std::string>(), "operation payload type")(
      "recipient", po::value<std::string>(), "recipient account hex")(
      "holder", po::value<std::string>(), "holder account hex")(
      "account", po::value<std::string>(), "account hex")(
      "operator", po::value<std::string>(), "operator account hex")(
      "approved", po::value<bool>()->default_value(true), "approval flag")(
      "credential-type-id", po::value<uint64_t>(), "credential type id")(
      "credential-type-ids", po::value<std::vector<uint64_t>>()->multitoken(),
      "credential type ids")("amount",
                             po::value<std::string>()->default_value("1"),
                             "decimal amount")(
      "amounts", po::value<std::vector<std::string>>()->multitoken(),
      "decimal amounts")("price", po::value<std::string>()->default_value("0"),
                         "decimal price")(
      "deadline", po::value<uint64_t>(), "authorization deadline seconds")(
      "domain-id", po::value<std::string>(), "deployment domain hash32 hex")(
      "nonce", po::value<uint64_t>()->default_value(0), "recipient nonce")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex",
                           po::value<std::string>()->default_value(""),
                           "signature bytes hex")(
      "signer-kind", po::value<std::string>()->default_value("none"),
      "none|ed25519|secp256k1|named")("signer-hex", po::value<std::string>(),
                                      "signer public key hex")(
      "name", po::value<std::string>()->default_value(""),
      "credential type name")("description",
                              po::value<std::string>()->default_value(""),
                              "credential type description")(
      "mint-start", po::value<uint64_t>()->default_value(0),
      "mint window start seconds")("mint-end",
                                   po::value<uint64_t>()->default_value(0),
                                   "mint window end seconds, 0 for open")(
      "base-uri", po::value<std::string>()->default_value(""),
      "metadata base uri")("label", po::value<std::string>(),
                           "domain label hashed into a domain id");

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

  if (command == "message") {
    std::cout << hex_of(credo::authorization::make_mint_authorization_message(
                     make_claim(vm)))
              << '\n';
    return 0;
  }

  if (command == "digest") {
    std::cout << hex_of(credo::authorization::mint_authorization_digest(
                     make_claim(vm)))
              << '\n';
    return 0;
  }

  if (command == "operation" || command == "op") {
    if (!vm.contains("payload")) {
      credo::common::critical("operation mode requires --payload");
    }
    auto encoded = encoder_t{}.encode(build_operation(vm));
    std::cout << credo::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "domain-id") {
    if (!vm.contains("label")) {
      credo::common::critical("domain-id mode requires --label");
    }
    std::cout << hex_of(credo::blake3::hash(
                     std::string_view{vm["label"].as<std::string>()}))
              << '\n';
    return 0;
  }

  credo::common::critical("command must be message|digest|operation|domain-id");
}
