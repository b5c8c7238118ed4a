#include <boost/program_options.hpp>
#include <registrar/common/critical.hpp>
#include <registrar/config/node_options.hpp>
#include <registrar/schema/encoding/scale/encoder.hpp>
#include <registrar/schema/transaction.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = registrar::schema::encoding::encoder<
    registrar::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    registrar::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

template <std::size_t N>
std::array<uint8_t, N> make_key_bytes(const std::string_view hex,
                                      const std::string_view kind) {
  auto bytes = registrar::schema::try_from_hex(hex);
  if (!bytes || bytes->size() != N) {
    registrar::common::critical("{} key must be {} bytes of hex", kind, N);
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(out));
  return out;
}

// Accepts `ed25519:<hex>`, `secp256k1:<hex>`, `named:<hex>` or a bare
// 32-byte hex value, which is taken as a named signer.
registrar::schema::signer_id_t parse_signer(const std::string_view text) {
  auto separator = text.find(':');
  if (separator == std::string_view::npos) {
    return registrar::schema::signer_id_t{
        registrar::schema::make_hash32(text)};
  }
  auto kind = text.substr(0, separator);
  auto hex = text.substr(separator + 1);
  if (kind == "ed25519") {
    return registrar::schema::ed25519_signer_id{
        .public_key = make_key_bytes<32>(hex, kind)};
  }
  if (kind == "secp256k1") {
    return registrar::schema::secp256k1_signer_id{
        .public_key = make_key_bytes<33>(hex, kind)};
  }
  if (kind == "named") {
    return registrar::schema::signer_id_t{registrar::schema::make_hash32(hex)};
  }
  registrar::common::critical("unsupported signer kind '{}'", kind);
}

registrar::schema::signer_id_t get_signer(const po::variables_map& vm,
                                          const std::string& name) {
  return parse_signer(require(vm, name));
}

registrar::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto hex = vm["signature-hex"].as<std::string>();
  auto bytes =
      hex.empty() ? registrar::schema::bytes_t{} : registrar::schema::from_hex(hex);
  if (kind == "ed25519") {
    auto signature = registrar::schema::ed25519_signature_t{};
    if (!bytes.empty()) {
      if (bytes.size() != signature.size()) {
        registrar::common::critical("ed25519 signature must be 64 bytes");
      }
      std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
    }
    return registrar::schema::signature_t{signature};
  }
  if (kind == "secp256k1") {
    auto signature = registrar::schema::secp256k1_signature_t{};
    if (!bytes.empty()) {
      if (bytes.size() != signature.size()) {
        registrar::common::critical("secp256k1 signature must be 65 bytes");
      }
      std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
    }
    return registrar::schema::signature_t{signature};
  }
  registrar::common::critical("unsupported signature-kind");
}

registrar::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "create_did") {
    return registrar::schema::create_did_t{.did = require(vm, "did")};
  }
  if (payload == "revoke_did") {
    return registrar::schema::revoke_did_t{};
  }
  if (payload == "add_credential") {
    return registrar::schema::add_credential_t{
        .credential = require(vm, "credential")};
  }
  if (payload == "deactivate_did") {
    auto reason = std::optional<std::string>{};
    if (vm.contains("reason")) {
      reason = vm["reason"].as<std::string>();
    }
    return registrar::schema::deactivate_did_t{.reason = reason};
  }
  if (payload == "reactivate_did") {
    return registrar::schema::reactivate_did_t{};
  }
  if (payload == "initiate_transfer") {
    return registrar::schema::initiate_transfer_t{
        .new_owner = get_signer(vm, "new-owner")};
  }
  if (payload == "cancel_transfer") {
    return registrar::schema::cancel_transfer_t{};
  }
  if (payload == "accept_transfer") {
    return registrar::schema::accept_transfer_t{
        .current_owner = get_signer(vm, "current-owner")};
  }
  registrar::common::critical("unsupported payload '{}'", payload);
}

registrar::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/engine/keyspaces") {
    return {};
  }
  if (path == "/history/range") {
    return encoder.encode(std::tuple{vm["from-height"].as<uint64_t>(),
                                     vm["to-height"].as<uint64_t>()});
  }
  if (path == "/credential/verify") {
    return encoder.encode(
        std::tuple{get_signer(vm, "owner"), require(vm, "credential")});
  }
  if (path == "/identity/did" || path == "/identity/active" ||
      path == "/transfer/pending" || path == "/transfer/expired" ||
      path == "/transfer/history") {
    return encoder.encode(get_signer(vm, "owner"));
  }
  registrar::common::critical("unsupported query path '{}'", path);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  registrar_transaction_builder transaction [options]\n"
            << "  registrar_transaction_builder query-key [options]\n"
            << "  registrar_transaction_builder chain-id\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|chain-id")(
      "payload", po::value<std::string>(),
      "create_did|revoke_did|add_credential|deactivate_did|reactivate_did|"
      "initiate_transfer|cancel_transfer|accept_transfer")(
      "path", po::value<std::string>(), "abci query path")(
      "chain-id", po::value<std::string>(),
      "32-byte chain id hex (defaults to the local chain id)")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(),
      "transaction signer, [ed25519:|secp256k1:|named:]<hex>")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex",
                           po::value<std::string>()->default_value(""),
                           "signature bytes hex")(
      "did", po::value<std::string>(), "did:stx:<id>")(
      "credential", po::value<std::string>(), "credential identifier")(
      "reason", po::value<std::string>(), "deactivation reason")(
      "new-owner", po::value<std::string>(), "transfer recipient signer")(
      "current-owner", po::value<std::string>(), "transfer source signer")(
      "owner", po::value<std::string>(), "record owner signer for queries")(
      "from-height", po::value<uint64_t>()->default_value(1),
      "history range from")(
      "to-height", po::value<uint64_t>()->default_value(1), "history range to");

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
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto chain_id = vm.contains("chain-id")
                      ? registrar::schema::make_hash32(
                            vm["chain-id"].as<std::string>())
                      : registrar::config::default_chain_id();

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      registrar::common::critical("transaction mode requires --payload");
    }
    auto transaction = registrar::schema::transaction_t{
        .version = 1,
        .chain_id = chain_id,
        .nonce = vm["nonce"].as<uint64_t>(),
        .signer = get_signer(vm, "signer"),
        .payload = build_payload(vm),
        .signature = make_signature(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << registrar::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      registrar::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    std::cout << registrar::schema::to_base64(key) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << registrar::schema::to_hex(registrar::schema::bytes_view_t{
                     chain_id.data(), chain_id.size()})
              << '\n';
    return 0;
  }

  registrar::common::critical("command must be transaction|query-key|chain-id");
}
