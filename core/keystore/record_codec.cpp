/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/record_codec.hpp"

#include <charconv>
#include <sstream>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "common/hexutil.hpp"
#include "crypto/secp256k1_types.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(gorc::keystore, RecordCodecError, e) {
  using E = gorc::keystore::RecordCodecError;
  switch (e) {
    case E::MALFORMED_JSON:
      return "key file is not valid JSON";
    case E::MISSING_FIELD:
      return "key file lacks a required field";
    case E::INVALID_FIELD:
      return "key file has a field with an invalid value";
    case E::UNSUPPORTED_VERSION:
      return "key file format version is not supported";
    case E::CHAIN_MISMATCH:
      return "chain in key file does not match its extension";
  }
  return "unknown RecordCodecError";
}

namespace gorc::keystore {

  namespace pt = boost::property_tree;

  namespace {
    template <typename T>
    outcome::result<std::decay_t<T>> ensure(boost::optional<T> opt) {
      if (not opt) {
        return RecordCodecError::MISSING_FIELD;
      }
      return opt.value();
    }

    template <typename T>
    outcome::result<T> parseNumber(const std::string &str) {
      T value{};
      auto [ptr, ec] =
          std::from_chars(str.data(), str.data() + str.size(), value);
      if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return RecordCodecError::INVALID_FIELD;
      }
      return value;
    }

    outcome::result<common::Buffer> parseHex(const std::string &str) {
      auto bytes = common::unhexWith0x(str);
      if (not bytes) {
        return RecordCodecError::INVALID_FIELD;
      }
      return common::Buffer(std::move(bytes.value()));
    }

    size_t publicKeySize(Chain chain) {
      switch (chain) {
        case Chain::Cosmos:
          return crypto::secp256k1::constants::kCompressedPublicKeySize;
        case Chain::Ethereum:
          return crypto::secp256k1::constants::kUncompressedPublicKeySize;
      }
      return 0;
    }

    outcome::result<EncryptedSecret> decodeCrypto(const pt::ptree &tree) {
      EncryptedSecret secret;
      OUTCOME_TRY(version, ensure(tree.get_optional<std::string>("version")));
      OUTCOME_TRY(version_num, parseNumber<uint32_t>(version));
      secret.version = version_num;
      OUTCOME_TRY(kdf, ensure(tree.get_optional<std::string>("kdf")));
      secret.kdf = std::move(kdf);
      OUTCOME_TRY(cipher, ensure(tree.get_optional<std::string>("cipher")));
      secret.cipher = std::move(cipher);

      OUTCOME_TRY(kdfparams, ensure(tree.get_child_optional("kdfparams")));
      OUTCOME_TRY(n, ensure(kdfparams.get_optional<std::string>("n")));
      OUTCOME_TRY(r, ensure(kdfparams.get_optional<std::string>("r")));
      OUTCOME_TRY(p, ensure(kdfparams.get_optional<std::string>("p")));
      OUTCOME_TRY(dklen, ensure(kdfparams.get_optional<std::string>("dklen")));
      OUTCOME_TRY(salt, ensure(kdfparams.get_optional<std::string>("salt")));
      OUTCOME_TRY(n_num, parseNumber<uint64_t>(n));
      OUTCOME_TRY(r_num, parseNumber<uint32_t>(r));
      OUTCOME_TRY(p_num, parseNumber<uint32_t>(p));
      OUTCOME_TRY(dklen_num, parseNumber<size_t>(dklen));
      secret.kdf_params = {.n = n_num, .r = r_num, .p = p_num};
      secret.dklen = dklen_num;
      OUTCOME_TRY(salt_bytes, parseHex(salt));
      secret.salt = std::move(salt_bytes);

      OUTCOME_TRY(cipherparams,
                  ensure(tree.get_child_optional("cipherparams")));
      OUTCOME_TRY(nonce,
                  ensure(cipherparams.get_optional<std::string>("nonce")));
      OUTCOME_TRY(nonce_bytes, parseHex(nonce));
      secret.nonce = std::move(nonce_bytes);

      OUTCOME_TRY(ciphertext,
                  ensure(tree.get_optional<std::string>("ciphertext")));
      OUTCOME_TRY(ciphertext_bytes, parseHex(ciphertext));
      secret.ciphertext = std::move(ciphertext_bytes);
      return secret;
    }
  }  // namespace

  std::string encodeRecord(const KeyRecord &record) {
    const auto &secret = record.encrypted_secret;
    pt::ptree kdfparams;
    kdfparams.put("n", std::to_string(secret.kdf_params.n));
    kdfparams.put("r", std::to_string(secret.kdf_params.r));
    kdfparams.put("p", std::to_string(secret.kdf_params.p));
    kdfparams.put("dklen", std::to_string(secret.dklen));
    kdfparams.put("salt", common::hex_lower_0x(secret.salt));

    pt::ptree cipherparams;
    cipherparams.put("nonce", common::hex_lower_0x(secret.nonce));

    pt::ptree crypto_tree;
    crypto_tree.put("version", std::to_string(secret.version));
    crypto_tree.put("kdf", secret.kdf);
    crypto_tree.add_child("kdfparams", kdfparams);
    crypto_tree.put("cipher", secret.cipher);
    crypto_tree.add_child("cipherparams", cipherparams);
    crypto_tree.put("ciphertext", common::hex_lower_0x(secret.ciphertext));

    pt::ptree tree;
    tree.put("version", std::string{kRecordFormatVersion});
    tree.put("chain", std::string{toString(record.chain)});
    tree.put("address", record.address);
    tree.put("public_key", common::hex_lower_0x(record.public_key));
    if (record.derivation_path) {
      tree.put("derivation_path", *record.derivation_path);
    }
    tree.add_child("crypto", crypto_tree);

    std::ostringstream out;
    pt::write_json(out, tree);
    return out.str();
  }

  outcome::result<KeyRecord> decodeRecord(std::string_view content,
                                          std::string name,
                                          Chain expected_chain) {
    pt::ptree tree;
    try {
      std::istringstream in{std::string{content}};
      pt::read_json(in, tree);
    } catch (const pt::json_parser_error &) {
      return RecordCodecError::MALFORMED_JSON;
    }

    OUTCOME_TRY(version, ensure(tree.get_optional<std::string>("version")));
    if (version != kRecordFormatVersion) {
      return RecordCodecError::UNSUPPORTED_VERSION;
    }

    OUTCOME_TRY(chain_str, ensure(tree.get_optional<std::string>("chain")));
    auto chain = chainFromString(chain_str);
    if (not chain) {
      return RecordCodecError::INVALID_FIELD;
    }
    if (*chain != expected_chain) {
      return RecordCodecError::CHAIN_MISMATCH;
    }

    KeyRecord record;
    record.name = std::move(name);
    record.chain = *chain;

    OUTCOME_TRY(address, ensure(tree.get_optional<std::string>("address")));
    if (address.empty()) {
      return RecordCodecError::INVALID_FIELD;
    }
    record.address = std::move(address);

    OUTCOME_TRY(public_key_hex,
                ensure(tree.get_optional<std::string>("public_key")));
    OUTCOME_TRY(public_key, parseHex(public_key_hex));
    if (public_key.size() != publicKeySize(record.chain)) {
      return RecordCodecError::INVALID_FIELD;
    }
    record.public_key = std::move(public_key);

    if (auto path = tree.get_optional<std::string>("derivation_path")) {
      record.derivation_path = std::move(path.value());
    }

    OUTCOME_TRY(crypto_tree, ensure(tree.get_child_optional("crypto")));
    OUTCOME_TRY(secret, decodeCrypto(crypto_tree));
    record.encrypted_secret = std::move(secret);
    return record;
  }

}  // namespace gorc::keystore
