/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <boost/algorithm/string/replace.hpp>

#include "keystore/record_codec.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace gorc::keystore;
using gorc::common::Buffer;

namespace {
  constexpr std::string_view kCosmosPubkey =
      "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";

  std::string cosmosRecordJson() {
    return R"({
  "version": "1",
  "chain": "cosmos",
  "address": "cosmos1w508d6qejxtdg4y5r3zarvary0c5xw7k6ah60c",
  "public_key": "0x0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798",
  "derivation_path": "m/44'/118'/0'/0/0",
  "crypto": {
    "version": "1",
    "kdf": "scrypt",
    "kdfparams": {
      "n": "32768",
      "r": "8",
      "p": "1",
      "dklen": "32",
      "salt": "0xaabbccdd"
    },
    "cipher": "aes-256-gcm",
    "cipherparams": {
      "nonce": "0x000102030405060708090a0b"
    },
    "ciphertext": "0xdeadbeef"
  }
})";
  }

  std::string replaced(std::string json,
                       std::string_view from,
                       std::string_view to) {
    boost::algorithm::replace_first(json, from, to);
    return json;
  }
}  // namespace

/**
 * @given record file content written by hand
 * @when decoded
 * @then every field lands in the record, name comes from the caller
 */
TEST(RecordCodecTest, DecodeHandWritten) {
  EXPECT_OUTCOME_TRUE(
      record, decodeRecord(cosmosRecordJson(), "validator", Chain::Cosmos));
  EXPECT_EQ(record.name, "validator");
  EXPECT_EQ(record.chain, Chain::Cosmos);
  EXPECT_EQ(record.address, "cosmos1w508d6qejxtdg4y5r3zarvary0c5xw7k6ah60c");
  EXPECT_EQ(record.public_key.toHex(), kCosmosPubkey);
  ASSERT_TRUE(record.derivation_path.has_value());
  EXPECT_EQ(*record.derivation_path, "m/44'/118'/0'/0/0");

  const auto &secret = record.encrypted_secret;
  EXPECT_EQ(secret.version, 1);
  EXPECT_EQ(secret.kdf, "scrypt");
  EXPECT_EQ(secret.kdf_params.n, 32768);
  EXPECT_EQ(secret.kdf_params.r, 8);
  EXPECT_EQ(secret.kdf_params.p, 1);
  EXPECT_EQ(secret.dklen, 32);
  EXPECT_EQ(secret.salt, "aabbccdd"_unhex);
  EXPECT_EQ(secret.cipher, "aes-256-gcm");
  EXPECT_EQ(secret.nonce, "000102030405060708090a0b"_unhex);
  EXPECT_EQ(secret.ciphertext, "deadbeef"_unhex);
}

/**
 * @given record without derivation path
 * @when encoded and decoded back
 * @then the same record is obtained and the path stays absent
 */
TEST(RecordCodecTest, EncodeImportedKey) {
  EXPECT_OUTCOME_TRUE(
      record, decodeRecord(cosmosRecordJson(), "validator", Chain::Cosmos));
  record.derivation_path.reset();

  auto json = encodeRecord(record);
  EXPECT_EQ(json.find("derivation_path"), std::string::npos);
  EXPECT_EQ(json.find("validator"), std::string::npos);
  EXPECT_NE(json.find("\"0xdeadbeef\""), std::string::npos);

  EXPECT_OUTCOME_TRUE(decoded, decodeRecord(json, "validator", Chain::Cosmos));
  EXPECT_EQ(decoded, record);
}

/**
 * @given content that is not JSON
 * @when decoded
 * @then MALFORMED_JSON is returned
 */
TEST(RecordCodecTest, MalformedJson) {
  EXPECT_EC(decodeRecord("{\"version\": ", "a", Chain::Cosmos),
            RecordCodecError::MALFORMED_JSON);
  EXPECT_EC(decodeRecord("", "a", Chain::Cosmos),
            RecordCodecError::MALFORMED_JSON);
}

/**
 * @given records lacking required fields
 * @when decoded
 * @then MISSING_FIELD is returned
 */
TEST(RecordCodecTest, MissingFields) {
  auto json = cosmosRecordJson();
  EXPECT_EC(decodeRecord(replaced(json, "\"address\"", "\"addr\""),
                         "a",
                         Chain::Cosmos),
            RecordCodecError::MISSING_FIELD);
  EXPECT_EC(decodeRecord(replaced(json, "\"nonce\"", "\"iv\""),
                         "a",
                         Chain::Cosmos),
            RecordCodecError::MISSING_FIELD);
  EXPECT_EC(decodeRecord(replaced(json, "\"crypto\"", "\"Crypto\""),
                         "a",
                         Chain::Cosmos),
            RecordCodecError::MISSING_FIELD);
  EXPECT_EC(decodeRecord("{}", "a", Chain::Cosmos),
            RecordCodecError::MISSING_FIELD);
}

/**
 * @given records with unparsable values
 * @when decoded
 * @then INVALID_FIELD is returned
 */
TEST(RecordCodecTest, InvalidFields) {
  auto json = cosmosRecordJson();
  EXPECT_EC(decodeRecord(replaced(json, "\"32768\"", "\"32k\""),
                         "a",
                         Chain::Cosmos),
            RecordCodecError::INVALID_FIELD);
  EXPECT_EC(decodeRecord(replaced(json, "0xdeadbeef", "0xdeadbeeg"),
                         "a",
                         Chain::Cosmos),
            RecordCodecError::INVALID_FIELD);
  EXPECT_EC(
      decodeRecord(replaced(json, "\"chain\": \"cosmos\"", "\"chain\": \"btc\""),
                   "a",
                   Chain::Cosmos),
      RecordCodecError::INVALID_FIELD);
  EXPECT_EC(decodeRecord(replaced(json,
                                  "cosmos1w508d6qejxtdg4y5r3zarvary0c5xw7k6ah60c",
                                  ""),
                         "a",
                         Chain::Cosmos),
            RecordCodecError::INVALID_FIELD);
  // compressed key in a record that claims to be ethereum
  auto eth = replaced(json, "\"chain\": \"cosmos\"", "\"chain\": \"eth\"");
  EXPECT_EC(decodeRecord(eth, "a", Chain::Ethereum),
            RecordCodecError::INVALID_FIELD);
}

/**
 * @given record of an unknown format version
 * @when decoded
 * @then UNSUPPORTED_VERSION is returned
 */
TEST(RecordCodecTest, UnsupportedVersion) {
  auto json = replaced(cosmosRecordJson(), "\"1\"", "\"2\"");
  EXPECT_EC(decodeRecord(json, "a", Chain::Cosmos),
            RecordCodecError::UNSUPPORTED_VERSION);
}

/**
 * @given cosmos record stored under the ethereum extension
 * @when decoded as ethereum
 * @then CHAIN_MISMATCH is returned
 */
TEST(RecordCodecTest, ChainMismatch) {
  EXPECT_EC(decodeRecord(cosmosRecordJson(), "a", Chain::Ethereum),
            RecordCodecError::CHAIN_MISMATCH);
}
