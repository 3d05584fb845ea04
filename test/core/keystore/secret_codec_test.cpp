/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "crypto/aes/impl/aes_gcm_provider_impl.hpp"
#include "crypto/random_generator/boost_generator.hpp"
#include "crypto/scrypt/impl/scrypt_provider_impl.hpp"
#include "keystore/impl/secret_codec_impl.hpp"
#include "keystore/keystore_error.hpp"
#include "mock/core/crypto/random_generator_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace gorc::keystore;
using gorc::crypto::AesGcmProviderImpl;
using gorc::crypto::BoostRandomGenerator;
using gorc::crypto::CSPRNGMock;
using gorc::crypto::RandomGeneratorError;
using gorc::crypto::ScryptParams;
using gorc::crypto::ScryptProviderImpl;
using gorc::crypto::SecureBuffer;
using testing::_;
using testing::Return;

class SecretCodecTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    codec = makeCodec(std::make_shared<BoostRandomGenerator>());
    key = SecureBuffer(32, 0x42);
  }

  std::shared_ptr<SecretCodecImpl> makeCodec(
      std::shared_ptr<gorc::crypto::CSPRNG> random) {
    return std::make_shared<SecretCodecImpl>(
        std::move(random),
        std::make_shared<ScryptProviderImpl>(),
        std::make_shared<AesGcmProviderImpl>(),
        kParams);
  }

  // cheap parameters keep the suite fast
  static constexpr ScryptParams kParams{.n = 1024, .r = 8, .p = 1};

  std::shared_ptr<SecretCodecImpl> codec;
  SecureBuffer key;
};

/**
 * @given serialized key
 * @when encrypted and decrypted with the same passphrase and context
 * @then original bytes are restored and the envelope describes the scheme
 */
TEST_F(SecretCodecTest, EncryptDecrypt) {
  EXPECT_OUTCOME_TRUE(secret, codec->encrypt(key, "hunter2", "cosmos"));
  EXPECT_EQ(secret.version, 1);
  EXPECT_EQ(secret.kdf, "scrypt");
  EXPECT_EQ(secret.cipher, "aes-256-gcm");
  EXPECT_EQ(secret.kdf_params, kParams);
  EXPECT_EQ(secret.dklen, 32);
  EXPECT_EQ(secret.salt.size(), SecretCodecImpl::kSaltSize);
  EXPECT_EQ(secret.nonce.size(), 12);
  // 32 bytes of key and 16 bytes of tag
  EXPECT_EQ(secret.ciphertext.size(), 48);

  EXPECT_OUTCOME_TRUE(plain, codec->decrypt(secret, "hunter2", "cosmos"));
  EXPECT_EQ(plain, key);
}

/**
 * @given the same key encrypted twice
 * @when envelopes compared
 * @then salt, nonce and ciphertext all differ
 */
TEST_F(SecretCodecTest, FreshSaltAndNonce) {
  EXPECT_OUTCOME_TRUE(first, codec->encrypt(key, "pass", "eth"));
  EXPECT_OUTCOME_TRUE(second, codec->encrypt(key, "pass", "eth"));
  EXPECT_NE(first.salt, second.salt);
  EXPECT_NE(first.nonce, second.nonce);
  EXPECT_NE(first.ciphertext, second.ciphertext);
}

/**
 * @given encrypted key
 * @when decrypted with a wrong passphrase, another context or altered
 * ciphertext
 * @then DECRYPTION_FAILED is returned in every case
 */
TEST_F(SecretCodecTest, AuthenticationFailures) {
  EXPECT_OUTCOME_TRUE(secret, codec->encrypt(key, "right", "cosmos"));
  EXPECT_EC(codec->decrypt(secret, "wrong", "cosmos"),
            KeystoreError::DECRYPTION_FAILED);
  EXPECT_EC(codec->decrypt(secret, "right", "eth"),
            KeystoreError::DECRYPTION_FAILED);

  auto tampered = secret;
  tampered.ciphertext[0] ^= 1;
  EXPECT_EC(codec->decrypt(tampered, "right", "cosmos"),
            KeystoreError::DECRYPTION_FAILED);

  tampered = secret;
  tampered.salt[0] ^= 1;
  EXPECT_EC(codec->decrypt(tampered, "right", "cosmos"),
            KeystoreError::DECRYPTION_FAILED);
}

/**
 * @given envelopes naming unknown algorithms or bad parameters
 * @when decrypted
 * @then CORRUPT_RECORD is returned before any work is done
 */
TEST_F(SecretCodecTest, UnsupportedEnvelope) {
  EXPECT_OUTCOME_TRUE(secret, codec->encrypt(key, "pass", "cosmos"));

  auto bad = secret;
  bad.version = 2;
  EXPECT_EC(codec->decrypt(bad, "pass", "cosmos"),
            KeystoreError::CORRUPT_RECORD);

  bad = secret;
  bad.kdf = "pbkdf2";
  EXPECT_EC(codec->decrypt(bad, "pass", "cosmos"),
            KeystoreError::CORRUPT_RECORD);

  bad = secret;
  bad.cipher = "aes-128-ctr";
  EXPECT_EC(codec->decrypt(bad, "pass", "cosmos"),
            KeystoreError::CORRUPT_RECORD);

  bad = secret;
  bad.dklen = 16;
  EXPECT_EC(codec->decrypt(bad, "pass", "cosmos"),
            KeystoreError::CORRUPT_RECORD);

  bad = secret;
  bad.nonce.resize(8);
  EXPECT_EC(codec->decrypt(bad, "pass", "cosmos"),
            KeystoreError::CORRUPT_RECORD);

  bad = secret;
  bad.salt.clear();
  EXPECT_EC(codec->decrypt(bad, "pass", "cosmos"),
            KeystoreError::CORRUPT_RECORD);

  bad = secret;
  bad.kdf_params.n = 1000;
  EXPECT_EC(codec->decrypt(bad, "pass", "cosmos"),
            KeystoreError::CORRUPT_RECORD);
}

/**
 * @given random source that fails
 * @when key encrypted
 * @then ENTROPY_SOURCE_ERROR is returned
 */
TEST_F(SecretCodecTest, RandomSourceFailure) {
  auto random = std::make_shared<CSPRNGMock>();
  EXPECT_CALL(*random, fillRandomly(_))
      .WillOnce(
          Return(outcome::failure(RandomGeneratorError::SOURCE_UNAVAILABLE)));
  auto failing = makeCodec(random);
  EXPECT_EC(failing->encrypt(key, "pass", "cosmos"),
            KeystoreError::ENTROPY_SOURCE_ERROR);
}
