/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/aes/impl/aes_gcm_provider_impl.hpp"

#include <memory>

#include <openssl/evp.h>

namespace gorc::crypto {

  namespace {
    using CipherCtx =
        std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

    CipherCtx makeCtx() {
      return CipherCtx{EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free};
    }

    outcome::result<void> checkSizes(common::BufferView key,
                                     common::BufferView nonce) {
      if (key.size() != constants::aes_gcm::KEY_SIZE) {
        return AesGcmError::INVALID_KEY_LENGTH;
      }
      if (nonce.size() != constants::aes_gcm::NONCE_SIZE) {
        return AesGcmError::INVALID_NONCE_LENGTH;
      }
      return outcome::success();
    }
  }  // namespace

  outcome::result<common::Buffer> AesGcmProviderImpl::encrypt(
      common::BufferView key,
      common::BufferView nonce,
      common::BufferView plaintext,
      common::BufferView aad) const {
    using constants::aes_gcm::TAG_SIZE;
    OUTCOME_TRY(checkSizes(key, nonce));

    auto ctx = makeCtx();
    if (not ctx) {
      return AesGcmError::ENCRYPTION_FAILED;
    }
    if (1
            != EVP_EncryptInit_ex(
                ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr)
        or 1
               != EVP_CIPHER_CTX_ctrl(ctx.get(),
                                      EVP_CTRL_GCM_SET_IVLEN,
                                      static_cast<int>(nonce.size()),
                                      nullptr)
        or 1
               != EVP_EncryptInit_ex(
                   ctx.get(), nullptr, nullptr, key.data(), nonce.data())) {
      return AesGcmError::ENCRYPTION_FAILED;
    }

    int len = 0;
    if (not aad.empty()
        and 1
                != EVP_EncryptUpdate(ctx.get(),
                                     nullptr,
                                     &len,
                                     aad.data(),
                                     static_cast<int>(aad.size()))) {
      return AesGcmError::ENCRYPTION_FAILED;
    }

    common::Buffer out(plaintext.size() + TAG_SIZE, 0);
    if (1
        != EVP_EncryptUpdate(ctx.get(),
                             out.data(),
                             &len,
                             plaintext.data(),
                             static_cast<int>(plaintext.size()))) {
      return AesGcmError::ENCRYPTION_FAILED;
    }
    auto written = static_cast<size_t>(len);
    if (1 != EVP_EncryptFinal_ex(ctx.get(), out.data() + written, &len)) {
      return AesGcmError::ENCRYPTION_FAILED;
    }
    written += static_cast<size_t>(len);
    if (1
        != EVP_CIPHER_CTX_ctrl(ctx.get(),
                               EVP_CTRL_GCM_GET_TAG,
                               TAG_SIZE,
                               out.data() + written)) {
      return AesGcmError::ENCRYPTION_FAILED;
    }
    out.resize(written + TAG_SIZE);
    return out;
  }

  outcome::result<SecureBuffer> AesGcmProviderImpl::decrypt(
      common::BufferView key,
      common::BufferView nonce,
      common::BufferView ciphertext,
      common::BufferView aad) const {
    using constants::aes_gcm::TAG_SIZE;
    OUTCOME_TRY(checkSizes(key, nonce));
    if (ciphertext.size() < TAG_SIZE) {
      return AesGcmError::CIPHERTEXT_TOO_SHORT;
    }
    auto body = ciphertext.first(ciphertext.size() - TAG_SIZE);
    auto tag = ciphertext.last(TAG_SIZE);

    auto ctx = makeCtx();
    if (not ctx) {
      return AesGcmError::AUTHENTICATION_FAILED;
    }
    if (1
            != EVP_DecryptInit_ex(
                ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr)
        or 1
               != EVP_CIPHER_CTX_ctrl(ctx.get(),
                                      EVP_CTRL_GCM_SET_IVLEN,
                                      static_cast<int>(nonce.size()),
                                      nullptr)
        or 1
               != EVP_DecryptInit_ex(
                   ctx.get(), nullptr, nullptr, key.data(), nonce.data())) {
      return AesGcmError::AUTHENTICATION_FAILED;
    }

    int len = 0;
    if (not aad.empty()
        and 1
                != EVP_DecryptUpdate(ctx.get(),
                                     nullptr,
                                     &len,
                                     aad.data(),
                                     static_cast<int>(aad.size()))) {
      return AesGcmError::AUTHENTICATION_FAILED;
    }

    // one spare block keeps EVP_DecryptFinal_ex in bounds
    SecureBuffer out(body.size() + TAG_SIZE, 0);
    if (1
        != EVP_DecryptUpdate(ctx.get(),
                             out.data(),
                             &len,
                             body.data(),
                             static_cast<int>(body.size()))) {
      return AesGcmError::AUTHENTICATION_FAILED;
    }
    auto written = static_cast<size_t>(len);

    // EVP_CTRL_GCM_SET_TAG takes a non-const pointer but only reads it
    common::Blob<TAG_SIZE> expected_tag;
    std::copy(tag.begin(), tag.end(), expected_tag.begin());
    if (1
        != EVP_CIPHER_CTX_ctrl(ctx.get(),
                               EVP_CTRL_GCM_SET_TAG,
                               TAG_SIZE,
                               expected_tag.data())) {
      return AesGcmError::AUTHENTICATION_FAILED;
    }
    if (1 != EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &len)) {
      return AesGcmError::AUTHENTICATION_FAILED;
    }
    written += static_cast<size_t>(len);
    out.resize(written);
    return out;
  }

}  // namespace gorc::crypto

OUTCOME_CPP_DEFINE_CATEGORY(gorc::crypto, AesGcmError, e) {
  using E = gorc::crypto::AesGcmError;
  switch (e) {
    case E::INVALID_KEY_LENGTH:
      return "AES-256-GCM key must be 32 bytes";
    case E::INVALID_NONCE_LENGTH:
      return "AES-256-GCM nonce must be 12 bytes";
    case E::CIPHERTEXT_TOO_SHORT:
      return "ciphertext is shorter than the authentication tag";
    case E::ENCRYPTION_FAILED:
      return "AES-256-GCM encryption failed";
    case E::AUTHENTICATION_FAILED:
      return "AES-256-GCM authentication failed";
  }
  return "unknown AesGcmError";
}
