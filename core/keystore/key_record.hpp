/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "common/buffer.hpp"
#include "crypto/scrypt/scrypt_provider.hpp"
#include "keystore/chain.hpp"

namespace gorc::keystore {

  /**
   * Passphrase-encrypted private key together with everything needed to
   * decrypt it. Names of the algorithms are kept as read so that unknown
   * ones are detected at decryption time.
   */
  struct EncryptedSecret {
    uint32_t version = 1;
    std::string kdf;
    crypto::ScryptParams kdf_params;
    size_t dklen = 32;
    common::Buffer salt;
    std::string cipher;
    common::Buffer nonce;
    /// ciphertext with authentication tag appended
    common::Buffer ciphertext;

    bool operator==(const EncryptedSecret &) const = default;
  };

  /// The persisted unit, one per file
  struct KeyRecord {
    std::string name;
    Chain chain{};
    common::Buffer public_key;
    std::string address;
    EncryptedSecret encrypted_secret;
    std::optional<std::string> derivation_path;

    bool operator==(const KeyRecord &) const = default;
  };

  /// List projection, never touches the encrypted part
  struct KeyRecordMeta {
    std::string name;
    Chain chain{};
    std::string address;

    bool operator==(const KeyRecordMeta &) const = default;
  };

  /// Displayable key information
  struct KeyInfo {
    std::string name;
    Chain chain{};
    common::Buffer public_key;
    std::string address;
    std::optional<std::string> derivation_path;

    bool operator==(const KeyInfo &) const = default;
  };

  /// Directory entry that looked like a record but could not be read
  struct SkippedEntry {
    std::string file_name;
    std::error_code error;
  };

  struct ListResult {
    /// sorted by name
    std::vector<KeyRecordMeta> records;
    std::vector<SkippedEntry> skipped;
  };

}  // namespace gorc::keystore
