/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/keystore_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(gorc::keystore, KeystoreError, e) {
  using E = gorc::keystore::KeystoreError;
  switch (e) {
    case E::ENTROPY_SOURCE_ERROR:
      return "system random source is unavailable";
    case E::INVALID_MNEMONIC:
      return "mnemonic has unknown words, a wrong checksum or an unsupported "
             "number of words";
    case E::INVALID_DERIVATION_PATH:
      return "malformed derivation path";
    case E::INVALID_NAME:
      return "key name must be 1 to 128 printable ASCII characters without "
             "path separators, not starting with a dot";
    case E::NAME_ALREADY_EXISTS:
      return "a key with this name already exists";
    case E::NOT_FOUND:
      return "no key with this name";
    case E::DECRYPTION_FAILED:
      return "decryption failed, wrong passphrase or damaged key file";
    case E::CORRUPT_RECORD:
      return "key file is unparseable or inconsistent";
    case E::STORAGE_IO_ERROR:
      return "keystore storage input/output error";
    case E::UNSUPPORTED_CHAIN:
      return "chain is not supported";
    case E::KEY_DERIVATION_FAILED:
      return "derived key was rejected by the curve";
  }
  return "unknown KeystoreError";
}
