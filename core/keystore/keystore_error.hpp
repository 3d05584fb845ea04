/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace gorc::keystore {

  /**
   * Errors reported by the keystore facade, the record store and the
   * derivation engine. Lower level errors are translated to these at
   * component boundaries.
   */
  enum class KeystoreError {
    ENTROPY_SOURCE_ERROR = 1,
    INVALID_MNEMONIC,
    INVALID_DERIVATION_PATH,
    INVALID_NAME,
    NAME_ALREADY_EXISTS,
    NOT_FOUND,
    DECRYPTION_FAILED,
    CORRUPT_RECORD,
    STORAGE_IO_ERROR,
    UNSUPPORTED_CHAIN,
    KEY_DERIVATION_FAILED,
  };

}  // namespace gorc::keystore

OUTCOME_HPP_DECLARE_ERROR(gorc::keystore, KeystoreError);
