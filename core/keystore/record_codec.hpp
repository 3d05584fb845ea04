/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "keystore/key_record.hpp"
#include "outcome/outcome.hpp"

namespace gorc::keystore {

  enum class RecordCodecError {
    MALFORMED_JSON = 1,
    MISSING_FIELD,
    INVALID_FIELD,
    UNSUPPORTED_VERSION,
    CHAIN_MISMATCH,
  };

  constexpr std::string_view kRecordFormatVersion = "1";

  /**
   * @brief serializes \param record to its JSON file form
   * @note name is not part of the content, it is the file stem
   */
  std::string encodeRecord(const KeyRecord &record);

  /**
   * @brief parses content of a record file
   * @param content file content
   * @param name name taken from the file stem
   * @param expected_chain chain implied by the file extension, the "chain"
   * field must agree with it
   */
  outcome::result<KeyRecord> decodeRecord(std::string_view content,
                                          std::string name,
                                          Chain expected_chain);

}  // namespace gorc::keystore

OUTCOME_HPP_DECLARE_ERROR(gorc::keystore, RecordCodecError);
