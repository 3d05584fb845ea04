/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <bitset>
#include <vector>

#include <boost/assert.hpp>

#include "crypto/bip39/const.hpp"
#include "crypto/common.hpp"
#include "outcome/outcome.hpp"

namespace gorc::crypto::bip39 {

  enum class Bip39EntropyError {
    WRONG_WORDS_COUNT = 1,
    WRONG_ENTROPY_SIZE,
    STORAGE_NOT_COMPLETE,
    STORAGE_IS_FULL,
  };

  struct EntropyToken : public std::bitset<kWordBits> {
    using Parent = std::bitset<kWordBits>;
    using Parent::bitset;
  };

  /**
   * @class EntropyAccumulator accumulates and provides entropy and checksum
   */
  class EntropyAccumulator {
   public:
    /**
     * @brief create class instance
     * @param words_count number of words in mnemonic phrase
     */
    static outcome::result<EntropyAccumulator> create(size_t words_count);

    /**
     * @brief create instance holding \param entropy followed by its checksum
     * @param entropy 16, 20, 24, 28 or 32 bytes
     */
    static outcome::result<EntropyAccumulator> fromEntropy(
        common::BufferView entropy);

    EntropyAccumulator(const EntropyAccumulator &) = default;

    ~EntropyAccumulator();

    /**
     * @brief append a new entropy token
     * @param value token
     * @return success or error if storage is full
     */
    outcome::result<void> append(const EntropyToken &value);

    /**
     * @return entropy as byte array
     */
    outcome::result<SecureBuffer> getEntropy() const;

    /**
     * @brief checksum is a part of last byte
     * @return checksum
     */
    outcome::result<uint8_t> getChecksum() const;

    /**
     * @brief calculates checksum of significant bits
     * @return checksum value
     */
    outcome::result<uint8_t> calculateChecksum() const;

    /**
     * @brief splits the complete storage into 11-bit word tokens
     */
    outcome::result<std::vector<EntropyToken>> getTokens() const;

   private:
    /**
     * @param bits_count total bits count (depends on words count)
     * @param checksum_bits_count number of bits in checksum byte
     */
    EntropyAccumulator(size_t bits_count, size_t checksum_bits_count);

    std::vector<uint8_t> bits_;
    const size_t total_bits_count_;
    const size_t checksum_bits_count_;
  };
}  // namespace gorc::crypto::bip39

OUTCOME_HPP_DECLARE_ERROR(gorc::crypto::bip39, Bip39EntropyError);
