/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/entropy_accumulator.hpp"

#include <boost/assert.hpp>

#include "crypto/sha/sha256.hpp"

namespace gorc::crypto::bip39 {
  outcome::result<EntropyAccumulator> EntropyAccumulator::create(
      size_t words_count) {
    switch (words_count) {
      case 12:
        return EntropyAccumulator(132, 4);
      case 15:
        return EntropyAccumulator(165, 5);
      case 18:
        return EntropyAccumulator(198, 6);
      case 21:
        return EntropyAccumulator(231, 7);
      case 24:
        return EntropyAccumulator(264, 8);
      default:
        break;
    }
    return Bip39EntropyError::WRONG_WORDS_COUNT;
  }

  outcome::result<EntropyAccumulator> EntropyAccumulator::fromEntropy(
      common::BufferView entropy) {
    if (entropy.size() < 16 or entropy.size() > 32 or entropy.size() % 4 != 0) {
      return Bip39EntropyError::WRONG_ENTROPY_SIZE;
    }
    const size_t entropy_bits = entropy.size() * 8;
    const size_t checksum_bits = entropy_bits / 32;
    EntropyAccumulator acc(entropy_bits + checksum_bits, checksum_bits);
    for (auto byte : entropy) {
      for (int i = 7; i >= 0; --i) {
        acc.bits_.push_back((byte >> i) & 1u);
      }
    }
    auto hash = sha256(entropy);
    for (size_t i = 0; i < checksum_bits; ++i) {
      acc.bits_.push_back((hash[0] >> (7 - i)) & 1u);
    }
    return acc;
  }

  EntropyAccumulator::~EntropyAccumulator() {
    OPENSSL_cleanse(bits_.data(), bits_.size());
  }

  outcome::result<SecureBuffer> EntropyAccumulator::getEntropy() const {
    if (bits_.size() != total_bits_count_) {
      return Bip39EntropyError::STORAGE_NOT_COMPLETE;
    }

    // convert data
    size_t bytes_count = (total_bits_count_ - checksum_bits_count_) / 8;
    SecureBuffer res;
    res.reserve(bytes_count);
    auto it = bits_.begin();
    for (size_t i = 0; i < bytes_count; ++i) {
      uint8_t byte = 0;
      for (size_t j = 0; j < 8u; ++j) {
        byte <<= 1u;
        byte += *it++;
      }

      res.push_back(byte);
    }

    return res;
  }

  outcome::result<uint8_t> EntropyAccumulator::getChecksum() const {
    if (bits_.size() != total_bits_count_) {
      return Bip39EntropyError::STORAGE_NOT_COMPLETE;
    }

    uint8_t checksum = 0u;
    auto it = bits_.rbegin();
    for (auto i = 0u; i < checksum_bits_count_; ++i) {
      checksum += (*it++ << i);
    }

    return checksum;
  }

  outcome::result<std::vector<EntropyToken>> EntropyAccumulator::getTokens()
      const {
    if (bits_.size() != total_bits_count_) {
      return Bip39EntropyError::STORAGE_NOT_COMPLETE;
    }

    std::vector<EntropyToken> tokens;
    tokens.reserve(total_bits_count_ / kWordBits);
    for (size_t offset = 0; offset < bits_.size(); offset += kWordBits) {
      EntropyToken token;
      for (size_t i = 0; i < kWordBits; ++i) {
        // first bit is the most significant one
        token.set(kWordBits - i - 1, bits_[offset + i] != 0);
      }
      tokens.push_back(token);
    }
    return tokens;
  }

  outcome::result<void> EntropyAccumulator::append(const EntropyToken &value) {
    if (bits_.size() + value.size() > total_bits_count_) {
      return Bip39EntropyError::STORAGE_IS_FULL;
    }

    for (size_t i = 0; i < value.size(); ++i) {
      // bits order is little-endian, but we need big endian, reverse it
      auto position = value.size() - i - 1;
      uint8_t v = value.test(position) ? 1 : 0;
      bits_.push_back(v);
    }

    return outcome::success();
  }

  outcome::result<uint8_t> EntropyAccumulator::calculateChecksum() const {
    OUTCOME_TRY(entropy, getEntropy());
    auto hash = sha256(entropy.view());
    return hash[0] >> static_cast<uint8_t>(8 - checksum_bits_count_);
  }

  EntropyAccumulator::EntropyAccumulator(size_t bits_count,
                                         size_t checksum_bits_count)
      : total_bits_count_{bits_count},
        checksum_bits_count_{checksum_bits_count} {
    BOOST_ASSERT_MSG((bits_count - checksum_bits_count) % 32 == 0,
                     "invalid bits count");
    BOOST_ASSERT_MSG(bits_count <= 264 && bits_count >= 132,
                     "unsupported bits count");

    bits_.reserve(bits_count);
  }

}  // namespace gorc::crypto::bip39

OUTCOME_CPP_DEFINE_CATEGORY(gorc::crypto::bip39, Bip39EntropyError, error) {
  using E = gorc::crypto::bip39::Bip39EntropyError;
  switch (error) {
    case E::WRONG_WORDS_COUNT:
      return "invalid or unsupported words count";
    case E::WRONG_ENTROPY_SIZE:
      return "entropy must be 16 to 32 bytes long, in steps of 4";
    case E::STORAGE_NOT_COMPLETE:
      return "cannot get info from storage while it is still not complete";
    case E::STORAGE_IS_FULL:
      return "cannot put more data into storage, it is full";
  }

  return "unknown Bip39EntropyError error";
}
