/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/random_generator/boost_generator.hpp"

#include <boost/random/random_device.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(gorc::crypto, RandomGeneratorError, e) {
  using E = gorc::crypto::RandomGeneratorError;
  switch (e) {
    case E::SOURCE_UNAVAILABLE:
      return "system random source is unavailable";
  }
  return "unknown RandomGeneratorError";
}

namespace gorc::crypto {

  BoostRandomGenerator::BoostRandomGenerator()
      : logger_{log::createLogger("RandomGenerator", "crypto")} {}

  outcome::result<void> BoostRandomGenerator::fillRandomly(
      std::span<uint8_t> out) {
    try {
      // random_device opens the system source on construction and throws if
      // it is missing
      boost::random::random_device rng;
      size_t offset = 0;
      while (offset < out.size()) {
        auto word = rng();
        for (size_t i = 0; i < sizeof(word) and offset < out.size(); ++i) {
          out[offset++] = static_cast<uint8_t>(word >> (i * 8));
        }
      }
    } catch (const std::exception &e) {
      SL_ERROR(logger_, "Can't read system random source: {}", e.what());
      return RandomGeneratorError::SOURCE_UNAVAILABLE;
    }
    return outcome::success();
  }

}  // namespace gorc::crypto
