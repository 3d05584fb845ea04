/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using namespace gorc::common;

/**
 * @given bytes
 * @when hex_lower and hex_lower_0x applied
 * @then lowercase hex string is returned, prefixed in the second case
 */
TEST(HexUtil, Encode) {
  std::vector<uint8_t> bytes{0x00, 0xab, 0x7f, 0xff};
  EXPECT_EQ(hex_lower(bytes), "00ab7fff");
  EXPECT_EQ(hex_lower_0x(bytes), "0x00ab7fff");
  EXPECT_EQ(hex_lower_0x({}), "0x");
}

/**
 * @given hex string in mixed case
 * @when unhex applied
 * @then bytes are returned
 */
TEST(HexUtil, DecodeValid) {
  EXPECT_OUTCOME_TRUE(bytes, unhex("00AbCd"));
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0x00, 0xab, 0xcd}));
}

/**
 * @given odd length or non hex strings
 * @when unhex applied
 * @then matching error is returned
 */
TEST(HexUtil, DecodeInvalid) {
  EXPECT_EC(unhex("abc"), UnhexError::NOT_ENOUGH_INPUT);
  EXPECT_EC(unhex("zz"), UnhexError::NON_HEX_INPUT);
}

/**
 * @given hex strings with and without 0x prefix
 * @when unhexWith0x applied
 * @then only the prefixed one is accepted
 */
TEST(HexUtil, DecodeWithPrefix) {
  EXPECT_OUTCOME_TRUE(bytes, unhexWith0x("0x0102"));
  EXPECT_EQ(bytes, (std::vector<uint8_t>{0x01, 0x02}));
  EXPECT_EC(unhexWith0x("0102"), UnhexError::MISSING_0X_PREFIX);
}
