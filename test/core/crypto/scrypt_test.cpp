/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/scrypt/impl/scrypt_provider_impl.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace gorc::crypto;
using gorc::common::Buffer;
using gorc::common::str2byte;

class ScryptTest : public testing::Test {
 protected:
  ScryptProviderImpl scrypt;
};

/**
 * @given RFC 7914 test vector with N=1024, r=8, p=16
 * @when key derived
 * @then reference key is returned
 */
TEST_F(ScryptTest, ReferenceVector) {
  EXPECT_OUTCOME_TRUE(key,
                      scrypt.deriveKey(str2byte("password"),
                                       str2byte("NaCl"),
                                       ScryptParams{.n = 1024, .r = 8, .p = 16},
                                       64));
  EXPECT_EQ(Buffer{key.view()},
            "fdbabe1c9d3472007856e7190d01e9fe7c6ad7cbc8237830e77376634b373162"
            "2eaf30d92e22a3886ff109279d9830dac727afb94a83ee6d8360cbdfa2cc0640"_unhex);
}

/**
 * @given default parameters
 * @when validated
 * @then they are accepted
 */
TEST_F(ScryptTest, DefaultParamsAreValid) {
  EXPECT_TRUE(scrypt.validate(ScryptParams{}));
  EXPECT_EQ(ScryptParams{}.n, 32768u);
  EXPECT_EQ(ScryptParams{}.r, 8u);
  EXPECT_EQ(ScryptParams{}.p, 1u);
}

/**
 * @given N not a power of two, zero or excessive r and p
 * @when validated or used
 * @then INVALID_PARAMETERS is returned
 */
TEST_F(ScryptTest, InvalidParams) {
  EXPECT_EC(scrypt.validate({.n = 1000, .r = 8, .p = 1}),
            ScryptProviderError::INVALID_PARAMETERS);
  EXPECT_EC(scrypt.validate({.n = 1, .r = 8, .p = 1}),
            ScryptProviderError::INVALID_PARAMETERS);
  EXPECT_EC(
      scrypt.validate({.n = ScryptProviderImpl::kMaxN * 2, .r = 8, .p = 1}),
      ScryptProviderError::INVALID_PARAMETERS);
  EXPECT_EC(scrypt.validate({.n = 1024, .r = 0, .p = 1}),
            ScryptProviderError::INVALID_PARAMETERS);
  EXPECT_EC(scrypt.validate({.n = 1024, .r = 8, .p = 0}),
            ScryptProviderError::INVALID_PARAMETERS);
  EXPECT_EC(scrypt.deriveKey(str2byte("pass"),
                             str2byte("salt"),
                             {.n = 1000, .r = 8, .p = 1},
                             32),
            ScryptProviderError::INVALID_PARAMETERS);
}
