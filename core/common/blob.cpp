/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(gorc::common, BlobError, e) {
  using E = gorc::common::BlobError;
  switch (e) {
    case E::INCORRECT_LENGTH:
      return "byte string has the wrong length for its type";
  }
  return "unknown BlobError";
}

namespace gorc::common {
  template class Blob<20ul>;
  template class Blob<32ul>;
  template class Blob<64ul>;
}  // namespace gorc::common
