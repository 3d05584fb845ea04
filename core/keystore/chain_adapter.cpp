/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "keystore/chain_adapter.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(gorc::keystore, ChainAdapterError, e) {
  using E = gorc::keystore::ChainAdapterError;
  switch (e) {
    case E::INVALID_PUBLIC_KEY:
      return "public key has a wrong length or is not a curve point";
    case E::INVALID_PRIVATE_KEY:
      return "private key has a wrong length or is out of range";
  }
  return "unknown ChainAdapterError";
}
