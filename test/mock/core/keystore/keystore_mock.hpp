/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "keystore/keystore.hpp"

namespace gorc::keystore {

  class KeystoreMock : public Keystore {
   public:
    MOCK_METHOD(outcome::result<KeyInfo>,
                add,
                (std::string_view, Chain, std::string_view),
                (override));

    MOCK_METHOD(outcome::result<MnemonicKeyInfo>,
                addWithMnemonic,
                (std::string_view, Chain, std::string_view, size_t),
                (override));

    MOCK_METHOD(outcome::result<KeyInfo>,
                importMnemonic,
                (std::string_view,
                 Chain,
                 std::string_view,
                 std::string_view,
                 const DerivationOptions &),
                (override));

    MOCK_METHOD(outcome::result<void>,
                remove,
                (std::string_view, Chain),
                (override));

    MOCK_METHOD(outcome::result<void>,
                rename,
                (std::string_view, std::string_view, Chain),
                (override));

    MOCK_METHOD(outcome::result<ListResult>, list, (Chain), (const, override));

    MOCK_METHOD(outcome::result<KeyInfo>,
                show,
                (std::string_view, Chain, std::string_view),
                (const, override));
  };

}  // namespace gorc::keystore
