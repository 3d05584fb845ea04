/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "outcome/outcome.hpp"

namespace gorc {
  namespace application {
    class AppConfiguration;
  }  // namespace application

  namespace crypto {
    class CSPRNG;
  }  // namespace crypto

  namespace keystore {
    class ChainAdapterRegistry;
    class DerivationEngine;
    class Keystore;
    class RecordStore;
    class SecretCodec;
  }  // namespace keystore
}  // namespace gorc

namespace gorc::injector {

  /**
   * Wires keystore components for the given configuration. Every component
   * is created once and shared.
   */
  class KeystoreInjector final {
   public:
    explicit KeystoreInjector(
        std::shared_ptr<application::AppConfiguration> app_config);

    std::shared_ptr<crypto::CSPRNG> injectRandomGenerator();
    std::shared_ptr<keystore::ChainAdapterRegistry> injectChainAdapters();
    std::shared_ptr<keystore::DerivationEngine> injectDerivationEngine();
    std::shared_ptr<keystore::SecretCodec> injectSecretCodec();

    /// fails if the keystore directory is missing
    outcome::result<std::shared_ptr<keystore::RecordStore>> injectRecordStore();
    outcome::result<std::shared_ptr<keystore::Keystore>> injectKeystore();

   protected:
    std::shared_ptr<class KeystoreInjectorImpl> pimpl_;
  };

}  // namespace gorc::injector
