/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "injector/keystore_injector.hpp"

#include <boost/di.hpp>
#include <boost/di/extension/scopes/shared.hpp>

#include "application/app_configuration.hpp"
#include "common/outcome_throw.hpp"
#include "crypto/aes/impl/aes_gcm_provider_impl.hpp"
#include "crypto/bip32/impl/bip32_provider_impl.hpp"
#include "crypto/bip39/impl/bip39_provider_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "crypto/pbkdf2/impl/pbkdf2_provider_impl.hpp"
#include "crypto/random_generator/boost_generator.hpp"
#include "crypto/scrypt/impl/scrypt_provider_impl.hpp"
#include "crypto/secp256k1/secp256k1_provider_impl.hpp"
#include "injector/bind_by_lambda.hpp"
#include "keystore/adapters/cosmos_adapter.hpp"
#include "keystore/adapters/ethereum_adapter.hpp"
#include "keystore/chain_adapter_registry.hpp"
#include "keystore/impl/derivation_engine_impl.hpp"
#include "keystore/impl/key_file_storage.hpp"
#include "keystore/impl/keystore_impl.hpp"
#include "keystore/impl/secret_codec_impl.hpp"
#include "log/logger.hpp"

namespace {
  template <class T>
  using sptr = std::shared_ptr<T>;

  namespace di = boost::di;
  using namespace gorc;  // NOLINT

  template <typename C>
  auto useConfig(C c) {
    return boost::di::bind<std::decay_t<C>>().template to(
        std::move(c))[boost::di::override];
  }

  using injector::bind_by_lambda;

  sptr<keystore::RecordStore> get_record_store(
      const application::AppConfiguration &config) {
    auto storage_res =
        keystore::KeyFileStorage::createAt(config.keystorePath());
    if (not storage_res) {
      common::raise(storage_res.error());
    }
    return std::move(storage_res.value());
  }

  template <typename Injector>
  sptr<keystore::ChainAdapterRegistry> get_chain_adapters(
      const Injector &injector) {
    const application::AppConfiguration &config =
        injector.template create<const application::AppConfiguration &>();
    auto hasher = injector.template create<sptr<crypto::Hasher>>();
    auto secp256k1 =
        injector.template create<sptr<crypto::Secp256k1Provider>>();

    auto registry = std::make_shared<keystore::ChainAdapterRegistry>();
    registry->registerAdapter(std::make_shared<keystore::CosmosAdapter>(
        hasher, secp256k1, config.cosmosPrefix()));
    registry->registerAdapter(
        std::make_shared<keystore::EthereumAdapter>(hasher, secp256k1));
    return registry;
  }

  template <typename... Ts>
  auto makeKeystoreInjector(sptr<application::AppConfiguration> config,
                            Ts &&...args) {
    // clang-format off
    return di::make_injector<boost::di::extension::shared_config>(
        // bind configs
        useConfig(config->scryptParams()),
        di::bind<application::AppConfiguration>.to(config),

        // crypto
        di::bind<crypto::Hasher>.template to<crypto::HasherImpl>(),
        di::bind<crypto::Secp256k1Provider>.template to<crypto::Secp256k1ProviderImpl>(),
        di::bind<crypto::CSPRNG>.template to<crypto::BoostRandomGenerator>(),
        di::bind<crypto::Pbkdf2Provider>.template to<crypto::Pbkdf2ProviderImpl>(),
        di::bind<crypto::Bip39Provider>.template to<crypto::Bip39ProviderImpl>(),
        di::bind<crypto::Bip32Provider>.template to<crypto::Bip32ProviderImpl>(),
        di::bind<crypto::ScryptProvider>.template to<crypto::ScryptProviderImpl>(),
        di::bind<crypto::AesGcmProvider>.template to<crypto::AesGcmProviderImpl>(),

        // keystore
        bind_by_lambda<keystore::ChainAdapterRegistry>([](const auto &injector) {
          return get_chain_adapters(injector);
        }),
        di::bind<keystore::DerivationEngine>.template to<keystore::DerivationEngineImpl>(),
        di::bind<keystore::SecretCodec>.template to<keystore::SecretCodecImpl>(),
        bind_by_lambda<keystore::RecordStore>([](const auto &injector) {
          const application::AppConfiguration &config =
              injector.template create<const application::AppConfiguration &>();
          return get_record_store(config);
        }),
        di::bind<keystore::Keystore>.template to<keystore::KeystoreImpl>(),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
    // clang-format on
  }

  /// turns a factory failure raised inside the injector back into an error
  template <typename T, typename Injector>
  outcome::result<sptr<T>> tryCreate(Injector &injector) {
    try {
      return injector.template create<sptr<T>>();
    } catch (const std::system_error &e) {
      return outcome::failure(e.code());
    }
  }
}  // namespace

namespace gorc::injector {

  class KeystoreInjectorImpl {
   public:
    using Injector =
        decltype(makeKeystoreInjector(sptr<application::AppConfiguration>()));

    KeystoreInjectorImpl(Injector injector,
                         sptr<application::AppConfiguration> config)
        : injector_{std::move(injector)},
          config_{std::move(config)},
          logger_{log::createLogger("Injector", "injector")} {}

    Injector injector_;
    sptr<application::AppConfiguration> config_;
    log::Logger logger_;
  };

  KeystoreInjector::KeystoreInjector(
      sptr<application::AppConfiguration> app_config)
      : pimpl_{std::make_shared<KeystoreInjectorImpl>(
          makeKeystoreInjector(app_config), app_config)} {}

  sptr<crypto::CSPRNG> KeystoreInjector::injectRandomGenerator() {
    return pimpl_->injector_.template create<sptr<crypto::CSPRNG>>();
  }

  sptr<keystore::ChainAdapterRegistry> KeystoreInjector::injectChainAdapters() {
    return pimpl_->injector_
        .template create<sptr<keystore::ChainAdapterRegistry>>();
  }

  sptr<keystore::DerivationEngine> KeystoreInjector::injectDerivationEngine() {
    return pimpl_->injector_
        .template create<sptr<keystore::DerivationEngine>>();
  }

  sptr<keystore::SecretCodec> KeystoreInjector::injectSecretCodec() {
    return pimpl_->injector_.template create<sptr<keystore::SecretCodec>>();
  }

  outcome::result<sptr<keystore::RecordStore>>
  KeystoreInjector::injectRecordStore() {
    return tryCreate<keystore::RecordStore>(pimpl_->injector_);
  }

  outcome::result<sptr<keystore::Keystore>> KeystoreInjector::injectKeystore() {
    OUTCOME_TRY(keystore, tryCreate<keystore::Keystore>(pimpl_->injector_));
    SL_DEBUG(pimpl_->logger_,
             "Keystore at {} is ready",
             pimpl_->config_->keystorePath());
    return keystore;
  }

}  // namespace gorc::injector
