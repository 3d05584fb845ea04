/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip32/impl/bip32_provider_impl.hpp"

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(gorc::crypto, Bip32ProviderError, e) {
  using E = gorc::crypto::Bip32ProviderError;
  switch (e) {
    case E::INVALID_SEED_LENGTH:
      return "BIP32 seed must be 16 to 64 bytes long";
    case E::INVALID_MASTER_KEY:
      return "seed produced an invalid master key";
    case E::INVALID_CHILD_KEY:
      return "derivation produced an invalid child key";
  }
  return "unknown Bip32ProviderError";
}

namespace gorc::crypto {

  namespace {
    constexpr std::string_view kMasterKeySalt = "Bitcoin seed";
    constexpr size_t kMinSeedSize = 16;
    constexpr size_t kMaxSeedSize = 64;

    /// splits I = IL || IR, IL becomes the key (or tweak), IR the chain code
    struct SplitMac {
      explicit SplitMac(common::Hash512 &mac)
          : guard{mac},
            left{std::span<uint8_t, 32>(mac.data(), 32)},
            right{std::span<uint8_t, 32>(mac.data() + 32, 32)} {}

      SecureCleanGuard<uint8_t, 64> guard;
      std::span<uint8_t, 32> left;
      std::span<uint8_t, 32> right;
    };
  }  // namespace

  Bip32ProviderImpl::Bip32ProviderImpl(
      std::shared_ptr<Hasher> hasher,
      std::shared_ptr<Secp256k1Provider> secp256k1_provider)
      : hasher_{std::move(hasher)},
        secp256k1_provider_{std::move(secp256k1_provider)},
        logger_{log::createLogger("Bip32Provider", "bip32")} {
    BOOST_ASSERT(hasher_ != nullptr);
    BOOST_ASSERT(secp256k1_provider_ != nullptr);
  }

  outcome::result<bip32::ExtendedPrivateKey> Bip32ProviderImpl::masterKey(
      common::BufferView seed) const {
    if (seed.size() < kMinSeedSize or seed.size() > kMaxSeedSize) {
      return Bip32ProviderError::INVALID_SEED_LENGTH;
    }
    OUTCOME_TRY(mac,
                hasher_->hmac_sha512(common::str2byte(kMasterKeySalt), seed));
    SplitMac split{mac};
    if (not secp256k1_provider_->isValidSecretKey(split.left)) {
      return Bip32ProviderError::INVALID_MASTER_KEY;
    }
    return bip32::ExtendedPrivateKey{
        .secret_key = secp256k1::SecretKey::from(
            SecureCleanGuard<uint8_t, 32>{split.left}),
        .chain_code =
            bip32::ChainCode::from(SecureCleanGuard<uint8_t, 32>{split.right}),
    };
  }

  outcome::result<bip32::ExtendedPrivateKey> Bip32ProviderImpl::deriveChild(
      const bip32::ExtendedPrivateKey &parent, uint32_t index) const {
    SecureBuffer data;
    data.reserve(secp256k1::constants::kCompressedPublicKeySize + 4);
    if ((index & bip32::kHardenedFlag) != 0) {
      // 0x00 || ser256(k_par) || ser32(i)
      data.putUint8(0);
      data.put(common::BufferView{parent.secret_key.unsafeBytes()});
    } else {
      // serP(point(k_par)) || ser32(i)
      OUTCOME_TRY(public_key,
                  secp256k1_provider_->derivePublicKeyCompressed(
                      parent.secret_key));
      data.put(public_key.view());
    }
    data.putUint32BE(index);

    OUTCOME_TRY(mac,
                hasher_->hmac_sha512(
                    common::BufferView{parent.chain_code.unsafeBytes()},
                    data.view()));
    SplitMac split{mac};

    secp256k1::Tweak tweak;
    SecureCleanGuard<uint8_t, 32> tweak_guard{tweak};
    std::ranges::copy(split.left, tweak.begin());

    auto child = secp256k1_provider_->tweakAdd(parent.secret_key, tweak);
    if (not child) {
      // probability is below 2^-127, BIP32 would skip to the next index
      SL_WARN(logger_, "Child key {} is invalid", index);
      return Bip32ProviderError::INVALID_CHILD_KEY;
    }
    return bip32::ExtendedPrivateKey{
        .secret_key = std::move(child.value()),
        .chain_code =
            bip32::ChainCode::from(SecureCleanGuard<uint8_t, 32>{split.right}),
    };
  }

  outcome::result<secp256k1::SecretKey> Bip32ProviderImpl::derivePath(
      common::BufferView seed, const bip32::DerivationPath &path) const {
    OUTCOME_TRY(key, masterKey(seed));
    for (auto index : path.indices()) {
      OUTCOME_TRY(child, deriveChild(key, index));
      key = std::move(child);
    }
    SL_TRACE(logger_, "Derived key at {}", path.toString());
    return std::move(key.secret_key);
  }

}  // namespace gorc::crypto
