/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bip39/mnemonic.hpp"

#include <boost/algorithm/string.hpp>

namespace gorc::crypto::bip39 {

  namespace {
    /**
     * @brief Checks if a given string is a valid UTF-8 encoded sequence.
     *
     * @param s The input string in UTF-8 encoding.
     * @return true if the string is valid UTF-8, otherwise false.
     *
     * @details
     * The function performs a byte-by-byte validation of the input string by
     * analyzing the leading bits of each byte:
     * - 0xxxxxxx : Single-byte ASCII (valid)
     * - 110xxxxx : Start of a 2-byte sequence
     *              (must be followed by 10xxxxxx)
     * - 1110xxxx : Start of a 3-byte sequence
     *              (must be followed by two 10xxxxxx bytes)
     * - 11110xxx : Start of a 4-byte sequence
     *              (must be followed by three 10xxxxxx bytes)
     *
     * Additional checks:
     * - Surrogate pair range (U+D800 to U+DFFF) is invalid in UTF-8.
     * - Codepoints above U+10FFFF are not allowed.
     * - Overlong forms, encoded with more bytes than the codepoint needs,
     *   are not allowed.
     */
    bool isValidUtf8(std::string_view s) {
      size_t i = 0, len = s.size();
      while (i < len) {
        auto c = static_cast<uint8_t>(s[i]);
        if (c <= 0x7F) {
          i++;
        } else if ((c & 0xE0) == 0xC0) {
          if (i + 1 >= len || (s[i + 1] & 0xC0) != 0x80) {
            return false;
          }
          // C0 and C1 leads only encode ASCII
          if (c < 0xC2) {
            return false;
          }
          i += 2;
        } else if ((c & 0xF0) == 0xE0) {
          if (i + 2 >= len || (s[i + 1] & 0xC0) != 0x80
              || (s[i + 2] & 0xC0) != 0x80) {
            return false;
          }
          uint32_t codepoint =
              ((c & 0x0F) << 12) | ((s[i + 1] & 0x3F) << 6) | (s[i + 2] & 0x3F);
          if (codepoint < 0x800
              || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            return false;
          }
          i += 3;
        } else if ((c & 0xF8) == 0xF0) {
          if (i + 3 >= len || (s[i + 1] & 0xC0) != 0x80
              || (s[i + 2] & 0xC0) != 0x80 || (s[i + 3] & 0xC0) != 0x80) {
            return false;
          }
          uint32_t codepoint = ((c & 0x07) << 18) | ((s[i + 1] & 0x3F) << 12)
                             | ((s[i + 2] & 0x3F) << 6) | (s[i + 3] & 0x3F);
          if (codepoint < 0x10000 || codepoint > 0x10FFFF) {
            return false;
          }
          i += 4;
        } else {
          return false;
        }
      }
      return true;
    }
  }  // namespace

  outcome::result<Mnemonic> Mnemonic::parse(std::string_view phrase) {
    if (not isValidUtf8(phrase)) {
      return MnemonicError::INVALID_MNEMONIC;
    }

    auto trimmed = boost::algorithm::trim_copy(std::string{phrase});
    Mnemonic mnemonic;
    if (not trimmed.empty()) {
      boost::split(mnemonic.words,
                   trimmed,
                   boost::algorithm::is_space(),
                   boost::algorithm::token_compress_on);
    }
    for (auto &word : mnemonic.words) {
      boost::algorithm::to_lower(word);
    }
    OPENSSL_cleanse(trimmed.data(), trimmed.size());
    return mnemonic;
  }

  Mnemonic::~Mnemonic() {
    for (auto &word : words) {
      OPENSSL_cleanse(word.data(), word.size());
    }
  }

  SecureString Mnemonic::sentence() const {
    SecureString res;
    for (const auto &word : words) {
      if (not res.empty()) {
        res += ' ';
      }
      res.append(word.begin(), word.end());
    }
    return res;
  }
}  // namespace gorc::crypto::bip39

OUTCOME_CPP_DEFINE_CATEGORY(gorc::crypto::bip39, MnemonicError, e) {
  switch (e) {
    using enum gorc::crypto::bip39::MnemonicError;
    case INVALID_MNEMONIC:
      return "Mnemonic provided is not valid";
  }
  return "unknown MnemonicError";
}
