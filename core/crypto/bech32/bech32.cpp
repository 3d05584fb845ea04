/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/bech32/bech32.hpp"

#include <array>
#include <vector>

OUTCOME_CPP_DEFINE_CATEGORY(gorc::crypto::bech32, Bech32Error, e) {
  using E = gorc::crypto::bech32::Bech32Error;
  switch (e) {
    case E::INVALID_HRP:
      return "bech32 human readable part is empty, too long or not printable "
             "lower case ASCII";
    case E::TOO_LONG:
      return "bech32 string exceeds 90 characters";
    case E::MIXED_CASE:
      return "bech32 string mixes upper and lower case";
    case E::MISSING_SEPARATOR:
      return "bech32 string has no separator or a too short data part";
    case E::INVALID_CHARACTER:
      return "bech32 data part contains a character outside the charset";
    case E::INVALID_CHECKSUM:
      return "bech32 checksum mismatch";
    case E::INVALID_PADDING:
      return "bech32 payload has invalid padding";
  }
  return "unknown Bech32Error";
}

namespace gorc::crypto::bech32 {

  namespace {
    constexpr std::string_view kCharset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
    constexpr char kSeparator = '1';
    constexpr size_t kChecksumSize = 6;

    using Words = std::vector<uint8_t>;

    uint32_t polymod(const Words &values) {
      constexpr std::array<uint32_t, 5> kGenerator{
          0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3};
      uint32_t chk = 1;
      for (auto v : values) {
        auto top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        for (size_t i = 0; i < kGenerator.size(); ++i) {
          if (((top >> i) & 1) != 0) {
            chk ^= kGenerator[i];
          }
        }
      }
      return chk;
    }

    Words expandHrp(std::string_view hrp) {
      Words ret;
      ret.reserve(hrp.size() * 2 + 1);
      for (auto c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) >> 5);
      }
      ret.push_back(0);
      for (auto c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) & 31);
      }
      return ret;
    }

    Words createChecksum(std::string_view hrp, const Words &values) {
      auto enc = expandHrp(hrp);
      enc.insert(enc.end(), values.begin(), values.end());
      enc.resize(enc.size() + kChecksumSize);
      auto mod = polymod(enc) ^ 1;
      Words ret(kChecksumSize);
      for (size_t i = 0; i < kChecksumSize; ++i) {
        ret[i] = (mod >> (5 * (5 - i))) & 31;
      }
      return ret;
    }

    bool verifyChecksum(std::string_view hrp, const Words &values) {
      auto enc = expandHrp(hrp);
      enc.insert(enc.end(), values.begin(), values.end());
      return polymod(enc) == 1;
    }

    /// regroups \param in of FromBits-wide words into ToBits-wide words
    template <unsigned FromBits, unsigned ToBits, bool Pad, typename In>
    bool convertBits(const In &in, Words &out) {
      constexpr uint32_t max_value = (1u << ToBits) - 1;
      constexpr uint32_t max_acc = (1u << (FromBits + ToBits - 1)) - 1;
      uint32_t acc = 0;
      unsigned bits = 0;
      for (auto value : in) {
        if ((value >> FromBits) != 0) {
          return false;
        }
        acc = ((acc << FromBits) | value) & max_acc;
        bits += FromBits;
        while (bits >= ToBits) {
          bits -= ToBits;
          out.push_back((acc >> bits) & max_value);
        }
      }
      if constexpr (Pad) {
        if (bits > 0) {
          out.push_back((acc << (ToBits - bits)) & max_value);
        }
      } else if (bits >= FromBits or ((acc << (ToBits - bits)) & max_value)) {
        return false;
      }
      return true;
    }

    bool isValidHrp(std::string_view hrp) {
      if (hrp.empty() or hrp.size() > kMaxLength - kChecksumSize - 1) {
        return false;
      }
      for (auto c : hrp) {
        if (c < 33 or c > 126 or (c >= 'A' and c <= 'Z')) {
          return false;
        }
      }
      return true;
    }
  }  // namespace

  outcome::result<std::string> encode(std::string_view hrp,
                                      common::BufferView data) {
    if (not isValidHrp(hrp)) {
      return Bech32Error::INVALID_HRP;
    }
    Words values;
    values.reserve((data.size() * 8 + 4) / 5 + kChecksumSize);
    convertBits<8, 5, true>(data, values);
    auto checksum = createChecksum(hrp, values);
    values.insert(values.end(), checksum.begin(), checksum.end());

    if (hrp.size() + 1 + values.size() > kMaxLength) {
      return Bech32Error::TOO_LONG;
    }
    std::string result;
    result.reserve(hrp.size() + 1 + values.size());
    result.append(hrp);
    result.push_back(kSeparator);
    for (auto v : values) {
      result.push_back(kCharset[v]);
    }
    return result;
  }

  outcome::result<Decoded> decode(std::string_view str) {
    if (str.size() > kMaxLength) {
      return Bech32Error::TOO_LONG;
    }
    bool has_lower = false;
    bool has_upper = false;
    for (auto c : str) {
      if (c < 33 or c > 126) {
        return Bech32Error::INVALID_CHARACTER;
      }
      has_lower = has_lower or (c >= 'a' and c <= 'z');
      has_upper = has_upper or (c >= 'A' and c <= 'Z');
    }
    if (has_lower and has_upper) {
      return Bech32Error::MIXED_CASE;
    }

    auto pos = str.rfind(kSeparator);
    if (pos == std::string_view::npos or pos == 0
        or pos + 1 + kChecksumSize > str.size()) {
      return Bech32Error::MISSING_SEPARATOR;
    }

    std::string hrp;
    hrp.reserve(pos);
    for (auto c : str.substr(0, pos)) {
      hrp.push_back((c >= 'A' and c <= 'Z') ? static_cast<char>(c + 32) : c);
    }

    Words values;
    values.reserve(str.size() - pos - 1);
    for (auto c : str.substr(pos + 1)) {
      auto lower = (c >= 'A' and c <= 'Z') ? static_cast<char>(c + 32) : c;
      auto idx = kCharset.find(lower);
      if (idx == std::string_view::npos) {
        return Bech32Error::INVALID_CHARACTER;
      }
      values.push_back(static_cast<uint8_t>(idx));
    }
    if (not verifyChecksum(hrp, values)) {
      return Bech32Error::INVALID_CHECKSUM;
    }
    values.resize(values.size() - kChecksumSize);

    Words bytes;
    if (not convertBits<5, 8, false>(values, bytes)) {
      return Bech32Error::INVALID_PADDING;
    }
    return Decoded{.hrp = std::move(hrp),
                   .data = common::Buffer(std::move(bytes))};
  }

}  // namespace gorc::crypto::bech32
