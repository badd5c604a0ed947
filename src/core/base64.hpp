#ifndef SAVEFILE_CORE_BASE64_HPP_
#define SAVEFILE_CORE_BASE64_HPP_

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace savefile::core {

// Decodes standard base64 (RFC 4648 alphabet, '=' padding) into `bytes`.
//
// Contract:
// - ASCII whitespace is skipped, so line-wrapped input decodes.
// - Input length (whitespace excluded) must be a multiple of 4; '=' may only
//   appear as the last one or two characters.
// - Empty input decodes to no bytes.
// - On failure `bytes` is left empty and `error` names the problem.
inline bool DecodeBase64(std::string_view input, std::vector<std::uint8_t>& bytes,
                         std::string& error) {
  static constexpr std::uint8_t kInvalid = 0xFF;
  static constexpr std::array<std::uint8_t, 256> kReverse = [] {
    std::array<std::uint8_t, 256> map{};
    map.fill(kInvalid);
    constexpr std::string_view kAlphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
      map[static_cast<std::uint8_t>(kAlphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return map;
  }();

  bytes.clear();
  std::string filtered;
  filtered.reserve(input.size());
  for (const char ch : input) {
    if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
      filtered.push_back(ch);
    }
  }
  if (filtered.size() % 4U != 0U) {
    error = "base64 length must be a multiple of 4";
    return false;
  }

  std::size_t padding = 0U;
  if (!filtered.empty() && filtered.back() == '=') {
    padding = filtered.size() >= 2U && filtered[filtered.size() - 2U] == '=' ? 2U : 1U;
  }

  bytes.reserve((filtered.size() / 4U) * 3U);
  for (std::size_t i = 0; i < filtered.size(); i += 4U) {
    const bool last_group = i + 4U == filtered.size();
    const std::size_t data_chars = last_group ? 4U - padding : 4U;

    std::uint32_t group = 0U;
    for (std::size_t j = 0; j < 4U; ++j) {
      const unsigned char ch = static_cast<unsigned char>(filtered[i + j]);
      std::uint8_t value = 0U;
      if (j < data_chars) {
        value = kReverse[ch];
        if (value == kInvalid) {
          bytes.clear();
          error = "invalid base64 character at offset " + std::to_string(i + j);
          return false;
        }
      }
      group = (group << 6U) | value;
    }

    bytes.push_back(static_cast<std::uint8_t>((group >> 16U) & 0xFFU));
    if (data_chars >= 3U) {
      bytes.push_back(static_cast<std::uint8_t>((group >> 8U) & 0xFFU));
    }
    if (data_chars == 4U) {
      bytes.push_back(static_cast<std::uint8_t>(group & 0xFFU));
    }
  }
  return true;
}

} // namespace savefile::core

#endif // SAVEFILE_CORE_BASE64_HPP_
