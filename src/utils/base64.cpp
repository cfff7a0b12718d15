#include "chatstream/utils/base64.hpp"

#include "chatstream/error.hpp"

#include <array>
#include <cctype>

namespace chatstream::utils {
namespace {

constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

const std::array<int, 256>& decode_table() {
  static const std::array<int, 256> table = [] {
    std::array<int, 256> t{};
    t.fill(-1);
    for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
      t[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int>(i);
    }
    return t;
  }();
  return table;
}

std::uint32_t decode_char(char c) {
  if (c == '=') {
    return 0;
  }
  int value = decode_table()[static_cast<unsigned char>(c)];
  if (value == -1) {
    throw ChatStreamError("Invalid base64 character encountered");
  }
  return static_cast<std::uint32_t>(value);
}

}  // namespace

std::vector<std::uint8_t> decode_base64(std::string_view input) {
  std::string_view trimmed = input;
  while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.front()))) {
    trimmed.remove_prefix(1);
  }
  while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.back()))) {
    trimmed.remove_suffix(1);
  }

  if (trimmed.size() % 4 != 0) {
    throw ChatStreamError("Base64 input length must be a multiple of 4");
  }

  std::vector<std::uint8_t> output;
  output.reserve((trimmed.size() / 4) * 3);

  for (std::size_t i = 0; i < trimmed.size(); i += 4) {
    const std::uint32_t triple = (decode_char(trimmed[i]) << 18) | (decode_char(trimmed[i + 1]) << 12) |
                                 (decode_char(trimmed[i + 2]) << 6) | decode_char(trimmed[i + 3]);

    output.push_back(static_cast<std::uint8_t>((triple >> 16) & 0xFF));
    if (trimmed[i + 2] != '=') {
      output.push_back(static_cast<std::uint8_t>((triple >> 8) & 0xFF));
    }
    if (trimmed[i + 3] != '=') {
      output.push_back(static_cast<std::uint8_t>(triple & 0xFF));
    }
  }

  return output;
}

std::string encode_base64(const std::vector<std::uint8_t>& bytes) {
  std::string output;
  output.reserve(((bytes.size() + 2) / 3) * 4);

  std::size_t i = 0;
  for (; i + 2 < bytes.size(); i += 3) {
    const std::uint32_t triple = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                                 (static_cast<std::uint32_t>(bytes[i + 1]) << 8) | bytes[i + 2];
    output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    output.push_back(kAlphabet[triple & 0x3F]);
  }

  const std::size_t remaining = bytes.size() - i;
  if (remaining == 1) {
    const std::uint32_t triple = static_cast<std::uint32_t>(bytes[i]) << 16;
    output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    output.append("==");
  } else if (remaining == 2) {
    const std::uint32_t triple = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                                 (static_cast<std::uint32_t>(bytes[i + 1]) << 8);
    output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    output.push_back('=');
  }

  return output;
}

}  // namespace chatstream::utils
