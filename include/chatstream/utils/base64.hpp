#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chatstream::utils {

std::vector<std::uint8_t> decode_base64(std::string_view input);

std::string encode_base64(const std::vector<std::uint8_t>& bytes);

}  // namespace chatstream::utils
