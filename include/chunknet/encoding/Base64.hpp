#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunknet::encoding {

enum class Base64Alphabet {
    Standard,
    UrlSafe
};

std::string base64_encode(std::span<const std::uint8_t> input, Base64Alphabet alphabet = Base64Alphabet::Standard);

// Padded input only; throws std::invalid_argument on malformed text.
std::vector<std::uint8_t> base64_decode(std::string_view input, Base64Alphabet alphabet = Base64Alphabet::Standard);

}  // namespace chunknet::encoding
