#pragma once

#include "chunknet/crypto/Sha256.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace chunknet::crypto {

class HmacSha256 {
public:
    static constexpr std::size_t kDigestSize = Sha256::kDigestSize;

    using Tag = std::array<std::uint8_t, kDigestSize>;

    static Tag compute(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);
    static Tag compute(std::span<const std::uint8_t> key, std::string_view data);

    // Constant-time comparison against the expected tag.
    static bool verify(std::span<const std::uint8_t> key,
                       std::span<const std::uint8_t> data,
                       std::span<const std::uint8_t> tag);
};

bool constant_time_equal(std::span<const std::uint8_t> lhs, std::span<const std::uint8_t> rhs);

}  // namespace chunknet::crypto
