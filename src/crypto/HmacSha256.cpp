#include "chunknet/crypto/HmacSha256.hpp"

#include <algorithm>

namespace chunknet::crypto {

HmacSha256::Tag HmacSha256::compute(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
    std::array<std::uint8_t, Sha256::kBlockSize> block{};
    if (key.size() > block.size()) {
        const auto hashed = Sha256::digest(key);
        std::copy(hashed.begin(), hashed.end(), block.begin());
    } else {
        std::copy(key.begin(), key.end(), block.begin());
    }

    std::array<std::uint8_t, Sha256::kBlockSize> inner_pad{};
    std::array<std::uint8_t, Sha256::kBlockSize> outer_pad{};
    for (std::size_t i = 0; i < block.size(); ++i) {
        inner_pad[i] = static_cast<std::uint8_t>(block[i] ^ 0x36u);
        outer_pad[i] = static_cast<std::uint8_t>(block[i] ^ 0x5cu);
    }

    Sha256 inner;
    inner.update(inner_pad);
    inner.update(data);
    const auto inner_digest = inner.finalize();

    Sha256 outer;
    outer.update(outer_pad);
    outer.update(inner_digest);

    std::fill(block.begin(), block.end(), std::uint8_t{0});
    return outer.finalize();
}

HmacSha256::Tag HmacSha256::compute(std::span<const std::uint8_t> key, std::string_view data) {
    return compute(key, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

bool HmacSha256::verify(std::span<const std::uint8_t> key,
                        std::span<const std::uint8_t> data,
                        std::span<const std::uint8_t> tag) {
    const auto expected = compute(key, data);
    return constant_time_equal(expected, tag);
}

bool constant_time_equal(std::span<const std::uint8_t> lhs, std::span<const std::uint8_t> rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    std::uint8_t diff = 0;
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        diff |= static_cast<std::uint8_t>(lhs[i] ^ rhs[i]);
    }
    return diff == 0;
}

}  // namespace chunknet::crypto
