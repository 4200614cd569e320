#include "chunknet/crypto/ChaCha20.hpp"

#include <algorithm>

namespace chunknet::crypto {

namespace {

constexpr std::array<std::uint32_t, 4> kConstants{0x61707865u, 0x3320646eu, 0x79622d32u, 0x6b206574u};

[[nodiscard]] constexpr std::uint32_t rotl(std::uint32_t value, int shift) noexcept {
    return (value << shift) | (value >> (32 - shift));
}

[[nodiscard]] std::uint32_t load_le32(const std::uint8_t* data) noexcept {
    return static_cast<std::uint32_t>(data[0]) |
           (static_cast<std::uint32_t>(data[1]) << 8) |
           (static_cast<std::uint32_t>(data[2]) << 16) |
           (static_cast<std::uint32_t>(data[3]) << 24);
}

void quarter_round(std::array<std::uint32_t, 16>& x, int a, int b, int c, int d) noexcept {
    x[a] += x[b]; x[d] = rotl(x[d] ^ x[a], 16);
    x[c] += x[d]; x[b] = rotl(x[b] ^ x[c], 12);
    x[a] += x[b]; x[d] = rotl(x[d] ^ x[a], 8);
    x[c] += x[d]; x[b] = rotl(x[b] ^ x[c], 7);
}

}  // namespace

std::array<std::uint8_t, ChaCha20::kBlockSize> ChaCha20::block(const Key& key, const Nonce& nonce, std::uint32_t counter) {
    std::array<std::uint32_t, 16> input{};
    std::copy(kConstants.begin(), kConstants.end(), input.begin());
    for (std::size_t i = 0; i < 8; ++i) {
        input[4 + i] = load_le32(key.bytes.data() + i * 4);
    }
    input[12] = counter;
    for (std::size_t i = 0; i < 3; ++i) {
        input[13 + i] = load_le32(nonce.bytes.data() + i * 4);
    }

    auto x = input;
    for (int round = 0; round < 10; ++round) {
        quarter_round(x, 0, 4, 8, 12);
        quarter_round(x, 1, 5, 9, 13);
        quarter_round(x, 2, 6, 10, 14);
        quarter_round(x, 3, 7, 11, 15);
        quarter_round(x, 0, 5, 10, 15);
        quarter_round(x, 1, 6, 11, 12);
        quarter_round(x, 2, 7, 8, 13);
        quarter_round(x, 3, 4, 9, 14);
    }

    std::array<std::uint8_t, kBlockSize> out{};
    for (std::size_t i = 0; i < 16; ++i) {
        const auto word = x[i] + input[i];
        out[i * 4] = static_cast<std::uint8_t>(word);
        out[i * 4 + 1] = static_cast<std::uint8_t>(word >> 8);
        out[i * 4 + 2] = static_cast<std::uint8_t>(word >> 16);
        out[i * 4 + 3] = static_cast<std::uint8_t>(word >> 24);
    }
    return out;
}

void ChaCha20::apply(const Key& key,
                     const Nonce& nonce,
                     std::span<const std::uint8_t> input,
                     std::vector<std::uint8_t>& output,
                     std::uint32_t counter) {
    output.resize(input.size());
    std::size_t offset = 0;
    while (offset < input.size()) {
        auto keystream = block(key, nonce, counter++);
        const auto length = std::min(kBlockSize, input.size() - offset);
        for (std::size_t i = 0; i < length; ++i) {
            output[offset + i] = static_cast<std::uint8_t>(input[offset + i] ^ keystream[i]);
        }
        offset += length;
        std::fill(keystream.begin(), keystream.end(), std::uint8_t{0});
    }
}

}  // namespace chunknet::crypto
