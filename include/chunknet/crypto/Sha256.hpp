#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace chunknet::crypto {

class Sha256 {
public:
    static constexpr std::size_t kDigestSize = 32;
    static constexpr std::size_t kBlockSize = 64;

    using Digest = std::array<std::uint8_t, kDigestSize>;

    Sha256();

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view text);
    Digest finalize();

    static Digest digest(std::span<const std::uint8_t> data);
    static std::string hex_digest(std::span<const std::uint8_t> data);

private:
    void compress(const std::uint8_t* block);

    std::array<std::uint32_t, 8> state_{};
    std::array<std::uint8_t, kBlockSize> pending_{};
    std::size_t pending_size_{0};
    std::uint64_t total_bytes_{0};
};

std::string to_hex(std::span<const std::uint8_t> bytes);

}  // namespace chunknet::crypto
