#pragma once

#include "chunknet/Types.hpp"
#include "chunknet/crypto/ChaCha20.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace chunknet::crypto {

// Authenticated symmetric tokens: ChaCha20 encryption with an HMAC-SHA256 tag
// over the whole token (encrypt-then-MAC). Layout:
//   version(1) | issued_at(8, big endian seconds) | nonce(12) | ciphertext | tag(32)
class TokenCipher {
public:
    static constexpr std::uint8_t kVersion = 0x81;
    static constexpr std::size_t kHeaderSize = 1 + 8 + 12;
    static constexpr std::size_t kTagSize = 32;
    static constexpr std::size_t kOverhead = kHeaderSize + kTagSize;

    explicit TokenCipher(const Key& key);
    ~TokenCipher();

    TokenCipher(const TokenCipher&) = default;
    TokenCipher& operator=(const TokenCipher&) = default;

    ChunkData encrypt(std::span<const std::uint8_t> plaintext) const;
    std::optional<ChunkData> decrypt(std::span<const std::uint8_t> token) const;

    static std::optional<std::chrono::system_clock::time_point> issued_at(std::span<const std::uint8_t> token);

    static Key generate_key();
    // URL-safe base64, padded (44 characters).
    static std::string encode_key(const Key& key);
    static std::optional<Key> decode_key(std::string_view text);

    static void random_bytes(std::span<std::uint8_t> buffer);

private:
    Key encryption_key_{};
    Key mac_key_{};
};

}  // namespace chunknet::crypto
