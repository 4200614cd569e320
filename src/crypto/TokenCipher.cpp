#include "chunknet/crypto/TokenCipher.hpp"

#include "chunknet/crypto/HmacSha256.hpp"
#include "chunknet/encoding/Base64.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>

namespace chunknet::crypto {

namespace {

constexpr std::string_view kEncryptionLabel = "chunknet.enc";
constexpr std::string_view kMacLabel = "chunknet.mac";

Key derive_subkey(const Key& master, std::string_view label) {
    const auto tag = HmacSha256::compute(master.bytes, label);
    Key subkey{};
    std::copy(tag.begin(), tag.end(), subkey.bytes.begin());
    return subkey;
}

}  // namespace

TokenCipher::TokenCipher(const Key& key)
    : encryption_key_(derive_subkey(key, kEncryptionLabel)),
      mac_key_(derive_subkey(key, kMacLabel)) {}

TokenCipher::~TokenCipher() {
    std::fill(encryption_key_.bytes.begin(), encryption_key_.bytes.end(), std::uint8_t{0});
    std::fill(mac_key_.bytes.begin(), mac_key_.bytes.end(), std::uint8_t{0});
}

ChunkData TokenCipher::encrypt(std::span<const std::uint8_t> plaintext) const {
    ChunkData token;
    token.reserve(plaintext.size() + kOverhead);
    token.push_back(kVersion);

    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    const auto issued = static_cast<std::uint64_t>(now);
    for (int shift = 56; shift >= 0; shift -= 8) {
        token.push_back(static_cast<std::uint8_t>((issued >> shift) & 0xFFu));
    }

    Nonce nonce{};
    random_bytes(nonce.bytes);
    token.insert(token.end(), nonce.bytes.begin(), nonce.bytes.end());

    ChunkData ciphertext;
    ChaCha20::apply(encryption_key_, nonce, plaintext, ciphertext);
    token.insert(token.end(), ciphertext.begin(), ciphertext.end());

    const auto tag = HmacSha256::compute(mac_key_.bytes, token);
    token.insert(token.end(), tag.begin(), tag.end());
    return token;
}

std::optional<ChunkData> TokenCipher::decrypt(std::span<const std::uint8_t> token) const {
    if (token.size() < kOverhead || token[0] != kVersion) {
        return std::nullopt;
    }

    const auto signed_part = token.first(token.size() - kTagSize);
    const auto tag = token.last(kTagSize);
    if (!HmacSha256::verify(mac_key_.bytes, signed_part, tag)) {
        return std::nullopt;
    }

    Nonce nonce{};
    std::copy_n(token.begin() + 9, nonce.bytes.size(), nonce.bytes.begin());

    const auto ciphertext = signed_part.subspan(kHeaderSize);
    ChunkData plaintext;
    ChaCha20::apply(encryption_key_, nonce, ciphertext, plaintext);
    return plaintext;
}

std::optional<std::chrono::system_clock::time_point> TokenCipher::issued_at(std::span<const std::uint8_t> token) {
    if (token.size() < kOverhead || token[0] != kVersion) {
        return std::nullopt;
    }
    std::uint64_t seconds = 0;
    for (std::size_t i = 1; i <= 8; ++i) {
        seconds = (seconds << 8) | token[i];
    }
    return std::chrono::system_clock::time_point(std::chrono::seconds(static_cast<std::int64_t>(seconds)));
}

Key TokenCipher::generate_key() {
    Key key{};
    random_bytes(key.bytes);
    return key;
}

std::string TokenCipher::encode_key(const Key& key) {
    return encoding::base64_encode(key.bytes, encoding::Base64Alphabet::UrlSafe);
}

std::optional<Key> TokenCipher::decode_key(std::string_view text) {
    std::vector<std::uint8_t> raw;
    try {
        raw = encoding::base64_decode(text, encoding::Base64Alphabet::UrlSafe);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    Key key{};
    if (raw.size() != key.bytes.size()) {
        return std::nullopt;
    }
    std::copy(raw.begin(), raw.end(), key.bytes.begin());
    return key;
}

void TokenCipher::random_bytes(std::span<std::uint8_t> buffer) {
    std::random_device rd;
    std::uniform_int_distribution<unsigned int> dist(0, 0xFF);
    for (auto& byte : buffer) {
        byte = static_cast<std::uint8_t>(dist(rd));
    }
}

}  // namespace chunknet::crypto
