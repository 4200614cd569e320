#include "chunknet/crypto/TokenCipher.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

using chunknet::crypto::TokenCipher;

int main() {
    const auto key = TokenCipher::generate_key();
    const TokenCipher cipher(key);

    const std::string text = "chunk payload that must survive the trip";
    const std::vector<std::uint8_t> plain(text.begin(), text.end());

    const auto token = cipher.encrypt(plain);
    assert(token.size() == plain.size() + TokenCipher::kOverhead);
    assert(token.front() == TokenCipher::kVersion);

    const auto decrypted = cipher.decrypt(token);
    assert(decrypted.has_value());
    assert(*decrypted == plain);

    // Fresh nonce per token.
    const auto second = cipher.encrypt(plain);
    assert(second != token);

    const auto issued = TokenCipher::issued_at(token);
    assert(issued.has_value());
    const auto skew = std::chrono::system_clock::now() - *issued;
    assert(skew < std::chrono::minutes(1) && skew > -std::chrono::minutes(1));

    // Any flipped byte fails authentication.
    for (const std::size_t position : {std::size_t{0}, std::size_t{5}, TokenCipher::kHeaderSize, token.size() - 1}) {
        auto tampered = token;
        tampered[position] ^= 0x40;
        assert(!cipher.decrypt(tampered).has_value());
    }

    // Wrong key.
    const TokenCipher other(TokenCipher::generate_key());
    assert(!other.decrypt(token).has_value());

    // Truncated tokens.
    std::vector<std::uint8_t> short_token(token.begin(), token.begin() + TokenCipher::kOverhead - 1);
    assert(!cipher.decrypt(short_token).has_value());
    assert(!cipher.decrypt(std::vector<std::uint8_t>{}).has_value());

    // Empty plaintext still yields an authenticated token.
    const auto empty_token = cipher.encrypt(std::vector<std::uint8_t>{});
    assert(empty_token.size() == TokenCipher::kOverhead);
    const auto empty_plain = cipher.decrypt(empty_token);
    assert(empty_plain.has_value() && empty_plain->empty());

    // Key text form.
    const auto encoded = TokenCipher::encode_key(key);
    assert(encoded.size() == 44);
    const auto decoded = TokenCipher::decode_key(encoded);
    assert(decoded.has_value());
    assert(decoded->bytes == key.bytes);
    assert(!TokenCipher::decode_key("").has_value());
    assert(!TokenCipher::decode_key("not base64 !!").has_value());
    assert(!TokenCipher::decode_key("AAAA").has_value());

    return 0;
}
