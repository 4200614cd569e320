#include "chunknet/crypto/ChaCha20.hpp"
#include "chunknet/crypto/HmacSha256.hpp"
#include "chunknet/crypto/Sha256.hpp"

#include <array>
#include <cassert>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::vector<std::uint8_t> bytes_of(std::string_view text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

}  // namespace

int main() {
    using chunknet::crypto::ChaCha20;
    using chunknet::crypto::HmacSha256;
    using chunknet::crypto::Sha256;

    assert(Sha256::hex_digest(bytes_of("abc")) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(Sha256::hex_digest(bytes_of("")) ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    assert(Sha256::hex_digest(bytes_of("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")) ==
           "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");

    // Incremental updates across block boundaries match the one-shot digest.
    {
        const std::string message(200, 'x');
        Sha256 hasher;
        hasher.update(std::string_view(message).substr(0, 63));
        hasher.update(std::string_view(message).substr(63, 70));
        hasher.update(std::string_view(message).substr(133));
        const auto incremental = hasher.finalize();
        assert(incremental == Sha256::digest(bytes_of(message)));
    }

    // RFC 4231 test case 1.
    {
        const std::vector<std::uint8_t> key(20, 0x0b);
        const auto tag = HmacSha256::compute(key, std::string_view("Hi There"));
        assert(chunknet::crypto::to_hex(tag) ==
               "b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7");
        assert(HmacSha256::verify(key, bytes_of("Hi There"), tag));
        auto tampered = tag;
        tampered[0] ^= 0x01;
        assert(!HmacSha256::verify(key, bytes_of("Hi There"), tampered));
    }

    // RFC 8439 section 2.3.2 block function.
    {
        chunknet::crypto::Key key{};
        for (std::size_t i = 0; i < key.bytes.size(); ++i) {
            key.bytes[i] = static_cast<std::uint8_t>(i);
        }
        chunknet::crypto::Nonce nonce{};
        nonce.bytes = {0x00, 0x00, 0x00, 0x09, 0x00, 0x00, 0x00, 0x4a, 0x00, 0x00, 0x00, 0x00};

        const auto block = ChaCha20::block(key, nonce, 1);
        const std::array<std::uint8_t, 64> expected{
            0x10, 0xf1, 0xe7, 0xe4, 0xd1, 0x3b, 0x59, 0x15, 0x50, 0x0f, 0xdd, 0x1f, 0xa3, 0x20, 0x71, 0xc4,
            0xc7, 0xd1, 0xf4, 0xc7, 0x33, 0xc0, 0x68, 0x03, 0x04, 0x22, 0xaa, 0x9a, 0xc3, 0xd4, 0x6c, 0x4e,
            0xd2, 0x82, 0x64, 0x46, 0x07, 0x9f, 0xaa, 0x09, 0x14, 0xc2, 0xd7, 0x05, 0xd9, 0x8b, 0x02, 0xa2,
            0xb5, 0x12, 0x9c, 0xd1, 0xde, 0x16, 0x4e, 0xb9, 0xcb, 0xd0, 0x83, 0xe8, 0xa2, 0x50, 0x3c, 0x4e};
        assert(block == expected);

        const auto plain = bytes_of("Ladies and Gentlemen of the class of '99: If I could offer you only one tip");
        std::vector<std::uint8_t> cipher;
        ChaCha20::apply(key, nonce, plain, cipher);
        assert(cipher.size() == plain.size());
        assert(cipher != plain);
        std::vector<std::uint8_t> roundtrip;
        ChaCha20::apply(key, nonce, cipher, roundtrip);
        assert(roundtrip == plain);
    }

    return 0;
}
