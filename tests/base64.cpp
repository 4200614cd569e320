#include "chunknet/encoding/Base64.hpp"

#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::vector<std::uint8_t> bytes_of(std::string_view text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

bool decode_throws(std::string_view text) {
    try {
        (void)chunknet::encoding::base64_decode(text);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    using chunknet::encoding::Base64Alphabet;
    using chunknet::encoding::base64_decode;
    using chunknet::encoding::base64_encode;

    assert(base64_encode(bytes_of("")).empty());
    assert(base64_encode(bytes_of("f")) == "Zg==");
    assert(base64_encode(bytes_of("fo")) == "Zm8=");
    assert(base64_encode(bytes_of("foo")) == "Zm9v");
    assert(base64_encode(bytes_of("foobar")) == "Zm9vYmFy");

    assert(base64_decode("Zm9vYmE=") == bytes_of("fooba"));
    assert(base64_decode("").empty());

    const std::vector<std::uint8_t> high{0xfb, 0xff};
    assert(base64_encode(high) == "+/8=");
    assert(base64_encode(high, Base64Alphabet::UrlSafe) == "-_8=");
    assert(base64_decode("-_8=", Base64Alphabet::UrlSafe) == high);

    assert(decode_throws("Zm9"));
    assert(decode_throws("Zm=v"));
    assert(decode_throws("Zm9*"));
    assert(decode_throws("-_8="));

    return 0;
}
