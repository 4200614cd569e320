#include "chunknet/encoding/Base64.hpp"

#include <array>
#include <stdexcept>

namespace chunknet::encoding {

namespace {

constexpr char kStandardAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char kUrlSafeAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

const char* alphabet_chars(Base64Alphabet alphabet) {
    return alphabet == Base64Alphabet::UrlSafe ? kUrlSafeAlphabet : kStandardAlphabet;
}

std::array<int, 256> build_decode_table(Base64Alphabet alphabet) {
    std::array<int, 256> table{};
    table.fill(-1);
    const auto* chars = alphabet_chars(alphabet);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(chars[i])] = i;
    }
    return table;
}

}  // namespace

std::string base64_encode(std::span<const std::uint8_t> input, Base64Alphabet alphabet) {
    const auto* chars = alphabet_chars(alphabet);
    std::string output;
    output.reserve(((input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 2 < input.size()) {
        const auto triple = (static_cast<std::uint32_t>(input[i]) << 16) |
                            (static_cast<std::uint32_t>(input[i + 1]) << 8) |
                            static_cast<std::uint32_t>(input[i + 2]);
        output.push_back(chars[(triple >> 18) & 0x3F]);
        output.push_back(chars[(triple >> 12) & 0x3F]);
        output.push_back(chars[(triple >> 6) & 0x3F]);
        output.push_back(chars[triple & 0x3F]);
        i += 3;
    }

    if (i < input.size()) {
        std::uint32_t triple = static_cast<std::uint32_t>(input[i]) << 16;
        const bool two_left = i + 1 < input.size();
        if (two_left) {
            triple |= static_cast<std::uint32_t>(input[i + 1]) << 8;
        }
        output.push_back(chars[(triple >> 18) & 0x3F]);
        output.push_back(chars[(triple >> 12) & 0x3F]);
        output.push_back(two_left ? chars[(triple >> 6) & 0x3F] : '=');
        output.push_back('=');
    }

    return output;
}

std::vector<std::uint8_t> base64_decode(std::string_view input, Base64Alphabet alphabet) {
    if (input.size() % 4 != 0) {
        throw std::invalid_argument("invalid base64 input length");
    }

    const auto table = build_decode_table(alphabet);
    std::vector<std::uint8_t> output;
    output.reserve((input.size() / 4) * 3);

    for (std::size_t i = 0; i < input.size(); i += 4) {
        const bool last_group = i + 4 == input.size();
        const bool pad3 = input[i + 3] == '=';
        const bool pad2 = input[i + 2] == '=';
        if ((pad3 || pad2) && !last_group) {
            throw std::invalid_argument("base64 padding before end of input");
        }
        if (pad2 && !pad3) {
            throw std::invalid_argument("invalid base64 padding");
        }

        const auto a = table[static_cast<unsigned char>(input[i])];
        const auto b = table[static_cast<unsigned char>(input[i + 1])];
        const auto c = pad2 ? 0 : table[static_cast<unsigned char>(input[i + 2])];
        const auto d = pad3 ? 0 : table[static_cast<unsigned char>(input[i + 3])];
        if (a < 0 || b < 0 || c < 0 || d < 0) {
            throw std::invalid_argument("invalid base64 character");
        }

        const auto triple = (static_cast<std::uint32_t>(a) << 18) | (static_cast<std::uint32_t>(b) << 12) |
                            (static_cast<std::uint32_t>(c) << 6) | static_cast<std::uint32_t>(d);
        output.push_back(static_cast<std::uint8_t>((triple >> 16) & 0xFF));
        if (!pad2) {
            output.push_back(static_cast<std::uint8_t>((triple >> 8) & 0xFF));
        }
        if (!pad3) {
            output.push_back(static_cast<std::uint8_t>(triple & 0xFF));
        }
    }

    return output;
}

}  // namespace chunknet::encoding
