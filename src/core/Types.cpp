#include "chunknet/Types.hpp"

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace chunknet {

namespace {
constexpr std::size_t kMaxIdentifierLength = 128;
constexpr char kHexDigits[] = "0123456789abcdef";
}  // namespace

std::string random_hex(std::size_t digits) {
    thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(digits);
    for (std::size_t i = 0; i < digits; ++i) {
        out.push_back(kHexDigits[dist(generator)]);
    }
    return out;
}

NodeId generate_node_id() {
    return "node-" + random_hex(6);
}

FileId generate_file_id() {
    return "file-" + random_hex(6);
}

ChunkId make_chunk_id(const FileId& file_id, std::size_t index) {
    std::ostringstream oss;
    oss << file_id << "_chunk_" << std::setw(5) << std::setfill('0') << index;
    return oss.str();
}

bool is_valid_identifier(std::string_view text) {
    if (text.empty() || text.size() > kMaxIdentifierLength) {
        return false;
    }
    if (text == "." || text == "..") {
        return false;
    }
    for (const unsigned char ch : text) {
        if (std::isalnum(ch) == 0 && ch != '_' && ch != '-' && ch != '.') {
            return false;
        }
    }
    return true;
}

}  // namespace chunknet
