#include "chunknet/Types.hpp"
#include "chunknet/daemon/StructuredLogger.hpp"
#include "chunknet/storage/ChunkSplitter.hpp"

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace {

chunknet::ChunkData pattern(std::size_t size) {
    chunknet::ChunkData data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
    }
    return data;
}

void write_all(const std::filesystem::path& path, const chunknet::ChunkData& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

chunknet::ChunkData read_all(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return chunknet::ChunkData(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

int main() {
    using namespace chunknet::storage;
    chunknet::daemon::StructuredLogger::instance().set_enabled(false);

    const auto root = std::filesystem::temp_directory_path() / ("chunknet_splitter_" + chunknet::random_hex(8));
    std::filesystem::create_directories(root);

    assert(chunk_file_name(0) == "chunk_00000");
    assert(chunk_file_name(42) == "chunk_00042");

    // 2.5 chunks worth of data.
    const auto data = pattern(2500);
    const auto input = root / "input.bin";
    write_all(input, data);

    const auto pieces = split_file(input, 1000, root / "pieces");
    assert(pieces.size() == 3);
    assert(pieces[0].filename() == "chunk_00000");
    assert(pieces[2].filename() == "chunk_00002");
    assert(std::filesystem::file_size(pieces[0]) == 1000);
    assert(std::filesystem::file_size(pieces[2]) == 500);

    // Foreign files in the folder are ignored, zero-length chunk files contribute nothing.
    write_all(root / "pieces" / "notes.txt", pattern(10));
    write_all(root / "pieces" / "chunk_00003", {});

    const auto output = root / "out" / "restored.bin";
    const auto written = reassemble_file(output, root / "pieces");
    assert(written == data.size());
    assert(read_all(output) == data);

    // Exact multiple of the chunk size.
    const auto exact = root / "exact.bin";
    write_all(exact, pattern(2000));
    assert(split_file(exact, 1000, root / "exact").size() == 2);

    // Empty input yields no chunks.
    const auto empty = root / "empty.bin";
    write_all(empty, {});
    assert(split_file(empty, 1000, root / "empty").empty());

    bool threw = false;
    try {
        (void)split_file(input, 0, root / "zero");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)split_file(root / "missing.bin", 1000, root / "missing");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    // In-memory helpers agree with the file variants.
    const auto in_memory = split_bytes(data, 1000);
    assert(in_memory.size() == 3);
    assert(in_memory[2].size() == 500);
    assert(reassemble_bytes(in_memory) == data);
    assert(split_bytes(chunknet::ChunkData{}, 10).empty());

    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    return 0;
}
