// File: src/storage/compression.cpp
#include "storage/compression.hpp"
#include <iostream>
#include <zstd.h>

namespace ctxmem {

std::optional<std::string> Compress(const std::string& data, int level) {
    if (data.size() > kMaxDecompressedSize) {
        std::cerr << "[Compression] Refusing to compress " << data.size()
                  << " bytes (limit " << kMaxDecompressedSize << ")" << std::endl;
        return std::nullopt;
    }

    size_t max_dst_size = ZSTD_compressBound(data.size());
    std::string compressed(max_dst_size, '\0');

    size_t compressed_size = ZSTD_compress(
        &compressed[0],
        max_dst_size,
        data.data(),
        data.size(),
        level
    );

    if (ZSTD_isError(compressed_size)) {
        std::cerr << "[Compression] ZSTD compression failed: "
                  << ZSTD_getErrorName(compressed_size) << std::endl;
        return std::nullopt;
    }

    compressed.resize(compressed_size);
    return compressed;
}

std::optional<std::string> Decompress(const std::string& frame) {
    unsigned long long original_size = ZSTD_getFrameContentSize(frame.data(), frame.size());
    if (original_size == ZSTD_CONTENTSIZE_ERROR || original_size == ZSTD_CONTENTSIZE_UNKNOWN) {
        std::cerr << "[Compression] Not a zstd frame with known size" << std::endl;
        return std::nullopt;
    }
    if (original_size > kMaxDecompressedSize) {
        std::cerr << "[Compression] Frame claims " << original_size
                  << " bytes (limit " << kMaxDecompressedSize << ")" << std::endl;
        return std::nullopt;
    }

    std::string decompressed(static_cast<size_t>(original_size), '\0');
    if (original_size == 0) {
        return decompressed;
    }

    size_t result = ZSTD_decompress(
        &decompressed[0],
        decompressed.size(),
        frame.data(),
        frame.size()
    );

    if (ZSTD_isError(result)) {
        std::cerr << "[Compression] ZSTD decompression failed: "
                  << ZSTD_getErrorName(result) << std::endl;
        return std::nullopt;
    }

    decompressed.resize(result);
    return decompressed;
}

} // namespace ctxmem
