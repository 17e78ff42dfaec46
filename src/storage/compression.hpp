// File: src/storage/compression.hpp
//
// zstd helpers used by the cold tier. Content is compressed as a single
// zstd frame so the decompressed size can be read back from the frame header.

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace ctxmem {

/// Default zstd level for cold content
constexpr int kDefaultCompressionLevel = 10;

/// Largest content a frame may hold; frame headers claiming more are rejected
constexpr size_t kMaxDecompressedSize = 256 * 1024 * 1024;

/// Compress bytes into one zstd frame
///
/// @param data Raw bytes
/// @param level zstd compression level (1-19)
/// @return Compressed frame, or nullopt if data exceeds kMaxDecompressedSize
///         or zstd reported an error
std::optional<std::string> Compress(const std::string& data,
                                    int level = kDefaultCompressionLevel);

/// Decompress one zstd frame produced by Compress()
///
/// @param frame Compressed bytes
/// @return Original bytes, or nullopt if the frame is corrupt, its size
///         unknown, or its size above kMaxDecompressedSize
std::optional<std::string> Decompress(const std::string& frame);

} // namespace ctxmem
