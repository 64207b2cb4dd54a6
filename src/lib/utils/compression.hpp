#pragma once

#include <cstdint>
#include <string>

namespace skyread {

enum class CompressionType : std::uint8_t { kNone, kGzip, kZstd };

/**
 * One-shot compression of @param to_compress with the Arrow codec for @param type.
 */
std::string Compress(const std::string& to_compress, CompressionType type);

/**
 * Streaming decompression of @param to_decompress. In contrast to one-shot decompression, the decompressed size does
 * not need to be known upfront. Concatenated gzip members are decompressed one after the other.
 * Throws std::runtime_error if the input is corrupt or truncated.
 */
std::string Decompress(const std::string& to_decompress, CompressionType type);

}  // namespace skyread
