#include "compression.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

#include <arrow/util/compression.h>
#include <magic_enum/magic_enum.hpp>

#include "assert.hpp"

namespace skyread {

namespace {

constexpr size_t kMinimumDecompressionBufferBytes = 4096;

arrow::Compression::type ToArrowCompression(CompressionType type) {
  switch (type) {
    case CompressionType::kNone:
      return arrow::Compression::type::UNCOMPRESSED;
    case CompressionType::kGzip:
      return arrow::Compression::type::GZIP;
    case CompressionType::kZstd:
      return arrow::Compression::type::ZSTD;
    default:
      Fail("Unexpected compression type.");
  }
}

std::unique_ptr<arrow::util::Codec> CreateCodec(CompressionType type) {
  auto codec_result = arrow::util::Codec::Create(ToArrowCompression(type));
  Assert(codec_result.ok(),
         "Could not create codec for " + std::string(magic_enum::enum_name(type)) + ": " +
             codec_result.status().ToString());
  return std::move(*codec_result);
}

}  // namespace

std::string Compress(const std::string& to_compress, CompressionType type) {
  if (type == CompressionType::kNone) {
    return to_compress;
  }

  const auto codec = CreateCodec(type);
  const auto* const to_compress_data = reinterpret_cast<const uint8_t*>(to_compress.data());
  const int64_t max_compression_size = codec->MaxCompressedLen(to_compress.size(), to_compress_data);

  std::string output;
  output.resize(max_compression_size);
  auto* output_data = reinterpret_cast<uint8_t*>(output.data());

  const auto compression_result =
      codec->Compress(to_compress.size(), to_compress_data, max_compression_size, output_data);
  Assert(compression_result.ok(), "Could not compress data: " + compression_result.status().ToString());
  output.resize(*compression_result);

  return output;
}

std::string Decompress(const std::string& to_decompress, CompressionType type) {
  if (type == CompressionType::kNone || to_decompress.empty()) {
    return to_decompress;
  }

  const auto codec = CreateCodec(type);
  auto decompressor_result = codec->MakeDecompressor();
  Assert(decompressor_result.ok(), "Codec does not support streaming decompression.");
  const std::shared_ptr<arrow::util::Decompressor> decompressor = *decompressor_result;

  const auto* input = reinterpret_cast<const uint8_t*>(to_decompress.data());
  int64_t input_left = static_cast<int64_t>(to_decompress.size());

  std::string output;
  output.resize(std::max(kMinimumDecompressionBufferBytes, to_decompress.size() * 4));
  size_t output_size = 0;

  while (true) {
    auto* output_data = reinterpret_cast<uint8_t*>(output.data()) + output_size;
    const auto output_left = static_cast<int64_t>(output.size() - output_size);
    const auto decompress_result = decompressor->Decompress(input_left, input, output_left, output_data);
    if (!decompress_result.ok()) {
      throw std::runtime_error("Could not decompress data: " + decompress_result.status().ToString());
    }

    input += decompress_result->bytes_read;
    input_left -= decompress_result->bytes_read;
    output_size += decompress_result->bytes_written;

    if (decompressor->IsFinished()) {
      if (input_left == 0) {
        break;
      }
      // Another gzip member follows.
      const auto reset_status = decompressor->Reset();
      Assert(reset_status.ok(), "Could not reset decompressor: " + reset_status.ToString());
      continue;
    }

    if (decompress_result->need_more_output) {
      output.resize(output.size() * 2);
      continue;
    }

    if (input_left == 0 || (decompress_result->bytes_read == 0 && decompress_result->bytes_written == 0)) {
      throw std::runtime_error("Could not decompress data: Input is truncated.");
    }
  }

  output.resize(output_size);
  return output;
}

}  // namespace skyread
