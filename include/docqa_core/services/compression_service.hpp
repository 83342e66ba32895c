#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docqa_core {

/**
 * @brief Zstandard framing for blobs written to the disk cache.
 */
class CompressionService {
 public:
  // Frames that claim to inflate past this size are rejected
  static constexpr size_t MAX_DECOMPRESSED_SIZE = size_t{1} << 30;

  /**
   * @brief Compresses a block of data.
   * @param data The data to compress.
   * @param compression_level The zstd compression level (default is 3).
   * @return The compressed frame; empty input yields an empty frame.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Decompresses a frame produced by compress().
   * @throws std::runtime_error if the data is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char>& compressed_data);

  static bool is_compressed_frame(const std::vector<char>& data);
};

}  // namespace docqa_core
