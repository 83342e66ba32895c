#include "docqa_core/services/compression_service.hpp"

#define ZSTD_STATIC_LINKING_ONLY  // ZSTD_isFrame
#include <zstd.h>

#include <stdexcept>

namespace docqa_core {

namespace {

[[noreturn]] void throw_zstd_error(const std::string& operation, size_t code) {
  throw std::runtime_error("ZSTD " + operation + " failed: " + ZSTD_getErrorName(code));
}

}  // namespace

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }

  std::vector<char> frame(ZSTD_compressBound(data.size()));
  const size_t written =
      ZSTD_compress(frame.data(), frame.size(), data.data(), data.size(), compression_level);
  if (ZSTD_isError(written)) {
    throw_zstd_error("compression", written);
  }
  frame.resize(written);
  return frame;
}

std::string CompressionService::decompress(const std::vector<char>& compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  const unsigned long long content_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw std::runtime_error("Blob is not a zstd frame with a known content size.");
  }
  if (content_size > MAX_DECOMPRESSED_SIZE) {
    throw std::runtime_error("Blob declares " + std::to_string(content_size) +
                             " bytes, above the decompression limit.");
  }

  std::string output(static_cast<size_t>(content_size), '\0');
  const size_t produced = ZSTD_decompress(output.data(), output.size(), compressed_data.data(),
                                          compressed_data.size());
  if (ZSTD_isError(produced)) {
    throw_zstd_error("decompression", produced);
  }
  if (produced != output.size()) {
    throw std::runtime_error("ZSTD decompression produced " + std::to_string(produced) +
                             " bytes, expected " + std::to_string(output.size()));
  }
  return output;
}

bool CompressionService::is_compressed_frame(const std::vector<char>& data) {
  return !data.empty() && ZSTD_isFrame(data.data(), data.size()) != 0;
}

}  // namespace docqa_core
