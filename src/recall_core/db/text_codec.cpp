#include "recall_core/db/text_codec.hpp"

#include <zstd.h>

#include <string>

namespace recall_core {

std::vector<char> TextCodec::encode(std::string_view text, int level) {
  if (text.empty()) {
    return {};
  }
  if (text.size() > MAX_DECODED_BYTES) {
    throw TextCodecError("Text of " + std::to_string(text.size()) +
                         " bytes exceeds the stored text limit of " +
                         std::to_string(MAX_DECODED_BYTES) + " bytes");
  }

  std::vector<char> blob(ZSTD_compressBound(text.size()));
  const size_t written = ZSTD_compress(blob.data(), blob.size(), text.data(), text.size(), level);
  if (ZSTD_isError(written)) {
    throw TextCodecError("zstd encode failed: " + std::string(ZSTD_getErrorName(written)));
  }
  blob.resize(written);
  return blob;
}

std::string TextCodec::decode(const std::vector<char> &blob) {
  if (blob.empty()) {
    return {};
  }

  const unsigned long long expected = ZSTD_getFrameContentSize(blob.data(), blob.size());
  if (expected == ZSTD_CONTENTSIZE_ERROR || expected == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw TextCodecError("Stored fragment text is not a sized zstd frame");
  }
  if (expected > MAX_DECODED_BYTES) {
    throw TextCodecError("Stored fragment text claims " + std::to_string(expected) +
                         " bytes, above the decode limit");
  }

  std::string text(static_cast<size_t>(expected), '\0');
  const size_t read = ZSTD_decompress(text.data(), text.size(), blob.data(), blob.size());
  if (ZSTD_isError(read)) {
    throw TextCodecError("zstd decode failed: " + std::string(ZSTD_getErrorName(read)));
  }
  if (read != expected) {
    throw TextCodecError("zstd decode produced " + std::to_string(read) + " bytes, expected " +
                         std::to_string(expected));
  }
  return text;
}

}  // namespace recall_core
