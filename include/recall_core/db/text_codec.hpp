#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace recall_core {

class TextCodecError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/*
Fragment text is stored as a Zstandard frame. Empty text encodes to an empty
blob so that a zero-length column round-trips without touching zstd.
*/
class TextCodec {
 public:
  static constexpr int DEFAULT_LEVEL = 3;
  // Upper bound on stored text. encode() refuses larger input and decode()
  // treats frames claiming more as corrupt.
  static constexpr unsigned long long MAX_DECODED_BYTES = 64ull * 1024 * 1024;

  static std::vector<char> encode(std::string_view text, int level = DEFAULT_LEVEL);
  static std::string decode(const std::vector<char> &blob);
};

}  // namespace recall_core
