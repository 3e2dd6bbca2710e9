#include "sessionflow/common/digest.hpp"

#include <openssl/sha.h>

#include <array>

namespace sessionflow::common {

std::string sha256_hex(const std::string &input) {
  std::array<unsigned char, SHA256_DIGEST_LENGTH> digest{};
  SHA256(reinterpret_cast<const unsigned char *>(input.data()), input.size(), digest.data());

  static constexpr char kHex[] = "0123456789abcdef";
  std::string output;
  output.reserve(digest.size() * 2);
  for (const unsigned char byte : digest) {
    output.push_back(kHex[byte >> 4]);
    output.push_back(kHex[byte & 0x0F]);
  }
  return output;
}

} // namespace sessionflow::common
