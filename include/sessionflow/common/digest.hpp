#pragma once

#include <string>

namespace sessionflow::common {

/// Lower-case hex SHA-256 of the input bytes.
[[nodiscard]] std::string sha256_hex(const std::string &input);

} // namespace sessionflow::common
