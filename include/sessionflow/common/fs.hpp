#pragma once

#include "sessionflow/common/result.hpp"

#include <filesystem>
#include <string>

namespace sessionflow::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Current UTC time as YYYY-MM-DDTHH:MM:SSZ.
[[nodiscard]] std::string now_rfc3339();

[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);

/// Write through a sibling .tmp file and rename it over the target.
[[nodiscard]] Status write_text_file_atomic(const std::filesystem::path &path,
                                            const std::string &content);

} // namespace sessionflow::common
