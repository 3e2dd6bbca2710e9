#pragma once

#include "sessionflow/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sessionflow::common {

struct ProcessOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
  std::optional<std::filesystem::path> working_dir;
};

struct ProcessResult {
  int exit_code = 0;
  bool timed_out = false;
  std::string stdout_text;
  std::string stderr_text;
};

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  /// argv[0] is resolved through PATH.
  [[nodiscard]] virtual Result<ProcessResult> run(const std::vector<std::string> &argv,
                                                  const ProcessOptions &options = {}) = 0;
};

class SubprocessRunner final : public IProcessRunner {
public:
  [[nodiscard]] Result<ProcessResult> run(const std::vector<std::string> &argv,
                                          const ProcessOptions &options = {}) override;
};

[[nodiscard]] std::string join_argv(const std::vector<std::string> &argv);

} // namespace sessionflow::common
