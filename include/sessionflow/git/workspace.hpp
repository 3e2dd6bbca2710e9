#pragma once

#include "sessionflow/common/process.hpp"
#include "sessionflow/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace sessionflow::git {

class GitWorkspace {
public:
  virtual ~GitWorkspace() = default;

  /// Empty when HEAD is detached.
  [[nodiscard]] virtual common::Result<std::string> current_branch() = 0;
  [[nodiscard]] virtual common::Result<std::string> default_branch() = 0;
  [[nodiscard]] virtual common::Result<std::uint64_t> commits_ahead(const std::string &base) = 0;
  /// "owner/name" of the origin remote.
  [[nodiscard]] virtual common::Result<std::string> remote_slug() = 0;
};

class GitCli final : public GitWorkspace {
public:
  GitCli(common::IProcessRunner &runner, std::filesystem::path repo_dir,
         std::string configured_base = "main");

  [[nodiscard]] common::Result<std::string> current_branch() override;
  [[nodiscard]] common::Result<std::string> default_branch() override;
  [[nodiscard]] common::Result<std::uint64_t> commits_ahead(const std::string &base) override;
  [[nodiscard]] common::Result<std::string> remote_slug() override;

private:
  [[nodiscard]] common::Result<common::ProcessResult> git(std::vector<std::string> args,
                                                          bool allow_failure);

  common::IProcessRunner &runner_;
  std::filesystem::path repo_dir_;
  std::string configured_base_;
};

/// Extracts "owner/name" from https, ssh and scp-style GitHub remote URLs.
[[nodiscard]] std::optional<std::string> parse_remote_slug(const std::string &remote_url);

} // namespace sessionflow::git
