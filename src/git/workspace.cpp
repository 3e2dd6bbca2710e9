#include "sessionflow/git/workspace.hpp"

#include "sessionflow/common/fs.hpp"

#include <charconv>

namespace sessionflow::git {

GitCli::GitCli(common::IProcessRunner &runner, std::filesystem::path repo_dir,
               std::string configured_base)
    : runner_(runner), repo_dir_(std::move(repo_dir)),
      configured_base_(std::move(configured_base)) {}

common::Result<common::ProcessResult> GitCli::git(std::vector<std::string> args,
                                                  const bool allow_failure) {
  args.insert(args.begin(), "git");
  return runner_.run(args, common::ProcessOptions{
                               .allow_failure = allow_failure,
                               .timeout = std::chrono::milliseconds(30'000),
                               .working_dir = repo_dir_,
                           });
}

common::Result<std::string> GitCli::current_branch() {
  auto result = git({"symbolic-ref", "--quiet", "--short", "HEAD"}, true);
  if (!result.ok()) {
    return common::Result<std::string>::failure(result.error());
  }
  if (result.value().exit_code != 0) {
    return common::Result<std::string>::success("");
  }
  return common::Result<std::string>::success(common::trim(result.value().stdout_text));
}

common::Result<std::string> GitCli::default_branch() {
  auto result = git({"symbolic-ref", "--quiet", "--short", "refs/remotes/origin/HEAD"}, true);
  if (!result.ok()) {
    return common::Result<std::string>::failure(result.error());
  }
  if (result.value().exit_code == 0) {
    std::string ref = common::trim(result.value().stdout_text);
    if (common::starts_with(ref, "origin/")) {
      ref = ref.substr(7);
    }
    if (!ref.empty()) {
      return common::Result<std::string>::success(std::move(ref));
    }
  }
  if (!common::trim(configured_base_).empty()) {
    return common::Result<std::string>::success(common::trim(configured_base_));
  }
  return common::Result<std::string>::success("main");
}

common::Result<std::uint64_t> GitCli::commits_ahead(const std::string &base) {
  auto result = git({"rev-list", "--count", "origin/" + base + "..HEAD"}, false);
  if (!result.ok()) {
    return common::Result<std::uint64_t>::failure("git rev-list failed: " +
                                                  common::trim(result.error()));
  }
  const std::string text = common::trim(result.value().stdout_text);
  std::uint64_t count = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), count);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return common::Result<std::uint64_t>::failure("unexpected git rev-list output: " + text);
  }
  return common::Result<std::uint64_t>::success(count);
}

common::Result<std::string> GitCli::remote_slug() {
  auto result = git({"remote", "get-url", "origin"}, false);
  if (!result.ok()) {
    return common::Result<std::string>::failure("no origin remote: " +
                                                common::trim(result.error()));
  }
  const std::string url = common::trim(result.value().stdout_text);
  auto slug = parse_remote_slug(url);
  if (!slug.has_value()) {
    return common::Result<std::string>::failure("cannot derive owner/name from remote " + url);
  }
  return common::Result<std::string>::success(std::move(*slug));
}

std::optional<std::string> parse_remote_slug(const std::string &remote_url) {
  std::string url = common::trim(remote_url);
  if (url.empty()) {
    return std::nullopt;
  }
  if (url.size() > 4 && url.compare(url.size() - 4, 4, ".git") == 0) {
    url.resize(url.size() - 4);
  }
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }

  std::string path;
  if (const auto scheme = url.find("://"); scheme != std::string::npos) {
    const auto slash = url.find('/', scheme + 3);
    if (slash == std::string::npos) {
      return std::nullopt;
    }
    path = url.substr(slash + 1);
  } else if (const auto colon = url.find(':'); colon != std::string::npos) {
    // git@github.com:owner/name
    path = url.substr(colon + 1);
  } else {
    return std::nullopt;
  }

  const auto separator = path.rfind('/');
  if (separator == std::string::npos || separator == 0 || separator + 1 >= path.size()) {
    return std::nullopt;
  }
  const auto owner_start = path.rfind('/', separator - 1);
  const std::string owner =
      owner_start == std::string::npos ? path.substr(0, separator)
                                       : path.substr(owner_start + 1, separator - owner_start - 1);
  if (owner.empty()) {
    return std::nullopt;
  }
  return owner + "/" + path.substr(separator + 1);
}

} // namespace sessionflow::git
