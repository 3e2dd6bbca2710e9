#pragma once

#include "sessionflow/gateway/gateway.hpp"
#include "sessionflow/git/workspace.hpp"
#include "sessionflow/session/session.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sessionflow::publish {

struct PublishRequest {
  std::string title;
  // Pre-generated, passed through verbatim apart from issue links.
  std::string description;
  bool draft = false;
  std::optional<std::uint64_t> issue;
};

struct PublishedPr {
  std::uint64_t number = 0;
  std::string url;
  std::string state;
  bool draft = false;
  // "created" or "updated"
  std::string action;
  std::vector<std::uint64_t> linked_issues;
};

enum class PublishErrorCode {
  MissingTitle,
  NotOnBranch,
  NoCommits,
  GitError,
  GatewayError,
};

struct PublishError {
  PublishErrorCode code = PublishErrorCode::GatewayError;
  std::string error;
  std::string message;
};

struct PublishResult {
  std::optional<PublishError> failure;
  PublishedPr pr;
  std::vector<std::string> next_steps;
  std::vector<std::string> warnings;

  [[nodiscard]] bool ok() const { return !failure.has_value(); }
  [[nodiscard]] std::string to_json() const;
};

/// Creates the session PR, or updates the open one already tied to the
/// session or branch.
class PublishEngine {
public:
  PublishEngine(gateway::Gateway &gateway, git::GitWorkspace &workspace);

  [[nodiscard]] PublishResult run(const session::Session &session, const PublishRequest &request);

private:
  gateway::Gateway &gateway_;
  git::GitWorkspace &workspace_;
};

/// True when text already links the issue with close/fix/resolve wording.
[[nodiscard]] bool has_closing_keyword(const std::string &text, std::uint64_t issue);

/// Description plus "Closes #<issue>" and, for a phase, "Part of #<parent>".
[[nodiscard]] std::string compose_body(const std::string &description,
                                       std::optional<std::uint64_t> issue,
                                       std::optional<std::uint64_t> parent);

} // namespace sessionflow::publish
