#pragma once

#include "sessionflow/common/result.hpp"
#include "sessionflow/gateway/types.hpp"

#include <filesystem>
#include <optional>

namespace sessionflow::gateway {

template <typename T> using GatewayResult = common::Result<T, GatewayError>;

/// Issue tracker and PR host operations. Implementations never retry; each
/// call has no side effect beyond the one it names.
class Gateway {
public:
  virtual ~Gateway() = default;

  [[nodiscard]] virtual GatewayResult<PullRequest> get_pr(std::uint64_t number) = 0;
  [[nodiscard]] virtual GatewayResult<Issue> get_issue(std::uint64_t number) = 0;

  /// Posts the comment (when non-empty) and closes the issue.
  [[nodiscard]] virtual GatewayResult<void> close_issue(std::uint64_t number,
                                                        const std::string &comment) = 0;
  [[nodiscard]] virtual GatewayResult<BodyUpdate>
  update_issue_body(std::uint64_t number, const BodyTransform &transform) = 0;

  [[nodiscard]] virtual GatewayResult<void>
  sync_external_board(const std::filesystem::path &ledger_path, const std::string &milestone) = 0;

  /// Most recent PR (any state) whose head is the branch.
  [[nodiscard]] virtual GatewayResult<std::optional<PullRequest>>
  find_pr_for_branch(const std::string &branch) = 0;
  [[nodiscard]] virtual GatewayResult<PullRequest> create_pr(const CreatePullRequest &request) = 0;
  [[nodiscard]] virtual GatewayResult<PullRequest>
  update_pr(std::uint64_t number, const std::string &title, const std::string &body) = 0;
  [[nodiscard]] virtual GatewayResult<BodyUpdate>
  update_pr_body(std::uint64_t number, const BodyTransform &transform) = 0;
  [[nodiscard]] virtual GatewayResult<PullRequest> mark_pr_ready(std::uint64_t number) = 0;
};

} // namespace sessionflow::gateway
