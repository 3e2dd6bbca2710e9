#pragma once

#include "sessionflow/common/json_util.hpp"
#include "sessionflow/common/process.hpp"
#include "sessionflow/config/schema.hpp"
#include "sessionflow/gateway/gateway.hpp"
#include "sessionflow/http/client.hpp"

namespace sessionflow::gateway {

/// GitHub REST (v3) and GraphQL backed gateway. Board sync shells out to the
/// configured command.
class GitHubGateway final : public Gateway {
public:
  GitHubGateway(http::HttpClient &http, common::IProcessRunner &runner, config::Config config,
                std::string repository);

  [[nodiscard]] GatewayResult<PullRequest> get_pr(std::uint64_t number) override;
  [[nodiscard]] GatewayResult<Issue> get_issue(std::uint64_t number) override;
  [[nodiscard]] GatewayResult<void> close_issue(std::uint64_t number,
                                                const std::string &comment) override;
  [[nodiscard]] GatewayResult<BodyUpdate>
  update_issue_body(std::uint64_t number, const BodyTransform &transform) override;
  [[nodiscard]] GatewayResult<void> sync_external_board(const std::filesystem::path &ledger_path,
                                                        const std::string &milestone) override;
  [[nodiscard]] GatewayResult<std::optional<PullRequest>>
  find_pr_for_branch(const std::string &branch) override;
  [[nodiscard]] GatewayResult<PullRequest> create_pr(const CreatePullRequest &request) override;
  [[nodiscard]] GatewayResult<PullRequest> update_pr(std::uint64_t number, const std::string &title,
                                                     const std::string &body) override;
  [[nodiscard]] GatewayResult<BodyUpdate>
  update_pr_body(std::uint64_t number, const BodyTransform &transform) override;
  [[nodiscard]] GatewayResult<PullRequest> mark_pr_ready(std::uint64_t number) override;

  [[nodiscard]] const std::string &repository() const { return repository_; }

private:
  [[nodiscard]] http::Headers headers() const;
  [[nodiscard]] std::string repo_url(const std::string &suffix) const;

  [[nodiscard]] GatewayResult<common::JsonObject> fetch_object(const std::string &call,
                                                               const std::string &url,
                                                               const std::string &resource);
  [[nodiscard]] GatewayResult<common::JsonObject> send_json(const std::string &call,
                                                            const std::string &method,
                                                            const std::string &url,
                                                            const std::string &body,
                                                            const std::string &resource,
                                                            bool body_update);
  [[nodiscard]] GatewayResult<BodyUpdate> update_body(const std::string &url,
                                                      const std::string &resource,
                                                      const BodyTransform &transform);

  http::HttpClient &http_;
  common::IProcessRunner &runner_;
  config::Config config_;
  std::string repository_;
};

/// Maps a transport failure or non-2xx response to the gateway taxonomy.
/// Conflict statuses (409, 412, 422) only apply to body updates.
[[nodiscard]] GatewayError map_http_error(const http::HttpResponse &response,
                                          const std::string &resource, bool body_update);

[[nodiscard]] std::optional<PullRequest> parse_pull_request(const std::string &json);
[[nodiscard]] std::optional<Issue> parse_issue(const std::string &json);

/// Substitutes {ledger} and {milestone} in every argument.
[[nodiscard]] std::vector<std::string>
expand_sync_command(const std::vector<std::string> &command_template,
                    const std::string &ledger_path, const std::string &milestone);

} // namespace sessionflow::gateway
