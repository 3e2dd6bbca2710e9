#pragma once

#include "sessionflow/common/process.hpp"
#include "sessionflow/config/schema.hpp"
#include "sessionflow/gateway/gateway.hpp"
#include "sessionflow/git/workspace.hpp"
#include "sessionflow/http/client.hpp"

#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sessionflow::testing {

config::Config mock_config();

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::string read_file(const std::string &name) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

/// In-memory issue tracker and PR host. Counts every mutating call.
class FakeGateway final : public gateway::Gateway {
public:
  std::map<std::uint64_t, gateway::PullRequest> prs;
  std::map<std::uint64_t, gateway::Issue> issues;
  std::map<std::string, std::uint64_t> branch_prs;

  std::set<std::uint64_t> conflicting_issue_bodies;
  std::set<std::uint64_t> conflicting_pr_bodies;
  std::set<std::uint64_t> denied_closes;
  std::optional<gateway::GatewayError> pr_fetch_error;
  std::optional<std::string> sync_failure;
  bool fail_mark_ready = false;

  struct Comment {
    std::uint64_t issue = 0;
    std::string text;
  };
  std::vector<Comment> comments;
  std::vector<std::pair<std::string, std::string>> syncs;

  std::size_t close_calls = 0;
  std::size_t issue_body_writes = 0;
  std::size_t pr_body_writes = 0;
  std::size_t create_calls = 0;
  std::size_t update_calls = 0;
  std::size_t ready_calls = 0;
  std::uint64_t next_pr_number = 100;

  [[nodiscard]] std::size_t mutating_calls() const;

  [[nodiscard]] gateway::GatewayResult<gateway::PullRequest> get_pr(std::uint64_t number) override;
  [[nodiscard]] gateway::GatewayResult<gateway::Issue> get_issue(std::uint64_t number) override;
  [[nodiscard]] gateway::GatewayResult<void> close_issue(std::uint64_t number,
                                                         const std::string &comment) override;
  [[nodiscard]] gateway::GatewayResult<gateway::BodyUpdate>
  update_issue_body(std::uint64_t number, const gateway::BodyTransform &transform) override;
  [[nodiscard]] gateway::GatewayResult<void>
  sync_external_board(const std::filesystem::path &ledger_path,
                      const std::string &milestone) override;
  [[nodiscard]] gateway::GatewayResult<std::optional<gateway::PullRequest>>
  find_pr_for_branch(const std::string &branch) override;
  [[nodiscard]] gateway::GatewayResult<gateway::PullRequest>
  create_pr(const gateway::CreatePullRequest &request) override;
  [[nodiscard]] gateway::GatewayResult<gateway::PullRequest>
  update_pr(std::uint64_t number, const std::string &title, const std::string &body) override;
  [[nodiscard]] gateway::GatewayResult<gateway::BodyUpdate>
  update_pr_body(std::uint64_t number, const gateway::BodyTransform &transform) override;
  [[nodiscard]] gateway::GatewayResult<gateway::PullRequest>
  mark_pr_ready(std::uint64_t number) override;
};

class FakeGitWorkspace final : public git::GitWorkspace {
public:
  std::string branch = "feature/work";
  std::string base = "main";
  std::uint64_t ahead = 1;
  std::string slug = "acme/widgets";
  std::optional<std::string> failure;

  [[nodiscard]] common::Result<std::string> current_branch() override;
  [[nodiscard]] common::Result<std::string> default_branch() override;
  [[nodiscard]] common::Result<std::uint64_t> commits_ahead(const std::string &base_branch) override;
  [[nodiscard]] common::Result<std::string> remote_slug() override;
};

/// Returns scripted results in order and records every argv.
class FakeProcessRunner final : public common::IProcessRunner {
public:
  std::deque<common::Result<common::ProcessResult>> results;
  std::vector<std::vector<std::string>> calls;
  std::vector<common::ProcessOptions> options;

  void push_output(std::string stdout_text, int exit_code = 0);

  [[nodiscard]] common::Result<common::ProcessResult>
  run(const std::vector<std::string> &argv, const common::ProcessOptions &opts) override;
};

/// Replays queued responses; records method, url, headers and body of each call.
class MockHttpClient final : public http::HttpClient {
public:
  struct Call {
    std::string method;
    std::string url;
    http::Headers headers;
    std::string body;
  };

  std::deque<http::HttpResponse> responses;
  std::vector<Call> calls;

  void push(std::uint16_t status, std::string body);

  [[nodiscard]] http::HttpResponse get(const std::string &url, const http::Headers &headers,
                                       std::uint64_t timeout_ms) override;
  [[nodiscard]] http::HttpResponse post_json(const std::string &url, const http::Headers &headers,
                                             const std::string &body,
                                             std::uint64_t timeout_ms) override;
  [[nodiscard]] http::HttpResponse patch_json(const std::string &url,
                                              const http::Headers &headers,
                                              const std::string &body,
                                              std::uint64_t timeout_ms) override;

private:
  http::HttpResponse next(Call call);
};

} // namespace sessionflow::testing
