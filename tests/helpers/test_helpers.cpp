#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>

namespace sessionflow::testing {

namespace {

gateway::GatewayError not_found(const std::string &resource) {
  return gateway::GatewayError{.code = gateway::GatewayErrorCode::NotFound,
                               .status = 404,
                               .resource = resource,
                               .message = "Not Found"};
}

gateway::GatewayError conflict(const std::string &resource) {
  return gateway::GatewayError{.code = gateway::GatewayErrorCode::Conflict,
                               .status = 409,
                               .resource = resource,
                               .message = "body changed since it was read"};
}

std::string issue_ref(const std::uint64_t number) { return "issue #" + std::to_string(number); }
std::string pr_ref(const std::uint64_t number) { return "pull request #" + std::to_string(number); }

} // namespace

config::Config mock_config() {
  config::Config config;
  config.github.repository = "acme/widgets";
  config.github.token = "test-token";
  config.observability.backend = "none";
  return config;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("sessionflow-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::string TempWorkspace::read_file(const std::string &name) const {
  std::ifstream in(path_ / name, std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

std::size_t FakeGateway::mutating_calls() const {
  return close_calls + issue_body_writes + pr_body_writes + create_calls + update_calls +
         ready_calls + comments.size();
}

gateway::GatewayResult<gateway::PullRequest> FakeGateway::get_pr(const std::uint64_t number) {
  if (pr_fetch_error.has_value()) {
    return gateway::GatewayResult<gateway::PullRequest>::failure(*pr_fetch_error);
  }
  const auto it = prs.find(number);
  if (it == prs.end()) {
    return gateway::GatewayResult<gateway::PullRequest>::failure(not_found(pr_ref(number)));
  }
  return gateway::GatewayResult<gateway::PullRequest>::success(it->second);
}

gateway::GatewayResult<gateway::Issue> FakeGateway::get_issue(const std::uint64_t number) {
  const auto it = issues.find(number);
  if (it == issues.end()) {
    return gateway::GatewayResult<gateway::Issue>::failure(not_found(issue_ref(number)));
  }
  return gateway::GatewayResult<gateway::Issue>::success(it->second);
}

gateway::GatewayResult<void> FakeGateway::close_issue(const std::uint64_t number,
                                                      const std::string &comment) {
  const auto it = issues.find(number);
  if (it == issues.end()) {
    return gateway::GatewayResult<void>::failure(not_found(issue_ref(number)));
  }
  if (denied_closes.contains(number)) {
    return gateway::GatewayResult<void>::failure(
        gateway::GatewayError{.code = gateway::GatewayErrorCode::PermissionDenied,
                              .status = 403,
                              .resource = issue_ref(number),
                              .message = "Resource not accessible by integration"});
  }
  ++close_calls;
  if (!comment.empty()) {
    comments.push_back(Comment{.issue = number, .text = comment});
  }
  it->second.state = "closed";
  return gateway::GatewayResult<void>::success();
}

gateway::GatewayResult<gateway::BodyUpdate>
FakeGateway::update_issue_body(const std::uint64_t number,
                               const gateway::BodyTransform &transform) {
  const auto it = issues.find(number);
  if (it == issues.end()) {
    return gateway::GatewayResult<gateway::BodyUpdate>::failure(not_found(issue_ref(number)));
  }
  std::string updated = transform(it->second.body);
  if (updated == it->second.body) {
    return gateway::GatewayResult<gateway::BodyUpdate>::success(
        gateway::BodyUpdate{.changed = false, .body = it->second.body});
  }
  if (conflicting_issue_bodies.contains(number)) {
    return gateway::GatewayResult<gateway::BodyUpdate>::failure(conflict(issue_ref(number)));
  }
  ++issue_body_writes;
  it->second.body = updated;
  return gateway::GatewayResult<gateway::BodyUpdate>::success(
      gateway::BodyUpdate{.changed = true, .body = std::move(updated)});
}

gateway::GatewayResult<void>
FakeGateway::sync_external_board(const std::filesystem::path &ledger_path,
                                 const std::string &milestone) {
  syncs.emplace_back(ledger_path.string(), milestone);
  if (sync_failure.has_value()) {
    return gateway::GatewayResult<void>::failure(
        gateway::GatewayError{.code = gateway::GatewayErrorCode::ExternalSyncError,
                              .status = 0,
                              .resource = "board " + milestone,
                              .message = *sync_failure});
  }
  return gateway::GatewayResult<void>::success();
}

gateway::GatewayResult<std::optional<gateway::PullRequest>>
FakeGateway::find_pr_for_branch(const std::string &branch) {
  using FindResult = gateway::GatewayResult<std::optional<gateway::PullRequest>>;
  const auto it = branch_prs.find(branch);
  if (it == branch_prs.end() || !prs.contains(it->second)) {
    return FindResult::success(std::nullopt);
  }
  return FindResult::success(prs.at(it->second));
}

gateway::GatewayResult<gateway::PullRequest>
FakeGateway::create_pr(const gateway::CreatePullRequest &request) {
  ++create_calls;
  gateway::PullRequest pr;
  pr.number = next_pr_number++;
  pr.state = "open";
  pr.draft = request.draft;
  pr.title = request.title;
  pr.body = request.body;
  pr.head_branch = request.head;
  pr.url = "https://github.com/acme/widgets/pull/" + std::to_string(pr.number);
  pr.node_id = "PR_node_" + std::to_string(pr.number);
  prs[pr.number] = pr;
  branch_prs[request.head] = pr.number;
  return gateway::GatewayResult<gateway::PullRequest>::success(pr);
}

gateway::GatewayResult<gateway::PullRequest> FakeGateway::update_pr(const std::uint64_t number,
                                                                    const std::string &title,
                                                                    const std::string &body) {
  const auto it = prs.find(number);
  if (it == prs.end()) {
    return gateway::GatewayResult<gateway::PullRequest>::failure(not_found(pr_ref(number)));
  }
  ++update_calls;
  it->second.title = title;
  it->second.body = body;
  return gateway::GatewayResult<gateway::PullRequest>::success(it->second);
}

gateway::GatewayResult<gateway::BodyUpdate>
FakeGateway::update_pr_body(const std::uint64_t number, const gateway::BodyTransform &transform) {
  const auto it = prs.find(number);
  if (it == prs.end()) {
    return gateway::GatewayResult<gateway::BodyUpdate>::failure(not_found(pr_ref(number)));
  }
  std::string updated = transform(it->second.body);
  if (updated == it->second.body) {
    return gateway::GatewayResult<gateway::BodyUpdate>::success(
        gateway::BodyUpdate{.changed = false, .body = it->second.body});
  }
  if (conflicting_pr_bodies.contains(number)) {
    return gateway::GatewayResult<gateway::BodyUpdate>::failure(conflict(pr_ref(number)));
  }
  ++pr_body_writes;
  it->second.body = updated;
  return gateway::GatewayResult<gateway::BodyUpdate>::success(
      gateway::BodyUpdate{.changed = true, .body = std::move(updated)});
}

gateway::GatewayResult<gateway::PullRequest>
FakeGateway::mark_pr_ready(const std::uint64_t number) {
  const auto it = prs.find(number);
  if (it == prs.end()) {
    return gateway::GatewayResult<gateway::PullRequest>::failure(not_found(pr_ref(number)));
  }
  if (fail_mark_ready) {
    return gateway::GatewayResult<gateway::PullRequest>::failure(
        gateway::GatewayError{.code = gateway::GatewayErrorCode::ApiError,
                              .status = 200,
                              .resource = pr_ref(number),
                              .message = "GraphQL error"});
  }
  if (it->second.draft) {
    ++ready_calls;
    it->second.draft = false;
  }
  return gateway::GatewayResult<gateway::PullRequest>::success(it->second);
}

common::Result<std::string> FakeGitWorkspace::current_branch() {
  if (failure.has_value()) {
    return common::Result<std::string>::failure(*failure);
  }
  return common::Result<std::string>::success(branch);
}

common::Result<std::string> FakeGitWorkspace::default_branch() {
  if (failure.has_value()) {
    return common::Result<std::string>::failure(*failure);
  }
  return common::Result<std::string>::success(base);
}

common::Result<std::uint64_t> FakeGitWorkspace::commits_ahead(const std::string &) {
  if (failure.has_value()) {
    return common::Result<std::uint64_t>::failure(*failure);
  }
  return common::Result<std::uint64_t>::success(ahead);
}

common::Result<std::string> FakeGitWorkspace::remote_slug() {
  if (failure.has_value()) {
    return common::Result<std::string>::failure(*failure);
  }
  return common::Result<std::string>::success(slug);
}

void FakeProcessRunner::push_output(std::string stdout_text, const int exit_code) {
  common::ProcessResult result;
  result.exit_code = exit_code;
  result.stdout_text = std::move(stdout_text);
  results.push_back(common::Result<common::ProcessResult>::success(std::move(result)));
}

common::Result<common::ProcessResult>
FakeProcessRunner::run(const std::vector<std::string> &argv, const common::ProcessOptions &opts) {
  calls.push_back(argv);
  options.push_back(opts);
  if (results.empty()) {
    return common::Result<common::ProcessResult>::failure("no scripted result for " +
                                                          common::join_argv(argv));
  }
  auto result = std::move(results.front());
  results.pop_front();
  if (result.ok() && result.value().exit_code != 0 && !opts.allow_failure) {
    return common::Result<common::ProcessResult>::failure(
        result.value().stderr_text.empty() ? "command failed: " + common::join_argv(argv)
                                           : result.value().stderr_text);
  }
  return result;
}

void MockHttpClient::push(const std::uint16_t status, std::string body) {
  http::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  responses.push_back(std::move(response));
}

http::HttpResponse MockHttpClient::next(Call call) {
  calls.push_back(std::move(call));
  if (responses.empty()) {
    http::HttpResponse missing;
    missing.network_error = true;
    missing.network_error_message = "no scripted response";
    return missing;
  }
  http::HttpResponse response = std::move(responses.front());
  responses.pop_front();
  return response;
}

http::HttpResponse MockHttpClient::get(const std::string &url, const http::Headers &headers,
                                       std::uint64_t) {
  return next(Call{.method = "GET", .url = url, .headers = headers, .body = ""});
}

http::HttpResponse MockHttpClient::post_json(const std::string &url, const http::Headers &headers,
                                             const std::string &body, std::uint64_t) {
  return next(Call{.method = "POST", .url = url, .headers = headers, .body = body});
}

http::HttpResponse MockHttpClient::patch_json(const std::string &url,
                                              const http::Headers &headers,
                                              const std::string &body, std::uint64_t) {
  return next(Call{.method = "PATCH", .url = url, .headers = headers, .body = body});
}

} // namespace sessionflow::testing
