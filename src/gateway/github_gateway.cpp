#include "sessionflow/gateway/github_gateway.hpp"

#include "sessionflow/common/digest.hpp"
#include "sessionflow/common/fs.hpp"
#include "sessionflow/observability/global.hpp"

#include <chrono>

namespace sessionflow::gateway {

namespace {

constexpr const char *kMarkReadyMutation =
    "mutation($id: ID!) { markPullRequestReadyForReview(input: {pullRequestId: $id}) "
    "{ pullRequest { number isDraft } } }";

bool is_success(const http::HttpResponse &response) {
  return !response.network_error && response.status >= 200 && response.status < 300;
}

std::string url_encode(const std::string &value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  for (const unsigned char ch : value) {
    if ((ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') ||
        ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      out.push_back(static_cast<char>(ch));
    } else {
      out.push_back('%');
      out.push_back(kHex[ch >> 4]);
      out.push_back(kHex[ch & 0x0F]);
    }
  }
  return out;
}

std::string pr_resource(const std::uint64_t number) {
  return "pull request #" + std::to_string(number);
}

std::string issue_resource(const std::uint64_t number) { return "issue #" + std::to_string(number); }

GatewayError invalid_response(const std::string &resource, const std::uint16_t status,
                              const std::string &what) {
  return GatewayError{.code = GatewayErrorCode::InvalidResponse,
                      .status = status,
                      .resource = resource,
                      .message = what};
}

class CallTimer {
public:
  CallTimer(std::string call, std::string target)
      : call_(std::move(call)), target_(std::move(target)),
        started_(std::chrono::steady_clock::now()) {}

  void finish(const bool success) const {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    observability::record_gateway_call(call_, target_, elapsed, success);
  }

private:
  std::string call_;
  std::string target_;
  std::chrono::steady_clock::time_point started_;
};

PullRequest pull_request_from(const common::JsonObject &object) {
  PullRequest pr;
  pr.number = common::json_member_u64(object, "number").value_or(0);
  pr.state = common::json_member_string(object, "state");
  pr.draft = common::json_member_bool(object, "draft").value_or(false);
  // List endpoints omit "merged"; a merge timestamp means the same thing.
  if (const auto merged = common::json_member_bool(object, "merged"); merged.has_value()) {
    pr.merged = *merged;
  } else {
    pr.merged = !common::json_member_string(object, "merged_at").empty();
  }
  pr.title = common::json_member_string(object, "title");
  pr.body = common::json_member_string(object, "body");
  pr.url = common::json_member_string(object, "html_url");
  pr.node_id = common::json_member_string(object, "node_id");
  if (const auto head = common::json_member_object(object, "head"); head.has_value()) {
    pr.head_branch = common::json_member_string(*head, "ref");
  }
  return pr;
}

Issue issue_from(const common::JsonObject &object) {
  Issue issue;
  issue.number = common::json_member_u64(object, "number").value_or(0);
  issue.state = common::json_member_string(object, "state");
  issue.title = common::json_member_string(object, "title");
  issue.body = common::json_member_string(object, "body");
  return issue;
}

std::string body_payload(const std::string &body) {
  common::JsonWriter writer;
  writer.begin_object().field("body", body).end_object();
  return writer.str();
}

} // namespace

GatewayError map_http_error(const http::HttpResponse &response, const std::string &resource,
                            const bool body_update) {
  GatewayError error;
  error.resource = resource;
  error.status = response.status;

  if (response.network_error) {
    error.code = response.timeout ? GatewayErrorCode::Timeout : GatewayErrorCode::NetworkError;
    error.message = response.network_error_message;
    return error;
  }

  if (const auto object = common::json_parse_object(response.body); object.has_value()) {
    error.message = common::json_member_string(*object, "message");
  }
  if (error.message.empty()) {
    error.message = "unexpected HTTP status " + std::to_string(response.status);
  }

  switch (response.status) {
  case 401:
  case 403:
    error.code = GatewayErrorCode::PermissionDenied;
    break;
  case 404:
  case 410:
    error.code = GatewayErrorCode::NotFound;
    break;
  case 409:
  case 412:
  case 422:
    error.code = body_update ? GatewayErrorCode::Conflict : GatewayErrorCode::ApiError;
    break;
  default:
    error.code = GatewayErrorCode::ApiError;
    break;
  }
  return error;
}

std::optional<PullRequest> parse_pull_request(const std::string &json) {
  const auto object = common::json_parse_object(json);
  if (!object.has_value() || !common::json_member_u64(*object, "number").has_value()) {
    return std::nullopt;
  }
  return pull_request_from(*object);
}

std::optional<Issue> parse_issue(const std::string &json) {
  const auto object = common::json_parse_object(json);
  if (!object.has_value() || !common::json_member_u64(*object, "number").has_value()) {
    return std::nullopt;
  }
  return issue_from(*object);
}

std::vector<std::string> expand_sync_command(const std::vector<std::string> &command_template,
                                             const std::string &ledger_path,
                                             const std::string &milestone) {
  const auto replace_all = [](std::string text, const std::string &needle,
                              const std::string &replacement) {
    std::size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
      text.replace(pos, needle.size(), replacement);
      pos += replacement.size();
    }
    return text;
  };

  std::vector<std::string> argv;
  argv.reserve(command_template.size());
  for (const auto &arg : command_template) {
    argv.push_back(replace_all(replace_all(arg, "{ledger}", ledger_path), "{milestone}", milestone));
  }
  return argv;
}

GitHubGateway::GitHubGateway(http::HttpClient &http, common::IProcessRunner &runner,
                             config::Config config, std::string repository)
    : http_(http), runner_(runner), config_(std::move(config)),
      repository_(std::move(repository)) {}

http::Headers GitHubGateway::headers() const {
  http::Headers headers = {
      {"Accept", "application/vnd.github+json"},
      {"X-GitHub-Api-Version", "2022-11-28"},
      {"Content-Type", "application/json"},
  };
  if (config_.github.token.has_value() && !config_.github.token->empty()) {
    headers["Authorization"] = "Bearer " + *config_.github.token;
  }
  return headers;
}

std::string GitHubGateway::repo_url(const std::string &suffix) const {
  std::string base = config_.github.api_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/repos/" + repository_ + suffix;
}

GatewayResult<common::JsonObject> GitHubGateway::fetch_object(const std::string &call,
                                                              const std::string &url,
                                                              const std::string &resource) {
  CallTimer timer(call, resource);
  const auto response = http_.get(url, headers(), config_.github.timeout_ms);
  if (!is_success(response)) {
    timer.finish(false);
    return GatewayResult<common::JsonObject>::failure(map_http_error(response, resource, false));
  }
  auto object = common::json_parse_object(response.body);
  timer.finish(object.has_value());
  if (!object.has_value()) {
    return GatewayResult<common::JsonObject>::failure(
        invalid_response(resource, response.status, "response is not a JSON object"));
  }
  return GatewayResult<common::JsonObject>::success(std::move(*object));
}

GatewayResult<common::JsonObject>
GitHubGateway::send_json(const std::string &call, const std::string &method,
                         const std::string &url, const std::string &body,
                         const std::string &resource, const bool body_update) {
  CallTimer timer(call, resource);
  const auto response = method == "PATCH"
                            ? http_.patch_json(url, headers(), body, config_.github.timeout_ms)
                            : http_.post_json(url, headers(), body, config_.github.timeout_ms);
  if (!is_success(response)) {
    timer.finish(false);
    return GatewayResult<common::JsonObject>::failure(
        map_http_error(response, resource, body_update));
  }
  auto object = common::json_parse_object(response.body);
  timer.finish(object.has_value());
  if (!object.has_value()) {
    return GatewayResult<common::JsonObject>::failure(
        invalid_response(resource, response.status, "response is not a JSON object"));
  }
  return GatewayResult<common::JsonObject>::success(std::move(*object));
}

GatewayResult<PullRequest> GitHubGateway::get_pr(const std::uint64_t number) {
  auto object = fetch_object("get_pr", repo_url("/pulls/" + std::to_string(number)),
                             pr_resource(number));
  if (!object.ok()) {
    return GatewayResult<PullRequest>::failure(object.error());
  }
  return GatewayResult<PullRequest>::success(pull_request_from(object.value()));
}

GatewayResult<Issue> GitHubGateway::get_issue(const std::uint64_t number) {
  auto object = fetch_object("get_issue", repo_url("/issues/" + std::to_string(number)),
                             issue_resource(number));
  if (!object.ok()) {
    return GatewayResult<Issue>::failure(object.error());
  }
  return GatewayResult<Issue>::success(issue_from(object.value()));
}

GatewayResult<void> GitHubGateway::close_issue(const std::uint64_t number,
                                               const std::string &comment) {
  const std::string resource = issue_resource(number);
  const std::string issue_url = repo_url("/issues/" + std::to_string(number));

  if (!comment.empty()) {
    auto posted =
        send_json("comment_issue", "POST", issue_url + "/comments", body_payload(comment),
                  resource, false);
    if (!posted.ok()) {
      return GatewayResult<void>::failure(posted.error());
    }
  }

  common::JsonWriter payload;
  payload.begin_object().field("state", "closed").field("state_reason", "completed").end_object();
  auto closed = send_json("close_issue", "PATCH", issue_url, payload.str(), resource, false);
  if (!closed.ok()) {
    return GatewayResult<void>::failure(closed.error());
  }
  observability::record_mutation("issue.closed", resource);
  return GatewayResult<void>::success();
}

GatewayResult<BodyUpdate> GitHubGateway::update_body(const std::string &url,
                                                     const std::string &resource,
                                                     const BodyTransform &transform) {
  auto current = fetch_object("read_body", url, resource);
  if (!current.ok()) {
    return GatewayResult<BodyUpdate>::failure(current.error());
  }
  const std::string original = common::json_member_string(current.value(), "body");
  std::string updated = transform(original);
  if (updated == original) {
    return GatewayResult<BodyUpdate>::success(BodyUpdate{.changed = false, .body = original});
  }

  // Someone else may have edited the body while the transform ran.
  auto latest = fetch_object("verify_body", url, resource);
  if (!latest.ok()) {
    return GatewayResult<BodyUpdate>::failure(latest.error());
  }
  // Conflict messages name both bodies by a 12-character digest prefix.
  const std::string read_digest = common::sha256_hex(original);
  const std::string latest_digest =
      common::sha256_hex(common::json_member_string(latest.value(), "body"));
  if (latest_digest != read_digest) {
    return GatewayResult<BodyUpdate>::failure(GatewayError{
        .code = GatewayErrorCode::Conflict,
        .status = 0,
        .resource = resource,
        .message = "body changed since it was read (sha256 " + read_digest.substr(0, 12) +
                   " -> " + latest_digest.substr(0, 12) + ")"});
  }

  auto patched = send_json("update_body", "PATCH", url, body_payload(updated), resource, true);
  if (!patched.ok()) {
    return GatewayResult<BodyUpdate>::failure(patched.error());
  }
  observability::record_mutation("body.updated", resource);
  return GatewayResult<BodyUpdate>::success(BodyUpdate{.changed = true, .body = std::move(updated)});
}

GatewayResult<BodyUpdate> GitHubGateway::update_issue_body(const std::uint64_t number,
                                                           const BodyTransform &transform) {
  return update_body(repo_url("/issues/" + std::to_string(number)), issue_resource(number),
                     transform);
}

GatewayResult<BodyUpdate> GitHubGateway::update_pr_body(const std::uint64_t number,
                                                        const BodyTransform &transform) {
  return update_body(repo_url("/pulls/" + std::to_string(number)), pr_resource(number),
                     transform);
}

GatewayResult<void> GitHubGateway::sync_external_board(const std::filesystem::path &ledger_path,
                                                       const std::string &milestone) {
  const auto sync_error = [&](std::string message) {
    return GatewayResult<void>::failure(GatewayError{.code = GatewayErrorCode::ExternalSyncError,
                                                     .status = 0,
                                                     .resource = "board " + milestone,
                                                     .message = std::move(message)});
  };

  if (!config_.projects.sync_enabled) {
    return sync_error("board sync is disabled");
  }
  if (config_.projects.sync_command.empty()) {
    return sync_error("projects.sync_command is empty");
  }

  const auto argv =
      expand_sync_command(config_.projects.sync_command, ledger_path.string(), milestone);
  CallTimer timer("sync_board", milestone);
  auto result = runner_.run(argv, common::ProcessOptions{
                                      .allow_failure = true,
                                      .timeout = std::chrono::milliseconds(
                                          config_.projects.sync_timeout_ms),
                                      .working_dir = std::nullopt,
                                  });
  if (!result.ok()) {
    timer.finish(false);
    return sync_error(result.error());
  }
  const auto &outcome = result.value();
  if (outcome.timed_out) {
    timer.finish(false);
    return sync_error("board sync timed out: " + common::join_argv(argv));
  }
  if (outcome.exit_code != 0) {
    timer.finish(false);
    const std::string detail = common::trim(outcome.stderr_text);
    return sync_error("board sync exited with " + std::to_string(outcome.exit_code) +
                      (detail.empty() ? std::string() : ": " + detail));
  }
  timer.finish(true);
  return GatewayResult<void>::success();
}

GatewayResult<std::optional<PullRequest>>
GitHubGateway::find_pr_for_branch(const std::string &branch) {
  using FindResult = GatewayResult<std::optional<PullRequest>>;
  const std::string owner = repository_.substr(0, repository_.find('/'));
  const std::string url =
      repo_url("/pulls?state=all&head=" + url_encode(owner + ":" + branch));
  const std::string resource = "pull requests for " + branch;

  CallTimer timer("find_pr", resource);
  const auto response = http_.get(url, headers(), config_.github.timeout_ms);
  if (!is_success(response)) {
    timer.finish(false);
    return FindResult::failure(map_http_error(response, resource, false));
  }
  const std::size_t start = common::json_skip_ws(response.body, 0);
  if (start >= response.body.size() || response.body[start] != '[') {
    timer.finish(false);
    return FindResult::failure(invalid_response(resource, response.status, "expected an array"));
  }
  timer.finish(true);

  for (const auto &raw : common::json_split_top_level_objects(common::trim(response.body))) {
    if (auto pr = parse_pull_request(raw); pr.has_value()) {
      return FindResult::success(std::move(pr));
    }
  }
  return FindResult::success(std::nullopt);
}

GatewayResult<PullRequest> GitHubGateway::create_pr(const CreatePullRequest &request) {
  common::JsonWriter payload;
  payload.begin_object()
      .field("title", request.title)
      .field("body", request.body)
      .field("head", request.head)
      .field("base", request.base)
      .field("draft", request.draft)
      .end_object();

  auto object = send_json("create_pr", "POST", repo_url("/pulls"), payload.str(),
                          "pull request for " + request.head, false);
  if (!object.ok()) {
    return GatewayResult<PullRequest>::failure(object.error());
  }
  auto pr = pull_request_from(object.value());
  observability::record_mutation("pr.created", pr_resource(pr.number));
  return GatewayResult<PullRequest>::success(std::move(pr));
}

GatewayResult<PullRequest> GitHubGateway::update_pr(const std::uint64_t number,
                                                    const std::string &title,
                                                    const std::string &body) {
  common::JsonWriter payload;
  payload.begin_object().field("title", title).field("body", body).end_object();

  auto object = send_json("update_pr", "PATCH", repo_url("/pulls/" + std::to_string(number)),
                          payload.str(), pr_resource(number), false);
  if (!object.ok()) {
    return GatewayResult<PullRequest>::failure(object.error());
  }
  observability::record_mutation("pr.updated", pr_resource(number));
  return GatewayResult<PullRequest>::success(pull_request_from(object.value()));
}

GatewayResult<PullRequest> GitHubGateway::mark_pr_ready(const std::uint64_t number) {
  auto current = get_pr(number);
  if (!current.ok()) {
    return current;
  }
  if (!current.value().draft) {
    return current;
  }
  const std::string resource = pr_resource(number);
  if (current.value().node_id.empty()) {
    return GatewayResult<PullRequest>::failure(
        invalid_response(resource, 0, "pull request has no node_id"));
  }

  common::JsonWriter payload;
  payload.begin_object()
      .field("query", kMarkReadyMutation)
      .key("variables")
      .begin_object()
      .field("id", current.value().node_id)
      .end_object()
      .end_object();

  CallTimer timer("mark_pr_ready", resource);
  const auto response =
      http_.post_json(config_.github.graphql_url, headers(), payload.str(), config_.github.timeout_ms);
  if (!is_success(response)) {
    timer.finish(false);
    return GatewayResult<PullRequest>::failure(map_http_error(response, resource, false));
  }
  const auto object = common::json_parse_object(response.body);
  if (!object.has_value()) {
    timer.finish(false);
    return GatewayResult<PullRequest>::failure(
        invalid_response(resource, response.status, "response is not a JSON object"));
  }
  // GraphQL reports failures with HTTP 200 and an "errors" array.
  if (const auto errors = object->find("errors");
      errors != object->end() && errors->second != "null") {
    timer.finish(false);
    const auto messages = common::json_split_top_level_objects(errors->second);
    std::string message = "GraphQL error";
    if (!messages.empty()) {
      if (const auto first = common::json_parse_object(messages.front()); first.has_value()) {
        message = common::json_member_string(*first, "message", message);
      }
    }
    return GatewayResult<PullRequest>::failure(GatewayError{
        .code = GatewayErrorCode::ApiError, .status = response.status, .resource = resource,
        .message = message});
  }
  timer.finish(true);
  observability::record_mutation("pr.ready_for_review", resource);

  PullRequest promoted = current.value();
  promoted.draft = false;
  return GatewayResult<PullRequest>::success(std::move(promoted));
}

} // namespace sessionflow::gateway
