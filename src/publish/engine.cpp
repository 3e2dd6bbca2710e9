#include "sessionflow/publish/engine.hpp"

#include "sessionflow/common/fs.hpp"
#include "sessionflow/common/json_util.hpp"
#include "sessionflow/observability/global.hpp"

#include <array>
#include <cctype>
#include <chrono>

namespace sessionflow::publish {

namespace {

constexpr const char *kComponent = "publish";

constexpr std::array<const char *, 9> kClosingKeywords = {
    "close", "closes", "closed", "fix", "fixes", "fixed", "resolve", "resolves", "resolved",
};

PublishResult failed(const PublishErrorCode code, std::string error, std::string message) {
  observability::record_error(kComponent, error + ": " + message);
  PublishResult result;
  result.failure =
      PublishError{.code = code, .error = std::move(error), .message = std::move(message)};
  return result;
}

// Whole-word match: no letter or digit directly before, no digit after.
bool mentions(const std::string &lower_text, const std::string &needle) {
  std::size_t pos = 0;
  while ((pos = lower_text.find(needle, pos)) != std::string::npos) {
    const std::size_t after = pos + needle.size();
    const bool starts_word =
        pos == 0 || std::isalnum(static_cast<unsigned char>(lower_text[pos - 1])) == 0;
    const bool ends_number = after >= lower_text.size() ||
                             std::isdigit(static_cast<unsigned char>(lower_text[after])) == 0;
    if (starts_word && ends_number) {
      return true;
    }
    ++pos;
  }
  return false;
}

std::vector<std::string> next_steps_for(const std::string &url) {
  return {
      "Monitor CI checks: " + url + "/checks",
      "Fix any CI failures if needed",
      "Get PR reviewed (if required)",
      "Merge PR when ready",
      "Then run: sessionflow finalize",
  };
}

} // namespace

bool has_closing_keyword(const std::string &text, const std::uint64_t issue) {
  const std::string lower = common::to_lower(text);
  const std::string reference = "#" + std::to_string(issue);
  for (const char *keyword : kClosingKeywords) {
    for (const char *separator : {" ", ": ", ":"}) {
      if (mentions(lower, std::string(keyword) + separator + reference)) {
        return true;
      }
    }
  }
  return false;
}

std::string compose_body(const std::string &description, const std::optional<std::uint64_t> issue,
                         const std::optional<std::uint64_t> parent) {
  std::vector<std::string> links;
  if (issue.has_value() && !has_closing_keyword(description, *issue)) {
    links.push_back("Closes #" + std::to_string(*issue));
  }
  if (parent.has_value() &&
      !mentions(common::to_lower(description), "part of #" + std::to_string(*parent))) {
    links.push_back("Part of #" + std::to_string(*parent));
  }
  if (links.empty()) {
    return description;
  }

  std::string body = description;
  while (!body.empty() && (body.back() == '\n' || body.back() == ' ')) {
    body.pop_back();
  }
  if (!body.empty()) {
    body += "\n\n";
  }
  for (std::size_t i = 0; i < links.size(); ++i) {
    body += links[i];
    body += i + 1 < links.size() ? "\n" : "";
  }
  return body + "\n";
}

std::string PublishResult::to_json() const {
  common::JsonWriter writer;
  writer.begin_object();
  if (failure.has_value()) {
    writer.field("status", "error")
        .field("error", failure->error)
        .field("message", failure->message)
        .end_object();
    return writer.str();
  }

  writer.field("status", "success")
      .key("pr")
      .begin_object()
      .field("number", pr.number)
      .field("url", pr.url)
      .field("state", pr.state)
      .field("draft", pr.draft)
      .field("action", pr.action)
      .key("linked_issues")
      .begin_array();
  for (const auto issue : pr.linked_issues) {
    writer.value(issue);
  }
  writer.end_array().end_object();

  writer.key("next_steps").begin_array();
  for (const auto &step : next_steps) {
    writer.value(step);
  }
  writer.end_array();
  if (!warnings.empty()) {
    writer.key("warnings").begin_array();
    for (const auto &warning : warnings) {
      writer.value(warning);
    }
    writer.end_array();
  }
  writer.end_object();
  return writer.str();
}

PublishEngine::PublishEngine(gateway::Gateway &gateway, git::GitWorkspace &workspace)
    : gateway_(gateway), workspace_(workspace) {}

PublishResult PublishEngine::run(const session::Session &session, const PublishRequest &request) {
  const auto started = std::chrono::steady_clock::now();
  observability::record_operation_start(kComponent, session.session_id,
                                        std::string(session::session_type(session)));
  const auto finish = [&](PublishResult result) {
    observability::record_operation_end(
        kComponent,
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                              started),
        result.ok());
    return result;
  };

  if (common::trim(request.title).empty()) {
    return finish(failed(PublishErrorCode::MissingTitle, "Missing required argument: --title",
                         "a PR title is required"));
  }

  auto branch = workspace_.current_branch();
  if (!branch.ok()) {
    return finish(failed(PublishErrorCode::GitError, "Git error", branch.error()));
  }
  if (branch.value().empty()) {
    return finish(failed(PublishErrorCode::NotOnBranch, "Not on a branch",
                         "check out the session branch before publishing"));
  }

  auto base = workspace_.default_branch();
  if (!base.ok()) {
    return finish(failed(PublishErrorCode::GitError, "Git error", base.error()));
  }
  auto ahead = workspace_.commits_ahead(base.value());
  if (!ahead.ok()) {
    return finish(failed(PublishErrorCode::GitError, "Git error", ahead.error()));
  }
  if (ahead.value() == 0) {
    return finish(failed(PublishErrorCode::NoCommits, "No commits to create PR from",
                         branch.value() + " has no commits ahead of origin/" + base.value()));
  }

  std::optional<std::uint64_t> issue = request.issue;
  if (!issue.has_value()) {
    issue = session::primary_issue(session);
  }
  std::optional<std::uint64_t> parent;
  if (const auto *speckit = std::get_if<session::SpeckitDetails>(&session.details)) {
    parent = speckit->parent_issue;
  }
  const std::string body = compose_body(request.description, issue, parent);

  PublishResult result;
  std::optional<gateway::PullRequest> existing;
  if (session.pr_number.has_value()) {
    auto current = gateway_.get_pr(*session.pr_number);
    if (current.ok() && current.value().state == "open") {
      existing = current.value();
    } else if (!current.ok() && current.error().code != gateway::GatewayErrorCode::NotFound) {
      return finish(failed(PublishErrorCode::GatewayError, "PR fetch failed",
                           current.error().describe()));
    }
  }
  if (!existing.has_value()) {
    auto found = gateway_.find_pr_for_branch(branch.value());
    if (!found.ok()) {
      return finish(
          failed(PublishErrorCode::GatewayError, "PR lookup failed", found.error().describe()));
    }
    if (found.value().has_value() && found.value()->state == "open") {
      existing = found.value();
    }
  }

  gateway::PullRequest pr;
  if (existing.has_value()) {
    auto updated = gateway_.update_pr(existing->number, request.title, body);
    if (!updated.ok()) {
      return finish(
          failed(PublishErrorCode::GatewayError, "PR update failed", updated.error().describe()));
    }
    pr = updated.value();
    if (!request.draft && pr.draft) {
      auto ready = gateway_.mark_pr_ready(pr.number);
      if (ready.ok()) {
        pr = ready.value();
      } else {
        result.warnings.push_back("PR #" + std::to_string(pr.number) +
                                  " left in draft: " + ready.error().describe());
        observability::record_warning(kComponent, result.warnings.back());
      }
    } else if (request.draft && !pr.draft) {
      result.warnings.push_back("PR #" + std::to_string(pr.number) +
                                " is already ready for review; it cannot return to draft");
      observability::record_warning(kComponent, result.warnings.back());
    }
    result.pr.action = "updated";
  } else {
    auto created = gateway_.create_pr(gateway::CreatePullRequest{
        .title = request.title,
        .body = body,
        .head = branch.value(),
        .base = base.value(),
        .draft = request.draft,
    });
    if (!created.ok()) {
      return finish(
          failed(PublishErrorCode::GatewayError, "PR create failed", created.error().describe()));
    }
    pr = created.value();
    result.pr.action = "created";
  }

  result.pr.number = pr.number;
  result.pr.url = pr.url;
  result.pr.state = pr.state;
  result.pr.draft = pr.draft;
  if (issue.has_value()) {
    result.pr.linked_issues.push_back(*issue);
  }
  if (parent.has_value()) {
    result.pr.linked_issues.push_back(*parent);
  }
  result.next_steps = next_steps_for(pr.url);
  return finish(std::move(result));
}

} // namespace sessionflow::publish
