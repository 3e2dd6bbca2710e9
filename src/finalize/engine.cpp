#include "sessionflow/finalize/engine.hpp"

#include "sessionflow/finalize/checklist.hpp"
#include "sessionflow/ledger/ledger.hpp"
#include "sessionflow/observability/global.hpp"

#include <chrono>
#include <set>

namespace sessionflow::finalize {

namespace {

constexpr const char *kComponent = "finalize";

PrSnapshot snapshot_of(const gateway::PullRequest &pr) {
  return PrSnapshot{.number = pr.number, .state = pr.state, .merged = pr.merged};
}

class FinalizeRun {
public:
  FinalizeRun(gateway::Gateway &gateway, const FinalizeContext &context)
      : gateway_(gateway), context_(context) {
    result_.session_id = context.session.session_id;
    result_.session_type = std::string(session::session_type(context.session));
  }

  FinalizeResult execute() {
    if (auto valid = session::validate_session(context_.session); !valid.ok()) {
      return fail(FinalizeError{.error = "Invalid session", .message = valid.error(), .pr = {}});
    }
    if (auto error = check_pr(); error.has_value()) {
      return fail(std::move(*error));
    }
    result_.pr_number = pr_.number;

    auto fatal = std::visit(
        session::overloaded{
            [&](const session::GithubIssueDetails &details) { return finalize_issue(details); },
            [&](const session::SpeckitDetails &details) { return finalize_phase(details); },
            [&](const session::UnstructuredDetails &) -> std::optional<FinalizeError> {
              result_.outcome = UnstructuredOutcome{};
              return mark_tasks();
            },
        },
        context_.session.details);
    if (fatal.has_value()) {
      fatal->pr = snapshot_of(pr_);
      return fail(std::move(*fatal));
    }

    sync_board();
    result_.ready_for_wrap = true;
    return result_;
  }

private:
  std::optional<FinalizeError> check_pr() {
    if (context_.session.pr_number.has_value()) {
      const std::uint64_t number = *context_.session.pr_number;
      auto fetched = gateway_.get_pr(number);
      if (!fetched.ok()) {
        if (fetched.error().code == gateway::GatewayErrorCode::NotFound) {
          return FinalizeError{
              .error = "PR not merged",
              .message = "PR #" + std::to_string(number) + " was not found",
              .pr = PrSnapshot{.number = number, .state = "not_found", .merged = false}};
        }
        return FinalizeError{
            .error = "PR fetch failed", .message = fetched.error().describe(), .pr = {}};
      }
      pr_ = fetched.value();
    } else {
      if (context_.branch.empty()) {
        return FinalizeError{.error = "No PR found for current branch",
                             .message = "session has no pr_number and HEAD is not on a branch",
                             .pr = {}};
      }
      auto found = gateway_.find_pr_for_branch(context_.branch);
      if (!found.ok()) {
        return FinalizeError{
            .error = "PR fetch failed", .message = found.error().describe(), .pr = {}};
      }
      if (!found.value().has_value()) {
        return FinalizeError{.error = "No PR found for current branch",
                             .message = "no pull request has head " + context_.branch,
                             .pr = {}};
      }
      pr_ = *found.value();
    }

    if (!pr_.merged) {
      return FinalizeError{.error = "PR not merged",
                           .message = "Merge PR #" + std::to_string(pr_.number) +
                                      " first, then retry sessionflow finalize",
                           .pr = snapshot_of(pr_)};
    }
    return std::nullopt;
  }

  std::optional<FinalizeError> finalize_issue(const session::GithubIssueDetails &details) {
    GithubIssueOutcome outcome;
    if (auto error = close_issue(*details.issue_number,
                                 "Resolved via PR #" + std::to_string(pr_.number), outcome.issue);
        error.has_value()) {
      return error;
    }
    result_.outcome = outcome;
    return mark_tasks();
  }

  std::optional<FinalizeError> finalize_phase(const session::SpeckitDetails &details) {
    SpeckitOutcome outcome;
    const std::uint64_t phase = *details.phase_issue;
    if (auto error = close_issue(phase,
                                 "Phase complete via PR #" + std::to_string(pr_.number) +
                                     ". All tasks done.",
                                 outcome.phase_issue);
        error.has_value()) {
      return error;
    }

    ChecklistProgress progress;
    if (auto error = update_parent(*details.parent_issue, phase, outcome.parent_issue, progress);
        error.has_value()) {
      return error;
    }
    if (auto error = mark_tasks(); error.has_value()) {
      return error;
    }
    update_draft(phase, progress, outcome.pr);
    result_.outcome = outcome;
    return std::nullopt;
  }

  std::optional<FinalizeError> close_issue(const std::uint64_t number, const std::string &comment,
                                           IssueOutcome &outcome) {
    outcome.number = number;
    auto issue = gateway_.get_issue(number);
    if (!issue.ok()) {
      return FinalizeError{.error = "Issue fetch failed", .message = issue.error().describe()};
    }
    if (issue.value().is_closed()) {
      outcome.closed = true;
      return std::nullopt;
    }
    auto closed = gateway_.close_issue(number, comment);
    if (!closed.ok()) {
      return FinalizeError{.error = "Issue close failed", .message = closed.error().describe()};
    }
    outcome.closed = true;
    outcome.comment = comment;
    return std::nullopt;
  }

  std::optional<FinalizeError> update_parent(const std::uint64_t parent_number,
                                             const std::uint64_t phase, ParentOutcome &outcome,
                                             ChecklistProgress &progress) {
    outcome.number = parent_number;
    auto parent = gateway_.get_issue(parent_number);
    if (!parent.ok()) {
      return FinalizeError{.error = "Parent issue fetch failed",
                           .message = parent.error().describe()};
    }
    const std::string &body = parent.value().body;
    const std::string parent_ref = "parent issue #" + std::to_string(parent_number);
    const std::string phase_ref = "#" + std::to_string(phase);

    const PhaseToggle toggle = check_phase_line(body, phase);
    progress = checklist_progress(body);
    switch (toggle.state) {
    case PhaseLineState::Missing:
      warn(parent_ref + " has no checklist line for " + phase_ref);
      break;
    case PhaseLineState::Ambiguous:
      warn(parent_ref + " has more than one checklist line for " + phase_ref);
      break;
    case PhaseLineState::Checked:
      outcome.checklist_updated = true;
      break;
    case PhaseLineState::Open: {
      PhaseLineState seen = PhaseLineState::Missing;
      auto updated = gateway_.update_issue_body(parent_number, [&](const std::string &current) {
        const PhaseToggle latest = check_phase_line(current, phase);
        seen = latest.state;
        return latest.body;
      });
      if (!updated.ok()) {
        if (updated.error().code != gateway::GatewayErrorCode::Conflict) {
          return FinalizeError{.error = "Parent issue update failed",
                               .message = updated.error().describe()};
        }
        warn(parent_ref + " checklist not updated: " + updated.error().describe());
        break;
      }
      outcome.updated = updated.value().changed;
      outcome.checklist_updated = seen == PhaseLineState::Open || seen == PhaseLineState::Checked;
      if (!outcome.checklist_updated) {
        warn(parent_ref + " checklist line for " + phase_ref + " changed before it could be checked");
      }
      progress = checklist_progress(updated.value().body);
      break;
    }
    }
    outcome.progress = progress.text();
    return std::nullopt;
  }

  std::optional<FinalizeError> mark_tasks() {
    const auto path = ledger_path(context_);
    result_.tasks.file = path.string();

    auto file = ledger::read_ledger_file(path);
    if (!file.ok()) {
      return FinalizeError{.error = "Task ledger read failed", .message = file.error().describe()};
    }
    if (!file.value().exists) {
      if (!context_.session.touched_tasks.empty()) {
        warn("task ledger " + path.string() + " not found; " +
             std::to_string(context_.session.touched_tasks.size()) + " touched tasks not marked");
      }
      return std::nullopt;
    }
    result_.tasks.found = true;

    const std::set<std::string> touched(context_.session.touched_tasks.begin(),
                                        context_.session.touched_tasks.end());
    auto marked = ledger::mark_done(file.value().text, touched);
    if (!marked.ok()) {
      return FinalizeError{.error = "Malformed task ledger", .message = marked.error().describe()};
    }
    if (marked.value().marked > 0) {
      auto written = ledger::write_ledger_file(path, marked.value().text);
      if (!written.ok()) {
        return FinalizeError{.error = "Task ledger write failed",
                             .message = written.error().describe()};
      }
      observability::record_mutation("ledger.marked", path.string());
      observability::record_tasks_marked(marked.value().marked);
    }

    auto counts = ledger::count(marked.value().text);
    if (!counts.ok()) {
      return FinalizeError{.error = "Malformed task ledger", .message = counts.error().describe()};
    }
    result_.tasks.total = counts.value().total;
    result_.tasks.completed = counts.value().completed;
    result_.tasks.marked = marked.value().marked;
    return std::nullopt;
  }

  void update_draft(const std::uint64_t phase, const ChecklistProgress &progress,
                    DraftOutcome &outcome) {
    outcome.number = pr_.number;
    const std::string pr_ref = "PR #" + std::to_string(pr_.number);

    if (progress.all_complete()) {
      outcome.reason = "all phases complete";
      if (pr_.draft) {
        auto ready = gateway_.mark_pr_ready(pr_.number);
        if (!ready.ok()) {
          warn(pr_ref + " not promoted out of draft: " + ready.error().describe());
          outcome.still_draft = true;
          return;
        }
      }
      outcome.still_draft = false;
      return;
    }

    outcome.still_draft = pr_.draft;
    outcome.reason = progress.total == 0
                         ? "parent checklist has no phases"
                         : std::to_string(progress.total - progress.complete) +
                               " of " + std::to_string(progress.total) + " phases remaining";
    auto updated = gateway_.update_pr_body(pr_.number, [&](const std::string &current) {
      return append_phase_note(current, phase, pr_.number, progress.text());
    });
    if (!updated.ok()) {
      warn(pr_ref + " description not updated: " + updated.error().describe());
      return;
    }
    outcome.description_updated = updated.value().changed;
  }

  void sync_board() {
    if (!context_.sync_enabled) {
      result_.synced_to_projects = false;
      return;
    }
    auto synced = gateway_.sync_external_board(ledger_path(context_),
                                               sync_milestone(context_.session));
    result_.synced_to_projects = synced.ok();
    if (!synced.ok()) {
      warn("board sync failed: " + synced.error().describe());
    }
  }

  void warn(std::string message) {
    observability::record_warning(kComponent, message);
    result_.warnings.push_back(std::move(message));
  }

  FinalizeResult fail(FinalizeError error) {
    observability::record_error(kComponent, error.error + ": " + error.message);
    auto failed = FinalizeResult::error(result_.session_type, std::move(error.error),
                                        std::move(error.message), std::move(error.pr));
    failed.session_id = result_.session_id;
    failed.warnings = std::move(result_.warnings);
    return failed;
  }

  gateway::Gateway &gateway_;
  const FinalizeContext &context_;
  gateway::PullRequest pr_;
  FinalizeResult result_;
};

} // namespace

FinalizeEngine::FinalizeEngine(gateway::Gateway &gateway) : gateway_(gateway) {}

FinalizeResult FinalizeEngine::run(const FinalizeContext &context) {
  const auto started = std::chrono::steady_clock::now();
  observability::record_operation_start("finalize", context.session.session_id,
                                        std::string(session::session_type(context.session)));
  FinalizeRun run(gateway_, context);
  FinalizeResult result = run.execute();
  observability::record_operation_end(
      "finalize",
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started),
      result.ok());
  return result;
}

std::string phase_note_marker(const std::uint64_t phase_issue) {
  return "<!-- sessionflow:phase-" + std::to_string(phase_issue) + " -->";
}

std::string append_phase_note(const std::string &body, const std::uint64_t phase_issue,
                              const std::uint64_t pr_number, const std::string &progress) {
  const std::string marker = phase_note_marker(phase_issue);
  if (body.find(marker) != std::string::npos) {
    return body;
  }
  std::string out = body;
  if (!out.empty()) {
    if (out.back() != '\n') {
      out.push_back('\n');
    }
    out.push_back('\n');
  }
  out += marker + "\n";
  out += "Phase #" + std::to_string(phase_issue) + " complete via PR #" +
         std::to_string(pr_number) + " (" + progress + ").\n";
  return out;
}

std::filesystem::path ledger_path(const FinalizeContext &context) {
  return std::visit(
      session::overloaded{
          [&](const session::SpeckitDetails &details) {
            return context.specs_dir / details.feature_id / "tasks.md";
          },
          [&](const auto &) {
            if (context.session.tasks_file.has_value()) {
              return std::filesystem::path(*context.session.tasks_file);
            }
            return context.session_dir / "tasks.md";
          },
      },
      context.session.details);
}

std::string sync_milestone(const session::Session &session) {
  return std::visit(session::overloaded{
                        [](const session::SpeckitDetails &details) { return details.feature_id; },
                        [&](const session::GithubIssueDetails &details) {
                          return details.issue_number.has_value()
                                     ? "issue-" + std::to_string(*details.issue_number)
                                     : "session-" + session.session_id;
                        },
                        [&](const session::UnstructuredDetails &) {
                          return "session-" + session.session_id;
                        },
                    },
                    session.details);
}

} // namespace sessionflow::finalize
