#include "sessionflow/report/reporter.hpp"

#include "sessionflow/common/json_util.hpp"

#include <sstream>

namespace sessionflow::report {

namespace {

std::string tasks_line(const finalize::TaskOutcome &tasks) {
  if (!tasks.found) {
    return "Tasks: no ledger at " + tasks.file;
  }
  std::string line = "Tasks: " + std::to_string(tasks.completed) + "/" +
                     std::to_string(tasks.total) + " complete";
  if (tasks.marked > 0) {
    line += " (" + std::to_string(tasks.marked) + " marked now)";
  }
  return line;
}

std::string issue_line(const std::string &label, const finalize::IssueOutcome &issue) {
  return label + " #" + std::to_string(issue.number) + ": " +
         (issue.comment.has_value() ? "Closed" : "Already closed");
}

void render_warnings(std::ostringstream &out, const std::vector<std::string> &warnings) {
  for (const auto &warning : warnings) {
    out << "Warning: " << warning << "\n";
  }
}

} // namespace

std::string render_finalize(const finalize::FinalizeResult &result) {
  std::ostringstream out;
  if (!result.ok()) {
    const auto &failure = *result.failure;
    out << "Cannot finalize: " << failure.error << "\n";
    if (failure.pr.has_value()) {
      out << "PR #" << failure.pr->number << " state: " << failure.pr->state
          << ", merged: " << (failure.pr->merged ? "yes" : "no") << "\n";
    }
    if (!failure.message.empty()) {
      out << failure.message << "\n";
    }
    render_warnings(out, result.warnings);
    return out.str();
  }

  std::visit(session::overloaded{
                 [&](const finalize::GithubIssueOutcome &outcome) {
                   out << "Session finalized\n";
                   out << issue_line("Issue", outcome.issue) << "\n";
                   out << "PR #" << result.pr_number << ": Merged\n";
                 },
                 [&](const finalize::SpeckitOutcome &outcome) {
                   out << "Phase finalized\n";
                   out << issue_line("Phase issue", outcome.phase_issue) << "\n";
                   out << "Parent issue #" << outcome.parent_issue.number << ": "
                       << outcome.parent_issue.progress
                       << (outcome.parent_issue.checklist_updated ? "" : " (checklist unchanged)")
                       << "\n";
                   out << "PR #" << outcome.pr.number << ": "
                       << (outcome.pr.still_draft ? "still draft" : "ready") << ", "
                       << outcome.pr.reason << "\n";
                 },
                 [&](const finalize::UnstructuredOutcome &) {
                   out << "Session finalized\n";
                   out << "PR #" << result.pr_number << ": Merged\n";
                 },
             },
             result.outcome);

  out << tasks_line(result.tasks) << "\n";
  out << "Board sync: " << (result.synced_to_projects ? "done" : "skipped") << "\n";
  render_warnings(out, result.warnings);
  out << "Ready for wrap: " << (result.ready_for_wrap ? "yes" : "no") << "\n";
  return out.str();
}

std::string render_publish(const publish::PublishResult &result) {
  std::ostringstream out;
  if (!result.ok()) {
    out << "Cannot publish: " << result.failure->error << "\n";
    if (!result.failure->message.empty()) {
      out << result.failure->message << "\n";
    }
    return out.str();
  }

  out << (result.pr.action == "created" ? "Created" : "Updated") << " PR #" << result.pr.number
      << (result.pr.draft ? " (draft)" : "") << "\n";
  out << "URL: " << result.pr.url << "\n";
  if (!result.pr.linked_issues.empty()) {
    out << "Linked issues:";
    for (const auto issue : result.pr.linked_issues) {
      out << " #" << issue;
    }
    out << "\n";
  }
  render_warnings(out, result.warnings);
  if (!result.next_steps.empty()) {
    out << "Next steps:\n";
    for (const auto &step : result.next_steps) {
      out << "  - " << step << "\n";
    }
  }
  return out.str();
}

std::string render_status(const SessionSummary &summary) {
  const auto &session = summary.session;
  std::ostringstream out;
  out << "Session " << session.session_id << " (" << session::session_type(session) << ", "
      << session.workflow << ")\n";
  out << "Directory: " << summary.session_dir << "\n";
  std::visit(session::overloaded{
                 [&](const session::GithubIssueDetails &details) {
                   if (details.issue_number.has_value()) {
                     out << "Issue: #" << *details.issue_number;
                     if (!details.issue_title.empty()) {
                       out << " " << details.issue_title;
                     }
                     out << "\n";
                   }
                 },
                 [&](const session::SpeckitDetails &details) {
                   out << "Feature: " << details.feature_id << "\n";
                   if (details.phase_issue.has_value()) {
                     out << "Phase issue: #" << *details.phase_issue << "\n";
                   }
                   if (details.parent_issue.has_value()) {
                     out << "Parent issue: #" << *details.parent_issue << "\n";
                   }
                 },
                 [&](const session::UnstructuredDetails &details) {
                   if (!details.goal.empty()) {
                     out << "Goal: " << details.goal << "\n";
                   }
                 },
             },
             session.details);
  if (session.pr_number.has_value()) {
    out << "PR: #" << *session.pr_number << "\n";
  }
  if (summary.counts.has_value()) {
    out << "Tasks: " << summary.counts->completed << "/" << summary.counts->total
        << " complete (" << summary.tasks_file << ")\n";
  } else {
    out << "Tasks: no ledger at " << summary.tasks_file << "\n";
  }
  if (!session.touched_tasks.empty()) {
    out << "Touched:";
    for (const auto &task : session.touched_tasks) {
      out << " " << task;
    }
    out << "\n";
  }
  return out.str();
}

std::string status_to_json(const SessionSummary &summary) {
  const auto &session = summary.session;
  common::JsonWriter writer;
  writer.begin_object()
      .field("status", "success")
      .field("session_id", session.session_id)
      .field("session_type", std::string(session::session_type(session)))
      .field("workflow", session.workflow)
      .field("session_dir", summary.session_dir)
      .field("issue_number", session::primary_issue(session));
  if (const auto *speckit = std::get_if<session::SpeckitDetails>(&session.details)) {
    writer.field("parent_issue", speckit->parent_issue).field("feature_id", speckit->feature_id);
  }
  writer.field("pr_number", session.pr_number);

  writer.key("tasks").begin_object().field("file", summary.tasks_file);
  if (summary.counts.has_value()) {
    writer.field("total", static_cast<std::uint64_t>(summary.counts->total))
        .field("completed", static_cast<std::uint64_t>(summary.counts->completed));
  } else {
    writer.key("total").null().key("completed").null();
  }
  writer.key("touched").begin_array();
  for (const auto &task : session.touched_tasks) {
    writer.value(task);
  }
  writer.end_array().end_object().end_object();
  return writer.str();
}

} // namespace sessionflow::report
