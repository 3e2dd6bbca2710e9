#include "sessionflow/finalize/result.hpp"

#include "sessionflow/common/json_util.hpp"
#include "sessionflow/session/session.hpp"

namespace sessionflow::finalize {

namespace {

void write_issue(common::JsonWriter &writer, const std::string &name, const IssueOutcome &issue) {
  writer.key(name)
      .begin_object()
      .field("number", issue.number)
      .field("closed", issue.closed);
  writer.key("comment");
  if (issue.comment.has_value()) {
    writer.value(*issue.comment);
  } else {
    writer.null();
  }
  writer.end_object();
}

void write_tasks(common::JsonWriter &writer, const TaskOutcome &tasks) {
  writer.key("tasks")
      .begin_object()
      .field("file", tasks.file)
      .field("total", static_cast<std::uint64_t>(tasks.total))
      .field("completed", static_cast<std::uint64_t>(tasks.completed))
      .field("marked", static_cast<std::uint64_t>(tasks.marked))
      .end_object();
}

} // namespace

FinalizeResult FinalizeResult::error(std::string session_type, std::string error,
                                     std::string message, std::optional<PrSnapshot> pr) {
  FinalizeResult result;
  result.session_type = std::move(session_type);
  result.failure = FinalizeError{
      .error = std::move(error), .message = std::move(message), .pr = std::move(pr)};
  result.outcome = UnstructuredOutcome{};
  return result;
}

std::string FinalizeResult::to_json() const {
  common::JsonWriter writer;
  writer.begin_object();

  if (failure.has_value()) {
    writer.field("status", "error").field("error", failure->error);
    if (failure->pr.has_value()) {
      writer.key("pr")
          .begin_object()
          .field("number", failure->pr->number)
          .field("state", failure->pr->state)
          .field("merged", failure->pr->merged)
          .end_object();
    }
    writer.field("message", failure->message).end_object();
    return writer.str();
  }

  writer.field("status", "success")
      .field("pr_merged", true)
      .field("session_type", session_type);

  std::visit(session::overloaded{
                 [&](const GithubIssueOutcome &outcome) {
                   write_issue(writer, "issue", outcome.issue);
                   write_tasks(writer, tasks);
                 },
                 [&](const SpeckitOutcome &outcome) {
                   write_issue(writer, "phase_issue", outcome.phase_issue);
                   writer.key("parent_issue")
                       .begin_object()
                       .field("number", outcome.parent_issue.number)
                       .field("updated", outcome.parent_issue.updated)
                       .field("progress", outcome.parent_issue.progress)
                       .field("checklist_updated", outcome.parent_issue.checklist_updated)
                       .end_object();
                   write_tasks(writer, tasks);
                   writer.key("pr")
                       .begin_object()
                       .field("number", outcome.pr.number)
                       .field("description_updated", outcome.pr.description_updated)
                       .field("still_draft", outcome.pr.still_draft)
                       .field("reason", outcome.pr.reason)
                       .end_object();
                 },
                 [&](const UnstructuredOutcome &) {
                   writer.field("pr_number", pr_number);
                   write_tasks(writer, tasks);
                 },
             },
             outcome);

  writer.field("synced_to_projects", synced_to_projects);
  if (!warnings.empty()) {
    writer.key("warnings").begin_array();
    for (const auto &warning : warnings) {
      writer.value(warning);
    }
    writer.end_array();
  }
  writer.field("ready_for_wrap", ready_for_wrap).end_object();
  return writer.str();
}

} // namespace sessionflow::finalize
