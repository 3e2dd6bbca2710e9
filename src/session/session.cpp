#include "sessionflow/session/session.hpp"

#include "sessionflow/common/fs.hpp"
#include "sessionflow/common/json_util.hpp"

#include <cctype>

namespace sessionflow::session {

namespace {

std::string basename_of(std::string path) {
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  const auto slash = path.rfind('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool all_digits(const std::string &text, const std::size_t from, const std::size_t to) {
  if (from >= to || to > text.size()) {
    return false;
  }
  for (std::size_t i = from; i < to; ++i) {
    if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
      return false;
    }
  }
  return true;
}

} // namespace

std::string_view session_type(const Session &session) {
  return std::visit(overloaded{
                        [](const GithubIssueDetails &) { return std::string_view("github_issue"); },
                        [](const SpeckitDetails &) { return std::string_view("speckit"); },
                        [](const UnstructuredDetails &) {
                          return std::string_view("unstructured");
                        },
                    },
                    session.details);
}

std::optional<std::uint64_t> primary_issue(const Session &session) {
  return std::visit(
      overloaded{
          [](const GithubIssueDetails &details) { return details.issue_number; },
          [](const SpeckitDetails &details) { return details.phase_issue; },
          [](const UnstructuredDetails &) { return std::optional<std::uint64_t>(); },
      },
      session.details);
}

bool is_valid_session_id(const std::string &session_id) {
  // 2025-01-31-1
  if (session_id.size() < 12 || session_id[4] != '-' || session_id[7] != '-' ||
      session_id[10] != '-') {
    return false;
  }
  return all_digits(session_id, 0, 4) && all_digits(session_id, 5, 7) &&
         all_digits(session_id, 8, 10) && all_digits(session_id, 11, session_id.size());
}

common::Result<Session> parse_session(const std::string &json) {
  const auto object = common::json_parse_object(json);
  if (!object.has_value()) {
    return common::Result<Session>::failure("session record is not a JSON object");
  }

  Session session;
  session.session_id = common::json_member_string(*object, "session_id");
  if (session.session_id.empty()) {
    return common::Result<Session>::failure("session record has no session_id");
  }
  session.schema_version = common::json_member_string(*object, "schema_version", kSchemaVersion);
  session.workflow = common::json_member_string(*object, "workflow", "development");
  session.stage = common::json_member_string(*object, "stage");
  session.created_at = common::json_member_string(*object, "created_at");
  session.pr_number = common::json_member_u64(*object, "pr_number");
  if (const auto it = object->find("touched_tasks"); it != object->end()) {
    session.touched_tasks = common::json_parse_string_array(it->second);
  }
  if (const std::string tasks_file = common::json_member_string(*object, "tasks_file");
      !tasks_file.empty()) {
    session.tasks_file = tasks_file;
  }

  const std::string type = common::json_member_string(*object, "type", "unstructured");
  if (type == "github_issue") {
    if (common::json_member_u64(*object, "parent_issue").has_value()) {
      return common::Result<Session>::failure("github_issue session must not have parent_issue");
    }
    session.details = GithubIssueDetails{
        .issue_number = common::json_member_u64(*object, "issue_number"),
        .issue_title = common::json_member_string(*object, "issue_title"),
    };
  } else if (type == "speckit") {
    SpeckitDetails details;
    details.phase_issue = common::json_member_u64(*object, "issue_number");
    details.parent_issue = common::json_member_u64(*object, "parent_issue");
    details.spec_dir = common::json_member_string(*object, "spec_dir");
    details.feature_id = common::json_member_string(*object, "feature_id");
    if (details.feature_id.empty() && !details.spec_dir.empty()) {
      details.feature_id = basename_of(details.spec_dir);
    }
    session.details = std::move(details);
  } else if (type == "unstructured") {
    session.details = UnstructuredDetails{.goal = common::json_member_string(*object, "goal")};
  } else {
    return common::Result<Session>::failure("unknown session type '" + type + "'");
  }

  return common::Result<Session>::success(std::move(session));
}

std::string serialize_session(const Session &session) {
  common::JsonWriter writer;
  writer.begin_object()
      .field("schema_version", session.schema_version)
      .field("session_id", session.session_id)
      .field("type", std::string(session_type(session)))
      .field("workflow", session.workflow);
  if (!session.stage.empty()) {
    writer.field("stage", session.stage);
  }
  writer.field("created_at", session.created_at);

  std::visit(overloaded{
                 [&](const GithubIssueDetails &details) {
                   if (details.issue_number.has_value()) {
                     writer.field("issue_number", *details.issue_number);
                   }
                   if (!details.issue_title.empty()) {
                     writer.field("issue_title", details.issue_title);
                   }
                 },
                 [&](const SpeckitDetails &details) {
                   if (!details.spec_dir.empty()) {
                     writer.field("spec_dir", details.spec_dir);
                   }
                   if (!details.feature_id.empty()) {
                     writer.field("feature_id", details.feature_id);
                   }
                   if (details.phase_issue.has_value()) {
                     writer.field("issue_number", *details.phase_issue);
                   }
                   if (details.parent_issue.has_value()) {
                     writer.field("parent_issue", *details.parent_issue);
                   }
                 },
                 [&](const UnstructuredDetails &details) {
                   if (!details.goal.empty()) {
                     writer.field("goal", details.goal);
                   }
                 },
             },
             session.details);

  if (session.pr_number.has_value()) {
    writer.field("pr_number", *session.pr_number);
  }
  if (session.tasks_file.has_value()) {
    writer.field("tasks_file", *session.tasks_file);
  }
  if (!session.touched_tasks.empty()) {
    writer.key("touched_tasks").begin_array();
    for (const auto &task : session.touched_tasks) {
      writer.value(task);
    }
    writer.end_array();
  }
  writer.end_object();
  return writer.str() + "\n";
}

common::Status validate_session(const Session &session) {
  if (session.session_id.empty()) {
    return common::Status::error("session_id is empty");
  }
  return std::visit(
      overloaded{
          [](const GithubIssueDetails &details) {
            if (!details.issue_number.has_value()) {
              return common::Status::error("github_issue session has no issue_number");
            }
            return common::Status::success();
          },
          [](const SpeckitDetails &details) {
            if (details.feature_id.empty()) {
              return common::Status::error("speckit session has no feature_id");
            }
            if (!details.parent_issue.has_value()) {
              return common::Status::error("speckit session has no parent_issue");
            }
            if (!details.phase_issue.has_value()) {
              return common::Status::error("speckit session has no phase issue_number");
            }
            return common::Status::success();
          },
          [](const UnstructuredDetails &) { return common::Status::success(); },
      },
      session.details);
}

} // namespace sessionflow::session
