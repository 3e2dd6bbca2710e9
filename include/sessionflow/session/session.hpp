#pragma once

#include "sessionflow/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sessionflow::session {

inline constexpr const char *kSchemaVersion = "2.2";

struct GithubIssueDetails {
  std::optional<std::uint64_t> issue_number;
  std::string issue_title;
};

/// One phase of a multi-phase feature tracked by a parent issue.
struct SpeckitDetails {
  std::optional<std::uint64_t> phase_issue;
  std::optional<std::uint64_t> parent_issue;
  std::string feature_id;
  // As recorded ("specs/<feature_id>"); kept for round trips.
  std::string spec_dir;
};

struct UnstructuredDetails {
  std::string goal;
};

using SessionDetails = std::variant<GithubIssueDetails, SpeckitDetails, UnstructuredDetails>;

struct Session {
  std::string session_id;
  std::string schema_version = kSchemaVersion;
  std::string workflow = "development";
  std::string stage;
  std::string created_at;
  SessionDetails details;
  std::optional<std::uint64_t> pr_number;
  std::vector<std::string> touched_tasks;
  std::optional<std::string> tasks_file;
};

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

/// "github_issue", "speckit" or "unstructured".
[[nodiscard]] std::string_view session_type(const Session &session);

/// The issue a session works on: the issue for github_issue, the phase issue
/// for speckit.
[[nodiscard]] std::optional<std::uint64_t> primary_issue(const Session &session);

/// Lenient: absent optional fields stay absent. Fails on unreadable JSON, a
/// missing session_id, an unknown type or a github_issue with a parent_issue.
[[nodiscard]] common::Result<Session> parse_session(const std::string &json);
[[nodiscard]] std::string serialize_session(const Session &session);

/// Checks the per-type invariants the engines rely on.
[[nodiscard]] common::Status validate_session(const Session &session);

/// YYYY-MM-DD-N
[[nodiscard]] bool is_valid_session_id(const std::string &session_id);

} // namespace sessionflow::session
