#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sessionflow::finalize {

struct PrSnapshot {
  std::uint64_t number = 0;
  // "open", "closed" or "not_found"
  std::string state;
  bool merged = false;
};

struct IssueOutcome {
  std::uint64_t number = 0;
  bool closed = false;
  // Comment posted by this run; empty when the issue was already closed.
  std::optional<std::string> comment;
};

struct TaskOutcome {
  std::string file;
  std::size_t total = 0;
  std::size_t completed = 0;
  std::size_t marked = 0;
  bool found = false;
};

struct ParentOutcome {
  std::uint64_t number = 0;
  // Body written by this run.
  bool updated = false;
  std::string progress;
  // Phase line is checked after this run.
  bool checklist_updated = false;
};

struct DraftOutcome {
  std::uint64_t number = 0;
  bool description_updated = false;
  bool still_draft = false;
  std::string reason;
};

struct GithubIssueOutcome {
  IssueOutcome issue;
};

struct SpeckitOutcome {
  IssueOutcome phase_issue;
  ParentOutcome parent_issue;
  DraftOutcome pr;
};

struct UnstructuredOutcome {};

using SessionOutcome = std::variant<GithubIssueOutcome, SpeckitOutcome, UnstructuredOutcome>;

struct FinalizeError {
  std::string error;
  std::string message;
  std::optional<PrSnapshot> pr;
};

/// Built once per finalize run.
struct FinalizeResult {
  std::string session_id;
  std::string session_type;
  std::optional<FinalizeError> failure;
  std::uint64_t pr_number = 0;
  SessionOutcome outcome;
  TaskOutcome tasks;
  bool synced_to_projects = false;
  bool ready_for_wrap = false;
  std::vector<std::string> warnings;

  [[nodiscard]] bool ok() const { return !failure.has_value(); }
  [[nodiscard]] std::string to_json() const;

  [[nodiscard]] static FinalizeResult error(std::string session_type, std::string error,
                                            std::string message,
                                            std::optional<PrSnapshot> pr = std::nullopt);
};

} // namespace sessionflow::finalize
