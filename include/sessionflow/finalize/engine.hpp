#pragma once

#include "sessionflow/finalize/result.hpp"
#include "sessionflow/gateway/gateway.hpp"
#include "sessionflow/session/session.hpp"

#include <filesystem>
#include <string>

namespace sessionflow::finalize {

/// Everything a finalize run needs besides the gateway. The CLI builds it from
/// the active session; tests build it directly.
struct FinalizeContext {
  session::Session session;
  std::filesystem::path session_dir;
  std::filesystem::path specs_dir = "specs";
  // Used to find the PR when the session has no pr_number.
  std::string branch;
  bool sync_enabled = false;
};

/// Post-merge reconciliation: PR gate, per-type issue and ledger updates,
/// best-effort board sync. Safe to re-run after partial failure.
class FinalizeEngine {
public:
  explicit FinalizeEngine(gateway::Gateway &gateway);

  [[nodiscard]] FinalizeResult run(const FinalizeContext &context);

private:
  gateway::Gateway &gateway_;
};

[[nodiscard]] std::string phase_note_marker(std::uint64_t phase_issue);

/// Appends the phase note unless its marker is already present.
[[nodiscard]] std::string append_phase_note(const std::string &body, std::uint64_t phase_issue,
                                            std::uint64_t pr_number, const std::string &progress);

/// Ledger location for a session: specs/<feature_id>/tasks.md for speckit,
/// tasks_file or <session_dir>/tasks.md otherwise.
[[nodiscard]] std::filesystem::path ledger_path(const FinalizeContext &context);

/// Board milestone: feature id, "issue-<n>" or "session-<id>".
[[nodiscard]] std::string sync_milestone(const session::Session &session);

} // namespace sessionflow::finalize
