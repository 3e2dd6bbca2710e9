#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sessionflow::finalize {

struct ChecklistProgress {
  std::size_t complete = 0;
  std::size_t total = 0;

  [[nodiscard]] bool all_complete() const { return total > 0 && complete == total; }
  /// "4/6 phases complete"
  [[nodiscard]] std::string text() const;
};

/// Counts "- [ ]" / "- [x]" lines outside fenced blocks that reference an issue ("#<n>").
[[nodiscard]] ChecklistProgress checklist_progress(const std::string &body);

enum class PhaseLineState {
  Missing,
  Ambiguous,
  Open,
  Checked,
};

struct PhaseToggle {
  PhaseLineState state = PhaseLineState::Missing;
  // Input with at most one marker byte changed.
  std::string body;
};

/// Finds the unique checklist line mentioning "#<phase_issue>" and checks it.
/// Every other byte of the body is left as is.
[[nodiscard]] PhaseToggle check_phase_line(const std::string &body, std::uint64_t phase_issue);

} // namespace sessionflow::finalize
