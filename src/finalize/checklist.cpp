#include "sessionflow/finalize/checklist.hpp"

#include <cctype>
#include <optional>
#include <vector>

namespace sessionflow::finalize {

namespace {

struct ChecklistLine {
  std::size_t begin = 0;
  std::size_t end = 0;
  std::size_t marker = 0;
  bool checked = false;
};

std::vector<ChecklistLine> checklist_lines(const std::string &body) {
  std::vector<ChecklistLine> lines;
  bool in_fence = false;
  std::size_t begin = 0;
  while (begin < body.size()) {
    const std::size_t newline = body.find('\n', begin);
    const std::size_t end = newline == std::string::npos ? body.size() : newline;

    std::size_t pos = begin;
    while (pos < end && (body[pos] == ' ' || body[pos] == '\t')) {
      ++pos;
    }
    if (end - pos >= 3 && (body.compare(pos, 3, "```") == 0 || body.compare(pos, 3, "~~~") == 0)) {
      in_fence = !in_fence;
    } else if (!in_fence && end - pos >= 5 && (body[pos] == '-' || body[pos] == '*') &&
               body[pos + 1] == ' ' && body[pos + 2] == '[' && body[pos + 4] == ']') {
      const char marker = body[pos + 3];
      if (marker == ' ' || marker == 'x' || marker == 'X') {
        lines.push_back(ChecklistLine{
            .begin = begin, .end = end, .marker = pos + 3, .checked = marker != ' '});
      }
    }

    if (newline == std::string::npos) {
      break;
    }
    begin = newline + 1;
  }
  return lines;
}

bool mentions_issue(const std::string &body, const ChecklistLine &line,
                    const std::string &needle) {
  std::size_t pos = line.begin;
  while ((pos = body.find(needle, pos)) != std::string::npos && pos + needle.size() <= line.end) {
    const std::size_t after = pos + needle.size();
    if (after >= line.end || std::isdigit(static_cast<unsigned char>(body[after])) == 0) {
      return true;
    }
    pos = after;
  }
  return false;
}

// "#<digits>" anywhere on the line.
bool has_issue_reference(const std::string &body, const ChecklistLine &line) {
  for (std::size_t pos = line.begin; pos + 1 < line.end; ++pos) {
    if (body[pos] == '#' && std::isdigit(static_cast<unsigned char>(body[pos + 1])) != 0) {
      return true;
    }
  }
  return false;
}

} // namespace

std::string ChecklistProgress::text() const {
  return std::to_string(complete) + "/" + std::to_string(total) + " phases complete";
}

ChecklistProgress checklist_progress(const std::string &body) {
  ChecklistProgress progress;
  for (const auto &line : checklist_lines(body)) {
    if (!has_issue_reference(body, line)) {
      continue;
    }
    ++progress.total;
    if (line.checked) {
      ++progress.complete;
    }
  }
  return progress;
}

PhaseToggle check_phase_line(const std::string &body, const std::uint64_t phase_issue) {
  const std::string needle = "#" + std::to_string(phase_issue);
  std::optional<ChecklistLine> match;
  for (const auto &line : checklist_lines(body)) {
    if (!mentions_issue(body, line, needle)) {
      continue;
    }
    if (match.has_value()) {
      return PhaseToggle{.state = PhaseLineState::Ambiguous, .body = body};
    }
    match = line;
  }

  if (!match.has_value()) {
    return PhaseToggle{.state = PhaseLineState::Missing, .body = body};
  }
  if (match->checked) {
    return PhaseToggle{.state = PhaseLineState::Checked, .body = body};
  }
  PhaseToggle toggle{.state = PhaseLineState::Open, .body = body};
  toggle.body[match->marker] = 'x';
  return toggle;
}

} // namespace sessionflow::finalize
