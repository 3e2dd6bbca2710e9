#pragma once

#include "sessionflow/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace sessionflow::ledger {

struct TaskEntry {
  std::string identifier;
  bool done = false;
  // 1-based
  std::size_t line = 0;
};

enum class LedgerErrorCode {
  MalformedLedger,
  IoError,
};

struct LedgerError {
  LedgerErrorCode code = LedgerErrorCode::MalformedLedger;
  std::size_t line = 0;
  std::string text;
  std::string message;

  [[nodiscard]] std::string describe() const;
};

template <typename T> using LedgerResult = common::Result<T, LedgerError>;

struct TaskCounts {
  std::size_t total = 0;
  std::size_t completed = 0;
};

struct MarkResult {
  std::string text;
  std::size_t marked = 0;
};

/// Checkbox lines ("- [" or "* [" after indentation) outside fenced code
/// blocks must read "- [ ] T042 ..." or "- [x] T042 ...".
[[nodiscard]] LedgerResult<std::vector<TaskEntry>> parse(const std::string &document);

/// Flips the marker byte of each open entry named in identifiers. Unknown
/// identifiers are ignored; done entries are neither changed nor counted.
[[nodiscard]] LedgerResult<MarkResult> mark_done(const std::string &document,
                                                 const std::set<std::string> &identifiers);

[[nodiscard]] LedgerResult<TaskCounts> count(const std::string &document);

/// Letters followed by digits, e.g. "T042".
[[nodiscard]] bool is_task_identifier(const std::string &text);

struct LedgerFile {
  std::filesystem::path path;
  std::string text;
  bool exists = false;
};

/// A missing file reads as an empty ledger with exists == false.
[[nodiscard]] LedgerResult<LedgerFile> read_ledger_file(const std::filesystem::path &path);
[[nodiscard]] common::Result<void, LedgerError> write_ledger_file(const std::filesystem::path &path,
                                                                  const std::string &text);

} // namespace sessionflow::ledger
