#include "sessionflow/ledger/ledger.hpp"

#include "sessionflow/common/fs.hpp"

#include <cctype>
#include <optional>

namespace sessionflow::ledger {

namespace {

struct LineView {
  std::size_t number = 0;
  std::size_t begin = 0;
  // Excludes "\n" and a trailing "\r".
  std::size_t end = 0;
};

struct EntryMatch {
  TaskEntry entry;
  // Offset of the ' ', 'x' or 'X' marker.
  std::size_t marker_offset = 0;
};

std::vector<LineView> split_lines(const std::string &document) {
  std::vector<LineView> lines;
  std::size_t begin = 0;
  std::size_t number = 1;
  while (begin < document.size()) {
    std::size_t newline = document.find('\n', begin);
    const std::size_t next = newline == std::string::npos ? document.size() : newline + 1;
    std::size_t end = newline == std::string::npos ? document.size() : newline;
    if (end > begin && document[end - 1] == '\r') {
      --end;
    }
    lines.push_back(LineView{.number = number, .begin = begin, .end = end});
    begin = next;
    ++number;
  }
  return lines;
}

std::size_t skip_indent(const std::string &document, std::size_t pos, const std::size_t end) {
  while (pos < end && (document[pos] == ' ' || document[pos] == '\t')) {
    ++pos;
  }
  return pos;
}

bool is_fence(const std::string &document, const LineView &line) {
  const std::size_t pos = skip_indent(document, line.begin, line.end);
  return line.end - pos >= 3 &&
         (document.compare(pos, 3, "```") == 0 || document.compare(pos, 3, "~~~") == 0);
}

bool is_checkbox_line(const std::string &document, const LineView &line) {
  const std::size_t pos = skip_indent(document, line.begin, line.end);
  return line.end - pos >= 3 && (document[pos] == '-' || document[pos] == '*') &&
         document[pos + 1] == ' ' && document[pos + 2] == '[';
}

// Letters followed by digits, not followed by another alphanumeric.
std::size_t identifier_end(const std::string &document, std::size_t pos, const std::size_t end) {
  const std::size_t begin = pos;
  while (pos < end && std::isalpha(static_cast<unsigned char>(document[pos])) != 0) {
    ++pos;
  }
  const std::size_t letters_end = pos;
  while (pos < end && std::isdigit(static_cast<unsigned char>(document[pos])) != 0) {
    ++pos;
  }
  if (letters_end == begin || pos == letters_end ||
      (pos < end && std::isalnum(static_cast<unsigned char>(document[pos])) != 0)) {
    return std::string::npos;
  }
  return pos;
}

// "[-*] [ |x|X] <letters><digits>". Checkbox lines without an identifier (link bullets,
// plain checklists) are not entries; lines with an identifier but a bad marker or
// spacing are malformed.
LedgerResult<std::optional<EntryMatch>> match_entry(const std::string &document,
                                                    const LineView &line) {
  const auto malformed = [&](const std::string &why) {
    return LedgerResult<std::optional<EntryMatch>>::failure(LedgerError{
        .code = LedgerErrorCode::MalformedLedger,
        .line = line.number,
        .text = document.substr(line.begin, line.end - line.begin),
        .message = why,
    });
  };
  const auto not_entry = [] {
    return LedgerResult<std::optional<EntryMatch>>::success(std::nullopt);
  };

  const std::size_t marker_offset = skip_indent(document, line.begin, line.end) + 3;
  if (marker_offset + 1 >= line.end || document[marker_offset + 1] != ']') {
    return not_entry();
  }
  const std::size_t after_box = marker_offset + 2;
  const std::size_t id_begin = skip_indent(document, after_box, line.end);
  const std::size_t id_end = identifier_end(document, id_begin, line.end);
  if (id_end == std::string::npos) {
    return not_entry();
  }

  const char marker = document[marker_offset];
  if (marker != ' ' && marker != 'x' && marker != 'X') {
    return malformed("checkbox marker must be ' ', 'x' or 'X'");
  }
  if (id_begin == after_box) {
    return malformed("missing space before task identifier");
  }

  EntryMatch match;
  match.marker_offset = marker_offset;
  match.entry.done = marker != ' ';
  match.entry.line = line.number;
  match.entry.identifier = document.substr(id_begin, id_end - id_begin);
  return LedgerResult<std::optional<EntryMatch>>::success(std::move(match));
}

LedgerResult<std::vector<EntryMatch>> scan(const std::string &document) {
  std::vector<EntryMatch> matches;
  bool in_fence = false;
  for (const auto &line : split_lines(document)) {
    if (is_fence(document, line)) {
      in_fence = !in_fence;
      continue;
    }
    if (in_fence || !is_checkbox_line(document, line)) {
      continue;
    }
    auto match = match_entry(document, line);
    if (!match.ok()) {
      return LedgerResult<std::vector<EntryMatch>>::failure(match.error());
    }
    if (match.value().has_value()) {
      matches.push_back(std::move(*match.value()));
    }
  }
  return LedgerResult<std::vector<EntryMatch>>::success(std::move(matches));
}

} // namespace

std::string LedgerError::describe() const {
  if (code == LedgerErrorCode::MalformedLedger) {
    return "malformed ledger at line " + std::to_string(line) + ": " + message + ": " + text;
  }
  return message;
}

LedgerResult<std::vector<TaskEntry>> parse(const std::string &document) {
  auto scanned = scan(document);
  if (!scanned.ok()) {
    return LedgerResult<std::vector<TaskEntry>>::failure(scanned.error());
  }
  std::vector<TaskEntry> entries;
  entries.reserve(scanned.value().size());
  for (auto &match : scanned.value()) {
    entries.push_back(std::move(match.entry));
  }
  return LedgerResult<std::vector<TaskEntry>>::success(std::move(entries));
}

LedgerResult<MarkResult> mark_done(const std::string &document,
                                   const std::set<std::string> &identifiers) {
  auto scanned = scan(document);
  if (!scanned.ok()) {
    return LedgerResult<MarkResult>::failure(scanned.error());
  }
  MarkResult result{.text = document, .marked = 0};
  for (const auto &match : scanned.value()) {
    if (match.entry.done || !identifiers.contains(match.entry.identifier)) {
      continue;
    }
    result.text[match.marker_offset] = 'x';
    ++result.marked;
  }
  return LedgerResult<MarkResult>::success(std::move(result));
}

LedgerResult<TaskCounts> count(const std::string &document) {
  auto entries = parse(document);
  if (!entries.ok()) {
    return LedgerResult<TaskCounts>::failure(entries.error());
  }
  TaskCounts counts;
  counts.total = entries.value().size();
  for (const auto &entry : entries.value()) {
    if (entry.done) {
      ++counts.completed;
    }
  }
  return LedgerResult<TaskCounts>::success(counts);
}

bool is_task_identifier(const std::string &text) {
  return !text.empty() && identifier_end(text, 0, text.size()) == text.size();
}

LedgerResult<LedgerFile> read_ledger_file(const std::filesystem::path &path) {
  LedgerFile file{.path = path, .text = "", .exists = false};
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return LedgerResult<LedgerFile>::success(std::move(file));
  }
  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return LedgerResult<LedgerFile>::failure(LedgerError{
        .code = LedgerErrorCode::IoError, .line = 0, .text = path.string(),
        .message = content.error()});
  }
  file.text = content.value();
  file.exists = true;
  return LedgerResult<LedgerFile>::success(std::move(file));
}

common::Result<void, LedgerError> write_ledger_file(const std::filesystem::path &path,
                                                    const std::string &text) {
  auto written = common::write_text_file_atomic(path, text);
  if (!written.ok()) {
    return common::Result<void, LedgerError>::failure(LedgerError{
        .code = LedgerErrorCode::IoError, .line = 0, .text = path.string(),
        .message = written.error()});
  }
  return common::Result<void, LedgerError>::success();
}

} // namespace sessionflow::ledger
