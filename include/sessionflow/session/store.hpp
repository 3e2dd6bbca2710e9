#pragma once

#include "sessionflow/common/result.hpp"
#include "sessionflow/session/session.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sessionflow::session {

/// Session records under <root>/sessions/<YYYY-MM>/<id>/session-info.json and
/// the active pointer at <root>/ACTIVE_SESSION.
class SessionStore {
public:
  explicit SessionStore(std::filesystem::path root_dir);

  [[nodiscard]] const std::filesystem::path &root() const { return root_dir_; }
  [[nodiscard]] std::filesystem::path active_pointer_path() const;
  [[nodiscard]] std::filesystem::path session_dir(const std::string &session_id) const;
  [[nodiscard]] std::filesystem::path info_path(const std::string &session_id) const;

  [[nodiscard]] common::Result<std::optional<std::string>> active_session_id() const;
  [[nodiscard]] common::Status set_active(const std::string &session_id);
  [[nodiscard]] common::Status clear_active();

  [[nodiscard]] common::Result<Session> load(const std::string &session_id) const;
  /// Fails with "No active session" when the pointer is missing or empty.
  [[nodiscard]] common::Result<Session> load_active() const;
  [[nodiscard]] common::Status save(const Session &session);

  /// Appends identifiers not yet recorded, keeping first-touch order.
  [[nodiscard]] common::Result<Session> record_touched_tasks(const std::vector<std::string> &ids);
  [[nodiscard]] common::Status set_pr_number(const std::string &session_id, std::uint64_t number);

private:
  std::filesystem::path root_dir_;
};

} // namespace sessionflow::session
