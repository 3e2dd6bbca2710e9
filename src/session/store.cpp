#include "sessionflow/session/store.hpp"

#include "sessionflow/common/fs.hpp"

#include <algorithm>

namespace sessionflow::session {

SessionStore::SessionStore(std::filesystem::path root_dir) : root_dir_(std::move(root_dir)) {}

std::filesystem::path SessionStore::active_pointer_path() const {
  return root_dir_ / "ACTIVE_SESSION";
}

std::filesystem::path SessionStore::session_dir(const std::string &session_id) const {
  return root_dir_ / "sessions" / session_id.substr(0, 7) / session_id;
}

std::filesystem::path SessionStore::info_path(const std::string &session_id) const {
  return session_dir(session_id) / "session-info.json";
}

common::Result<std::optional<std::string>> SessionStore::active_session_id() const {
  using ActiveResult = common::Result<std::optional<std::string>>;
  std::error_code ec;
  if (!std::filesystem::exists(active_pointer_path(), ec)) {
    return ActiveResult::success(std::nullopt);
  }
  auto content = common::read_text_file(active_pointer_path());
  if (!content.ok()) {
    return ActiveResult::failure(content.error());
  }
  const std::string id = common::trim(content.value());
  if (id.empty()) {
    return ActiveResult::success(std::nullopt);
  }
  return ActiveResult::success(id);
}

common::Status SessionStore::set_active(const std::string &session_id) {
  if (!is_valid_session_id(session_id)) {
    return common::Status::error("invalid session id '" + session_id + "'");
  }
  return common::write_text_file_atomic(active_pointer_path(), session_id + "\n");
}

common::Status SessionStore::clear_active() {
  std::error_code ec;
  std::filesystem::remove(active_pointer_path(), ec);
  if (ec) {
    return common::Status::error("failed to remove active session pointer: " + ec.message());
  }
  return common::Status::success();
}

common::Result<Session> SessionStore::load(const std::string &session_id) const {
  if (!is_valid_session_id(session_id)) {
    return common::Result<Session>::failure("invalid session id '" + session_id + "'");
  }
  const auto path = info_path(session_id);
  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Session>::failure("cannot read session record " + path.string() + ": " +
                                            content.error());
  }
  auto parsed = parse_session(content.value());
  if (!parsed.ok()) {
    return common::Result<Session>::failure(path.string() + ": " + parsed.error());
  }
  if (parsed.value().session_id != session_id) {
    return common::Result<Session>::failure(path.string() + ": session_id '" +
                                            parsed.value().session_id +
                                            "' does not match its directory");
  }
  return parsed;
}

common::Result<Session> SessionStore::load_active() const {
  auto active = active_session_id();
  if (!active.ok()) {
    return common::Result<Session>::failure(active.error());
  }
  if (!active.value().has_value()) {
    return common::Result<Session>::failure("No active session");
  }
  return load(*active.value());
}

common::Status SessionStore::save(const Session &session) {
  if (!is_valid_session_id(session.session_id)) {
    return common::Status::error("invalid session id '" + session.session_id + "'");
  }
  auto dir = common::ensure_dir(session_dir(session.session_id));
  if (!dir.ok()) {
    return common::Status::error(dir.error());
  }
  return common::write_text_file_atomic(info_path(session.session_id),
                                        serialize_session(session));
}

common::Result<Session> SessionStore::record_touched_tasks(const std::vector<std::string> &ids) {
  auto loaded = load_active();
  if (!loaded.ok()) {
    return loaded;
  }
  Session session = loaded.value();
  for (const auto &raw : ids) {
    const std::string id = common::trim(raw);
    if (id.empty()) {
      continue;
    }
    if (std::find(session.touched_tasks.begin(), session.touched_tasks.end(), id) ==
        session.touched_tasks.end()) {
      session.touched_tasks.push_back(id);
    }
  }
  if (auto saved = save(session); !saved.ok()) {
    return common::Result<Session>::failure(saved.error());
  }
  return common::Result<Session>::success(std::move(session));
}

common::Status SessionStore::set_pr_number(const std::string &session_id,
                                           const std::uint64_t number) {
  auto loaded = load(session_id);
  if (!loaded.ok()) {
    return common::Status::error(loaded.error());
  }
  Session session = loaded.value();
  if (session.pr_number == number) {
    return common::Status::success();
  }
  session.pr_number = number;
  return save(session);
}

} // namespace sessionflow::session
