#pragma once

#include "sessionflow/finalize/result.hpp"
#include "sessionflow/ledger/ledger.hpp"
#include "sessionflow/publish/engine.hpp"
#include "sessionflow/session/session.hpp"

#include <optional>
#include <string>

namespace sessionflow::report {

[[nodiscard]] std::string render_finalize(const finalize::FinalizeResult &result);
[[nodiscard]] std::string render_publish(const publish::PublishResult &result);

struct SessionSummary {
  session::Session session;
  std::string session_dir;
  std::string tasks_file;
  std::optional<ledger::TaskCounts> counts;
};

[[nodiscard]] std::string render_status(const SessionSummary &summary);
[[nodiscard]] std::string status_to_json(const SessionSummary &summary);

} // namespace sessionflow::report
