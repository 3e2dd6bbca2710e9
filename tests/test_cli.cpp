#include "test_framework.hpp"

#include "sessionflow/cli/commands.hpp"
#include "sessionflow/config/config.hpp"
#include "sessionflow/http/client.hpp"
#include "sessionflow/observability/global.hpp"
#include "sessionflow/session/store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <iostream>
#include <sstream>

namespace {

namespace session = sessionflow::session;
using sessionflow::testing::TempWorkspace;

struct CliRun {
  int exit_code = 0;
  std::string out;
};

class CoutCapture {
public:
  CoutCapture() : old_(std::cout.rdbuf(buffer_.rdbuf())) {}
  ~CoutCapture() { std::cout.rdbuf(old_); }

  CoutCapture(const CoutCapture &) = delete;
  CoutCapture &operator=(const CoutCapture &) = delete;

  [[nodiscard]] std::string str() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf *old_;
};

/// Temp config pointing the session store into the workspace, with one
/// active github_issue session.
struct CliFixture {
  TempWorkspace workspace;

  CliFixture() {
    workspace.create_file("config.toml", "[github]\nrepository = \"acme/widgets\"\n"
                                         "token = \"test-token\"\n\n[session]\nroot = \"" +
                                             (workspace.path() / "store").string() +
                                             "\"\n\n[observability]\nbackend = \"none\"\n");
    session::SessionStore store(workspace.path() / "store");
    session::Session record;
    record.session_id = "2025-01-31-1";
    record.created_at = "2025-01-31T10:00:00Z";
    record.details = session::GithubIssueDetails{.issue_number = 42, .issue_title = "Crash"};
    record.tasks_file = (workspace.path() / "tasks.md").string();
    if (!store.save(record).ok() || !store.set_active(record.session_id).ok()) {
      throw std::runtime_error("cannot seed session store");
    }
    workspace.create_file("tasks.md", "- [x] T001 Reproduce\n- [ ] T002 Fix\n- [ ] T003 Test\n");
  }

  ~CliFixture() {
    sessionflow::config::clear_config_path_override();
    sessionflow::observability::set_global_observer(nullptr);
  }

  CliRun run(std::vector<std::string> args) {
    args.insert(args.begin(), {"sessionflow", "--config", (workspace.path() / "config.toml").string()});
    std::vector<char *> argv;
    argv.reserve(args.size());
    for (auto &arg : args) {
      argv.push_back(arg.data());
    }
    CliRun result;
    CoutCapture capture;
    result.exit_code = sessionflow::cli::run_cli(static_cast<int>(argv.size()), argv.data());
    result.out = capture.str();
    return result;
  }
};

} // namespace

void register_cli_tests(std::vector<sessionflow::tests::TestCase> &tests) {
  using sessionflow::tests::require;

  tests.push_back({"cli_version_and_help", [] {
                     CliFixture fx;
                     const auto version = fx.run({"version"});
                     require(version.exit_code == 0, "version exit code");
                     require(version.out.starts_with("sessionflow "), version.out);
                     const std::string agent = sessionflow::http::user_agent();
                     require(agent.starts_with("sessionflow/"), agent);
                     require(version.out.starts_with("sessionflow " + agent.substr(12)),
                             "user agent carries the release version: " + agent);
                     const auto help = fx.run({"help"});
                     require(help.out.find("finalize [--json]") != std::string::npos, help.out);
                   }});

  tests.push_back({"cli_status_json", [] {
                     CliFixture fx;
                     const auto status = fx.run({"status", "--json"});
                     require(status.exit_code == 0, "status exit code");
                     require(status.out.find("\"session_type\": \"github_issue\"") != std::string::npos,
                             status.out);
                     require(status.out.find("\"issue_number\": 42") != std::string::npos, status.out);
                     require(status.out.find("\"completed\": 1") != std::string::npos, status.out);
                   }});

  tests.push_back({"cli_tasks_touch_records_ids", [] {
                     CliFixture fx;
                     const auto touched = fx.run({"tasks", "touch", "T002", "T003", "T002"});
                     require(touched.exit_code == 0, "touch exit code");
                     require(touched.out == "Touched tasks (2): T002 T003\n", touched.out);

                     session::SessionStore store(fx.workspace.path() / "store");
                     const auto loaded = store.load_active();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().touched_tasks ==
                                 std::vector<std::string>({"T002", "T003"}),
                             "persisted touched tasks");

                     const auto listing = fx.run({"tasks", "status"});
                     require(listing.out.find("  [ ] T002  (touched)") != std::string::npos,
                             listing.out);
                   }});

  tests.push_back({"cli_tasks_touch_rejects_bad_id", [] {
                     CliFixture fx;
                     const auto touched = fx.run({"tasks", "touch", "fix-it", "--json"});
                     require(touched.exit_code == 1, "invalid id fails");
                     require(touched.out.find("\"error\": \"Invalid task identifier\"") !=
                                 std::string::npos,
                             touched.out);
                   }});

  tests.push_back({"cli_publish_requires_title_before_any_io", [] {
                     CliFixture fx;
                     const auto published = fx.run({"publish", "--json", "--draft", "--ready"});
                     require(published.exit_code == 1, "conflicting flags fail");
                     require(published.out.find("mutually exclusive") != std::string::npos,
                             published.out);
                   }});

  tests.push_back({"cli_finalize_without_session", [] {
                     CliFixture fx;
                     session::SessionStore store(fx.workspace.path() / "store");
                     require(store.clear_active().ok(), "clear active");
                     const auto finalized = fx.run({"finalize", "--json"});
                     require(finalized.exit_code == 1, "no session fails");
                     require(finalized.out.find("\"error\": \"No active session\"") !=
                                 std::string::npos,
                             finalized.out);
                   }});

  tests.push_back({"cli_config_show_masks_token", [] {
                     CliFixture fx;
                     const sessionflow::testing::EnvGuard token("SESSIONFLOW_GITHUB_TOKEN",
                                                                std::nullopt);
                     const auto shown = fx.run({"config", "show"});
                     require(shown.exit_code == 0, "config show exit code");
                     require(shown.out.find("repository = \"acme/widgets\"") != std::string::npos,
                             shown.out);
                     require(shown.out.find("test-token") == std::string::npos, "token masked");
                   }});

  tests.push_back({"cli_unknown_command", [] {
                     CliFixture fx;
                     require(fx.run({"deploy"}).exit_code == 1, "unknown command fails");
                   }});
}
