#include "sessionflow/cli/commands.hpp"

#include "sessionflow/common/fs.hpp"
#include "sessionflow/common/json_util.hpp"
#include "sessionflow/common/process.hpp"
#include "sessionflow/config/config.hpp"
#include "sessionflow/finalize/engine.hpp"
#include "sessionflow/gateway/github_gateway.hpp"
#include "sessionflow/git/workspace.hpp"
#include "sessionflow/http/client.hpp"
#include "sessionflow/ledger/ledger.hpp"
#include "sessionflow/observability/factory.hpp"
#include "sessionflow/observability/global.hpp"
#include "sessionflow/publish/engine.hpp"
#include "sessionflow/report/reporter.hpp"
#include "sessionflow/session/store.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>
#include <vector>

namespace sessionflow::cli {

namespace {

std::string version_string() {
#ifdef SESSIONFLOW_VERSION
  std::string version = SESSIONFLOW_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef SESSIONFLOW_GIT_COMMIT
  const std::string commit = SESSIONFLOW_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "sessionflow " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

// Returns false when the option is absent; missing_value is set when the
// option is present without a value.
bool take_option(std::vector<std::string> &args, const std::string &name, std::string &out_value,
                 bool &missing_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      if (i + 1 >= args.size()) {
        missing_value = true;
        args.erase(args.begin() + static_cast<long>(i));
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], name + "=")) {
      out_value = args[i].substr(name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<std::uint64_t> parse_number(const std::string &text) {
  std::string digits = common::trim(text);
  if (!digits.empty() && digits.front() == '#') {
    digits.erase(digits.begin());
  }
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size() || value == 0) {
    return std::nullopt;
  }
  return value;
}

/// Prints an error the way the command would print its result.
int report_error(const bool json, const std::string &error, const std::string &message = "") {
  if (json) {
    common::JsonWriter writer;
    writer.begin_object().field("status", "error").field("error", error);
    if (!message.empty()) {
      writer.field("message", message);
    }
    writer.end_object();
    std::cout << writer.str() << "\n";
  } else {
    std::cerr << error;
    if (!message.empty()) {
      std::cerr << ": " << message;
    }
    std::cerr << "\n";
  }
  return 1;
}

/// Shared setup: configuration, logging and the session store.
struct Environment {
  config::Config config;
  std::filesystem::path repo_dir;
};

std::optional<Environment> load_environment(const bool json) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    report_error(json, "Config error", loaded.error());
    return std::nullopt;
  }
  observability::set_global_observer(observability::create_observer(loaded.value()));

  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    report_error(json, "Config error", validated.error());
    return std::nullopt;
  }
  for (const auto &warning : validated.value()) {
    observability::record_warning("config", warning);
  }

  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    report_error(json, "Cannot determine working directory", ec.message());
    return std::nullopt;
  }
  return Environment{.config = loaded.value(), .repo_dir = std::move(cwd)};
}

session::SessionStore open_store(const Environment &env) {
  std::filesystem::path root = common::expand_path(env.config.session.root);
  if (root.is_relative()) {
    root = env.repo_dir / root;
  }
  return session::SessionStore(std::move(root));
}

std::filesystem::path specs_dir(const Environment &env) {
  std::filesystem::path dir = common::expand_path(env.config.session.specs_dir);
  if (dir.is_relative()) {
    dir = env.repo_dir / dir;
  }
  return dir;
}

finalize::FinalizeContext make_context(const Environment &env, const session::SessionStore &store,
                                       const session::Session &session) {
  finalize::FinalizeContext context;
  context.session = session;
  context.session_dir = store.session_dir(session.session_id);
  context.specs_dir = specs_dir(env);
  context.sync_enabled = env.config.projects.sync_enabled;
  if (context.session.tasks_file.has_value()) {
    std::filesystem::path tasks = *context.session.tasks_file;
    if (tasks.is_relative()) {
      context.session.tasks_file = (env.repo_dir / tasks).string();
    }
  }
  return context;
}

common::Result<std::string> resolve_repository(const Environment &env, git::GitWorkspace &git) {
  if (!common::trim(env.config.github.repository).empty()) {
    return common::Result<std::string>::success(common::trim(env.config.github.repository));
  }
  return git.remote_slug();
}

int run_finalize(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  std::string branch;
  bool missing_value = false;
  const bool has_branch = take_option(args, "--branch", branch, missing_value);
  if (missing_value) {
    return report_error(json, "Missing value for --branch");
  }
  if (!args.empty()) {
    return report_error(json, "Unknown option", args.front());
  }

  auto env = load_environment(json);
  if (!env.has_value()) {
    return 1;
  }
  auto store = open_store(*env);
  auto session = store.load_active();
  if (!session.ok()) {
    return report_error(json, session.error());
  }

  common::SubprocessRunner runner;
  git::GitCli git(runner, env->repo_dir, env->config.publish.base_branch);
  auto context = make_context(*env, store, session.value());
  if (has_branch) {
    context.branch = branch;
  } else if (!session.value().pr_number.has_value()) {
    auto current = git.current_branch();
    if (!current.ok()) {
      return report_error(json, "Git error", current.error());
    }
    context.branch = current.value();
  }

  auto repository = resolve_repository(*env, git);
  if (!repository.ok()) {
    return report_error(json, "Cannot determine repository", repository.error());
  }
  http::CurlHttpClient http;
  gateway::GitHubGateway gateway(http, runner, env->config, repository.value());

  finalize::FinalizeEngine engine(gateway);
  const finalize::FinalizeResult result = engine.run(context);
  if (json) {
    std::cout << result.to_json() << "\n";
  } else {
    std::cout << report::render_finalize(result);
  }
  return result.ok() ? 0 : 1;
}

int run_publish(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  const bool draft = take_flag(args, "--draft");
  const bool ready = take_flag(args, "--ready");
  if (draft && ready) {
    return report_error(json, "--draft and --ready are mutually exclusive");
  }

  publish::PublishRequest request;
  request.draft = draft;
  bool missing_value = false;
  (void)take_option(args, "--title", request.title, missing_value);

  std::string description_file;
  const bool has_description = take_option(args, "--description", request.description,
                                           missing_value);
  const bool has_description_file =
      take_option(args, "--description-file", description_file, missing_value);
  if (has_description && has_description_file) {
    return report_error(json, "--description and --description-file are mutually exclusive");
  }

  std::string issue_raw;
  if (take_option(args, "--issue", issue_raw, missing_value)) {
    request.issue = parse_number(issue_raw);
    if (!request.issue.has_value()) {
      return report_error(json, "Invalid issue number", issue_raw);
    }
  }
  if (missing_value) {
    return report_error(json, "Missing option value");
  }
  if (!args.empty()) {
    return report_error(json, "Unknown option", args.front());
  }
  if (has_description_file) {
    auto text = common::read_text_file(common::expand_path(description_file));
    if (!text.ok()) {
      return report_error(json, "Cannot read description file", text.error());
    }
    request.description = text.value();
  }

  auto env = load_environment(json);
  if (!env.has_value()) {
    return 1;
  }
  auto store = open_store(*env);
  auto session = store.load_active();
  if (!session.ok()) {
    return report_error(json, session.error());
  }

  common::SubprocessRunner runner;
  git::GitCli git(runner, env->repo_dir, env->config.publish.base_branch);
  auto repository = resolve_repository(*env, git);
  if (!repository.ok()) {
    return report_error(json, "Cannot determine repository", repository.error());
  }
  http::CurlHttpClient http;
  gateway::GitHubGateway gateway(http, runner, env->config, repository.value());

  publish::PublishEngine engine(gateway, git);
  publish::PublishResult result = engine.run(session.value(), request);
  if (result.ok()) {
    if (auto saved = store.set_pr_number(session.value().session_id, result.pr.number);
        !saved.ok()) {
      result.warnings.push_back("PR number not saved to session: " + saved.error());
      observability::record_warning("publish", result.warnings.back());
    }
  }

  if (json) {
    std::cout << result.to_json() << "\n";
  } else {
    std::cout << report::render_publish(result);
  }
  return result.ok() ? 0 : 1;
}

report::SessionSummary summarize(const Environment &env, const session::SessionStore &store,
                                 const session::Session &session,
                                 std::vector<ledger::TaskEntry> *entries) {
  const auto context = make_context(env, store, session);
  report::SessionSummary summary;
  summary.session = session;
  summary.session_dir = context.session_dir.string();
  summary.tasks_file = finalize::ledger_path(context).string();

  auto file = ledger::read_ledger_file(summary.tasks_file);
  if (!file.ok() || !file.value().exists) {
    return summary;
  }
  auto parsed = ledger::parse(file.value().text);
  if (!parsed.ok()) {
    observability::record_warning("tasks", parsed.error().describe());
    return summary;
  }
  ledger::TaskCounts counts;
  counts.total = parsed.value().size();
  for (const auto &entry : parsed.value()) {
    if (entry.done) {
      ++counts.completed;
    }
  }
  summary.counts = counts;
  if (entries != nullptr) {
    *entries = parsed.value();
  }
  return summary;
}

int run_status(std::vector<std::string> args) {
  const bool json = take_flag(args, "--json");
  if (!args.empty()) {
    return report_error(json, "Unknown option", args.front());
  }
  auto env = load_environment(json);
  if (!env.has_value()) {
    return 1;
  }
  auto store = open_store(*env);
  auto session = store.load_active();
  if (!session.ok()) {
    return report_error(json, session.error());
  }
  const auto summary = summarize(*env, store, session.value(), nullptr);
  if (json) {
    std::cout << report::status_to_json(summary) << "\n";
  } else {
    std::cout << report::render_status(summary);
  }
  return 0;
}

int run_tasks(std::vector<std::string> args) {
  if (args.empty()) {
    std::cerr << "usage: sessionflow tasks touch <ID>... | tasks status [--json]\n";
    return 1;
  }
  const std::string sub = args.front();
  args.erase(args.begin());
  const bool json = take_flag(args, "--json");

  auto env = load_environment(json);
  if (!env.has_value()) {
    return 1;
  }
  auto store = open_store(*env);

  if (sub == "touch") {
    if (args.empty()) {
      return report_error(json, "usage: sessionflow tasks touch <ID>...");
    }
    for (const auto &id : args) {
      if (!ledger::is_task_identifier(id)) {
        return report_error(json, "Invalid task identifier", id);
      }
    }
    auto updated = store.record_touched_tasks(args);
    if (!updated.ok()) {
      return report_error(json, updated.error());
    }
    if (json) {
      common::JsonWriter writer;
      writer.begin_object()
          .field("status", "success")
          .field("session_id", updated.value().session_id)
          .key("touched_tasks")
          .begin_array();
      for (const auto &task : updated.value().touched_tasks) {
        writer.value(task);
      }
      writer.end_array().end_object();
      std::cout << writer.str() << "\n";
    } else {
      std::cout << "Touched tasks (" << updated.value().touched_tasks.size() << "):";
      for (const auto &task : updated.value().touched_tasks) {
        std::cout << " " << task;
      }
      std::cout << "\n";
    }
    return 0;
  }

  if (sub == "status") {
    if (!args.empty()) {
      return report_error(json, "Unknown option", args.front());
    }
    auto session = store.load_active();
    if (!session.ok()) {
      return report_error(json, session.error());
    }
    std::vector<ledger::TaskEntry> entries;
    const auto summary = summarize(*env, store, session.value(), &entries);
    const std::set<std::string> touched(session.value().touched_tasks.begin(),
                                        session.value().touched_tasks.end());
    if (json) {
      common::JsonWriter writer;
      writer.begin_object().field("status", "success").field("file", summary.tasks_file);
      if (summary.counts.has_value()) {
        writer.field("total", static_cast<std::uint64_t>(summary.counts->total))
            .field("completed", static_cast<std::uint64_t>(summary.counts->completed));
      }
      writer.key("tasks").begin_array();
      for (const auto &entry : entries) {
        writer.begin_object()
            .field("id", entry.identifier)
            .field("done", entry.done)
            .field("line", static_cast<std::uint64_t>(entry.line))
            .field("touched", touched.contains(entry.identifier))
            .end_object();
      }
      writer.end_array().end_object();
      std::cout << writer.str() << "\n";
      return 0;
    }
    if (!summary.counts.has_value()) {
      std::cout << "No task ledger at " << summary.tasks_file << "\n";
      return 0;
    }
    std::cout << summary.tasks_file << ": " << summary.counts->completed << "/"
              << summary.counts->total << " complete\n";
    for (const auto &entry : entries) {
      std::cout << "  [" << (entry.done ? 'x' : ' ') << "] " << entry.identifier
                << (touched.contains(entry.identifier) ? "  (touched)" : "") << "\n";
    }
    return 0;
  }

  return report_error(json, "Unknown tasks subcommand", sub);
}

int run_config(std::vector<std::string> args) {
  if (args.empty() || args.front() != "show") {
    std::cerr << "usage: sessionflow config show\n";
    return 1;
  }
  auto env = load_environment(false);
  if (!env.has_value()) {
    return 1;
  }
  std::cout << config::describe_config(env->config);
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: sessionflow [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  finalize [--json] [--branch NAME]     Reconcile issues and tasks after merge\n";
  std::cout << "  publish --title T (--description D | --description-file F)\n";
  std::cout << "          [--draft|--ready] [--issue N] [--json]\n";
  std::cout << "                                        Create or update the session PR\n";
  std::cout << "  tasks touch <ID>...                   Record tasks worked on in this session\n";
  std::cout << "  tasks status [--json]                 Show the session task ledger\n";
  std::cout << "  status [--json]                       Show the active session\n";
  std::cout << "  config show                           Print the effective configuration\n";
  std::cout << "  config-path                           Print the config file location\n";
  std::cout << "  version                               Print the version\n";
  std::cout << "  help                                  Show this help\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }
  if (subcommand == "finalize") {
    return run_finalize(std::move(args));
  }
  if (subcommand == "publish") {
    return run_publish(std::move(args));
  }
  if (subcommand == "tasks") {
    return run_tasks(std::move(args));
  }
  if (subcommand == "status") {
    return run_status(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace sessionflow::cli
