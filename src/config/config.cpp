#include "sessionflow/config/config.hpp"

#include "sessionflow/common/fs.hpp"
#include "sessionflow/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace sessionflow::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".sessionflow";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SESSIONFLOW_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("SESSIONFLOW_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  // Config dir .env wins over the working directory one (first writer is kept).
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

bool is_http_url(const std::string &url) {
  return common::starts_with(url, "https://") || common::starts_with(url, "http://");
}

bool is_repository_slug(const std::string &slug) {
  const auto slash = slug.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 >= slug.size()) {
    return false;
  }
  return slug.find('/', slash + 1) == std::string::npos;
}

std::string mask_token(const std::optional<std::string> &token) {
  if (!token.has_value() || token->empty()) {
    return "(unset)";
  }
  if (token->size() <= 8) {
    return "****";
  }
  return token->substr(0, 4) + "****";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *token = env_value("SESSIONFLOW_GITHUB_TOKEN"); token != nullptr) {
    config.github.token = std::string(token);
  } else if (!config.github.token.has_value() || common::trim(*config.github.token).empty()) {
    if (const char *gh = env_value("GITHUB_TOKEN"); gh != nullptr) {
      config.github.token = std::string(gh);
    } else if (const char *gh_alt = env_value("GH_TOKEN"); gh_alt != nullptr) {
      config.github.token = std::string(gh_alt);
    }
  }

  if (const char *repo = env_value("SESSIONFLOW_REPO"); repo != nullptr) {
    config.github.repository = repo;
  }
  if (const char *root = env_value("SESSIONFLOW_SESSION_ROOT"); root != nullptr) {
    config.session.root = root;
  }
  if (const char *api = env_value("SESSIONFLOW_GITHUB_API_URL"); api != nullptr) {
    config.github.api_url = api;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.github.api_url = expand_config_value(doc.get_string("github.api_url", config.github.api_url));
  config.github.graphql_url =
      expand_config_value(doc.get_string("github.graphql_url", config.github.graphql_url));
  config.github.repository =
      expand_config_value(doc.get_string("github.repository", config.github.repository));
  if (doc.has("github.token")) {
    config.github.token = expand_config_value(doc.get_string("github.token"));
  }
  config.github.timeout_ms = doc.get_u64("github.timeout_ms", config.github.timeout_ms);

  config.session.root = expand_config_value(doc.get_string("session.root", config.session.root));
  config.session.specs_dir =
      expand_config_value(doc.get_string("session.specs_dir", config.session.specs_dir));

  config.publish.base_branch = doc.get_string("publish.base_branch", config.publish.base_branch);

  config.projects.sync_enabled = doc.get_bool("projects.sync_enabled", config.projects.sync_enabled);
  config.projects.sync_command =
      doc.get_string_array("projects.sync_command", config.projects.sync_command);
  config.projects.sync_timeout_ms =
      doc.get_u64("projects.sync_timeout_ms", config.projects.sync_timeout_ms);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_file =
      doc.get_string("observability.log_file", config.observability.log_file);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto text = common::read_text_file(path);
  if (!text.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(text.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (!is_http_url(config.github.api_url)) {
    return common::Result<std::vector<std::string>>::failure("github.api_url must be an http(s) URL: " +
                                                              config.github.api_url);
  }
  if (!is_http_url(config.github.graphql_url)) {
    return common::Result<std::vector<std::string>>::failure(
        "github.graphql_url must be an http(s) URL: " + config.github.graphql_url);
  }
  if (!config.github.repository.empty() && !is_repository_slug(config.github.repository)) {
    return common::Result<std::vector<std::string>>::failure(
        "github.repository must look like owner/name: " + config.github.repository);
  }
  if (config.github.timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure("github.timeout_ms must be > 0");
  }
  if (common::trim(config.session.root).empty()) {
    return common::Result<std::vector<std::string>>::failure("session.root must not be empty");
  }
  if (common::trim(config.session.specs_dir).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "session.specs_dir must not be empty");
  }
  if (common::trim(config.publish.base_branch).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "publish.base_branch must not be empty");
  }

  if (config.projects.sync_enabled && config.projects.sync_command.empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "projects.sync_command is required when projects.sync_enabled is true");
  }
  if (config.projects.sync_enabled && config.projects.sync_timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "projects.sync_timeout_ms must be > 0 when board sync is enabled");
  }

  if (!config.github.token.has_value() || common::trim(*config.github.token).empty()) {
    warnings.push_back("no GitHub token configured (set github.token or GITHUB_TOKEN)");
  }
  if (config.github.repository.empty()) {
    warnings.push_back("github.repository is empty; it will be derived from the origin remote");
  }

  std::stringstream backends(config.observability.backend);
  std::string part;
  while (std::getline(backends, part, ',')) {
    const std::string backend = common::to_lower(common::trim(part));
    if (backend == "file" && common::trim(config.observability.log_file).empty()) {
      warnings.push_back("observability backend 'file' needs observability.log_file");
    } else if (!backend.empty() && backend != "log" && backend != "debug" &&
               backend != "file" && backend != "none" && backend != "noop") {
      warnings.push_back("unknown observability backend '" + backend + "', ignored");
    }
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

std::string describe_config(const Config &config) {
  std::ostringstream out;
  out << "[github]\n";
  out << "api_url = " << common::quote_toml_string(config.github.api_url) << "\n";
  out << "graphql_url = " << common::quote_toml_string(config.github.graphql_url) << "\n";
  out << "repository = " << common::quote_toml_string(config.github.repository) << "\n";
  out << "token = " << common::quote_toml_string(mask_token(config.github.token)) << "\n";
  out << "timeout_ms = " << config.github.timeout_ms << "\n";

  out << "\n[session]\n";
  out << "root = " << common::quote_toml_string(config.session.root) << "\n";
  out << "specs_dir = " << common::quote_toml_string(config.session.specs_dir) << "\n";

  out << "\n[publish]\n";
  out << "base_branch = " << common::quote_toml_string(config.publish.base_branch) << "\n";

  out << "\n[projects]\n";
  out << "sync_enabled = " << (config.projects.sync_enabled ? "true" : "false") << "\n";
  out << "sync_command = [";
  for (std::size_t i = 0; i < config.projects.sync_command.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << common::quote_toml_string(config.projects.sync_command[i]);
  }
  out << "]\n";
  out << "sync_timeout_ms = " << config.projects.sync_timeout_ms << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "log_file = " << common::quote_toml_string(config.observability.log_file) << "\n";
  return out.str();
}

} // namespace sessionflow::config
