#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sessionflow::config {

struct GitHubConfig {
  std::string api_url = "https://api.github.com";
  std::string graphql_url = "https://api.github.com/graphql";
  // "owner/name"; empty means derive from the origin remote.
  std::string repository;
  std::optional<std::string> token;
  std::uint64_t timeout_ms = 30'000;
};

struct SessionConfig {
  std::string root = ".session";
  std::string specs_dir = "specs";
};

struct PublishConfig {
  std::string base_branch = "main";
};

struct ProjectsConfig {
  bool sync_enabled = false;
  // argv template; "{ledger}" and "{milestone}" are substituted per call.
  std::vector<std::string> sync_command = {"scripts/sync-task-status.sh", "{ledger}",
                                           "{milestone}"};
  std::uint64_t sync_timeout_ms = 60'000;
};

struct ObservabilityConfig {
  // Comma-separated: "log", "debug", "file", "none".
  std::string backend = "log";
  std::string log_file;
};

struct Config {
  GitHubConfig github;
  SessionConfig session;
  PublishConfig publish;
  ProjectsConfig projects;
  ObservabilityConfig observability;
};

} // namespace sessionflow::config
