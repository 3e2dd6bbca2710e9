#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace sessionflow::gateway {

struct PullRequest {
  std::uint64_t number = 0;
  // "open" or "closed"
  std::string state;
  bool merged = false;
  bool draft = false;
  std::string title;
  std::string body;
  std::string url;
  std::string head_branch;
  std::string node_id;
};

struct Issue {
  std::uint64_t number = 0;
  std::string state;
  std::string title;
  std::string body;

  [[nodiscard]] bool is_closed() const { return state == "closed"; }
};

struct CreatePullRequest {
  std::string title;
  std::string body;
  std::string head;
  std::string base;
  bool draft = false;
};

enum class GatewayErrorCode {
  NotFound,
  PermissionDenied,
  Conflict,
  ExternalSyncError,
  NetworkError,
  Timeout,
  InvalidResponse,
  ApiError,
};

[[nodiscard]] std::string_view to_string(GatewayErrorCode code);

struct GatewayError {
  GatewayErrorCode code = GatewayErrorCode::ApiError;
  std::uint16_t status = 0;
  // e.g. "issue #42", "pull request #7"
  std::string resource;
  std::string message;

  [[nodiscard]] std::string describe() const;
};

/// Maps the current body to the desired body. Returning the input unchanged
/// means no write is needed.
using BodyTransform = std::function<std::string(const std::string &)>;

struct BodyUpdate {
  bool changed = false;
  std::string body;
};

} // namespace sessionflow::gateway
