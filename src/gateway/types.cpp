#include "sessionflow/gateway/types.hpp"

namespace sessionflow::gateway {

std::string_view to_string(const GatewayErrorCode code) {
  switch (code) {
  case GatewayErrorCode::NotFound:
    return "not_found";
  case GatewayErrorCode::PermissionDenied:
    return "permission_denied";
  case GatewayErrorCode::Conflict:
    return "conflict";
  case GatewayErrorCode::ExternalSyncError:
    return "external_sync_error";
  case GatewayErrorCode::NetworkError:
    return "network_error";
  case GatewayErrorCode::Timeout:
    return "timeout";
  case GatewayErrorCode::InvalidResponse:
    return "invalid_response";
  case GatewayErrorCode::ApiError:
    return "api_error";
  }
  return "api_error";
}

std::string GatewayError::describe() const {
  std::string out = resource.empty() ? std::string(to_string(code))
                                     : resource + ": " + std::string(to_string(code));
  if (status != 0) {
    out += " (HTTP " + std::to_string(status) + ")";
  }
  if (!message.empty()) {
    out += ": " + message;
  }
  return out;
}

} // namespace sessionflow::gateway
