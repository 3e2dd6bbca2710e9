#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sessionflow::observability {

struct OperationStartEvent {
  std::string operation;
  std::string session_id;
  std::string session_type;
};

struct OperationEndEvent {
  std::string operation;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct GatewayCallEvent {
  std::string call;
  std::string target;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct MutationEvent {
  std::string kind;
  std::string target;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<OperationStartEvent, OperationEndEvent, GatewayCallEvent,
                                   MutationEvent, WarningEvent, ErrorEvent>;

struct GatewayLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct TasksMarkedMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<GatewayLatencyMetric, TasksMarkedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sessionflow::observability
