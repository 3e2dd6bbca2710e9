#include "sessionflow/observability/global.hpp"

#include <mutex>

namespace sessionflow::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_operation_start(const std::string &operation, const std::string &session_id,
                            const std::string &session_type) {
  record_event(OperationStartEvent{
      .operation = operation, .session_id = session_id, .session_type = session_type});
}

void record_operation_end(const std::string &operation, std::chrono::milliseconds duration,
                          bool success) {
  record_event(
      OperationEndEvent{.operation = operation, .duration = duration, .success = success});
}

void record_gateway_call(const std::string &call, const std::string &target,
                         std::chrono::milliseconds duration, bool success) {
  record_event(GatewayCallEvent{
      .call = call, .target = target, .duration = duration, .success = success});
  record_metric(GatewayLatencyMetric{.latency = duration});
}

void record_mutation(const std::string &kind, const std::string &target) {
  record_event(MutationEvent{.kind = kind, .target = target});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_tasks_marked(std::uint64_t count) {
  record_metric(TasksMarkedMetric{.count = count});
}

} // namespace sessionflow::observability
