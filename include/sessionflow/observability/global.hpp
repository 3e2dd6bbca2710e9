#pragma once

#include "sessionflow/observability/observer.hpp"

#include <memory>

namespace sessionflow::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_operation_start(const std::string &operation, const std::string &session_id,
                            const std::string &session_type);
void record_operation_end(const std::string &operation, std::chrono::milliseconds duration,
                          bool success);
void record_gateway_call(const std::string &call, const std::string &target,
                         std::chrono::milliseconds duration, bool success);
void record_mutation(const std::string &kind, const std::string &target);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);
void record_tasks_marked(std::uint64_t count);

} // namespace sessionflow::observability
