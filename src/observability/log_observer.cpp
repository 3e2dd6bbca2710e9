#include "sessionflow/observability/log_observer.hpp"

#include "sessionflow/common/fs.hpp"

#include <fstream>
#include <iostream>
#include <type_traits>

namespace sessionflow::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

LogObserver::LogObserver(const bool verbose) : out_(&std::cerr), verbose_(verbose) {}

LogObserver::LogObserver(std::ostream &out, const bool verbose) : out_(&out), verbose_(verbose) {}

LogObserver::LogObserver(const std::filesystem::path &file, const bool verbose)
    : file_(std::make_unique<std::ofstream>(file, std::ios::app)), out_(file_.get()),
      verbose_(verbose), timestamps_(true) {}

LogObserver::~LogObserver() {
  if (out_ != nullptr) {
    out_->flush();
  }
}

bool LogObserver::is_open() const { return file_ == nullptr || file_->is_open(); }

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  if (timestamps_) {
    *out_ << common::now_rfc3339() << " ";
  }
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, OperationStartEvent>) {
          log_line("DEBUG", evt.operation + ".start session=" + evt.session_id +
                                " type=" + evt.session_type);
        } else if constexpr (std::is_same_v<T, OperationEndEvent>) {
          log_line("DEBUG", evt.operation + ".end duration_ms=" +
                                std::to_string(evt.duration.count()) +
                                " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, GatewayCallEvent>) {
          log_line("DEBUG", "gateway." + evt.call + " target=" + evt.target +
                                " duration_ms=" + std::to_string(evt.duration.count()) +
                                " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, MutationEvent>) {
          log_line("INFO", evt.kind + " " + evt.target);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, GatewayLatencyMetric>) {
          log_line("DEBUG", "metric.gateway_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, TasksMarkedMetric>) {
          log_line("DEBUG", "metric.tasks_marked=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace sessionflow::observability
