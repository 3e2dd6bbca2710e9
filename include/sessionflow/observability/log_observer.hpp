#pragma once

#include "sessionflow/observability/observer.hpp"

#include <filesystem>
#include <iosfwd>
#include <memory>

namespace sessionflow::observability {

/// Writes "[LEVEL] message" lines; DEBUG lines only when verbose.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool verbose = false);
  LogObserver(std::ostream &out, bool verbose);
  /// Appends to a file; lines carry an RFC 3339 timestamp.
  LogObserver(const std::filesystem::path &file, bool verbose);
  ~LogObserver() override;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
  [[nodiscard]] bool is_open() const;

private:
  void log_line(std::string_view level, const std::string &message);

  std::unique_ptr<std::ofstream> file_;
  std::ostream *out_;
  bool verbose_;
  bool timestamps_ = false;
};

} // namespace sessionflow::observability
