#pragma once

#include "beeptunnel/observability/observer.hpp"

#include <mutex>

namespace beeptunnel::observability {

/// Writes `[LEVEL] message` lines to stderr. DEBUG lines need `verbose`.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool verbose = false) : verbose_(verbose) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
  [[nodiscard]] bool verbose() const { return verbose_; }

private:
  void log_line(std::string_view level, const std::string &message);

  bool verbose_;
  std::mutex mutex_;
};

} // namespace beeptunnel::observability
