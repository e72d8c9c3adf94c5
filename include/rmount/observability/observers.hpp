#pragma once

#include "rmount/observability/observer.hpp"

#include <memory>
#include <mutex>
#include <ostream>
#include <vector>

namespace rmount::observability {

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

/// Writes one `[LEVEL] message` line per event. Metrics are DEBUG lines and
/// only written when `verbose` is set; the probe reports one per sample.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool verbose = false);
  LogObserver(std::ostream &out, bool verbose);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
  [[nodiscard]] bool verbose() const { return verbose_; }

private:
  void write_line(std::string_view level, const std::string &message);

  std::ostream *out_;
  bool verbose_;
  std::mutex mutex_;
};

class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace rmount::observability
