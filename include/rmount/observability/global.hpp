#pragma once

#include "rmount/observability/observer.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace rmount::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_mount_started(const std::string &mountpoint, const std::string &executable,
                          std::uint32_t attempt);
void record_mount_ready(const std::string &mountpoint, std::chrono::milliseconds startup);
void record_health_event(const std::string &mountpoint, const std::string &kind,
                         const std::string &detail);
void record_restart_scheduled(const std::string &mountpoint, std::uint32_t attempt,
                              std::chrono::milliseconds delay);
void record_mount_failed(const std::string &mountpoint, const std::string &reason);
void record_unmounted(const std::string &mountpoint, const std::string &termination);
void record_error(const std::string &component, const std::string &message);

} // namespace rmount::observability
