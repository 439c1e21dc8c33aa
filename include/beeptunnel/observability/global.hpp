#pragma once

#include "beeptunnel/observability/observer.hpp"

#include <memory>

namespace beeptunnel::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_process_started(int pid, const std::string &command_line);
void record_process_exited(int pid, std::optional<int> exit_code, bool requested);
void record_tunnel_url(const std::string &url);
void record_process_output(const std::string &stream, const std::string &line, bool matched);
void record_binary_resolved(const std::string &platform, const std::string &path,
                            const std::string &version, const std::string &source);
void record_binary_check(const std::string &path, const std::string &check, bool passed,
                         const std::string &detail = "");
void record_download(const std::string &url, std::uint64_t bytes,
                     std::chrono::milliseconds duration);
void record_uptime(std::chrono::milliseconds uptime);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace beeptunnel::observability
