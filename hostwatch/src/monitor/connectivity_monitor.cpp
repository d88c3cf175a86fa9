#include "monitor/connectivity_monitor.hpp"

#include "fastlog/fastlog.hpp"
#include "util/log_name.hpp"

namespace hostwatch {

ConnectivityMonitor::ConnectivityMonitor(std::vector<std::string> hosts,
                                         std::unique_ptr<HostProber> prober)
    : _hosts(std::move(hosts)), _prober(std::move(prober)) {}

// 主机不可达是采集结果而不是采集失败，因此总是返回 true
bool ConnectivityMonitor::update(hostwatch::proto::SampleInfo* sample_info) {
  sample_info->clear_host_probes();
  auto status = hostwatch::proto::CONNECTIVITY_OK;

  for (const auto& host : _hosts) {
    bool reachable = _prober->probe(host);
    auto* probe = sample_info->add_host_probes();
    probe->set_host(host);
    probe->set_reachable(reachable);
    if (!reachable) {
      status = hostwatch::proto::CONNECTIVITY_FAIL;
      auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
      if (log) log->warn("Host {} is unreachable", host);
    }
  }

  sample_info->set_connectivity(status);
  return true;
}

void ConnectivityMonitor::apply_default(
    hostwatch::proto::SampleInfo* sample_info) {
  sample_info->clear_host_probes();
  sample_info->set_connectivity(hostwatch::proto::CONNECTIVITY_FAIL);
}

}  // namespace hostwatch
