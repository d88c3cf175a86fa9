#include "monitor/net_monitor.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include "fastlog/fastlog.hpp"
#include "util/log_name.hpp"

namespace hostwatch {

NetMonitor::NetMonitor(std::string interface, std::chrono::milliseconds window,
                       std::string net_dev_path)
    : _interface(std::move(interface)),
      _window(window),
      _net_dev_path(std::move(net_dev_path)) {}

bool NetMonitor::read_net_stat(const std::string& net_dev_path,
                               const std::string& interface, NetStat* stat) {
    std::ifstream file(net_dev_path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    // 跳过前两行标题
    std::getline(file, line);
    std::getline(file, line);

    while (std::getline(file, line)) {
        // 计数很大时接口名与数字之间可能没有空格，如 "eth0:123456"
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string iface = line.substr(0, colon);
        auto first = iface.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        iface = iface.substr(first);
        if (iface != interface) continue;

        std::istringstream iss(line.substr(colon + 1));
        stat->name = iface;
        // 接收统计: bytes packets errs drop fifo frame compressed multicast
        uint64_t dummy;
        iss >> stat->rcv_bytes >> stat->rcv_packets;
        iss >> dummy >> dummy >> dummy >> dummy >> dummy >> dummy;
        // 发送统计: bytes packets errs drop fifo colls carrier compressed
        iss >> stat->snd_bytes >> stat->snd_packets;
        return !iss.fail();
    }

    return false;
}

double NetMonitor::rate_kbps(uint64_t before, uint64_t after, double seconds) {
    if (seconds <= 0 || after < before) {
        return 0;
    }
    return (after - before) / 1024.0 / seconds;
}

// 在采样窗口两端读取网卡计数，计算接收与发送速率（KB/s）
bool NetMonitor::update(hostwatch::proto::SampleInfo* sample_info) {
    NetStat before;
    auto start = std::chrono::steady_clock::now();
    if (!read_net_stat(_net_dev_path, _interface, &before)) {
        auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
        if (log) log->warn("Interface {} not found in {}", _interface, _net_dev_path);
        return false;
    }

    std::this_thread::sleep_for(_window);

    NetStat after;
    auto end = std::chrono::steady_clock::now();
    if (!read_net_stat(_net_dev_path, _interface, &after)) {
        auto* log = fastlog::file::get_logger(kHostwatchLoggerName);
        if (log) log->warn("Interface {} disappeared from {}", _interface, _net_dev_path);
        return false;
    }

    double dt = std::chrono::duration<double>(end - start).count();
    double rcv_rate = rate_kbps(before.rcv_bytes, after.rcv_bytes, dt);
    double send_rate = rate_kbps(before.snd_bytes, after.snd_bytes, dt);

    auto net_info = sample_info->mutable_net();
    net_info->set_interface(_interface);
    net_info->set_rcv_rate(rcv_rate);
    net_info->set_send_rate(send_rate);
    sample_info->set_net_total_kbps(static_cast<int64_t>(rcv_rate + send_rate));
    return true;
}

void NetMonitor::apply_default(hostwatch::proto::SampleInfo* sample_info) {
    auto net_info = sample_info->mutable_net();
    net_info->set_interface(_interface);
    net_info->set_rcv_rate(0);
    net_info->set_send_rate(0);
    sample_info->set_net_total_kbps(0);
}

}  // namespace hostwatch
