/**
 * @file linux_source.cpp
 * @brief LinuxMetricSource — reads CPU, memory, disk, network, process and
 *        accelerator metrics from Linux pseudo-filesystems.
 *
 * Every reader degrades to zero / empty on a missing or unreadable file; only
 * an unexpected exception aborts a sample, and collect() turns that into the
 * all-zero sample.
 */

#include "resource_monitor/metric_source.hpp"

#include <sys/statvfs.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

namespace model_keeper {

using CpuTimes = LinuxMetricSource::CpuTimesInternal;

// ─────────────────────────────────────────────
// Internal helpers for /proc and /sys parsing
// ─────────────────────────────────────────────
namespace {

constexpr auto kCpuPrimeInterval = std::chrono::milliseconds(100);

std::string read_file_line(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::string line;
    if (ifs.is_open()) {
        std::getline(ifs, line);
    }
    return line;
}

std::vector<std::string> read_file_lines(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

std::optional<uint64_t> read_u64(const std::filesystem::path& path) {
    auto line = read_file_line(path);
    if (line.empty()) return std::nullopt;
    try {
        return std::stoull(line);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/**
 * @brief Parse the aggregate CPU line from /proc/stat.
 * Format: "cpu user nice system idle iowait irq softirq steal ..."
 */
std::optional<CpuTimes> read_cpu_times(const std::filesystem::path& proc_root) {
    auto line = read_file_line(proc_root / "stat");
    if (!line.starts_with("cpu ")) return std::nullopt;
    CpuTimes times;
    std::istringstream iss(line);
    std::string label;
    iss >> label >> times.user >> times.nice >> times.system >> times.idle
        >> times.iowait >> times.irq >> times.softirq >> times.steal;
    return times;
}

float compute_cpu_percent(const CpuTimes& prev, const CpuTimes& curr) {
    auto prev_total = prev.user + prev.nice + prev.system + prev.idle
                    + prev.iowait + prev.irq + prev.softirq + prev.steal;
    auto curr_total = curr.user + curr.nice + curr.system + curr.idle
                    + curr.iowait + curr.irq + curr.softirq + curr.steal;
    auto prev_active = prev.user + prev.nice + prev.system
                     + prev.irq + prev.softirq + prev.steal;
    auto curr_active = curr.user + curr.nice + curr.system
                     + curr.irq + curr.softirq + curr.steal;

    if (curr_total <= prev_total || curr_active < prev_active) return 0.0f;
    uint64_t total_delta = curr_total - prev_total;
    uint64_t active_delta = curr_active - prev_active;
    return std::clamp(100.0f * static_cast<float>(active_delta)
                      / static_cast<float>(total_delta), 0.0f, 100.0f);
}

Timestamp read_boot_time(const std::filesystem::path& proc_root) {
    for (const auto& line : read_file_lines(proc_root / "stat")) {
        if (line.starts_with("btime ")) {
            try {
                auto seconds = std::stoll(line.substr(6));
                return Timestamp{std::chrono::seconds(seconds)};
            } catch (const std::exception&) {
                break;
            }
        }
    }
    return Timestamp{};
}

struct MemInfo {
    uint64_t total_kb{0};
    uint64_t available_kb{0};
};

MemInfo parse_meminfo(const std::filesystem::path& proc_root) {
    MemInfo info;
    for (const auto& line : read_file_lines(proc_root / "meminfo")) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            iss >> info.total_kb;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            iss >> info.available_kb;
        }
    }
    return info;
}

float read_cpu_frequency_mhz(const std::filesystem::path& proc_root,
                             const std::filesystem::path& sys_root) {
    if (auto khz = read_u64(sys_root / "devices/system/cpu/cpu0/cpufreq/scaling_cur_freq")) {
        return static_cast<float>(*khz) / 1000.0f;
    }
    for (const auto& line : read_file_lines(proc_root / "cpuinfo")) {
        if (line.starts_with("cpu MHz")) {
            auto colon = line.find(':');
            if (colon == std::string::npos) continue;
            try {
                return std::stof(line.substr(colon + 1));
            } catch (const std::exception&) {
                return 0.0f;
            }
        }
    }
    return 0.0f;
}

struct NetCounters {
    uint64_t rx_bytes{0}, rx_packets{0};
    uint64_t tx_bytes{0}, tx_packets{0};
};

NetCounters parse_net_dev(const std::filesystem::path& proc_root) {
    NetCounters total;
    auto lines = read_file_lines(proc_root / "net/dev");
    for (size_t i = 2; i < lines.size(); ++i) {
        const auto& line = lines[i];
        auto colon_pos = line.find(':');
        if (colon_pos == std::string::npos) continue;

        std::string iface = line.substr(0, colon_pos);
        auto start = iface.find_first_not_of(' ');
        if (start != std::string::npos) iface = iface.substr(start);
        if (iface == "lo") continue;

        std::istringstream iss(line.substr(colon_pos + 1));
        uint64_t rx_bytes{0}, rx_packets{0}, rx_e{0}, rx_d{0}, rx_fi{0}, rx_fr{0}, rx_c{0}, rx_m{0};
        uint64_t tx_bytes{0}, tx_packets{0};
        iss >> rx_bytes >> rx_packets >> rx_e >> rx_d >> rx_fi >> rx_fr >> rx_c >> rx_m
            >> tx_bytes >> tx_packets;
        if (!iss) continue;

        total.rx_bytes += rx_bytes;
        total.rx_packets += rx_packets;
        total.tx_bytes += tx_bytes;
        total.tx_packets += tx_packets;
    }
    return total;
}

uint32_t count_processes(const std::filesystem::path& proc_root) {
    uint32_t count = 0;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(proc_root, ec)) {
        const auto name = entry.path().filename().string();
        if (!name.empty() && std::all_of(name.begin(), name.end(),
                                         [](unsigned char c) { return std::isdigit(c); })) {
            ++count;
        }
    }
    return count;
}

/// Hottest readable thermal_zone*/temp, in degrees Celsius.
std::optional<float> read_temperature(const std::filesystem::path& sys_root) {
    std::optional<float> hottest;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(sys_root / "class/thermal", ec)) {
        if (entry.path().filename().string().rfind("thermal_zone", 0) != 0) continue;

        auto line = read_file_line(entry.path() / "temp");
        if (line.empty()) continue;
        try {
            auto celsius = static_cast<float>(std::stol(line)) / 1000.0f;
            if (!hottest || celsius > *hottest) hottest = celsius;
        } catch (const std::exception&) {
            continue;
        }
    }
    return hottest;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// process_resident_bytes
// ─────────────────────────────────────────────

uint64_t process_resident_bytes() {
    std::ifstream statm("/proc/self/statm");
    uint64_t size_pages = 0;
    uint64_t resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages)) return 0;
    auto page_size = ::sysconf(_SC_PAGESIZE);
    if (page_size <= 0) return 0;
    return resident_pages * static_cast<uint64_t>(page_size);
}

// ─────────────────────────────────────────────
// LinuxMetricSource implementation
// ─────────────────────────────────────────────

LinuxMetricSource::LinuxMetricSource(std::filesystem::path disk_path,
                                     std::filesystem::path proc_root,
                                     std::filesystem::path sys_root)
    : disk_path_(std::move(disk_path))
    , proc_root_(std::move(proc_root))
    , sys_root_(std::move(sys_root)) {}

MetricSample LinuxMetricSource::collect() {
    try {
        return sample_once();
    } catch (const std::exception&) {
        MetricSample fallback;
        fallback.timestamp = std::chrono::system_clock::now();
        return fallback;
    }
}

float LinuxMetricSource::cpu_percent_since_last() {
    std::lock_guard lock(cpu_mutex_);
    auto curr = read_cpu_times(proc_root_);
    if (!curr) return 0.0f;

    if (!prev_cpu_times_) {
        // First reading: prime the counters over a short interval
        prev_cpu_times_ = curr;
        std::this_thread::sleep_for(kCpuPrimeInterval);
        curr = read_cpu_times(proc_root_);
        if (!curr) return 0.0f;
    }

    float percent = compute_cpu_percent(*prev_cpu_times_, *curr);
    prev_cpu_times_ = curr;
    return percent;
}

std::vector<AcceleratorInfo> LinuxMetricSource::read_accelerators() const {
    std::vector<AcceleratorInfo> accelerators;
    std::error_code ec;
    auto drm = sys_root_ / "class/drm";
    if (!std::filesystem::is_directory(drm, ec)) return accelerators;

    std::vector<std::filesystem::path> cards;
    for (const auto& entry : std::filesystem::directory_iterator(drm, ec)) {
        auto name = entry.path().filename().string();
        // card0, card1, ... (skip connector nodes such as card0-HDMI-A-1)
        if (name.starts_with("card") && name.find('-') == std::string::npos) {
            cards.push_back(entry.path());
        }
    }
    std::sort(cards.begin(), cards.end());

    for (const auto& card : cards) {
        auto device = card / "device";
        auto vram_total = read_u64(device / "mem_info_vram_total");
        if (!vram_total || *vram_total == 0) continue;

        AcceleratorInfo info;
        info.id = static_cast<uint32_t>(accelerators.size());
        info.name = card.filename().string();
        info.memory_total_bytes = *vram_total;
        info.memory_used_bytes = read_u64(device / "mem_info_vram_used").value_or(0);
        info.utilization_percent =
            static_cast<float>(read_u64(device / "gpu_busy_percent").value_or(0));
        accelerators.push_back(std::move(info));
    }
    return accelerators;
}

MetricSample LinuxMetricSource::sample_once() {
    MetricSample snap;

    // CPU
    snap.cpu_percent = cpu_percent_since_last();
    snap.cpu_count = std::max(1u, std::thread::hardware_concurrency());
    snap.cpu_frequency_mhz = read_cpu_frequency_mhz(proc_root_, sys_root_);

    // Memory
    auto mem = parse_meminfo(proc_root_);
    snap.memory_total_bytes = mem.total_kb * 1024;
    snap.memory_available_bytes = std::min(mem.available_kb, mem.total_kb) * 1024;
    snap.memory_used_bytes = snap.memory_total_bytes - snap.memory_available_bytes;

    // Disk
    struct statvfs vfs {};
    if (::statvfs(disk_path_.c_str(), &vfs) == 0) {
        uint64_t block = vfs.f_frsize ? vfs.f_frsize : vfs.f_bsize;
        snap.disk_total_bytes = static_cast<uint64_t>(vfs.f_blocks) * block;
        snap.disk_free_bytes = static_cast<uint64_t>(vfs.f_bavail) * block;
        uint64_t free_all = static_cast<uint64_t>(vfs.f_bfree) * block;
        snap.disk_used_bytes = snap.disk_total_bytes > free_all
                                   ? snap.disk_total_bytes - free_all : 0;
    }

    // Network I/O (cumulative)
    auto net = parse_net_dev(proc_root_);
    snap.network_bytes_recv = net.rx_bytes;
    snap.network_bytes_sent = net.tx_bytes;
    snap.network_packets_recv = net.rx_packets;
    snap.network_packets_sent = net.tx_packets;

    // System
    snap.process_count = count_processes(proc_root_);
    snap.boot_time = read_boot_time(proc_root_);
    snap.cpu_temperature_celsius = read_temperature(sys_root_);
    snap.accelerators = read_accelerators();

    snap.timestamp = std::chrono::system_clock::now();
    return snap;
}

}  // namespace model_keeper
