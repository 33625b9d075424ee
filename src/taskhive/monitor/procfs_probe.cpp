#include "taskhive/monitor/resource_monitor.hpp"

#include <sys/statvfs.h>

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

namespace taskhive {

namespace {

class ProcfsProbe final : public ISystemProbe {
public:
  auto cpu_times() -> Result<CpuTimes> override {
    std::ifstream in("/proc/stat");
    std::string label;
    if (!(in >> label) || label != "cpu") {
      return fail(Error::FileNotFound);
    }
    // user nice system idle iowait irq softirq steal
    std::uint64_t fields[8] = {};
    for (auto& f : fields) {
      if (!(in >> f)) {
        return fail(Error::ParseError);
      }
    }
    CpuTimes t;
    t.idle = fields[3] + fields[4];
    for (auto f : fields) {
      t.total += f;
    }
    return t;
  }

  auto memory() -> Result<MemoryInfo> override {
    std::ifstream in("/proc/meminfo");
    if (!in) {
      return fail(Error::FileNotFound);
    }
    MemoryInfo info;
    std::string line;
    while (std::getline(in, line)) {
      std::istringstream ls(line);
      std::string key;
      std::uint64_t kib = 0;
      ls >> key >> kib;
      if (key == "MemTotal:") {
        info.total_bytes = kib * 1024;
      } else if (key == "MemAvailable:") {
        info.available_bytes = kib * 1024;
      }
    }
    if (info.total_bytes == 0) {
      return fail(Error::ParseError);
    }
    return info;
  }

  auto disk(std::string_view path) -> Result<DiskInfo> override {
    struct statvfs st{};
    if (statvfs(std::string(path).c_str(), &st) != 0) {
      return fail(Error::NotFound);
    }
    return DiskInfo{
        .total_bytes = static_cast<std::uint64_t>(st.f_blocks) * st.f_frsize,
        .free_bytes = static_cast<std::uint64_t>(st.f_bavail) * st.f_frsize,
    };
  }

  auto load_average() -> std::array<double, 3> override {
    std::array<double, 3> out{};
    if (getloadavg(out.data(), 3) != 3) {
      return {};
    }
    return out;
  }

  auto process_count() -> int override {
    std::error_code ec;
    int count = 0;
    for (const auto& entry :
         std::filesystem::directory_iterator("/proc", ec)) {
      auto name = entry.path().filename().string();
      if (!name.empty() && std::isdigit(static_cast<unsigned char>(name[0]))) {
        ++count;
      }
    }
    return count;
  }

  auto cpu_count() -> int override {
    auto n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<int>(n);
  }
};

}  // namespace

auto create_procfs_probe() -> std::unique_ptr<ISystemProbe> {
  return std::make_unique<ProcfsProbe>();
}

}  // namespace taskhive
