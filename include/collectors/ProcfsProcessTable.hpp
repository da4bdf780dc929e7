#pragma once
#include "collectors/IProcessTable.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace warden::collectors {

// /proc backed process table. Honours WARDEN_PROC_ROOT for fixture trees.
class ProcfsProcessTable : public IProcessTable {
public:
  ProcfsProcessTable();
  std::vector<model::OsProcess> list_processes() override;
  std::optional<model::OsProcess> find(int32_t pid) override;
  std::optional<model::ResourceUsage> usage(int32_t pid) override;
  std::optional<std::string> working_directory(int32_t pid) override;
  bool alive(int32_t pid) override;
  const char* name() const override { return "procfs"; }

  struct StatFields {
    char state{'?'};
    int32_t ppid{0};
    uint64_t utime{0};
    uint64_t stime{0};
    uint64_t starttime{0}; // clock ticks after boot
    int64_t rss_pages{0};
    std::string comm;
  };
  // Parses the contents of /proc/<pid>/stat. comm may contain spaces and ')'.
  static bool parse_stat_line(const std::string& content, StatFields& out);
  // Extracts the lineage marker from NUL separated /proc/<pid>/environ bytes.
  static std::optional<int32_t> owner_marker_from_environ(const std::vector<unsigned char>& env);

private:
  std::optional<model::OsProcess> read_process(int32_t pid, const StatFields& st, double uptime_s);

  std::mutex mu_;
  struct CpuSample { uint64_t proc; uint64_t cpu_total; }; // utime+stime, /proc/stat total
  std::unordered_map<int32_t, CpuSample> last_per_proc_{};
  unsigned ncpu_{1};  // online cpus, read once at construction
  long clk_tck_{100};
  long page_kb_{4};
};

} // namespace warden::collectors
