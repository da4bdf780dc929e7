#include "collectors/ProcfsProcessTable.hpp"
#include "util/Elapsed.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <unistd.h>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace warden::collectors {

static uint64_t read_cpu_total() {
  auto txt = util::read_file_string("/proc/stat"); if (!txt) return 0;
  std::istringstream ss(*txt); std::string line; if (!std::getline(ss, line)) return 0;
  size_t pos = line.find(' '); if (pos == std::string::npos) return 0;
  std::string_view rest(line.c_str() + pos + 1);
  uint64_t vals[8]{}; int i=0; size_t start=0;
  while (i<8 && start<rest.size()) {
    while (start<rest.size() && (rest[start]==' '||rest[start]=='\t')) ++start;
    size_t end=start; while (end<rest.size() && rest[end]>='0'&&rest[end]<='9') ++end;
    if (end>start) { std::from_chars(rest.data()+start, rest.data()+end, vals[i++]); }
    start=end+1;
  }
  uint64_t total=0; for (int j=0;j<8;++j) total+=vals[j]; return total;
}

static unsigned read_cpu_count() {
  auto txt = util::read_file_string("/proc/stat"); if (!txt) return 1;
  std::istringstream ss(*txt); std::string line; unsigned count = 0; bool first = true;
  while (std::getline(ss, line)) {
    if (line.rfind("cpu", 0) == 0) {
      if (first) { first = false; continue; } // aggregate line
      if (line.size() >= 4 && std::isdigit(static_cast<unsigned char>(line[3]))) count++;
    } else if (!first) {
      break;
    }
  }
  return count == 0 ? 1 : count;
}

static std::optional<double> read_uptime_seconds() {
  auto txt = util::read_file_string("/proc/uptime"); if (!txt) return std::nullopt;
  char* end = nullptr;
  double v = std::strtod(txt->c_str(), &end);
  if (end == txt->c_str()) return std::nullopt;
  return v;
}

static std::string read_cmdline(int32_t pid) {
  auto bytes = util::read_file_bytes(util::pid_path(pid, "cmdline"));
  if (!bytes) return {};
  std::string out; out.reserve(bytes->size()); bool sep=true;
  for (auto b : *bytes) { if (b==0) { if(!sep){ out.push_back(' '); sep=true; } } else { out.push_back(static_cast<char>(b)); sep=false; } }
  if (!out.empty() && out.back()==' ') out.pop_back();
  return out;
}

static bool parse_pid(const std::string& name, int32_t& pid) {
  if (name.empty() || name[0]<'0' || name[0]>'9') return false;
  auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
  return ec == std::errc() && ptr == name.data() + name.size();
}

ProcfsProcessTable::ProcfsProcessTable() {
  long t = ::sysconf(_SC_CLK_TCK);
  if (t > 0) clk_tck_ = t;
  long pg = ::getpagesize();
  if (pg >= 1024) page_kb_ = pg / 1024;
  ncpu_ = read_cpu_count();
}

bool ProcfsProcessTable::parse_stat_line(const std::string& content, StatFields& out) {
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp==std::string::npos||rp==std::string::npos||rp<lp||rp+2>content.size()) return false;
  out.comm = content.substr(lp+1, rp-lp-1);
  std::istringstream ss(content.substr(rp+2));
  ss >> out.state >> out.ppid;
  // pgrp session tty_nr tpgid flags minflt cminflt majflt cmajflt
  for (int i=0;i<9;i++){ std::string tmp; ss >> tmp; }
  ss >> out.utime >> out.stime;
  // cutime cstime priority nice num_threads itrealvalue
  for (int i=0;i<6;i++){ std::string tmp; ss >> tmp; }
  ss >> out.starttime;
  unsigned long long vsize_bytes = 0;
  ss >> vsize_bytes;
  ss >> out.rss_pages;
  return !ss.fail();
}

std::optional<int32_t> ProcfsProcessTable::owner_marker_from_environ(const std::vector<unsigned char>& env) {
  const std::string key = std::string(model::kOwnerMarkerEnv) + "=";
  size_t i = 0;
  while (i < env.size()) {
    size_t j = i;
    while (j < env.size() && env[j] != 0) ++j;
    std::string_view entry(reinterpret_cast<const char*>(env.data()) + i, j - i);
    if (entry.size() > key.size() && entry.compare(0, key.size(), key) == 0) {
      auto val = entry.substr(key.size());
      int32_t pid = 0;
      auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), pid);
      if (ec == std::errc() && ptr == val.data() + val.size() && pid > 0) return pid;
      return std::nullopt;
    }
    i = j + 1;
  }
  return std::nullopt;
}

std::optional<model::OsProcess> ProcfsProcessTable::read_process(int32_t pid, const StatFields& st, double uptime_s) {
  model::OsProcess p;
  p.pid = pid;
  p.ppid = st.ppid;
  p.command = read_cmdline(pid);
  if (p.command.empty()) p.command = "[" + st.comm + "]"; // kernel thread or exiting
  double started_s = static_cast<double>(st.starttime) / static_cast<double>(clk_tck_);
  double age_s = uptime_s > started_s ? uptime_s - started_s : 0.0;
  p.etime = util::format_elapsed(static_cast<int64_t>(age_s));
  p.rss_kb = st.rss_pages > 0 ? static_cast<uint64_t>(st.rss_pages) * static_cast<uint64_t>(page_kb_) : 0;
  // environ of other users' processes is unreadable; no marker then
  if (auto env = util::read_file_bytes(util::pid_path(pid, "environ"))) {
    p.owner_marker = owner_marker_from_environ(*env);
  }
  return p;
}

std::vector<model::OsProcess> ProcfsProcessTable::list_processes() {
  std::vector<model::OsProcess> out;
  double uptime = read_uptime_seconds().value_or(0.0);
  for (auto& name : util::list_dir("/proc")) {
    int32_t pid = 0;
    if (!parse_pid(name, pid)) continue;
    auto content = util::read_file_string(util::pid_path(pid, "stat"));
    if (!content) continue; // exited during the scan
    StatFields st;
    if (!parse_stat_line(*content, st)) {
      util::log_debug("Procfs", "unparseable stat for pid %d", pid);
      continue;
    }
    if (st.state == 'Z') continue;
    if (auto p = read_process(pid, st, uptime)) out.push_back(std::move(*p));
  }
  return out;
}

std::optional<model::OsProcess> ProcfsProcessTable::find(int32_t pid) {
  auto content = util::read_file_string(util::pid_path(pid, "stat"));
  if (!content) return std::nullopt;
  StatFields st;
  if (!parse_stat_line(*content, st) || st.state == 'Z') return std::nullopt;
  return read_process(pid, st, read_uptime_seconds().value_or(0.0));
}

std::optional<model::ResourceUsage> ProcfsProcessTable::usage(int32_t pid) {
  auto content = util::read_file_string(util::pid_path(pid, "stat"));
  if (!content) return std::nullopt;
  StatFields st;
  if (!parse_stat_line(*content, st) || st.state == 'Z') return std::nullopt;

  std::lock_guard<std::mutex> lk(mu_);
  uint64_t cpu_total = read_cpu_total();
  uint64_t total_proc = st.utime + st.stime;
  model::ResourceUsage u;
  auto it = last_per_proc_.find(pid);
  if (it != last_per_proc_.end() && cpu_total > it->second.cpu_total) {
    uint64_t dp = total_proc > it->second.proc ? total_proc - it->second.proc : 0;
    uint64_t dt = cpu_total - it->second.cpu_total;
    u.cpu_pct = (100.0 * static_cast<double>(dp) / static_cast<double>(dt)) * static_cast<double>(ncpu_);
  } else if (cpu_total == 0) {
    util::log_debug("Procfs", "cpu accounting unavailable; reporting 0%% for pid %d", pid);
  }
  last_per_proc_[pid] = {total_proc, cpu_total};
  u.rss_bytes = st.rss_pages > 0 ? static_cast<uint64_t>(st.rss_pages) * static_cast<uint64_t>(page_kb_) * 1024 : 0;
  return u;
}

std::optional<std::string> ProcfsProcessTable::working_directory(int32_t pid) {
  return util::read_symlink(util::pid_path(pid, "cwd"));
}

bool ProcfsProcessTable::alive(int32_t pid) {
  if (pid <= 0) return false;
  auto content = util::read_file_string(util::pid_path(pid, "stat"));
  if (!content) return false;
  StatFields st;
  if (!parse_stat_line(*content, st)) return false;
  return st.state != 'Z' && st.state != 'X';
}

} // namespace warden::collectors
