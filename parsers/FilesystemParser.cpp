#include "parsers/Parsers.hpp"
#include "parsers/TextUtil.hpp"

#include <map>
#include <set>

namespace tomexp::parsers {

namespace {

// node_exporter's default fstype exclusions. squashfs is kept: it is the root
// filesystem on most router firmware.
const std::set<std::string, std::less<>> kIgnoredTypes = {
    "autofs", "binfmt_misc", "bpf", "cgroup", "cgroup2", "configfs", "debugfs", "devpts",
    "devtmpfs", "fusectl", "hugetlbfs", "iso9660", "mqueue", "nsfs", "overlay", "proc",
    "procfs", "pstore", "rpc_pipefs", "securityfs", "selinuxfs", "sysfs", "tracefs", "usbfs",
    "rootfs"};

// /proc/mounts escapes blanks in paths as octal (\040).
std::string UnescapeMountPath(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '\\' && i + 3 < in.size() && in[i + 1] >= '0' && in[i + 1] <= '3' &&
        in[i + 2] >= '0' && in[i + 2] <= '7' && in[i + 3] >= '0' && in[i + 3] <= '7') {
      out += static_cast<char>((in[i + 1] - '0') * 64 + (in[i + 2] - '0') * 8 + (in[i + 3] - '0'));
      i += 3;
    } else {
      out += in[i];
    }
  }
  return out;
}

struct Mount {
  std::string device;
  std::string fstype;
};

} // namespace

ParseOutcome ParseFilesystem(const RawOutput& raw) {
  ParseOutcome out;
  const auto lines = SplitLines(raw.text);

  std::size_t df_start = 0;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (Trim(lines[i]) == kFilesystemSeparator) { df_start = i + 1; break; }
  }

  // Later mounts shadow earlier ones on the same mountpoint.
  std::map<std::string, Mount> mounts;
  for (std::size_t i = 0; df_start > 0 && i + 1 < df_start; ++i) {
    const auto f = SplitFields(lines[i]);
    if (f.size() < 3) continue;
    mounts[UnescapeMountPath(f[1])] = Mount{std::string(f[0]), std::string(f[2])};
  }

  bool header = false;
  std::vector<std::string_view> pending;
  for (std::size_t i = df_start; i < lines.size(); ++i) {
    const auto line = lines[i];
    if (Trim(line).empty()) continue;
    if (!header) {
      if (Trim(line).starts_with("Filesystem")) { header = true; continue; }
      return Failure(raw, "missing df header", line);
    }

    // Long device names wrap the rest of the row onto the next line.
    const auto f = SplitFields(line);
    pending.insert(pending.end(), f.begin(), f.end());
    if (pending.size() < 6) continue;

    std::uint64_t blocks = 0, used = 0, avail = 0;
    if (!ParseU64(pending[1], blocks) || !ParseU64(pending[2], used) || !ParseU64(pending[3], avail)) {
      return Failure(raw, "non-numeric df row", line);
    }
    const auto first = pending[5];
    const auto last = pending.back();
    const std::string mountpoint(first.data(), last.data() + last.size() - first.data());
    std::string device(pending[0]);
    pending.clear();

    std::string fstype = "unknown";
    if (auto it = mounts.find(mountpoint); it != mounts.end()) fstype = it->second.fstype;
    if (kIgnoredTypes.count(fstype) || blocks == 0) continue;

    const std::vector<Label> labels = {{"device", device}, {"fstype", fstype}, {"mountpoint", mountpoint}};
    const double free_bytes = blocks > used ? static_cast<double>(blocks - used) * 1024.0 : 0.0;
    out.samples.push_back(Gauge("node_filesystem_size_bytes", static_cast<double>(blocks) * 1024.0, labels,
                                "Filesystem size in bytes."));
    out.samples.push_back(Gauge("node_filesystem_free_bytes", free_bytes, labels,
                                "Filesystem free space in bytes."));
    out.samples.push_back(Gauge("node_filesystem_avail_bytes", static_cast<double>(avail) * 1024.0, labels,
                                "Filesystem space available to non-root users in bytes."));
  }

  if (!header) return Failure(raw, "missing df output", raw.text);
  if (!pending.empty()) return Failure(raw, "truncated df row", pending.front());
  return out;
}

} // namespace tomexp::parsers
