#include "parsers/Parsers.hpp"
#include "parsers/TextUtil.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

using namespace tomexp;
using namespace tomexp::parsers;

namespace {

RawOutput Raw(const std::string& collector, const std::string& text) {
  return RawOutput{collector, text, std::chrono::system_clock::now()};
}

// Value of the sample with this name and exactly these labels (in any order); NaN when absent.
double Find(const std::vector<MetricSample>& samples, const std::string& name, std::vector<Label> labels = {}) {
  std::sort(labels.begin(), labels.end());
  for (const auto& s : samples) {
    if (s.name != name) continue;
    auto l = s.labels;
    std::sort(l.begin(), l.end());
    if (l == labels) return s.value;
  }
  return std::nan("");
}

std::size_t Count(const std::vector<MetricSample>& samples, const std::string& name) {
  return std::count_if(samples.begin(), samples.end(), [&](const MetricSample& s) { return s.name == name; });
}

const char* kProcStat =
    "cpu  2255 34 2290 22625563 6290 127 456 0 0 0\n"
    "cpu0 1132 34 1441 11311718 3675 127 438 0 0 0\n"
    "cpu1 1123 0 849 11313845 2614 0 18 0 0 0\n"
    "intr 114930548 113199788 3 0 5 263 0 4 [... lots more numbers ...]\n"
    "ctxt 1990473\n"
    "btime 1062191376\n"
    "processes 2915\n"
    "procs_running 1\n"
    "procs_blocked 0\n"
    "softirq 183433 0 21755 12 39 0 0 0 0 0 0\n";

} // namespace

TEST(TextUtil, LinesAndFields) {
  const auto lines = SplitLines("a b\r\n\tc  d \nlast");
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0], "a b");
  const auto f = SplitFields(lines[1]);
  ASSERT_EQ(f.size(), 2u);
  EXPECT_EQ(f[0], "c");
  EXPECT_EQ(f[1], "d");
  EXPECT_EQ(lines[2], "last");
}

TEST(TextUtil, SnippetIsBounded) {
  const std::string big(500, 'x');
  EXPECT_LE(Snippet(big).size(), kSnippetMax + 3);
  EXPECT_EQ(Snippet("a\nb"), "a\\nb");
}

TEST(MeminfoParser, ScenarioKilobytesToBytes) {
  auto out = ParseMeminfo(Raw("meminfo", "MemTotal: 131072 kB\nMemFree: 65536 kB\n"));
  ASSERT_TRUE(out.ok()) << out.error.message;
  ASSERT_EQ(out.samples.size(), 2u);
  EXPECT_EQ(out.samples[0].name, "node_memory_MemTotal_bytes");
  EXPECT_EQ(out.samples[0].kind, MetricKind::Gauge);
  EXPECT_DOUBLE_EQ(out.samples[0].value, 134217728);
  EXPECT_EQ(out.samples[1].name, "node_memory_MemFree_bytes");
  EXPECT_DOUBLE_EQ(out.samples[1].value, 67108864);
}

TEST(MeminfoParser, ParenthesesAndUnitlessFields) {
  auto out = ParseMeminfo(Raw("meminfo", "Active(anon):     1024 kB\r\nHugePages_Total:       0\n\n"));
  ASSERT_TRUE(out.ok());
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_memory_Active_anon_bytes"), 1048576);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_memory_HugePages_Total"), 0);
}

TEST(MeminfoParser, ShellErrorIsParseError) {
  auto out = ParseMeminfo(Raw("meminfo", "cat: can't open '/proc/meminfo': No such file or directory\n"));
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error.collector, "meminfo");
  EXPECT_FALSE(out.error.snippet.empty());
  EXPECT_LE(out.error.snippet.size(), kSnippetMax + 3);
}

TEST(CpuParser, PerCpuSecondsAndCounters) {
  auto out = ParseCpuStat(Raw("cpu", kProcStat));
  ASSERT_TRUE(out.ok()) << out.error.message;
  EXPECT_EQ(Count(out.samples, "node_cpu_seconds_total"), 16u);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_cpu_seconds_total", {{"cpu", "0"}, {"mode", "user"}}), 11.32);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_cpu_seconds_total", {{"cpu", "1"}, {"mode", "idle"}}), 113138.45);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_cpu_seconds_total", {{"cpu", "0"}, {"mode", "softirq"}}), 4.38);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_intr_total"), 114930548);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_context_switches_total"), 1990473);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_forks_total"), 2915);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_procs_running"), 1);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_procs_blocked"), 0);
  EXPECT_EQ(Count(out.samples, "node_boot_time_seconds"), 0u);
  for (const auto& s : out.samples) {
    if (s.name == "node_cpu_seconds_total") EXPECT_EQ(s.kind, MetricKind::Counter);
  }
}

TEST(CpuParser, OldKernelWithFourColumns) {
  auto out = ParseCpuStat(Raw("cpu", "cpu 10 0 5 100\ncpu0 10 0 5 100   \nctxt 7\n"));
  ASSERT_TRUE(out.ok());
  EXPECT_EQ(Count(out.samples, "node_cpu_seconds_total"), 4u);
  EXPECT_TRUE(std::isnan(Find(out.samples, "node_cpu_seconds_total", {{"cpu", "0"}, {"mode", "iowait"}})));
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_context_switches_total"), 7);
}

TEST(CpuParser, Deterministic) {
  auto a = ParseCpuStat(Raw("cpu", kProcStat));
  auto b = ParseCpuStat(Raw("cpu", kProcStat));
  ASSERT_EQ(a.samples.size(), b.samples.size());
  for (std::size_t i = 0; i < a.samples.size(); ++i) {
    EXPECT_EQ(a.samples[i].name, b.samples[i].name);
    EXPECT_EQ(a.samples[i].labels, b.samples[i].labels);
    EXPECT_EQ(a.samples[i].value, b.samples[i].value);
  }
}

TEST(CpuParser, MalformedInput) {
  EXPECT_FALSE(ParseCpuStat(Raw("cpu", "sh: cat: not found\n")).ok());
  EXPECT_FALSE(ParseCpuStat(Raw("cpu", "cpu0 12 x 3 4\n")).ok());
  EXPECT_FALSE(ParseCpuStat(Raw("cpu", "cpu0 12 3\n")).ok());
}

TEST(LoadavgParser, AllFields) {
  auto out = ParseLoadavg(Raw("loadavg", "0.08 0.03 0.01 1/42 1234\n"));
  ASSERT_TRUE(out.ok());
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_load1"), 0.08);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_load5"), 0.03);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_load15"), 0.01);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_processes_pids"), 42);
}

TEST(LoadavgParser, OptionalColumnsMissing) {
  auto out = ParseLoadavg(Raw("loadavg", "1.50 1.00 0.50\n"));
  ASSERT_TRUE(out.ok());
  EXPECT_EQ(out.samples.size(), 3u);
  EXPECT_FALSE(ParseLoadavg(Raw("loadavg", "1.50 abc 0.50\n")).ok());
  EXPECT_FALSE(ParseLoadavg(Raw("loadavg", "1.50\n")).ok());
}

TEST(TimeParser, BootTimeFromUptime) {
  auto out = ParseTime(Raw("time", "1597976137\n1391983.12 1234.56\n"));
  ASSERT_TRUE(out.ok());
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_time_seconds"), 1597976137);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_boot_time_seconds"), 1597976137 - 1391983);
}

TEST(TimeParser, UptimeMissing) {
  auto out = ParseTime(Raw("time", "1597976137\n"));
  ASSERT_TRUE(out.ok());
  EXPECT_EQ(out.samples.size(), 1u);
  EXPECT_FALSE(ParseTime(Raw("time", "Thu Jan  1 00:00:00 UTC 1970\n")).ok());
}

TEST(UnameParser, TomatoLine) {
  auto out = ParseUname(Raw("uname", "Linux karabor 2.6.22.19 #31 Thu Jul 16 01:30:27 CEST 2020 mips Tomato\n"));
  ASSERT_TRUE(out.ok()) << out.error.message;
  ASSERT_EQ(out.samples.size(), 1u);
  const auto& s = out.samples.front();
  EXPECT_EQ(s.name, "node_uname_info");
  EXPECT_DOUBLE_EQ(s.value, 1);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_uname_info",
                        {{"domainname", "(none)"},
                         {"machine", "mips"},
                         {"nodename", "karabor"},
                         {"release", "2.6.22.19"},
                         {"sysname", "Linux"},
                         {"version", "#31 Thu Jul 16 01:30:27 CEST 2020"}}),
                   1);
}

TEST(UnameParser, GnuStyleLine) {
  auto out = ParseUname(
      Raw("uname", "Linux box 5.15.0-91-generic #101-Ubuntu SMP Tue Nov 14 13:30:08 UTC 2023 x86_64 x86_64 x86_64 GNU/Linux"));
  ASSERT_TRUE(out.ok());
  const auto& labels = out.samples.front().labels;
  auto get = [&](const std::string& k) {
    for (const auto& [key, v] : labels) if (key == k) return v;
    return std::string();
  };
  EXPECT_EQ(get("machine"), "x86_64");
  EXPECT_EQ(get("release"), "5.15.0-91-generic");
  EXPECT_EQ(get("version"), "#101-Ubuntu SMP Tue Nov 14 13:30:08 UTC 2023");
  EXPECT_FALSE(ParseUname(Raw("uname", "Linux\n")).ok());
}

TEST(NetdevParser, CountersPerDevice) {
  const char* text =
      "Inter-|   Receive                                                |  Transmit\n"
      " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
      "    lo:   12345      100    0    0    0     0          0         0    12345     100    0    0    0     0       0          0\n"
      "  eth0:1000 20 1 2 3 4 5 6 3000 40 7 8 9 10 11 12\n"
      "  vlan1: 55 1 0 0 0 0 0 0 66 2 0 0 0 0 0 0\n";
  auto out = ParseNetDev(Raw("netdev", text));
  ASSERT_TRUE(out.ok()) << out.error.message;
  EXPECT_EQ(out.samples.size(), 16u * 3u);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_network_receive_bytes_total", {{"device", "eth0"}}), 1000);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_network_receive_multicast_total", {{"device", "eth0"}}), 6);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_network_transmit_bytes_total", {{"device", "eth0"}}), 3000);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_network_transmit_carrier_total", {{"device", "eth0"}}), 11);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_network_transmit_packets_total", {{"device", "vlan1"}}), 2);
  // Same-name samples are contiguous
  EXPECT_EQ(out.samples[0].name, out.samples[2].name);
}

TEST(NetdevParser, HeaderOnlyAndMalformed) {
  auto empty = ParseNetDev(Raw("netdev", "Inter-|   Receive |  Transmit\n face |bytes|bytes\n"));
  ASSERT_TRUE(empty.ok());
  EXPECT_TRUE(empty.samples.empty());
  EXPECT_FALSE(ParseNetDev(Raw("netdev", "eth0: 1 2 3\n")).ok());
  EXPECT_FALSE(ParseNetDev(Raw("netdev", "permission denied\n")).ok());
}

TEST(FilesystemParser, ScenarioTwoVolumes) {
  const std::string text = std::string(
                               "rootfs / rootfs rw 0 0\n"
                               "/dev/root / squashfs ro 0 0\n"
                               "proc /proc proc rw 0 0\n"
                               "tmpfs /tmp tmpfs rw 0 0\n"
                               "/dev/mtdblock4 /jffs jffs2 rw,noatime 0 0\n") +
                           kFilesystemSeparator +
                           "\n"
                           "Filesystem           1K-blocks      Used Available Use% Mounted on\n"
                           "/dev/root                 6016      6016         0 100% /\n"
                           "tmpfs                    14464       408     14056   3% /tmp\n"
                           "/dev/mtdblock4            1024       256       768  25% /jffs\n";
  auto out = ParseFilesystem(Raw("filesystem", text));
  ASSERT_TRUE(out.ok()) << out.error.message;
  EXPECT_EQ(Count(out.samples, "node_filesystem_size_bytes"), 3u);

  std::vector<std::string> mountpoints;
  for (const auto& s : out.samples) {
    if (s.name != "node_filesystem_size_bytes") continue;
    for (const auto& [k, v] : s.labels) if (k == "mountpoint") mountpoints.push_back(v);
  }
  EXPECT_EQ(mountpoints, (std::vector<std::string>{"/", "/tmp", "/jffs"}));

  const std::vector<Label> jffs = {{"device", "/dev/mtdblock4"}, {"fstype", "jffs2"}, {"mountpoint", "/jffs"}};
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_filesystem_size_bytes", jffs), 1024.0 * 1024);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_filesystem_free_bytes", jffs), 768.0 * 1024);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_filesystem_avail_bytes", jffs), 768.0 * 1024);
  EXPECT_DOUBLE_EQ(
      Find(out.samples, "node_filesystem_size_bytes", {{"device", "/dev/root"}, {"fstype", "squashfs"}, {"mountpoint", "/"}}),
      6016.0 * 1024);
}

TEST(FilesystemParser, ExactlyTwoMountsInInputOrder) {
  const std::string text = std::string("/dev/sda1 /mnt/usb ext3 rw 0 0\n/dev/mtdblock4 /jffs jffs2 rw 0 0\n") +
                           kFilesystemSeparator +
                           "\nFilesystem 1K-blocks Used Available Use% Mounted on\n"
                           "/dev/sda1 2000 500 1400 25% /mnt/usb\n"
                           "/dev/mtdblock4 1024 256 768 25% /jffs\n";
  auto out = ParseFilesystem(Raw("filesystem", text));
  ASSERT_TRUE(out.ok());
  std::vector<std::string> size_mounts, free_mounts;
  for (const auto& s : out.samples) {
    for (const auto& [k, v] : s.labels) {
      if (k != "mountpoint") continue;
      if (s.name == "node_filesystem_size_bytes") size_mounts.push_back(v);
      if (s.name == "node_filesystem_free_bytes") free_mounts.push_back(v);
    }
  }
  EXPECT_EQ(size_mounts, (std::vector<std::string>{"/mnt/usb", "/jffs"}));
  EXPECT_EQ(free_mounts, size_mounts);
}

TEST(FilesystemParser, WrappedRowsAndSkippedPseudo) {
  const std::string text = std::string("none /proc proc rw 0 0\n/dev/sda1 /mnt/my\\040disk ext3 rw 0 0\n") +
                           kFilesystemSeparator +
                           "\nFilesystem 1K-blocks Used Available Use% Mounted on\n"
                           "none 0 0 0 0% /proc\n"
                           "/dev/disk/by-label/a-very-long-device-name\n"
                           "                          2000 500 1400 25% /mnt/my disk\n";
  auto out = ParseFilesystem(Raw("filesystem", text));
  ASSERT_TRUE(out.ok()) << out.error.message;
  EXPECT_EQ(Count(out.samples, "node_filesystem_size_bytes"), 1u);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_filesystem_size_bytes",
                        {{"device", "/dev/disk/by-label/a-very-long-device-name"},
                         {"fstype", "ext3"},
                         {"mountpoint", "/mnt/my disk"}}),
                   2000.0 * 1024);
}

TEST(FilesystemParser, MalformedDf) {
  EXPECT_FALSE(ParseFilesystem(Raw("filesystem", "df: applet not found\n")).ok());
  EXPECT_FALSE(ParseFilesystem(Raw("filesystem", "Filesystem 1K-blocks Used Available Use% Mounted on\n/dev/x a b c 1% /\n")).ok());
}

TEST(WirelessParser, QualityAndDiscards) {
  const char* text =
      "Inter-| sta-|   Quality        |   Discarded packets               | Missed | WE\n"
      " face | tus | link level noise |  nwid  crypt   frag  retry   misc | beacon | 22\n"
      "  eth1: 0000   54.  -56.  -92.       0      3      0     12      1        7\n";
  auto out = ParseWireless(Raw("wireless", text));
  ASSERT_TRUE(out.ok()) << out.error.message;
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_wifi_interface_link_quality", {{"device", "eth1"}}), 54);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_wifi_interface_signal_dbm", {{"device", "eth1"}}), -56);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_wifi_interface_noise_dbm", {{"device", "eth1"}}), -92);
  EXPECT_DOUBLE_EQ(
      Find(out.samples, "node_wifi_interface_discarded_packets_total", {{"device", "eth1"}, {"reason", "crypt"}}), 3);
  EXPECT_DOUBLE_EQ(
      Find(out.samples, "node_wifi_interface_discarded_packets_total", {{"device", "eth1"}, {"reason", "retry"}}), 12);
  EXPECT_DOUBLE_EQ(Find(out.samples, "node_wifi_interface_missed_beacons_total", {{"device", "eth1"}}), 7);
}

TEST(WirelessParser, EmptyTableAndShortRows) {
  auto empty = ParseWireless(Raw("wireless", "Inter-| sta-|   Quality  |\n face | tus | link level noise |\n"));
  ASSERT_TRUE(empty.ok());
  EXPECT_TRUE(empty.samples.empty());

  auto shortrow = ParseWireless(Raw("wireless", "Inter-| sta-|\n  wl0: 0000 30. -70. -95.\n"));
  ASSERT_TRUE(shortrow.ok());
  EXPECT_EQ(shortrow.samples.size(), 3u);

  EXPECT_FALSE(ParseWireless(Raw("wireless", "  wl0: 0000 x\n")).ok());
}
