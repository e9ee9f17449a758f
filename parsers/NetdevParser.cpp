#include "parsers/Parsers.hpp"
#include "parsers/TextUtil.hpp"

#include <array>

namespace tomexp::parsers {

namespace {

// Column order of /proc/net/dev after "iface:".
constexpr std::array<const char*, 16> kColumns = {
    "receive_bytes",  "receive_packets",  "receive_errs",  "receive_drop",
    "receive_fifo",   "receive_frame",    "receive_compressed", "receive_multicast",
    "transmit_bytes", "transmit_packets", "transmit_errs", "transmit_drop",
    "transmit_fifo",  "transmit_colls",   "transmit_carrier",   "transmit_compressed"};

struct Device {
  std::string name;
  std::array<std::uint64_t, 16> values{};
};

} // namespace

ParseOutcome ParseNetDev(const RawOutput& raw) {
  ParseOutcome out;
  std::vector<Device> devices;
  bool header = false;

  for (const auto line : SplitLines(raw.text)) {
    const auto t = Trim(line);
    if (t.empty()) continue;
    if (t.find('|') != std::string_view::npos) { header = true; continue; }

    // Old kernels print "eth0:123" without a blank after the colon.
    const auto colon = t.find(':');
    if (colon == std::string_view::npos || colon == 0) return Failure(raw, "expected 'iface: counters'", line);
    Device dev;
    dev.name = std::string(Trim(t.substr(0, colon)));
    const auto fields = SplitFields(t.substr(colon + 1));
    if (fields.size() < kColumns.size()) return Failure(raw, "interface line has fewer than 16 counters", line);
    for (std::size_t i = 0; i < kColumns.size(); ++i) {
      if (!ParseU64(fields[i], dev.values[i])) return Failure(raw, "non-numeric interface counter", line);
    }
    devices.push_back(std::move(dev));
  }

  if (!header && devices.empty()) return Failure(raw, "not a /proc/net/dev table", raw.text);

  // Family-major so each metric name stays contiguous.
  for (std::size_t i = 0; i < kColumns.size(); ++i) {
    const std::string name = std::string("node_network_") + kColumns[i] + "_total";
    const std::string help = std::string("Network device statistic ") + kColumns[i] + ".";
    for (const auto& dev : devices) {
      out.samples.push_back(Counter(name, static_cast<double>(dev.values[i]), {{"device", dev.name}}, help));
    }
  }
  return out;
}

} // namespace tomexp::parsers
