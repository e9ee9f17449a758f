#include "parsers/Parsers.hpp"
#include "parsers/TextUtil.hpp"

#include <array>

namespace tomexp::parsers {

namespace {

constexpr std::array<const char*, 5> kDiscardReasons = {"nwid", "crypt", "fragment", "retry", "misc"};

struct Iface {
  std::string name;
  double link = 0, level = 0, noise = 0;
  std::vector<std::pair<const char*, std::uint64_t>> discarded;
  bool has_beacon = false;
  std::uint64_t beacon = 0;
};

} // namespace

// /proc/net/wireless:
//   Inter-| sta-|   Quality        |   Discarded packets               | Missed | WE
//    face | tus | link level noise |  nwid  crypt   frag  retry   misc | beacon | 22
//     eth1: 0000    5.  -256.  -92.       0      0      0      0      0        0
// Quality columns are required; discard and beacon columns vary by driver.
ParseOutcome ParseWireless(const RawOutput& raw) {
  ParseOutcome out;
  std::vector<Iface> ifaces;
  bool header = false;

  for (const auto line : SplitLines(raw.text)) {
    const auto t = Trim(line);
    if (t.empty()) continue;
    if (t.find('|') != std::string_view::npos) { header = true; continue; }

    const auto colon = t.find(':');
    if (colon == std::string_view::npos || colon == 0) return Failure(raw, "expected 'iface: status quality...'", line);
    const auto f = SplitFields(t.substr(colon + 1));
    if (f.size() < 4) return Failure(raw, "wireless line has no quality columns", line);

    Iface w;
    w.name = std::string(Trim(t.substr(0, colon)));
    if (!ParseDouble(f[1], w.link) || !ParseDouble(f[2], w.level) || !ParseDouble(f[3], w.noise)) {
      return Failure(raw, "non-numeric quality column", line);
    }
    for (std::size_t i = 0; i < kDiscardReasons.size() && 4 + i < f.size(); ++i) {
      std::uint64_t v = 0;
      if (!ParseU64(f[4 + i], v)) return Failure(raw, "non-numeric discard counter", line);
      w.discarded.emplace_back(kDiscardReasons[i], v);
    }
    if (f.size() > 9) {
      if (!ParseU64(f[9], w.beacon)) return Failure(raw, "non-numeric missed beacon counter", line);
      w.has_beacon = true;
    }
    ifaces.push_back(std::move(w));
  }

  if (!header && ifaces.empty()) return Failure(raw, "not a /proc/net/wireless table", raw.text);

  for (const auto& w : ifaces) {
    out.samples.push_back(Gauge("node_wifi_interface_link_quality", w.link, {{"device", w.name}},
                                "Link quality reported by the wireless driver."));
  }
  for (const auto& w : ifaces) {
    out.samples.push_back(Gauge("node_wifi_interface_signal_dbm", w.level, {{"device", w.name}},
                                "Signal level in dBm."));
  }
  for (const auto& w : ifaces) {
    out.samples.push_back(Gauge("node_wifi_interface_noise_dbm", w.noise, {{"device", w.name}},
                                "Noise level in dBm."));
  }
  for (const auto& w : ifaces) {
    for (const auto& [reason, v] : w.discarded) {
      out.samples.push_back(Counter("node_wifi_interface_discarded_packets_total", static_cast<double>(v),
                                    {{"device", w.name}, {"reason", reason}},
                                    "Packets discarded by the wireless interface, by reason."));
    }
  }
  for (const auto& w : ifaces) {
    if (!w.has_beacon) continue;
    out.samples.push_back(Counter("node_wifi_interface_missed_beacons_total", static_cast<double>(w.beacon),
                                  {{"device", w.name}}, "Missed beacons."));
  }
  return out;
}

} // namespace tomexp::parsers
