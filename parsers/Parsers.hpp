// Parsers for router shell output. Pure functions: RawOutput in, samples or ParseError out.
#pragma once

#include "core/Types.hpp"

namespace tomexp::parsers {

// Line printed between /proc/mounts and df output by the filesystem collector.
constexpr const char* kFilesystemSeparator = "--tomexp-df--";

ParseOutcome ParseCpuStat(const RawOutput& raw);     // /proc/stat
ParseOutcome ParseMeminfo(const RawOutput& raw);     // /proc/meminfo
ParseOutcome ParseLoadavg(const RawOutput& raw);     // /proc/loadavg
ParseOutcome ParseTime(const RawOutput& raw);        // date +%s; cat /proc/uptime
ParseOutcome ParseUname(const RawOutput& raw);       // uname -a
ParseOutcome ParseNetDev(const RawOutput& raw);      // /proc/net/dev
ParseOutcome ParseFilesystem(const RawOutput& raw);  // /proc/mounts + df -k
ParseOutcome ParseWireless(const RawOutput& raw);    // /proc/net/wireless

} // namespace tomexp::parsers
