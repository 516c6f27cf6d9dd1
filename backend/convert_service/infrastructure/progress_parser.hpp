#pragma once

#include <optional>
#include <string_view>

namespace convert_service {

// Turns ffmpeg's diagnostic stream (`-progress pipe:2` key=value blocks and the
// classic "time=HH:MM:SS.xx" stats line) into a completion fraction.
//
// The fraction never decreases and stays below 1.0: only a confirmed successful
// exit may report completion. With an unknown duration every progress block
// advances a heartbeat value asymptotically towards the cap instead.
class ProgressParser {
public:
  static constexpr double kRunningCap = 0.999;
  static constexpr double kHeartbeatStep = 0.02;

  explicit ProgressParser(double total_seconds);

  std::optional<double> feed(std::string_view line);
  double current() const { return fraction_; }

  // True for the key=value lines ffmpeg writes with -progress.
  static bool isProgressLine(std::string_view line);

  // "01:02:03.5" -> 3723.5; nullopt on anything else ("N/A", garbage)
  static std::optional<double> parseClock(std::string_view text);

private:
  std::optional<double> elapsedSeconds(std::string_view line) const;

  double total_;
  double fraction_{0.0};
};

} // namespace convert_service
