#include "progress_parser.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>

namespace convert_service {

namespace {

constexpr std::array<std::string_view, 12> kProgressKeys{
  "frame=", "fps=", "stream_", "bitrate=", "total_size=", "out_time_us=",
  "out_time_ms=", "out_time=", "dup_frames=", "drop_frames=", "speed=", "progress="};

std::string_view trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == '\r' || text.back() == '\n' ||
                           text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

template <typename T>
std::optional<T> number(std::string_view text) {
  T value{};
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

// value of `key` when the line is exactly "key=value"
std::optional<std::string_view> valueOf(std::string_view line, std::string_view key) {
  if (!line.starts_with(key)) {
    return std::nullopt;
  }
  return line.substr(key.size());
}

} // namespace

ProgressParser::ProgressParser(double total_seconds)
  : total_(std::isfinite(total_seconds) ? total_seconds : 0.0) {}

std::optional<double> ProgressParser::feed(std::string_view raw) {
  const auto line = trim(raw);
  if (line.empty()) {
    return std::nullopt;
  }

  if (total_ > 0.0) {
    auto elapsed = elapsedSeconds(line);
    if (!elapsed) {
      return std::nullopt;
    }
    const double fraction = std::clamp(*elapsed / total_, 0.0, kRunningCap);
    fraction_ = std::max(fraction_, fraction);
    return fraction_;
  }

  // unknown duration: one heartbeat per progress block or stats line
  const bool heartbeat = line.starts_with("progress=continue") ||
                         (!line.starts_with("out_time") && elapsedSeconds(line).has_value());
  if (!heartbeat) {
    return std::nullopt;
  }
  fraction_ += (kRunningCap - fraction_) * kHeartbeatStep;
  return fraction_;
}

bool ProgressParser::isProgressLine(std::string_view raw) {
  const auto line = trim(raw);
  return std::any_of(kProgressKeys.begin(), kProgressKeys.end(),
                     [&](std::string_view key) { return line.starts_with(key); });
}

std::optional<double> ProgressParser::parseClock(std::string_view text) {
  bool negative = false;
  if (!text.empty() && text.front() == '-') {
    negative = true;
    text.remove_prefix(1);
  }
  auto first = text.find(':');
  auto second = first == std::string_view::npos ? first : text.find(':', first + 1);
  if (second == std::string_view::npos) {
    return std::nullopt;
  }
  auto hours = number<long>(text.substr(0, first));
  auto minutes = number<long>(text.substr(first + 1, second - first - 1));
  auto seconds = number<double>(text.substr(second + 1));
  if (!hours || !minutes || !seconds) {
    return std::nullopt;
  }
  double total = static_cast<double>(*hours) * 3600.0 + static_cast<double>(*minutes) * 60.0 + *seconds;
  return negative ? 0.0 : total;
}

std::optional<double> ProgressParser::elapsedSeconds(std::string_view line) const {
  // out_time_ms carries microseconds as well; ffmpeg kept the name for compatibility
  for (auto key : {std::string_view("out_time_us="), std::string_view("out_time_ms=")}) {
    if (auto value = valueOf(line, key)) {
      auto micros = number<long long>(*value);
      if (!micros) {
        return std::nullopt;
      }
      return std::max(0.0, static_cast<double>(*micros) / 1e6);
    }
  }
  if (auto value = valueOf(line, "out_time=")) {
    return parseClock(*value);
  }

  // classic stats line: "frame=  120 fps= 30 ... time=00:00:04.00 bitrate=..."
  auto pos = line.find("time=");
  while (pos != std::string_view::npos) {
    if (pos == 0 || line[pos - 1] == ' ') {
      auto rest = line.substr(pos + 5);
      auto end = rest.find(' ');
      return parseClock(rest.substr(0, end));
    }
    pos = line.find("time=", pos + 1);
  }
  return std::nullopt;
}

} // namespace convert_service
