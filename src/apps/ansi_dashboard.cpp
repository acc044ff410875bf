#include "apps/ansi_dashboard.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

namespace fta {

static constexpr const char* kReset = "\033[0m";
static constexpr const char* kRed   = "\033[31m";
static constexpr const char* kGreen = "\033[32m";
static constexpr const char* kYellow= "\033[33m";
static constexpr const char* kCyan  = "\033[36m";

static double NsToMs(std::uint64_t ns) { return static_cast<double>(ns) / 1e6; }

// Fill a simple bar based on ratio of used/cap
static std::string Bar(double frac, std::size_t width) {
  frac = std::max(0.0, std::min(1.0, frac));
  const std::size_t filled = static_cast<std::size_t>(frac * width);
  std::string s;
  s.reserve(width);
  for (std::size_t i = 0; i < width; ++i) s.push_back(i < filled ? 'I' : '_');
  return s;
}

static const char* ColorByFrac(double frac) {
  return (frac > 0.85) ? kRed : (frac > 0.60) ? kYellow : kGreen;
}

AnsiDashboard::AnsiDashboard(const Metrics& metrics, const std::atomic_bool& sigint_flag)
    : metrics_(metrics), sigint_(sigint_flag) {}

void AnsiDashboard::publish(const AnalyticsSnapshot& s) {
  if (!cleared_) {
    std::cout << "\033[2J";
    cleared_ = true;
  }

  std::cout << "\033[H";
  std::cout << "FOOT TRAFFIC ANALYTICS\n";
  std::cout << "SIGINT: " << (sigint_.load(std::memory_order_relaxed) ? "pending" : "ok")
            << "   frame " << s.frame_id << "\n\n";

  std::cout << std::left
            << std::setw(12) << "COUNT" << std::setw(12) << "ENTRIES" << std::setw(12) << "EXITS"
            << std::setw(12) << "VISITORS" << std::setw(10) << "TRACKS" << std::setw(10) << "FPS" << "\n";
  std::cout << std::string(68, '-') << "\n";
  std::cout << std::left
            << std::setw(12) << s.current_count << std::setw(12) << s.total_entries << std::setw(12) << s.total_exits
            << std::setw(12) << s.unique_visitors << std::setw(10) << s.active_tracks
            << std::setw(10) << std::fixed << std::setprecision(1) << s.fps << "\n\n";

  std::cout << "MODE  " << (s.crowd_mode ? kCyan : kGreen) << std::setw(10) << ToString(s.mode) << kReset
            << " band=" << std::setw(9) << ToString(s.density_band)
            << " conf=" << std::fixed << std::setprecision(2) << s.crowd_confidence << "      \n\n";

  std::cout << "ZONES\n";
  for (const auto& z : s.zones) {
    const double frac = z.occupancy_percent / 100.0;
    std::cout << "  " << std::setw(16) << std::left << z.name
              << " " << ColorByFrac(frac) << std::setw(4) << z.count << "/" << std::setw(4) << z.capacity
              << " [" << Bar(frac, 24) << "]" << kReset
              << "  avg=" << std::fixed << std::setprecision(1) << z.rolling_average
              << "  " << std::setprecision(0) << z.occupancy_percent << "%     \n";
  }

  std::cout << "\n" << std::left
            << std::setw(18) << "STAGE"
            << std::setw(10) << "ITEMS"
            << std::setw(10) << "DROPS"
            << std::setw(8) << "DROP%"
            << std::setw(10) << "FAILS"
            << std::setw(12) << "LAT(ms)"
            << std::setw(12) << "IDLE(ms)"
            << "\n";
  std::cout << std::string(80, '-') << "\n";
  for (const StageMetricsView& m : metrics_.views()) {
    const double drop = m.drop_ratio();
    std::cout << std::left
              << std::setw(18) << m.name
              << std::setw(10) << m.count
              << std::setw(10) << m.dropped
              << ColorByFrac(drop) << std::setw(8) << std::fixed << std::setprecision(0) << drop * 100.0 << kReset
              << std::setw(10) << m.failed
              << std::setw(12) << std::setprecision(1) << NsToMs(m.avg_latency_ns)
              << std::setw(12) << NsToMs(m.idle_ns)
              << "\n";
  }

  std::cout << "\n" << std::flush;
}

} // namespace fta
