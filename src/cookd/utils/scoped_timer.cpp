#include "cookd/utils/scoped_timer.hpp"

#include <fmt/format.h>

namespace cookd::utils {

ScopedTimer::ScopedTimer(
    std::string operation_name, std::shared_ptr<spdlog::logger> logger)
    : start_(std::chrono::steady_clock::now()),
      operation_name_(std::move(operation_name)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

ScopedTimer::~ScopedTimer() {
  logger_->debug(
      "{} completed ({})", operation_name_, FormatDuration(GetElapsed()));
}

auto ScopedTimer::GetElapsed() const -> std::chrono::microseconds {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start_);
}

auto ScopedTimer::FormatDuration(std::chrono::microseconds duration)
    -> std::string {
  auto count = duration.count();

  if (count >= 1'000'000) {
    return fmt::format("{:.1f}s", static_cast<double>(count) / 1'000'000.0);
  }
  if (count >= 1'000) {
    return fmt::format("{}ms", count / 1'000);
  }
  // Scans over a single buffer are usually sub-millisecond
  return fmt::format("{}us", count);
}

}  // namespace cookd::utils
