#include "finagent/utils/time.hpp"

#include <cmath>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <thread>

namespace finagent::utils {
namespace {

constexpr double kInitialRetryDelaySeconds = 0.5;
constexpr double kMaxRetryDelaySeconds = 8.0;

}  // namespace

void sleep_for(std::chrono::milliseconds duration) {
  if (duration.count() <= 0) {
    return;
  }
  std::this_thread::sleep_for(duration);
}

double retry_jitter_factor() {
  thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_real_distribution<double> dist(0.0, 0.25);
  return 1.0 - dist(rng);
}

std::chrono::milliseconds calculate_retry_delay(std::size_t attempt, std::optional<double> jitter_factor) {
  double jitter = jitter_factor.value_or(retry_jitter_factor());
  if (jitter < 0.0) {
    jitter = 0.0;
  }

  double sleep_seconds = kInitialRetryDelaySeconds * std::pow(2.0, static_cast<double>(attempt));
  if (sleep_seconds > kMaxRetryDelaySeconds) {
    sleep_seconds = kMaxRetryDelaySeconds;
  }
  sleep_seconds *= jitter;

  return std::chrono::milliseconds(static_cast<long>(sleep_seconds * 1000.0));
}

std::optional<Timestamp> from_unix_seconds(double seconds) {
  // One second of headroom keeps the microsecond rounding inside the clock's range.
  static const double kLimit =
      std::floor(std::chrono::duration<double>(Timestamp::duration::max()).count()) - 1.0;
  if (!std::isfinite(seconds) || std::fabs(seconds) > kLimit) {
    return std::nullopt;
  }
  auto micros = static_cast<long long>(std::llround(seconds * 1'000'000.0));
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds(micros)));
}

std::string format_iso8601_utc(Timestamp timestamp) {
  auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(timestamp.time_since_epoch());
  auto whole_seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
  auto micros = (since_epoch - whole_seconds).count();

  std::time_t raw = static_cast<std::time_t>(whole_seconds.count());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &raw);
#else
  gmtime_r(&raw, &tm);
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (micros != 0) {
    oss << '.' << std::setw(6) << std::setfill('0') << micros;
  }
  oss << "+00:00";
  return oss.str();
}

}  // namespace finagent::utils
