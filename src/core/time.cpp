#include "horaid/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace horaid::core {

std::string format_unix_millis_iso8601(const std::int64_t unix_millis) {
  std::int64_t seconds = unix_millis / 1000;
  std::int64_t millis = unix_millis % 1000;
  if (millis < 0) {
    millis += 1000;
    --seconds;
  }

  const auto time_t_value = static_cast<std::time_t>(seconds);
  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return oss.str();
}

}  // namespace horaid::core
