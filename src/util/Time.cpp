#include "kspec/util/Time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace kspec {
namespace util {

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  auto t  = system_clock::to_time_t(tp);
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
  if (ms.count() < 0) ms += milliseconds(1000);
  std::tm tm;
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
  return oss.str();
}

} // namespace util
} // namespace kspec
