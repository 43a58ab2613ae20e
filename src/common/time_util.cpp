#include "devpulse/common/time_util.hpp"

#include "devpulse/common/fs.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace devpulse::common {

std::string format_rfc3339(const SystemTime time) {
  const auto t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

std::string now_rfc3339() { return format_rfc3339(std::chrono::system_clock::now()); }

Result<SystemTime> parse_rfc3339(const std::string &text) {
  const std::string value = trim(text);
  if (value.size() < 20) {
    return Result<SystemTime>::failure("invalid timestamp: " + text, ErrorKind::Validation);
  }

  std::tm tm{};
  std::istringstream in(value.substr(0, 19));
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return Result<SystemTime>::failure("invalid timestamp: " + text, ErrorKind::Validation);
  }

  std::size_t pos = 19;
  std::chrono::nanoseconds fraction{0};
  if (pos < value.size() && value[pos] == '.') {
    ++pos;
    std::int64_t scale = 100000000;
    while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos])) != 0) {
      fraction += std::chrono::nanoseconds((value[pos] - '0') * scale);
      scale /= 10;
      ++pos;
    }
  }

  std::chrono::minutes offset{0};
  if (pos < value.size() && (value[pos] == 'Z' || value[pos] == 'z')) {
    ++pos;
  } else if (pos + 6 == value.size() && (value[pos] == '+' || value[pos] == '-') &&
             value[pos + 3] == ':') {
    try {
      const int hours = std::stoi(value.substr(pos + 1, 2));
      const int minutes = std::stoi(value.substr(pos + 4, 2));
      offset = std::chrono::minutes(hours * 60 + minutes);
    } catch (const std::exception &) {
      return Result<SystemTime>::failure("invalid timestamp offset: " + text,
                                         ErrorKind::Validation);
    }
    if (value[pos] == '-') {
      offset = -offset;
    }
    pos += 6;
  }
  if (pos != value.size()) {
    return Result<SystemTime>::failure("invalid timestamp: " + text, ErrorKind::Validation);
  }

  const std::time_t seconds = timegm(&tm);
  auto parsed = std::chrono::system_clock::from_time_t(seconds) - offset;
  parsed += std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
  return Result<SystemTime>::success(parsed);
}

} // namespace devpulse::common
