#include "tracescope/common/time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace tracescope::common {

namespace {

std::tm to_utc_tm(const std::time_t value) {
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &value);
#else
  gmtime_r(&value, &tm);
#endif
  return tm;
}

std::tm to_local_tm(const std::time_t value) {
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &value);
#else
  localtime_r(&value, &tm);
#endif
  return tm;
}

bool read_digits(const std::string &value, std::size_t &pos, const std::size_t count, int &out) {
  if (pos + count > value.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char ch = value[pos + i];
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      return false;
    }
    out = out * 10 + (ch - '0');
  }
  pos += count;
  return true;
}

} // namespace

std::optional<Timestamp> parse_iso8601(const std::string &value) {
  std::tm tm{};
  std::istringstream in(value);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }

  std::size_t pos = static_cast<std::size_t>(in.tellg());
  if (in.eof()) {
    pos = value.size();
  }

  std::chrono::milliseconds fraction{0};
  if (pos < value.size() && value[pos] == '.') {
    ++pos;
    int millis = 0;
    int digits = 0;
    while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos])) != 0) {
      if (digits < 3) {
        millis = millis * 10 + (value[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (int i = digits; i < 3; ++i) {
      millis *= 10;
    }
    fraction = std::chrono::milliseconds(millis);
  }

  std::chrono::minutes offset{0};
  if (pos < value.size()) {
    const char zone = value[pos];
    if (zone == 'Z' || zone == 'z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      ++pos;
      int hours = 0;
      int minutes = 0;
      if (!read_digits(value, pos, 2, hours)) {
        return std::nullopt;
      }
      if (pos < value.size() && value[pos] == ':') {
        ++pos;
      }
      if (!read_digits(value, pos, 2, minutes)) {
        return std::nullopt;
      }
      offset = std::chrono::minutes(hours * 60 + minutes);
      if (zone == '-') {
        offset = -offset;
      }
    }
  }
  if (pos != value.size()) {
    return std::nullopt;
  }

#ifdef _WIN32
  const std::time_t seconds = _mkgmtime(&tm);
#else
  const std::time_t seconds = timegm(&tm);
#endif
  if (seconds == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(seconds) + fraction - offset;
}

std::string format_iso8601(const Timestamp value) {
  const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(value);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(value - seconds).count();
  auto whole = std::chrono::system_clock::to_time_t(seconds);
  if (millis < 0) {
    millis += 1000;
    whole -= 1;
  }
  const std::tm tm = to_utc_tm(whole);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

std::string local_date_key(const Timestamp value) {
  const std::tm tm = to_local_tm(std::chrono::system_clock::to_time_t(value));
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d");
  return out.str();
}

std::string format_local(const Timestamp value) {
  const std::tm tm = to_local_tm(std::chrono::system_clock::to_time_t(value));
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M");
  return out.str();
}

double seconds_between(const Timestamp from, const Timestamp to) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(to - from).count();
}

} // namespace tracescope::common
