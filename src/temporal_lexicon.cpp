#include "temporal_lexicon.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <re2/re2.h>
#include <string>

namespace {

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
  return s.substr(a, b - a);
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

// Howard Hinnant's days_from_civil.
long long daysFromCivil(int y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const long long era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<long long>(doe) - 719468;
}

Meridiem meridiemFromToken(const std::string& token) {
  if (token.empty()) return Meridiem::None;
  return std::tolower(static_cast<unsigned char>(token[0])) == 'a' ? Meridiem::Am : Meridiem::Pm;
}

} // namespace

std::string CalendarDate::isoText() const {
  char buf[16];
  switch (precision) {
    case DatePrecision::Year:
      std::snprintf(buf, sizeof(buf), "%04d", year);
      break;
    case DatePrecision::Month:
      std::snprintf(buf, sizeof(buf), "%04d-%02d", year, month);
      break;
    case DatePrecision::Day:
      std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
      break;
  }
  return buf;
}

long long CalendarDate::epochDays() const {
  unsigned m = month > 0 ? static_cast<unsigned>(month) : 1;
  unsigned d = day > 0 ? static_cast<unsigned>(day) : 1;
  return daysFromCivil(year, m, d);
}

int monthFromName(const std::string& name) {
  static const char* const kNames[] = {
    "january", "february", "march", "april", "may", "june",
    "july", "august", "september", "october", "november", "december",
  };
  std::string n = toLower(trim(name));
  if (!n.empty() && n.back() == '.') n.pop_back();
  if (n.size() < 3) return 0;
  if (n == "sept") return 9;
  for (int i = 0; i < 12; ++i) {
    std::string full = kNames[i];
    if (n == full || n == full.substr(0, 3)) return i + 1;
  }
  return 0;
}

int daysInMonth(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && isLeapYear(year)) return 29;
  return kDays[month - 1];
}

std::optional<CalendarDate> parseDate(const std::string& text, const DateFallback& fallback) {
  static const re2::RE2 iso("(\\d{4})-(\\d{1,2})-(\\d{1,2})");
  static const re2::RE2 numeric("(\\d{1,2})/(\\d{1,2})/(\\d{4})");
  static const re2::RE2 monthYear("([A-Za-z]+)\\.?,?\\s+(\\d{4})");
  static const re2::RE2 monthDay("([A-Za-z]+)\\.?\\s+(\\d{1,2})(?:st|nd|rd|th)?(?:,?\\s+(\\d{4}))?");
  static const re2::RE2 dayMonth("(\\d{1,2})(?:st|nd|rd|th)?\\s+([A-Za-z]+)\\.?(?:,?\\s+(\\d{4}))?");
  static const re2::RE2 yearOnly("(\\d{4})");
  static const re2::RE2 monthOnly("[A-Za-z]+\\.?");
  static const re2::RE2 dayOnly("(\\d{1,2})(?:st|nd|rd|th)?");

  const std::string s = trim(text);
  std::string name, year;
  CalendarDate date;

  const bool allFields = re2::RE2::FullMatch(s, iso, &date.year, &date.month, &date.day) ||
                         re2::RE2::FullMatch(s, numeric, &date.month, &date.day, &date.year);
  if (allFields) {
    date.precision = DatePrecision::Day;
  } else if (re2::RE2::FullMatch(s, monthYear, &name, &date.year)) {
    date.month = monthFromName(name);
    date.precision = DatePrecision::Month;
  } else if (re2::RE2::FullMatch(s, monthDay, &name, &date.day, &year)) {
    date.month = monthFromName(name);
    date.year = year.empty() ? fallback.year : std::stoi(year);
  } else if (re2::RE2::FullMatch(s, dayMonth, &date.day, &name, &year)) {
    date.month = monthFromName(name);
    date.year = year.empty() ? fallback.year : std::stoi(year);
  } else if (re2::RE2::FullMatch(s, yearOnly, &date.year)) {
    date.precision = DatePrecision::Year;
  } else if (re2::RE2::FullMatch(s, monthOnly)) {
    date.month = monthFromName(s);
    date.year = fallback.year;
    date.precision = DatePrecision::Month;
  } else if (re2::RE2::FullMatch(s, dayOnly, &date.day)) {
    date.month = fallback.month;
    date.year = fallback.year;
  } else {
    return std::nullopt;
  }

  if (date.year < 1 || date.year > 9999) return std::nullopt;
  if (date.precision != DatePrecision::Year && (date.month < 1 || date.month > 12)) return std::nullopt;
  if (date.precision == DatePrecision::Day &&
      (date.day < 1 || date.day > daysInMonth(date.year, date.month))) {
    return std::nullopt;
  }
  return date;
}

std::string TimeOfDay::isoText() const {
  char buf[16];
  if (hasSeconds) {
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", hour, minute, second);
  } else {
    std::snprintf(buf, sizeof(buf), "%02d:%02d", hour, minute);
  }
  return buf;
}

Meridiem meridiemOf(const std::string& text) {
  static const re2::RE2 meridiem("\\b(AM|PM|am|pm)\\b|\\b([ap])\\.m\\.");
  std::string word, letter;
  if (!re2::RE2::PartialMatch(text, meridiem, &word, &letter)) return Meridiem::None;
  return meridiemFromToken(word.empty() ? letter : word);
}

std::optional<TimeOfDay> parseTimeOfDay(const std::string& text, Meridiem fallback) {
  static const re2::RE2 clock(
    "(\\d{1,2})(?::(\\d{2})(?::(\\d{2}))?)?\\s?(?:(AM|PM|am|pm)|([ap])\\.m\\.)?");

  const std::string s = trim(text);
  const std::string lower = toLower(s);
  TimeOfDay time;
  if (lower == "noon") {
    time.hour = 12;
    return time;
  }
  if (lower == "midnight") return time;

  int hour = 0;
  std::string minutes, seconds, word, letter;
  if (!re2::RE2::FullMatch(s, clock, &hour, &minutes, &seconds, &word, &letter)) return std::nullopt;

  Meridiem written = meridiemFromToken(word.empty() ? letter : word);
  Meridiem meridiem = written != Meridiem::None ? written : fallback;

  if (minutes.empty() && meridiem == Meridiem::None) return std::nullopt;

  time.minute = minutes.empty() ? 0 : std::stoi(minutes);
  time.second = seconds.empty() ? 0 : std::stoi(seconds);
  time.hasSeconds = !seconds.empty();
  if (time.minute > 59 || time.second > 59) return std::nullopt;

  if (meridiem == Meridiem::None) {
    if (hour > 23) return std::nullopt;
    time.hour = hour;
  } else {
    if (hour < 1 || hour > 12) return std::nullopt;
    time.hour = hour % 12 + (meridiem == Meridiem::Pm ? 12 : 0);
  }
  return time;
}
