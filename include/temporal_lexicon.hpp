#pragma once

#include <optional>
#include <string>

enum class DatePrecision {
  Year,
  Month,
  Day,
};

struct CalendarDate {
  int year = 0;
  int month = 0;  // 1-12, 0 when precision is Year
  int day = 0;    // 1-31, 0 unless precision is Day
  DatePrecision precision = DatePrecision::Day;

  // "2024-03-15", "2024-03" or "2024" depending on precision.
  std::string isoText() const;
  // Days since 1970-01-01 of the first day the date covers.
  long long epochDays() const;
};

// Month and year to assume when the text omits them ("18" in "March 15-18, 2024").
struct DateFallback {
  int month = 0;
  int year = 0;
};

// Accepts "March 15, 2024", "15 March 2024", "3/15/2024", "2024-03-15",
// "March 2024", "2024", "March 15" and "15" (the last two need a fallback).
// Ordinal suffixes and abbreviated month names are accepted. Invalid
// calendar dates yield nullopt.
std::optional<CalendarDate> parseDate(const std::string& text, const DateFallback& fallback = {});

// 1-12 for English month names and their common abbreviations, 0 otherwise.
int monthFromName(const std::string& name);

int daysInMonth(int year, int month);

enum class Meridiem {
  None,
  Am,
  Pm,
};

struct TimeOfDay {
  int hour = 0;  // 0-23
  int minute = 0;
  int second = 0;
  bool hasSeconds = false;

  // "09:00" or "09:00:30".
  std::string isoText() const;
  int secondsOfDay() const { return hour * 3600 + minute * 60 + second; }
};

// Meridiem written in `text`, if any.
Meridiem meridiemOf(const std::string& text);

// Accepts "9:00", "9:00 AM", "9:00:30 p.m.", "5pm", "noon" and "midnight".
// A bare hour needs a meridiem, either written or supplied as `fallback`.
std::optional<TimeOfDay> parseTimeOfDay(const std::string& text, Meridiem fallback = Meridiem::None);
