#include "entity_parser.hpp"
#include "number_lexicon.hpp"
#include "temporal_lexicon.hpp"

#include <cmath>
#include <spdlog/spdlog.h>

namespace {

std::string groupText(const CompiledPattern& pattern, const PatternMatch& match, const std::string& text,
                      CaptureRole role) {
  size_t g = pattern.groupFor(role);
  if (g == 0 || g >= match.size() || !match[g].matched) return "";
  return text.substr(match[g].start, match[g].end - match[g].start);
}

std::string meridiemText(Meridiem meridiem) {
  switch (meridiem) {
    case Meridiem::Am: return "AM";
    case Meridiem::Pm: return "PM";
    case Meridiem::None: break;
  }
  return "";
}

// 0 unless `digits` is a short run of ASCII digits.
int yearFromText(const std::string& digits) {
  if (digits.empty() || digits.size() > 4) return 0;
  for (char c : digits) {
    if (c < '0' || c > '9') return 0;
  }
  return std::stoi(digits);
}

Meridiem opposite(Meridiem meridiem) {
  return meridiem == Meridiem::Am ? Meridiem::Pm : Meridiem::Am;
}

std::optional<ScalarValue> parseScalar(EntityCategory category, const std::string& raw) {
  ScalarValue scalar;
  switch (category) {
    case EntityCategory::Date: {
      auto date = parseDate(raw);
      if (!date) return std::nullopt;
      scalar.value = static_cast<double>(date->epochDays());
      scalar.normalized = date->isoText();
      return scalar;
    }
    case EntityCategory::Time: {
      auto time = parseTimeOfDay(raw);
      if (!time) return std::nullopt;
      scalar.value = time->secondsOfDay();
      scalar.normalized = time->isoText();
      return scalar;
    }
    case EntityCategory::Money:
    case EntityCategory::Measurement: {
      auto value = parseNumber(raw);
      if (!value) return std::nullopt;
      scalar.value = *value;
      return scalar;
    }
  }
  return std::nullopt;
}

bool parseDateRange(const CompiledPattern& pattern, const PatternMatch& match, const std::string& text,
                    RangeValue& range) {
  DateFallback shared;
  shared.month = monthFromName(groupText(pattern, match, text, CaptureRole::Month));
  shared.year = yearFromText(groupText(pattern, match, text, CaptureRole::Year));

  // The second bound usually carries the year ("January 1-March 31, 2024"),
  // so it is parsed first and lends its month and year to the first one.
  auto end = parseDate(range.rawEnd, shared);
  if (!end) return false;
  DateFallback startFallback;
  startFallback.month = shared.month != 0 ? shared.month : end->month;
  startFallback.year = shared.year != 0 ? shared.year : end->year;
  auto start = parseDate(range.rawStart, startFallback);
  if (!start) return false;

  range.startValue = static_cast<double>(start->epochDays());
  range.endValue = static_cast<double>(end->epochDays());
  range.normalizedStart = start->isoText();
  range.normalizedEnd = end->isoText();
  return true;
}

bool parseTimeRange(RangeValue& range) {
  auto end = parseTimeOfDay(range.rawEnd);
  if (!end) return false;

  Meridiem endMeridiem = meridiemOf(range.rawEnd);
  Meridiem startMeridiem = meridiemOf(range.rawStart);
  std::optional<TimeOfDay> start;
  if (startMeridiem == Meridiem::None && endMeridiem != Meridiem::None) {
    // "9-5 PM": borrow the end's meridiem unless that puts the start after the end.
    startMeridiem = endMeridiem;
    start = parseTimeOfDay(range.rawStart, startMeridiem);
    if (start && start->secondsOfDay() > end->secondsOfDay()) {
      if (auto flipped = parseTimeOfDay(range.rawStart, opposite(endMeridiem))) {
        start = flipped;
        startMeridiem = opposite(endMeridiem);
      }
    }
    if (!start) {
      start = parseTimeOfDay(range.rawStart);
      startMeridiem = Meridiem::None;
    }
  } else {
    start = parseTimeOfDay(range.rawStart);
  }
  if (!start) return false;

  range.startValue = start->secondsOfDay();
  range.endValue = end->secondsOfDay();
  range.normalizedStart = start->isoText();
  range.normalizedEnd = end->isoText();
  range.startUnit = meridiemText(startMeridiem);
  range.endUnit = meridiemText(endMeridiem);
  return true;
}

bool parseNumericRange(const CompiledPattern& pattern, const PatternMatch& match, const std::string& text,
                       RangeValue& range) {
  auto start = parseNumber(range.rawStart);
  auto end = parseNumber(range.rawEnd);
  if (!start || !end) return false;

  std::string scaleText = groupText(pattern, match, text, CaptureRole::Scale);
  if (auto scale = parseScale(scaleText)) {
    *end *= *scale;
    if (!hasScaleSuffix(range.rawStart)) *start *= *scale;
    if (!std::isfinite(*start) || !std::isfinite(*end)) return false;
  }

  const EntityCategory category = pattern.definition.category;
  range.startValue = *start;
  range.endValue = *end;
  range.startUnit = groupText(pattern, match, text, CaptureRole::StartUnit);
  if (range.startUnit.empty()) range.startUnit = parseUnit(range.rawStart, category);
  range.endUnit = groupText(pattern, match, text, CaptureRole::EndUnit);
  if (range.endUnit.empty()) range.endUnit = parseUnit(range.rawEnd, category);
  return true;
}

} // namespace

std::optional<Entity> parseEntity(const CompiledPattern& pattern, const PatternMatch& match, const std::string& text) {
  const PatternDefinition& def = pattern.definition;
  if (match.empty() || !match[0].matched || match[0].end <= match[0].start || match[0].end > text.size()) {
    return std::nullopt;
  }

  Entity entity;
  entity.category = def.category;
  entity.byteSpan.start = match[0].start;
  entity.byteSpan.end = match[0].end;
  entity.rawText = text.substr(match[0].start, match[0].end - match[0].start);
  entity.pattern = def.name;

  std::string explicitUnit = groupText(pattern, match, text, CaptureRole::Unit);
  entity.unit = explicitUnit.empty() ? parseUnit(entity.rawText, def.category) : explicitUnit;

  if (isRangeTier(def.tier)) {
    RangeValue range;
    range.rawStart = groupText(pattern, match, text, CaptureRole::Start);
    range.rawEnd = groupText(pattern, match, text, CaptureRole::End);

    bool parsed = false;
    switch (def.category) {
      case EntityCategory::Date: parsed = parseDateRange(pattern, match, text, range); break;
      case EntityCategory::Time: parsed = parseTimeRange(range); break;
      case EntityCategory::Money:
      case EntityCategory::Measurement: parsed = parseNumericRange(pattern, match, text, range); break;
    }
    if (!parsed) {
      spdlog::trace("Dropping '{}' ({}): range bound did not parse", entity.rawText, def.name);
      return std::nullopt;
    }
    if (def.category != EntityCategory::Time) {
      if (range.startUnit.empty()) range.startUnit = entity.unit;
      if (range.endUnit.empty()) range.endUnit = entity.unit;
    }
    entity.value = range;
    return entity;
  }

  const std::string raw = groupText(pattern, match, text, CaptureRole::Value);
  auto scalar = parseScalar(def.category, raw);
  if (!scalar) {
    spdlog::trace("Dropping '{}' ({}): value did not parse", entity.rawText, def.name);
    return std::nullopt;
  }

  if (def.tier == PatternTier::NegatedScalar) {
    if (def.category == EntityCategory::Date || def.category == EntityCategory::Time) {
      spdlog::trace("Dropping '{}' ({}): dates and times cannot be negated", entity.rawText, def.name);
      return std::nullopt;
    }
    scalar->value = -std::fabs(scalar->value);
  }
  entity.value = *scalar;
  return entity;
}
