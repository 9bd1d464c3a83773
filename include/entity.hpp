#pragma once

#include <cstddef>
#include <string>
#include <variant>

enum class EntityCategory {
  Date,
  Time,
  Money,
  Measurement,
};

enum class EntityKind {
  Range,
  Scalar,
};

// Half-open [start, end) interval.
struct Span {
  size_t start = 0;
  size_t end = 0;

  size_t length() const { return end - start; }
  bool overlaps(const Span& other) const { return start < other.end && other.start < end; }
  bool operator==(const Span& other) const { return start == other.start && end == other.end; }
  bool operator!=(const Span& other) const { return !(*this == other); }
};

struct ScalarValue {
  double value = 0.0;
  // ISO form for DATE/TIME ("2024-03-15", "14:30"), empty otherwise.
  std::string normalized;
};

struct RangeValue {
  double startValue = 0.0;
  double endValue = 0.0;
  std::string rawStart;
  std::string rawEnd;
  std::string startUnit;
  std::string endUnit;
  std::string normalizedStart;
  std::string normalizedEnd;
};

struct Entity {
  EntityCategory category = EntityCategory::Measurement;
  Span span;      // codepoint offsets
  Span byteSpan;  // byte offsets into the input string
  std::string unit;
  std::string rawText;
  std::string pattern;
  std::variant<ScalarValue, RangeValue> value;

  EntityKind kind() const {
    return std::holds_alternative<RangeValue>(value) ? EntityKind::Range : EntityKind::Scalar;
  }
  bool isRange() const { return kind() == EntityKind::Range; }

  // Throw std::bad_variant_access when called on the other kind.
  const ScalarValue& scalar() const { return std::get<ScalarValue>(value); }
  const RangeValue& range() const { return std::get<RangeValue>(value); }
};

const char* categoryName(EntityCategory category);
const char* kindName(EntityKind kind);
