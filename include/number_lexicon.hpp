#pragma once

#include "entity.hpp"

#include <cstddef>
#include <optional>
#include <string>

// RE2 fragments shared by the pattern table and the unit lookups below.
// Multi-byte glyphs are spelled as UTF-8 bytes inside alternations.

inline constexpr char kSignPattern[] = "(?:-|\xE2\x88\x92|\xE2\x80\x93)";
inline constexpr char kNumberPattern[] = "(?:\\d{1,3}(?:,\\d{3})+(?:\\.\\d+)?|\\d+(?:\\.\\d+)?|\\.\\d+)";
inline constexpr char kScaleSuffixPattern[] =
  "(?:\\s?(?:thousand|million|billion|trillion)\\b|(?:[KMB]|bn|mn)\\b)";
inline constexpr char kCurrencyPrefixPattern[] =
  "(?:US\\$|\\$|\xE2\x82\xAC|\xC2\xA3|\xC2\xA5|(?:USD|EUR|GBP|JPY|CAD|AUD|CHF)\\s?)";
inline constexpr char kCurrencyWordPattern[] = "(?:dollars?|euros?|yen|USD|EUR|GBP|JPY|CAD|AUD|CHF)\\b";
inline constexpr char kMeridiemPattern[] = "(?:(?:AM|PM|am|pm)\\b|[ap]\\.m\\.)";
inline constexpr char kMeasurementUnitPattern[] =
  "(?:\xC2\xB0\\s?[CFK]\\b|%|\xC2\xB5m\\b|"
  "(?:percent|degrees?\\s?[CF]|degrees?|inches|inch|feet|foot|ft|yards?|yd|miles?|mi|"
  "kilometers?|kilometres?|km|centimeters?|centimetres?|cm|millimeters?|millimetres?|mm|"
  "nanometers?|nm|micrometers?|meters?|metres?|m|kilograms?|kg|milligrams?|mg|grams?|g|"
  "pounds?|lbs?|ounces?|oz|tonnes?|tons?|milliliters?|millilitres?|ml|mL|liters?|litres?|L|"
  "gallons?|gal|psi|kPa|MPa|Pa|bar|mAh|mA|amps?|volts?|kV|V|kW|MW|W|watts?|"
  "GHz|MHz|kHz|Hz|dB|decibels?|seconds?|secs?|minutes?|mins?|hours?|hrs?|"
  "days?|weeks?|months?|years?)\\b)";
inline constexpr char kNegationWordPattern[] =
  "(?:[Mm]inus|[Nn]egative|[Ll]oss of|[Dd]ecline of|[Dd]rop of|[Bb]elow|[Dd]eficit of)";

// Numeric literal to double. Currency symbols/codes and grouping commas are
// ignored, any minus glyph before the first digit makes the value negative and
// a scale suffix after the mantissa (K, M, B, thousand, million, ...) is
// applied. Returns nullopt when the text holds no digit or the value does not
// fit a finite double.
std::optional<double> parseNumber(const std::string& text);

// True when a scale suffix directly follows the mantissa in `text`.
bool hasScaleSuffix(const std::string& text);

// Multiplier of a standalone scale token (" million", "K", "bn").
std::optional<double> parseScale(const std::string& token);

// First unit token of the category found in `text`; empty when none.
std::string parseUnit(const std::string& text, EntityCategory category);

// True when the bytes right before `pos` are a negation cue: a glued minus
// glyph or one of the cue phrases followed by whitespace.
bool precededByNegationCue(const std::string& text, size_t pos);

// True when `text` holds a hyphen, minus sign or en/em dash at `pos`.
bool startsWithSignGlyph(const std::string& text, size_t pos);
