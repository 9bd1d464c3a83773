#include "number_lexicon.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <re2/re2.h>
#include <string>

namespace {

const char* const kMinusGlyphs[] = {
  "\xE2\x88\x92",  // U+2212 minus sign
  "\xE2\x80\x93",  // U+2013 en dash
  "\xE2\x80\x94",  // U+2014 em dash
};

bool isDigit(char c) {
  return c >= '0' && c <= '9';
}

bool isAlpha(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
  while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) b--;
  return s.substr(a, b - a);
}

std::optional<double> scaleForWord(const std::string& word) {
  std::string w = toLower(word);
  if (w == "k" || w == "thousand") return 1e3;
  if (w == "m" || w == "mn" || w == "million") return 1e6;
  if (w == "b" || w == "bn" || w == "billion") return 1e9;
  if (w == "trillion") return 1e12;
  return std::nullopt;
}

struct NumberParts {
  double mantissa = 0.0;
  double scale = 1.0;
  bool scaled = false;
  bool negative = false;
};

std::optional<NumberParts> splitNumber(const std::string& text) {
  size_t first = text.find_first_of("0123456789");
  if (first == std::string::npos) return std::nullopt;

  NumberParts parts;
  for (size_t i = 0; i < first; ++i) {
    if (startsWithSignGlyph(text, i)) {
      parts.negative = true;
      break;
    }
  }

  std::string digits;
  bool seenPoint = false;
  if (first > 0 && text[first - 1] == '.') {
    digits = "0.";
    seenPoint = true;
  }

  size_t i = first;
  for (; i < text.size(); ++i) {
    char c = text[i];
    bool digitFollows = i + 1 < text.size() && isDigit(text[i + 1]);
    if (isDigit(c)) {
      digits.push_back(c);
    } else if (c == ',' && !seenPoint && digitFollows) {
      continue;
    } else if (c == '.' && !seenPoint && digitFollows) {
      seenPoint = true;
      digits.push_back('.');
    } else {
      break;
    }
  }
  parts.mantissa = std::strtod(digits.c_str(), nullptr);

  size_t wordStart = i;
  if (wordStart < text.size() && std::isspace(static_cast<unsigned char>(text[wordStart]))) wordStart++;
  size_t wordEnd = wordStart;
  while (wordEnd < text.size() && isAlpha(text[wordEnd])) wordEnd++;
  if (wordEnd > wordStart) {
    if (auto scale = scaleForWord(text.substr(wordStart, wordEnd - wordStart))) {
      parts.scale = *scale;
      parts.scaled = true;
    }
  }
  return parts;
}

// The first non-empty of two alternative captures.
std::string eitherGroup(const std::string& a, const std::string& b) {
  return a.empty() ? b : a;
}

} // namespace

bool startsWithSignGlyph(const std::string& text, size_t pos) {
  if (pos >= text.size()) return false;
  if (text[pos] == '-') return true;
  for (const char* glyph : kMinusGlyphs) {
    if (text.compare(pos, 3, glyph) == 0) return true;
  }
  return false;
}

std::optional<double> parseNumber(const std::string& text) {
  auto parts = splitNumber(text);
  if (!parts) return std::nullopt;
  double value = parts->mantissa * parts->scale;
  if (!std::isfinite(value)) return std::nullopt;
  return parts->negative ? -value : value;
}

bool hasScaleSuffix(const std::string& text) {
  auto parts = splitNumber(text);
  return parts && parts->scaled;
}

std::optional<double> parseScale(const std::string& token) {
  std::string t = trim(token);
  if (t.empty()) return std::nullopt;
  return scaleForWord(t);
}

std::string parseUnit(const std::string& text, EntityCategory category) {
  static const re2::RE2 measurementUnit(std::string("\\d\\s?(") + kMeasurementUnitPattern + ")");
  static const re2::RE2 currency(
    "(US\\$|\\$|\xE2\x82\xAC|\xC2\xA3|\xC2\xA5)|\\b(USD|EUR|GBP|JPY|CAD|AUD|CHF|dollars?|euros?|yen)\\b");
  static const re2::RE2 scaleWord("\\b(thousand|million|billion|trillion)\\b");
  static const re2::RE2 meridiem("\\b(AM|PM|am|pm)\\b|\\b([ap])\\.m\\.");

  std::string first, second;
  switch (category) {
    case EntityCategory::Measurement:
      if (re2::RE2::PartialMatch(text, measurementUnit, &first)) return first;
      return "";
    case EntityCategory::Money:
      if (re2::RE2::PartialMatch(text, currency, &first, &second)) return eitherGroup(first, second);
      if (re2::RE2::PartialMatch(text, scaleWord, &first)) return first;
      return "";
    case EntityCategory::Time:
      if (re2::RE2::PartialMatch(text, meridiem, &first, &second)) {
        std::string found = toLower(eitherGroup(first, second));
        return found[0] == 'a' ? "AM" : "PM";
      }
      return "";
    case EntityCategory::Date:
      return "";
  }
  return "";
}

bool precededByNegationCue(const std::string& text, size_t pos) {
  static const re2::RE2 cue(std::string("(?:") + kSignPattern + "|\\b" + kNegationWordPattern + "\\s+)$");

  if (pos == 0 || pos > text.size()) return false;
  size_t from = pos > 24 ? pos - 24 : 0;
  return re2::RE2::PartialMatch(re2::StringPiece(text.data() + from, pos - from), cue);
}
