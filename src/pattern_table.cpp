#include "number_lexicon.hpp"
#include "pattern_library.hpp"

#include <string>
#include <vector>

namespace {

using Roles = std::vector<CaptureRole>;

const std::string kSign = kSignPattern;
const std::string kNum = kNumberPattern;
const std::string kScale = kScaleSuffixPattern;
const std::string kCurrency = kCurrencyPrefixPattern;
const std::string kCurrencyWord = kCurrencyWordPattern;
const std::string kUnit = kMeasurementUnitPattern;
const std::string kMeridiem = kMeridiemPattern;
const std::string kNegationWord = kNegationWordPattern;

// "-", "−", "–", "—", " to ", " through ", " thru "
const std::string kJoin =
  "(?:\\s*(?:-|\xE2\x88\x92|\xE2\x80\x93|\xE2\x80\x94)\\s*|\\s+(?:to|through|thru)\\s+)";
const std::string kFrom = "\\b[Ff]rom\\s+";
const std::string kFromJoin = "\\s+(?:to|through|thru|until|till)\\s+";
const std::string kBetween = "\\b[Bb]etween\\s+";
const std::string kBetweenJoin = "\\s+and\\s+";
const std::string kRangeCue = "\\b(?:[Rr]ange|[Bb]udget)(?:\\s+(?:of|is|was|from|allocation))?\\s*:?\\s*";

const std::string kMonth =
  "(?:January|February|March|April|May|June|July|August|September|October|November|December|"
  "Jan|Feb|Mar|Apr|Jun|Jul|Aug|Sept|Sep|Oct|Nov|Dec)";
const std::string kOrdinal = "(?:st|nd|rd|th)?";
const std::string kMonthDay = kMonth + "\\.?\\s+\\d{1,2}" + kOrdinal;
const std::string kIsoDate = "\\d{4}-\\d{1,2}-\\d{1,2}";
const std::string kNumericDate = "\\d{1,2}/\\d{1,2}/\\d{4}";
const std::string kMonthDayYear = kMonthDay + ",?\\s+\\d{4}";
const std::string kDayMonthYear = "\\d{1,2}" + kOrdinal + "\\s+" + kMonth + "\\.?,?\\s+\\d{4}";
const std::string kFullDate =
  "(?:" + kMonthDayYear + "|" + kDayMonthYear + "|" + kIsoDate + "|" + kNumericDate + ")";
const std::string kDateOperand = "(?:" + kFullDate + "|(?:19|20)\\d{2})";

const std::string kClock = "\\d{1,2}:\\d{2}(?::\\d{2})?";
const std::string kClockTime = kClock + "(?:\\s?" + kMeridiem + ")?";
const std::string kHourWithMeridiem = "\\d{1,2}(?::\\d{2})?\\s?" + kMeridiem;
const std::string kHourMaybeMeridiem = "\\d{1,2}(?::\\d{2})?(?:\\s?" + kMeridiem + ")?";
const std::string kNamedTime = "(?:[Nn]oon|[Mm]idnight)\\b";
const std::string kTimeOperand = "(?:\\d{1,2}(?::\\d{2}(?::\\d{2})?)?(?:\\s?" + kMeridiem + ")?|" + kNamedTime + ")";

const std::string kMoneyStart = "(?:" + kSign + "\\s?)?" + kCurrency + "\\s?" + kSign + "?" + kNum + kScale + "?";
const std::string kMoneyEnd = "(?:" + kSign + "\\s?)?(?:" + kCurrency + "\\s?)?" + kSign + "?" + kNum;
const std::string kPlainStart = kSign + "?" + kNum + kScale + "?";
const std::string kPlainEnd = kSign + "?" + kNum;

const std::string kMeasureStart = "(" + kSign + "?" + kNum + ")(?:\\s?(" + kUnit + "))?";
const std::string kMeasureEnd = "(" + kSign + "?" + kNum + ")\\s?(" + kUnit + ")";

PatternDefinition define(const std::string& name, EntityCategory category, PatternTier tier,
                         const std::string& expression, const Roles& roles, bool yieldsToNegation = false) {
  PatternDefinition def;
  def.name = name;
  def.category = category;
  def.tier = tier;
  def.expression = expression;
  def.captureRoles = roles;
  def.yieldsToNegation = yieldsToNegation;
  return def;
}

// "from X to Y", "between X and Y" and, with `withCue`, "range X-Y" / "budget: X to Y".
// `start` and `end` carry their own capture groups; `tail` follows the second bound.
void addContextRanges(std::vector<PatternDefinition>& out, const std::string& prefix, EntityCategory category,
                      const std::string& start, const std::string& end, const std::string& tail,
                      const Roles& roles, bool withCue) {
  out.push_back(define(prefix + "_from_to", category, PatternTier::ContextRange,
                       kFrom + start + kFromJoin + end + tail, roles));
  out.push_back(define(prefix + "_between_and", category, PatternTier::ContextRange,
                       kBetween + start + kBetweenJoin + end + tail, roles));
  if (withCue) {
    out.push_back(define(prefix + "_cue_range", category, PatternTier::ContextRange,
                         kRangeCue + start + kJoin + end + tail, roles));
  }
}

void addDatePatterns(std::vector<PatternDefinition>& out) {
  const auto date = EntityCategory::Date;

  addContextRanges(out, "date", date, "(" + kDateOperand + ")", "(" + kDateOperand + ")", "",
                   {CaptureRole::Start, CaptureRole::End}, false);
  out.push_back(define("date_from_to_shared_year", date, PatternTier::ContextRange,
                       kFrom + "(" + kMonthDay + ")" + kFromJoin + "(" + kMonthDay + "),?\\s+(\\d{4})",
                       {CaptureRole::Start, CaptureRole::End, CaptureRole::Year}));

  // March 15-18, 2024
  out.push_back(define("date_day_span", date, PatternTier::BareRange,
                       "(" + kMonth + ")\\.?\\s+(\\d{1,2})" + kOrdinal + kJoin + "(\\d{1,2})" + kOrdinal +
                         ",?\\s+(\\d{4})",
                       {CaptureRole::Month, CaptureRole::Start, CaptureRole::End, CaptureRole::Year}));
  // January 1-March 31, 2024
  out.push_back(define("date_month_day_span", date, PatternTier::BareRange,
                       "(" + kMonthDay + ")" + kJoin + "(" + kMonthDay + "),?\\s+(\\d{4})",
                       {CaptureRole::Start, CaptureRole::End, CaptureRole::Year}));
  out.push_back(define("date_full_span", date, PatternTier::BareRange,
                       "(" + kFullDate + ")" + kJoin + "(" + kFullDate + ")",
                       {CaptureRole::Start, CaptureRole::End}));
  // 2024-01-01/2024-12-31
  out.push_back(define("date_iso_interval", date, PatternTier::BareRange,
                       "(" + kIsoDate + ")\\s*/\\s*(" + kIsoDate + ")",
                       {CaptureRole::Start, CaptureRole::End}));
  // January-March 2024
  out.push_back(define("date_month_span", date, PatternTier::BareRange,
                       "(" + kMonth + ")\\.?" + kJoin + "(" + kMonth + ")\\.?,?\\s+(\\d{4})",
                       {CaptureRole::Start, CaptureRole::End, CaptureRole::Year}));

  out.push_back(define("date_month_day_year", date, PatternTier::CompleteSingle, "(" + kMonthDayYear + ")",
                       {CaptureRole::Value}));
  out.push_back(define("date_day_month_year", date, PatternTier::CompleteSingle, "(" + kDayMonthYear + ")",
                       {CaptureRole::Value}));
  out.push_back(define("date_iso", date, PatternTier::CompleteSingle, "(" + kIsoDate + ")",
                       {CaptureRole::Value}));
  out.push_back(define("date_numeric", date, PatternTier::CompleteSingle, "(" + kNumericDate + ")",
                       {CaptureRole::Value}));

  out.push_back(define("date_month_year", date, PatternTier::BareScalar, "(" + kMonth + "\\.?,?\\s+\\d{4})",
                       {CaptureRole::Value}));
}

void addTimePatterns(std::vector<PatternDefinition>& out) {
  const auto time = EntityCategory::Time;

  addContextRanges(out, "time", time, "(" + kTimeOperand + ")", "(" + kTimeOperand + ")", "",
                   {CaptureRole::Start, CaptureRole::End}, false);

  out.push_back(define("time_clock_span", time, PatternTier::BareRange,
                       "(" + kClockTime + ")" + kJoin + "(" + kClockTime + ")",
                       {CaptureRole::Start, CaptureRole::End}));
  // 9-5 PM, 9 AM-5 PM, noon to 2 PM
  out.push_back(define("time_hour_span", time, PatternTier::BareRange,
                       "(" + kHourMaybeMeridiem + "|" + kNamedTime + ")" + kJoin + "(" + kHourWithMeridiem + "|" +
                         kNamedTime + ")",
                       {CaptureRole::Start, CaptureRole::End}));

  out.push_back(define("time_clock", time, PatternTier::CompleteSingle, "(" + kClockTime + ")",
                       {CaptureRole::Value}));

  out.push_back(define("time_hour", time, PatternTier::BareScalar,
                       "(" + kHourWithMeridiem + "|" + kNamedTime + ")", {CaptureRole::Value}));
}

void addMoneyPatterns(std::vector<PatternDefinition>& out) {
  const auto money = EntityCategory::Money;
  const Roles rangeRoles = {CaptureRole::Start, CaptureRole::End, CaptureRole::Scale};
  const std::string wordTail = "(" + kScale + ")?\\s?" + kCurrencyWord;

  addContextRanges(out, "money", money, "(" + kMoneyStart + ")", "(" + kMoneyEnd + ")", "(" + kScale + ")?",
                   rangeRoles, true);
  addContextRanges(out, "money_words", money, "(" + kPlainStart + ")", "(" + kPlainEnd + ")", wordTail,
                   rangeRoles, true);

  out.push_back(define("money_symbol_span", money, PatternTier::BareRange,
                       "(" + kMoneyStart + ")" + kJoin + "(" + kMoneyEnd + ")(" + kScale + ")?", rangeRoles));
  out.push_back(define("money_words_span", money, PatternTier::BareRange,
                       "(" + kPlainStart + ")" + kJoin + "(" + kPlainEnd + ")" + wordTail, rangeRoles));

  out.push_back(define("money_symbol", money, PatternTier::CompleteSingle,
                       "(" + kCurrency + "\\s?" + kNum + kScale + "?)", {CaptureRole::Value}, true));

  out.push_back(define("money_negation_cue", money, PatternTier::NegatedScalar,
                       "\\b" + kNegationWord + "\\s+(" + kMoneyStart + ")", {CaptureRole::Value}));
  out.push_back(define("money_words_negation_cue", money, PatternTier::NegatedScalar,
                       "\\b" + kNegationWord + "\\s+(" + kPlainStart + "\\s?" + kCurrencyWord + ")",
                       {CaptureRole::Value}));
  out.push_back(define("money_leading_sign", money, PatternTier::NegatedScalar,
                       kSign + "(" + kCurrency + "\\s?" + kNum + kScale + "?)", {CaptureRole::Value}));
  out.push_back(define("money_inner_sign", money, PatternTier::NegatedScalar,
                       "(" + kCurrency + "\\s?" + kSign + kNum + kScale + "?)", {CaptureRole::Value}));
  out.push_back(define("money_words_leading_sign", money, PatternTier::NegatedScalar,
                       kSign + "(" + kNum + kScale + "?\\s?" + kCurrencyWord + ")", {CaptureRole::Value}));

  out.push_back(define("money_words", money, PatternTier::BareScalar,
                       "(" + kNum + kScale + "?\\s?" + kCurrencyWord + ")", {CaptureRole::Value}));
}

void addMeasurementPatterns(std::vector<PatternDefinition>& out) {
  const auto measurement = EntityCategory::Measurement;
  const Roles rangeRoles = {CaptureRole::Start, CaptureRole::StartUnit, CaptureRole::End, CaptureRole::EndUnit};

  addContextRanges(out, "measurement", measurement, kMeasureStart, kMeasureEnd, "", rangeRoles, true);

  out.push_back(define("measurement_span", measurement, PatternTier::BareRange,
                       kMeasureStart + kJoin + kMeasureEnd, rangeRoles));

  out.push_back(define("measurement_negation_cue", measurement, PatternTier::NegatedScalar,
                       "\\b" + kNegationWord + "\\s+(" + kSign + "?" + kNum + ")\\s?(" + kUnit + ")",
                       {CaptureRole::Value, CaptureRole::Unit}));
  out.push_back(define("measurement_leading_sign", measurement, PatternTier::NegatedScalar,
                       kSign + "(" + kNum + ")\\s?(" + kUnit + ")", {CaptureRole::Value, CaptureRole::Unit}));

  out.push_back(define("measurement", measurement, PatternTier::BareScalar,
                       "(" + kNum + ")\\s?(" + kUnit + ")", {CaptureRole::Value, CaptureRole::Unit}));
}

} // namespace

std::vector<PatternDefinition> builtinPatternDefinitions() {
  std::vector<PatternDefinition> defs;
  addDatePatterns(defs);
  addTimePatterns(defs);
  addMoneyPatterns(defs);
  addMeasurementPatterns(defs);
  return defs;
}
