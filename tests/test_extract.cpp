#include <catch2/catch_all.hpp>

#include "entity_format.hpp"
#include "extractor.hpp"

#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using Catch::Matchers::ContainsSubstring;

namespace {

const FactExtractor& defaultExtractor() {
  static const FactExtractor extractor(PatternLibrary::buildDefault());
  return extractor;
}

bool anyOverlap(const std::vector<Entity>& entities) {
  for (size_t i = 0; i < entities.size(); ++i) {
    for (size_t j = i + 1; j < entities.size(); ++j) {
      if (entities[i].byteSpan.overlaps(entities[j].byteSpan)) return true;
    }
  }
  return false;
}

bool sameEntities(const std::vector<Entity>& a, const std::vector<Entity>& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i].byteSpan != b[i].byteSpan || a[i].span != b[i].span || a[i].rawText != b[i].rawText ||
        a[i].pattern != b[i].pattern || a[i].unit != b[i].unit || a[i].kind() != b[i].kind()) {
      return false;
    }
  }
  return true;
}

bool allFinite(const std::vector<Entity>& entities) {
  for (const auto& e : entities) {
    if (e.isRange()) {
      if (!std::isfinite(e.range().startValue) || !std::isfinite(e.range().endValue)) return false;
    } else if (!std::isfinite(e.scalar().value)) {
      return false;
    }
  }
  return true;
}

std::string repeat(const std::string& piece, size_t times) {
  std::string out;
  out.reserve(piece.size() * times);
  for (size_t i = 0; i < times; ++i) out += piece;
  return out;
}

} // namespace

TEST_CASE("temperature range with a cue word", "[extract][scenario]") {
  const std::string text = "Temperature range -20\xC2\xB0" "F to 120\xC2\xB0" "F";
  auto entities = defaultExtractor().extract(text);

  REQUIRE(entities.size() == 1);
  const Entity& e = entities[0];
  REQUIRE(e.category == EntityCategory::Measurement);
  REQUIRE(e.isRange());
  REQUIRE(e.range().startValue == Catch::Approx(-20.0));
  REQUIRE(e.range().endValue == Catch::Approx(120.0));
  REQUIRE(e.unit == "\xC2\xB0" "F");
  REQUIRE(e.range().startUnit == "\xC2\xB0" "F");
  REQUIRE(e.range().endUnit == "\xC2\xB0" "F");

  // Two degree signs are two bytes each.
  REQUIRE(e.byteSpan.start == 12);
  REQUIRE(e.byteSpan.end == text.size());
  REQUIRE(e.span.start == 12);
  REQUIRE(e.span.end == text.size() - 2);
}

TEST_CASE("money range with a trailing scale", "[extract][scenario]") {
  auto entities = defaultExtractor().extract("$1-5 million");

  REQUIRE(entities.size() == 1);
  const Entity& e = entities[0];
  REQUIRE(e.category == EntityCategory::Money);
  REQUIRE(e.isRange());
  REQUIRE(e.range().startValue == Catch::Approx(1000000.0));
  REQUIRE(e.range().endValue == Catch::Approx(5000000.0));
  REQUIRE(e.unit == "$");
}

TEST_CASE("budget range inside a sentence", "[extract][scenario]") {
  auto entities = defaultExtractor().extract("Budget allocation: $150,000-$250,000 for the project");

  REQUIRE(entities.size() == 1);
  const Entity& e = entities[0];
  REQUIRE(e.category == EntityCategory::Money);
  REQUIRE(e.range().startValue == Catch::Approx(150000.0));
  REQUIRE(e.range().endValue == Catch::Approx(250000.0));
  REQUIRE(e.unit == "$");
  REQUIRE(e.rawText == "Budget allocation: $150,000-$250,000");
}

TEST_CASE("conference day span", "[extract][scenario]") {
  auto entities = defaultExtractor().extract("Conference dates: March 15-18, 2024");

  REQUIRE(entities.size() == 1);
  const Entity& e = entities[0];
  REQUIRE(e.category == EntityCategory::Date);
  REQUIRE(e.isRange());
  REQUIRE(e.range().normalizedStart == "2024-03-15");
  REQUIRE(e.range().normalizedEnd == "2024-03-18");
  REQUIRE(e.rawText == "March 15-18, 2024");
}

TEST_CASE("negative range keeps textual bound order", "[extract][scenario]") {
  auto entities = defaultExtractor().extract("Deficit range: -$50,000 to -$25,000");

  REQUIRE(entities.size() == 1);
  const Entity& e = entities[0];
  REQUIRE(e.category == EntityCategory::Money);
  REQUIRE(e.range().startValue == Catch::Approx(-50000.0));
  REQUIRE(e.range().endValue == Catch::Approx(-25000.0));
  REQUIRE(e.unit == "$");
}

TEST_CASE("a percentage range is one range, not two scalars", "[extract]") {
  auto entities = defaultExtractor().extract("15-20%");

  REQUIRE(entities.size() == 1);
  REQUIRE(entities[0].category == EntityCategory::Measurement);
  REQUIRE(entities[0].kind() == EntityKind::Range);
  REQUIRE(entities[0].range().startValue == Catch::Approx(15.0));
  REQUIRE(entities[0].range().endValue == Catch::Approx(20.0));
  REQUIRE(entities[0].unit == "%");
}

TEST_CASE("negation cues give negative money", "[extract]") {
  const std::vector<std::string> inputs = {
    "loss of $500",
    "-$500",
    "minus $500",
    "\xE2\x88\x92$500",
  };
  for (const auto& text : inputs) {
    INFO(text);
    auto entities = defaultExtractor().extract(text);
    REQUIRE(entities.size() == 1);
    REQUIRE(entities[0].category == EntityCategory::Money);
    REQUIRE_FALSE(entities[0].isRange());
    REQUIRE(entities[0].scalar().value == Catch::Approx(-500.0));
  }

  auto scaled = defaultExtractor().extract("Deficit of $2 million this year");
  REQUIRE(scaled.size() == 1);
  REQUIRE(scaled[0].scalar().value == Catch::Approx(-2e6));
}

TEST_CASE("negative measurements", "[extract]") {
  auto glyph = defaultExtractor().extract("\xE2\x88\x92" "20\xC2\xB0" "F");
  REQUIRE(glyph.size() == 1);
  REQUIRE(glyph[0].scalar().value == Catch::Approx(-20.0));
  REQUIRE(glyph[0].unit == "\xC2\xB0" "F");

  auto cue = defaultExtractor().extract("a drop of 5 kg");
  REQUIRE(cue.size() == 1);
  REQUIRE(cue[0].scalar().value == Catch::Approx(-5.0));
  REQUIRE(cue[0].unit == "kg");
}

TEST_CASE("every joining operator yields one whole range", "[extract]") {
  struct Case {
    std::string text;
    EntityCategory category;
  };
  const std::vector<Case> cases = {
    {"10-15%", EntityCategory::Measurement},
    {"10\xE2\x80\x93" "15%", EntityCategory::Measurement},
    {"10\xE2\x80\x94" "15 kg", EntityCategory::Measurement},
    {"10 to 15 kg", EntityCategory::Measurement},
    {"5 through 10 miles", EntityCategory::Measurement},
    {"5 thru 10 miles", EntityCategory::Measurement},
    {"2024-01-01/2024-12-31", EntityCategory::Date},
    {"from 9:00 AM to 5:00 PM", EntityCategory::Time},
    {"between 5 and 10 kg", EntityCategory::Measurement},
    {"between $10 and $20", EntityCategory::Money},
  };

  for (const auto& c : cases) {
    INFO(c.text);
    auto entities = defaultExtractor().extract(c.text);
    REQUIRE(entities.size() == 1);
    REQUIRE(entities[0].category == c.category);
    REQUIRE(entities[0].isRange());
    REQUIRE(entities[0].byteSpan.start == 0);
    REQUIRE(entities[0].byteSpan.end == c.text.size());
  }
}

TEST_CASE("time ranges carry seconds after midnight", "[extract]") {
  auto entities = defaultExtractor().extract("Open 9:00 AM-5:00 PM daily");
  REQUIRE(entities.size() == 1);
  REQUIRE(entities[0].category == EntityCategory::Time);
  REQUIRE(entities[0].range().startValue == Catch::Approx(9 * 3600.0));
  REQUIRE(entities[0].range().endValue == Catch::Approx(17 * 3600.0));
  REQUIRE(entities[0].range().normalizedEnd == "17:00");
}

TEST_CASE("a failed time parse leaves the region to measurements", "[extract]") {
  auto entities = defaultExtractor().extract("Wait from 10 to 20 minutes");
  REQUIRE(entities.size() == 1);
  REQUIRE(entities[0].category == EntityCategory::Measurement);
  REQUIRE(entities[0].range().startValue == Catch::Approx(10.0));
  REQUIRE(entities[0].range().endValue == Catch::Approx(20.0));
  REQUIRE(entities[0].unit == "minutes");
}

TEST_CASE("phone numbers are not amounts", "[extract]") {
  auto entities = defaultExtractor().extract("Call support at 321-6742");
  for (const auto& e : entities) {
    REQUIRE(e.category != EntityCategory::Money);
    REQUIRE(e.category != EntityCategory::Measurement);
  }
  REQUIRE(entities.empty());
}

TEST_CASE("numbers glued to words are skipped", "[extract]") {
  REQUIRE(defaultExtractor().extract("Model A15% blend").empty());
}

TEST_CASE("mixed text comes back ordered and disjoint", "[extract]") {
  const std::string text = "Revenue grew 15-20% to $1.5M on March 15, 2024 at 9:30 AM.";
  auto entities = defaultExtractor().extract(text);

  REQUIRE(entities.size() == 4);
  REQUIRE_FALSE(anyOverlap(entities));
  for (size_t i = 1; i < entities.size(); ++i) {
    REQUIRE(entities[i - 1].span.start < entities[i].span.start);
  }

  REQUIRE(entities[0].category == EntityCategory::Measurement);
  REQUIRE(entities[0].isRange());
  REQUIRE(entities[1].category == EntityCategory::Money);
  REQUIRE(entities[1].scalar().value == Catch::Approx(1.5e6));
  REQUIRE(entities[2].category == EntityCategory::Date);
  REQUIRE(entities[2].scalar().normalized == "2024-03-15");
  REQUIRE(entities[3].category == EntityCategory::Time);
  REQUIRE(entities[3].scalar().normalized == "09:30");
}

TEST_CASE("complete single entities", "[extract]") {
  auto entities = defaultExtractor().extract("Invoice total: $1,234.56 due 2024-07-05");
  REQUIRE(entities.size() == 2);
  REQUIRE(entities[0].category == EntityCategory::Money);
  REQUIRE(entities[0].scalar().value == Catch::Approx(1234.56));
  REQUIRE(entities[1].category == EntityCategory::Date);
  REQUIRE(entities[1].scalar().normalized == "2024-07-05");
}

TEST_CASE("spans count codepoints, byte spans count bytes", "[extract]") {
  const std::string text = "Temp\xC3\xA9rature: 25\xC2\xB0" "C";
  auto entities = defaultExtractor().extract(text);

  REQUIRE(entities.size() == 1);
  REQUIRE((entities[0].span == Span{13, 17}));
  REQUIRE((entities[0].byteSpan == Span{14, 19}));
  REQUIRE(entities[0].rawText == "25\xC2\xB0" "C");
}

TEST_CASE("extraction is idempotent", "[extract]") {
  const std::string text = "Between $10 and $20 per unit, shipped March 3, 2024, weighing 5-7 kg.";
  auto first = defaultExtractor().extract(text);
  auto second = defaultExtractor().extract(text);

  REQUIRE_FALSE(first.empty());
  REQUIRE(first.size() == second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    REQUIRE(first[i].span == second[i].span);
    REQUIRE(first[i].rawText == second[i].rawText);
    REQUIRE(first[i].pattern == second[i].pattern);
    REQUIRE(first[i].kind() == second[i].kind());
  }
}

TEST_CASE("empty input yields nothing", "[extract]") {
  REQUIRE(defaultExtractor().extract("").empty());
  REQUIRE(defaultExtractor().extract("no facts in here").empty());
}

TEST_CASE("category selection limits the output", "[extract]") {
  const std::string text = "$500 and 15 kg";
  REQUIRE(defaultExtractor().extract(text).size() == 2);

  LibraryOptions options;
  options.categories = {EntityCategory::Money};
  FactExtractor moneyOnly(PatternLibrary::buildDefault(options));
  auto entities = moneyOnly.extract(text);
  REQUIRE(entities.size() == 1);
  REQUIRE(entities[0].category == EntityCategory::Money);
}

TEST_CASE("committed spans match the returned entities", "[extract]") {
  auto library = PatternLibrary::buildDefault();
  std::vector<CommittedSpan> committed;
  auto entities = extractEntities(*library, "Budget allocation: $150,000-$250,000 for the project", committed);

  REQUIRE(entities.size() == 1);
  REQUIRE(committed.size() == 1);
  REQUIRE(committed[0].span == entities[0].byteSpan);
  REQUIRE(committed[0].pattern != nullptr);
  REQUIRE(committed[0].pattern->definition.name == entities[0].pattern);
  REQUIRE(committed[0].pattern->definition.tier == PatternTier::ContextRange);
}

TEST_CASE("an extractor needs a library", "[extract]") {
  REQUIRE_THROWS_AS(FactExtractor(std::shared_ptr<const PatternLibrary>()), std::invalid_argument);
}

TEST_CASE("fragments of a longer number are not entities", "[extract]") {
  auto leading = defaultExtractor().extract(".5 kg");
  REQUIRE(leading.size() == 1);
  REQUIRE(leading[0].rawText == ".5 kg");
  REQUIRE(leading[0].scalar().value == Catch::Approx(0.5));
  REQUIRE(leading[0].unit == "kg");

  REQUIRE(defaultExtractor().extract("12.5.3 kg").empty());
  REQUIRE(defaultExtractor().extract("1,2345 kg").empty());

  auto mixed = defaultExtractor().extract(".5 kg and 1,2345 kg");
  REQUIRE(mixed.size() == 1);
  REQUIRE(mixed[0].rawText == ".5 kg");
}

TEST_CASE("a number too large for a double is dropped", "[extract]") {
  auto entities = defaultExtractor().extract(std::string(400, '9') + " kg and 5 kg");
  REQUIRE(entities.size() == 1);
  REQUIRE(entities[0].rawText == "5 kg");

  std::ostringstream json;
  writeEntitiesJson(json, defaultExtractor().extract("$" + std::string(400, '9') + " paid"));
  REQUIRE(json.str() == "[]\n");
}

TEST_CASE("noon joins an hour span", "[extract]") {
  auto entities = defaultExtractor().extract("Lunch is noon to 2 PM.");
  REQUIRE(entities.size() == 1);
  REQUIRE(entities[0].category == EntityCategory::Time);
  REQUIRE(entities[0].isRange());
  REQUIRE(entities[0].rawText == "noon to 2 PM");
  REQUIRE(entities[0].range().startValue == Catch::Approx(12 * 3600.0));
  REQUIRE(entities[0].range().endValue == Catch::Approx(14 * 3600.0));
}

TEST_CASE("long hostile inputs finish in bounded time", "[extract][large]") {
  const size_t n = 100000;
  struct Case {
    std::string name;
    std::string text;
    size_t expected;
  };
  const std::vector<Case> cases = {
    {"digit run", std::string(n, '9'), 0},
    {"digit run with a unit", std::string(n, '9') + " kg", 0},
    {"currency then blanks", "$1" + std::string(n, ' ') + "x", 1},
    {"blanks inside a range", "from 5" + std::string(n, ' ') + "to 7 kg", 1},
    {"amounts glued to words", repeat("a1%", n / 3), 0},
    {"hyphen chain", repeat("1-", n / 2) + "x", 0},
  };

  for (const auto& c : cases) {
    INFO(c.name);
    const auto started = std::chrono::steady_clock::now();
    auto entities = defaultExtractor().extract(c.text);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(elapsed < std::chrono::seconds(5));
    REQUIRE(entities.size() == c.expected);
    REQUIRE(allFinite(entities));
  }

  auto range = defaultExtractor().extract("from 5" + std::string(n, ' ') + "to 7 kg");
  REQUIRE(range.size() == 1);
  REQUIRE(range[0].category == EntityCategory::Measurement);
  REQUIRE(range[0].range().startValue == Catch::Approx(5.0));
  REQUIRE(range[0].range().endValue == Catch::Approx(7.0));
  REQUIRE(range[0].unit == "kg");
}

TEST_CASE("a long document keeps every sentence's entities", "[extract][large]") {
  const std::string sentence = "Revenue grew 15-20% to $1.5M on March 15, 2024 at 9:30 AM. ";
  const size_t copies = 100000 / sentence.size() + 1;
  const std::string text = repeat(sentence, copies);

  const auto started = std::chrono::steady_clock::now();
  auto entities = defaultExtractor().extract(text);
  REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));

  REQUIRE(entities.size() == 4 * copies);
  for (size_t i = 1; i < entities.size(); ++i) {
    REQUIRE(entities[i - 1].byteSpan.end <= entities[i].byteSpan.start);
  }
  REQUIRE(entities.back().category == EntityCategory::Time);
  REQUIRE_THAT(entities.back().rawText, ContainsSubstring("9:30"));
}

TEST_CASE("concurrent extraction matches a single-threaded run", "[extract][threads]") {
  const std::vector<std::string> texts = {
    "Temperature range -20\xC2\xB0" "F to 120\xC2\xB0" "F",
    "Budget allocation: $150,000-$250,000 for the project",
    "Deficit range: -$50,000 to -$25,000; loss of $500",
    "Conference dates: March 15-18, 2024, doors 9 AM-5 PM",
    "Revenue grew 15-20% to $1.5M on March 15, 2024 at 9:30 AM.",
  };

  const FactExtractor& extractor = defaultExtractor();
  std::vector<std::vector<Entity>> expected;
  for (const auto& text : texts) expected.push_back(extractor.extract(text));

  const int threadCount = 8;
  const int rounds = 50;
  std::vector<int> mismatches(threadCount, 0);
  std::vector<std::thread> workers;
  for (int t = 0; t < threadCount; ++t) {
    workers.emplace_back([&, t] {
      for (int round = 0; round < rounds; ++round) {
        for (size_t i = 0; i < texts.size(); ++i) {
          if (!sameEntities(extractor.extract(texts[i]), expected[i])) mismatches[t]++;
        }
      }
    });
  }
  for (auto& worker : workers) worker.join();

  for (int t = 0; t < threadCount; ++t) {
    INFO("thread " << t);
    REQUIRE(mismatches[t] == 0);
  }
  REQUIRE(expected[2].size() == 2);
}
