#include "extractor.hpp"
#include "entity_parser.hpp"
#include "number_lexicon.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

bool isDigit(char c) {
  return c >= '0' && c <= '9';
}

bool isAsciiAlnum(char c) {
  return isDigit(c) || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

// The engine has no look-behind, so word boundaries on the outside of a
// match are checked here: "A15%" and "x-20" are not entities, nor is the
// "2345" of "1,2345" or the "5.3" of "12.5.3".
bool startsInsideWord(const std::string& text, size_t start) {
  if (start == 0 || start >= text.size()) return false;
  const char prev = text[start - 1];
  const char cur = text[start];
  if (isAsciiAlnum(prev)) return isAsciiAlnum(cur) || cur == '.' || startsWithSignGlyph(text, start);
  if (prev == '.' || prev == ',') return isDigit(cur) && start >= 2 && isAsciiAlnum(text[start - 2]);
  return false;
}

bool endsInsideWord(const std::string& text, size_t end) {
  if (end >= text.size()) return false;
  char next = text[end];
  if (isDigit(next)) return true;
  return isAsciiAlnum(text[end - 1]) && isAsciiAlnum(next);
}

// First position after `start` where an accepted match could begin.
// Skipping the rest of a word keeps a long rejected run from being searched
// once per byte.
size_t nextCandidate(const std::string& text, size_t start) {
  size_t pos = start + 1;
  while (pos < text.size() && startsInsideWord(text, pos)) pos++;
  return pos;
}

void scanPattern(const CompiledPattern& pattern, const std::string& text, SpanAllocator& allocator,
                 std::vector<Entity>& out) {
  PatternMatch m;
  size_t pos = 0;

  while (pos < text.size()) {
    if (!pattern.search(text, pos, m)) break;

    Span span{m[0].start, m[0].end};
    if (span.end <= span.start || startsInsideWord(text, span.start) || endsInsideWord(text, span.end)) {
      pos = nextCandidate(text, span.start);
      continue;
    }
    pos = span.end;

    if (allocator.overlaps(span)) continue;
    if (pattern.definition.yieldsToNegation && precededByNegationCue(text, span.start)) continue;

    auto entity = parseEntity(pattern, m, text);
    if (!entity) continue;
    if (allocator.commit(span, &pattern)) out.push_back(std::move(*entity));
  }
}

void assignCodepointSpans(const std::string& text, std::vector<Entity>& entities) {
  size_t bytePos = 0;
  size_t codepoints = 0;
  auto advanceTo = [&](size_t target) {
    for (; bytePos < target && bytePos < text.size(); ++bytePos) {
      if ((static_cast<unsigned char>(text[bytePos]) & 0xC0) != 0x80) codepoints++;
    }
    return codepoints;
  };
  for (auto& entity : entities) {
    entity.span.start = advanceTo(entity.byteSpan.start);
    entity.span.end = advanceTo(entity.byteSpan.end);
  }
}

} // namespace

std::vector<Entity> extractEntities(const PatternLibrary& library, const std::string& text,
                                    std::vector<CommittedSpan>& committed) {
  SpanAllocator allocator;
  std::vector<Entity> entities;

  for (const auto& pattern : library.patterns()) {
    scanPattern(pattern, text, allocator, entities);
  }

  std::stable_sort(entities.begin(), entities.end(),
                   [](const Entity& a, const Entity& b) { return a.byteSpan.start < b.byteSpan.start; });
  assignCodepointSpans(text, entities);

  committed = allocator.committed();
  spdlog::debug("Extracted {} entities from {} bytes", entities.size(), text.size());
  return entities;
}

std::vector<Entity> extractEntities(const PatternLibrary& library, const std::string& text) {
  std::vector<CommittedSpan> committed;
  return extractEntities(library, text, committed);
}

FactExtractor::FactExtractor(std::shared_ptr<const PatternLibrary> library) : library_(std::move(library)) {
  if (!library_) {
    throw std::invalid_argument("FactExtractor requires a pattern library");
  }
}

std::vector<Entity> FactExtractor::extract(const std::string& text) const {
  return extractEntities(*library_, text);
}
