#pragma once

#include "entity.hpp"
#include "pattern_library.hpp"
#include "span_allocator.hpp"

#include <memory>
#include <string>
#include <vector>

// Finds dates, times, money amounts and measurements in `text`. Patterns run
// tier by tier, widest context first, and each accepted match claims its
// span so narrower patterns cannot take a piece of it. The result is ordered
// by position and never overlaps. Never throws for any input text.
std::vector<Entity> extractEntities(const PatternLibrary& library, const std::string& text);

// Same scan, also handing back the committed spans in start order.
std::vector<Entity> extractEntities(const PatternLibrary& library, const std::string& text,
                                    std::vector<CommittedSpan>& committed);

// Holds a shared, immutable pattern library. Safe to call from several
// threads at once.
class FactExtractor {
public:
  explicit FactExtractor(std::shared_ptr<const PatternLibrary> library);

  std::vector<Entity> extract(const std::string& text) const;
  const PatternLibrary& library() const { return *library_; }

private:
  std::shared_ptr<const PatternLibrary> library_;
};
