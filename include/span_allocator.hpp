#pragma once

#include "entity.hpp"
#include "pattern_library.hpp"

#include <cstddef>
#include <map>
#include <vector>

struct CommittedSpan {
  Span span;
  const CompiledPattern* pattern = nullptr;
};

// Set of pairwise disjoint byte spans claimed during one extraction call.
class SpanAllocator {
public:
  bool overlaps(const Span& span) const;

  // Claims `span` for `pattern`. Fails on empty spans and on any overlap with
  // a span already committed.
  bool commit(const Span& span, const CompiledPattern* pattern);

  // Committed spans in start order.
  std::vector<CommittedSpan> committed() const;
  size_t size() const { return byStart_.size(); }

private:
  std::map<size_t, CommittedSpan> byStart_;
};
