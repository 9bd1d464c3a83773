#include "span_allocator.hpp"

bool SpanAllocator::overlaps(const Span& span) const {
  if (byStart_.empty() || span.end <= span.start) return false;
  // Committed spans are disjoint, so only the last one starting before
  // `span.end` can reach into it.
  auto it = byStart_.lower_bound(span.end);
  if (it == byStart_.begin()) return false;
  --it;
  return it->second.span.end > span.start;
}

bool SpanAllocator::commit(const Span& span, const CompiledPattern* pattern) {
  if (span.end <= span.start || overlaps(span)) return false;
  byStart_.emplace(span.start, CommittedSpan{span, pattern});
  return true;
}

std::vector<CommittedSpan> SpanAllocator::committed() const {
  std::vector<CommittedSpan> out;
  out.reserve(byStart_.size());
  for (const auto& entry : byStart_) out.push_back(entry.second);
  return out;
}
