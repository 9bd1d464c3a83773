#include <catch2/catch_all.hpp>

#include "pattern_library.hpp"
#include "span_allocator.hpp"

TEST_CASE("SpanAllocator keeps committed spans disjoint", "[allocator]") {
  SpanAllocator allocator;
  REQUIRE(allocator.commit({10, 20}, nullptr));

  REQUIRE_FALSE(allocator.commit({15, 25}, nullptr));
  REQUIRE_FALSE(allocator.commit({5, 11}, nullptr));
  REQUIRE_FALSE(allocator.commit({12, 18}, nullptr));
  REQUIRE_FALSE(allocator.commit({0, 30}, nullptr));
  REQUIRE_FALSE(allocator.commit({10, 20}, nullptr));

  // Half-open: touching spans do not overlap.
  REQUIRE(allocator.commit({20, 25}, nullptr));
  REQUIRE(allocator.commit({5, 10}, nullptr));
  REQUIRE(allocator.size() == 3);
}

TEST_CASE("SpanAllocator rejects empty spans", "[allocator]") {
  SpanAllocator allocator;
  REQUIRE_FALSE(allocator.commit({4, 4}, nullptr));
  REQUIRE(allocator.size() == 0);
  REQUIRE_FALSE(allocator.overlaps({4, 4}));
}

TEST_CASE("SpanAllocator overlap queries", "[allocator]") {
  SpanAllocator allocator;
  REQUIRE(allocator.commit({0, 3}, nullptr));
  REQUIRE(allocator.commit({40, 50}, nullptr));
  REQUIRE(allocator.commit({10, 20}, nullptr));

  REQUIRE(allocator.overlaps({2, 5}));
  REQUIRE(allocator.overlaps({19, 40}));
  REQUIRE(allocator.overlaps({45, 46}));
  REQUIRE(allocator.overlaps({30, 60}));
  REQUIRE_FALSE(allocator.overlaps({3, 10}));
  REQUIRE_FALSE(allocator.overlaps({20, 40}));
  REQUIRE_FALSE(allocator.overlaps({50, 90}));
}

TEST_CASE("SpanAllocator lists spans in start order", "[allocator]") {
  auto library = PatternLibrary::buildDefault();
  const CompiledPattern* marker = &library->patterns().front();
  SpanAllocator allocator;
  REQUIRE(allocator.commit({30, 35}, nullptr));
  REQUIRE(allocator.commit({0, 5}, marker));
  REQUIRE(allocator.commit({10, 12}, nullptr));

  auto spans = allocator.committed();
  REQUIRE(spans.size() == 3);
  REQUIRE((spans[0].span == Span{0, 5}));
  REQUIRE(spans[0].pattern == marker);
  REQUIRE((spans[1].span == Span{10, 12}));
  REQUIRE((spans[2].span == Span{30, 35}));
}
