#pragma once

#include "entity.hpp"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace re2 {
class RE2;
}

// Widest context first. A region contested by two tiers goes to the lower one.
enum class PatternTier {
  ContextRange = 1,
  BareRange = 2,
  CompleteSingle = 3,
  NegatedScalar = 4,
  BareScalar = 5,
};

// Meaning of one capture group of a pattern.
enum class CaptureRole {
  Start,      // first range bound
  End,        // second range bound
  Value,      // scalar value
  StartUnit,  // unit written after the first bound
  EndUnit,    // unit written after the second bound
  Unit,       // unit of a scalar
  Scale,      // scale suffix shared by both bounds ("$1-5 million")
  Month,      // month shared by both bounds ("March 15-18, 2024")
  Year,       // year shared by both bounds
};

struct PatternDefinition {
  std::string name;
  EntityCategory category = EntityCategory::Measurement;
  PatternTier tier = PatternTier::BareScalar;
  std::string expression;
  std::vector<CaptureRole> captureRoles;  // one per capture group, in group order
  // Leave the region to the negated-scalar tier when a negation cue
  // directly precedes the match ("loss of $500").
  bool yieldsToNegation = false;
};

// Byte range of one capture group. Groups that took no part in the match
// are left unmatched.
struct MatchGroup {
  size_t start = 0;
  size_t end = 0;
  bool matched = false;
};

// Group 0 is the whole match, then one entry per capture group.
using PatternMatch = std::vector<MatchGroup>;

struct CompiledPattern {
  PatternDefinition definition;
  // Shared between copies; matching through a const RE2 is thread-safe.
  std::shared_ptr<const re2::RE2> matcher;

  // Capture group index carrying `role`, 0 when the pattern has none.
  size_t groupFor(CaptureRole role) const;

  // Leftmost match starting at or after `pos`. The bytes before `pos` are
  // still seen by \b.
  bool search(const std::string& text, size_t pos, PatternMatch& match) const;
};

struct PatternCompileError {
  std::string patternName;
  std::string reason;
};

class PatternCompilationError : public std::runtime_error {
public:
  explicit PatternCompilationError(const PatternCompileError& error);
  const PatternCompileError& error() const { return error_; }

private:
  PatternCompileError error_;
};

struct LibraryOptions {
  // Categories to load; empty loads all of them.
  std::vector<EntityCategory> categories;
  // Throw PatternCompilationError on the first rejected pattern instead of
  // excluding it.
  bool strict = false;
};

// Compiles one definition after checking it for non-linear constructs and
// for a capture-role list matching its capture groups.
std::variant<CompiledPattern, PatternCompileError> compilePattern(const PatternDefinition& definition);

// The shipped pattern table, in declaration order.
std::vector<PatternDefinition> builtinPatternDefinitions();

// Immutable, tier-ordered pattern table. Built once and shared read-only by
// every extraction call.
class PatternLibrary {
public:
  static std::shared_ptr<const PatternLibrary> build(const std::vector<PatternDefinition>& definitions,
                                                     const LibraryOptions& options = {});
  static std::shared_ptr<const PatternLibrary> buildDefault(const LibraryOptions& options = {});

  // Sorted by tier; declaration order is kept inside a tier.
  const std::vector<CompiledPattern>& patterns() const { return patterns_; }
  const std::vector<PatternCompileError>& rejected() const { return rejected_; }
  size_t tierSize(PatternTier tier) const;

private:
  // Only build() can name this, so only build() constructs a library.
  struct Token {
    explicit Token() = default;
  };

public:
  explicit PatternLibrary(Token) {}

private:

  std::vector<CompiledPattern> patterns_;
  std::vector<PatternCompileError> rejected_;
};

const char* tierName(PatternTier tier);
bool isRangeTier(PatternTier tier);
