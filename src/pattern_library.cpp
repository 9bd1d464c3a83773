#include "pattern_library.hpp"
#include "pattern_safety.hpp"

#include <algorithm>
#include <re2/re2.h>
#include <spdlog/spdlog.h>

namespace {

bool categoryEnabled(const LibraryOptions& options, EntityCategory category) {
  if (options.categories.empty()) return true;
  return std::find(options.categories.begin(), options.categories.end(), category) != options.categories.end();
}

bool hasRole(const PatternDefinition& def, CaptureRole role) {
  return std::find(def.captureRoles.begin(), def.captureRoles.end(), role) != def.captureRoles.end();
}

// Empty when the roles fit the tier.
std::string checkRoles(const PatternDefinition& def) {
  if (isRangeTier(def.tier)) {
    if (!hasRole(def, CaptureRole::Start) || !hasRole(def, CaptureRole::End)) {
      return "range pattern needs Start and End captures";
    }
  } else if (!hasRole(def, CaptureRole::Value)) {
    return "scalar pattern needs a Value capture";
  }
  return "";
}

} // namespace

size_t CompiledPattern::groupFor(CaptureRole role) const {
  const auto& roles = definition.captureRoles;
  auto it = std::find(roles.begin(), roles.end(), role);
  return it == roles.end() ? 0 : static_cast<size_t>(it - roles.begin()) + 1;
}

bool CompiledPattern::search(const std::string& text, size_t pos, PatternMatch& match) const {
  match.clear();
  if (!matcher || pos > text.size()) return false;

  std::vector<re2::StringPiece> groups(static_cast<size_t>(matcher->NumberOfCapturingGroups()) + 1);
  if (!matcher->Match(text, pos, text.size(), re2::RE2::UNANCHORED, groups.data(), static_cast<int>(groups.size()))) {
    return false;
  }

  match.resize(groups.size());
  for (size_t g = 0; g < groups.size(); ++g) {
    if (groups[g].data() == nullptr) continue;
    match[g].start = static_cast<size_t>(groups[g].data() - text.data());
    match[g].end = match[g].start + groups[g].size();
    match[g].matched = true;
  }
  return true;
}

PatternCompilationError::PatternCompilationError(const PatternCompileError& error)
  : std::runtime_error("pattern '" + error.patternName + "' rejected: " + error.reason), error_(error) {}

std::variant<CompiledPattern, PatternCompileError> compilePattern(const PatternDefinition& definition) {
  const std::string name = definition.name.empty() ? "<unnamed>" : definition.name;
  if (definition.expression.empty()) return PatternCompileError{name, "empty expression"};

  if (auto construct = findNonLinearConstruct(definition.expression)) {
    return PatternCompileError{name, "not linear-time safe: " + *construct};
  }

  std::string roleProblem = checkRoles(definition);
  if (!roleProblem.empty()) return PatternCompileError{name, roleProblem};

  // Errors come back through error(); RE2 must not print them itself.
  re2::RE2::Options reOptions;
  reOptions.set_log_errors(false);
  auto matcher = std::make_shared<const re2::RE2>(definition.expression, reOptions);
  if (!matcher->ok()) {
    return PatternCompileError{name, "regex error: " + matcher->error()};
  }

  const size_t groups = static_cast<size_t>(matcher->NumberOfCapturingGroups());
  if (groups != definition.captureRoles.size()) {
    return PatternCompileError{name, "expression has " + std::to_string(groups) + " capture groups but " +
                                       std::to_string(definition.captureRoles.size()) + " roles"};
  }

  CompiledPattern compiled;
  compiled.definition = definition;
  compiled.matcher = std::move(matcher);
  return compiled;
}

std::shared_ptr<const PatternLibrary> PatternLibrary::build(const std::vector<PatternDefinition>& definitions,
                                                            const LibraryOptions& options) {
  auto library = std::make_shared<PatternLibrary>(Token{});

  for (const auto& def : definitions) {
    if (!categoryEnabled(options, def.category)) continue;

    auto result = compilePattern(def);
    if (auto* error = std::get_if<PatternCompileError>(&result)) {
      if (options.strict) throw PatternCompilationError(*error);
      spdlog::warn("Pattern '{}' rejected: {}", error->patternName, error->reason);
      library->rejected_.push_back(*error);
      continue;
    }
    library->patterns_.push_back(std::move(std::get<CompiledPattern>(result)));
  }

  std::stable_sort(library->patterns_.begin(), library->patterns_.end(),
                   [](const CompiledPattern& a, const CompiledPattern& b) {
                     return static_cast<int>(a.definition.tier) < static_cast<int>(b.definition.tier);
                   });

  spdlog::debug("Pattern library ready: {} patterns, {} rejected", library->patterns_.size(),
                library->rejected_.size());
  return library;
}

std::shared_ptr<const PatternLibrary> PatternLibrary::buildDefault(const LibraryOptions& options) {
  return build(builtinPatternDefinitions(), options);
}

size_t PatternLibrary::tierSize(PatternTier tier) const {
  return static_cast<size_t>(std::count_if(patterns_.begin(), patterns_.end(),
                                           [tier](const CompiledPattern& p) { return p.definition.tier == tier; }));
}

const char* tierName(PatternTier tier) {
  switch (tier) {
    case PatternTier::ContextRange: return "context-range";
    case PatternTier::BareRange: return "bare-range";
    case PatternTier::CompleteSingle: return "complete-single";
    case PatternTier::NegatedScalar: return "negated-scalar";
    case PatternTier::BareScalar: return "bare-scalar";
  }
  return "unknown";
}

bool isRangeTier(PatternTier tier) {
  return tier == PatternTier::ContextRange || tier == PatternTier::BareRange;
}
