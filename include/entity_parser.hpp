#pragma once

#include "entity.hpp"
#include "pattern_library.hpp"

#include <optional>
#include <string>

// Turns one match of `pattern` into an entity. `match` holds byte offsets
// into `text`. Range tiers give ranges in textual bound order, the negated-scalar
// tier forces a negative value, the other tiers give plain scalars.
// Returns nullopt when a value or bound does not parse; the codepoint span
// is left for the caller to fill.
std::optional<Entity> parseEntity(const CompiledPattern& pattern, const PatternMatch& match, const std::string& text);
