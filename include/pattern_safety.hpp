#pragma once

#include <optional>
#include <string>

// Scans a regular expression for constructs a linear-time (Thompson NFA)
// engine cannot run or that risk catastrophic backtracking: back-references,
// look-around, and an unbounded quantifier applied to a group that already
// contains one. Returns a description of the first offending construct, or
// nullopt when the expression is safe.
std::optional<std::string> findNonLinearConstruct(const std::string& expression);
