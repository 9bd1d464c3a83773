#include "pattern_safety.hpp"

#include <cctype>
#include <vector>

namespace {

struct GroupFrame {
  bool hasUnbounded = false;
};

enum class LastAtom {
  None,
  Plain,
  Group,
};

bool isDigit(char c) {
  return c >= '0' && c <= '9';
}

// Parses "{n}", "{n,}" or "{n,m}" starting at `pos`. Returns the index past
// the closing brace, or `pos` when the brace does not start a quantifier.
size_t parseBraceQuantifier(const std::string& expr, size_t pos, bool& unbounded) {
  size_t i = pos + 1;
  size_t digitsStart = i;
  while (i < expr.size() && isDigit(expr[i])) i++;
  if (i == digitsStart) return pos;
  unbounded = false;
  if (i < expr.size() && expr[i] == ',') {
    i++;
    size_t upperStart = i;
    while (i < expr.size() && isDigit(expr[i])) i++;
    unbounded = i == upperStart;
  }
  if (i >= expr.size() || expr[i] != '}') return pos;
  return i + 1;
}

size_t skipBracketExpression(const std::string& expr, size_t pos) {
  size_t i = pos + 1;
  if (i < expr.size() && expr[i] == '^') i++;
  if (i < expr.size() && expr[i] == ']') i++;
  while (i < expr.size() && expr[i] != ']') {
    if (expr[i] == '\\') i++;
    i++;
  }
  return i < expr.size() ? i + 1 : i;
}

} // namespace

std::optional<std::string> findNonLinearConstruct(const std::string& expression) {
  std::vector<GroupFrame> frames(1);
  LastAtom last = LastAtom::None;
  bool lastGroupUnbounded = false;

  size_t i = 0;
  while (i < expression.size()) {
    char c = expression[i];

    if (c == '\\') {
      if (i + 1 >= expression.size()) return std::string("dangling escape");
      char next = expression[i + 1];
      if (next >= '1' && next <= '9') {
        return "back-reference \\" + std::string(1, next) + " at offset " + std::to_string(i);
      }
      last = LastAtom::Plain;
      i += 2;
      continue;
    }

    if (c == '[') {
      last = LastAtom::Plain;
      i = skipBracketExpression(expression, i);
      continue;
    }

    if (c == '(') {
      if (expression.compare(i, 3, "(?=") == 0 || expression.compare(i, 3, "(?!") == 0 ||
          expression.compare(i, 4, "(?<=") == 0 || expression.compare(i, 4, "(?<!") == 0) {
        return "look-around at offset " + std::to_string(i);
      }
      frames.push_back(GroupFrame{});
      last = LastAtom::None;
      i += expression.compare(i, 3, "(?:") == 0 ? 3 : 1;
      continue;
    }

    if (c == ')') {
      if (frames.size() < 2) return "unbalanced ')' at offset " + std::to_string(i);
      GroupFrame closed = frames.back();
      frames.pop_back();
      if (closed.hasUnbounded) frames.back().hasUnbounded = true;
      last = LastAtom::Group;
      lastGroupUnbounded = closed.hasUnbounded;
      i++;
      continue;
    }

    bool isQuantifier = false;
    bool unbounded = false;
    size_t after = i + 1;
    if (c == '*' || c == '+') {
      isQuantifier = true;
      unbounded = true;
    } else if (c == '?') {
      isQuantifier = true;
    } else if (c == '{') {
      size_t end = parseBraceQuantifier(expression, i, unbounded);
      if (end != i) {
        isQuantifier = true;
        after = end;
      }
    }

    if (isQuantifier) {
      if (last == LastAtom::None) return "quantifier without operand at offset " + std::to_string(i);
      if (unbounded) {
        if (last == LastAtom::Group && lastGroupUnbounded) {
          return "nested unbounded quantifier at offset " + std::to_string(i);
        }
        frames.back().hasUnbounded = true;
      }
      // A trailing '?' makes the quantifier lazy; it is not a new operand.
      if (after < expression.size() && expression[after] == '?') after++;
      last = LastAtom::None;
      i = after;
      continue;
    }

    if (c == '|' || c == '^' || c == '$') {
      last = LastAtom::None;
    } else {
      last = LastAtom::Plain;
    }
    i++;
  }

  if (frames.size() != 1) return std::string("unbalanced '('");
  return std::nullopt;
}
