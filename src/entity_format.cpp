#include "entity_format.hpp"

#include <cstdio>
#include <sstream>

namespace {

std::string formatNumber(double value) {
  std::ostringstream os;
  os.precision(15);
  os << value;
  return os.str();
}

std::string quoted(const std::string& s) {
  return "\"" + jsonEscape(s) + "\"";
}

} // namespace

std::string jsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char ch : s) {
    unsigned char c = static_cast<unsigned char>(ch);
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out.push_back(ch);
        }
    }
  }
  return out;
}

std::string formatEntity(const Entity& entity) {
  std::ostringstream os;
  os << categoryName(entity.category) << " " << kindName(entity.kind()) << " [" << entity.span.start << ","
     << entity.span.end << ") ";
  if (entity.isRange()) {
    const RangeValue& range = entity.range();
    if (!range.normalizedStart.empty()) {
      os << range.normalizedStart << " .. " << range.normalizedEnd;
    } else {
      os << formatNumber(range.startValue) << " .. " << formatNumber(range.endValue);
    }
  } else {
    const ScalarValue& scalar = entity.scalar();
    os << (scalar.normalized.empty() ? formatNumber(scalar.value) : scalar.normalized);
  }
  if (!entity.unit.empty()) os << " " << entity.unit;
  os << " " << quoted(entity.rawText);
  return os.str();
}

void writeEntitiesJson(std::ostream& out, const std::vector<Entity>& entities) {
  out << "[";
  for (size_t i = 0; i < entities.size(); ++i) {
    const Entity& e = entities[i];
    out << (i == 0 ? "\n" : ",\n");
    out << "  {\"category\": " << quoted(categoryName(e.category)) << ", \"kind\": " << quoted(kindName(e.kind()))
        << ", \"span\": {\"start\": " << e.span.start << ", \"end\": " << e.span.end << "}"
        << ", \"unit\": " << quoted(e.unit);
    if (e.isRange()) {
      const RangeValue& r = e.range();
      out << ", \"start_value\": " << formatNumber(r.startValue) << ", \"end_value\": " << formatNumber(r.endValue)
          << ", \"raw_start\": " << quoted(r.rawStart) << ", \"raw_end\": " << quoted(r.rawEnd)
          << ", \"start_unit\": " << quoted(r.startUnit) << ", \"end_unit\": " << quoted(r.endUnit);
      if (!r.normalizedStart.empty()) {
        out << ", \"normalized_start\": " << quoted(r.normalizedStart) << ", \"normalized_end\": "
            << quoted(r.normalizedEnd);
      }
    } else {
      const ScalarValue& s = e.scalar();
      out << ", \"value\": " << formatNumber(s.value);
      if (!s.normalized.empty()) out << ", \"normalized\": " << quoted(s.normalized);
    }
    out << ", \"raw_text\": " << quoted(e.rawText) << ", \"pattern\": " << quoted(e.pattern) << "}";
  }
  out << (entities.empty() ? "]\n" : "\n]\n");
}
