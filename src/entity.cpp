#include "entity.hpp"

const char* categoryName(EntityCategory category) {
  switch (category) {
    case EntityCategory::Date: return "DATE";
    case EntityCategory::Time: return "TIME";
    case EntityCategory::Money: return "MONEY";
    case EntityCategory::Measurement: return "MEASUREMENT";
  }
  return "UNKNOWN";
}

const char* kindName(EntityKind kind) {
  return kind == EntityKind::Range ? "RANGE" : "SCALAR";
}
