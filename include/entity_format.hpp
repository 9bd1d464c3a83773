#pragma once

#include "entity.hpp"

#include <ostream>
#include <string>
#include <vector>

// One line: "MONEY RANGE [18,35) 150000 .. 250000 $ \"$150,000-$250,000\"".
std::string formatEntity(const Entity& entity);

// JSON array of entities in the neutral form read by downstream writers.
void writeEntitiesJson(std::ostream& out, const std::vector<Entity>& entities);

std::string jsonEscape(const std::string& s);
