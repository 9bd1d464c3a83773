#include "entity_format.hpp"
#include "extractor.hpp"
#include "pattern_library.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--json] [--categories=date,time,money,measurement] [--strict]"
               " [--log-level=trace|debug|info|warn|error] [--verbose] [<text_file>|-]\n";
}

// Throws std::invalid_argument on an unknown category name.
std::vector<EntityCategory> parseCategories(const std::string& list) {
  std::vector<EntityCategory> categories;
  std::stringstream ss(list);
  std::string name;
  while (std::getline(ss, name, ',')) {
    if (name.empty()) continue;
    if (name == "date") categories.push_back(EntityCategory::Date);
    else if (name == "time") categories.push_back(EntityCategory::Time);
    else if (name == "money") categories.push_back(EntityCategory::Money);
    else if (name == "measurement") categories.push_back(EntityCategory::Measurement);
    else throw std::invalid_argument("unknown category '" + name + "'");
  }
  return categories;
}

bool applyLogLevel(const std::string& level) {
  if (level == "trace") spdlog::set_level(spdlog::level::trace);
  else if (level == "debug") spdlog::set_level(spdlog::level::debug);
  else if (level == "info") spdlog::set_level(spdlog::level::info);
  else if (level == "warn") spdlog::set_level(spdlog::level::warn);
  else if (level == "error") spdlog::set_level(spdlog::level::err);
  else return false;
  return true;
}

std::string readAll(std::istream& in) {
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

int main(int argc, char** argv)
{
  // Entities go to stdout; diagnostics stay on stderr.
  spdlog::set_default_logger(spdlog::stderr_color_mt("factextract"));
  spdlog::set_level(spdlog::level::warn);

  try {
    std::string inputPath;
    bool json = false;
    LibraryOptions options;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--json") {
        json = true;
      } else if (arg == "--strict") {
        options.strict = true;
      } else if (arg == "--verbose") {
        spdlog::set_level(spdlog::level::debug);
      } else if (arg.rfind("--log-level=", 0) == 0) {
        std::string level = arg.substr(std::string("--log-level=").size());
        if (!applyLogLevel(level)) {
          std::cerr << "Unknown log level: " << level << "\n";
          printUsage(argv[0]);
          return 2;
        }
      } else if (arg.rfind("--categories=", 0) == 0) {
        try {
          options.categories = parseCategories(arg.substr(std::string("--categories=").size()));
        } catch (const std::invalid_argument& ex) {
          std::cerr << "Error: " << ex.what() << "\n";
          printUsage(argv[0]);
          return 2;
        }
      } else if (arg == "--help" || arg == "-h") {
        printUsage(argv[0]);
        return 0;
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
      } else if (inputPath.empty()) {
        inputPath = arg;
      } else {
        std::cerr << "Unexpected argument: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
      }
    }

    std::string text;
    if (inputPath.empty() || inputPath == "-") {
      text = readAll(std::cin);
    } else {
      if (!std::filesystem::exists(inputPath)) {
        std::cerr << "Input not found: " << inputPath << "\n";
        printUsage(argv[0]);
        return 2;
      }
      std::ifstream in(inputPath, std::ios::binary);
      if (!in) {
        throw std::runtime_error("cannot open " + inputPath);
      }
      text = readAll(in);
    }

    FactExtractor extractor(PatternLibrary::buildDefault(options));
    if (!extractor.library().rejected().empty()) {
      spdlog::warn("{} pattern(s) excluded from the library", extractor.library().rejected().size());
    }

    std::vector<Entity> entities = extractor.extract(text);
    spdlog::info("{} entities in {} bytes of input", entities.size(), text.size());

    if (json) {
      writeEntitiesJson(std::cout, entities);
    } else {
      for (const auto& entity : entities) {
        std::cout << formatEntity(entity) << "\n";
      }
    }

    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
