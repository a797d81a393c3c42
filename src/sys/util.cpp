#include "sys/util.hpp"

#include <cctype>
#include <sstream>

#include "series/expansion_spec.hpp"
#include "sys/log.hpp"
#include "sys/setup.hpp"

#define cstr(a) std::string(xstr(a))
#define xstr(a) ystr(a)
#define ystr(a) #a

#ifdef TAYLOR_VERSION
const std::string Version::VERSION = cstr(TAYLOR_VERSION);
const std::string Version::INFO = "taylor v" + cstr(TAYLOR_VERSION);
const bool Version::IS_RELEASE = true;
#else
const std::string Version::VERSION = "dev";
const std::string Version::INFO = "taylor developer version";
const bool Version::IS_RELEASE = false;
#endif

Settings::Settings()
    : default_order(DEFAULT_ORDER), max_rounds(DEFAULT_MAX_ROUNDS) {}

void checkOrder(int64_t order) {
  if (order < 0 || order > ExpansionSpec::MAX_ORDER) {
    Log::get().error("Invalid expansion order: " + std::to_string(order),
                     true);
  }
}

void checkRounds(int64_t rounds) {
  if (rounds < 1) {
    Log::get().error("Invalid number of rounds: " + std::to_string(rounds),
                     true);
  }
}

void Settings::loadSetup() {
  default_order = Setup::getSetupInt("TAYLOR_DEFAULT_ORDER", default_order);
  checkOrder(default_order);
  max_rounds = Setup::getSetupInt("TAYLOR_MAX_ROUNDS", max_rounds);
  checkRounds(max_rounds);
  auto level = Setup::getSetupValue("TAYLOR_LOG_LEVEL");
  if (!level.empty()) {
    Log::get().level = Log::parseLevel(level);
  }
}

enum class Option { NONE, DEFAULT_ORDER, MAX_ROUNDS, LOG_LEVEL };

std::vector<std::string> Settings::parseArgs(int argc, char *argv[]) {
  Option option(Option::NONE);
  std::vector<std::string> unparsed;
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (option == Option::DEFAULT_ORDER || option == Option::MAX_ROUNDS) {
      std::stringstream s(arg);
      int64_t val;
      if (!(s >> val) || !s.eof()) {
        Log::get().error("Invalid value for option: " + arg, true);
      }
      if (option == Option::DEFAULT_ORDER) {
        checkOrder(val);
        default_order = val;
      } else {
        checkRounds(val);
        max_rounds = val;
      }
      option = Option::NONE;
    } else if (option == Option::LOG_LEVEL) {
      Log::get().level = Log::parseLevel(arg);
      option = Option::NONE;
    } else if (arg.size() == 2 && arg.at(0) == '-' &&
               std::isalpha(static_cast<unsigned char>(arg.at(1)))) {
      // longer arguments starting with '-' are negated expressions
      std::string opt = arg.substr(1);
      if (opt == "o") {
        option = Option::DEFAULT_ORDER;
      } else if (opt == "r") {
        option = Option::MAX_ROUNDS;
      } else if (opt == "l") {
        option = Option::LOG_LEVEL;
      } else {
        Log::get().error("Unknown option: -" + opt, true);
      }
    } else {
      unparsed.push_back(arg);
    }
  }
  if (option != Option::NONE) {
    Log::get().error("Missing argument", true);
  }
  return unparsed;
}

void trimString(std::string &str) {
  while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
    str.erase(0, 1);
  }
  while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
    str.pop_back();
  }
}
