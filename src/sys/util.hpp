#pragma once

#include <cstdint>
#include <string>
#include <vector>

class Version {
 public:
  static const std::string VERSION;
  static const std::string INFO;
  static const bool IS_RELEASE;
};

class Settings {
 public:
  static constexpr int64_t DEFAULT_ORDER = 5;
  static constexpr int64_t DEFAULT_MAX_ROUNDS = 8;

  // order of expansions that do not state one
  int64_t default_order;

  // maximum number of re-expansion rounds of the driver
  int64_t max_rounds;

  Settings();

  // apply defaults from setup.txt
  void loadSetup();

  std::vector<std::string> parseArgs(int argc, char *argv[]);
};

void trimString(std::string &str);
