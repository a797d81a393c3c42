#pragma once

#include <cstdint>
#include <map>
#include <string>

/**
 * Persistent configuration read from setup.txt in the taylor home
 * directory. Each line has the form KEY=VALUE; lines starting with '#'
 * are comments.
 */
class Setup {
 public:
  static std::string getTaylorHome();

  static void setTaylorHome(const std::string& home);

  static std::string getSetupValue(const std::string& key);

  static bool getSetupFlag(const std::string& key, bool default_value);

  static int64_t getSetupInt(const std::string& key, int64_t default_value);

  static void loadSetup();

 private:
  static std::string TAYLOR_HOME;
  static std::map<std::string, std::string> SETUP;
  static bool LOADED_SETUP;
};
