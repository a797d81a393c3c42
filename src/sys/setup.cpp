#include "sys/setup.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include "sys/file.hpp"
#include "sys/log.hpp"
#include "sys/util.hpp"

std::string Setup::TAYLOR_HOME;
std::map<std::string, std::string> Setup::SETUP;
bool Setup::LOADED_SETUP = false;

std::string Setup::getTaylorHome() {
  if (!TAYLOR_HOME.empty()) {
    return TAYLOR_HOME;
  }
  auto taylor_home = std::getenv("TAYLOR_HOME");
  std::string result;
  if (taylor_home) {
    result = std::string(taylor_home);
  } else {
    result = getHomeDir() + FILE_SEP + ".taylor" + FILE_SEP;
  }
  ensureTrailingFileSep(result);
  return result;
}

void Setup::setTaylorHome(const std::string& home) {
  TAYLOR_HOME = home;
  ensureTrailingFileSep(TAYLOR_HOME);
  SETUP.clear();
  LOADED_SETUP = false;
}

std::string Setup::getSetupValue(const std::string& key) {
  if (!LOADED_SETUP) {
    loadSetup();
    LOADED_SETUP = true;
  }
  auto it = SETUP.find(key);
  if (it != SETUP.end()) {
    return it->second;
  }
  return std::string();
}

bool Setup::getSetupFlag(const std::string& key, bool default_value) {
  auto s = getSetupValue(key);
  if (s.empty()) {
    return default_value;
  }
  return (s == "yes" || s == "true" || s == "1");
}

int64_t Setup::getSetupInt(const std::string& key, int64_t default_value) {
  auto s = getSetupValue(key);
  if (s.empty()) {
    return default_value;
  }
  size_t pos = 0;
  int64_t result = 0;
  try {
    result = std::stoll(s, &pos);
  } catch (const std::exception&) {
    pos = 0;
  }
  if (pos != s.size()) {
    Log::get().error("Invalid value for " + key + " in setup.txt: " + s, true);
  }
  return result;
}

void throwSetupParseError(const std::string& line) {
  Log::get().error("Error parsing line from setup.txt: " + line, true);
}

void Setup::loadSetup() {
  std::ifstream in(getTaylorHome() + "setup.txt");
  if (in.good()) {
    std::string line;
    while (std::getline(in, line)) {
      if (line.empty() || line[0] == '#') {
        continue;
      }
      auto pos = line.find('=');
      if (pos == std::string::npos) {
        throwSetupParseError(line);
      }
      auto key = line.substr(0, pos);
      auto value = line.substr(pos + 1);
      trimString(key);
      trimString(value);
      std::transform(key.begin(), key.end(), key.begin(), ::toupper);
      if (key.empty() || value.empty()) {
        throwSetupParseError(line);
      }
      SETUP[key] = value;
    }
  }
}
