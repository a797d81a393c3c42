#include <cstdlib>
#include <iostream>

#include "cmd/commands.hpp"
#include "sys/log.hpp"
#include "sys/util.hpp"

bool checkArgs(const std::vector<std::string>& args, size_t min, size_t max,
               const std::string& usage) {
  if (args.size() < min || args.size() > max) {
    std::cerr << "Usage: taylor " << usage << std::endl;
    return false;
  }
  return true;
}

int dispatch(const Settings& settings, const std::vector<std::string>& args) {
  if (args.empty()) {
    Commands::help();
    return EXIT_SUCCESS;
  }
  std::string cmd = args.front();
  if (cmd == "help") {
    Commands::help();
    return EXIT_SUCCESS;
  }

  Commands commands(settings);

  // official commands
  if (cmd == "expand") {
    if (!checkArgs(args, 3, args.size(), "expand <expr> <var=point:order>...")) {
      return EXIT_FAILURE;
    }
    commands.expand(args.at(1),
                    std::vector<std::string>(args.begin() + 2, args.end()));
  } else if (cmd == "diff") {
    if (!checkArgs(args, 3, 4, "diff <expr> <var> [order]")) {
      return EXIT_FAILURE;
    }
    commands.diff(args.at(1), args.at(2), args.size() > 3 ? args.at(3) : "");
  } else if (cmd == "subst") {
    if (!checkArgs(args, 4, 4, "subst <expr> <var> <value>")) {
      return EXIT_FAILURE;
    }
    commands.subst(args.at(1), args.at(2), args.at(3));
  } else if (cmd == "simplify") {
    if (!checkArgs(args, 2, 2, "simplify <expr>")) {
      return EXIT_FAILURE;
    }
    commands.simplify(args.at(1));
  }
  // hidden commands
  else if (cmd == "test") {
    commands.testAll();
  } else if (cmd == "test-fast") {
    commands.testFast();
  }
  // unknown command
  else {
    std::cerr << "Unknown command: " << cmd << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
  try {
    Settings settings;
    settings.loadSetup();
    auto args = settings.parseArgs(argc, argv);
    return dispatch(settings, args);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}
