#include "cmd/commands.hpp"

#include <cstdlib>
#include <iostream>

#include "cmd/test.hpp"
#include "form/derivative.hpp"
#include "form/expression_parser.hpp"
#include "form/expression_util.hpp"
#include "form/substitution.hpp"
#include "series/expansion_driver.hpp"
#include "series/series_error.hpp"
#include "sys/log.hpp"

void Commands::initLog(bool silent) {
  if (silent && Log::get().level != Log::Level::DEBUG) {
    Log::get().silent = true;
  } else {
    Log::get().silent = false;
    Log::get().info("Starting " + Version::INFO);
  }
}

void Commands::help() {
  initLog(true);
  Settings settings;
  std::cout << "Welcome to " << Version::INFO << "." << std::endl << std::endl;
  std::cout << "Usage: taylor <command> <options>" << std::endl << std::endl;
  std::cout << "Commands:" << std::endl;
  std::cout << "  expand <expr> <var=point:order>...  Compute a truncated "
               "Taylor series (see -o,-r)"
            << std::endl;
  std::cout << "  diff <expr> <var> [order]           Differentiate an "
               "expression"
            << std::endl;
  std::cout << "  subst <expr> <var> <value>          Substitute a value for a "
               "variable"
            << std::endl;
  std::cout << "  simplify <expr>                     Print the normalized "
               "expression"
            << std::endl;

  std::cout << std::endl << "Targets:" << std::endl;
  std::cout << "  <expr>               Expression (example: sin(x)/(1-x))"
            << std::endl;
  std::cout << "  <var=point:order>    Expansion variable, point and order "
               "(example: x=0:3)"
            << std::endl;

  std::cout << std::endl << "Options:" << std::endl;
  std::cout << "  -o <number>          Order of expansions without order "
               "(default: "
            << settings.default_order << ")" << std::endl;
  std::cout << "  -r <number>          Maximum number of expansion rounds "
               "(default: "
            << settings.max_rounds << ")" << std::endl;
  std::cout << "  -l <string>          Log level (values: "
               "debug,info,warn,error)"
            << std::endl;
}

// official commands

void Commands::expand(const std::string& expr,
                      const std::vector<std::string>& specs) {
  initLog(true);
  try {
    std::cout << expansion(expr, specs) << std::endl;
  } catch (const ExpansionError& error) {
    Log::get().error(error.what());
    std::cout << "could not be computed: " << error.what() << std::endl;
    exit(1);
  }
}

Expression Commands::expansion(const std::string& expr,
                               const std::vector<std::string>& specs) const {
  ExpressionParser parser;
  auto e = parser.parse(expr);
  ExpressionUtil::normalize(e);
  ExpansionSpecList list;
  for (const auto& s : specs) {
    list.push_back(ExpansionSpec::parse(s, settings.default_order));
  }
  ExpansionDriver driver(settings);
  return driver.expand(e, list);
}

void Commands::diff(const std::string& expr, const std::string& var,
                    const std::string& order) {
  initLog(true);
  ExpressionParser parser;
  auto e = parser.parse(expr);
  int64_t k = 1;
  if (!order.empty()) {
    auto n = parser.parse(order);
    if (n.type != Expression::Type::CONSTANT || !n.value.isInteger()) {
      Log::get().error("Invalid derivative order: " + order, true);
    }
    k = n.value.asInt();
  }
  ExpressionUtil::normalize(e);
  std::cout << Derivative::derive(e, var, k) << std::endl;
}

void Commands::subst(const std::string& expr, const std::string& var,
                     const std::string& value) {
  initLog(true);
  ExpressionParser parser;
  auto e = parser.parse(expr);
  auto v = parser.parse(value);
  std::cout << Substitution::substitute(e, var, v) << std::endl;
}

void Commands::simplify(const std::string& expr) {
  initLog(true);
  ExpressionParser parser;
  auto e = parser.parse(expr);
  ExpressionUtil::normalize(e);
  std::cout << e << std::endl;
}

// hidden commands

void Commands::testAll() {
  initLog(false);
  Test test;
  test.all();
}

void Commands::testFast() {
  initLog(false);
  Test test;
  test.fast();
}
