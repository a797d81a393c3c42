#pragma once

#include <string>
#include <vector>

#include "form/expression.hpp"
#include "sys/util.hpp"

class Commands {
 public:
  explicit Commands(const Settings& settings) : settings(settings) {}

  static void help();

  // official commands

  void expand(const std::string& expr, const std::vector<std::string>& specs);

  void diff(const std::string& expr, const std::string& var,
            const std::string& order);

  void subst(const std::string& expr, const std::string& var,
             const std::string& value);

  void simplify(const std::string& expr);

  // parses and normalizes the input and computes its expansion
  Expression expansion(const std::string& expr,
                       const std::vector<std::string>& specs) const;

  // hidden commands

  void testAll();

  void testFast();

 private:
  static void initLog(bool silent);

  const Settings& settings;
};
