#pragma once

#include <string>

#include "form/expression.hpp"
#include "sys/util.hpp"

class Test {
 public:
  Test();

  void all();

  void fast();

  void number();

  void semantics();

  void expression();

  void parser();

  void derivative();

  void substitution();

  void selfReference();

  void singularity();

  void expansionSpec();

  void knownSeries();

  void differentialExpander();

  void driver();

  void config();

  void simplifyFile();

  void derivativeFile();

  void expansionFile();

 private:
  void checkExpansion(const std::string& expr, const std::string& specs,
                      const std::string& expected);

  Settings settings;
};
