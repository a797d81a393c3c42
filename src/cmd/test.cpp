#include "cmd/test.hpp"

#include <cstdio>
#include <fstream>
#include <functional>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "cmd/commands.hpp"
#include "eval/semantics.hpp"
#include "form/derivative.hpp"
#include "form/expression_parser.hpp"
#include "form/expression_util.hpp"
#include "form/substitution.hpp"
#include "series/differential_expander.hpp"
#include "series/expansion_driver.hpp"
#include "series/known_series.hpp"
#include "series/self_reference.hpp"
#include "series/series_error.hpp"
#include "series/singularity_checker.hpp"
#include "sys/file.hpp"
#include "sys/log.hpp"
#include "sys/setup.hpp"

Test::Test() {
  const std::string home = getTmpDir() + "taylor-test" + FILE_SEP;
  ensureDir(home);
  Setup::setTaylorHome(home);
}

void Test::all() {
  fast();
  simplifyFile();
  derivativeFile();
  expansionFile();
}

void Test::fast() {
  number();
  semantics();
  expression();
  parser();
  derivative();
  substitution();
  selfReference();
  singularity();
  expansionSpec();
  knownSeries();
  differentialExpander();
  driver();
  config();
}

Expression parse(const std::string& str) {
  ExpressionParser parser;
  return parser.parse(str);
}

Expression normalized(const std::string& str) {
  auto e = parse(str);
  ExpressionUtil::normalize(e);
  return e;
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> result;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    trimString(item);
    result.push_back(item);
  }
  return result;
}

void check_str(const std::string& context, const std::string& result,
               const std::string& expected) {
  if (result != expected) {
    Log::get().error("Unexpected result for " + context + ": expected \"" +
                         expected + "\"; got \"" + result + "\"",
                     true);
  }
}

void check_expr(const std::string& context, const Expression& result,
                const Expression& expected) {
  if (result != expected) {
    Log::get().error("Unexpected result for " + context + ": expected " +
                         expected.toString() + "; got " + result.toString(),
                     true);
  }
}

void check_num(const Number& m, const std::string& s) {
  check_str("number", m.to_string(), s);
}

void check_inf(const Number& n) {
  if (n != Number::INF) {
    Log::get().error("Expected undefined for " + n.to_string(), true);
  }
}

void check_simplify(const std::string& input, const std::string& expected) {
  check_str("simplify(" + input + ")", normalized(input).toString(), expected);
}

template <class Error>
void check_throws(const std::string& context, std::function<void()> f) {
  try {
    f();
  } catch (const Error&) {
    return;
  }
  Log::get().error("Expected error for " + context, true);
}

ExpansionSpecList parseSpecs(const std::string& str, int64_t default_order) {
  ExpansionSpecList specs;
  for (const auto& s : split(str, ' ')) {
    if (!s.empty()) {
      specs.push_back(ExpansionSpec::parse(s, default_order));
    }
  }
  return specs;
}

void Test::number() {
  Log::get().info("Testing number");
  check_num(Number(6, 4), "3/2");
  check_num(Number(3, -6), "-1/2");
  check_num(Number("12"), "12");
  check_num(Number("-3/9"), "-1/3");
  check_num(Number("undefined"), "undefined");
  check_inf(Number(1, 0));
  Number a(1, 2);
  a += Number(1, 3);
  check_num(a, "5/6");
  a *= Number(6, 5);
  check_num(a, "1");
  a /= Number(-4);
  check_num(a, "-1/4");
  a -= Number(3, 4);
  check_num(a, "-1");
  Number big(std::numeric_limits<int64_t>::max());
  big *= 2;
  check_num(big, "18446744073709551614");
  big /= 2;
  check_num(big, std::to_string(std::numeric_limits<int64_t>::max()));
  Number b(std::numeric_limits<int64_t>::max());
  b += 1;
  check_num(b, "9223372036854775808");
  b -= 1;
  if (b != Number(std::numeric_limits<int64_t>::max()) ||
      b.numerator().isBig()) {
    Log::get().error("Expected demotion to 64 bits: " + b.to_string(), true);
  }
  check_num(Number(std::numeric_limits<int64_t>::min()),
            std::to_string(std::numeric_limits<int64_t>::min()));
  auto m = Number(std::numeric_limits<int64_t>::min());
  m.negate();
  check_num(m, "9223372036854775808");
  Number r("1000000000000000000000000000001/100000000000000000000");
  r *= 3;
  check_num(r, "3000000000000000000000000000003/100000000000000000000");
  r /= Number("3000000000000000000000000000003");
  check_num(r, "1/100000000000000000000");
  if (!(Number(1, 2) < Number("100000000000000000000/3")) ||
      !(Number("-100000000000000000000") < Number(-1, 2))) {
    Log::get().error("Unexpected big number comparison", true);
  }
  auto c = Number::INF;
  c *= 0;
  check_inf(c);
  if (!(Number(1, 2) < Number(2, 3)) || !(Number(-1) < Number(0)) ||
      !(Number(1000) < Number::INF) || Number::INF != Number::INF) {
    Log::get().error("Unexpected number comparison", true);
  }
  if (!Number(4, 2).isInteger() || Number(1, 2).isInteger() ||
      Number::INF.isInteger()) {
    Log::get().error("Unexpected integer check", true);
  }
  check_throws<std::exception>("asInt", []() { Number(1, 2).asInt(); });
  check_throws<std::exception>("parse", []() { Number("1/x"); });
}

void Test::semantics() {
  Log::get().info("Testing semantics");
  check_num(Semantics::add(Number(1, 2), Number(1, 2)), "1");
  check_num(Semantics::sub(3, Number(1, 2)), "5/2");
  check_num(Semantics::mul(Number(2, 3), Number(3, 4)), "1/2");
  check_num(Semantics::div(1, 3), "1/3");
  check_inf(Semantics::div(1, 0));
  check_num(Semantics::pow(2, 10), "1024");
  check_num(Semantics::pow(Number(2, 3), 2), "4/9");
  check_num(Semantics::pow(2, -2), "1/4");
  check_num(Semantics::pow(-1, 7), "-1");
  check_num(Semantics::pow(0, 0), "1");
  check_inf(Semantics::pow(0, -1));
  check_num(Semantics::pow(2, 64), "18446744073709551616");
  check_num(Semantics::pow(Number(1, 3), 50),
            "1/717897987691852588770249");
  check_num(Semantics::gcd(12, -18), "6");
  check_num(Semantics::abs(Number(-2, 3)), "2/3");
  check_num(Semantics::sign(-5), "-1");
  check_num(Semantics::factorial(0), "1");
  check_num(Semantics::factorial(5), "120");
  check_num(Semantics::factorial(20), "2432902008176640000");
  check_num(Semantics::factorial(21), "51090942171709440000");
  check_num(Semantics::factorial(25), "15511210043330985984000000");
  check_inf(Semantics::factorial(-1));
  check_throws<std::runtime_error>("pow",
                                   []() { Semantics::pow(2, Number(1, 2)); });
}

void Test::expression() {
  Log::get().info("Testing expression");
  auto x = ExpressionUtil::newParameter("x");
  auto e = ExpressionUtil::newSum(x, ExpressionUtil::newConstant(1));
  auto f = e;  // copy
  f.children[0].name = "y";
  check_str("copy", e.toString(), "x+1");
  check_str("copy", f.toString(), "y+1");
  if (e == f || !(e == parse("x+1")) || e.compare(f) != -f.compare(e)) {
    Log::get().error("Unexpected expression comparison", true);
  }
  if (!e.contains(x) || e.contains(Expression::Type::FUNCTION) ||
      !ExpressionUtil::isFreeOf(e, "y") || ExpressionUtil::isFreeOf(e, "x")) {
    Log::get().error("Unexpected expression containment", true);
  }
  std::set<std::string> names;
  ExpressionUtil::collectNames(parse("f(x)+g(y,x)*z"),
                               Expression::Type::PARAMETER, names);
  if (names != std::set<std::string>({"x", "y", "z"})) {
    Log::get().error("Unexpected parameter names", true);
  }

  // printing and normalization
  check_simplify("x+x", "2*x");
  check_simplify("x*x*x", "x^3");
  check_simplify("2*x+3*x-5*x", "0");
  check_simplify("x/x", "1");
  check_simplify("(x+1)-(x+1)", "0");
  check_simplify("x*y/(x*y)", "1");
  check_simplify("sin(0)+cos(0)", "1");
  check_simplify("exp(0)*log(1)", "0");
  check_simplify("2^10", "1024");
  check_simplify("3*(x+2)", "3*x+6");
  check_simplify("x-1", "x-1");
  check_simplify("1-x", "-x+1");
  check_simplify("-x", "-x");
  check_simplify("1/x", "1/x");
  check_simplify("x^2/y", "x^2/y");
  check_simplify("(x^2)^3", "x^6");
  check_simplify("(x*y)^2", "x^2*y^2");
  check_simplify("abs(-3)", "3");
  check_simplify("1/0", "undefined");
  check_simplify("x+1/0", "undefined");
  check_simplify("sin(x)/abs(sin(x))", "sin(x)/abs(sin(x))");
  check_simplify("diff(f(x),x,2)", "diff(f(x),x,2)");
  check_simplify("diff(f(y),x,1)", "0");
  check_simplify("[1,x+x]", "[1,2*x]");
  check_simplify("-oo", "-oo");
  check_simplify("-1*oo", "-oo");

  // sums are ordered by descending degree
  check_simplify("1+x+x^6+x^2/2", "x^6+1/2*x^2+x+1");
  for (auto s : {"2*x^2*y|3", "x^3+x|3", "5|0", "sin(x)|0", "1/x|-1",
                 "(x+1)^4|4", "x/y^2|-1"}) {
    auto parts = split(s, '|');
    check_num(ExpressionUtil::degree(parse(parts[0])), parts[1]);
  }

  // normalization is idempotent
  for (auto s : {"3*(x+2)*x", "sin(x)/(1-x)^2", "exp(1)*(x-1)+x^2*(x-1)"}) {
    auto a = normalized(s);
    auto b = a;
    if (ExpressionUtil::normalize(b) || a != b) {
      Log::get().error("Normalization not idempotent for " + std::string(s),
                       true);
    }
  }
}

void Test::parser() {
  Log::get().info("Testing parser");
  check_str("parse", parse("x^-2").toString(), "1/x^2");
  check_str("parse", parse("2^3^2").toString(), "2^(3^2)");
  check_str("parse", parse("[1,[2],3]").toString(), "[1,[2],3]");
  check_str("parse", parse("f(x,y)").toString(), "f(x,y)");
  check_str("parse", parse("diff(f(x),x)").toString(), "diff(f(x),x,1)");
  check_str("parse", parse("infinity").toString(), "oo");
  auto e = parse("2^3^2");
  if (e.type != Expression::Type::POWER ||
      e.children[1].type != Expression::Type::POWER) {
    Log::get().error("Power is not right-associative", true);
  }
  check_expr("parse", normalized("2^3^2"), parse("512"));
  check_expr("parse", normalized("-2^2"), parse("-4"));
  check_expr("parse", normalized("1 - 2 - 3"), parse("-4"));
  check_expr("parse", normalized("12/4/3"), parse("1"));
  for (auto s : {"", "x+", "(x", "f(x", "x)", "[1,2", "2*/3", "diff(x)",
                 "diff(x,1)", "diff(x,x,0)", "x $ y"}) {
    check_throws<std::runtime_error>(std::string("parse ") + s,
                                     [s]() { parse(s); });
  }
}

void Test::derivative() {
  Log::get().info("Testing derivative");
  auto d = [](const std::string& e, const std::string& var, int64_t order) {
    return Derivative::derive(normalized(e), var, order).toString();
  };
  check_str("d/dx", d("x^3", "x", 1), "3*x^2");
  check_str("d/dx", d("x^3", "x", 3), "6");
  check_str("d/dx", d("x^3", "x", 4), "0");
  check_str("d/dx", d("x^3", "x", 0), "x^3");
  check_str("d/dx", d("sin(x)", "x", 1), "cos(x)");
  check_str("d/dx", d("cos(x)", "x", 1), "-sin(x)");
  check_str("d/dx", d("sin(x)", "x", 4), "sin(x)");
  check_str("d/dx", d("exp(2*x)", "x", 1), "2*exp(2*x)");
  check_str("d/dx", d("log(x)", "x", 1), "1/x");
  check_str("d/dx", d("abs(x)", "x", 1), "x/abs(x)");
  check_str("d/dx", d("x*y", "x", 1), "y");
  check_str("d/dx", d("y", "x", 1), "0");
  check_str("d/dx", d("[x^2,x]", "x", 1), "[2*x,1]");
  check_str("d/dx", d("f(x)", "x", 1), "diff(f(x),x,1)");
  check_str("d/dx", d("f(x)", "x", 2), "diff(f(x),x,2)");
  check_str("d/dx", d("f(x,y)", "x", 1), "diff(f(x,y),x,1)");
  check_str("d/dy", d("diff(f(x),x,1)", "y", 1), "0");
  check_str("d/dy", d("diff(f(x,y),x,1)", "y", 1),
            "diff(diff(f(x,y),x,1),y,1)");
  check_expr("d/dx", Derivative::derive(normalized("1/(1-x)"), "x", 1),
             normalized("(1-x)^-2"));
  check_expr("d/dx", Derivative::derive(normalized("x^x"), "x", 1),
             normalized("x^x*(log(x)+1)"));
  check_expr("d/dx", Derivative::derive(normalized("2^x"), "x", 1),
             normalized("2^x*log(2)"));
  check_expr("d/dx", Derivative::derive(normalized("atan(x)"), "x", 1),
             normalized("1/(1+x^2)"));
  check_throws<std::runtime_error>(
      "negative order", []() { Derivative::derive(parse("x"), "x", -1); });
}

void Test::substitution() {
  Log::get().info("Testing substitution");
  auto s = [](const std::string& e, const std::string& var,
              const std::string& value) {
    return Substitution::substitute(parse(e), var, parse(value));
  };
  check_str("subst", s("x^2+1", "x", "3").toString(), "10");
  check_str("subst", s("f(x)*y", "y", "2").toString(), "2*f(x)");
  check_str("subst", s("sin(x)+x", "x", "0").toString(), "0");
  check_str("subst", s("x*y", "x", "y+1").toString(), "y*(y+1)");
  check_str("subst", s("diff(f(x),x,1)", "x", "0").toString(),
            "diff(f(x),x,1)");
  check_str("subst", s("diff(f(x,y),x,1)", "y", "0").toString(),
            "diff(f(x,0),x,1)");
  if (!Substitution::isIndeterminate(s("sin(x)/x", "x", "0")) ||
      !Substitution::isIndeterminate(s("sin(x)/abs(sin(x))", "x", "0")) ||
      Substitution::isIndeterminate(s("sin(x)/x", "x", "1"))) {
    Log::get().error("Unexpected indeterminate check", true);
  }
}

void Test::selfReference() {
  Log::get().info("Testing self reference");
  auto check = [](const std::string& branch, const std::string& tree,
                  const std::string& expected) {
    auto matches = SelfReference::search(parse(branch), parse(tree));
    Expression result(Expression::Type::VECTOR);
    for (const auto& m : matches) {
      result.newChild(m);
    }
    check_str("search(" + branch + "," + tree + ")", result.toString(),
              expected);
  };
  check("2", "[1,2,3]", "[[1,2,3]]");
  check("2", "[1,2,2,3]", "[[1,2,2,3]]");
  check("2", "[1,[2],3]", "[[2]]");
  check("4", "[1,[2],3]", "[]");
  check("2", "[1,[2],3,[2]]", "[[2],[2]]");
  check("x", "x", "[]");
  check("f(x)", "2*diff(f(x),x,1)+g(x)", "[diff(f(x),x,1)]");

  // custom equality predicate
  auto sameType = [](const Expression& a, const Expression& b) {
    return a.type == b.type;
  };
  auto matches = SelfReference::search(parse("0"), parse("[x,[y,1]]"), sameType);
  if (matches.size() != 1 || matches[0] != parse("[y,1]")) {
    Log::get().error("Unexpected result for custom predicate", true);
  }
  auto all = SelfReference::search(parse("f(x)"),
                                   parse("[diff(f(x),x,1),[f(x)]]"));
  auto unresolved = SelfReference::unresolved(all);
  if (all.size() != 2 || unresolved.size() != 1 ||
      unresolved[0] != parse("[f(x)]")) {
    Log::get().error("Unexpected unresolved matches", true);
  }
}

void Test::singularity() {
  Log::get().info("Testing singularity checker");
  SingularityChecker::checkPoints({});
  SingularityChecker::checkPoints(parseSpecs("x=0:2 y=a:1", 5));
  for (auto s : {"x=oo:2", "x=-oo:0", "x=0:1 y=oo:1", "x=infinity"}) {
    auto specs = parseSpecs(s, 3);
    check_throws<ExpansionPointError>(
        s, [&specs]() { SingularityChecker::checkPoints(specs); });
  }
}

void Test::expansionSpec() {
  Log::get().info("Testing expansion spec");
  auto spec = ExpansionSpec::parse("x=1/2:3", 5);
  std::stringstream ss;
  ss << spec;
  check_str("spec", ss.str(), "x=1/2:3");
  check_str("spec", spec.varName(), "x");
  if (ExpansionSpec::parse("y=0", 7).order != 7 ||
      ExpansionSpec::parse("y=0:0", 7).order != 0 ||
      ExpansionSpec::parse("y=0:20", 7).order != ExpansionSpec::MAX_ORDER) {
    Log::get().error("Unexpected expansion order", true);
  }
  for (auto s : {"x", "x=0:21", "x=0:-1", "x=0:a", "2=0:1", "x+y=0:1",
                 "x=:1", "x=0:"}) {
    check_throws<std::runtime_error>(s,
                                     [s]() { ExpansionSpec::parse(s, 3); });
  }
}

void Test::knownSeries() {
  Log::get().info("Testing known series");
  auto check = [](const std::string& e, const std::string& spec,
                  const std::string& expected) {
    auto s = ExpansionSpec::parse(spec, 5);
    std::vector<Expression> coefficients;
    if (!KnownSeries::apply(parse(e), s, coefficients)) {
      Log::get().error("No known series for " + e, true);
    }
    if (coefficients.size() != static_cast<size_t>(s.order + 1)) {
      Log::get().error("Unexpected number of coefficients for " + e, true);
    }
    Expression result(Expression::Type::SUM);
    for (size_t k = 0; k < coefficients.size(); k++) {
      result.newChild(ExpressionUtil::newProduct(
          coefficients[k],
          ExpressionUtil::newPower(
              ExpressionUtil::newDifference(s.variable, s.point),
              ExpressionUtil::newConstant(static_cast<int64_t>(k)))));
    }
    ExpressionUtil::normalize(result);
    check_expr(e + " at " + spec, result, normalized(expected));
  };
  check("exp(x)", "x=0:3", "1+x+1/2*x^2+1/6*x^3");
  check("exp(x)", "x=1:2", "exp(1)+exp(1)*(x-1)+1/2*exp(1)*(x-1)^2");
  check("sin(x)", "x=0:5", "x-1/6*x^3+1/120*x^5");
  check("cos(x)", "x=0:4", "1-1/2*x^2+1/24*x^4");
  check("sinh(x)", "x=0:3", "x+1/6*x^3");
  check("cosh(x)", "x=0:2", "1+1/2*x^2");
  check("atan(x)", "x=0:5", "x-1/3*x^3+1/5*x^5");
  check("log(x)", "x=1:3", "(x-1)-1/2*(x-1)^2+1/3*(x-1)^3");
  check("sin(y)", "y=0:3", "y-1/6*y^3");
  check("exp(x)", "x=y:1", "exp(y)+exp(y)*(x-y)");
  check("exp(x)", "x=0:0", "1");
  std::vector<Expression> coefficients;
  for (auto s : {"sin(x)|x=1:2", "log(x)|x=0:2", "f(x)|x=0:2",
                 "sin(2*x)|x=0:2", "sin(x)|y=0:2", "x|x=0:1"}) {
    auto parts = split(s, '|');
    if (KnownSeries::apply(parse(parts[0]), ExpansionSpec::parse(parts[1], 5),
                           coefficients)) {
      Log::get().error("Unexpected known series for " + parts[0], true);
    }
  }
}

void Test::differentialExpander() {
  Log::get().info("Testing differential expander");
  // sum_{k=0}^{n} f^(k)(c)/k! (x-c)^k computed term by term
  auto reference = [](const Expression& f, const std::string& var,
                      const Expression& c, int64_t n) {
    Expression sum(Expression::Type::SUM);
    for (int64_t k = 0; k <= n; k++) {
      auto coeff = Substitution::substitute(Derivative::derive(f, var, k),
                                            var, c);
      auto term = ExpressionUtil::newProduct(
          ExpressionUtil::newProduct(
              coeff, ExpressionUtil::newConstant(
                         Semantics::div(1, Semantics::factorial(k)))),
          ExpressionUtil::newPower(
              ExpressionUtil::newDifference(ExpressionUtil::newParameter(var),
                                            c),
              ExpressionUtil::newConstant(k)));
      sum.newChild(term);
    }
    ExpressionUtil::normalize(sum);
    return sum;
  };
  for (auto s : {"exp(x)*sin(x)|x=0:4", "1/(1-x)|x=0:5", "log(1+x)|x=0:4",
                 "x^3-2*x|x=2:3", "cos(x)^2|x=0:4", "sqrt(1+x)|x=0:3",
                 "exp(x)|x=1:2", "atan(x)|x=0:5"}) {
    auto parts = split(s, '|');
    auto f = parse(parts[0]);
    auto specs = parseSpecs(parts[1], 5);
    auto result = DifferentialExpander::expand(f, specs);
    ExpressionUtil::normalize(result);
    check_expr(parts[0] + " at " + parts[1], result,
               reference(f, specs[0].varName(), specs[0].point,
                         specs[0].order));
  }

  // known values
  auto check = [](const std::string& e, const std::string& specs,
                  const std::string& expected) {
    auto result = DifferentialExpander::expand(parse(e), parseSpecs(specs, 5));
    ExpressionUtil::normalize(result);
    check_expr(e + " at " + specs, result, normalized(expected));
  };
  check("1/(1-x)", "x=0:3", "1+x+x^2+x^3");
  check("x^3-2*x", "x=2:3", "4+10*(x-2)+6*(x-2)^2+(x-2)^3");
  check("exp(x)*exp(y)", "x=0:1 y=0:1", "1+y+x*(1+y)");
  check("x*y", "x=0:1 y=0:1", "x*y");
  check("x^2", "x=0:1", "0");
  check("x^2", "x=0:0", "0");
  check("5", "x=0:3", "5");
  check("f(x)", "x=0:1", "f(0)+x*diff(f(x),x,1)");

  // no specs: unchanged
  auto e = parse("sin(x)+y");
  check_expr("no specs", DifferentialExpander::expand(e, {}), e);

  // indeterminate coefficients keep the unevaluated derivative
  auto raw = DifferentialExpander::expand(parse("sin(x)/x"),
                                          parseSpecs("x=0:0", 5));
  if (SelfReference::search(parse("sin(x)/x"), raw).empty()) {
    Log::get().error("Expected unevaluated coefficient", true);
  }
  check_throws<ExpansionPointError>("expand at oo", []() {
    DifferentialExpander::expand(parse("x"), parseSpecs("x=oo:1", 5));
  });
}

void Test::checkExpansion(const std::string& expr, const std::string& specs,
                          const std::string& expected) {
  const auto context = expr + " at " + specs;
  ExpansionDriver driver(settings);
  auto list = parseSpecs(specs, settings.default_order);
  if (expected == "ExpansionPointError") {
    check_throws<ExpansionPointError>(
        context, [&]() { driver.expand(parse(expr), list); });
  } else if (expected == "DivergentExpansionError") {
    check_throws<DivergentExpansionError>(
        context, [&]() { driver.expand(parse(expr), list); });
  } else {
    auto result = driver.expand(parse(expr), list);
    ExpressionUtil::normalize(result);
    check_expr(context, result, normalized(expected));
  }
}

void Test::driver() {
  Log::get().info("Testing expansion driver");
  ExpansionDriver driver(settings);

  // variable-free expressions are returned unchanged
  for (auto s : {"sin(y)+1", "f(y,z)", "diff(f(y),y,2)", "1/0"}) {
    auto e = parse(s);
    check_expr(std::string("free ") + s,
               driver.expand(e, parseSpecs("x=0:3", 5)), e);
  }

  // points at infinity are rejected for every expression and order
  for (auto f : {"1", "x", "sin(x)", "f(x)", "exp(x)"}) {
    for (auto p : {"x=oo:0", "x=-oo:3", "x=0:1 y=oo:2"}) {
      checkExpansion(f, p, "ExpansionPointError");
    }
  }

  // self-referencing expansions
  checkExpansion("sin(x)/abs(sin(x))", "x=0:0", "DivergentExpansionError");
  checkExpansion("sin(x)/abs(sin(x))", "x=0:2", "DivergentExpansionError");
  checkExpansion("log(x)", "x=0:2", "DivergentExpansionError");

  // derivative markers of the expression are legitimate
  checkExpansion("f(x)", "x=0:1", "f(0)+x*diff(f(x),x,1)");

  // several variables
  checkExpansion("x*y", "x=0:1 y=0:1", "x*y");
  checkExpansion("x^2*y", "y=0:1 x=0:1", "0");
  checkExpansion("exp(x+y)", "x=0:1 y=0:1", "1+y+x*(1+y)");

  // known series and general fallback
  checkExpansion("sin(x)", "x=0:5", "x-1/6*x^3+1/120*x^5");
  checkExpansion("cos(x)*exp(x)", "x=0:2", "1+x");
  checkExpansion("1/(1-x)", "x=0:3", "1+x+x^2+x^3");
  checkExpansion("x^2+1", "x=0:1", "1");

  // coefficients beyond 64 bits
  checkExpansion("(x+3)^50", "x=0:1",
                 "717897987691852588770249+11964966461530876479504150*x");
  checkExpansion("exp(40*x)", "x=0:12",
                 "1+40*x+800*x^2+32000/3*x^3+320000/3*x^4+2560000/3*x^5+"
                 "51200000/9*x^6+2048000000/63*x^7+10240000000/63*x^8+"
                 "409600000000/567*x^9+1638400000000/567*x^10+"
                 "65536000000000/6237*x^11+655360000000000/18711*x^12");

  // coefficients of known series are expanded in the remaining variables
  checkExpansion("exp(x)", "x=y:1 y=0:1", "1+y+(1+y)*(x-y)");
  checkExpansion("exp(x)", "y=0:1 x=y:1", "exp(y)+exp(y)*(x-y)");
  auto nested = driver.expand(parse("exp(x)"), parseSpecs("x=y:1 y=0:1", 5));
  if (nested.toString().find("exp") != std::string::npos) {
    Log::get().error("Unexpanded coefficient in " + nested.toString(), true);
  }

  // terms of expansions are printed by descending degree
  auto terms = driver.expand(parse("exp(sin(x))"), parseSpecs("x=0:6", 5));
  ExpressionUtil::normalize(terms);
  if (terms.type != Expression::Type::SUM || terms.children.size() < 2) {
    Log::get().error("Unexpected expansion " + terms.toString(), true);
  }
  for (size_t i = 1; i < terms.children.size(); i++) {
    if (ExpressionUtil::degree(terms.children[i - 1]) <
        ExpressionUtil::degree(terms.children[i])) {
      Log::get().error("Unordered terms in " + terms.toString(), true);
    }
  }

  // command input is normalized before the expansion
  Commands commands(settings);
  check_expr("expansion of x/x", commands.expansion("x/x", {"x=0:2"}),
             parse("1"));
  check_expr("expansion of x*y/y",
             commands.expansion("x*y/y", {"x=1:3", "y=0:2"}), parse("x"));

  // inputs are not modified
  auto e = parse("exp(x)*sin(x)");
  auto copy = e;
  auto specs = parseSpecs("x=0:3", 5);
  driver.expand(e, specs);
  check_expr("unchanged input", e, copy);
}

void Test::config() {
  Log::get().info("Testing config");
  const std::string path = Setup::getTaylorHome() + "setup.txt";
  {
    std::ofstream out(path);
    out << "# test configuration" << std::endl;
    out << "TAYLOR_DEFAULT_ORDER=3" << std::endl;
    out << " taylor_max_rounds = 4 " << std::endl;
    out << "TAYLOR_LOG_LEVEL=info" << std::endl;
  }
  Setup::setTaylorHome(Setup::getTaylorHome());
  Settings s;
  s.loadSetup();
  if (s.default_order != 3 || s.max_rounds != 4) {
    Log::get().error("Unexpected settings from setup.txt", true);
  }
  const char* argv[] = {"taylor", "-o",  "7",  "expand",
                        "-x^2",   "x=0", "-r", "2"};
  auto args = s.parseArgs(8, const_cast<char**>(argv));
  if (s.default_order != 7 || s.max_rounds != 2 || args.size() != 3 ||
      args[1] != "-x^2") {
    Log::get().error("Unexpected settings from arguments", true);
  }
  {
    std::ofstream out(path);
    out << "TAYLOR_MAX_ROUNDS" << std::endl;
  }
  Setup::setTaylorHome(Setup::getTaylorHome());
  check_throws<std::runtime_error>("setup.txt", []() {
    Settings t;
    t.loadSetup();
  });
  std::remove(path.c_str());
  Setup::setTaylorHome(Setup::getTaylorHome());
  Settings defaults;
  defaults.loadSetup();
  if (defaults.default_order != Settings::DEFAULT_ORDER ||
      defaults.max_rounds != Settings::DEFAULT_MAX_ROUNDS) {
    Log::get().error("Unexpected default settings", true);
  }
}

void Test::simplifyFile() {
  const std::string path = std::string("tests") + FILE_SEP + "series" +
                           FILE_SEP + "simplify.txt";
  Log::get().info("Testing " + path);
  for (const auto& line : readLinesWithComments(path)) {
    auto fields = split(line, ';');
    if (fields.size() != 2) {
      Log::get().error("Invalid test line: " + line, true);
    }
    check_simplify(fields[0], fields[1]);
  }
}

void Test::derivativeFile() {
  const std::string path = std::string("tests") + FILE_SEP + "series" +
                           FILE_SEP + "derivative.txt";
  Log::get().info("Testing " + path);
  for (const auto& line : readLinesWithComments(path)) {
    auto fields = split(line, ';');
    if (fields.size() != 4) {
      Log::get().error("Invalid test line: " + line, true);
    }
    auto result = Derivative::derive(parse(fields[0]), fields[1],
                                     std::stoll(fields[2]));
    check_expr("d/d" + fields[1] + " " + fields[0], result,
               normalized(fields[3]));
  }
}

void Test::expansionFile() {
  const std::string path = std::string("tests") + FILE_SEP + "series" +
                           FILE_SEP + "expand.txt";
  Log::get().info("Testing " + path);
  for (const auto& line : readLinesWithComments(path)) {
    auto fields = split(line, ';');
    if (fields.size() != 3) {
      Log::get().error("Invalid test line: " + line, true);
    }
    checkExpansion(fields[0], fields[1], fields[2]);
  }
}
