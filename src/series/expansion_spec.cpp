#include "series/expansion_spec.hpp"

#include <stdexcept>

#include "form/expression_parser.hpp"

ExpansionSpec::ExpansionSpec(const Expression& variable,
                             const Expression& point, int64_t order)
    : variable(variable), point(point), order(order) {
  if (variable.type != Expression::Type::PARAMETER) {
    throw std::runtime_error("expansion variable must be a symbol: " +
                             variable.toString());
  }
  if (order < 0 || order > MAX_ORDER) {
    throw std::runtime_error("invalid expansion order: " +
                             std::to_string(order));
  }
}

ExpansionSpec ExpansionSpec::parse(const std::string& str,
                                   int64_t default_order) {
  auto eq = str.find('=');
  if (eq == std::string::npos) {
    throw std::runtime_error("invalid expansion: " + str);
  }
  auto colon = str.find(':', eq);
  auto point_str = str.substr(eq + 1, colon == std::string::npos
                                          ? std::string::npos
                                          : colon - eq - 1);
  int64_t order = default_order;
  if (colon != std::string::npos) {
    auto order_str = str.substr(colon + 1);
    if (order_str.empty() ||
        order_str.find_first_not_of("0123456789") != std::string::npos ||
        order_str.size() > 9) {
      throw std::runtime_error("invalid expansion order: " + order_str);
    }
    order = std::stoll(order_str);
  }
  ExpressionParser parser;
  auto variable = parser.parse(str.substr(0, eq));
  auto point = parser.parse(point_str);
  return ExpansionSpec(variable, point, order);
}

std::ostream& operator<<(std::ostream& out, const ExpansionSpec& spec) {
  out << spec.variable << "=" << spec.point << ":" << spec.order;
  return out;
}
