#pragma once

#include <functional>
#include <vector>

#include "form/expression.hpp"

/**
 * Detects expansions that still contain the expression being expanded.
 */
class SelfReference {
 public:
  /**
   * Returns the nodes of a tree that have an immediate child equal to the
   * given branch, in pre-order. Matching nodes are not searched further.
   *
   * Example: search(2, [1,[2],3,[2]]) = [[2],[2]]
   */
  template <class Eq = std::equal_to<Expression>>
  static std::vector<Expression> search(const Expression& branch,
                                        const Expression& tree,
                                        Eq eq = Eq()) {
    std::vector<Expression> result;
    collect(branch, tree, eq, result);
    return result;
  }

  // matches that are not derivative markers
  static std::vector<Expression> unresolved(
      const std::vector<Expression>& matches);

 private:
  template <class Eq>
  static void collect(const Expression& branch, const Expression& tree,
                      Eq& eq, std::vector<Expression>& result) {
    if (tree.isAtom()) {
      return;
    }
    for (const auto& c : tree.children) {
      if (eq(c, branch)) {
        result.push_back(tree);
        return;
      }
    }
    for (const auto& c : tree.children) {
      collect(branch, c, eq, result);
    }
  }
};
