#pragma once
#include "../confl-lang.hh"

#include <string>
#include <string_view>

namespace confl
{
  using namespace ::trieste;

  inline const auto type_keyword = T(TDyn,TNum,TBool,TStr,TList);

  Node err(const NodeRange &r, const std::string &msg);

  Node err(Node node, const std::string &msg);

  std::string node_val(Node node);

  /**
   * Strips the quotes of a string literal and resolves its escapes.
   * @param node a `Str`, `Doc` or `Import` node, located on the literal.
   * @return the literal's contents.
   */
  std::string unquote(Node node);

  /**
   * Generates a variable name that cannot clash with user-defined variables.
   *
   * Names are drawn from a single process-wide counter and start with `%`,
   * which the surface syntax never accepts in identifiers. The counter is not
   * synchronized: only one transformation pipeline may run at a time.
   */
  std::string fresh_var();

  bool is_fresh_var(std::string_view name);

  // Restarts the fresh variable counter. Only for tests: names generated
  // before the reset may be produced again.
  void reset_fresh_vars();
}
