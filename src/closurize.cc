#include "closurize.hh"
#include "passes/utils.hh"

#include <utility>

namespace confl {

  Node closurize(Node term, Environment& env, Environment with_env) {
    auto var = fresh_var();
    env.insert_or_assign(var, Binding{make_thunk(term, std::move(with_env)), IdentKind::Record});
    return Var ^ var;
  }

  Types closurize(const Types& types, Environment& env, Environment with_env) {
    return Types::flat(closurize(types.contract(), env, std::move(with_env)));
  }
}
