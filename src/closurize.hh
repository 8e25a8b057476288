#pragma once
#include "contracts.hh"
#include "environment.hh"

namespace confl {

  /**
   * Packs a term with an environment: binds a fresh variable to the closure
   * `(term, with_env)` in `env` and returns that variable.
   */
  Node closurize(Node term, Environment& env, Environment with_env);

  /**
   * Packs the contract of a type with an environment and wraps the resulting
   * variable back as a flat type.
   */
  Types closurize(const Types& types, Environment& env, Environment with_env);
}
