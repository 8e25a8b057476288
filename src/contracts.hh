#pragma once
#include "confl-lang.hh"

#include <optional>

namespace confl {
  using namespace trieste;

  /**
   * A validated type annotation, as found under `ContractWithDefault`.
   */
  class Types {
  public:
    /**
     * Validates a type annotation.
     * @param type a `Type` node holding one of the type forms.
     * @return nothing if `type` is not a well-formed type.
     */
    static std::optional<Types> from(Node type);

    // Type whose only content is the runtime contract `term`.
    static Types flat(Node term);

    Node node() const { return type_; }

    /**
     * Builds the term checking this type at runtime. Built-in types map to
     * the `$`-prefixed contract primitives of the evaluator, arrows to
     * `$func` applied to both contracts and flat types to their term.
     */
    Node contract() const;

  private:
    explicit Types(Node type);

    Node type_;
  };
}
