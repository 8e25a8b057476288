#pragma once
#include "confl-lang.hh"

#include <map>
#include <memory>
#include <string>

namespace confl {
  using namespace trieste;

  class Thunk;

  // How an identifier was bound.
  enum class IdentKind { Let, Lambda, Record };

  struct Binding {
    std::shared_ptr<Thunk> thunk;
    IdentKind kind;
  };

  /**
   * Lexical environment. Copies share their thunks, so an update made
   * through one copy is seen by every closure holding another.
   */
  using Environment = std::map<std::string, Binding>;

  struct Closure {
    Node body;
    Environment env;
  };

  /**
   * A shared binding slot, evaluated at most once.
   *
   * Suspended -> Blackholed (entered by the evaluator) -> Evaluated.
   */
  class Thunk {
  public:
    enum class State { Suspended, Blackholed, Evaluated };

    explicit Thunk(Closure closure);

    State state() const { return state_; }
    const Closure& closure() const { return closure_; }

    /**
     * Marks a suspended thunk as being evaluated.
     * @return false if the thunk is not suspended: entering a blackholed
     * thunk means its value depends on itself.
     */
    bool enter();

    // Stores the value of an entered thunk.
    void update(Closure value);

  private:
    State state_;
    Closure closure_;
  };

  std::shared_ptr<Thunk> make_thunk(Node body, Environment env);
}
