#include "environment.hh"

#include <utility>

namespace confl {

  Thunk::Thunk(Closure closure)
  : state_(State::Suspended), closure_(std::move(closure)) {}

  bool Thunk::enter() {
    if (state_ != State::Suspended) {
      return false;
    }
    state_ = State::Blackholed;
    return true;
  }

  void Thunk::update(Closure value) {
    closure_ = std::move(value);
    state_ = State::Evaluated;
  }

  std::shared_ptr<Thunk> make_thunk(Node body, Environment env) {
    return std::make_shared<Thunk>(Closure{body, std::move(env)});
  }
}
