#include "../../transform.hh"
#include "../utils.hh"

#include <algorithm>
#include <utility>

namespace confl {

  using namespace trieste;

  bool should_share(Node term) {
    return !term->type().in({True, False, Num, Str, Lbl, Sym, Var, Enum, Fun});
  }

  // Wraps `body` in one `Let` per binding, the first binding innermost.
  Node bind_all(Node term, Node body, std::vector<std::pair<std::string, Node>>& bindings) {
    for (auto& [name, value] : bindings) {
      body = (Let ^ term) << (Ident ^ name) << value << body;
    }
    return body;
  }

  Node share_fields(Node record) {
    bool shareable = std::any_of(record->begin(), record->end(), [](Node field) {
      return should_share(field->back());
    });
    if (!shareable) {
      return record;
    }

    std::vector<std::pair<std::string, Node>> bindings;
    Node result = Record ^ record;

    for (Node field : *record) {
      Node name = field->front();
      Node value = field->back();
      if (should_share(value)) {
        auto fresh = fresh_var();
        bindings.emplace_back(fresh, value);
        value = Var ^ fresh;
      }
      result << ((Field ^ field) << name << value);
    }

    return bind_all(record, result, bindings);
  }

  Node share_elements(Node list) {
    if (std::none_of(list->begin(), list->end(), should_share)) {
      return list;
    }

    std::vector<std::pair<std::string, Node>> bindings;
    Node result = List ^ list;

    for (Node elem : *list) {
      if (should_share(elem)) {
        auto fresh = fresh_var();
        bindings.emplace_back(fresh, elem);
        elem = Var ^ fresh;
      }
      result << elem;
    }

    return bind_all(list, result, bindings);
  }

  // The shared term of a wrapper is its last child.
  Node share_wrapped(Node wrapper) {
    Node inner = wrapper->back();
    if (!should_share(inner)) {
      return wrapper;
    }

    auto fresh = fresh_var();
    Node result = wrapper->type() ^ wrapper;
    for (auto it = wrapper->begin(); it != wrapper->end() - 1; ++it) {
      result << *it;
    }
    result << (Var ^ fresh);

    std::vector<std::pair<std::string, Node>> bindings{{fresh, inner}};
    return bind_all(wrapper, result, bindings);
  }

  Node share_one(Node term) {
    if (term->type() == Record) {
      return share_fields(term);
    }
    if (term->type() == List) {
      return share_elements(term);
    }
    if (term->type().in({DefaultValue, ContractWithDefault, Docstring})) {
      return share_wrapped(term);
    }
    return term;
  }
}
