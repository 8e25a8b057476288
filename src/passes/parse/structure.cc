#include "../../confl-lang.hh"
#include "../internal.hh"
#include "../utils.hh"

#include <set>


namespace confl {

using namespace trieste;

  /**
   * Builds a record from the groups of a brace. Each group must read
   * `name = value`, and a name may only be defined once.
   */
  Node record(Node brace)
  {
    Node rec = Record ^ brace;
    std::set<std::string> names;

    for (Node group : *brace) {
      if (
        group->size() < 3 || group->front()->type() != Ident ||
        group->at(1)->type() != Equals) {
        return err(group, "expected a field definition `name = value`");
      }

      Node name = group->front();
      if (!names.insert(node_val(name)).second) {
        return err(name, "duplicate field `" + node_val(name) + "`");
      }

      Node value = Expr;
      for (auto it = group->begin() + 2; it != group->end(); ++it) {
        value << *it;
      }
      rec << (Field << name << value);
    }

    return rec;
  }

  PassDef structure(){
      return {
      "structure",
      parse::wf_structure,
      dir::topdown,
      {
      T(Paren) << (T(Group)[Group] * End) >>
      [](Match& _) {
          return Expr << *_[Group];
      },
      T(Paren)[Paren] >>
        [](Match& _){
          return err(_(Paren), "invalid parenthesis");
        },
      T(Brace)[Brace] >>
        [](Match& _){
          return record(_(Brace));
      },
      T(Square)[Square] >>
        [](Match& _){
          Node list = List ^ _(Square);
          for (Node group : *_(Square)) {
            Node elem = Expr;
            for (Node tok : *group) {
              elem << tok;
            }
            list << elem;
          }
          return list;
      }
      }
    };
  }
}
