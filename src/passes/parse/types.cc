#include "../../confl-lang.hh"
#include "../utils.hh"
#include "../internal.hh"


namespace confl {

using namespace trieste;

inline const auto type_atom =
  T(TDyn, TNum, TBool, TStr, TList, Flat, Type) / (T(TypeArrow) << Any);

inline const auto arrow_token = T(TypeArrow) << End;

  PassDef types() {
    return
    {
      "types",
      parse::wf_annotations,
      dir::bottomup,
      {
      // custom contract
      In(Type) * T(Hash) * T(Ident)[Ident] >>
        [](Match& _) -> Node {
          return Flat << (Var ^ _(Ident));
      },

      // parenthesized type
      In(Type) * T(Expr)[Expr] >>
        [](Match& _) -> Node {
          return Type << *_[Expr];
      },

      // arrows associate to the right
      In(Type) * type_atom[Ty1] * arrow_token * type_atom[Ty2] * End >>
        [](Match& _) -> Node {
          return TypeArrow << _(Ty1) << _(Ty2);
      },

      In(Type, TypeArrow) * (T(Type) << (type_atom[Type] * End)) >>
        [](Match& _) -> Node {
          return _(Type);
      },

      // errors
      In(Type) * T(Ident)[Ident] >>
        [](Match& _) -> Node {
          return err(_(Ident),
            "unknown type '" + node_val(_(Ident)) + "', custom contracts are written #name");
      },

      In(Type) * T(Hash)[Hash] >>
        [](Match& _) -> Node {
          return err(_(Hash), "expected a contract name after '#'");
      },

      In(Type) * type_atom * type_atom[Type] >>
        [](Match& _) -> Node {
          return err(_(Type), "expected '->' between types");
      },

      In(Type) * arrow_token * arrow_token[TypeArrow] >>
        [](Match& _) -> Node {
          return err(_(TypeArrow), "expected a type after '->'");
      },

      In(Type) * Start * arrow_token[TypeArrow] >>
        [](Match& _) -> Node {
          return err(_(TypeArrow), "expected a type before '->'");
      },

      In(Type) * arrow_token[TypeArrow] * End >>
        [](Match& _) -> Node {
          return err(_(TypeArrow), "expected a type after '->'");
      },

      In(Type) * (T(Type)[Type] << End) >>
        [](Match& _) -> Node {
          return err(_(Type), "empty type");
      },
      }
    };
  }

}
