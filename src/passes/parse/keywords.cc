#include "../../confl-lang.hh"
#include "../utils.hh"
#include "../internal.hh"


namespace confl {

using namespace trieste;

inline const auto nonempty = Any * Any++;

  /**
   * Builds the keyword constructs of an expression. A construct extends as
   * far right as possible, so `let`, `fun`, `if`, `default` and `doc` bind
   * looser than every operator.
   */
  PassDef keywords() {
    return {
      "keywords",
      parse::wf_let,
      dir::topdown,
      {
      // let x = e in e
      In(Expr) * (T(Let)[Let] << End) * T(Ident)[Ident] * T(Equals)
        * (!T(InKw) * (!T(InKw))++)[Bound] * T(InKw) * nonempty[Body] >>
        [](Match& _) -> Node {
          return (Let ^ _(Let)) << _(Ident)
                                << (Expr << _[Bound])
                                << (Expr << _[Body]);
      },

      // fun x => e
      In(Expr) * (T(Fun)[Fun] << End) * T(Ident)[Ident] * T(FatArrow) * nonempty[Body] >>
        [](Match& _) -> Node {
          return (Fun ^ _(Fun)) << _(Ident) << (Expr << _[Body]);
      },

      // fun x y => e is fun x => fun y => e
      In(Expr) * (T(Fun)[Fun] << End) * T(Ident)[Ident]
        * (T(Ident) * T(Ident)++ * T(FatArrow) * nonempty)[Body] >>
        [](Match& _) -> Node {
          return (Fun ^ _(Fun)) << _(Ident)
                                << (Expr << (Fun ^ _(Fun)) << _[Body]);
      },

      In(Expr) * (T(If)[If] << End) * (!T(Then) * (!T(Then))++)[Cond]
        * T(Then) * (!T(Else) * (!T(Else))++)[Then]
        * T(Else) * nonempty[Else] >>
        [](Match& _) -> Node {
          return (If ^ _(If)) << (Expr << _[Cond])
                              << (Expr << _[Then])
                              << (Expr << _[Else]);
      },

      In(Expr) * T(ImportKw) * T(Str)[Str] >>
        [](Match& _) -> Node {
          return Import ^ _(Str);
      },

      // default e : T
      In(Expr) * T(DefaultKw)[DefaultKw] * (!T(Colon) * (!T(Colon))++)[Value]
        * T(Colon)[Colon] * nonempty[Type] >>
        [](Match& _) -> Node {
          return (ContractWithDefault ^ _(DefaultKw))
                   << (Type << _[Type])
                   << (Lbl ^ _(Colon))
                   << (Expr << _[Value]);
      },

      In(Expr) * T(DefaultKw)[DefaultKw] * (!T(Colon))++ * T(Colon) >>
        [](Match& _) -> Node {
          return err(_(DefaultKw), "expected `default <expr> : <type>`");
      },

      In(Expr) * T(DefaultKw)[DefaultKw] * nonempty[Value] >>
        [](Match& _) -> Node {
          return (DefaultValue ^ _(DefaultKw)) << (Expr << _[Value]);
      },

      In(Expr) * T(DocKw)[DocKw] * T(Str)[Str] * nonempty[Value] >>
        [](Match& _) -> Node {
          return (Docstring ^ _(DocKw)) << (Doc ^ _(Str)) << (Expr << _[Value]);
      },

      // errors
      In(Expr) * (T(Let)[Let] << End) >>
        [](Match& _) -> Node {
          return err(_(Let), "expected `let <name> = <expr> in <expr>`");
      },

      In(Expr) * (T(Fun)[Fun] << End) >>
        [](Match& _) -> Node {
          return err(_(Fun), "expected `fun <names> => <expr>`");
      },

      In(Expr) * (T(If)[If] << End) >>
        [](Match& _) -> Node {
          return err(_(If), "expected `if <expr> then <expr> else <expr>`");
      },

      In(Expr) * T(ImportKw)[ImportKw] >>
        [](Match& _) -> Node {
          return err(_(ImportKw), "import expects a string literal path");
      },

      In(Expr) * T(DefaultKw)[DefaultKw] >>
        [](Match& _) -> Node {
          return err(_(DefaultKw), "default lacks a value");
      },

      In(Expr) * T(DocKw)[DocKw] >>
        [](Match& _) -> Node {
          return err(_(DocKw), "expected `doc \"<text>\" <expr>`");
      },

      In(Expr) * T(InKw, FatArrow, Then, Else, Equals, Colon)[Op] >>
        [](Match& _) -> Node {
          return err(_(Op), "unexpected '" + node_val(_(Op)) + "'");
      },

      --(In(Type)++) * In(Expr) * (type_keyword / T(TypeArrow, Hash))[Type] >>
        [](Match& _) -> Node {
          return err(_(Type), "types may only appear after ':' in a default value");
      },
      }
    };
  }
}
