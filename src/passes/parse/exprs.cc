#include "../../confl-lang.hh"
#include "../utils.hh"
#include "../internal.hh"

namespace confl{

inline const auto expr_atom =
  T(Var, Num, Str, True, False, Enum, Record, List,
    Let, Fun, If, Import, DefaultValue, ContractWithDefault, Docstring);

PassDef wrap_exprs(){
    return {
      "exprs",
      parse::wf_exprs,
      dir::bottomup,
      {
      // field access binds tighter than application
      In(Expr) * T(Ident, Var, Expr, Record, List)[Lhs] * T(Dot) * T(Ident)[Ident] >>
        [](Match& _){
          return Expr << (Access << (Expr << _(Lhs)) << _(Ident));
      },
      In(Expr) * T(Ident)[Ident] >>
        [](Match& _){
          return Var ^ _(Ident);
      },
      In(Expr) * ((expr_atom[Expr] * --End)
              / (--Start * expr_atom[Expr])) >>
        [](Match& _){
          return Expr << _(Expr);
      },
      // error
      In(Expr) * T(Dot)[Dot] >>
        [](Match& _){
          return err(_(Dot), "expected a field name after '.'");
      }
      }
    };
  }
}
