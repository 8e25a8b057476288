#include "../../confl-lang.hh"
#include "../utils.hh"
#include "../internal.hh"

namespace confl {

using namespace trieste;

  // Application is left associative and binds tighter than any operator.
  PassDef funapp() {
    return {
        "funapp",
        parse::wf_funapp,
        (dir::bottomup) ,
        {
        In(Expr) * T(Expr)[Lhs] * T(Expr)[Rhs] >>
            [](Match &_)
              {return Expr << (App << _(Lhs) << _(Rhs));
            },
        }};
  }

  /**
   * One precedence level of left associative binary operators.
   * @param name pass name.
   * @param wf well-formedness after the pass.
   * @param ops the operators of this level.
   */
  PassDef binary(const std::string& name, const wf::Wellformed& wf, detail::Pattern ops)
  {
    return {
        name,
        wf,
        dir::topdown,
        {
          In(Expr) * (T(Expr)[Lhs] * ops[Op] * T(Expr)[Rhs]) >>
            [](Match &_)
              {return Expr << (_(Op) << _[Lhs] << _[Rhs]);
          },
          // an operator left without an operand on one side
          In(Expr) * (ops[Op] << End) >>
            [](Match &_)
            {
              return err(_(Op), "'" + node_val(_(Op)) + "' expects an operand on each side");
            },
        }};
  }

  PassDef mul()
  {
    return binary("mul", parse::wf_mul, T(Mul));
  }

  PassDef addsub()
  {
    return binary("addsub", parse::wf_add, T(Add, Sub));
  }

  PassDef comparison()
  {
    return binary("comparison", parse::wf_cmp, T(LT, Eq));
  }
}
