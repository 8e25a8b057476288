#include "../../confl-lang.hh"
#include "../utils.hh"
#include "../internal.hh"

namespace confl {

using namespace trieste;
PassDef cleanup() {
    return {
        "cleanup",
        parse::wf,
        (dir::bottomup | dir::once), {
          //remove redundant exprs
        T(Expr) << (Any[Expr] * End) >>
            [](Match &_)
              {return _(Expr);
          },
        // error
        T(Expr)[Expr] << End >>
            [](Match &_)
              {return err(_(Expr),"missing expression");
          },
        T(Expr)[Expr] << (Any * Any * Any++) >>
            [](Match &_)
              {return err(_(Expr),"invalid expression");
          },
        }
      };
  }
}
