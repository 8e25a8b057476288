// clang-format off
#include "../init_parse.cc"
#include "parse/parse_cleanup.cc"
#include "parse/structure.cc"
#include "parse/keywords.cc"
#include "parse/types.cc"
#include "parse/exprs.cc"
#include "parse/operators.cc"
#include "parse/cleanup.cc"
// clang-format on

namespace confl {

  Parse parser() {
    return init_parse::parser();
  }

  std::vector<Pass> parse_passes() {
    return {
      parse_cleanup(),
      structure(),
      keywords(),
      types(),
      wrap_exprs(),
      funapp(),
      mul(),
      addsub(),
      comparison(),
      cleanup(),
    };
  }
}
