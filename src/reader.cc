#include "confl-lang.hh"
#include "passes/internal.hh"
#include "transform.hh"

namespace confl {

  using namespace trieste;

  Reader reader(std::shared_ptr<FileResolver> resolver) {
    auto passes = parse_passes();
    passes.push_back(resolve(resolver));
    return {
      "confl",
      passes,
      parser(),
    };
  }

}
