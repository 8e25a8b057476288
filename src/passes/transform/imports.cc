#include "../../transform.hh"
#include "../utils.hh"

namespace confl {

  using namespace trieste;

  ImportStep import_one(Node term, ImportResolver& resolver) {
    if (term->type() != Import) {
      return {term, std::nullopt, {}};
    }

    Resolution res = resolver.resolve(unquote(term), term);
    if (!res.ok()) {
      return {term, std::nullopt, res.error};
    }

    Node marker = resolved_import(term, *res.file_id);
    if (res.from_cache()) {
      return {marker, std::nullopt, {}};
    }
    return {marker, Pending{res.term, *res.file_id}, {}};
  }
}
