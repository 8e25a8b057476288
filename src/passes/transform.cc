// clang-format off
#include "transform/share.cc"
#include "transform/imports.cc"
// clang-format on

#include "internal.hh"

#include <trieste/logging.h>

namespace confl {

  using namespace trieste;

  PassDef transform_pass(std::shared_ptr<TransformState> state, const std::string& name) {
    return {
      name,
      transform::wf,
      (dir::bottomup | dir::once),
      {
        T(Record, List, DefaultValue, ContractWithDefault, Docstring)[Value] >>
          [](Match& _) -> Node {
            Node term = _(Value);
            Node shared = share_one(term);
            if (shared == term) {
              return NoChange;
            }
            return shared;
          },

        T(Import)[Import] >> [state](Match& _) -> Node {
          if (state->error) {
            return NoChange;
          }

          ImportStep step = import_one(_(Import), state->resolver);
          if (step.error) {
            state->error = step.error;
            return NoChange;
          }
          if (step.pending) {
            state->stack.push_back(*step.pending);
          }
          return step.term;
        },
      }};
  }

  // Transforms queued files until none remain or an import fails.
  bool drain(TransformState& state, const Pass& pass) {
    while (!state.stack.empty() && !state.error) {
      Pending next = state.stack.back();
      state.stack.pop_back();

      auto [ast, count, changes] = pass->run(next.term);
      logging::Debug() << "transformed file " << next.file_id.value() << ": "
                       << changes << " changes";
      if (state.error) {
        return false;
      }
      state.resolver.insert(next.file_id, ast);
    }
    return !state.error;
  }

  TransformResult transform(Node top, ImportResolver& resolver) {
    auto state = std::make_shared<TransformState>(resolver);
    Pass pass = transform_pass(state);

    auto [ast, count, changes] = pass->run(top);
    logging::Debug() << "transformed root: " << changes << " changes, "
                     << state->stack.size() << " files queued";

    // Queued files are of no use once the root failed.
    if (state->error || !drain(*state, pass)) {
      return {nullptr, state->error};
    }
    return {ast, nullptr};
  }

  // Origin of the file a parsed tree was read from, empty for synthetic sources.
  std::string origin_of(Node top) {
    for (Node node = top; node; node = node->size() == 0 ? Node{} : node->front()) {
      auto source = node->location().source;
      if (source && !source->origin().empty()) {
        return source->origin();
      }
    }
    return {};
  }

  PassDef resolve(std::shared_ptr<FileResolver> resolver) {
    auto state = std::make_shared<TransformState>(*resolver);
    auto root = std::make_shared<std::optional<FileId>>();
    Pass files = transform_pass(state);
    PassDef pass = transform_pass(state, "resolve");

    pass.pre([state, root, resolver](Node top) {
      state->stack.clear();
      state->error = nullptr;
      root->reset();

      auto origin = origin_of(top);
      if (!origin.empty()) {
        *root = resolver->add_root(origin, top);
      }
      return 0;
    });

    pass.post([state, root, files, resolver](Node top) {
      if (!state->error) {
        drain(*state, files);
      }
      if (state->error) {
        top << state->error;
        return 1;
      }
      if (*root) {
        resolver->insert(**root, top);
      }
      logging::Debug() << resolver->size() << " files loaded";
      return 0;
    });

    return pass;
  }
}
