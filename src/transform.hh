#pragma once
#include "resolver.hh"

#include <memory>
#include <optional>
#include <vector>

namespace confl {
  using namespace trieste;

  /**
   * Whether a term is worth binding to a thunk. Constants, labels, symbols,
   * enum tags, variables and functions are already in weak head normal form
   * and are copied instead.
   */
  bool should_share(Node term);

  /**
   * Introduces sharing at the top node of a term. Every shareable field of a
   * record, element of a list or child of a wrapper (`DefaultValue`,
   * `ContractWithDefault`, `Docstring`) is replaced by a fresh variable bound
   * by a `Let` around the rebuilt node. Other terms are returned as is.
   * @param term the term to rewrite. Its children are moved into the result.
   * @return `term` itself when nothing is shareable, a new term otherwise.
   */
  Node share_one(Node term);

  // A loaded file that still has to be transformed.
  struct Pending {
    Node term;
    FileId file_id;
  };

  struct ImportStep {
    Node term;
    std::optional<Pending> pending;
    Node error;
  };

  /**
   * Resolves the import at the top node of a term. The import is replaced by
   * a `ResolvedImport` marker; if its file was loaded for the first time the
   * file is returned as pending. Other terms are returned as is.
   */
  ImportStep import_one(Node term, ImportResolver& resolver);

  struct TransformState {
    explicit TransformState(ImportResolver& resolver) : resolver(resolver) {}

    ImportResolver& resolver;
    // Loaded files, processed last discovered first.
    std::vector<Pending> stack;
    // First import error; later imports are left untouched.
    Node error;
  };

  /**
   * Single bottom-up pass applying the sharing and import rules to every
   * node. Loaded files are pushed on `state->stack`.
   */
  PassDef transform_pass(
    std::shared_ptr<TransformState> state, const std::string& name = "transform");

  struct TransformResult {
    // Null when the transformation failed.
    Node ast;
    Node error;

    bool ok() const { return ast != nullptr; }
  };

  /**
   * Transforms a parsed file and, transitively, every file it imports. Each
   * newly loaded file is transformed once and stored with
   * `ImportResolver::insert`.
   * @param top a `Top` node from the parse pipeline, rewritten in place.
   * @return the transformed `Top`, or the first import error.
   */
  TransformResult transform(Node top, ImportResolver& resolver);

  /**
   * The transformation as the last pass of the reader pipeline. Import errors
   * are appended to the AST.
   */
  PassDef resolve(std::shared_ptr<FileResolver> resolver);
}
