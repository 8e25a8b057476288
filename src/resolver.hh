#pragma once
#include "confl-lang.hh"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace confl {
  using namespace trieste;

  /**
   * Opaque handle on a file known to a resolver. Only resolvers mint them.
   */
  class FileId {
  public:
    explicit FileId(size_t value) : value_(value) {}

    size_t value() const { return value_; }

    bool operator==(const FileId& other) const { return value_ == other.value_; }
    bool operator!=(const FileId& other) const { return value_ != other.value_; }
    bool operator<(const FileId& other) const { return value_ < other.value_; }

  private:
    size_t value_;
  };

  /**
   * Outcome of `ImportResolver::resolve`: an error, a file that was already
   * known ("cached") or a file parsed for the first time ("loaded"), which
   * still has to be transformed. File terms are `Top` nodes as produced by
   * the parse pipeline.
   */
  struct Resolution {
    Node error;
    std::optional<FileId> file_id;
    Node term;

    bool ok() const { return !error && file_id.has_value(); }
    bool from_cache() const { return ok() && !term; }

    static Resolution failed(Node error) { return {error, std::nullopt, {}}; }
    static Resolution cached(FileId id) { return {{}, id, {}}; }
    static Resolution loaded(FileId id, Node term) { return {{}, id, term}; }
  };

  /**
   * Owner of import resolution and of the per-file cache of transformed
   * terms.
   */
  class ImportResolver {
  public:
    virtual ~ImportResolver() = default;

    /**
     * Resolves an import path.
     * @param path the path as written in the import.
     * @param site the `Import` node, used for relative lookup and errors.
     * @return the file, or an `Error` node attributed to `site`.
     */
    virtual Resolution resolve(const std::string& path, Node site) = 0;

    /**
     * Stores the transformed term of a file that `resolve` loaded.
     */
    virtual void insert(FileId file_id, Node term) = 0;
  };

  // Marker that replaces an import once its file is known.
  Node resolved_import(Node site, FileId file_id);

  // File referenced by a `ResolvedImport` marker.
  FileId resolved_file(Node marker);

  struct ResolverConfig {
    std::filesystem::path root;
    std::vector<std::filesystem::path> search_paths;

    /**
     * Configuration rooted at `root`, with search paths read from the
     * colon separated `CONFL_IMPORT_PATH` environment variable.
     */
    static ResolverConfig from_env(std::filesystem::path root);
  };

  /**
   * Resolves imports against the file system and parses new files with the
   * parse pipeline. Files are identified by canonical path.
   */
  class FileResolver : public ImportResolver {
  public:
    explicit FileResolver(ResolverConfig config);

    Resolution resolve(const std::string& path, Node site) override;
    void insert(FileId file_id, Node term) override;

    /**
     * Registers a file parsed outside the resolver, so that imports leading
     * back to it are cache hits.
     * @param path the file's path, as given to the reader.
     * @param top the parsed `Top` node.
     * @return the file's id, an existing one if the path is already known.
     */
    FileId add_root(const std::filesystem::path& path, Node top);

    // Transformed term of a file, or its parsed term if not transformed yet.
    Node get(FileId file_id) const;
    const std::filesystem::path& path_of(FileId file_id) const;
    size_t size() const { return files_.size(); }

  private:
    struct Entry {
      std::filesystem::path path;
      Node term;
    };

    std::optional<std::filesystem::path>
    locate(const std::string& path, Node site) const;

    ResolverConfig config_;
    std::map<std::filesystem::path, FileId> ids_;
    std::vector<Entry> files_;
  };
}
