#include "resolver.hh"
#include "passes/internal.hh"
#include "passes/utils.hh"

#include <cstdlib>
#include <trieste/logging.h>

namespace confl {
  using namespace trieste;

  Node resolved_import(Node site, FileId file_id) {
    return (ResolvedImport ^ site) << (FileRef ^ std::to_string(file_id.value()));
  }

  FileId resolved_file(Node marker) {
    return FileId(std::stoul(node_val(marker->front())));
  }

  ResolverConfig ResolverConfig::from_env(std::filesystem::path root) {
    ResolverConfig config{std::move(root), {}};
    const char* env = std::getenv("CONFL_IMPORT_PATH");
    if (env == nullptr) {
      return config;
    }

    std::string paths(env);
    size_t start = 0;
    while (start <= paths.size()) {
      size_t end = paths.find(':', start);
      if (end == std::string::npos) {
        end = paths.size();
      }
      if (end > start) {
        config.search_paths.emplace_back(paths.substr(start, end - start));
      }
      start = end + 1;
    }
    return config;
  }

  FileResolver::FileResolver(ResolverConfig config) : config_(std::move(config)) {}

  std::optional<std::filesystem::path>
  FileResolver::locate(const std::string& path, Node site) const {
    std::filesystem::path p(path);
    std::error_code ec;

    if (p.is_absolute()) {
      if (std::filesystem::is_regular_file(p, ec)) {
        return p;
      }
      return std::nullopt;
    }

    std::vector<std::filesystem::path> dirs;
    auto source = site->location().source;
    if (source && !source->origin().empty()) {
      dirs.push_back(std::filesystem::path(source->origin()).parent_path());
    }
    dirs.push_back(config_.root);
    dirs.insert(dirs.end(), config_.search_paths.begin(), config_.search_paths.end());

    for (auto& dir : dirs) {
      auto candidate = dir / p;
      if (std::filesystem::is_regular_file(candidate, ec)) {
        return candidate;
      }
    }
    return std::nullopt;
  }

  Resolution FileResolver::resolve(const std::string& path, Node site) {
    auto found = locate(path, site);
    if (!found) {
      logging::Debug() << "import \"" << path << "\": not found";
      return Resolution::failed(err(site->clone(), "cannot find import \"" + path + "\""));
    }

    std::error_code ec;
    auto canonical = std::filesystem::canonical(*found, ec);
    if (ec) {
      return Resolution::failed(
        err(site->clone(), "cannot read import \"" + path + "\": " + ec.message()));
    }

    auto it = ids_.find(canonical);
    if (it != ids_.end()) {
      logging::Debug() << "import \"" << path << "\": cached as file "
                       << it->second.value();
      return Resolution::cached(it->second);
    }

    Reader reader{"confl", parse_passes(), parser()};
    auto result = reader.file(canonical).read();
    if (!result.ok) {
      std::string msg = "failed to parse import \"" + path + "\"";
      if (!result.errors.empty()) {
        msg += ": " + node_val(result.errors.front()->front());
      }
      logging::Debug() << msg;
      return Resolution::failed(err(site->clone(), msg));
    }

    FileId id(files_.size());
    files_.push_back({canonical, result.ast});
    ids_.emplace(canonical, id);
    logging::Debug() << "import \"" << path << "\": loaded " << canonical.string()
                     << " as file " << id.value();
    return Resolution::loaded(id, result.ast);
  }

  FileId FileResolver::add_root(const std::filesystem::path& path, Node top) {
    std::error_code ec;
    auto canonical = std::filesystem::canonical(path, ec);
    if (ec) {
      canonical = std::filesystem::absolute(path);
    }

    auto it = ids_.find(canonical);
    if (it != ids_.end()) {
      files_.at(it->second.value()).term = top;
      return it->second;
    }

    FileId id(files_.size());
    files_.push_back({canonical, top});
    ids_.emplace(canonical, id);
    logging::Debug() << "root " << canonical.string() << " registered as file "
                     << id.value();
    return id;
  }

  void FileResolver::insert(FileId file_id, Node term) {
    auto& entry = files_.at(file_id.value());
    entry.term = term;
    logging::Trace() << "stored transformed file " << file_id.value() << std::endl
                     << term;
  }

  Node FileResolver::get(FileId file_id) const {
    return files_.at(file_id.value()).term;
  }

  const std::filesystem::path& FileResolver::path_of(FileId file_id) const {
    return files_.at(file_id.value()).path;
  }
}
