#include "tree_enumerator.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace fs = std::filesystem;

namespace {

// "dir/", "." and "a/b/.." all name a directory whose basename is not the
// last lexical component.
fs::path source_basename(const fs::path& source) {
  auto normal = fs::absolute(source).lexically_normal();
  if(normal.filename().empty() && normal.has_parent_path()) {
    normal = normal.parent_path();
  }
  return normal.filename();
}

bool is_within(const fs::path& candidate, const fs::path& base) {
  auto c = candidate.begin();
  for(auto b = base.begin(); b != base.end(); ++b, ++c) {
    if(c == candidate.end() || *c != *b) return false;
  }
  return true;
}

fs::path leaf_destination(const fs::path& source, const fs::path& destination) {
  std::error_code ec;
  if(fs::is_directory(destination, ec)) {
    return destination / source_basename(source);
  }
  return destination;
}

} // namespace

TreeEnumerator::TreeEnumerator(Options options, std::shared_ptr<Logger> logger)
  : options_(options),
    logger_(std::move(logger)) {}

std::vector<CopyItem> TreeEnumerator::plan(const std::vector<fs::path>& sources,
                                           const fs::path& destination) {
  if(sources.empty()) {
    throw CopyError(CopyError::Kind::Usage, "no source given");
  }
  std::error_code ec;
  if(sources.size() > 1 && !fs::is_directory(destination, ec)) {
    throw CopyError(CopyError::Kind::Usage,
                    "destination '" + destination.string() + "' must be an existing directory when copying multiple sources");
  }
  for(const auto& source : sources) {
    if(!fs::exists(fs::symlink_status(source, ec))) {
      throw CopyError(CopyError::Kind::NotFound, "source '" + source.string() + "' does not exist");
    }
  }

  std::vector<CopyItem> items;
  for(const auto& source : sources) {
    auto found = enumerate(source, destination);
    items.insert(items.end(),
                 std::make_move_iterator(found.begin()),
                 std::make_move_iterator(found.end()));
  }
  return drop_overwritten(std::move(items));
}

// Two items aimed at one destination would race on it. The later source on
// the command line replaces the earlier one.
std::vector<CopyItem> TreeEnumerator::drop_overwritten(std::vector<CopyItem> items) {
  std::unordered_map<std::string, std::size_t> last_for_destination;
  for(std::size_t i = 0; i < items.size(); ++i) {
    last_for_destination[fs::absolute(items[i].destination).lexically_normal().string()] = i;
  }
  if(last_for_destination.size() == items.size()) return items;

  std::vector<CopyItem> kept;
  kept.reserve(last_for_destination.size());
  for(std::size_t i = 0; i < items.size(); ++i) {
    const auto winner = last_for_destination[fs::absolute(items[i].destination).lexically_normal().string()];
    if(winner != i) {
      log_warn(logger_.get(), "Not copying {}: {} is overwritten by later source {}",
               items[i].source.string(), items[i].destination.string(), items[winner].source.string());
      continue;
    }
    kept.push_back(std::move(items[i]));
  }
  return kept;
}

std::vector<CopyItem> TreeEnumerator::enumerate(const fs::path& source, const fs::path& destination) {
  std::error_code ec;
  const auto link_status = fs::symlink_status(source, ec);
  if(!fs::exists(link_status)) {
    throw CopyError(CopyError::Kind::NotFound, "source '" + source.string() + "' does not exist");
  }

  std::vector<CopyItem> items;
  auto status = link_status;
  if(fs::is_symlink(link_status)) {
    switch(options_.symlinks) {
      case SymlinkPolicy::Skip:
        log_debug(logger_.get(), "Skipping symbolic link {}", source.string());
        return items;
      case SymlinkPolicy::Recreate:
        items.push_back(CopyItem{source, leaf_destination(source, destination), ItemKind::Symlink});
        return items;
      case SymlinkPolicy::Follow:
        status = fs::status(source, ec);
        if(!fs::exists(status)) {
          skip(source, "dangling symbolic link");
          return items;
        }
        break;
    }
  }

  if(fs::is_regular_file(status)) {
    items.push_back(CopyItem{source, leaf_destination(source, destination), ItemKind::File});
    return items;
  }
  if(fs::is_directory(status)) {
    enumerate_directory(source, leaf_destination(source, destination), items);
    return items;
  }
  skip(source, "not a regular file, directory or symbolic link");
  return items;
}

void TreeEnumerator::enumerate_directory(const fs::path& source,
                                         const fs::path& root,
                                         std::vector<CopyItem>& out) {
  std::error_code ec;
  const auto source_real = fs::canonical(source, ec);
  if(ec) {
    throw CopyError(CopyError::Kind::IOSetup, "cannot resolve '" + source.string() + "': " + ec.message());
  }
  const auto root_real = fs::weakly_canonical(root, ec);
  if(!ec && is_within(root_real, source_real)) {
    throw CopyError(CopyError::Kind::IOSetup,
                    "cannot copy '" + source.string() + "' into itself ('" + root.string() + "')");
  }

  create_directory(root);
  visiting_.clear();
  visiting_.insert(source_real);
  walk(source, root, out);
  visiting_.clear();
}

void TreeEnumerator::walk(const fs::path& source_dir,
                          const fs::path& dest_dir,
                          std::vector<CopyItem>& out) {
  std::error_code ec;
  std::vector<fs::directory_entry> entries;
  for(fs::directory_iterator it(source_dir, ec), end; !ec && it != end; it.increment(ec)) {
    entries.push_back(*it);
  }
  if(ec) {
    skip(source_dir, "cannot read directory: " + ec.message());
    return;
  }
  std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry& a, const fs::directory_entry& b){
              return a.path().filename() < b.path().filename();
            });

  for(const auto& entry : entries) {
    const auto& path = entry.path();
    const auto target = dest_dir / path.filename();
    auto status = entry.symlink_status(ec);
    if(ec) {
      skip(path, "cannot stat: " + ec.message());
      continue;
    }

    if(fs::is_symlink(status)) {
      if(options_.symlinks == SymlinkPolicy::Skip) {
        log_debug(logger_.get(), "Skipping symbolic link {}", path.string());
        continue;
      }
      if(options_.symlinks == SymlinkPolicy::Recreate) {
        out.push_back(CopyItem{path, target, ItemKind::Symlink});
        continue;
      }
      status = fs::status(path, ec);
      if(ec || !fs::exists(status)) {
        skip(path, "dangling symbolic link");
        continue;
      }
    }

    if(fs::is_directory(status)) {
      descend(path, target, out);
    } else if(fs::is_regular_file(status)) {
      out.push_back(CopyItem{path, target, ItemKind::File});
    } else {
      skip(path, "not a regular file, directory or symbolic link");
    }
  }
}

void TreeEnumerator::descend(const fs::path& source_dir,
                             const fs::path& dest_dir,
                             std::vector<CopyItem>& out) {
  std::error_code ec;
  auto real = fs::canonical(source_dir, ec);
  if(ec) {
    skip(source_dir, "cannot resolve: " + ec.message());
    return;
  }
  if(!visiting_.insert(real).second) {
    skip(source_dir, "directory cycle through symbolic link");
    return;
  }
  create_directory(dest_dir);
  walk(source_dir, dest_dir, out);
  visiting_.erase(real);
}

void TreeEnumerator::create_directory(const fs::path& path) {
  std::error_code ec;
  if(fs::create_directories(path, ec)) {
    ++directories_created_;
    return;
  }
  if(ec || !fs::is_directory(path)) {
    throw CopyError(CopyError::Kind::IOSetup,
                    "cannot create directory '" + path.string() + "'" + (ec ? ": " + ec.message() : std::string()));
  }
}

void TreeEnumerator::skip(const fs::path& path, const std::string& reason) {
  log_warn(logger_.get(), "Skipping {}: {}", path.string(), reason);
  skipped_.push_back(RunSummary::Failure{path, reason});
}
