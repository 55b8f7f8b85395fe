#pragma once

#include <filesystem>
#include <memory>
#include <set>
#include <vector>

#include "copy_types.hpp"
#include "log.hpp"

// Turns source paths into the flat list of CopyItems a run will copy.
// Destination directories are created while walking, before the walk descends
// into them, so workers never race to create a shared parent. A missing
// source (NotFound) or a destination directory that cannot be created
// (IOSetup) throws CopyError; nothing is scheduled in that case.
class TreeEnumerator {
public:
  struct Options {
    SymlinkPolicy symlinks = SymlinkPolicy::Recreate;
  };

  explicit TreeEnumerator(Options options, std::shared_ptr<Logger> logger = nullptr);

  // Validates every source up front, then enumerates them in order. With more
  // than one source the destination must be an existing directory. When two
  // items share a destination only the later one is kept.
  std::vector<CopyItem> plan(const std::vector<std::filesystem::path>& sources,
                             const std::filesystem::path& destination);

  std::vector<CopyItem> enumerate(const std::filesystem::path& source,
                                  const std::filesystem::path& destination);

  // Entries that were passed over while walking (unreadable directories,
  // dangling links under "follow", special files, link cycles).
  const std::vector<RunSummary::Failure>& skipped() const { return skipped_; }
  std::size_t directories_created() const { return directories_created_; }

private:
  void enumerate_directory(const std::filesystem::path& source,
                           const std::filesystem::path& root,
                           std::vector<CopyItem>& out);
  void walk(const std::filesystem::path& source_dir,
            const std::filesystem::path& dest_dir,
            std::vector<CopyItem>& out);
  void descend(const std::filesystem::path& source_dir,
               const std::filesystem::path& dest_dir,
               std::vector<CopyItem>& out);
  void create_directory(const std::filesystem::path& path);
  std::vector<CopyItem> drop_overwritten(std::vector<CopyItem> items);
  void skip(const std::filesystem::path& path, const std::string& reason);

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::vector<RunSummary::Failure> skipped_;
  std::set<std::filesystem::path> visiting_;
  std::size_t directories_created_ = 0;
};
