#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

enum class ItemKind { File, Symlink };

// One file or symlink scheduled for copying. Never mutated after the
// enumerator creates it.
struct CopyItem {
  std::filesystem::path source;
  std::filesystem::path destination;
  ItemKind kind = ItemKind::File;
};

// Correlates every progress event of one CopyItem. Taken from a process-wide
// atomic counter, so ids are unique for the process lifetime and never 0.
using TrackingId = uint64_t;
TrackingId next_tracking_id();

enum class SymlinkPolicy { Recreate, Follow, Skip };

bool parse_symlink_policy(const std::string& text, SymlinkPolicy& out);
const char* to_string(SymlinkPolicy policy);

class CopyError : public std::runtime_error {
public:
  enum class Kind { NotFound, IOSetup, IOStream, Usage };

  CopyError(Kind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

const char* to_string(CopyError::Kind kind);

struct CopyResult {
  enum class Status { Copied, SetupFailed, StreamFailed };

  Status status = Status::Copied;
  uint64_t bytes_copied = 0;
  std::string error;

  bool ok() const { return status == Status::Copied; }
};

struct RunSummary {
  struct Failure {
    std::filesystem::path source;
    std::string error;
  };

  std::size_t items_planned = 0;
  std::size_t items_copied = 0;
  std::size_t items_failed = 0;
  uint64_t bytes_copied = 0;
  std::vector<Failure> failures;
  // Entries the enumerator passed over; never scheduled.
  std::vector<Failure> skipped;
};
