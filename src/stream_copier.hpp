#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "copy_types.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Copies one CopyItem through a fixed buffer that is allocated once and
// reused for every chunk of every file this copier handles.
//
// Every call to copy() reports exactly one NewItem and one Done for the given
// id, including when the item fails: a failure before the first byte reports
// NewItem followed by Done{ok=false}, a mid-stream failure stops the loop and
// still reports Done{ok=false}. Failures are logged with the offending path
// and returned; they never throw.
class StreamCopier {
public:
  static constexpr std::size_t kDefaultBufferSize = 64 * 1024;

  struct Options {
    std::size_t buffer_size = kDefaultBufferSize;
    bool preserve_permissions = true;
  };

  explicit StreamCopier(Options options, std::shared_ptr<Logger> logger = nullptr);
  StreamCopier();

  CopyResult copy(const CopyItem& item, TrackingId id, const ProgressReporter& report);

  std::size_t buffer_size() const { return buffer_.size(); }

private:
  CopyResult copy_file(const CopyItem& item, TrackingId id, const ProgressReporter& report);
  CopyResult copy_symlink(const CopyItem& item, TrackingId id, const ProgressReporter& report);
  CopyResult fail(const CopyItem& item, TrackingId id, const ProgressReporter& report,
                  CopyResult::Status status, uint64_t bytes_copied, std::string message);

  Options options_;
  std::vector<char> buffer_;
  std::shared_ptr<Logger> logger_;
};
