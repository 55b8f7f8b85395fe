#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "copy_types.hpp"
#include "display_coordinator.hpp"
#include "log.hpp"
#include "stream_copier.hpp"

// Runs every CopyItem exactly once on a pool of `workers` threads. Each item
// gets a fresh TrackingId and its own StreamCopier (one buffer per file,
// reused for every chunk). run() returns only after every pool thread has
// joined; a failing item never stops its siblings.
class CopyScheduler {
public:
  struct Options {
    std::size_t workers = 4;
    StreamCopier::Options copier;
  };

  explicit CopyScheduler(Options options, std::shared_ptr<Logger> logger = nullptr);

  // Progress events go to `progress`. A send that fails because the consumer
  // is gone is dropped; reporting never aborts a copy.
  RunSummary run(const std::vector<CopyItem>& items, ProgressChannel::Sender progress);

  static std::size_t default_worker_count();

private:
  Options options_;
  std::shared_ptr<Logger> logger_;
};
