#include "copy_scheduler.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <utility>
#include <variant>

CopyScheduler::CopyScheduler(Options options, std::shared_ptr<Logger> logger)
  : options_(options),
    logger_(std::move(logger)) {
  if(options_.workers == 0) options_.workers = default_worker_count();
}

std::size_t CopyScheduler::default_worker_count() {
  const auto hw = static_cast<std::size_t>(std::thread::hardware_concurrency());
  return std::clamp<std::size_t>(hw, 1, 8);
}

RunSummary CopyScheduler::run(const std::vector<CopyItem>& items, ProgressChannel::Sender progress) {
  RunSummary summary;
  summary.items_planned = items.size();

  std::mutex summary_mutex;
  std::atomic<std::size_t> dropped_events{0};
  const std::size_t workers = std::min(options_.workers, std::max<std::size_t>(1, items.size()));

  log_debug(logger_.get(), "Copying {} items on {} workers", items.size(), workers);
  {
    asio::thread_pool pool(workers);
    for(const auto& item : items) {
      const TrackingId id = next_tracking_id();
      asio::post(pool, [&, id, sender = progress]() mutable {
        bool announced = false;
        bool finished = false;
        ProgressReporter report = [&](ProgressEvent event){
          if(std::holds_alternative<NewItemEvent>(event)) announced = true;
          if(std::holds_alternative<DoneEvent>(event)) finished = true;
          if(!sender.send(std::move(event))) {
            dropped_events.fetch_add(1, std::memory_order_relaxed);
          }
        };
        CopyResult result;
        try {
          StreamCopier copier(options_.copier, logger_);
          result = copier.copy(item, id, report);
        } catch(const std::exception& e) {
          log_error(logger_.get(), "{}: {}", item.source.string(), e.what());
          result.status = CopyResult::Status::SetupFailed;
          result.error = e.what();
          if(!announced) report(make_new_item(id, item.source.string(), 0));
          if(!finished) report(make_done(id, false));
        }
        std::lock_guard<std::mutex> lock(summary_mutex);
        summary.bytes_copied += result.bytes_copied;
        if(result.ok()) {
          ++summary.items_copied;
        } else {
          ++summary.items_failed;
          summary.failures.push_back(RunSummary::Failure{item.source, result.error});
        }
      });
    }
    pool.join();
  }
  progress.release();

  if(dropped_events.load() > 0) {
    log_debug(logger_.get(), "{} progress events dropped after the display closed", dropped_events.load());
  }
  return summary;
}
