#include "stream_copier.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

void emit(const ProgressReporter& report, ProgressEvent event) {
  if(report) report(std::move(event));
}

// Directories may be created concurrently by sibling workers; an existing
// directory is success.
bool ensure_parent_directory(const fs::path& path, std::error_code& ec) {
  ec.clear();
  auto parent = path.parent_path();
  if(parent.empty()) return true;
  fs::create_directories(parent, ec);
  if(ec && fs::is_directory(parent)) ec.clear();
  return !ec;
}

} // namespace

StreamCopier::StreamCopier(Options options, std::shared_ptr<Logger> logger)
  : options_(options),
    buffer_(options.buffer_size == 0 ? kDefaultBufferSize : options.buffer_size),
    logger_(std::move(logger)) {}

StreamCopier::StreamCopier()
  : StreamCopier(Options{}) {}

CopyResult StreamCopier::copy(const CopyItem& item, TrackingId id, const ProgressReporter& report) {
  if(item.kind == ItemKind::Symlink) {
    return copy_symlink(item, id, report);
  }
  return copy_file(item, id, report);
}

CopyResult StreamCopier::fail(const CopyItem& item,
                              TrackingId id,
                              const ProgressReporter& report,
                              CopyResult::Status status,
                              uint64_t bytes_copied,
                              std::string message) {
  log_error(logger_.get(), "{}: {}", item.source.string(), message);
  emit(report, make_done(id, false));
  CopyResult result;
  result.status = status;
  result.bytes_copied = bytes_copied;
  result.error = std::move(message);
  return result;
}

CopyResult StreamCopier::copy_file(const CopyItem& item, TrackingId id, const ProgressReporter& report) {
  const auto display_path = item.source.string();
  std::error_code ec;
  const auto reported_size = fs::file_size(item.source, ec);
  const uint64_t total_size = ec ? 0 : static_cast<uint64_t>(reported_size);

  std::ifstream in(item.source, std::ios::binary);
  emit(report, make_new_item(id, display_path, total_size));
  if(!in) {
    return fail(item, id, report, CopyResult::Status::SetupFailed, 0,
                "cannot open source for reading");
  }

  if(!ensure_parent_directory(item.destination, ec)) {
    return fail(item, id, report, CopyResult::Status::SetupFailed, 0,
                "cannot create directory " + item.destination.parent_path().string() + ": " + ec.message());
  }
  // Replace a link at the destination rather than writing through it.
  if(fs::is_symlink(fs::symlink_status(item.destination, ec))) {
    fs::remove(item.destination, ec);
  }
  // Truncating the destination would destroy the source before it is read.
  if(fs::equivalent(item.source, item.destination, ec)) {
    return fail(item, id, report, CopyResult::Status::SetupFailed, 0,
                "source and destination are the same file");
  }

  std::ofstream out(item.destination, std::ios::binary | std::ios::trunc);
  if(!out) {
    return fail(item, id, report, CopyResult::Status::SetupFailed, 0,
                "cannot create " + item.destination.string());
  }

  uint64_t copied = 0;
  while(true) {
    in.read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    const std::streamsize n = in.gcount();
    if(n > 0) {
      out.write(buffer_.data(), n);
      if(!out) {
        return fail(item, id, report, CopyResult::Status::StreamFailed, copied,
                    "write to " + item.destination.string() + " failed after " + std::to_string(copied) + " bytes");
      }
      copied += static_cast<uint64_t>(n);
      emit(report, make_advanced(id, copied));
    }
    if(in.bad()) {
      return fail(item, id, report, CopyResult::Status::StreamFailed, copied,
                  "read failed after " + std::to_string(copied) + " bytes");
    }
    if(!in || n == 0) break;
  }

  out.flush();
  if(!out) {
    return fail(item, id, report, CopyResult::Status::StreamFailed, copied,
                "flush of " + item.destination.string() + " failed");
  }
  out.close();

  if(options_.preserve_permissions) {
    auto perms = fs::status(item.source, ec).permissions();
    if(!ec) {
      fs::permissions(item.destination, perms, fs::perm_options::replace, ec);
    }
    if(ec) {
      log_warn(logger_.get(), "{}: permissions not preserved: {}", item.destination.string(), ec.message());
    }
  }

  emit(report, make_done(id, true));
  CopyResult result;
  result.bytes_copied = copied;
  return result;
}

CopyResult StreamCopier::copy_symlink(const CopyItem& item, TrackingId id, const ProgressReporter& report) {
  emit(report, make_new_item(id, item.source.string(), kSymlinkSyntheticSize));

  std::error_code ec;
  const auto target = fs::read_symlink(item.source, ec);
  if(ec) {
    return fail(item, id, report, CopyResult::Status::SetupFailed, 0,
                "cannot read link: " + ec.message());
  }

  if(fs::exists(fs::symlink_status(item.destination, ec))) {
    fs::remove(item.destination, ec);
    if(ec) {
      return fail(item, id, report, CopyResult::Status::SetupFailed, 0,
                  "cannot replace " + item.destination.string() + ": " + ec.message());
    }
  }
  if(!ensure_parent_directory(item.destination, ec)) {
    return fail(item, id, report, CopyResult::Status::SetupFailed, 0,
                "cannot create directory " + item.destination.parent_path().string() + ": " + ec.message());
  }
  fs::create_symlink(target, item.destination, ec);
  if(ec) {
    return fail(item, id, report, CopyResult::Status::SetupFailed, 0,
                "cannot create link " + item.destination.string() + ": " + ec.message());
  }

  emit(report, make_advanced(id, kSymlinkSyntheticSize));
  emit(report, make_done(id, true));
  return CopyResult{};
}
