#include "copy_types.hpp"

#include <atomic>

TrackingId next_tracking_id() {
  static std::atomic<TrackingId> next_id{1};
  return next_id.fetch_add(1, std::memory_order_relaxed);
}

bool parse_symlink_policy(const std::string& text, SymlinkPolicy& out) {
  if(text == "recreate") {
    out = SymlinkPolicy::Recreate;
  } else if(text == "follow") {
    out = SymlinkPolicy::Follow;
  } else if(text == "skip") {
    out = SymlinkPolicy::Skip;
  } else {
    return false;
  }
  return true;
}

const char* to_string(SymlinkPolicy policy) {
  switch(policy) {
    case SymlinkPolicy::Recreate: return "recreate";
    case SymlinkPolicy::Follow: return "follow";
    case SymlinkPolicy::Skip: return "skip";
  }
  return "unknown";
}

const char* to_string(CopyError::Kind kind) {
  switch(kind) {
    case CopyError::Kind::NotFound: return "not found";
    case CopyError::Kind::IOSetup: return "setup error";
    case CopyError::Kind::IOStream: return "stream error";
    case CopyError::Kind::Usage: return "usage error";
  }
  return "error";
}
