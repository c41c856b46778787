#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace usbtrail::model {

enum class OperationKind { Created, Modified, Deleted, Moved };

[[nodiscard]] inline const char* to_string(OperationKind k) {
  switch (k) {
    case OperationKind::Created:  return "created";
    case OperationKind::Modified: return "modified";
    case OperationKind::Deleted:  return "deleted";
    case OperationKind::Moved:    return "moved";
  }
  return "modified";
}

[[nodiscard]] inline std::optional<OperationKind> parse_operation(std::string_view s) {
  if (s == "created")  return OperationKind::Created;
  if (s == "modified") return OperationKind::Modified;
  if (s == "deleted")  return OperationKind::Deleted;
  if (s == "moved")    return OperationKind::Moved;
  return std::nullopt;
}

// Raw notification as delivered by a filesystem watcher. For moves, dest is
// set when the destination lies inside the watched root.
struct FsEvent {
  OperationKind kind{OperationKind::Modified};
  std::string path;                 // absolute source path
  std::optional<std::string> dest;  // absolute destination (moves only)
  bool is_directory{false};
};

// Pending operation for one path; a newer event replaces it wholesale.
struct InFlightOperation {
  OperationKind kind{OperationKind::Modified};
  std::chrono::steady_clock::time_point start{};
};

// One finalized line of the transfer log.
struct TransferRecord {
  std::chrono::system_clock::time_point timestamp{};
  OperationKind operation{OperationKind::Created};
  std::string device_name;
  std::string relative_path;
  uint64_t file_size_bytes{};
  std::string file_extension;  // lowercase incl. leading '.', or empty
  std::string username;
};

} // namespace usbtrail::model
